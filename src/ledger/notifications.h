// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CROWDFUND_LEDGER_NOTIFICATIONS_H
#define CROWDFUND_LEDGER_NOTIFICATIONS_H

#include "account.h"
#include "amount.h"

#include <memory>
#include <stdint.h>

class UniValue;
struct Campaign;

/**
 * Implement this to subscribe to ledger events. Events fire after the state
 * change is final; a subscriber cannot veto or roll back anything.
 *
 * Called with the ledger lock held: implementations may read the ledger but
 * must not block.
 */
class CLedgerNotificationInterface
{
public:
    virtual ~CLedgerNotificationInterface() = default;

protected:
    /** A campaign was appended to the ledger. */
    virtual void CampaignCreated(const CAccountID& caller, const Campaign& campaign) {}
    /** A donation was credited to campaign index. */
    virtual void Donation(const CAccountID& caller, const CAmount& value, uint64_t index) {}
    /** Campaign index was settled and amount paid to benefactor. */
    virtual void CampaignEnded(uint64_t index, const CAccountID& benefactor, const CAmount& amount) {}

    friend class CLedgerSignals;
};

struct LedgerSignalsInstance;

class CLedgerSignals
{
private:
    std::unique_ptr<LedgerSignalsInstance> m_internals;

public:
    CLedgerSignals();
    ~CLedgerSignals();

    void RegisterInterface(CLedgerNotificationInterface* pif);
    void UnregisterInterface(CLedgerNotificationInterface* pif);
    void UnregisterAllInterfaces();

    void CampaignCreated(const CAccountID& caller, const Campaign& campaign);
    void Donation(const CAccountID& caller, const CAmount& value, uint64_t index);
    void CampaignEnded(uint64_t index, const CAccountID& benefactor, const CAmount& amount);
};

CLedgerSignals& GetLedgerSignals();

/** Register a sink. The caller keeps ownership and must unregister before destroying it. */
void RegisterLedgerInterface(CLedgerNotificationInterface* pif);
void UnregisterLedgerInterface(CLedgerNotificationInterface* pif);
void UnregisterAllLedgerInterfaces();

/** Event records as JSON, for logging and external indexers. */
UniValue CampaignCreatedToJSON(const CAccountID& caller, const Campaign& campaign);
UniValue DonationToJSON(const CAccountID& caller, const CAmount& value, uint64_t index);
UniValue CampaignEndedToJSON(uint64_t index, const CAccountID& benefactor, const CAmount& amount);

/**
 * CLedgerEventLogger - writes every ledger event to the debug log as one
 * JSON line (category: notify).
 */
class CLedgerEventLogger : public CLedgerNotificationInterface
{
protected:
    void CampaignCreated(const CAccountID& caller, const Campaign& campaign) override;
    void Donation(const CAccountID& caller, const CAmount& value, uint64_t index) override;
    void CampaignEnded(uint64_t index, const CAccountID& benefactor, const CAmount& amount) override;
};

#endif // CROWDFUND_LEDGER_NOTIFICATIONS_H
