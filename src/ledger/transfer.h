// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CROWDFUND_LEDGER_TRANSFER_H
#define CROWDFUND_LEDGER_TRANSFER_H

#include "account.h"
#include "amount.h"
#include "sync.h"

#include <map>
#include <set>
#include <string>

/**
 * CTransferRail - value custody and payout
 *
 * The ledger never holds funds itself. Donated value is moved into custody
 * by the boundary layer before Donate() is called; settlement asks the rail
 * to move the raised amount out to the benefactor.
 *
 * Transfer() is synchronous and must return promptly (fail fast rather
 * than block). The ledger treats false as "no value moved" and rolls the
 * settlement back; it never retries.
 */
class CTransferRail
{
public:
    virtual ~CTransferRail() = default;

    /**
     * Transfer - pay amount out of custody to recipient
     *
     * @param recipient Benefactor account (never null)
     * @param amount Amount to pay (never zero)
     * @param strError Output: reason on failure
     * @return true only if the value actually moved
     */
    virtual bool Transfer(const CAccountID& recipient, const CAmount& amount, std::string& strError) = 0;
};

/**
 * CCustodyRail - in-process custody account
 *
 * Tracks the pooled custody balance and the total paid to each recipient.
 * Recipients can be blocked to model a payee that refuses funds.
 */
class CCustodyRail : public CTransferRail
{
private:
    mutable Mutex cs;
    CAmount m_custody GUARDED_BY(cs){0};
    std::map<CAccountID, CAmount> m_paid GUARDED_BY(cs);
    std::set<CAccountID> m_blocked GUARDED_BY(cs);

public:
    /** Credit custody with value received from a donor. */
    bool Deposit(const CAmount& amount, std::string& strError);

    bool Transfer(const CAccountID& recipient, const CAmount& amount, std::string& strError) override;

    void BlockRecipient(const CAccountID& recipient);
    void UnblockRecipient(const CAccountID& recipient);

    CAmount GetCustodyBalance() const;
    CAmount GetPaidTo(const CAccountID& recipient) const;
};

#endif // CROWDFUND_LEDGER_TRANSFER_H
