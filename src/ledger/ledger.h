// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CROWDFUND_LEDGER_LEDGER_H
#define CROWDFUND_LEDGER_LEDGER_H

/**
 * Crowdfund Ledger
 *
 * Ordered, append-only sequence of campaigns. Three mutating operations:
 *
 *   CreateCampaign  append a campaign, deadline = now + duration
 *   Donate          credit value to an open campaign
 *   EndCampaign     settle a closed campaign: pay amountRaised to the
 *                   benefactor exactly once
 *
 * Invariants:
 * - Indices are assigned in creation order and never reused.
 * - amountRaised only grows via Donate and is zeroed only by a successful
 *   EndCampaign, together with ended: false -> true.
 * - A rejected call leaves the ledger (memory and DB) exactly as it was.
 *
 * Every operation runs under cs_ledger, including the rail callback inside
 * EndCampaign. m_settling additionally refuses any nested settlement while
 * a payout is in flight.
 */

#include "account.h"
#include "amount.h"
#include "ledger/auth.h"
#include "ledger/campaign.h"
#include "ledger/ledgerstate.h"
#include "sync.h"

#include <atomic>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

class CCampaignDB;
class CTransferRail;

struct LedgerOptions
{
    AuthPolicy createPolicy{AuthPolicy::OPEN};
    AuthPolicy settlePolicy{AuthPolicy::OWNER_ONLY};
    CAccountID owner;                       // Designated authority
    std::set<CAccountID> allowlist;         // Extra callers for ALLOWLIST policies
};

/**
 * CSettlementGuard - scoped hold on the ledger's settlement flag
 *
 * Acquired() is false when another settlement already holds the flag; the
 * flag is released on destruction only by the guard that acquired it.
 */
class CSettlementGuard
{
private:
    std::atomic<bool>& m_flag;
    bool m_acquired{false};

public:
    explicit CSettlementGuard(std::atomic<bool>& flag) : m_flag(flag)
    {
        bool expected = false;
        m_acquired = m_flag.compare_exchange_strong(expected, true);
    }

    ~CSettlementGuard()
    {
        if (m_acquired) {
            m_flag.store(false);
        }
    }

    CSettlementGuard(const CSettlementGuard&) = delete;
    CSettlementGuard& operator=(const CSettlementGuard&) = delete;

    bool Acquired() const { return m_acquired; }
};

class CLedger
{
private:
    mutable RecursiveMutex cs_ledger;

    std::vector<Campaign> vCampaigns GUARDED_BY(cs_ledger);
    std::map<CAccountID, std::vector<uint64_t>> mapCreatorIndex GUARDED_BY(cs_ledger);

    const CAuthorizer m_createAuth;
    const CAuthorizer m_settleAuth;

    CTransferRail& m_rail;
    CCampaignDB* const m_db;  // Not owned; nullptr keeps the ledger memory-only

    std::atomic<bool> m_settling{false};

    bool RejectCreate(CLedgerState& state, LedgerError error, const std::string& strDebug);
    bool RejectDonate(CLedgerState& state, LedgerError error, uint64_t nIndex, const std::string& strDebug);
    bool RejectEnd(CLedgerState& state, LedgerError error, uint64_t nIndex, const std::string& strDebug);

    /** Write one campaign record; dbwrapper_error is reported as STORAGE_FAILED. */
    bool WriteCampaignRecord(const Campaign& campaign, std::string& strError) EXCLUSIVE_LOCKS_REQUIRED(cs_ledger);

public:
    CLedger(const LedgerOptions& options, CTransferRail& rail, CCampaignDB* db = nullptr);

    CLedger(const CLedger&) = delete;
    CLedger& operator=(const CLedger&) = delete;

    /**
     * LoadFromDB - Rebuild campaigns and the creator index from storage
     *
     * Only valid on an empty ledger. Fails if the stored sequence is not
     * dense (0..count-1) or a record's index disagrees with its key.
     */
    bool LoadFromDB(std::string& strError);

    // === Mutating Operations ===

    /**
     * CreateCampaign - Append a new campaign
     *
     * @param caller Authenticated caller (checked against the create policy)
     * @param name Campaign name (opaque)
     * @param description Campaign description (opaque)
     * @param benefactor Payout account; may be null at creation
     * @param goal Informational target, never enforced
     * @param nDuration Seconds from now until the deadline
     * @param nIndexOut Output: index of the new campaign
     * @param state Output: reject reason on failure
     * @return true on success
     */
    bool CreateCampaign(const CAccountID& caller, const std::string& name, const std::string& description,
                        const CAccountID& benefactor, const CAmount& goal, uint64_t nDuration,
                        uint64_t& nIndexOut, CLedgerState& state);

    /**
     * Donate - Credit value to campaign nIndex
     *
     * Checked in order: index, deadline, not settled, overflow. Value custody
     * is the caller's job; the ledger only records the amount.
     */
    bool Donate(const CAccountID& caller, uint64_t nIndex, const CAmount& value, CLedgerState& state);

    /**
     * EndCampaign - Settle campaign nIndex and pay out its raised amount
     *
     * Checked in order: index, settle policy, deadline passed, not settled,
     * benefactor set, amount raised, no settlement in progress.
     * If the rail refuses the payout the campaign is restored exactly and
     * TRANSFER_FAILED is returned. If the stored record cannot be restored
     * either, memory is still rolled back but STORAGE_FAILED is returned
     * and the stored record needs repair.
     */
    bool EndCampaign(const CAccountID& caller, uint64_t nIndex, CLedgerState& state);

    // === Queries ===

    uint64_t GetCampaignCount() const;
    bool GetCampaign(uint64_t nIndex, Campaign& campaign, CLedgerState& state) const;
    bool GetBalance(uint64_t nIndex, CAmount& balance, CLedgerState& state) const;
    /** Campaigns created by creator, in creation order, copied under one lock. */
    std::vector<Campaign> GetCampaignsByCreator(const CAccountID& creator) const;
    std::vector<uint64_t> GetCampaignIndicesByCreator(const CAccountID& creator) const;

    /** True while a payout is in flight. */
    bool IsSettling() const { return m_settling.load(); }

    AuthPolicy GetCreatePolicy() const { return m_createAuth.GetPolicy(); }
    AuthPolicy GetSettlePolicy() const { return m_settleAuth.GetPolicy(); }
};

// Global ledger instance (set up by InitLedger)
extern std::unique_ptr<CLedger> g_ledger;

#endif // CROWDFUND_LEDGER_LEDGER_H
