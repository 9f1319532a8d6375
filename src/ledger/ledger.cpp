// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledger.h"

#include "dbwrapper.h"
#include "ledger/campaigndb.h"
#include "ledger/metrics.h"
#include "ledger/notifications.h"
#include "ledger/transfer.h"
#include "logging.h"
#include "util/format.h"
#include "utilmoneystr.h"
#include "utiltime.h"

#include <limits>

std::unique_ptr<CLedger> g_ledger;

namespace ledger {
LedgerMetrics g_ledger_metrics;
} // namespace ledger

using ledger::g_ledger_metrics;

CLedger::CLedger(const LedgerOptions& options, CTransferRail& rail, CCampaignDB* db)
    : m_createAuth(options.createPolicy, options.owner, options.allowlist),
      m_settleAuth(options.settlePolicy, options.owner, options.allowlist),
      m_rail(rail),
      m_db(db)
{
}

// =============================================================================
// Rejection helpers
// =============================================================================

bool CLedger::RejectCreate(CLedgerState& state, LedgerError error, const std::string& strDebug)
{
    g_ledger_metrics.createsRejected++;
    LogPrint(BCLog::LEDGER, "CreateCampaign: REJECT %s (%s)\n", LedgerErrorToString(error), strDebug);
    return state.Invalid(error, strDebug);
}

bool CLedger::RejectDonate(CLedgerState& state, LedgerError error, uint64_t nIndex, const std::string& strDebug)
{
    g_ledger_metrics.donationsRejected++;
    LogPrint(BCLog::LEDGER, "Donate: REJECT campaign %d: %s (%s)\n", nIndex, LedgerErrorToString(error), strDebug);
    return state.Invalid(error, strDebug);
}

bool CLedger::RejectEnd(CLedgerState& state, LedgerError error, uint64_t nIndex, const std::string& strDebug)
{
    g_ledger_metrics.settlementsRejected++;
    LogPrint(BCLog::LEDGER, "EndCampaign: REJECT campaign %d: %s (%s)\n", nIndex, LedgerErrorToString(error), strDebug);
    return state.Invalid(error, strDebug);
}

bool CLedger::WriteCampaignRecord(const Campaign& campaign, std::string& strError)
{
    if (!m_db) return true;

    try {
        CCampaignDB::Batch batch = m_db->CreateBatch();
        batch.WriteCampaign(campaign);
        if (!batch.Commit()) {
            strError = "batch commit failed";
            return false;
        }
    } catch (const dbwrapper_error& e) {
        strError = e.what();
        return false;
    }
    return true;
}

// =============================================================================
// LoadFromDB
// =============================================================================

bool CLedger::LoadFromDB(std::string& strError)
{
    LOCK(cs_ledger);

    if (!m_db) {
        strError = "no campaign database";
        return false;
    }
    if (!vCampaigns.empty()) {
        strError = "ledger already populated";
        return false;
    }

    std::vector<Campaign> vLoaded;
    uint64_t nCount = 0;
    bool fDense = true;

    try {
        m_db->ReadCount(nCount);
        m_db->ForEachCampaign([&](const Campaign& campaign) {
            if (campaign.index != vLoaded.size()) {
                fDense = false;
                return false;
            }
            vLoaded.push_back(campaign);
            return true;
        });
    } catch (const dbwrapper_error& e) {
        strError = strprintf("campaign database read failed: %s", e.what());
        return false;
    }

    if (!fDense) {
        strError = strprintf("campaign sequence has a gap at index %d", vLoaded.size());
        return false;
    }
    if (vLoaded.size() != nCount) {
        strError = strprintf("campaign count mismatch: %d stored, %d records", nCount, vLoaded.size());
        return false;
    }

    std::map<CAccountID, std::vector<uint64_t>> mapLoadedIndex;
    for (const Campaign& campaign : vLoaded) {
        mapLoadedIndex[campaign.creator].push_back(campaign.index);
    }

    vCampaigns.swap(vLoaded);
    mapCreatorIndex.swap(mapLoadedIndex);

    LogPrintf("Ledger: loaded %d campaigns from database\n", vCampaigns.size());
    return true;
}

// =============================================================================
// CreateCampaign
// =============================================================================

bool CLedger::CreateCampaign(const CAccountID& caller, const std::string& name, const std::string& description,
                             const CAccountID& benefactor, const CAmount& goal, uint64_t nDuration,
                             uint64_t& nIndexOut, CLedgerState& state)
{
    LOCK(cs_ledger);

    if (!m_createAuth.IsAuthorized(caller)) {
        return RejectCreate(state, LedgerError::NOT_AUTHORIZED,
                            strprintf("caller %s, policy %s", caller.ToString(), AuthPolicyToString(m_createAuth.GetPolicy())));
    }

    const int64_t now = GetTime();
    if (now < 0 || nDuration > static_cast<uint64_t>(std::numeric_limits<int64_t>::max() - now)) {
        return RejectCreate(state, LedgerError::AMOUNT_OVERFLOW,
                            strprintf("deadline %d + %d not representable", now, nDuration));
    }

    Campaign campaign;
    campaign.index = vCampaigns.size();
    campaign.creator = caller;
    campaign.name = name;
    campaign.description = description;
    campaign.benefactor = benefactor;
    campaign.goal = goal;
    campaign.createdAt = now;
    campaign.deadline = now + static_cast<int64_t>(nDuration);
    campaign.amountRaised = 0;
    campaign.ended = false;

    if (m_db) {
        try {
            CCampaignDB::Batch batch = m_db->CreateBatch();
            batch.WriteCampaign(campaign);
            batch.WriteCreatorIndex(caller, campaign.index);
            batch.WriteCount(campaign.index + 1);
            if (!batch.Commit()) {
                return RejectCreate(state, LedgerError::STORAGE_FAILED, "batch commit failed");
            }
        } catch (const dbwrapper_error& e) {
            LogPrintf("ERROR: CreateCampaign: campaign DB write failed: %s\n", e.what());
            return RejectCreate(state, LedgerError::STORAGE_FAILED, e.what());
        }
    }

    vCampaigns.push_back(campaign);
    mapCreatorIndex[caller].push_back(campaign.index);
    nIndexOut = campaign.index;

    g_ledger_metrics.campaignsCreated++;
    LogPrint(BCLog::LEDGER, "CreateCampaign: campaign %d by %s (goal=%s, deadline=%d)\n",
             campaign.index, caller.ToString(), FormatAmount(goal), campaign.deadline);

    GetLedgerSignals().CampaignCreated(caller, campaign);
    return true;
}

// =============================================================================
// Donate
// =============================================================================

bool CLedger::Donate(const CAccountID& caller, uint64_t nIndex, const CAmount& value, CLedgerState& state)
{
    LOCK(cs_ledger);

    if (nIndex >= vCampaigns.size()) {
        return RejectDonate(state, LedgerError::INVALID_INDEX, nIndex,
                            strprintf("%d campaigns", vCampaigns.size()));
    }

    const Campaign& campaign = vCampaigns[nIndex];
    const int64_t now = GetTime();

    if (now >= campaign.deadline) {
        return RejectDonate(state, LedgerError::CAMPAIGN_CLOSED, nIndex,
                            strprintf("now %d >= deadline %d", now, campaign.deadline));
    }

    if (campaign.ended) {
        return RejectDonate(state, LedgerError::CAMPAIGN_ALREADY_SETTLED, nIndex, "");
    }

    CAmount newRaised;
    if (!AddNoOverflow(campaign.amountRaised, value, newRaised)) {
        return RejectDonate(state, LedgerError::AMOUNT_OVERFLOW, nIndex,
                            strprintf("raised %s + %s", FormatAmount(campaign.amountRaised), FormatAmount(value)));
    }

    Campaign updated = campaign;
    updated.amountRaised = newRaised;

    std::string strError;
    if (!WriteCampaignRecord(updated, strError)) {
        LogPrintf("ERROR: Donate: campaign DB write failed: %s\n", strError);
        return RejectDonate(state, LedgerError::STORAGE_FAILED, nIndex, strError);
    }

    vCampaigns[nIndex].amountRaised = newRaised;

    g_ledger_metrics.donationsAccepted++;
    LogPrint(BCLog::LEDGER, "Donate: %s to campaign %d from %s (raised=%s)\n",
             FormatAmount(value), nIndex, caller.ToString(), FormatAmount(newRaised));

    GetLedgerSignals().Donation(caller, value, nIndex);
    return true;
}

// =============================================================================
// EndCampaign
// =============================================================================

bool CLedger::EndCampaign(const CAccountID& caller, uint64_t nIndex, CLedgerState& state)
{
    LOCK(cs_ledger);

    if (nIndex >= vCampaigns.size()) {
        return RejectEnd(state, LedgerError::INVALID_INDEX, nIndex,
                         strprintf("%d campaigns", vCampaigns.size()));
    }

    if (!m_settleAuth.IsAuthorized(caller)) {
        return RejectEnd(state, LedgerError::NOT_AUTHORIZED, nIndex,
                         strprintf("caller %s, policy %s", caller.ToString(), AuthPolicyToString(m_settleAuth.GetPolicy())));
    }

    {
        const Campaign& campaign = vCampaigns[nIndex];
        const int64_t now = GetTime();

        if (now < campaign.deadline) {
            return RejectEnd(state, LedgerError::CAMPAIGN_STILL_OPEN, nIndex,
                             strprintf("now %d < deadline %d", now, campaign.deadline));
        }
        if (campaign.ended) {
            return RejectEnd(state, LedgerError::CAMPAIGN_ALREADY_SETTLED, nIndex, "");
        }
        if (campaign.benefactor.IsNull()) {
            return RejectEnd(state, LedgerError::NO_BENEFACTOR, nIndex, "");
        }
        if (campaign.amountRaised == 0) {
            return RejectEnd(state, LedgerError::NOTHING_TO_SETTLE, nIndex, "");
        }
    }

    CSettlementGuard guard(m_settling);
    if (!guard.Acquired()) {
        g_ledger_metrics.reentrantCallsBlocked++;
        return RejectEnd(state, LedgerError::REENTRANT_CALL, nIndex, "settlement already in progress");
    }

    // vCampaigns may reallocate if the rail calls back into CreateCampaign:
    // address the record by index only from here on.
    const Campaign original = vCampaigns[nIndex];

    vCampaigns[nIndex].ended = true;
    const CAmount amountToTransfer = vCampaigns[nIndex].amountRaised;
    vCampaigns[nIndex].amountRaised = 0;

    std::string strError;
    if (!WriteCampaignRecord(vCampaigns[nIndex], strError)) {
        vCampaigns[nIndex] = original;
        LogPrintf("ERROR: EndCampaign: campaign DB write failed: %s\n", strError);
        return RejectEnd(state, LedgerError::STORAGE_FAILED, nIndex, strError);
    }

    bool fTransferred = false;
    try {
        fTransferred = m_rail.Transfer(original.benefactor, amountToTransfer, strError);
    } catch (const std::exception& e) {
        strError = strprintf("transfer threw: %s", e.what());
        fTransferred = false;
    }

    if (!fTransferred) {
        vCampaigns[nIndex] = original;
        g_ledger_metrics.transferFailures++;

        // The store already holds the settled record: put the original back,
        // retrying once before giving up.
        std::string strRestoreError;
        if (!WriteCampaignRecord(original, strRestoreError) &&
            !WriteCampaignRecord(original, strRestoreError)) {
            LogPrintf("ERROR: EndCampaign: failed to restore campaign %d after transfer failure: %s; "
                      "stored record says settled but nothing was paid\n", nIndex, strRestoreError);
            return RejectEnd(state, LedgerError::STORAGE_FAILED, nIndex,
                             strprintf("transfer failed: %s; restore failed: %s", strError, strRestoreError));
        }

        LogPrintf("EndCampaign: transfer of %s to %s for campaign %d failed: %s (rolled back)\n",
                  FormatAmount(amountToTransfer), original.benefactor.ToString(), nIndex, strError);
        return RejectEnd(state, LedgerError::TRANSFER_FAILED, nIndex, strError);
    }

    g_ledger_metrics.settlementsCompleted++;
    LogPrintf("EndCampaign: campaign %d settled, paid %s to %s\n",
              nIndex, FormatAmount(amountToTransfer), original.benefactor.ToString());

    GetLedgerSignals().CampaignEnded(nIndex, original.benefactor, amountToTransfer);
    return true;
}

// =============================================================================
// Queries
// =============================================================================

uint64_t CLedger::GetCampaignCount() const
{
    LOCK(cs_ledger);
    return vCampaigns.size();
}

bool CLedger::GetCampaign(uint64_t nIndex, Campaign& campaign, CLedgerState& state) const
{
    LOCK(cs_ledger);
    if (nIndex >= vCampaigns.size()) {
        return state.Invalid(LedgerError::INVALID_INDEX, strprintf("%d campaigns", vCampaigns.size()));
    }
    campaign = vCampaigns[nIndex];
    return true;
}

bool CLedger::GetBalance(uint64_t nIndex, CAmount& balance, CLedgerState& state) const
{
    LOCK(cs_ledger);
    if (nIndex >= vCampaigns.size()) {
        return state.Invalid(LedgerError::INVALID_INDEX, strprintf("%d campaigns", vCampaigns.size()));
    }
    balance = vCampaigns[nIndex].amountRaised;
    return true;
}

std::vector<Campaign> CLedger::GetCampaignsByCreator(const CAccountID& creator) const
{
    LOCK(cs_ledger);
    std::vector<Campaign> vRet;
    auto it = mapCreatorIndex.find(creator);
    if (it == mapCreatorIndex.end()) {
        return vRet;
    }
    vRet.reserve(it->second.size());
    for (uint64_t nIndex : it->second) {
        vRet.push_back(vCampaigns[nIndex]);
    }
    return vRet;
}

std::vector<uint64_t> CLedger::GetCampaignIndicesByCreator(const CAccountID& creator) const
{
    LOCK(cs_ledger);
    auto it = mapCreatorIndex.find(creator);
    if (it == mapCreatorIndex.end()) {
        return {};
    }
    return it->second;
}
