// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CROWDFUND_LEDGER_CAMPAIGNDB_H
#define CROWDFUND_LEDGER_CAMPAIGNDB_H

/**
 * Campaign Database Layer
 *
 * Provides persistence for the campaign ledger:
 * - WriteCampaign / ReadCampaign (by index)
 * - Creator index (creator -> indices, creation order)
 * - Campaign count
 *
 * DB Keys:
 * 'c' + index (BE)            -> Campaign
 * 'i' + creator + index (BE)  -> marker
 * 'n'                         -> uint64_t campaign count
 *
 * Indices are written big-endian so LevelDB iteration yields creation order.
 */

#include "dbwrapper.h"
#include "ledger/campaign.h"

#include <functional>
#include <memory>
#include <vector>

static const char DB_CAMPAIGN = 'c';
static const char DB_CAMPAIGN_CREATOR = 'i';
static const char DB_CAMPAIGN_COUNT = 'n';

//! -ledgerdbcache default (MiB)
static const int64_t DEFAULT_LEDGER_DB_CACHE = 8;

class CCampaignDB
{
private:
    std::unique_ptr<CDBWrapper> db;

protected:
    /** Durably apply a batch. Every Batch::Commit goes through here. */
    virtual bool WriteBatch(CDBBatch& batch);

public:
    explicit CCampaignDB(size_t nCacheSize, bool fWipe = false);
    virtual ~CCampaignDB();

    // === Campaign Record Operations ===

    /**
     * WriteCampaign - Store campaign record under its index
     * @param campaign The campaign record to store
     * @return true on success
     */
    bool WriteCampaign(const Campaign& campaign);

    /**
     * ReadCampaign - Retrieve campaign record by index
     * @param index Ledger index
     * @param campaign Output: the campaign record
     * @return true if found
     */
    bool ReadCampaign(uint64_t index, Campaign& campaign) const;

    bool HasCampaign(uint64_t index) const;

    /** Number of campaigns ever created (0 on a fresh DB). */
    bool ReadCount(uint64_t& nCount) const;

    // === Creator Index Operations ===

    /**
     * GetByCreator - All indices created by creator, in creation order
     * @return true if at least one index was found
     */
    bool GetByCreator(const CAccountID& creator, std::vector<uint64_t>& indices) const;

    // === Query Operations ===

    /**
     * ForEachCampaign - Iterate campaign records in index order
     * @param func Callback; return false to stop iteration
     */
    void ForEachCampaign(std::function<bool(const Campaign&)> func) const;

    // === Batch Operations ===

    class Batch
    {
    private:
        CDBBatch batch;
        CCampaignDB& parent;

    public:
        explicit Batch(CCampaignDB& db);

        void WriteCampaign(const Campaign& campaign);
        void WriteCreatorIndex(const CAccountID& creator, uint64_t index);
        void WriteCount(uint64_t nCount);

        bool Commit();
    };

    Batch CreateBatch() { return Batch(*this); }

    // Sync to disk
    bool Sync();
};

// Global campaign DB instance
extern std::unique_ptr<CCampaignDB> g_campaigndb;

/**
 * InitCampaignDB - Initialize the campaign database
 *
 * @param nCacheSize DB cache size in bytes
 * @param fWipe If true, wipe and recreate DB
 * @return true on success
 */
bool InitCampaignDB(size_t nCacheSize, bool fWipe = false);

/**
 * IsCampaignDBMissing - Check if campaigns directory exists
 * @return true if campaigns/ directory is missing or empty
 */
bool IsCampaignDBMissing();

#endif // CROWDFUND_LEDGER_CAMPAIGNDB_H
