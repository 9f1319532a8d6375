// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/campaigndb.h"

#include "fs.h"
#include "logging.h"
#include "util/system.h"

// Global campaign DB instance
std::unique_ptr<CCampaignDB> g_campaigndb;

// DB key helpers
namespace {

template<typename T>
std::pair<char, T> MakeKey(char prefix, const T& key)
{
    return std::make_pair(prefix, key);
}

// Campaign key: 'c' + index (BE)
struct CampaignKey
{
    uint64_t index{0};

    template<typename Stream>
    void Serialize(Stream& s) const
    {
        ser_writedata64be(s, index);
    }

    template<typename Stream>
    void Unserialize(Stream& s)
    {
        index = ser_readdata64be(s);
    }
};

// Creator index key: 'i' + creator + index (BE)
struct CreatorIndexKey
{
    CAccountID creator;
    uint64_t index{0};

    template<typename Stream>
    void Serialize(Stream& s) const
    {
        creator.Serialize(s);
        ser_writedata64be(s, index);
    }

    template<typename Stream>
    void Unserialize(Stream& s)
    {
        creator.Unserialize(s);
        index = ser_readdata64be(s);
    }
};

} // anonymous namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

CCampaignDB::CCampaignDB(size_t nCacheSize, bool fWipe)
{
    fs::path path = GetDataDir() / "campaigns";
    db = std::make_unique<CDBWrapper>(path, nCacheSize, fWipe);
}

CCampaignDB::~CCampaignDB() = default;

// =============================================================================
// Campaign Record Operations
// =============================================================================

bool CCampaignDB::WriteCampaign(const Campaign& campaign)
{
    return db->Write(MakeKey(DB_CAMPAIGN, CampaignKey{campaign.index}), campaign);
}

bool CCampaignDB::ReadCampaign(uint64_t index, Campaign& campaign) const
{
    return db->Read(MakeKey(DB_CAMPAIGN, CampaignKey{index}), campaign);
}

bool CCampaignDB::HasCampaign(uint64_t index) const
{
    return db->Exists(MakeKey(DB_CAMPAIGN, CampaignKey{index}));
}

bool CCampaignDB::ReadCount(uint64_t& nCount) const
{
    if (!db->Read(DB_CAMPAIGN_COUNT, nCount)) {
        nCount = 0;
    }
    return true;
}

// =============================================================================
// Creator Index Operations
// =============================================================================

bool CCampaignDB::GetByCreator(const CAccountID& creator, std::vector<uint64_t>& indices) const
{
    indices.clear();

    std::unique_ptr<CDBIterator> it(db->NewIterator());
    CreatorIndexKey prefix{creator, 0};
    it->Seek(MakeKey(DB_CAMPAIGN_CREATOR, prefix));

    while (it->Valid()) {
        std::pair<char, CreatorIndexKey> key;
        if (it->GetKey(key) && key.first == DB_CAMPAIGN_CREATOR && key.second.creator == creator) {
            indices.push_back(key.second.index);
            it->Next();
        } else {
            break;  // No more entries for this creator
        }
    }

    return !indices.empty();
}

// =============================================================================
// Query Operations
// =============================================================================

void CCampaignDB::ForEachCampaign(std::function<bool(const Campaign&)> func) const
{
    std::unique_ptr<CDBIterator> it(db->NewIterator());
    it->Seek(MakeKey(DB_CAMPAIGN, CampaignKey{0}));

    while (it->Valid()) {
        std::pair<char, CampaignKey> key;
        if (it->GetKey(key) && key.first == DB_CAMPAIGN) {
            Campaign campaign;
            if (it->GetValue(campaign)) {
                if (!func(campaign)) {
                    break;  // Callback returned false, stop iteration
                }
            } else {
                LogPrintf("ERROR: %s: unreadable campaign record at index %d\n", __func__, key.second.index);
            }
            it->Next();
        } else {
            break;  // No more campaign entries
        }
    }
}

// =============================================================================
// Batch Operations
// =============================================================================

CCampaignDB::Batch::Batch(CCampaignDB& db) : parent(db) {}

void CCampaignDB::Batch::WriteCampaign(const Campaign& campaign)
{
    batch.Write(MakeKey(DB_CAMPAIGN, CampaignKey{campaign.index}), campaign);
}

void CCampaignDB::Batch::WriteCreatorIndex(const CAccountID& creator, uint64_t index)
{
    batch.Write(MakeKey(DB_CAMPAIGN_CREATOR, CreatorIndexKey{creator, index}), true);  // Value is just a marker
}

void CCampaignDB::Batch::WriteCount(uint64_t nCount)
{
    batch.Write(DB_CAMPAIGN_COUNT, nCount);
}

bool CCampaignDB::Batch::Commit()
{
    LogPrint(BCLog::DB, "CampaignDB: committing batch (%u bytes)\n", batch.SizeEstimate());
    return parent.WriteBatch(batch);
}

bool CCampaignDB::WriteBatch(CDBBatch& batch)
{
    return db->WriteBatch(batch, true);
}

bool CCampaignDB::Sync()
{
    return db->Sync();
}

// =============================================================================
// InitCampaignDB - Initialize the campaign database
// =============================================================================

bool InitCampaignDB(size_t nCacheSize, bool fWipe)
{
    try {
        g_campaigndb.reset();
        g_campaigndb = std::make_unique<CCampaignDB>(nCacheSize, fWipe);
        LogPrint(BCLog::DB, "CampaignDB: Initialized database (cache=%zu, wipe=%d)\n", nCacheSize, fWipe);
        return true;
    } catch (const std::exception& e) {
        LogPrintf("ERROR: Failed to initialize campaign database: %s\n", e.what());
        return false;
    }
}

// =============================================================================
// IsCampaignDBMissing - Check if campaigns directory exists
// =============================================================================

bool IsCampaignDBMissing()
{
    fs::path campaignsPath = GetDataDir() / "campaigns";

    if (!fs::exists(campaignsPath)) {
        return true;
    }

    return fs::is_empty(campaignsPath);
}
