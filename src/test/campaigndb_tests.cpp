// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Campaign DB Tests
 *
 * Tests:
 *   1. campaigndb_records - write/read/exists, count, creator index
 *   2. campaigndb_index_order - big-endian keys iterate in creation order
 *   3. ledger_reload - ledger state survives a restart
 *   4. ledger_reload_after_failed_transfer - rollback reaches the DB
 *      ledger_restore_write_* - restore after a refused payout, retried once
 *   5. ledger_load_rejects_* - gaps and count mismatch
 *   6. init_ledger - InitLedger / ShutdownLedger from configuration
 */

#include "ledger/campaigndb.h"
#include "ledger/init.h"
#include "ledger/ledger.h"
#include "ledger/transfer.h"
#include "util/format.h"
#include "util/system.h"
#include "utilmoneystr.h"
#include "utiltime.h"
#include "test/test_crowdfund.h"

#include <boost/test/unit_test.hpp>

#include <functional>

static const size_t TEST_DB_CACHE = 1 << 20;

static Campaign MakeCampaign(uint64_t index, const CAccountID& creator)
{
    Campaign campaign;
    campaign.index = index;
    campaign.creator = creator;
    campaign.name = strprintf("campaign %d", index);
    campaign.benefactor = TestAccount(0x04);
    campaign.goal = MAX_AMOUNT;
    campaign.createdAt = TEST_BASE_TIME;
    campaign.deadline = TEST_BASE_TIME + 100;
    campaign.amountRaised = static_cast<CAmount>(index) << 70;
    return campaign;
}

/** Campaign DB whose commits can be made to fail from the test. */
class CFailingCampaignDB : public CCampaignDB
{
public:
    int nCommits{0};
    std::function<bool(int)> failCommit;  // Called with the 1-based commit number

    CFailingCampaignDB() : CCampaignDB(TEST_DB_CACHE, true) {}

protected:
    bool WriteBatch(CDBBatch& batch) override
    {
        nCommits++;
        if (failCommit && failCommit(nCommits)) return false;
        return CCampaignDB::WriteBatch(batch);
    }
};

static LedgerOptions TestOptions()
{
    LedgerOptions options;
    options.owner = TestAccount(0x01);
    return options;
}

BOOST_FIXTURE_TEST_SUITE(campaigndb_tests, BasicTestingSetup)

// =============================================================================
// Test 1: Records
// =============================================================================
BOOST_AUTO_TEST_CASE(campaigndb_records)
{
    BOOST_CHECK(IsCampaignDBMissing());
    BOOST_REQUIRE(InitCampaignDB(TEST_DB_CACHE, true));
    CCampaignDB& db = *g_campaigndb;

    uint64_t nCount = 99;
    BOOST_CHECK(db.ReadCount(nCount));
    BOOST_CHECK_EQUAL(nCount, 0U);
    BOOST_CHECK(!db.HasCampaign(0));

    const Campaign written = MakeCampaign(3, TestAccount(0x02));
    BOOST_CHECK(db.WriteCampaign(written));
    BOOST_CHECK(db.HasCampaign(3));

    Campaign read;
    BOOST_CHECK(db.ReadCampaign(3, read));
    BOOST_CHECK_EQUAL(read.index, 3U);
    BOOST_CHECK(read.creator == written.creator);
    BOOST_CHECK_EQUAL(read.name, "campaign 3");
    BOOST_CHECK(read.goal == MAX_AMOUNT);
    BOOST_CHECK(read.amountRaised == written.amountRaised);
    BOOST_CHECK_EQUAL(read.deadline, written.deadline);
    BOOST_CHECK(!read.ended);

    CCampaignDB::Batch batch = db.CreateBatch();
    batch.WriteCreatorIndex(TestAccount(0x02), 3);
    batch.WriteCreatorIndex(TestAccount(0x02), 1);
    batch.WriteCreatorIndex(TestAccount(0x05), 2);
    batch.WriteCount(4);
    BOOST_CHECK(batch.Commit());

    std::vector<uint64_t> indices;
    BOOST_CHECK(db.GetByCreator(TestAccount(0x02), indices));
    BOOST_CHECK(indices == std::vector<uint64_t>({1, 3}));
    BOOST_CHECK(!db.GetByCreator(TestAccount(0x03), indices));
    BOOST_CHECK(indices.empty());

    BOOST_CHECK(db.ReadCount(nCount));
    BOOST_CHECK_EQUAL(nCount, 4U);
    BOOST_CHECK(db.Sync());
    BOOST_CHECK(!IsCampaignDBMissing());
}

// =============================================================================
// Test 2: Iteration order
// =============================================================================
BOOST_AUTO_TEST_CASE(campaigndb_index_order)
{
    BOOST_REQUIRE(InitCampaignDB(TEST_DB_CACHE, true));

    // Insert out of order, across the one-byte boundary
    CCampaignDB::Batch batch = g_campaigndb->CreateBatch();
    for (uint64_t i = 300; i-- > 0;) {
        batch.WriteCampaign(MakeCampaign(i, TestAccount(0x02)));
        batch.WriteCreatorIndex(TestAccount(0x02), i);
    }
    BOOST_CHECK(batch.Commit());

    uint64_t nExpected = 0;
    g_campaigndb->ForEachCampaign([&](const Campaign& campaign) {
        BOOST_CHECK_EQUAL(campaign.index, nExpected);
        nExpected++;
        return true;
    });
    BOOST_CHECK_EQUAL(nExpected, 300U);

    std::vector<uint64_t> indices;
    BOOST_CHECK(g_campaigndb->GetByCreator(TestAccount(0x02), indices));
    BOOST_REQUIRE_EQUAL(indices.size(), 300U);
    for (uint64_t i = 0; i < indices.size(); i++) {
        BOOST_CHECK_EQUAL(indices[i], i);
    }

    // Early stop
    int nVisited = 0;
    g_campaigndb->ForEachCampaign([&](const Campaign&) { return ++nVisited < 5; });
    BOOST_CHECK_EQUAL(nVisited, 5);
}

// =============================================================================
// Test 3: Restart
// =============================================================================
BOOST_AUTO_TEST_CASE(ledger_reload)
{
    BOOST_REQUIRE(InitCampaignDB(TEST_DB_CACHE, true));
    CCustodyRail rail;
    const CAccountID owner = TestAccount(0x01);
    const CAccountID alice = TestAccount(0x02);
    const CAccountID bob = TestAccount(0x03);
    const CAccountID benefactor = TestAccount(0x04);
    std::string strError;

    {
        CLedger ledger(TestOptions(), rail, g_campaigndb.get());
        BOOST_CHECK(ledger.LoadFromDB(strError));
        BOOST_CHECK_EQUAL(ledger.GetCampaignCount(), 0U);

        uint64_t nIndex = 0;
        CLedgerState state;
        BOOST_REQUIRE(ledger.CreateCampaign(alice, "a0", "first", benefactor, 100, 50, nIndex, state));
        BOOST_REQUIRE(ledger.CreateCampaign(bob, "b1", "", benefactor, 100, 50, nIndex, state));
        BOOST_REQUIRE(ledger.CreateCampaign(alice, "a2", "", CAccountID(), 100, 5000, nIndex, state));

        BOOST_REQUIRE(rail.Deposit(40, strError));
        BOOST_CHECK(ledger.Donate(bob, 0, 40, state));
        BOOST_CHECK(ledger.Donate(bob, 2, 7, state));

        SetMockTime(TEST_BASE_TIME + 50);
        BOOST_CHECK(ledger.EndCampaign(owner, 0, state));
    }

    CLedger reloaded(TestOptions(), rail, g_campaigndb.get());
    BOOST_REQUIRE(reloaded.LoadFromDB(strError));
    BOOST_CHECK_EQUAL(reloaded.GetCampaignCount(), 3U);

    Campaign campaign;
    CLedgerState state;
    BOOST_CHECK(reloaded.GetCampaign(0, campaign, state));
    BOOST_CHECK(campaign.ended);
    BOOST_CHECK(campaign.amountRaised == 0);
    BOOST_CHECK_EQUAL(campaign.description, "first");

    BOOST_CHECK(reloaded.GetCampaign(2, campaign, state));
    BOOST_CHECK(!campaign.ended);
    BOOST_CHECK(campaign.amountRaised == 7);
    BOOST_CHECK(campaign.benefactor.IsNull());
    BOOST_CHECK_EQUAL(campaign.deadline, TEST_BASE_TIME + 5000);

    BOOST_CHECK(reloaded.GetCampaignIndicesByCreator(alice) == std::vector<uint64_t>({0, 2}));
    BOOST_CHECK(reloaded.GetCampaignIndicesByCreator(bob) == std::vector<uint64_t>({1}));

    // Settled stays settled after the restart
    CLedgerState again;
    BOOST_CHECK(!reloaded.EndCampaign(owner, 0, again));
    BOOST_CHECK(again.GetError() == LedgerError::CAMPAIGN_ALREADY_SETTLED);

    // New campaigns continue the sequence
    uint64_t nIndex = 0;
    BOOST_CHECK(reloaded.CreateCampaign(bob, "b3", "", benefactor, 1, 10, nIndex, state));
    BOOST_CHECK_EQUAL(nIndex, 3U);

    // A populated ledger refuses a second load
    BOOST_CHECK(!reloaded.LoadFromDB(strError));
}

BOOST_AUTO_TEST_CASE(ledger_reload_after_failed_transfer)
{
    BOOST_REQUIRE(InitCampaignDB(TEST_DB_CACHE, true));
    CCustodyRail rail;
    const CAccountID owner = TestAccount(0x01);
    const CAccountID benefactor = TestAccount(0x04);
    std::string strError;

    {
        CLedger ledger(TestOptions(), rail, g_campaigndb.get());
        uint64_t nIndex = 0;
        CLedgerState state;
        BOOST_REQUIRE(ledger.CreateCampaign(owner, "n", "", benefactor, 100, 10, nIndex, state));
        BOOST_REQUIRE(rail.Deposit(9, strError));
        BOOST_CHECK(ledger.Donate(owner, nIndex, 9, state));

        SetMockTime(TEST_BASE_TIME + 10);
        rail.BlockRecipient(benefactor);
        BOOST_CHECK(!ledger.EndCampaign(owner, nIndex, state));
        BOOST_CHECK(state.GetError() == LedgerError::TRANSFER_FAILED);
    }

    Campaign stored;
    BOOST_REQUIRE(g_campaigndb->ReadCampaign(0, stored));
    BOOST_CHECK(!stored.ended);
    BOOST_CHECK(stored.amountRaised == 9);
}

BOOST_AUTO_TEST_CASE(ledger_restore_write_retried)
{
    CFailingCampaignDB db;
    CCustodyRail rail;
    const CAccountID owner = TestAccount(0x01);
    const CAccountID benefactor = TestAccount(0x04);

    CLedger ledger(TestOptions(), rail, &db);
    uint64_t nIndex = 0;
    CLedgerState state;
    BOOST_REQUIRE(ledger.CreateCampaign(owner, "n", "", benefactor, 100, 10, nIndex, state));
    BOOST_REQUIRE(ledger.Donate(owner, nIndex, 9, state));  // Nothing deposited: payout is refused

    // Commits from here: 1 settled record, 2 restore (fails), 3 retry
    const int nBase = db.nCommits;
    db.failCommit = [nBase](int n) { return n == nBase + 2; };

    SetMockTime(TEST_BASE_TIME + 10);
    CLedgerState failed;
    BOOST_CHECK(!ledger.EndCampaign(owner, nIndex, failed));
    BOOST_CHECK(failed.GetError() == LedgerError::TRANSFER_FAILED);
    BOOST_CHECK_EQUAL(db.nCommits, nBase + 3);

    Campaign stored;
    BOOST_REQUIRE(db.ReadCampaign(nIndex, stored));
    BOOST_CHECK(!stored.ended);
    BOOST_CHECK(stored.amountRaised == 9);
}

BOOST_AUTO_TEST_CASE(ledger_restore_write_failure_reported)
{
    CFailingCampaignDB db;
    CCustodyRail rail;
    const CAccountID owner = TestAccount(0x01);
    const CAccountID benefactor = TestAccount(0x04);

    CLedger ledger(TestOptions(), rail, &db);
    uint64_t nIndex = 0;
    CLedgerState state;
    BOOST_REQUIRE(ledger.CreateCampaign(owner, "n", "", benefactor, 100, 10, nIndex, state));
    BOOST_REQUIRE(ledger.Donate(owner, nIndex, 9, state));

    // The settled record lands, then every later commit fails
    const int nBase = db.nCommits;
    db.failCommit = [nBase](int n) { return n > nBase + 1; };

    SetMockTime(TEST_BASE_TIME + 10);
    CLedgerState failed;
    BOOST_CHECK(!ledger.EndCampaign(owner, nIndex, failed));
    BOOST_CHECK(failed.GetError() == LedgerError::STORAGE_FAILED);
    BOOST_CHECK(failed.GetDebugMessage().find("transfer failed") != std::string::npos);
    BOOST_CHECK(failed.GetDebugMessage().find("restore failed") != std::string::npos);
    BOOST_CHECK_EQUAL(db.nCommits, nBase + 3);
    BOOST_CHECK(!ledger.IsSettling());

    // Memory is rolled back
    Campaign campaign;
    BOOST_REQUIRE(ledger.GetCampaign(nIndex, campaign, state));
    BOOST_CHECK(!campaign.ended);
    BOOST_CHECK(campaign.amountRaised == 9);
    BOOST_CHECK(rail.GetPaidTo(benefactor) == 0);

    // The stored record is the one that needs repair
    Campaign stored;
    BOOST_REQUIRE(db.ReadCampaign(nIndex, stored));
    BOOST_CHECK(stored.ended);
    BOOST_CHECK(stored.amountRaised == 0);

    // Once storage recovers the campaign settles normally
    db.failCommit = nullptr;
    std::string strError;
    BOOST_REQUIRE(rail.Deposit(9, strError));
    CLedgerState settled;
    BOOST_CHECK(ledger.EndCampaign(owner, nIndex, settled));
    BOOST_CHECK(rail.GetPaidTo(benefactor) == 9);
    BOOST_REQUIRE(db.ReadCampaign(nIndex, stored));
    BOOST_CHECK(stored.ended);
}

// =============================================================================
// Test 5: Corrupt sequences
// =============================================================================
BOOST_AUTO_TEST_CASE(ledger_load_rejects_gap)
{
    BOOST_REQUIRE(InitCampaignDB(TEST_DB_CACHE, true));
    CCampaignDB::Batch batch = g_campaigndb->CreateBatch();
    batch.WriteCampaign(MakeCampaign(0, TestAccount(0x02)));
    batch.WriteCampaign(MakeCampaign(2, TestAccount(0x02)));
    batch.WriteCount(3);
    BOOST_REQUIRE(batch.Commit());

    CCustodyRail rail;
    CLedger ledger(TestOptions(), rail, g_campaigndb.get());
    std::string strError;
    BOOST_CHECK(!ledger.LoadFromDB(strError));
    BOOST_CHECK(strError.find("gap") != std::string::npos);
    BOOST_CHECK_EQUAL(ledger.GetCampaignCount(), 0U);
}

BOOST_AUTO_TEST_CASE(ledger_load_rejects_count_mismatch)
{
    BOOST_REQUIRE(InitCampaignDB(TEST_DB_CACHE, true));
    CCampaignDB::Batch batch = g_campaigndb->CreateBatch();
    batch.WriteCampaign(MakeCampaign(0, TestAccount(0x02)));
    batch.WriteCount(2);
    BOOST_REQUIRE(batch.Commit());

    CCustodyRail rail;
    CLedger ledger(TestOptions(), rail, g_campaigndb.get());
    std::string strError;
    BOOST_CHECK(!ledger.LoadFromDB(strError));
    BOOST_CHECK(strError.find("count mismatch") != std::string::npos);

    CLedger memoryOnly(TestOptions(), rail);
    BOOST_CHECK(!memoryOnly.LoadFromDB(strError));
}

// =============================================================================
// Test 6: Init from configuration
// =============================================================================
BOOST_AUTO_TEST_CASE(init_ledger)
{
    CCustodyRail rail;
    std::string error;

    ArgsManager args;
    const char* argv[] = {"crowdfund", "-ledgerowner=0x0101010101010101010101010101010101010101",
                          "-createpolicy=owner", "-ledgerdbcache=2"};
    BOOST_REQUIRE(args.ParseParameters(4, argv, error));

    BOOST_REQUIRE(InitLedger(args, rail, error));
    BOOST_REQUIRE(g_ledger != nullptr);
    BOOST_CHECK(g_ledger->GetCreatePolicy() == AuthPolicy::OWNER_ONLY);
    BOOST_CHECK(g_ledger->GetSettlePolicy() == AuthPolicy::OWNER_ONLY);

    uint64_t nIndex = 0;
    CLedgerState state;
    BOOST_CHECK(g_ledger->CreateCampaign(TestAccount(0x01), "n", "", TestAccount(0x04), 1, 10, nIndex, state));
    ShutdownLedger();
    BOOST_CHECK(g_ledger == nullptr);
    BOOST_CHECK(g_campaigndb == nullptr);

    // Reopen: the campaign is still there
    BOOST_REQUIRE(InitLedger(args, rail, error));
    BOOST_CHECK_EQUAL(g_ledger->GetCampaignCount(), 1U);
    ShutdownLedger();

    ArgsManager badCache;
    const char* argvBad[] = {"crowdfund", "-settlepolicy=open", "-ledgerdbcache=0"};
    BOOST_REQUIRE(badCache.ParseParameters(3, argvBad, error));
    BOOST_CHECK(!InitLedger(badCache, rail, error));
    BOOST_CHECK(error.find("-ledgerdbcache") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
