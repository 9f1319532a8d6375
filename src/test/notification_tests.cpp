// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/campaign.h"
#include "ledger/init.h"
#include "ledger/notifications.h"
#include "util/format.h"
#include "utilmoneystr.h"
#include "utiltime.h"
#include "test/ledger_test_fixture.h"

#include <boost/test/unit_test.hpp>
#include <univalue.h>

#include <stdexcept>
#include <vector>

namespace {

class CRecordingSink : public CLedgerNotificationInterface
{
public:
    std::vector<std::string> events;
    bool fThrow{false};

protected:
    void CampaignCreated(const CAccountID& caller, const Campaign& campaign) override
    {
        events.push_back(strprintf("created %d %s", campaign.index, caller.ToString()));
        if (fThrow) throw std::runtime_error("sink failure");
    }
    void Donation(const CAccountID& caller, const CAmount& value, uint64_t index) override
    {
        events.push_back(strprintf("donation %d %s", index, FormatAmount(value)));
        if (fThrow) throw std::runtime_error("sink failure");
    }
    void CampaignEnded(uint64_t index, const CAccountID& benefactor, const CAmount& amount) override
    {
        events.push_back(strprintf("ended %d %s", index, FormatAmount(amount)));
        if (fThrow) throw std::runtime_error("sink failure");
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(notification_tests, LedgerTestingSetup)

BOOST_AUTO_TEST_CASE(events_follow_successful_operations)
{
    CRecordingSink sink;
    RegisterLedgerInterface(&sink);

    const uint64_t nIndex = CreateTestCampaign(1000);
    CLedgerState state;
    BOOST_CHECK(DepositAndDonate(nIndex, 40, state));
    BOOST_CHECK(DepositAndDonate(nIndex, 70, state));

    // Rejections emit nothing
    BOOST_CHECK(!ledger->Donate(donor, 9, 1, state));
    BOOST_CHECK(!ledger->EndCampaign(owner, nIndex, state));

    SetMockTime(TEST_BASE_TIME + 1001);
    BOOST_CHECK(ledger->EndCampaign(owner, nIndex, state));

    BOOST_REQUIRE_EQUAL(sink.events.size(), 4U);
    BOOST_CHECK_EQUAL(sink.events[0], "created 0 " + creator.ToString());
    BOOST_CHECK_EQUAL(sink.events[1], "donation 0 40");
    BOOST_CHECK_EQUAL(sink.events[2], "donation 0 70");
    BOOST_CHECK_EQUAL(sink.events[3], "ended 0 110");

    UnregisterLedgerInterface(&sink);
}

BOOST_AUTO_TEST_CASE(no_event_on_rolled_back_settlement)
{
    CRecordingSink sink;
    const uint64_t nIndex = CreateTestCampaign(10);
    CLedgerState state;
    BOOST_CHECK(DepositAndDonate(nIndex, 5, state));

    RegisterLedgerInterface(&sink);
    SetMockTime(TEST_BASE_TIME + 10);
    rail.BlockRecipient(benefactor);
    BOOST_CHECK(!ledger->EndCampaign(owner, nIndex, state));
    BOOST_CHECK(sink.events.empty());

    UnregisterLedgerInterface(&sink);
}

BOOST_AUTO_TEST_CASE(throwing_sink_does_not_roll_back)
{
    CRecordingSink sink;
    sink.fThrow = true;
    RegisterLedgerInterface(&sink);

    const uint64_t nIndex = CreateTestCampaign(10);
    CLedgerState state;
    BOOST_CHECK(DepositAndDonate(nIndex, 5, state));
    BOOST_CHECK(Balance(nIndex) == 5);

    SetMockTime(TEST_BASE_TIME + 10);
    BOOST_CHECK(ledger->EndCampaign(owner, nIndex, state));
    BOOST_CHECK(GetTestCampaign(nIndex).ended);
    BOOST_CHECK_EQUAL(sink.events.size(), 3U);

    UnregisterLedgerInterface(&sink);
}

BOOST_AUTO_TEST_CASE(register_and_unregister)
{
    CRecordingSink first, second;
    RegisterLedgerInterface(&first);
    RegisterLedgerInterface(&first);  // no double delivery
    RegisterLedgerInterface(&second);

    CreateTestCampaign(10);
    BOOST_CHECK_EQUAL(first.events.size(), 1U);
    BOOST_CHECK_EQUAL(second.events.size(), 1U);

    UnregisterLedgerInterface(&first);
    CreateTestCampaign(10);
    BOOST_CHECK_EQUAL(first.events.size(), 1U);
    BOOST_CHECK_EQUAL(second.events.size(), 2U);

    UnregisterAllLedgerInterfaces();
    CreateTestCampaign(10);
    BOOST_CHECK_EQUAL(second.events.size(), 2U);
}

BOOST_AUTO_TEST_CASE(event_json)
{
    const UniValue donation = DonationToJSON(donor, MAX_AMOUNT, 7);
    BOOST_CHECK_EQUAL(donation["event"].get_str(), "Donation");
    BOOST_CHECK_EQUAL(donation["caller"].get_str(), donor.ToString());
    BOOST_CHECK_EQUAL(donation["value"].get_str(), FormatAmount(MAX_AMOUNT));
    BOOST_CHECK_EQUAL(donation["index"].get_int64(), 7);

    const UniValue ended = CampaignEndedToJSON(2, benefactor, 110);
    BOOST_CHECK_EQUAL(ended["event"].get_str(), "CampaignEnded");
    BOOST_CHECK_EQUAL(ended["benefactor"].get_str(), benefactor.ToString());
    BOOST_CHECK_EQUAL(ended["amount"].get_str(), "110");

    const uint64_t nIndex = CreateTestCampaign(1000);
    const UniValue created = CampaignCreatedToJSON(creator, GetTestCampaign(nIndex));
    BOOST_CHECK_EQUAL(created["event"].get_str(), "CampaignCreated");
    BOOST_CHECK_EQUAL(created["campaign"]["status"].get_str(), "open");
    BOOST_CHECK_EQUAL(created["campaign"]["deadline"].get_int64(), TEST_BASE_TIME + 1000);
}

BOOST_AUTO_TEST_CASE(event_logger_interface)
{
    InitLedgerInterfaces();

    const uint64_t nIndex = CreateTestCampaign(10);
    CLedgerState state;
    BOOST_CHECK(DepositAndDonate(nIndex, 5, state));
    SetMockTime(TEST_BASE_TIME + 10);
    BOOST_CHECK(ledger->EndCampaign(owner, nIndex, state));

    ResetLedgerInterfaces();
    ResetLedgerInterfaces();  // idempotent
}

BOOST_AUTO_TEST_SUITE_END()
