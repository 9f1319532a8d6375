// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#define BOOST_TEST_MODULE Crowdfund Test Suite

#include "test/test_crowdfund.h"

#include "ledger/campaigndb.h"
#include "ledger/ledger.h"
#include "ledger/metrics.h"
#include "ledger/notifications.h"
#include "logging.h"
#include "util/system.h"
#include "utiltime.h"

#include <boost/test/unit_test.hpp>

#include <vector>

CAccountID TestAccount(uint8_t n)
{
    return CAccountID(std::vector<unsigned char>(CAccountID::WIDTH, n));
}

BasicTestingSetup::BasicTestingSetup()
{
    m_path_root = fs::temp_directory_path() / fs::unique_path("test_crowdfund_%%%%_%%%%_%%%%");
    fs::create_directories(m_path_root);
    gArgs.ForceSetArg("-datadir", m_path_root.string());
    ClearDatadirCache();

    BCLog::Logger& logger = LogInstance();
    logger.m_print_to_console = false;
    logger.m_print_to_file = false;
    logger.EnableCategory(BCLog::ALL);
    logger.StartLogging();

    SetMockTime(TEST_BASE_TIME);
    ledger::g_ledger_metrics.Reset();
    UnregisterAllLedgerInterfaces();
}

BasicTestingSetup::~BasicTestingSetup()
{
    UnregisterAllLedgerInterfaces();
    g_ledger.reset();
    g_campaigndb.reset();
    SetMockTime(0);
    gArgs.ClearArgs();
    ClearDatadirCache();
    fs::remove_all(m_path_root);
}
