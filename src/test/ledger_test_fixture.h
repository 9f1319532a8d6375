// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CROWDFUND_TEST_LEDGER_TEST_FIXTURE_H
#define CROWDFUND_TEST_LEDGER_TEST_FIXTURE_H

#include "ledger/ledger.h"
#include "ledger/transfer.h"
#include "test/test_crowdfund.h"

#include <memory>

/**
 * Testing setup with a memory-only ledger over an in-process custody rail.
 * Default policies: create open, settle owner-only.
 */
struct LedgerTestingSetup : public BasicTestingSetup
{
    const CAccountID owner;
    const CAccountID creator;
    const CAccountID donor;
    const CAccountID benefactor;

    CCustodyRail rail;
    std::unique_ptr<CLedger> ledger;

    LedgerTestingSetup();

    /** Rebuild the ledger with different options (same rail). */
    void ResetLedger(const LedgerOptions& options);

    /** CreateCampaign by creator paying benefactor; requires success. */
    uint64_t CreateTestCampaign(uint64_t nDuration, const CAmount& goal = 100);

    /** Deposit value into custody, then Donate it; returns the Donate result. */
    bool DepositAndDonate(uint64_t nIndex, const CAmount& value, CLedgerState& state);

    CAmount Balance(uint64_t nIndex) const;
    Campaign GetTestCampaign(uint64_t nIndex) const;
};

#endif // CROWDFUND_TEST_LEDGER_TEST_FIXTURE_H
