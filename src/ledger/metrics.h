// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CROWDFUND_LEDGER_METRICS_H
#define CROWDFUND_LEDGER_METRICS_H

#include <atomic>
#include <stdint.h>
#include <univalue.h>

namespace ledger {

/**
 * Ledger Metrics - operation counters for monitoring
 *
 * All counters are atomic; they are bumped by CLedger under its own lock but
 * may be read from any thread.
 *
 * Usage:
 *   g_ledger_metrics.campaignsCreated++;
 */
struct LedgerMetrics {
    // =========================================================================
    // Campaigns
    // =========================================================================
    std::atomic<uint64_t> campaignsCreated{0};       // Campaigns appended
    std::atomic<uint64_t> createsRejected{0};        // CreateCampaign calls rejected

    // =========================================================================
    // Donations
    // =========================================================================
    std::atomic<uint64_t> donationsAccepted{0};      // Donations credited
    std::atomic<uint64_t> donationsRejected{0};      // Donate calls rejected

    // =========================================================================
    // Settlement
    // =========================================================================
    std::atomic<uint64_t> settlementsCompleted{0};   // Payouts that moved value
    std::atomic<uint64_t> settlementsRejected{0};    // EndCampaign calls rejected (all reasons)
    std::atomic<uint64_t> transferFailures{0};       // Payouts refused by the rail (rolled back)
    std::atomic<uint64_t> reentrantCallsBlocked{0};  // Nested EndCampaign calls refused

    UniValue ToJSON() const {
        UniValue result(UniValue::VOBJ);

        UniValue campaigns(UniValue::VOBJ);
        campaigns.pushKV("created", (int64_t)campaignsCreated.load());
        campaigns.pushKV("rejected", (int64_t)createsRejected.load());
        result.pushKV("campaigns", campaigns);

        UniValue donations(UniValue::VOBJ);
        donations.pushKV("accepted", (int64_t)donationsAccepted.load());
        donations.pushKV("rejected", (int64_t)donationsRejected.load());
        result.pushKV("donations", donations);

        UniValue settlement(UniValue::VOBJ);
        settlement.pushKV("completed", (int64_t)settlementsCompleted.load());
        settlement.pushKV("rejected", (int64_t)settlementsRejected.load());
        settlement.pushKV("transfer_failures", (int64_t)transferFailures.load());
        settlement.pushKV("reentrant_blocked", (int64_t)reentrantCallsBlocked.load());
        result.pushKV("settlement", settlement);

        return result;
    }

    /**
     * Reset all metrics (for testing)
     */
    void Reset() {
        campaignsCreated.store(0);
        createsRejected.store(0);
        donationsAccepted.store(0);
        donationsRejected.store(0);
        settlementsCompleted.store(0);
        settlementsRejected.store(0);
        transferFailures.store(0);
        reentrantCallsBlocked.store(0);
    }
};

// Global metrics instance
extern LedgerMetrics g_ledger_metrics;

} // namespace ledger

#endif // CROWDFUND_LEDGER_METRICS_H
