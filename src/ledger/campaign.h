// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CROWDFUND_LEDGER_CAMPAIGN_H
#define CROWDFUND_LEDGER_CAMPAIGN_H

/**
 * Campaign - one fundraising effort in the ledger
 *
 * Lifecycle:
 * - OPEN:    created, now < deadline, donations accepted
 * - CLOSED:  now >= deadline, not yet settled (eligible for settlement)
 * - SETTLED: payout issued; amountRaised reset to 0, ended = true
 *
 * ended only ever moves false -> true. amountRaised only grows while the
 * campaign is open and is zeroed exactly once, by settlement. A settled
 * record stays in the ledger forever.
 *
 * DB Keys (see campaigndb.h):
 * 'c' + index (BE) -> Campaign
 */

#include "account.h"
#include "amount.h"
#include "serialize.h"

#include <stdint.h>
#include <string>

class UniValue;

static const uint8_t CAMPAIGN_RECORD_VERSION = 1;

/**
 * CampaignStatus - derived, never stored
 */
enum class CampaignStatus : uint8_t {
    OPEN = 0,       // Accepting donations
    CLOSED = 1,     // Past deadline, awaiting settlement
    SETTLED = 2     // Funds paid out to the benefactor
};

std::string CampaignStatusToString(CampaignStatus status);

struct Campaign
{
    uint8_t nVersion{CAMPAIGN_RECORD_VERSION};

    // === Identity ===
    uint64_t index{0};           // Position in the ledger, assigned at creation
    CAccountID creator;          // Who registered it (informational)
    std::string name;
    std::string description;

    // === Terms ===
    CAccountID benefactor;       // Receives the payout; must be non-null to settle
    CAmount goal{0};             // Informational, never enforced
    int64_t createdAt{0};
    int64_t deadline{0};         // Absolute: createdAt + duration

    // === Running state ===
    CAmount amountRaised{0};
    bool ended{false};

    CampaignStatus GetStatus(int64_t now) const
    {
        if (ended) return CampaignStatus::SETTLED;
        return now < deadline ? CampaignStatus::OPEN : CampaignStatus::CLOSED;
    }

    UniValue ToJSON(int64_t now) const;

    SERIALIZE_METHODS(Campaign, obj)
    {
        READWRITE(obj.nVersion);
        READWRITE(obj.index);
        READWRITE(obj.creator);
        READWRITE(obj.name);
        READWRITE(obj.description);
        READWRITE(obj.benefactor);
        READWRITE(obj.goal);
        READWRITE(obj.createdAt);
        READWRITE(obj.deadline);
        READWRITE(obj.amountRaised);
        READWRITE(obj.ended);
    }
};

#endif // CROWDFUND_LEDGER_CAMPAIGN_H
