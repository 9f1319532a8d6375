// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/campaign.h"

#include "utilmoneystr.h"

#include <univalue.h>

std::string CampaignStatusToString(CampaignStatus status)
{
    switch (status) {
    case CampaignStatus::OPEN:
        return "open";
    case CampaignStatus::CLOSED:
        return "closed";
    case CampaignStatus::SETTLED:
        return "settled";
    }
    return "unknown";
}

UniValue Campaign::ToJSON(int64_t now) const
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("index", (uint64_t)index);
    obj.pushKV("creator", creator.ToString());
    obj.pushKV("name", name);
    obj.pushKV("description", description);
    obj.pushKV("benefactor", benefactor.ToString());
    // Amounts are 128-bit; emit as decimal strings so no JSON reader truncates them
    obj.pushKV("goal", FormatAmount(goal));
    obj.pushKV("created_at", createdAt);
    obj.pushKV("deadline", deadline);
    obj.pushKV("amount_raised", FormatAmount(amountRaised));
    obj.pushKV("ended", ended);
    obj.pushKV("status", CampaignStatusToString(GetStatus(now)));
    return obj;
}
