// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/notifications.h"

#include "ledger/campaign.h"
#include "logging.h"
#include "sync.h"
#include "utilmoneystr.h"
#include "utiltime.h"

#include <boost/signals2/signal.hpp>
#include <univalue.h>

#include <map>
#include <vector>

struct LedgerSignalsInstance
{
    boost::signals2::signal<void(const CAccountID&, const Campaign&)> CampaignCreated;
    boost::signals2::signal<void(const CAccountID&, const CAmount&, uint64_t)> Donation;
    boost::signals2::signal<void(uint64_t, const CAccountID&, const CAmount&)> CampaignEnded;

    Mutex cs;
    std::map<CLedgerNotificationInterface*, std::vector<boost::signals2::connection>> m_connections GUARDED_BY(cs);
};

static CLedgerSignals g_ledger_signals;

CLedgerSignals::CLedgerSignals() : m_internals(new LedgerSignalsInstance()) {}

CLedgerSignals::~CLedgerSignals() = default;

CLedgerSignals& GetLedgerSignals()
{
    return g_ledger_signals;
}

// An exception escaping a sink is logged and stops here.
template <typename Callable>
static void InvokeSink(const char* event, Callable&& fn)
{
    try {
        fn();
    } catch (const std::exception& e) {
        LogPrintf("ERROR: ledger notification %s failed: %s\n", event, e.what());
    }
}

void CLedgerSignals::RegisterInterface(CLedgerNotificationInterface* pif)
{
    LOCK(m_internals->cs);
    auto& conns = m_internals->m_connections[pif];
    if (!conns.empty()) {
        return; // already registered
    }

    conns.push_back(m_internals->CampaignCreated.connect([pif](const CAccountID& caller, const Campaign& campaign) {
        InvokeSink("CampaignCreated", [&] { pif->CampaignCreated(caller, campaign); });
    }));
    conns.push_back(m_internals->Donation.connect([pif](const CAccountID& caller, const CAmount& value, uint64_t index) {
        InvokeSink("Donation", [&] { pif->Donation(caller, value, index); });
    }));
    conns.push_back(m_internals->CampaignEnded.connect([pif](uint64_t index, const CAccountID& benefactor, const CAmount& amount) {
        InvokeSink("CampaignEnded", [&] { pif->CampaignEnded(index, benefactor, amount); });
    }));
}

void CLedgerSignals::UnregisterInterface(CLedgerNotificationInterface* pif)
{
    LOCK(m_internals->cs);
    auto it = m_internals->m_connections.find(pif);
    if (it == m_internals->m_connections.end()) {
        return;
    }
    for (auto& conn : it->second) {
        conn.disconnect();
    }
    m_internals->m_connections.erase(it);
}

void CLedgerSignals::UnregisterAllInterfaces()
{
    LOCK(m_internals->cs);
    m_internals->CampaignCreated.disconnect_all_slots();
    m_internals->Donation.disconnect_all_slots();
    m_internals->CampaignEnded.disconnect_all_slots();
    m_internals->m_connections.clear();
}

void CLedgerSignals::CampaignCreated(const CAccountID& caller, const Campaign& campaign)
{
    m_internals->CampaignCreated(caller, campaign);
}

void CLedgerSignals::Donation(const CAccountID& caller, const CAmount& value, uint64_t index)
{
    m_internals->Donation(caller, value, index);
}

void CLedgerSignals::CampaignEnded(uint64_t index, const CAccountID& benefactor, const CAmount& amount)
{
    m_internals->CampaignEnded(index, benefactor, amount);
}

void RegisterLedgerInterface(CLedgerNotificationInterface* pif)
{
    g_ledger_signals.RegisterInterface(pif);
}

void UnregisterLedgerInterface(CLedgerNotificationInterface* pif)
{
    g_ledger_signals.UnregisterInterface(pif);
}

void UnregisterAllLedgerInterfaces()
{
    g_ledger_signals.UnregisterAllInterfaces();
}

// =============================================================================
// Event records
// =============================================================================

UniValue CampaignCreatedToJSON(const CAccountID& caller, const Campaign& campaign)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("event", "CampaignCreated");
    obj.pushKV("caller", caller.ToString());
    obj.pushKV("campaign", campaign.ToJSON(GetTime()));
    return obj;
}

UniValue DonationToJSON(const CAccountID& caller, const CAmount& value, uint64_t index)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("event", "Donation");
    obj.pushKV("caller", caller.ToString());
    obj.pushKV("value", FormatAmount(value));
    obj.pushKV("index", index);
    return obj;
}

UniValue CampaignEndedToJSON(uint64_t index, const CAccountID& benefactor, const CAmount& amount)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("event", "CampaignEnded");
    obj.pushKV("index", index);
    obj.pushKV("benefactor", benefactor.ToString());
    obj.pushKV("amount", FormatAmount(amount));
    return obj;
}

void CLedgerEventLogger::CampaignCreated(const CAccountID& caller, const Campaign& campaign)
{
    LogPrint(BCLog::NOTIFY, "event %s\n", CampaignCreatedToJSON(caller, campaign).write());
}

void CLedgerEventLogger::Donation(const CAccountID& caller, const CAmount& value, uint64_t index)
{
    LogPrint(BCLog::NOTIFY, "event %s\n", DonationToJSON(caller, value, index).write());
}

void CLedgerEventLogger::CampaignEnded(uint64_t index, const CAccountID& benefactor, const CAmount& amount)
{
    LogPrint(BCLog::NOTIFY, "event %s\n", CampaignEndedToJSON(index, benefactor, amount).write());
}
