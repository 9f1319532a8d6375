// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/init.h"

#include "ledger/campaigndb.h"
#include "ledger/ledger.h"
#include "ledger/notifications.h"
#include "logging.h"
#include "util/system.h"

static std::unique_ptr<CLedgerEventLogger> pLedgerEventLogger{nullptr};

static bool ParsePolicyArg(const ArgsManager& args, const std::string& strArg, const char* strDefault,
                           AuthPolicy& policy, std::string& error)
{
    const std::string strValue = args.GetArg(strArg, strDefault);
    if (!ParseAuthPolicy(strValue, policy)) {
        error = strprintf("Invalid %s '%s' (expected open, owner or allowlist)", strArg, strValue);
        return false;
    }
    return true;
}

static bool CheckPolicyAuthority(const std::string& strArg, AuthPolicy policy, const LedgerOptions& options,
                                 std::string& error)
{
    if (policy == AuthPolicy::OWNER_ONLY && options.owner.IsNull()) {
        error = strprintf("%s=owner requires -ledgerowner", strArg);
        return false;
    }
    if (policy == AuthPolicy::ALLOWLIST && options.owner.IsNull() && options.allowlist.empty()) {
        error = strprintf("%s=allowlist requires -ledgerowner or -ledgerallow", strArg);
        return false;
    }
    return true;
}

bool InitLedgerOptions(const ArgsManager& args, LedgerOptions& options, std::string& error)
{
    if (!ParsePolicyArg(args, "-createpolicy", DEFAULT_CREATE_POLICY, options.createPolicy, error) ||
        !ParsePolicyArg(args, "-settlepolicy", DEFAULT_SETTLE_POLICY, options.settlePolicy, error)) {
        return false;
    }

    options.owner.SetNull();
    if (args.IsArgSet("-ledgerowner")) {
        const std::string strOwner = args.GetArg("-ledgerowner", "");
        if (!ParseAccountID(strOwner, options.owner) || options.owner.IsNull()) {
            error = strprintf("Invalid -ledgerowner address '%s'", strOwner);
            return false;
        }
    }

    options.allowlist.clear();
    for (const std::string& strAllow : args.GetArgs("-ledgerallow")) {
        CAccountID account;
        if (!ParseAccountID(strAllow, account) || account.IsNull()) {
            error = strprintf("Invalid -ledgerallow address '%s'", strAllow);
            return false;
        }
        options.allowlist.insert(account);
    }

    if (!CheckPolicyAuthority("-createpolicy", options.createPolicy, options, error) ||
        !CheckPolicyAuthority("-settlepolicy", options.settlePolicy, options, error)) {
        return false;
    }

    LogPrintf("Ledger: create policy %s, settle policy %s, owner %s, %d allowlisted\n",
              AuthPolicyToString(options.createPolicy), AuthPolicyToString(options.settlePolicy),
              options.owner.IsNull() ? "(none)" : options.owner.ToString(), options.allowlist.size());
    return true;
}

bool InitLogging(const ArgsManager& args, std::string& error)
{
    BCLog::Logger& logger = LogInstance();

    logger.m_print_to_console = args.GetBoolArg("-printtoconsole", false);
    logger.m_print_to_file = !args.IsArgNegated("-debuglogfile");
    if (logger.m_print_to_file) {
        fs::path logfile = args.GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE);
        logger.m_file_path = logfile.is_absolute() ? logfile : GetDataDir() / logfile;
    }

    for (const std::string& cat : args.GetArgs("-debug")) {
        if (!logger.EnableCategory(cat)) {
            error = strprintf("Unsupported logging category -debug=%s (valid: %s)", cat, ListLogCategories());
            return false;
        }
    }

    for (const std::string& cat : args.GetArgs("-debugexclude")) {
        if (!logger.DisableCategory(cat)) {
            error = strprintf("Unsupported logging category -debugexclude=%s (valid: %s)", cat, ListLogCategories());
            return false;
        }
    }

    if (!logger.StartLogging()) {
        error = strprintf("Could not open debug log file %s", logger.m_file_path.string());
        return false;
    }
    return true;
}

bool InitLedger(const ArgsManager& args, CTransferRail& rail, std::string& error)
{
    LedgerOptions options;
    if (!InitLedgerOptions(args, options, error)) {
        return false;
    }

    int64_t nCacheMiB = args.GetArg("-ledgerdbcache", DEFAULT_LEDGER_DB_CACHE);
    if (nCacheMiB < 1) {
        error = strprintf("Invalid -ledgerdbcache=%d (minimum 1)", nCacheMiB);
        return false;
    }

    g_ledger.reset();
    if (!InitCampaignDB(static_cast<size_t>(nCacheMiB) << 20)) {
        error = "Failed to open campaign database";
        return false;
    }

    g_ledger = std::make_unique<CLedger>(options, rail, g_campaigndb.get());
    if (!g_ledger->LoadFromDB(error)) {
        LogPrintf("ERROR: %s: %s\n", __func__, error);
        g_ledger.reset();
        g_campaigndb.reset();
        return false;
    }
    return true;
}

void ShutdownLedger()
{
    g_ledger.reset();
    if (g_campaigndb) {
        try {
            g_campaigndb->Sync();
        } catch (const std::exception& e) {
            LogPrintf("ERROR: %s: campaign DB sync failed: %s\n", __func__, e.what());
        }
        g_campaigndb.reset();
    }
}

void InitLedgerInterfaces()
{
    pLedgerEventLogger = std::make_unique<CLedgerEventLogger>();
    RegisterLedgerInterface(pLedgerEventLogger.get());
}

void ResetLedgerInterfaces()
{
    if (pLedgerEventLogger) {
        UnregisterLedgerInterface(pLedgerEventLogger.get());
        pLedgerEventLogger.reset();
    }
}
