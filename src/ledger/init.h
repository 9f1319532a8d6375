// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CROWDFUND_LEDGER_INIT_H
#define CROWDFUND_LEDGER_INIT_H

#include <string>

class ArgsManager;
class CTransferRail;
struct LedgerOptions;

static const char* const DEFAULT_CREATE_POLICY = "open";
static const char* const DEFAULT_SETTLE_POLICY = "owner";

/**
 * InitLedgerOptions - Convert -createpolicy, -settlepolicy, -ledgerowner and
 * -ledgerallow into ledger options
 *
 * An "owner" policy requires -ledgerowner; an "allowlist" policy requires
 * -ledgerowner or at least one -ledgerallow.
 *
 * @return false with error set on a malformed or inconsistent setting
 */
bool InitLedgerOptions(const ArgsManager& args, LedgerOptions& options, std::string& error);

/** Apply -printtoconsole, -debug, -debugexclude and -debuglogfile, then start the logger. */
bool InitLogging(const ArgsManager& args, std::string& error);

/**
 * InitLedger - Open the campaign DB and bring up g_ledger over rail
 *
 * The rail must outlive the ledger (until ShutdownLedger()).
 */
bool InitLedger(const ArgsManager& args, CTransferRail& rail, std::string& error);
void ShutdownLedger();

void InitLedgerInterfaces();
void ResetLedgerInterfaces();

#endif // CROWDFUND_LEDGER_INIT_H
