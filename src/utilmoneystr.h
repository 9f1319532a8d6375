// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Money parsing/formatting utilities.
 */
#ifndef CROWDFUND_UTILMONEYSTR_H
#define CROWDFUND_UTILMONEYSTR_H

#include "amount.h"

#include <string>

/** Decimal representation of n in base units (no fractional part). */
std::string FormatAmount(const CAmount& n);

bool ParseAmount(const std::string& str, CAmount& nRet);
bool ParseAmount(const char* pszIn, CAmount& nRet);

#endif // CROWDFUND_UTILMONEYSTR_H
