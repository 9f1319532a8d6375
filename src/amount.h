// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CROWDFUND_AMOUNT_H
#define CROWDFUND_AMOUNT_H

#include <stdint.h>

/**
 * Amount in base units of the custody asset.
 *
 * 128-bit unsigned so that campaign totals never need to wrap. All
 * additions on ledger balances go through AddNoOverflow(); amounts are
 * never converted to floating point.
 */
__extension__ typedef unsigned __int128 CAmount;

static const CAmount MAX_AMOUNT = ~static_cast<CAmount>(0);

/**
 * AddNoOverflow - Overflow-checked CAmount addition
 *
 * @param a First operand
 * @param b Second operand
 * @param result Output: a + b if no overflow (untouched otherwise)
 * @return true if no overflow, false if overflow would occur
 */
bool AddNoOverflow(const CAmount& a, const CAmount& b, CAmount& result);

#endif // CROWDFUND_AMOUNT_H
