// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "amount.h"

#include "logging.h"
#include "utilmoneystr.h"

bool AddNoOverflow(const CAmount& a, const CAmount& b, CAmount& result)
{
    // Unsigned: a + b overflows iff b exceeds the headroom above a
    if (b > MAX_AMOUNT - a) {
        LogPrint(BCLog::LEDGER, "AddNoOverflow: overflow a=%s b=%s\n",
                 FormatAmount(a), FormatAmount(b));
        return false;
    }

    result = a + b;
    return true;
}
