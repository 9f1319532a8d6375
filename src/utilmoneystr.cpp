// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "utilmoneystr.h"

#include <algorithm>
#include <ctype.h>

std::string FormatAmount(const CAmount& n)
{
    if (n == 0)
        return "0";

    std::string str;
    CAmount value = n;
    while (value > 0) {
        str.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(str.begin(), str.end());
    return str;
}


bool ParseAmount(const std::string& str, CAmount& nRet)
{
    // Embedded NUL would otherwise truncate the c_str() view
    if (str.find('\0') != std::string::npos)
        return false;
    return ParseAmount(str.c_str(), nRet);
}

bool ParseAmount(const char* pszIn, CAmount& nRet)
{
    const char* p = pszIn;

    // Skip leading whitespace
    while (isspace(static_cast<unsigned char>(*p)))
        p++;

    CAmount value = 0;
    bool fDigits = false;
    for (; *p; p++) {
        if (isspace(static_cast<unsigned char>(*p)))
            break;
        if (!isdigit(static_cast<unsigned char>(*p)))
            return false;
        const CAmount digit = static_cast<CAmount>(*p - '0');
        // value * 10 + digit must stay within MAX_AMOUNT
        if (value > (MAX_AMOUNT - digit) / 10)
            return false;
        value = value * 10 + digit;
        fDigits = true;
    }

    // Skip trailing whitespace
    for (; *p; p++)
        if (!isspace(static_cast<unsigned char>(*p)))
            return false;

    if (!fDigits)
        return false;

    nRet = value;
    return true;
}
