// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "account.h"

#include <stdexcept>

static signed char HexDigit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

CAccountID::CAccountID(const std::vector<unsigned char>& vch)
{
    if (vch.size() != WIDTH)
        throw std::invalid_argument("CAccountID: wrong vector size");
    memcpy(m_data, vch.data(), WIDTH);
}

bool CAccountID::SetHex(const std::string& str)
{
    size_t pos = 0;
    if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X'))
        pos = 2;

    if (str.size() - pos != 2 * WIDTH)
        return false;

    uint8_t data[WIDTH];
    for (unsigned int i = 0; i < WIDTH; i++) {
        signed char hi = HexDigit(str[pos + 2 * i]);
        signed char lo = HexDigit(str[pos + 2 * i + 1]);
        if (hi < 0 || lo < 0)
            return false;
        data[i] = (uint8_t)((hi << 4) | lo);
    }
    memcpy(m_data, data, WIDTH);
    return true;
}

std::string CAccountID::GetHex() const
{
    static const char hexmap[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                    '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::string rv("0x");
    rv.reserve(2 + WIDTH * 2);
    for (unsigned int i = 0; i < WIDTH; i++) {
        rv.push_back(hexmap[m_data[i] >> 4]);
        rv.push_back(hexmap[m_data[i] & 15]);
    }
    return rv;
}

bool ParseAccountID(const std::string& str, CAccountID& id)
{
    return id.SetHex(str);
}
