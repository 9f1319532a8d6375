// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CROWDFUND_ACCOUNT_H
#define CROWDFUND_ACCOUNT_H

#include <stdint.h>
#include <string.h>
#include <string>
#include <vector>

/**
 * CAccountID - 20-byte account address
 *
 * Identifies campaign creators, benefactors and callers. The boundary layer
 * authenticates callers; the ledger only compares ids. The all-zero id is
 * the null account and can never receive a payout.
 *
 * Text form: "0x" followed by 40 lowercase hex digits.
 */
class CAccountID
{
public:
    static constexpr unsigned int WIDTH = 20;

private:
    uint8_t m_data[WIDTH];

public:
    CAccountID() { SetNull(); }
    explicit CAccountID(const std::vector<unsigned char>& vch);

    bool IsNull() const
    {
        for (unsigned int i = 0; i < WIDTH; i++)
            if (m_data[i] != 0)
                return false;
        return true;
    }

    void SetNull() { memset(m_data, 0, sizeof(m_data)); }

    inline int Compare(const CAccountID& other) const { return memcmp(m_data, other.m_data, sizeof(m_data)); }

    friend inline bool operator==(const CAccountID& a, const CAccountID& b) { return a.Compare(b) == 0; }
    friend inline bool operator!=(const CAccountID& a, const CAccountID& b) { return a.Compare(b) != 0; }
    friend inline bool operator<(const CAccountID& a, const CAccountID& b) { return a.Compare(b) < 0; }

    /** Parse "0x" + 40 hex digits (prefix optional). Returns false and leaves the id untouched on error. */
    bool SetHex(const std::string& str);
    std::string GetHex() const;
    std::string ToString() const { return GetHex(); }

    const uint8_t* begin() const { return &m_data[0]; }
    const uint8_t* end() const { return &m_data[WIDTH]; }

    template<typename Stream>
    void Serialize(Stream& s) const
    {
        s.write((const char*)m_data, sizeof(m_data));
    }

    template<typename Stream>
    void Unserialize(Stream& s)
    {
        s.read((char*)m_data, sizeof(m_data));
    }
};

/** Parse an account id, returning false for malformed text. */
bool ParseAccountID(const std::string& str, CAccountID& id);

#endif // CROWDFUND_ACCOUNT_H
