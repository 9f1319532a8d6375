// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CROWDFUND_LEDGER_LEDGERSTATE_H
#define CROWDFUND_LEDGER_LEDGERSTATE_H

#include <stdint.h>
#include <string>

/**
 * LedgerError - why a ledger operation was rejected
 *
 * Every rejection is terminal for the call and leaves the ledger exactly as
 * it was before the call. The ledger never retries; the caller decides.
 */
enum class LedgerError : uint8_t {
    NONE = 0,
    INVALID_INDEX,              // No campaign at that index
    NOT_AUTHORIZED,             // Caller rejected by the configured policy
    CAMPAIGN_CLOSED,            // Donation at or after the deadline
    CAMPAIGN_STILL_OPEN,        // Settlement before the deadline
    CAMPAIGN_ALREADY_SETTLED,   // Campaign already paid out
    NOTHING_TO_SETTLE,          // Raised amount is zero
    NO_BENEFACTOR,              // Null benefactor, nobody to pay
    AMOUNT_OVERFLOW,            // Amount or deadline arithmetic overflow
    REENTRANT_CALL,             // Settlement already in progress
    TRANSFER_FAILED,            // Value rail refused the payout (state rolled back)
    STORAGE_FAILED,             // Campaign DB write failed (state rolled back)
};

/** Stable reject code, e.g. "campaign-closed". Safe to match on in callers and tests. */
const char* LedgerErrorToString(LedgerError error);

/** Capture information about ledger operation failure */
class CLedgerState
{
private:
    LedgerError m_error{LedgerError::NONE};
    std::string m_debug_message;

public:
    bool Invalid(LedgerError error, const std::string& debug_message = "")
    {
        m_error = error;
        m_debug_message = debug_message;
        return false;
    }

    bool IsValid() const { return m_error == LedgerError::NONE; }
    bool IsInvalid() const { return m_error != LedgerError::NONE; }

    LedgerError GetError() const { return m_error; }
    std::string GetRejectReason() const { return LedgerErrorToString(m_error); }
    const std::string& GetDebugMessage() const { return m_debug_message; }

    std::string ToString() const
    {
        if (IsValid()) return "Valid";
        if (m_debug_message.empty()) return GetRejectReason();
        return GetRejectReason() + ", " + m_debug_message;
    }
};

#endif // CROWDFUND_LEDGER_LEDGERSTATE_H
