// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledgerstate.h"

const char* LedgerErrorToString(LedgerError error)
{
    switch (error) {
    case LedgerError::NONE:                     return "valid";
    case LedgerError::INVALID_INDEX:            return "bad-campaign-index";
    case LedgerError::NOT_AUTHORIZED:           return "not-authorized";
    case LedgerError::CAMPAIGN_CLOSED:          return "campaign-closed";
    case LedgerError::CAMPAIGN_STILL_OPEN:      return "campaign-still-open";
    case LedgerError::CAMPAIGN_ALREADY_SETTLED: return "campaign-already-settled";
    case LedgerError::NOTHING_TO_SETTLE:        return "nothing-to-settle";
    case LedgerError::NO_BENEFACTOR:            return "no-benefactor";
    case LedgerError::AMOUNT_OVERFLOW:          return "amount-overflow";
    case LedgerError::REENTRANT_CALL:           return "reentrant-call";
    case LedgerError::TRANSFER_FAILED:          return "transfer-failed";
    case LedgerError::STORAGE_FAILED:           return "storage-failed";
    }
    return "unknown";
}
