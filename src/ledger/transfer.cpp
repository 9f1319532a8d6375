// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/transfer.h"

#include "logging.h"
#include "utilmoneystr.h"

bool CCustodyRail::Deposit(const CAmount& amount, std::string& strError)
{
    LOCK(cs);
    CAmount newCustody;
    if (!AddNoOverflow(m_custody, amount, newCustody)) {
        strError = "custody-overflow";
        return false;
    }
    m_custody = newCustody;
    LogPrint(BCLog::TRANSFER, "CCustodyRail: deposit %s (custody=%s)\n",
             FormatAmount(amount), FormatAmount(m_custody));
    return true;
}

bool CCustodyRail::Transfer(const CAccountID& recipient, const CAmount& amount, std::string& strError)
{
    LOCK(cs);

    if (recipient.IsNull()) {
        strError = "null-recipient";
        return false;
    }

    if (m_blocked.count(recipient)) {
        strError = "recipient-blocked";
        LogPrint(BCLog::TRANSFER, "CCustodyRail: REJECT transfer %s to blocked %s\n",
                 FormatAmount(amount), recipient.ToString());
        return false;
    }

    if (amount > m_custody) {
        strError = "insufficient-custody";
        LogPrint(BCLog::TRANSFER, "CCustodyRail: REJECT transfer %s > custody %s\n",
                 FormatAmount(amount), FormatAmount(m_custody));
        return false;
    }

    auto it = m_paid.find(recipient);
    const CAmount alreadyPaid = it == m_paid.end() ? 0 : it->second;
    CAmount newPaid;
    if (!AddNoOverflow(alreadyPaid, amount, newPaid)) {
        strError = "recipient-overflow";
        return false;
    }

    m_custody -= amount;
    m_paid[recipient] = newPaid;

    LogPrint(BCLog::TRANSFER, "CCustodyRail: paid %s to %s (custody=%s)\n",
             FormatAmount(amount), recipient.ToString(), FormatAmount(m_custody));
    return true;
}

void CCustodyRail::BlockRecipient(const CAccountID& recipient)
{
    LOCK(cs);
    m_blocked.insert(recipient);
}

void CCustodyRail::UnblockRecipient(const CAccountID& recipient)
{
    LOCK(cs);
    m_blocked.erase(recipient);
}

CAmount CCustodyRail::GetCustodyBalance() const
{
    LOCK(cs);
    return m_custody;
}

CAmount CCustodyRail::GetPaidTo(const CAccountID& recipient) const
{
    LOCK(cs);
    auto it = m_paid.find(recipient);
    return it == m_paid.end() ? 0 : it->second;
}
