// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/auth.h"

bool ParseAuthPolicy(const std::string& str, AuthPolicy& policy)
{
    if (str == "open") {
        policy = AuthPolicy::OPEN;
    } else if (str == "owner") {
        policy = AuthPolicy::OWNER_ONLY;
    } else if (str == "allowlist") {
        policy = AuthPolicy::ALLOWLIST;
    } else {
        return false;
    }
    return true;
}

std::string AuthPolicyToString(AuthPolicy policy)
{
    switch (policy) {
    case AuthPolicy::OPEN:
        return "open";
    case AuthPolicy::OWNER_ONLY:
        return "owner";
    case AuthPolicy::ALLOWLIST:
        return "allowlist";
    }
    return "unknown";
}

CAuthorizer::CAuthorizer(AuthPolicy policy, const CAccountID& owner, const std::set<CAccountID>& allowlist)
    : m_policy(policy), m_owner(owner), m_allowlist(allowlist)
{
}

bool CAuthorizer::IsAuthorized(const CAccountID& caller) const
{
    if (m_policy == AuthPolicy::OPEN) {
        return true;
    }

    if (caller.IsNull()) {
        return false;
    }

    if (!m_owner.IsNull() && caller == m_owner) {
        return true;
    }

    return m_policy == AuthPolicy::ALLOWLIST && m_allowlist.count(caller) > 0;
}
