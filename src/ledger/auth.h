// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CROWDFUND_LEDGER_AUTH_H
#define CROWDFUND_LEDGER_AUTH_H

#include "account.h"

#include <set>
#include <stdint.h>
#include <string>

/**
 * AuthPolicy - who may invoke a gated ledger operation
 *
 * Configured separately for campaign creation and for settlement:
 *   -createpolicy=open|owner|allowlist   (default: open)
 *   -settlepolicy=open|owner|allowlist   (default: owner)
 */
enum class AuthPolicy : uint8_t {
    OPEN = 0,        // Any caller
    OWNER_ONLY = 1,  // Only the designated ledger owner
    ALLOWLIST = 2    // The owner plus every allowlisted account
};

bool ParseAuthPolicy(const std::string& str, AuthPolicy& policy);
std::string AuthPolicyToString(AuthPolicy policy);

class CAuthorizer
{
private:
    AuthPolicy m_policy{AuthPolicy::OPEN};
    CAccountID m_owner;
    std::set<CAccountID> m_allowlist;

public:
    CAuthorizer() = default;
    CAuthorizer(AuthPolicy policy, const CAccountID& owner, const std::set<CAccountID>& allowlist);

    /** The null account is never authorized by a restricted policy. */
    bool IsAuthorized(const CAccountID& caller) const;

    AuthPolicy GetPolicy() const { return m_policy; }
};

#endif // CROWDFUND_LEDGER_AUTH_H
