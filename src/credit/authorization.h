// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_CREDIT_AUTHORIZATION_H
#define CREDITCORE_CREDIT_AUTHORIZATION_H

/**
 * @file authorization.h
 * @brief Capability allow-list gating every write into shared credit state
 *
 * Each capability is an explicit set of permitted principals, checked per
 * call. There is no role hierarchy: holding ADMIN does not imply any other
 * capability.
 */

#include <credit/credit_common.h>
#include <sync.h>
#include <uint256.h>

#include <map>
#include <set>
#include <string>

namespace credit {

enum class Capability : uint8_t {
    /** Register loans, repayments, liquidations and collateral */
    LEDGER_WRITER = 0,
    /** Draw on the loss-absorption fund */
    FUND_COVERER = 1,
    /** Route protocol revenue into the fund */
    REVENUE_ALLOCATOR = 2,
    /** Post score attestations */
    ATTESTER = 3,
    /** Grant/revoke, cancel auctions, pause, tune parameters */
    ADMIN = 4
};

std::string CapabilityToString(Capability cap);

inline std::ostream& operator<<(std::ostream& os, Capability cap) {
    return os << CapabilityToString(cap);
}

class AuthorizationGate
{
public:
    /** The initial admin is the only principal allowed to grant */
    explicit AuthorizationGate(const Principal& admin);

    /**
     * Add a principal to a capability's allow-list.
     * @param caller Must hold ADMIN
     */
    CreditResult Grant(const Principal& caller, Capability cap, const Principal& principal);

    /**
     * Remove a principal from a capability's allow-list.
     * Removing the last admin is refused so the gate can never lock itself.
     */
    CreditResult Revoke(const Principal& caller, Capability cap, const Principal& principal);

    bool IsAllowed(Capability cap, const Principal& principal) const;

    /** Fails with UNAUTHORIZED unless principal holds cap */
    CreditResult Require(Capability cap, const Principal& principal) const;

    size_t CountHolders(Capability cap) const;

private:
    mutable CCriticalSection cs_gate_;
    std::map<Capability, std::set<Principal>> allowLists_;
};

} // namespace credit

#endif // CREDITCORE_CREDIT_AUTHORIZATION_H
