// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/authorization.h>

#include <util.h>

namespace credit {

std::string CapabilityToString(Capability cap)
{
    switch (cap) {
        case Capability::LEDGER_WRITER: return "ledger_writer";
        case Capability::FUND_COVERER: return "fund_coverer";
        case Capability::REVENUE_ALLOCATOR: return "revenue_allocator";
        case Capability::ATTESTER: return "attester";
        case Capability::ADMIN: return "admin";
    }
    return "unknown";
}

AuthorizationGate::AuthorizationGate(const Principal& admin)
{
    allowLists_[Capability::ADMIN].insert(admin);
}

CreditResult AuthorizationGate::Grant(const Principal& caller, Capability cap, const Principal& principal)
{
    LOCK(cs_gate_);

    if (!IsAllowed(Capability::ADMIN, caller)) {
        return CreditResult::Fail(CreditError::UNAUTHORIZED, "Only an admin may grant capabilities");
    }
    if (principal.IsNull()) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT, "Cannot grant to the null principal");
    }

    if (allowLists_[cap].insert(principal).second) {
        LogPrint(BCLog::CREDIT, "Credit: Granted %s to %s\n", CapabilityToString(cap), principal.GetHex());
    }
    return CreditResult::Ok();
}

CreditResult AuthorizationGate::Revoke(const Principal& caller, Capability cap, const Principal& principal)
{
    LOCK(cs_gate_);

    if (!IsAllowed(Capability::ADMIN, caller)) {
        return CreditResult::Fail(CreditError::UNAUTHORIZED, "Only an admin may revoke capabilities");
    }

    auto it = allowLists_.find(cap);
    if (it == allowLists_.end() || it->second.count(principal) == 0) {
        return CreditResult::Ok();
    }
    if (cap == Capability::ADMIN && it->second.size() == 1) {
        return CreditResult::Fail(CreditError::UNAUTHORIZED, "Cannot revoke the last admin");
    }

    it->second.erase(principal);
    LogPrint(BCLog::CREDIT, "Credit: Revoked %s from %s\n", CapabilityToString(cap), principal.GetHex());
    return CreditResult::Ok();
}

bool AuthorizationGate::IsAllowed(Capability cap, const Principal& principal) const
{
    LOCK(cs_gate_);
    auto it = allowLists_.find(cap);
    return it != allowLists_.end() && it->second.count(principal) > 0;
}

CreditResult AuthorizationGate::Require(Capability cap, const Principal& principal) const
{
    if (!IsAllowed(cap, principal)) {
        return CreditResult::Fail(CreditError::UNAUTHORIZED,
            strprintf("Caller %s lacks %s", principal.GetHex(), CapabilityToString(cap)));
    }
    return CreditResult::Ok();
}

size_t AuthorizationGate::CountHolders(Capability cap) const
{
    LOCK(cs_gate_);
    auto it = allowLists_.find(cap);
    return it == allowLists_.end() ? 0 : it->second.size();
}

} // namespace credit
