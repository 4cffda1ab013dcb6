// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/credit_common.h>

namespace credit {

std::string CreditErrorToString(CreditError error) {
    switch (error) {
        case CreditError::OK:
            return "OK";
        case CreditError::UNAUTHORIZED:
            return "Unauthorized";
        case CreditError::INVALID_SCORE:
            return "InvalidScore";
        case CreditError::INVALID_TIER:
            return "InvalidTier";
        case CreditError::INVALID_LTV:
            return "InvalidLTV";
        case CreditError::INVALID_PROOF:
            return "InvalidProof";
        case CreditError::PROOF_EXPIRED:
            return "ProofExpired";
        case CreditError::INVALID_AMOUNT:
            return "InvalidAmount";
        case CreditError::LOAN_NOT_ACTIVE:
            return "LoanNotActive";
        case CreditError::ATTESTATION_PENDING:
            return "AttestationPending";
        case CreditError::AUCTION_ALREADY_EXECUTED:
            return "AuctionAlreadyExecuted";
        case CreditError::GRACE_PERIOD_ACTIVE:
            return "GracePeriodActive";
        case CreditError::LOCK_ACTIVE:
            return "LockActive";
        case CreditError::CHALLENGE_PERIOD_ACTIVE:
            return "ChallengePeriodActive";
        case CreditError::CHALLENGE_PERIOD_NOT_EXPIRED:
            return "ChallengePeriodNotExpired";
        case CreditError::ALREADY_CHALLENGED:
            return "AlreadyChallenged";
        case CreditError::NOT_LIQUIDATABLE:
            return "NotLiquidatable";
        case CreditError::PAUSED:
            return "Paused";
        case CreditError::INSUFFICIENT_LIQUIDITY:
            return "InsufficientLiquidity";
        case CreditError::EXCEEDS_ALLOWED_LTV:
            return "ExceedsAllowedLTV";
        case CreditError::INSUFFICIENT_BOND:
            return "InsufficientBond";
        case CreditError::INSUFFICIENT_FUNDS:
            return "InsufficientFunds";
        case CreditError::UNKNOWN_LOAN:
            return "UnknownLoan";
        case CreditError::UNKNOWN_AUCTION:
            return "UnknownAuction";
        case CreditError::UNKNOWN_ATTESTATION:
            return "UnknownAttestation";
        case CreditError::CHALLENGE_NOT_FOUND:
            return "ChallengeNotFound";
        case CreditError::PRICE_UNAVAILABLE:
            return "PriceUnavailable";
        case CreditError::STALE_PRICE:
            return "StalePrice";
        case CreditError::TRANSFER_FAILED:
            return "TransferFailed";
        case CreditError::STORAGE_FAILURE:
            return "StorageFailure";
    }
    return "Unknown";
}

std::string LoanStatusToString(LoanStatus status) {
    switch (status) {
        case LoanStatus::ACTIVE: return "active";
        case LoanStatus::REPAID: return "repaid";
        case LoanStatus::LIQUIDATED: return "liquidated";
    }
    return "unknown";
}

std::string TierToString(Tier tier) {
    switch (tier) {
        case Tier::BRONZE: return "Bronze";
        case Tier::SILVER: return "Silver";
        case Tier::GOLD: return "Gold";
        case Tier::PLATINUM: return "Platinum";
    }
    return "Unknown";
}

std::string RiskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::SAFE: return "safe";
        case RiskLevel::WARNING: return "warning";
        case RiskLevel::DANGER: return "danger";
        case RiskLevel::CRITICAL: return "critical";
    }
    return "unknown";
}

std::string AuctionStateToString(AuctionState state) {
    switch (state) {
        case AuctionState::NONE: return "none";
        case AuctionState::GRACE_PENDING: return "grace_pending";
        case AuctionState::AUCTION_OPEN: return "auction_open";
        case AuctionState::EXECUTED: return "executed";
        case AuctionState::CANCELLED: return "cancelled";
    }
    return "unknown";
}

} // namespace credit
