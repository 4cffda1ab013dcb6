// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_CREDIT_COMMON_H
#define CREDITCORE_CREDIT_COMMON_H

/**
 * @file credit_common.h
 * @brief Common types shared by every credit ledger component
 *
 * Error codes, the operation result type, status enumerations and the
 * fixed-point conventions used across the ledger, scoring, lending,
 * liquidation and fund engines.
 */

#include <amount.h>
#include <uint256.h>

#include <cstdint>
#include <limits>
#include <ostream>
#include <string>

namespace credit {

/** Subjects, accounts, assets and principals are all 160-bit handles */
typedef uint160 Subject;
typedef uint160 AssetId;
typedef uint160 Principal;

/** Denominator for every ratio expressed in basis points */
static constexpr int64_t BPS_ONE = 10000;

/** Loan ids are assigned from 1; 0 never names a loan */
static constexpr uint64_t NULL_LOAN_ID = 0;

// ============================================================================
// Error codes
// ============================================================================

/**
 * @brief Every failure a credit operation can report
 *
 * Grouped as authorization, validation, state-conflict and resource errors,
 * followed by supporting codes for lookups, feeds and transfers.
 */
enum class CreditError : uint8_t {
    OK = 0,

    // Authorization
    UNAUTHORIZED,

    // Validation
    INVALID_SCORE,
    INVALID_TIER,
    INVALID_LTV,
    INVALID_PROOF,
    PROOF_EXPIRED,
    INVALID_AMOUNT,

    // State conflict
    LOAN_NOT_ACTIVE,
    ATTESTATION_PENDING,
    AUCTION_ALREADY_EXECUTED,
    GRACE_PERIOD_ACTIVE,
    LOCK_ACTIVE,
    CHALLENGE_PERIOD_ACTIVE,
    CHALLENGE_PERIOD_NOT_EXPIRED,
    ALREADY_CHALLENGED,
    NOT_LIQUIDATABLE,
    PAUSED,

    // Resource
    INSUFFICIENT_LIQUIDITY,
    EXCEEDS_ALLOWED_LTV,
    INSUFFICIENT_BOND,
    INSUFFICIENT_FUNDS,

    // Lookups and collaborators
    UNKNOWN_LOAN,
    UNKNOWN_AUCTION,
    UNKNOWN_ATTESTATION,
    CHALLENGE_NOT_FOUND,
    PRICE_UNAVAILABLE,
    STALE_PRICE,
    TRANSFER_FAILED,
    STORAGE_FAILURE
};

/**
 * @brief Convert CreditError to its stable name
 */
std::string CreditErrorToString(CreditError error);

/**
 * @brief Stream output operator for CreditError (needed for Boost.Test)
 */
inline std::ostream& operator<<(std::ostream& os, CreditError error) {
    return os << CreditErrorToString(error);
}

/**
 * @brief Outcome of a credit operation
 *
 * Operations never partially apply: a failed result means no record,
 * counter or balance changed.
 */
struct CreditResult {
    /** Error code; OK on success */
    CreditError error = CreditError::OK;

    /** Detailed error message */
    std::string message;

    CreditResult() = default;

    static CreditResult Ok() {
        return CreditResult();
    }

    static CreditResult Fail(CreditError err, const std::string& msg = "") {
        CreditResult result;
        result.error = err;
        result.message = msg.empty() ? CreditErrorToString(err) : msg;
        return result;
    }

    bool IsOk() const { return error == CreditError::OK; }

    explicit operator bool() const { return IsOk(); }
};

// ============================================================================
// Status enumerations
// ============================================================================

/**
 * @brief Lifecycle of a loan record
 */
enum class LoanStatus : uint8_t {
    ACTIVE = 0,
    REPAID = 1,
    LIQUIDATED = 2
};

std::string LoanStatusToString(LoanStatus status);

inline std::ostream& operator<<(std::ostream& os, LoanStatus status) {
    return os << LoanStatusToString(status);
}

/**
 * @brief Discrete credit band mapping score ranges to borrowing terms
 */
enum class Tier : uint8_t {
    BRONZE = 0,
    SILVER = 1,
    GOLD = 2,
    PLATINUM = 3
};

static constexpr size_t TIER_COUNT = 4;

std::string TierToString(Tier tier);

inline std::ostream& operator<<(std::ostream& os, Tier tier) {
    return os << TierToString(tier);
}

/**
 * @brief Risk classification of a position by health factor
 */
enum class RiskLevel : uint8_t {
    SAFE = 0,
    WARNING = 1,
    DANGER = 2,
    CRITICAL = 3
};

std::string RiskLevelToString(RiskLevel level);

inline std::ostream& operator<<(std::ostream& os, RiskLevel level) {
    return os << RiskLevelToString(level);
}

/**
 * @brief Liquidation auction state machine
 *
 * NONE -> GRACE_PENDING -> AUCTION_OPEN -> EXECUTED, or CANCELLED by an admin.
 * GRACE_PENDING and AUCTION_OPEN are derived lazily from the stored grace end
 * and the caller's clock.
 */
enum class AuctionState : uint8_t {
    NONE = 0,
    GRACE_PENDING = 1,
    AUCTION_OPEN = 2,
    EXECUTED = 3,
    CANCELLED = 4
};

std::string AuctionStateToString(AuctionState state);

inline std::ostream& operator<<(std::ostream& os, AuctionState state) {
    return os << AuctionStateToString(state);
}

// ============================================================================
// Fixed-point helpers
// ============================================================================

/** a * b / c with a 128-bit intermediate; c must be non-zero */
inline int64_t MulDiv(int64_t a, int64_t b, int64_t c)
{
    __int128 numerator = static_cast<__int128>(a) * b;
    __int128 result = numerator / c;
    if (result > std::numeric_limits<int64_t>::max()) return std::numeric_limits<int64_t>::max();
    if (result < std::numeric_limits<int64_t>::min()) return std::numeric_limits<int64_t>::min();
    return static_cast<int64_t>(result);
}

/** Same as MulDiv but rounds up for non-negative operands */
inline int64_t MulDivCeil(int64_t a, int64_t b, int64_t c)
{
    __int128 numerator = static_cast<__int128>(a) * b;
    __int128 result = (numerator + c - 1) / c;
    if (result > std::numeric_limits<int64_t>::max()) return std::numeric_limits<int64_t>::max();
    return static_cast<int64_t>(result);
}

/** 10^decimals for price scaling; decimals above 18 are rejected by callers */
inline int64_t Pow10(uint8_t decimals)
{
    int64_t result = 1;
    for (uint8_t i = 0; i < decimals; ++i) result *= 10;
    return result;
}

template <typename T>
inline T Clamp(T value, T lo, T hi)
{
    return value < lo ? lo : (value > hi ? hi : value);
}

} // namespace credit

#endif // CREDITCORE_CREDIT_COMMON_H
