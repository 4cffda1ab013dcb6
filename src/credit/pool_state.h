// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_CREDIT_POOL_STATE_H
#define CREDITCORE_CREDIT_POOL_STATE_H

/**
 * @file pool_state.h
 * @brief Lending pool records shared with the ledger and its database
 *
 * A pool write that also moves a loan (open, principal repayment,
 * liquidation) travels inside the ledger's transition, so the loan row and
 * the pool position are committed together.
 */

#include <amount.h>
#include <credit/credit_common.h>

#include <optional>
#include <utility>

namespace credit {

/**
 * @brief Pool-side view of one loan
 */
struct LoanPosition {
    uint64_t loanId = NULL_LOAN_ID;
    Subject subject;
    AssetId collateralAsset;
    /** Collateral still held, in asset base units */
    CAmount collateralAmount = 0;
    CAmount originalPrincipal = 0;
    /** Outstanding principal */
    CAmount principal = 0;
    /** Interest accrued up to lastAccrual and not yet paid */
    CAmount accruedInterest = 0;
    /** Annual rate fixed at origination */
    int64_t rateBps = 0;
    int64_t lastAccrual = 0;
    /** Tier max LTV at origination, used as liquidation threshold */
    int64_t liquidationThresholdBps = 0;
    Tier tier = Tier::BRONZE;
    int64_t creditScore = 0;
    int64_t openedAt = 0;
    bool active = false;
};

struct PoolTotals {
    CAmount cash = 0;
    CAmount totalBorrows = 0;
    CAmount reserves = 0;
    bool paused = false;
};

/**
 * @brief Everything one pool write changes
 *
 * totals always carries the complete post-write values.
 */
struct PoolTransition {
    std::optional<LoanPosition> position;
    /** Lender whose deposit changed, with the new balance */
    std::optional<std::pair<Principal, CAmount>> lender;
    PoolTotals totals;
};

} // namespace credit

#endif // CREDITCORE_CREDIT_POOL_STATE_H
