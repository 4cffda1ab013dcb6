// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_CREDIT_HEALTH_MONITOR_H
#define CREDITCORE_CREDIT_HEALTH_MONITOR_H

/**
 * @file health_monitor.h
 * @brief Health factor and risk classification of a collateralized position
 *
 * healthFactor = collateralValue * liquidationThreshold / debt, in basis
 * points. A debt-free position reports HEALTH_FACTOR_INFINITE.
 */

#include <amount.h>
#include <credit/credit_common.h>
#include <credit/credit_params.h>
#include <sync.h>

#include <limits>

namespace credit {

static constexpr int64_t HEALTH_FACTOR_INFINITE = std::numeric_limits<int64_t>::max();

/** Risk band lower bounds, bps */
static constexpr int64_t HEALTH_SAFE_BPS = 12000;
static constexpr int64_t HEALTH_WARNING_BPS = 10500;

class HealthMonitor
{
public:
    explicit HealthMonitor(const LiquidationParams& params) : params_(params) {}

    /**
     * @param liquidationThresholdBps Share of collateral value counted against debt
     */
    int64_t CalculateHealthFactor(CAmount collateralValue, CAmount debt, int64_t liquidationThresholdBps) const;

    RiskLevel GetRiskLevel(int64_t healthFactorBps) const;

    bool IsLiquidatable(int64_t healthFactorBps) const;

    /** Collateral value to add to reach targetHealthFactorBps; 0 if already there */
    CAmount RequiredAdditionalCollateral(CAmount collateralValue, CAmount debt,
                                         int64_t liquidationThresholdBps,
                                         int64_t targetHealthFactorBps) const;

    int64_t GetLiquidationHealthFactor() const;

    void SetParams(const LiquidationParams& params);

private:
    mutable CCriticalSection cs_health_;
    LiquidationParams params_;
};

} // namespace credit

#endif // CREDITCORE_CREDIT_HEALTH_MONITOR_H
