// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/health_monitor.h>

namespace credit {

int64_t HealthMonitor::CalculateHealthFactor(CAmount collateralValue, CAmount debt,
                                             int64_t liquidationThresholdBps) const
{
    if (debt <= 0) {
        return HEALTH_FACTOR_INFINITE;
    }
    if (collateralValue <= 0) {
        return 0;
    }
    return MulDiv(collateralValue, liquidationThresholdBps, debt);
}

RiskLevel HealthMonitor::GetRiskLevel(int64_t healthFactorBps) const
{
    if (healthFactorBps >= HEALTH_SAFE_BPS) return RiskLevel::SAFE;
    if (healthFactorBps >= HEALTH_WARNING_BPS) return RiskLevel::WARNING;
    if (healthFactorBps > GetLiquidationHealthFactor()) return RiskLevel::DANGER;
    return RiskLevel::CRITICAL;
}

bool HealthMonitor::IsLiquidatable(int64_t healthFactorBps) const
{
    return healthFactorBps <= GetLiquidationHealthFactor();
}

int64_t HealthMonitor::GetLiquidationHealthFactor() const
{
    LOCK(cs_health_);
    return params_.liquidationHealthFactorBps;
}

void HealthMonitor::SetParams(const LiquidationParams& params)
{
    LOCK(cs_health_);
    params_ = params;
}

CAmount HealthMonitor::RequiredAdditionalCollateral(CAmount collateralValue, CAmount debt,
                                                    int64_t liquidationThresholdBps,
                                                    int64_t targetHealthFactorBps) const
{
    if (debt <= 0 || liquidationThresholdBps <= 0) {
        return 0;
    }
    if (CalculateHealthFactor(collateralValue, debt, liquidationThresholdBps) >= targetHealthFactorBps) {
        return 0;
    }
    CAmount required = MulDivCeil(debt, targetHealthFactorBps, liquidationThresholdBps);
    return required > collateralValue ? required - collateralValue : 0;
}

} // namespace credit
