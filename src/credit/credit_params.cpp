// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/credit_params.h>

#include <util.h>

#include <algorithm>

namespace credit {

Tier TierTable::GetTier(int64_t score) const
{
    for (size_t i = TIER_COUNT; i-- > 0;) {
        if (score >= tiers[i].minScore) {
            return static_cast<Tier>(i);
        }
    }
    return Tier::BRONZE;
}

int64_t RateModel::RateAt(int64_t utilizationBps) const
{
    int64_t u = Clamp<int64_t>(utilizationBps, 0, BPS_ONE);
    int64_t rate = baseRateBps;
    rate += MulDiv(std::min(u, optimalUtilizationBps), slope1Bps, optimalUtilizationBps);
    if (u > optimalUtilizationBps) {
        rate += MulDiv(u - optimalUtilizationBps, slope2Bps, BPS_ONE - optimalUtilizationBps);
    }
    return rate;
}

int64_t LookupStep(const std::vector<ScoreStep>& steps, int64_t value, int64_t fallback)
{
    for (const ScoreStep& step : steps) {
        if (value >= step.threshold) {
            return step.value;
        }
    }
    return fallback;
}

static bool IsDescending(const std::vector<ScoreStep>& steps)
{
    for (size_t i = 1; i < steps.size(); ++i) {
        if (steps[i].threshold >= steps[i - 1].threshold) return false;
    }
    return true;
}

bool ValidateCreditParams(const CreditParams& params, std::string& strError)
{
    int64_t weightSum = 0;
    for (int64_t w : params.score.weights) {
        if (w < 0) {
            strError = "score weights must be non-negative";
            return false;
        }
        weightSum += w;
    }
    if (weightSum != 100) {
        strError = strprintf("score weights sum to %d, expected 100", weightSum);
        return false;
    }
    if (params.score.s3Divisor <= 0) {
        strError = "sybil normalization divisor must be positive";
        return false;
    }
    if (!IsDescending(params.score.s2RatioSteps) || !IsDescending(params.score.s2DiversitySteps) ||
        !IsDescending(params.score.walletAgeSteps) || !IsDescending(params.score.stakeSteps) ||
        !IsDescending(params.score.voteSteps)) {
        strError = "score step tables must have strictly descending thresholds";
        return false;
    }

    const auto& tiers = params.tiers.tiers;
    if (tiers[0].minScore != 0) {
        strError = "lowest tier must start at score 0";
        return false;
    }
    for (size_t i = 0; i < TIER_COUNT; ++i) {
        if (tiers[i].maxLtvBps <= 0 || tiers[i].maxLtvBps > BPS_ONE) {
            strError = strprintf("tier %s max LTV out of range", TierToString(static_cast<Tier>(i)));
            return false;
        }
        if (tiers[i].rateMultiplierBps <= 0) {
            strError = strprintf("tier %s rate multiplier must be positive", TierToString(static_cast<Tier>(i)));
            return false;
        }
        if (tiers[i].gracePeriod < 0) {
            strError = strprintf("tier %s grace period is negative", TierToString(static_cast<Tier>(i)));
            return false;
        }
        if (i > 0) {
            if (tiers[i].minScore <= tiers[i - 1].minScore) {
                strError = "tier boundaries must be strictly increasing";
                return false;
            }
            if (tiers[i].gracePeriod <= tiers[i - 1].gracePeriod) {
                strError = "tier grace periods must be strictly increasing";
                return false;
            }
        }
    }

    const RateModel& rates = params.rates;
    if (rates.optimalUtilizationBps <= 0 || rates.optimalUtilizationBps >= BPS_ONE) {
        strError = "optimal utilization must lie strictly between 0 and 10000 bps";
        return false;
    }
    if (rates.baseRateBps < 0 || rates.slope1Bps < 0 || rates.slope2Bps < 0) {
        strError = "interest curve parameters must be non-negative";
        return false;
    }

    const LiquidationParams& liq = params.liquidation;
    if (liq.auctionDuration <= 0 || liq.maxDiscountBps < 0 || liq.maxDiscountBps >= BPS_ONE ||
        liq.liquidationHealthFactorBps <= 0) {
        strError = "liquidation parameters out of range";
        return false;
    }

    if (params.lending.protocolFeeBps < 0 || params.lending.protocolFeeBps > BPS_ONE ||
        params.lending.maxPriceAge <= 0) {
        strError = "lending parameters out of range";
        return false;
    }

    if (params.fund.maxCoverageBps < 0 || params.fund.maxCoverageBps > BPS_ONE ||
        params.fund.revenueShareBps < 0 || params.fund.revenueShareBps > BPS_ONE) {
        strError = "fund parameters out of range";
        return false;
    }

    const AttestationParams& att = params.attestation;
    if (att.challengePeriod < AttestationParams::MIN_CHALLENGE_PERIOD ||
        att.challengePeriod > AttestationParams::MAX_CHALLENGE_PERIOD) {
        strError = "challenge period out of range";
        return false;
    }
    if (att.challengeBond < AttestationParams::MIN_CHALLENGE_BOND ||
        att.challengeBond > AttestationParams::MAX_CHALLENGE_BOND) {
        strError = "challenge bond out of range";
        return false;
    }
    return true;
}

} // namespace credit
