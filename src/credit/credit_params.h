// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_CREDIT_PARAMS_H
#define CREDITCORE_CREDIT_PARAMS_H

/**
 * @file credit_params.h
 * @brief Versioned, governance-tunable parameter tables
 *
 * Tier boundaries, scoring bonuses, the interest-rate curve and liquidation
 * and fund constants are data, not code. Every table carries a version so a
 * change of terms is visible in logs and persisted state.
 */

#include <amount.h>
#include <credit/credit_common.h>
#include <utiltime.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace credit {

/** A threshold/value pair; tables are ordered by descending threshold */
struct ScoreStep {
    int64_t threshold;
    int64_t value;
};

/**
 * @brief Constants of the five-factor score formula
 */
struct ScoreParams {
    uint32_t version = 1;

    /** Weights for S1..S5; must sum to 100 */
    std::array<int64_t, 5> weights = {{40, 20, 20, 10, 10}};

    // S1 repayment
    int64_t s1Neutral = 50;
    int64_t s1LiquidationPenalty = 20;

    // S2 collateral utilization
    int64_t s2Neutral = 50;
    /** Collateralization ratio (bps) to base score */
    std::vector<ScoreStep> s2RatioSteps = {{20000, 100}, {15000, 75}, {12000, 50}, {10000, 25}};
    int64_t s2MaxLtvPenalty = 30;
    /** Distinct collateral assets to bonus */
    std::vector<ScoreStep> s2DiversitySteps = {{4, 15}, {3, 10}, {2, 5}};

    // S3 sybil resistance
    int64_t s3Baseline = 50;
    int64_t s3Divisor = 5;
    int64_t identityBonus = 150;
    int64_t identityPenalty = 150;
    int64_t identityPenaltyReduced = 75;
    int64_t reducedPenaltyMinAge = 365 * SECONDS_PER_DAY;
    CAmount reducedPenaltyMinStake = 10000 * COIN;
    /** Wallet age (seconds) to penalty; younger than the last step uses walletAgeFloor */
    std::vector<ScoreStep> walletAgeSteps = {
        {365 * SECONDS_PER_DAY, 0},
        {180 * SECONDS_PER_DAY, -50},
        {90 * SECONDS_PER_DAY, -100},
        {30 * SECONDS_PER_DAY, -200}};
    int64_t walletAgeFloor = -300;
    /** Staked amount to bonus */
    std::vector<ScoreStep> stakeSteps = {
        {10000 * COIN, 50}, {5000 * COIN, 40}, {1000 * COIN, 30}, {100 * COIN, 25}};
    int64_t activityThreshold = 10;
    int64_t activityBonus = 50;

    // S4 external reputation
    int64_t s4Neutral = 50;

    // S5 participation
    std::vector<ScoreStep> voteSteps = {{20, 100}, {10, 75}, {5, 50}, {1, 25}};
    int64_t proposalPoints = 10;

    /** Range of the displayed credit score */
    int64_t creditScoreMin = 300;
    int64_t creditScoreMax = 850;
};

/**
 * @brief Borrowing terms for one tier
 */
struct TierTerms {
    /** Lowest credit score (0-1000 scale) that qualifies */
    int64_t minScore = 0;
    int64_t maxLtvBps = 0;
    int64_t rateMultiplierBps = BPS_ONE;
    int64_t gracePeriod = 0;
};

/**
 * @brief Score-to-terms table, ordered Bronze..Platinum
 */
struct TierTable {
    uint32_t version = 1;
    std::array<TierTerms, TIER_COUNT> tiers = {{
        {0,   5000, 15000, 24 * SECONDS_PER_HOUR},
        {600, 7000, 12000, 36 * SECONDS_PER_HOUR},
        {740, 8000, 10000, 48 * SECONDS_PER_HOUR},
        {800, 9000,  8000, 72 * SECONDS_PER_HOUR}}};

    /** Highest tier whose minimum the score reaches */
    Tier GetTier(int64_t score) const;

    const TierTerms& Get(Tier tier) const { return tiers[static_cast<size_t>(tier)]; }
};

/**
 * @brief Kinked utilization interest curve, all values annualized bps
 */
struct RateModel {
    uint32_t version = 1;
    int64_t baseRateBps = 200;
    int64_t optimalUtilizationBps = 8000;
    int64_t slope1Bps = 400;
    int64_t slope2Bps = 6000;

    /** base + min(u,opt)/opt*slope1 + max(u-opt,0)/(1-opt)*slope2 */
    int64_t RateAt(int64_t utilizationBps) const;
};

struct LiquidationParams {
    uint32_t version = 1;
    /** Health factor (bps) at or below which a position may be liquidated */
    int64_t liquidationHealthFactorBps = 9500;
    /** Length of the discount window after grace ends */
    int64_t auctionDuration = 6 * SECONDS_PER_HOUR;
    int64_t maxDiscountBps = 2000;
};

struct LendingParams {
    uint32_t version = 1;
    /** Share of interest that becomes protocol revenue */
    int64_t protocolFeeBps = 2000;
    /** Oldest price the engine will act on */
    int64_t maxPriceAge = SECONDS_PER_HOUR;
};

struct FundParams {
    uint32_t version = 1;
    /** Cap on a single payout as a share of the loan principal (0.25%) */
    int64_t maxCoverageBps = 25;
    /** Share of protocol revenue skimmed into the fund (5%) */
    int64_t revenueShareBps = 500;
};

struct AttestationParams {
    uint32_t version = 1;
    int64_t challengePeriod = SECONDS_PER_HOUR;
    CAmount challengeBond = 500 * COIN;
    /** Finalized attestations older than this are ignored for borrowing */
    int64_t maxScoreAge = 30 * SECONDS_PER_DAY;

    static constexpr int64_t MIN_CHALLENGE_PERIOD = 10 * 60;
    static constexpr int64_t MAX_CHALLENGE_PERIOD = 24 * SECONDS_PER_HOUR;
    static constexpr CAmount MIN_CHALLENGE_BOND = 100 * COIN;
    static constexpr CAmount MAX_CHALLENGE_BOND = 10000 * COIN;
};

/**
 * @brief Complete parameter set handed to the engines at construction
 */
struct CreditParams {
    ScoreParams score;
    TierTable tiers;
    RateModel rates;
    LiquidationParams liquidation;
    LendingParams lending;
    FundParams fund;
    AttestationParams attestation;
};

/**
 * Check a parameter set for internal consistency.
 * @param[out] strError Description of the first problem found
 * @return true if the set can be used
 */
bool ValidateCreditParams(const CreditParams& params, std::string& strError);

/** Look up a descending step table; returns fallback below the last threshold */
int64_t LookupStep(const std::vector<ScoreStep>& steps, int64_t value, int64_t fallback);

} // namespace credit

#endif // CREDITCORE_CREDIT_PARAMS_H
