// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/score_engine.h>

#include <util.h>

#include <algorithm>
#include <limits>

namespace credit {

std::optional<int64_t> StaticScoreSource::GetScore(const Subject& subject) const
{
    LOCK(cs_scores_);
    auto it = scores_.find(subject);
    if (it != scores_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void StaticScoreSource::SetScore(const Subject& subject, int64_t score)
{
    LOCK(cs_scores_);
    scores_[subject] = score;
}

void StaticScoreSource::ClearScore(const Subject& subject)
{
    LOCK(cs_scores_);
    scores_.erase(subject);
}

ScoreEngine::ScoreEngine(const ScoreParams& params, const TierTable& tiers, const LedgerStore& ledger,
                         const IdentityRegistry& identity, const ExternalScoreSource* external)
    : ledger_(ledger)
    , identity_(identity)
    , external_(external)
    , params_(params)
    , tiers_(tiers)
{
}

void ScoreEngine::SetParams(const ScoreParams& params, const TierTable& tiers)
{
    LOCK(cs_score_);
    params_ = params;
    tiers_ = tiers;
    LogPrintf("Score: Using score table v%u, tier table v%u\n", params_.version, tiers_.version);
}

ScoreParams ScoreEngine::GetScoreParams() const
{
    LOCK(cs_score_);
    return params_;
}

TierTable ScoreEngine::GetTierTable() const
{
    LOCK(cs_score_);
    return tiers_;
}

int64_t ScoreEngine::RepaymentScore(const AggregateCounters& counters) const
{
    LOCK(cs_score_);
    if (counters.totalLoans == 0) {
        return params_.s1Neutral;
    }
    int64_t total = static_cast<int64_t>(counters.totalLoans);
    int64_t score = static_cast<int64_t>(counters.repaidLoans) * 100 / total -
                    static_cast<int64_t>(counters.liquidatedLoans) * params_.s1LiquidationPenalty;
    return Clamp<int64_t>(score, 0, 100);
}

int64_t ScoreEngine::CollateralScore(const AggregateCounters& counters) const
{
    LOCK(cs_score_);
    if (counters.totalLoans == 0 || counters.totalBorrowedValue <= 0) {
        return params_.s2Neutral;
    }

    int64_t ratioBps = MulDiv(counters.totalCollateralValue, BPS_ONE, counters.totalBorrowedValue);
    int64_t score = LookupStep(params_.s2RatioSteps, ratioBps, 0);

    score -= MulDiv(static_cast<int64_t>(counters.maxLtvBorrowCount), params_.s2MaxLtvPenalty,
                    static_cast<int64_t>(counters.totalLoans));
    score += LookupStep(params_.s2DiversitySteps, static_cast<int64_t>(counters.uniqueCollateralAssets), 0);

    return Clamp<int64_t>(score, 0, 100);
}

int64_t ScoreEngine::SybilRaw(bool verified, int64_t walletAge, CAmount stake, uint64_t activityCount) const
{
    LOCK(cs_score_);
    int64_t raw = 0;

    if (verified) {
        raw += params_.identityBonus;
    } else if (walletAge >= params_.reducedPenaltyMinAge && stake >= params_.reducedPenaltyMinStake) {
        raw -= params_.identityPenaltyReduced;
    } else {
        raw -= params_.identityPenalty;
    }

    raw += LookupStep(params_.walletAgeSteps, walletAge, params_.walletAgeFloor);
    raw += LookupStep(params_.stakeSteps, stake, 0);

    if (static_cast<int64_t>(activityCount) >= params_.activityThreshold) {
        raw += params_.activityBonus;
    }
    return raw;
}

int64_t ScoreEngine::SybilScore(int64_t raw) const
{
    LOCK(cs_score_);
    return Clamp<int64_t>(params_.s3Baseline + raw / params_.s3Divisor, 0, 100);
}

int64_t ScoreEngine::ParticipationScore(const ActivityCounters& activity) const
{
    LOCK(cs_score_);
    int64_t votes = static_cast<int64_t>(std::min<uint64_t>(activity.voteCount, std::numeric_limits<int32_t>::max()));
    int64_t proposals = static_cast<int64_t>(std::min<uint64_t>(activity.proposalCount, 100));
    int64_t score = LookupStep(params_.voteSteps, votes, 0) + proposals * params_.proposalPoints;
    return Clamp<int64_t>(score, 0, 100);
}

int64_t ScoreEngine::CreditScoreFromOverall(int64_t overall) const
{
    LOCK(cs_score_);
    int64_t clamped = Clamp<int64_t>(overall, 0, 100);
    return params_.creditScoreMin + clamped * (params_.creditScoreMax - params_.creditScoreMin) / 100;
}

Tier ScoreEngine::GetScoreTier(int64_t creditScore) const
{
    LOCK(cs_score_);
    return tiers_.GetTier(creditScore);
}

ScoreBreakdown ScoreEngine::ComputeScore(const Subject& subject, int64_t now) const
{
    LOCK(cs_score_);

    const AggregateCounters counters = ledger_.GetAggregates(subject);
    const ActivityCounters activity = identity_.GetActivity(subject);
    const StakeCommitment stake = identity_.GetStake(subject);
    const bool verified = identity_.HasValidIdentity(subject, now);

    int64_t walletAge = 0;
    if (activity.firstSeen > 0 && now > activity.firstSeen) {
        walletAge = now - activity.firstSeen;
    }

    ScoreBreakdown breakdown;
    breakdown.repayment = RepaymentScore(counters);
    breakdown.collateral = CollateralScore(counters);
    breakdown.sybilRaw = SybilRaw(verified, walletAge, stake.amount, counters.totalLoans + activity.voteCount);
    breakdown.sybilResistance = SybilScore(breakdown.sybilRaw);

    breakdown.external = params_.s4Neutral;
    if (external_ != nullptr) {
        std::optional<int64_t> external = external_->GetScore(subject);
        if (external) {
            breakdown.external = Clamp<int64_t>(*external, 0, 100);
        }
    }

    breakdown.participation = ParticipationScore(activity);

    const std::array<int64_t, 5> factors = {{breakdown.repayment, breakdown.collateral,
                                             breakdown.sybilResistance, breakdown.external,
                                             breakdown.participation}};
    int64_t weighted = 0;
    for (size_t i = 0; i < factors.size(); ++i) {
        weighted += factors[i] * params_.weights[i];
    }
    breakdown.overall = Clamp<int64_t>(weighted / 100, 0, 100);
    breakdown.creditScore = CreditScoreFromOverall(breakdown.overall);
    breakdown.tier = tiers_.GetTier(breakdown.creditScore);
    breakdown.scoreVersion = params_.version;
    breakdown.tierVersion = tiers_.version;

    LogPrint(BCLog::SCORE, "Score: %s S1=%d S2=%d S3=%d S4=%d S5=%d overall=%d credit=%d tier=%s\n",
             subject.GetHex(), breakdown.repayment, breakdown.collateral, breakdown.sybilResistance,
             breakdown.external, breakdown.participation, breakdown.overall, breakdown.creditScore,
             TierToString(breakdown.tier));
    return breakdown;
}

} // namespace credit
