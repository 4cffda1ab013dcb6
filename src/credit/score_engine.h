// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_CREDIT_SCORE_ENGINE_H
#define CREDITCORE_CREDIT_SCORE_ENGINE_H

/**
 * @file score_engine.h
 * @brief Five-factor composite credit score
 *
 * Factors, each on [0,100]:
 *   S1 repayment history         (AggregateCounters)
 *   S2 collateral utilization    (AggregateCounters)
 *   S3 sybil resistance          (identity proof, wallet age, stake, activity)
 *   S4 external reputation       (ExternalScoreSource)
 *   S5 governance participation  (ActivityCounters)
 *
 * overall = floor(sum(Si * wi) / 100), then mapped onto the displayed credit
 * score range and looked up in the tier table.
 *
 * Scoring reads a fixed number of records per subject and never walks the
 * subject's loan list, so its cost does not grow with borrowing history.
 */

#include <credit/credit_common.h>
#include <credit/credit_params.h>
#include <credit/identity_registry.h>
#include <credit/ledger_store.h>
#include <sync.h>

#include <map>
#include <optional>

namespace credit {

// ============================================================================
// External reputation
// ============================================================================

class ExternalScoreSource
{
public:
    virtual ~ExternalScoreSource() {}

    /** Aggregate off-ledger reputation on [0,100]; no value if unknown */
    virtual std::optional<int64_t> GetScore(const Subject& subject) const = 0;
};

class StaticScoreSource : public ExternalScoreSource
{
public:
    std::optional<int64_t> GetScore(const Subject& subject) const override;

    void SetScore(const Subject& subject, int64_t score);
    void ClearScore(const Subject& subject);

private:
    mutable CCriticalSection cs_scores_;
    std::map<Subject, int64_t> scores_;
};

// ============================================================================
// Score engine
// ============================================================================

struct ScoreBreakdown {
    int64_t repayment = 0;
    int64_t collateral = 0;
    int64_t sybilResistance = 0;
    int64_t external = 0;
    int64_t participation = 0;

    /** Unnormalized S3 adjustments, before 50 + raw/5 */
    int64_t sybilRaw = 0;

    /** Weighted composite on [0,100] */
    int64_t overall = 0;

    /** overall mapped onto [creditScoreMin, creditScoreMax] */
    int64_t creditScore = 0;

    Tier tier = Tier::BRONZE;

    /** Versions of the tables the score was computed with */
    uint32_t scoreVersion = 0;
    uint32_t tierVersion = 0;
};

class ScoreEngine
{
public:
    /**
     * @param external May be null; S4 is then neutral for everyone
     */
    ScoreEngine(const ScoreParams& params, const TierTable& tiers, const LedgerStore& ledger,
                const IdentityRegistry& identity, const ExternalScoreSource* external = nullptr);

    ScoreBreakdown ComputeScore(const Subject& subject, int64_t now) const;

    /** Tier for a credit score under the current table */
    Tier GetScoreTier(int64_t creditScore) const;

    /** Replace the tables; callers validate first */
    void SetParams(const ScoreParams& params, const TierTable& tiers);

    ScoreParams GetScoreParams() const;
    TierTable GetTierTable() const;

    // Individual factors, exposed for inspection
    int64_t RepaymentScore(const AggregateCounters& counters) const;
    int64_t CollateralScore(const AggregateCounters& counters) const;
    int64_t SybilRaw(bool verified, int64_t walletAge, CAmount stake, uint64_t activityCount) const;
    int64_t SybilScore(int64_t raw) const;
    int64_t ParticipationScore(const ActivityCounters& activity) const;
    int64_t CreditScoreFromOverall(int64_t overall) const;

private:
    const LedgerStore& ledger_;
    const IdentityRegistry& identity_;
    const ExternalScoreSource* external_;

    mutable CCriticalSection cs_score_;
    ScoreParams params_;
    TierTable tiers_;
};

} // namespace credit

#endif // CREDITCORE_CREDIT_SCORE_ENGINE_H
