// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_CREDIT_PROTOCOL_H
#define CREDITCORE_CREDIT_PROTOCOL_H

/**
 * @file credit_protocol.h
 * @brief Caller-facing surface of the credit ledger
 *
 * CreditProtocol owns every engine, wires their capabilities and exposes the
 * operations a participant may invoke. Writes act for the authenticated
 * caller as subject, except liquidations which anyone may trigger. The
 * current time is taken from GetTime() so tests can drive it with
 * SetMockTime().
 *
 * System accounts (pool, fund, auctioneer, stake vault, bond escrow,
 * treasury) are derived from fixed names, see SystemAccount().
 */

#include <amount.h>
#include <credit/authorization.h>
#include <credit/credit_common.h>
#include <credit/credit_params.h>
#include <credit/health_monitor.h>
#include <credit/identity_registry.h>
#include <credit/insurance_fund.h>
#include <credit/ledger_store.h>
#include <credit/lending_pool.h>
#include <credit/liquidation_auction.h>
#include <credit/price_feed.h>
#include <credit/score_attestation.h>
#include <credit/score_engine.h>
#include <credit/token_ledger.h>
#include <sync.h>

#include <optional>
#include <string>
#include <vector>

namespace credit {

class LedgerDB;

class CreditProtocol
{
public:
    /**
     * @param poolAsset Asset lent by the pool and held by the fund
     * @param stakeAsset Asset staked for sybil resistance and posted as bonds
     * @param external May be null
     * @param db Optional durable backing for every engine; not owned
     * @throws std::runtime_error if params are inconsistent
     */
    CreditProtocol(const CreditParams& params, const Principal& admin, ValueTransfer& tokens,
                   const PriceFeed& prices, const ExternalScoreSource* external, const AssetId& poolAsset,
                   const AssetId& stakeAsset, const uint160& trustedIssuer, LedgerDB* db = nullptr);

    /** Deterministic principal for a named system account */
    static Principal SystemAccount(const std::string& name);

    /**
     * Restore every engine from the attached database. Refuses the load when
     * the ledger's active pool loans and the pool's open positions differ.
     */
    bool LoadFromDatabase();

    // ========================================================================
    // Reads
    // ========================================================================

    ScoreBreakdown GetScoreBreakdown(const Subject& subject) const;

    /** Fresh finalized attestation if there is one, else the computed credit score */
    int64_t GetScore(const Subject& subject) const;

    Tier GetTier(const Subject& subject) const;

    /** Current curve rate scaled by the subject's tier multiplier, bps */
    int64_t GetAPR(const Subject& subject) const;

    std::vector<LoanRecord> GetLoans(const Subject& subject) const;

    CreditResult GetHealthFactor(uint64_t loanId, int64_t& healthFactorOut) const;

    std::optional<Auction> GetAuction(uint64_t auctionId) const;

    // ========================================================================
    // Writes on behalf of the caller
    // ========================================================================

    CreditResult Borrow(const Principal& caller, const AssetId& collateralAsset, CAmount collateralAmount,
                        CAmount principal, uint64_t& loanIdOut);

    CreditResult Repay(const Principal& caller, uint64_t loanId, CAmount amount, CAmount* paidOut = nullptr);

    CreditResult StartLiquidation(const Principal& caller, uint64_t loanId, uint64_t& auctionIdOut);

    CreditResult ExecuteLiquidation(const Principal& caller, uint64_t auctionId, CAmount* paidOut = nullptr);

    CreditResult Stake(const Principal& caller, CAmount amount, int64_t lockDuration);

    CreditResult Unstake(const Principal& caller, CAmount amount);

    CreditResult SubmitIdentityProof(const Principal& caller, const uint256& commitmentHash, int64_t expiresAt,
                                     const std::vector<unsigned char>& signature);

    CreditResult SupplyLiquidity(const Principal& caller, CAmount amount);

    CreditResult WithdrawLiquidity(const Principal& caller, CAmount amount);

    /**
     * Start a liquidation on every open loan at or below the liquidation
     * health factor that has no live auction yet.
     * @param[out] startedOut Loans an auction was opened for, may be null
     * @return Number of auctions opened
     */
    size_t ScanLiquidations(const Principal& keeper, std::vector<uint64_t>* startedOut = nullptr);

    // ========================================================================
    // Administration
    // ========================================================================

    /** Validate and install a new parameter set in every engine */
    CreditResult UpdateParams(const Principal& caller, const CreditParams& params);

    CreditParams GetParams() const;

    AuthorizationGate& Gate() { return gate_; }
    LedgerStore& Ledger() { return ledger_; }
    IdentityRegistry& Identity() { return identity_; }
    ScoreEngine& Scores() { return scores_; }
    ScoreAttestationRegistry& Attestations() { return attestations_; }
    const HealthMonitor& Health() const { return health_; }
    InsuranceFund& Fund() { return fund_; }
    LendingPool& Pool() { return pool_; }
    LiquidationAuction& Auctioneer() { return auctioneer_; }

    const Principal& PoolAccount() const { return poolAccount_; }
    const Principal& FundAccount() const { return fundAccount_; }
    const Principal& AuctionAccount() const { return auctionAccount_; }
    const Principal& VaultAccount() const { return vaultAccount_; }
    const Principal& EscrowAccount() const { return escrowAccount_; }
    const Principal& TreasuryAccount() const { return treasuryAccount_; }

private:
    int64_t ScoreLocked(const Subject& subject, int64_t now) const;

    void GrantOrThrow(const Principal& admin, Capability cap, const Principal& principal);

    mutable CCriticalSection cs_protocol_;
    CreditParams params_;

    const Principal poolAccount_;
    const Principal fundAccount_;
    const Principal auctionAccount_;
    const Principal vaultAccount_;
    const Principal escrowAccount_;
    const Principal treasuryAccount_;

    AuthorizationGate gate_;
    IdentityRegistry identity_;
    LedgerStore ledger_;
    ScoreEngine scores_;
    ScoreAttestationRegistry attestations_;
    HealthMonitor health_;
    InsuranceFund fund_;
    LendingPool pool_;
    LiquidationAuction auctioneer_;
};

} // namespace credit

#endif // CREDITCORE_CREDIT_PROTOCOL_H
