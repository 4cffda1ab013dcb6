// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_CREDIT_LENDING_POOL_H
#define CREDITCORE_CREDIT_LENDING_POOL_H

/**
 * @file lending_pool.h
 * @brief Score-gated collateralized lending against a shared liquidity pool
 *
 * Lenders deposit the pool asset; borrowers post collateral and draw up to
 * their tier's maximum LTV. Each loan's rate is fixed at origination from the
 * utilization curve scaled by the tier multiplier, and interest accrues
 * simply over elapsed time.
 *
 * Pool value accounting:
 *   token balance of the pool account == cash + reserves
 * where cash is lendable liquidity and reserves are retained protocol fees.
 *
 * Every value movement happens before the state write that records it, and
 * is reversed if that write fails. Writes that close or open a loan ride in
 * the ledger's transition; the rest go straight to the LedgerDB.
 */

#include <amount.h>
#include <credit/authorization.h>
#include <credit/credit_common.h>
#include <credit/credit_params.h>
#include <credit/health_monitor.h>
#include <credit/insurance_fund.h>
#include <credit/ledger_store.h>
#include <credit/pool_state.h>
#include <credit/price_feed.h>
#include <credit/token_ledger.h>
#include <sync.h>

#include <map>
#include <optional>
#include <vector>

namespace credit {

class LedgerDB;

class LendingPool
{
public:
    /**
     * @param asset Asset lent and repaid
     * @param account Account holding pool value; it holds LEDGER_WRITER,
     *                FUND_COVERER and REVENUE_ALLOCATOR
     * @param db Optional durable backing; not owned
     */
    LendingPool(const CreditParams& params, const AuthorizationGate& gate, LedgerStore& ledger,
                ValueTransfer& tokens, const PriceFeed& prices, InsuranceFund& fund,
                const HealthMonitor& health, const AssetId& asset, const Principal& account,
                LedgerDB* db = nullptr);

    bool LoadFromDatabase();

    // ========================================================================
    // Liquidity providers
    // ========================================================================

    CreditResult Deposit(const Principal& lender, CAmount amount);

    /** Limited by the lender's deposit and by idle liquidity */
    CreditResult Withdraw(const Principal& lender, CAmount amount);

    CAmount GetLenderBalance(const Principal& lender) const;

    // ========================================================================
    // Borrowers
    // ========================================================================

    /**
     * Open a loan against collateral.
     * @param creditScore Score (0-1000 scale) selecting the tier terms
     * @param[out] loanIdOut Ledger id of the new loan
     */
    CreditResult Borrow(const Subject& subject, const AssetId& collateralAsset, CAmount collateralAmount,
                        CAmount principal, int64_t creditScore, int64_t now, uint64_t& loanIdOut);

    /**
     * Pay interest first, then principal, releasing collateral pro rata.
     * Only the outstanding debt is pulled from the subject.
     * @param[out] paidOut Amount actually collected
     */
    CreditResult Repay(const Subject& subject, uint64_t loanId, CAmount amount, int64_t now,
                       CAmount* paidOut = nullptr);

    /** Principal plus interest at now; no value for an unknown or closed loan */
    std::optional<CAmount> CalculateDebt(uint64_t loanId, int64_t now) const;

    CreditResult CalculateHealthFactor(uint64_t loanId, int64_t now, int64_t& healthFactorOut) const;

    /**
     * Close a loan sold at auction: collect paid from executor, hand over all
     * collateral and claim the shortfall from the fund.
     * @param caller Must hold LEDGER_WRITER
     * @param[out] coveredOut Amount the fund paid towards the shortfall
     */
    CreditResult SettleLiquidation(const Principal& caller, uint64_t loanId, const Principal& executor,
                                   CAmount paid, int64_t now, CAmount* coveredOut = nullptr);

    // ========================================================================
    // Administration and state
    // ========================================================================

    CreditResult SetPaused(const Principal& caller, bool paused);
    bool IsPaused() const;

    /** Replace lending tables; callers validate first */
    void SetParams(const CreditParams& params);

    /** Latest usable price, or PRICE_UNAVAILABLE / STALE_PRICE */
    CreditResult GetPrice(const AssetId& asset, int64_t now, PriceData& priceOut) const;

    /** Borrowed share of pool value, bps */
    int64_t GetUtilization() const;

    /** Curve rate at current utilization before the tier multiplier */
    int64_t GetCurrentRate() const;

    CAmount GetAvailableLiquidity() const;
    CAmount GetTotalBorrows() const;
    CAmount GetReserves() const;

    std::optional<LoanPosition> GetPosition(uint64_t loanId) const;

    /** Ids of open positions, ascending */
    std::vector<uint64_t> GetActiveLoanIds() const;

    const Principal& GetAccount() const { return account_; }
    const AssetId& GetAsset() const { return asset_; }

private:
    /** Interest owed on a position at now, including unpaid accrued interest */
    CAmount InterestDue(const LoanPosition& position, int64_t now) const;

    int64_t UtilizationLocked() const;

    PoolTotals TotalsLocked() const;

    /** Write a pool-only transition; true when not backed */
    bool PersistLocked(const PoolTransition& transition);

    /** In-memory half of a transition that has been persisted */
    void ApplyLocked(const PoolTransition& transition);

    const AuthorizationGate& gate_;
    LedgerStore& ledger_;
    ValueTransfer& tokens_;
    const PriceFeed& prices_;
    InsuranceFund& fund_;
    const HealthMonitor& health_;
    const AssetId asset_;
    const Principal account_;
    LedgerDB* db_;

    mutable CCriticalSection cs_pool_;
    TierTable tiers_;
    RateModel rates_;
    LendingParams lending_;
    bool paused_;

    CAmount cash_;
    CAmount totalBorrows_;
    CAmount reserves_;
    std::map<Principal, CAmount> lenderBalances_;
    std::map<uint64_t, LoanPosition> positions_;
};

} // namespace credit

#endif // CREDITCORE_CREDIT_LENDING_POOL_H
