// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_CREDIT_LIQUIDATION_AUCTION_H
#define CREDITCORE_CREDIT_LIQUIDATION_AUCTION_H

/**
 * @file liquidation_auction.h
 * @brief Grace-period Dutch auction for unhealthy positions
 *
 * Starting a liquidation opens a tier-sized grace period during which the
 * borrower can still repay. After it ends, the collateral is offered at a
 * discount that grows linearly from 0 to maxDiscountBps over auctionDuration
 * and then stays at the cap. There are no timers: states and discounts are
 * derived from the stored grace end and the caller's clock. A live auction
 * whose loan has been closed some other way (typically repaid during grace)
 * reads as CANCELLED.
 */

#include <amount.h>
#include <credit/authorization.h>
#include <credit/credit_common.h>
#include <credit/credit_params.h>
#include <credit/health_monitor.h>
#include <credit/lending_pool.h>
#include <sync.h>

#include <map>
#include <optional>
#include <string>

namespace credit {

struct Auction {
    uint64_t id = 0;
    uint64_t loanId = NULL_LOAN_ID;
    Subject subject;
    /** Debt when the liquidation started */
    CAmount debtAmount = 0;
    CAmount collateralAmount = 0;
    AssetId collateralAsset;
    int64_t graceEnd = 0;
    int64_t auctionStart = 0;
    /** Stored state; GRACE_PENDING covers both live states */
    AuctionState state = AuctionState::NONE;
    Principal executor;
    int64_t executedAt = 0;
    CAmount salePrice = 0;
    CAmount paidAmount = 0;
    CAmount coveredAmount = 0;
    std::string cancelReason;

    bool IsLive() const { return state == AuctionState::GRACE_PENDING; }
};

class LedgerDB;

class LiquidationAuction
{
public:
    /**
     * @param account Principal the auctioneer settles as; holds LEDGER_WRITER
     * @param db Optional durable backing; not owned
     */
    LiquidationAuction(const LiquidationParams& params, const TierTable& tiers, const AuthorizationGate& gate,
                       LendingPool& pool, const HealthMonitor& health, const Principal& account,
                       LedgerDB* db = nullptr);

    bool LoadFromDatabase();

    /**
     * Open an auction for an unhealthy loan, or return the live one.
     * @param[out] auctionIdOut
     */
    CreditResult StartLiquidation(const Principal& caller, uint64_t loanId, int64_t now, uint64_t& auctionIdOut);

    /**
     * Buy the collateral at the current discount.
     * @param[out] paidOut Amount collected from the executor
     */
    CreditResult ExecuteLiquidation(const Principal& executor, uint64_t auctionId, int64_t now,
                                    CAmount* paidOut = nullptr);

    CreditResult CancelAuction(const Principal& caller, uint64_t auctionId, const std::string& reason);

    /** Discount in bps for an auction whose grace ended at graceEnd */
    int64_t DiscountAt(int64_t graceEnd, int64_t now) const;

    std::optional<int64_t> GetCurrentDiscount(uint64_t auctionId, int64_t now) const;

    bool IsExecutable(uint64_t auctionId, int64_t now) const;

    /** Seconds of grace left; 0 once over or for an unknown auction */
    int64_t GracePeriodRemaining(uint64_t auctionId, int64_t now) const;

    /** Stored record, with a live auction on a closed loan shown as CANCELLED */
    std::optional<Auction> GetAuction(uint64_t auctionId) const;

    AuctionState GetAuctionState(uint64_t auctionId, int64_t now) const;

    std::optional<uint64_t> GetAuctionForLoan(uint64_t loanId) const;

    void SetParams(const LiquidationParams& params, const TierTable& tiers);

private:
    /** Live in storage but its loan is no longer active in the pool */
    bool LoanClosedLocked(const Auction& auction) const;

    bool Persist(const Auction& auction, uint64_t nextAuctionId);

    const AuthorizationGate& gate_;
    LendingPool& pool_;
    const HealthMonitor& health_;
    const Principal account_;
    LedgerDB* db_;

    mutable CCriticalSection cs_auction_;
    LiquidationParams params_;
    TierTable tiers_;
    uint64_t nextAuctionId_;
    std::map<uint64_t, Auction> auctions_;
    /** Most recent auction per loan */
    std::map<uint64_t, uint64_t> loanAuctions_;
};

} // namespace credit

#endif // CREDITCORE_CREDIT_LIQUIDATION_AUCTION_H
