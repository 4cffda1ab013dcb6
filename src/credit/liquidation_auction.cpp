// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/liquidation_auction.h>

#include <credit/ledger_db.h>
#include <util.h>
#include <utilmoneystr.h>

#include <algorithm>

namespace credit {

LiquidationAuction::LiquidationAuction(const LiquidationParams& params, const TierTable& tiers,
                                       const AuthorizationGate& gate, LendingPool& pool,
                                       const HealthMonitor& health, const Principal& account, LedgerDB* db)
    : gate_(gate)
    , pool_(pool)
    , health_(health)
    , account_(account)
    , db_(db)
    , params_(params)
    , tiers_(tiers)
    , nextAuctionId_(1)
{
}

bool LiquidationAuction::LoadFromDatabase()
{
    LOCK(cs_auction_);

    if (db_ == nullptr || !db_->IsInitialized()) {
        return false;
    }

    std::map<uint64_t, Auction> auctions;
    uint64_t nextAuctionId = 1;
    if (!db_->LoadAuctions(auctions, nextAuctionId)) {
        LogPrintf("Auction: Failed to load auctions from database\n");
        return false;
    }

    auctions_ = std::move(auctions);
    nextAuctionId_ = nextAuctionId;

    // Ascending ids, so the last one written per loan is the most recent
    loanAuctions_.clear();
    for (const auto& entry : auctions_) {
        loanAuctions_[entry.second.loanId] = entry.first;
    }

    LogPrintf("Auction: Loaded %u auctions, next id %u\n", auctions_.size(), nextAuctionId_);
    return true;
}

bool LiquidationAuction::Persist(const Auction& auction, uint64_t nextAuctionId)
{
    if (db_ == nullptr || !db_->IsInitialized()) {
        return true;
    }
    return db_->WriteAuction(auction, nextAuctionId);
}

bool LiquidationAuction::LoanClosedLocked(const Auction& auction) const
{
    if (!auction.IsLive()) {
        return false;
    }
    std::optional<LoanPosition> position = pool_.GetPosition(auction.loanId);
    return !position || !position->active;
}

CreditResult LiquidationAuction::StartLiquidation(const Principal& caller, uint64_t loanId, int64_t now,
                                                  uint64_t& auctionIdOut)
{
    LOCK(cs_auction_);

    std::optional<LoanPosition> position = pool_.GetPosition(loanId);
    if (!position) {
        return CreditResult::Fail(CreditError::UNKNOWN_LOAN, strprintf("Loan %u not found", loanId));
    }
    if (!position->active) {
        return CreditResult::Fail(CreditError::LOAN_NOT_ACTIVE, strprintf("Loan %u is closed", loanId));
    }

    auto existing = loanAuctions_.find(loanId);
    if (existing != loanAuctions_.end() && auctions_[existing->second].IsLive()) {
        auctionIdOut = existing->second;
        return CreditResult::Ok();
    }

    int64_t healthFactor = 0;
    CreditResult result = pool_.CalculateHealthFactor(loanId, now, healthFactor);
    if (!result) return result;

    if (!health_.IsLiquidatable(healthFactor)) {
        return CreditResult::Fail(CreditError::NOT_LIQUIDATABLE,
            strprintf("Loan %u health factor %d above %d", loanId, healthFactor,
                      health_.GetLiquidationHealthFactor()));
    }

    std::optional<CAmount> debt = pool_.CalculateDebt(loanId, now);
    if (!debt) {
        return CreditResult::Fail(CreditError::LOAN_NOT_ACTIVE, strprintf("Loan %u is closed", loanId));
    }

    const Tier tier = tiers_.GetTier(position->creditScore);

    Auction auction;
    auction.id = nextAuctionId_;
    auction.loanId = loanId;
    auction.subject = position->subject;
    auction.debtAmount = *debt;
    auction.collateralAmount = position->collateralAmount;
    auction.collateralAsset = position->collateralAsset;
    auction.graceEnd = now + tiers_.Get(tier).gracePeriod;
    auction.auctionStart = auction.graceEnd;
    auction.state = AuctionState::GRACE_PENDING;

    if (!Persist(auction, auction.id + 1)) {
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Auction could not be persisted");
    }
    nextAuctionId_ = auction.id + 1;
    auctions_[auction.id] = auction;
    loanAuctions_[loanId] = auction.id;
    auctionIdOut = auction.id;

    LogPrintf("Auction: Liquidation %u started by %s for loan %u (HF %d, %s tier), grace ends %d\n",
              auction.id, caller.GetHex(), loanId, healthFactor, TierToString(tier), auction.graceEnd);
    return CreditResult::Ok();
}

int64_t LiquidationAuction::DiscountAt(int64_t graceEnd, int64_t now) const
{
    LOCK(cs_auction_);

    if (now < graceEnd) {
        return 0;
    }
    if (params_.auctionDuration <= 0) {
        return params_.maxDiscountBps;
    }
    int64_t discount = MulDiv(params_.maxDiscountBps, now - graceEnd, params_.auctionDuration);
    return std::min(discount, params_.maxDiscountBps);
}

std::optional<int64_t> LiquidationAuction::GetCurrentDiscount(uint64_t auctionId, int64_t now) const
{
    LOCK(cs_auction_);
    auto it = auctions_.find(auctionId);
    if (it == auctions_.end()) {
        return std::nullopt;
    }
    return DiscountAt(it->second.graceEnd, now);
}

CreditResult LiquidationAuction::ExecuteLiquidation(const Principal& executor, uint64_t auctionId, int64_t now,
                                                    CAmount* paidOut)
{
    LOCK(cs_auction_);

    if (paidOut) *paidOut = 0;

    auto it = auctions_.find(auctionId);
    if (it == auctions_.end()) {
        return CreditResult::Fail(CreditError::UNKNOWN_AUCTION, strprintf("Auction %u not found", auctionId));
    }
    Auction& auction = it->second;
    if (auction.state == AuctionState::EXECUTED) {
        return CreditResult::Fail(CreditError::AUCTION_ALREADY_EXECUTED,
            strprintf("Auction %u executed at %d", auctionId, auction.executedAt));
    }
    if (auction.state == AuctionState::CANCELLED) {
        return CreditResult::Fail(CreditError::UNKNOWN_AUCTION,
            strprintf("Auction %u was cancelled", auctionId));
    }
    if (LoanClosedLocked(auction)) {
        return CreditResult::Fail(CreditError::LOAN_NOT_ACTIVE,
            strprintf("Loan %u closed before the auction", auction.loanId));
    }
    if (now < auction.graceEnd) {
        return CreditResult::Fail(CreditError::GRACE_PERIOD_ACTIVE,
            strprintf("Grace period for auction %u ends at %d", auctionId, auction.graceEnd));
    }

    std::optional<LoanPosition> position = pool_.GetPosition(auction.loanId);
    if (!position || !position->active) {
        return CreditResult::Fail(CreditError::LOAN_NOT_ACTIVE,
            strprintf("Loan %u closed before the auction", auction.loanId));
    }

    PriceData price;
    CreditResult result = pool_.GetPrice(position->collateralAsset, now, price);
    if (!result) return result;

    std::optional<CAmount> debt = pool_.CalculateDebt(auction.loanId, now);
    if (!debt) {
        return CreditResult::Fail(CreditError::LOAN_NOT_ACTIVE, strprintf("Loan %u is closed", auction.loanId));
    }

    const int64_t discount = DiscountAt(auction.graceEnd, now);
    const CAmount collateralValue = CollateralValue(position->collateralAmount, price);
    const CAmount salePrice = MulDiv(collateralValue, BPS_ONE - discount, BPS_ONE);
    const CAmount paid = std::min(salePrice, *debt);

    CAmount covered = 0;
    result = pool_.SettleLiquidation(account_, auction.loanId, executor, paid, now, &covered);
    if (!result) return result;

    auction.state = AuctionState::EXECUTED;
    auction.executor = executor;
    auction.executedAt = now;
    auction.salePrice = salePrice;
    auction.paidAmount = paid;
    auction.coveredAmount = covered;
    // The settlement is already committed; a lost record reloads as CANCELLED on a closed loan
    if (!Persist(auction, nextAuctionId_)) {
        LogPrintf("Auction: Execution of %u settled but its record was not persisted\n", auctionId);
    }

    if (paidOut) *paidOut = paid;

    LogPrintf("Auction: %u executed by %s at %d bps discount, sale price %s, paid %s of %s debt\n",
              auctionId, executor.GetHex(), discount, FormatMoney(salePrice), FormatMoney(paid),
              FormatMoney(*debt));
    return CreditResult::Ok();
}

CreditResult LiquidationAuction::CancelAuction(const Principal& caller, uint64_t auctionId,
                                               const std::string& reason)
{
    LOCK(cs_auction_);

    CreditResult auth = gate_.Require(Capability::ADMIN, caller);
    if (!auth) return auth;

    auto it = auctions_.find(auctionId);
    if (it == auctions_.end()) {
        return CreditResult::Fail(CreditError::UNKNOWN_AUCTION, strprintf("Auction %u not found", auctionId));
    }
    Auction& auction = it->second;
    if (auction.state == AuctionState::EXECUTED) {
        return CreditResult::Fail(CreditError::AUCTION_ALREADY_EXECUTED);
    }
    if (auction.state == AuctionState::CANCELLED) {
        return CreditResult::Ok();
    }

    Auction cancelled = auction;
    cancelled.state = AuctionState::CANCELLED;
    cancelled.cancelReason = reason;
    if (!Persist(cancelled, nextAuctionId_)) {
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Cancellation could not be persisted");
    }
    auction = cancelled;

    LogPrintf("Auction: %u for loan %u cancelled: %s\n", auctionId, auction.loanId, reason);
    return CreditResult::Ok();
}

bool LiquidationAuction::IsExecutable(uint64_t auctionId, int64_t now) const
{
    LOCK(cs_auction_);
    auto it = auctions_.find(auctionId);
    return it != auctions_.end() && it->second.IsLive() && now >= it->second.graceEnd &&
           !LoanClosedLocked(it->second);
}

int64_t LiquidationAuction::GracePeriodRemaining(uint64_t auctionId, int64_t now) const
{
    LOCK(cs_auction_);
    auto it = auctions_.find(auctionId);
    if (it == auctions_.end() || !it->second.IsLive() || LoanClosedLocked(it->second)) {
        return 0;
    }
    return std::max<int64_t>(0, it->second.graceEnd - now);
}

std::optional<Auction> LiquidationAuction::GetAuction(uint64_t auctionId) const
{
    LOCK(cs_auction_);
    auto it = auctions_.find(auctionId);
    if (it == auctions_.end()) {
        return std::nullopt;
    }
    Auction auction = it->second;
    if (LoanClosedLocked(auction)) {
        auction.state = AuctionState::CANCELLED;
        auction.cancelReason = "Loan closed";
    }
    return auction;
}

AuctionState LiquidationAuction::GetAuctionState(uint64_t auctionId, int64_t now) const
{
    LOCK(cs_auction_);
    auto it = auctions_.find(auctionId);
    if (it == auctions_.end()) {
        return AuctionState::NONE;
    }
    const Auction& auction = it->second;
    if (!auction.IsLive()) {
        return auction.state;
    }
    if (LoanClosedLocked(auction)) {
        return AuctionState::CANCELLED;
    }
    return now < auction.graceEnd ? AuctionState::GRACE_PENDING : AuctionState::AUCTION_OPEN;
}

std::optional<uint64_t> LiquidationAuction::GetAuctionForLoan(uint64_t loanId) const
{
    LOCK(cs_auction_);
    auto it = loanAuctions_.find(loanId);
    if (it != loanAuctions_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void LiquidationAuction::SetParams(const LiquidationParams& params, const TierTable& tiers)
{
    LOCK(cs_auction_);
    params_ = params;
    tiers_ = tiers;
}

} // namespace credit
