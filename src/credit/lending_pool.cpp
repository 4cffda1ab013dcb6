// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/lending_pool.h>

#include <credit/ledger_db.h>
#include <util.h>
#include <utilmoneystr.h>

#include <algorithm>

namespace credit {

LendingPool::LendingPool(const CreditParams& params, const AuthorizationGate& gate, LedgerStore& ledger,
                         ValueTransfer& tokens, const PriceFeed& prices, InsuranceFund& fund,
                         const HealthMonitor& health, const AssetId& asset, const Principal& account,
                         LedgerDB* db)
    : gate_(gate)
    , ledger_(ledger)
    , tokens_(tokens)
    , prices_(prices)
    , fund_(fund)
    , health_(health)
    , asset_(asset)
    , account_(account)
    , db_(db)
    , tiers_(params.tiers)
    , rates_(params.rates)
    , lending_(params.lending)
    , paused_(false)
    , cash_(0)
    , totalBorrows_(0)
    , reserves_(0)
{
}

bool LendingPool::LoadFromDatabase()
{
    LOCK(cs_pool_);

    if (db_ == nullptr || !db_->IsInitialized()) {
        return false;
    }

    std::map<uint64_t, LoanPosition> positions;
    std::map<Principal, CAmount> lenderBalances;
    PoolTotals totals;
    if (!db_->LoadPoolState(positions, lenderBalances, totals)) {
        LogPrintf("Lending: Failed to load pool state from database\n");
        return false;
    }

    CAmount outstanding = 0;
    for (const auto& entry : positions) {
        if (entry.second.active) outstanding += entry.second.principal;
    }
    if (outstanding != totals.totalBorrows) {
        LogPrintf("Lending: Stored borrows %s disagree with open positions %s\n",
                  FormatMoney(totals.totalBorrows), FormatMoney(outstanding));
        return false;
    }

    positions_ = std::move(positions);
    lenderBalances_ = std::move(lenderBalances);
    cash_ = totals.cash;
    totalBorrows_ = totals.totalBorrows;
    reserves_ = totals.reserves;
    paused_ = totals.paused;

    LogPrintf("Lending: Loaded %u positions, liquidity %s, borrows %s, reserves %s\n",
              positions_.size(), FormatMoney(cash_), FormatMoney(totalBorrows_), FormatMoney(reserves_));
    return true;
}

// ============================================================================
// Liquidity providers
// ============================================================================

CreditResult LendingPool::Deposit(const Principal& lender, CAmount amount)
{
    LOCK(cs_pool_);

    if (amount <= 0 || !MoneyRange(amount)) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT, "Deposit must be positive");
    }
    if (!tokens_.TransferFrom(asset_, account_, lender, account_, amount)) {
        return CreditResult::Fail(CreditError::TRANSFER_FAILED,
            strprintf("Could not pull %s from %s", FormatMoney(amount), lender.GetHex()));
    }

    PoolTransition transition;
    transition.lender = std::make_pair(lender, GetLenderBalance(lender) + amount);
    transition.totals = TotalsLocked();
    transition.totals.cash += amount;
    if (!PersistLocked(transition)) {
        if (!tokens_.Transfer(asset_, account_, lender, amount)) {
            LogPrintf("Lending: Failed to return deposit of %s to %s after storage failure\n",
                      FormatMoney(amount), lender.GetHex());
        }
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Deposit could not be persisted");
    }
    ApplyLocked(transition);

    LogPrint(BCLog::LENDING, "Lending: %s deposited %s, liquidity %s\n",
             lender.GetHex(), FormatMoney(amount), FormatMoney(cash_));
    return CreditResult::Ok();
}

CreditResult LendingPool::Withdraw(const Principal& lender, CAmount amount)
{
    LOCK(cs_pool_);

    if (amount <= 0) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT, "Withdrawal must be positive");
    }
    CAmount balance = GetLenderBalance(lender);
    if (amount > balance) {
        return CreditResult::Fail(CreditError::INSUFFICIENT_LIQUIDITY,
            strprintf("Withdrawal %s exceeds deposit %s", FormatMoney(amount), FormatMoney(balance)));
    }
    if (amount > cash_) {
        return CreditResult::Fail(CreditError::INSUFFICIENT_LIQUIDITY,
            strprintf("Withdrawal %s exceeds idle liquidity %s", FormatMoney(amount), FormatMoney(cash_)));
    }

    PoolTransition transition;
    transition.lender = std::make_pair(lender, balance - amount);
    transition.totals = TotalsLocked();
    transition.totals.cash -= amount;
    if (!PersistLocked(transition)) {
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Withdrawal could not be persisted");
    }
    if (!tokens_.Transfer(asset_, account_, lender, amount)) {
        PoolTransition previous;
        previous.lender = std::make_pair(lender, balance);
        previous.totals = TotalsLocked();
        if (!PersistLocked(previous)) {
            LogPrintf("Lending: Balance record for %s out of sync with pool\n", lender.GetHex());
        }
        return CreditResult::Fail(CreditError::TRANSFER_FAILED, "Pool could not pay out withdrawal");
    }
    ApplyLocked(transition);

    LogPrint(BCLog::LENDING, "Lending: %s withdrew %s, liquidity %s\n",
             lender.GetHex(), FormatMoney(amount), FormatMoney(cash_));
    return CreditResult::Ok();
}

CAmount LendingPool::GetLenderBalance(const Principal& lender) const
{
    LOCK(cs_pool_);
    auto it = lenderBalances_.find(lender);
    return it != lenderBalances_.end() ? it->second : 0;
}

// ============================================================================
// Borrowers
// ============================================================================

CreditResult LendingPool::GetPrice(const AssetId& asset, int64_t now, PriceData& priceOut) const
{
    LOCK(cs_pool_);

    std::optional<PriceData> price = prices_.LatestPrice(asset);
    if (!price) {
        return CreditResult::Fail(CreditError::PRICE_UNAVAILABLE,
            strprintf("No price for asset %s", asset.GetHex()));
    }
    if (now - price->updatedAt > lending_.maxPriceAge) {
        return CreditResult::Fail(CreditError::STALE_PRICE,
            strprintf("Price for %s last updated at %d", asset.GetHex(), price->updatedAt));
    }
    priceOut = *price;
    return CreditResult::Ok();
}

CreditResult LendingPool::Borrow(const Subject& subject, const AssetId& collateralAsset,
                                 CAmount collateralAmount, CAmount principal, int64_t creditScore,
                                 int64_t now, uint64_t& loanIdOut)
{
    LOCK(cs_pool_);

    if (paused_) {
        return CreditResult::Fail(CreditError::PAUSED, "Borrowing is paused");
    }
    if (collateralAmount <= 0 || principal <= 0 || !MoneyRange(principal)) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT, "Collateral and principal must be positive");
    }
    if (collateralAsset == asset_) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT, "The pool asset cannot be posted as collateral");
    }

    PriceData price;
    CreditResult result = GetPrice(collateralAsset, now, price);
    if (!result) return result;

    const CAmount collateralValue = CollateralValue(collateralAmount, price);
    const Tier tier = tiers_.GetTier(creditScore);
    const TierTerms& terms = tiers_.Get(tier);
    const CAmount maxPrincipal = MulDiv(collateralValue, terms.maxLtvBps, BPS_ONE);

    if (principal > maxPrincipal) {
        return CreditResult::Fail(CreditError::EXCEEDS_ALLOWED_LTV,
            strprintf("Principal %s above %s allowed for %s at %d bps LTV", FormatMoney(principal),
                      FormatMoney(maxPrincipal), TierToString(tier), terms.maxLtvBps));
    }
    if (principal > cash_) {
        return CreditResult::Fail(CreditError::INSUFFICIENT_LIQUIDITY,
            strprintf("Principal %s above available liquidity %s", FormatMoney(principal), FormatMoney(cash_)));
    }

    const int64_t rateBps = MulDiv(rates_.RateAt(UtilizationLocked()), terms.rateMultiplierBps, BPS_ONE);

    if (!tokens_.TransferFrom(collateralAsset, account_, subject, account_, collateralAmount)) {
        return CreditResult::Fail(CreditError::TRANSFER_FAILED, "Collateral could not be collected");
    }
    if (!tokens_.Transfer(asset_, account_, subject, principal)) {
        if (!tokens_.Transfer(collateralAsset, account_, subject, collateralAmount)) {
            LogPrintf("Lending: Failed to return collateral to %s after failed disbursement\n", subject.GetHex());
        }
        return CreditResult::Fail(CreditError::TRANSFER_FAILED, "Principal could not be disbursed");
    }

    CollateralRecord record;
    record.asset = collateralAsset;
    record.collateralValue = collateralValue;
    record.scoreAtOrigination = creditScore;
    record.maxLtvBps = terms.maxLtvBps;

    LoanPosition position;
    position.subject = subject;
    position.collateralAsset = collateralAsset;
    position.collateralAmount = collateralAmount;
    position.originalPrincipal = principal;
    position.principal = principal;
    position.rateBps = rateBps;
    position.lastAccrual = now;
    position.liquidationThresholdBps = terms.maxLtvBps;
    position.tier = tier;
    position.creditScore = creditScore;
    position.openedAt = now;
    position.active = true;

    PoolTransition transition;
    transition.position = position;
    transition.totals = TotalsLocked();
    transition.totals.cash -= principal;
    transition.totals.totalBorrows += principal;

    uint64_t loanId = NULL_LOAN_ID;
    result = ledger_.RegisterCollateralizedLoan(account_, subject, principal, account_, now, record, loanId,
                                                &transition);
    if (!result) {
        // Collateral only goes back once the principal is home
        if (!tokens_.TransferFrom(asset_, account_, subject, account_, principal)) {
            LogPrintf("Lending: Rejected loan for %s: principal %s not reclaimed, holding %s collateral\n",
                      subject.GetHex(), FormatMoney(principal), FormatMoney(collateralAmount));
        } else if (!tokens_.Transfer(collateralAsset, account_, subject, collateralAmount)) {
            LogPrintf("Lending: Failed to return collateral to %s after rejected loan\n", subject.GetHex());
        }
        return result;
    }

    transition.position->loanId = loanId;
    ApplyLocked(transition);

    loanIdOut = loanId;
    LogPrintf("Lending: Loan %u opened for %s: %s against %s collateral, %s tier, %d bps\n",
              loanId, subject.GetHex(), FormatMoney(principal), FormatMoney(collateralValue),
              TierToString(tier), rateBps);
    return CreditResult::Ok();
}

CAmount LendingPool::InterestDue(const LoanPosition& position, int64_t now) const
{
    int64_t elapsed = std::max<int64_t>(0, now - position.lastAccrual);
    __int128 accrued = static_cast<__int128>(position.principal) * position.rateBps * elapsed /
                       (static_cast<__int128>(BPS_ONE) * SECONDS_PER_YEAR);
    if (accrued > MAX_MONEY) accrued = MAX_MONEY;
    return position.accruedInterest + static_cast<CAmount>(accrued);
}

std::optional<CAmount> LendingPool::CalculateDebt(uint64_t loanId, int64_t now) const
{
    LOCK(cs_pool_);
    auto it = positions_.find(loanId);
    if (it == positions_.end() || !it->second.active) {
        return std::nullopt;
    }
    return it->second.principal + InterestDue(it->second, now);
}

CreditResult LendingPool::CalculateHealthFactor(uint64_t loanId, int64_t now, int64_t& healthFactorOut) const
{
    LOCK(cs_pool_);

    auto it = positions_.find(loanId);
    if (it == positions_.end()) {
        return CreditResult::Fail(CreditError::UNKNOWN_LOAN, strprintf("Loan %u not found", loanId));
    }
    const LoanPosition& position = it->second;
    if (!position.active) {
        return CreditResult::Fail(CreditError::LOAN_NOT_ACTIVE, strprintf("Loan %u is closed", loanId));
    }

    PriceData price;
    CreditResult result = GetPrice(position.collateralAsset, now, price);
    if (!result) return result;

    CAmount collateralValue = CollateralValue(position.collateralAmount, price);
    CAmount debt = position.principal + InterestDue(position, now);
    healthFactorOut = health_.CalculateHealthFactor(collateralValue, debt, position.liquidationThresholdBps);
    return CreditResult::Ok();
}

CreditResult LendingPool::Repay(const Subject& subject, uint64_t loanId, CAmount amount, int64_t now,
                                CAmount* paidOut)
{
    LOCK(cs_pool_);

    if (paidOut) *paidOut = 0;

    auto it = positions_.find(loanId);
    if (it == positions_.end()) {
        return CreditResult::Fail(CreditError::UNKNOWN_LOAN, strprintf("Loan %u not found", loanId));
    }
    LoanPosition& position = it->second;
    if (!position.active) {
        return CreditResult::Fail(CreditError::LOAN_NOT_ACTIVE, strprintf("Loan %u is closed", loanId));
    }
    if (position.subject != subject) {
        return CreditResult::Fail(CreditError::UNAUTHORIZED,
            strprintf("Loan %u does not belong to %s", loanId, subject.GetHex()));
    }
    if (amount <= 0 || !MoneyRange(amount)) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT, "Repayment must be positive");
    }

    const CAmount interestDue = InterestDue(position, now);
    const CAmount debt = position.principal + interestDue;
    const CAmount payment = std::min(amount, debt);
    const CAmount interestPaid = std::min(payment, interestDue);
    const CAmount principalPaid = payment - interestPaid;
    const bool settled = principalPaid == position.principal;
    const CAmount released = settled ? position.collateralAmount
                                     : MulDiv(position.collateralAmount, principalPaid, position.principal);
    const CAmount fee = MulDiv(interestPaid, lending_.protocolFeeBps, BPS_ONE);

    if (!tokens_.TransferFrom(asset_, account_, subject, account_, payment)) {
        return CreditResult::Fail(CreditError::TRANSFER_FAILED,
            strprintf("Could not collect repayment of %s", FormatMoney(payment)));
    }
    if (released > 0 && !tokens_.Transfer(position.collateralAsset, account_, subject, released)) {
        if (!tokens_.Transfer(asset_, account_, subject, payment)) {
            LogPrintf("Lending: Failed to refund %s to %s after failed collateral release\n",
                      FormatMoney(payment), subject.GetHex());
        }
        return CreditResult::Fail(CreditError::TRANSFER_FAILED,
            strprintf("Could not release %s collateral on loan %u", FormatMoney(released), loanId));
    }

    PoolTransition transition;
    transition.position = position;
    transition.position->principal -= principalPaid;
    transition.position->accruedInterest = interestDue - interestPaid;
    transition.position->lastAccrual = now;
    transition.position->collateralAmount -= released;
    transition.position->active = !settled;
    transition.totals = TotalsLocked();
    transition.totals.cash += payment - fee;
    transition.totals.reserves += fee;
    transition.totals.totalBorrows -= principalPaid;

    CreditResult result = CreditResult::Ok();
    if (principalPaid > 0) {
        result = ledger_.RegisterRepayment(account_, loanId, principalPaid, nullptr, &transition);
    } else if (!PersistLocked(transition)) {
        result = CreditResult::Fail(CreditError::STORAGE_FAILURE, "Repayment could not be persisted");
    }
    if (!result) {
        if (released > 0 && !tokens_.TransferFrom(position.collateralAsset, account_, subject, account_, released)) {
            LogPrintf("Lending: Rejected repayment on loan %u: released collateral not reclaimed, keeping %s\n",
                      loanId, FormatMoney(payment));
        } else if (!tokens_.Transfer(asset_, account_, subject, payment)) {
            LogPrintf("Lending: Failed to refund %s to %s after rejected repayment\n",
                      FormatMoney(payment), subject.GetHex());
        }
        return result;
    }
    ApplyLocked(transition);

    if (fee > 0) {
        CAmount allocated = 0;
        CreditResult allocation = fund_.AllocateRevenue(account_, fee, &allocated);
        if (!allocation) {
            LogPrintf("Lending: Revenue allocation of %s failed, kept in reserves: %s\n",
                      FormatMoney(fee), allocation.message);
        }
        if (allocated > 0) {
            PoolTransition skim;
            skim.totals = TotalsLocked();
            skim.totals.reserves -= allocated;
            if (!PersistLocked(skim)) {
                LogPrintf("Lending: Reserves after revenue share not persisted, next pool write carries them\n");
            }
            ApplyLocked(skim);
        }
    }

    if (paidOut) *paidOut = payment;

    LogPrintf("Lending: Loan %u repaid %s (interest %s, principal %s, fee %s)%s\n",
              loanId, FormatMoney(payment), FormatMoney(interestPaid), FormatMoney(principalPaid),
              FormatMoney(fee), settled ? " settled" : "");
    return CreditResult::Ok();
}

CreditResult LendingPool::SettleLiquidation(const Principal& caller, uint64_t loanId, const Principal& executor,
                                            CAmount paid, int64_t now, CAmount* coveredOut)
{
    LOCK(cs_pool_);

    if (coveredOut) *coveredOut = 0;

    CreditResult result = gate_.Require(Capability::LEDGER_WRITER, caller);
    if (!result) return result;

    auto it = positions_.find(loanId);
    if (it == positions_.end()) {
        return CreditResult::Fail(CreditError::UNKNOWN_LOAN, strprintf("Loan %u not found", loanId));
    }
    LoanPosition& position = it->second;
    if (!position.active) {
        return CreditResult::Fail(CreditError::LOAN_NOT_ACTIVE, strprintf("Loan %u is closed", loanId));
    }

    const CAmount debt = position.principal + InterestDue(position, now);
    if (paid < 0 || paid > debt) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT,
            strprintf("Settlement %s outside [0, %s]", FormatMoney(paid), FormatMoney(debt)));
    }

    if (paid > 0 && !tokens_.TransferFrom(asset_, account_, executor, account_, paid)) {
        return CreditResult::Fail(CreditError::TRANSFER_FAILED,
            strprintf("Could not collect %s from executor %s", FormatMoney(paid), executor.GetHex()));
    }
    const CAmount collateral = position.collateralAmount;
    if (collateral > 0 && !tokens_.Transfer(position.collateralAsset, account_, executor, collateral)) {
        if (paid > 0 && !tokens_.Transfer(asset_, account_, executor, paid)) {
            LogPrintf("Lending: Failed to refund executor %s after failed collateral delivery\n", executor.GetHex());
        }
        return CreditResult::Fail(CreditError::TRANSFER_FAILED,
            strprintf("Could not deliver collateral of loan %u to %s", loanId, executor.GetHex()));
    }

    PoolTransition transition;
    transition.position = position;
    transition.position->principal = 0;
    transition.position->accruedInterest = 0;
    transition.position->collateralAmount = 0;
    transition.position->lastAccrual = now;
    transition.position->active = false;
    transition.totals = TotalsLocked();
    transition.totals.cash += paid;
    transition.totals.totalBorrows -= position.principal;

    result = ledger_.RegisterLiquidation(account_, loanId, &transition);
    if (!result) {
        if (collateral > 0 &&
            !tokens_.TransferFrom(position.collateralAsset, account_, executor, account_, collateral)) {
            LogPrintf("Lending: Rejected liquidation of loan %u: collateral not reclaimed from %s, keeping %s\n",
                      loanId, executor.GetHex(), FormatMoney(paid));
        } else if (paid > 0 && !tokens_.Transfer(asset_, account_, executor, paid)) {
            LogPrintf("Lending: Failed to refund executor %s after rejected liquidation\n", executor.GetHex());
        }
        return result;
    }
    const Subject subject = position.subject;
    const CAmount originalPrincipal = position.originalPrincipal;
    ApplyLocked(transition);

    CAmount covered = 0;
    const CAmount shortfall = debt - paid;
    if (shortfall > 0) {
        result = fund_.CoverLoss(account_, subject, loanId, originalPrincipal, shortfall, now, &covered);
        if (!result) {
            LogPrintf("Lending: Fund coverage for loan %u failed: %s\n", loanId, result.message);
        }
    }
    if (covered > 0) {
        PoolTransition coverage;
        coverage.totals = TotalsLocked();
        coverage.totals.cash += covered;
        if (!PersistLocked(coverage)) {
            LogPrintf("Lending: Liquidity after fund coverage not persisted, next pool write carries it\n");
        }
        ApplyLocked(coverage);
    }

    if (coveredOut) *coveredOut = covered;

    LogPrintf("Lending: Loan %u liquidated, recovered %s of %s, fund covered %s\n",
              loanId, FormatMoney(paid), FormatMoney(debt), FormatMoney(covered));
    return CreditResult::Ok();
}

// ============================================================================
// Administration and state
// ============================================================================

CreditResult LendingPool::SetPaused(const Principal& caller, bool paused)
{
    LOCK(cs_pool_);

    CreditResult auth = gate_.Require(Capability::ADMIN, caller);
    if (!auth) return auth;

    PoolTransition transition;
    transition.totals = TotalsLocked();
    transition.totals.paused = paused;
    if (!PersistLocked(transition)) {
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Pause flag could not be persisted");
    }
    ApplyLocked(transition);
    LogPrintf("Lending: Borrowing %s\n", paused ? "paused" : "resumed");
    return CreditResult::Ok();
}

bool LendingPool::IsPaused() const
{
    LOCK(cs_pool_);
    return paused_;
}

void LendingPool::SetParams(const CreditParams& params)
{
    LOCK(cs_pool_);
    tiers_ = params.tiers;
    rates_ = params.rates;
    lending_ = params.lending;
}

int64_t LendingPool::UtilizationLocked() const
{
    CAmount total = cash_ + totalBorrows_;
    if (total <= 0) {
        return 0;
    }
    return MulDiv(totalBorrows_, BPS_ONE, total);
}

PoolTotals LendingPool::TotalsLocked() const
{
    PoolTotals totals;
    totals.cash = cash_;
    totals.totalBorrows = totalBorrows_;
    totals.reserves = reserves_;
    totals.paused = paused_;
    return totals;
}

bool LendingPool::PersistLocked(const PoolTransition& transition)
{
    if (db_ == nullptr || !db_->IsInitialized()) {
        return true;
    }
    return db_->ApplyPoolTransition(transition);
}

void LendingPool::ApplyLocked(const PoolTransition& transition)
{
    if (transition.position) {
        positions_[transition.position->loanId] = *transition.position;
    }
    if (transition.lender) {
        lenderBalances_[transition.lender->first] = transition.lender->second;
    }
    cash_ = transition.totals.cash;
    totalBorrows_ = transition.totals.totalBorrows;
    reserves_ = transition.totals.reserves;
    paused_ = transition.totals.paused;
}

int64_t LendingPool::GetUtilization() const
{
    LOCK(cs_pool_);
    return UtilizationLocked();
}

int64_t LendingPool::GetCurrentRate() const
{
    LOCK(cs_pool_);
    return rates_.RateAt(UtilizationLocked());
}

CAmount LendingPool::GetAvailableLiquidity() const
{
    LOCK(cs_pool_);
    return cash_;
}

CAmount LendingPool::GetTotalBorrows() const
{
    LOCK(cs_pool_);
    return totalBorrows_;
}

CAmount LendingPool::GetReserves() const
{
    LOCK(cs_pool_);
    return reserves_;
}

std::optional<LoanPosition> LendingPool::GetPosition(uint64_t loanId) const
{
    LOCK(cs_pool_);
    auto it = positions_.find(loanId);
    if (it != positions_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<uint64_t> LendingPool::GetActiveLoanIds() const
{
    LOCK(cs_pool_);
    std::vector<uint64_t> ids;
    for (const auto& entry : positions_) {
        if (entry.second.active) ids.push_back(entry.first);
    }
    return ids;
}

} // namespace credit
