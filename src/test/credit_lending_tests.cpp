// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file credit_lending_tests.cpp
 * @brief Tests for the lending pool: liquidity, tiered borrowing, interest and repayment
 */

#include <credit/lending_pool.h>
#include <test/test_credit.h>

#include <boost/test/unit_test.hpp>

using namespace credit;

namespace {

/** A representative credit score inside each tier */
const int64_t TIER_SCORES[TIER_COUNT] = {500, 650, 760, 820};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(credit_lending_tests, CreditTestingSetup)

BOOST_AUTO_TEST_CASE(rate_curve)
{
    const RateModel& rates = params.rates;
    BOOST_CHECK_EQUAL(rates.RateAt(0), 200);
    BOOST_CHECK_EQUAL(rates.RateAt(4000), 400);
    BOOST_CHECK_EQUAL(rates.RateAt(8000), 600);
    BOOST_CHECK_EQUAL(rates.RateAt(9000), 3600);
    BOOST_CHECK_EQUAL(rates.RateAt(10000), 6600);
    // Out of range utilization is clamped
    BOOST_CHECK_EQUAL(rates.RateAt(-5), 200);
    BOOST_CHECK_EQUAL(rates.RateAt(20000), 6600);
}

BOOST_AUTO_TEST_CASE(liquidity_deposit_and_withdraw)
{
    Principal lender = SupplyLiquidity(10000 * COIN);
    BOOST_CHECK_EQUAL(pool.GetLenderBalance(lender), 10000 * COIN);
    BOOST_CHECK_EQUAL(pool.GetAvailableLiquidity(), 10000 * COIN);
    BOOST_CHECK_EQUAL(pool.GetUtilization(), 0);
    BOOST_CHECK_EQUAL(pool.GetCurrentRate(), 200);

    BOOST_CHECK_EQUAL(pool.Deposit(lender, 0).error, CreditError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(pool.Withdraw(lender, 0).error, CreditError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(pool.Withdraw(lender, 10001 * COIN).error, CreditError::INSUFFICIENT_LIQUIDITY);
    BOOST_CHECK_EQUAL(pool.Withdraw(InsecureRand160(), COIN).error, CreditError::INSUFFICIENT_LIQUIDITY);

    // Borrowed funds cannot be withdrawn
    OpenLoan(InsecureRand160(), 20 * COIN, 9000 * COIN, 500);
    BOOST_CHECK_EQUAL(pool.GetUtilization(), 9000);
    BOOST_CHECK_EQUAL(pool.Withdraw(lender, 2000 * COIN).error, CreditError::INSUFFICIENT_LIQUIDITY);

    BOOST_CHECK(pool.Withdraw(lender, 1000 * COIN).IsOk());
    BOOST_CHECK_EQUAL(pool.GetLenderBalance(lender), 9000 * COIN);
    BOOST_CHECK_EQUAL(pool.GetAvailableLiquidity(), 0);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, lender), 1000 * COIN);
}

BOOST_AUTO_TEST_CASE(borrow_opens_position)
{
    SupplyLiquidity(10000 * COIN);
    Subject borrower = InsecureRand160();

    uint64_t loanId = OpenLoan(borrower, COIN, 500 * COIN, 500);
    BOOST_CHECK_EQUAL(loanId, 1U);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, borrower), 500 * COIN);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, borrower), 0);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, poolAccount), COIN);

    std::optional<LoanPosition> position = pool.GetPosition(loanId);
    BOOST_REQUIRE(position);
    BOOST_CHECK(position->subject == borrower);
    BOOST_CHECK(position->active);
    BOOST_CHECK_EQUAL(position->principal, 500 * COIN);
    BOOST_CHECK_EQUAL(position->tier, Tier::BRONZE);
    BOOST_CHECK_EQUAL(position->liquidationThresholdBps, 5000);
    // Empty pool utilization: 200 bps base, times the 1.5x bronze multiplier
    BOOST_CHECK_EQUAL(position->rateBps, 300);

    std::optional<LoanRecord> loan = ledger.GetLoan(loanId);
    BOOST_REQUIRE(loan);
    BOOST_CHECK(loan->subject == borrower);
    BOOST_CHECK(loan->counterparty == poolAccount);
    std::optional<CollateralRecord> collateral = ledger.GetCollateral(loanId);
    BOOST_REQUIRE(collateral);
    BOOST_CHECK_EQUAL(collateral->collateralValue, 1000 * COIN);
    BOOST_CHECK_EQUAL(collateral->scoreAtOrigination, 500);
    BOOST_CHECK_EQUAL(collateral->maxLtvBps, 5000);
    BOOST_CHECK_EQUAL(ledger.GetAggregates(borrower).maxLtvBorrowCount, 1U);

    BOOST_CHECK_EQUAL(pool.GetTotalBorrows(), 500 * COIN);
    BOOST_CHECK_EQUAL(pool.GetAvailableLiquidity(), 9500 * COIN);

    // The next loan prices off the 500 bps utilization the first one created: 225 bps times 1.5
    BOOST_CHECK_EQUAL(pool.GetUtilization(), 500);
    uint64_t second = OpenLoan(InsecureRand160(), 10 * COIN, 4500 * COIN, 500);
    BOOST_CHECK_EQUAL(pool.GetPosition(second)->rateBps, 337);
}

BOOST_AUTO_TEST_CASE(ltv_limit_per_tier)
{
    SupplyLiquidity(100000 * COIN);

    for (size_t i = 0; i < TIER_COUNT; ++i) {
        const TierTerms& terms = params.tiers.Get(static_cast<Tier>(i));
        BOOST_REQUIRE_EQUAL(params.tiers.GetTier(TIER_SCORES[i]), static_cast<Tier>(i));

        // 1 ETH at $1000
        const CAmount limit = 1000 * COIN * terms.maxLtvBps / BPS_ONE;

        Subject over = InsecureRand160();
        Give(eth, over, COIN, poolAccount);
        uint64_t loanId = NULL_LOAN_ID;
        CreditResult result = pool.Borrow(over, eth, COIN, limit + 1, TIER_SCORES[i], now, loanId);
        BOOST_CHECK_MESSAGE(result.error == CreditError::EXCEEDS_ALLOWED_LTV,
                            "tier " << i << " accepted principal above its limit");
        BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, over), COIN);

        Subject at = InsecureRand160();
        loanId = OpenLoan(at, COIN, limit, TIER_SCORES[i]);
        BOOST_CHECK_EQUAL(pool.GetPosition(loanId)->liquidationThresholdBps, terms.maxLtvBps);
        BOOST_CHECK_EQUAL(pool.GetPosition(loanId)->tier, static_cast<Tier>(i));
    }
}

BOOST_AUTO_TEST_CASE(borrow_rejections)
{
    SupplyLiquidity(1000 * COIN);
    Subject borrower = InsecureRand160();
    Give(eth, borrower, 10 * COIN, poolAccount);
    uint64_t loanId = NULL_LOAN_ID;

    BOOST_CHECK_EQUAL(pool.Borrow(borrower, eth, 0, 100 * COIN, 500, now, loanId).error, CreditError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(pool.Borrow(borrower, eth, COIN, 0, 500, now, loanId).error, CreditError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(pool.Borrow(borrower, usd, COIN, 100, 500, now, loanId).error, CreditError::INVALID_AMOUNT);

    AssetId unpriced = InsecureRand160();
    BOOST_CHECK_EQUAL(pool.Borrow(borrower, unpriced, COIN, 100 * COIN, 500, now, loanId).error,
                      CreditError::PRICE_UNAVAILABLE);

    // Above the pool's idle liquidity
    BOOST_CHECK_EQUAL(pool.Borrow(borrower, eth, 10 * COIN, 1001 * COIN, 500, now, loanId).error,
                      CreditError::INSUFFICIENT_LIQUIDITY);

    // Collateral the borrower does not hold
    BOOST_CHECK_EQUAL(pool.Borrow(borrower, eth, 11 * COIN, 100 * COIN, 500, now, loanId).error,
                      CreditError::TRANSFER_FAILED);

    BOOST_CHECK_EQUAL(ledger.GetLoanCount(), 0U);
    BOOST_CHECK_EQUAL(pool.GetAvailableLiquidity(), 1000 * COIN);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, borrower), 10 * COIN);
}

BOOST_AUTO_TEST_CASE(stale_price_rejected)
{
    SupplyLiquidity(1000 * COIN);
    Subject borrower = InsecureRand160();
    Give(eth, borrower, 2 * COIN, poolAccount);
    uint64_t loanId = NULL_LOAN_ID;

    prices.SetPrice(eth, 1000 * COIN, 8, now - SECONDS_PER_HOUR - 1);
    BOOST_CHECK_EQUAL(pool.Borrow(borrower, eth, COIN, 100 * COIN, 500, now, loanId).error, CreditError::STALE_PRICE);

    prices.SetPrice(eth, 1000 * COIN, 8, now - SECONDS_PER_HOUR);
    BOOST_CHECK(pool.Borrow(borrower, eth, COIN, 100 * COIN, 500, now, loanId).IsOk());

    prices.SetPrice(eth, 0, 8, now);
    BOOST_CHECK_EQUAL(pool.Borrow(borrower, eth, COIN, 100 * COIN, 500, now, loanId).error,
                      CreditError::PRICE_UNAVAILABLE);
}

BOOST_AUTO_TEST_CASE(price_decimals)
{
    SupplyLiquidity(1000 * COIN);
    Subject borrower = InsecureRand160();
    Give(eth, borrower, COIN, poolAccount);

    // $2000 quoted with 6 decimals
    prices.SetPrice(eth, 2000 * 1000000LL, 6, now);
    uint64_t loanId = NULL_LOAN_ID;
    BOOST_CHECK_EQUAL(pool.Borrow(borrower, eth, COIN, 1000 * COIN + 1, 500, now, loanId).error,
                      CreditError::EXCEEDS_ALLOWED_LTV);
    BOOST_CHECK(pool.Borrow(borrower, eth, COIN, 1000 * COIN, 500, now, loanId).IsOk());
    BOOST_CHECK_EQUAL(ledger.GetCollateral(loanId)->collateralValue, 2000 * COIN);
}

BOOST_AUTO_TEST_CASE(paused_pool)
{
    SupplyLiquidity(1000 * COIN);
    Subject borrower = InsecureRand160();
    Give(eth, borrower, COIN, poolAccount);
    uint64_t loanId = NULL_LOAN_ID;

    BOOST_CHECK_EQUAL(pool.SetPaused(borrower, true).error, CreditError::UNAUTHORIZED);
    BOOST_REQUIRE(pool.SetPaused(admin, true).IsOk());
    BOOST_CHECK(pool.IsPaused());
    BOOST_CHECK_EQUAL(pool.Borrow(borrower, eth, COIN, 100 * COIN, 500, now, loanId).error, CreditError::PAUSED);

    BOOST_REQUIRE(pool.SetPaused(admin, false).IsOk());
    BOOST_CHECK(pool.Borrow(borrower, eth, COIN, 100 * COIN, 500, now, loanId).IsOk());
}

BOOST_AUTO_TEST_CASE(interest_accrues_linearly)
{
    SupplyLiquidity(10000 * COIN);
    uint64_t loanId = OpenLoan(InsecureRand160(), COIN, 500 * COIN, 500);

    BOOST_CHECK_EQUAL(*pool.CalculateDebt(loanId, now), 500 * COIN);
    // 3% for a year, 1.5% for half of one
    BOOST_CHECK_EQUAL(*pool.CalculateDebt(loanId, now + SECONDS_PER_YEAR), 515 * COIN);
    BOOST_CHECK_EQUAL(*pool.CalculateDebt(loanId, now + SECONDS_PER_YEAR / 2), 5075 * COIN / 10);
    BOOST_CHECK(!pool.CalculateDebt(99, now));
}

BOOST_AUTO_TEST_CASE(full_repayment_routes_fee)
{
    SupplyLiquidity(10000 * COIN);
    Subject borrower = InsecureRand160();
    uint64_t loanId = OpenLoan(borrower, COIN, 500 * COIN, 500);
    Give(usd, borrower, 15 * COIN, poolAccount);

    now += SECONDS_PER_YEAR;
    CAmount paid = 0;
    // Overpaying only takes what is owed
    BOOST_REQUIRE(pool.Repay(borrower, loanId, 600 * COIN, now, &paid).IsOk());
    BOOST_CHECK_EQUAL(paid, 515 * COIN);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, borrower), 0);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, borrower), COIN);

    // 20% of the 15 interest is protocol revenue; 5% of that goes to the fund
    BOOST_CHECK_EQUAL(fund.GetBalance(), 15 * COIN / 100);
    BOOST_CHECK_EQUAL(pool.GetReserves(), 3 * COIN - 15 * COIN / 100);
    BOOST_CHECK_EQUAL(pool.GetAvailableLiquidity(), 10012 * COIN);
    BOOST_CHECK_EQUAL(pool.GetTotalBorrows(), 0);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, poolAccount), pool.GetAvailableLiquidity() + pool.GetReserves());

    std::optional<LoanPosition> position = pool.GetPosition(loanId);
    BOOST_REQUIRE(position);
    BOOST_CHECK(!position->active);
    BOOST_CHECK_EQUAL(position->collateralAmount, 0);
    BOOST_CHECK_EQUAL(ledger.GetLoan(loanId)->status, LoanStatus::REPAID);
    BOOST_CHECK_EQUAL(ledger.GetAggregates(borrower).repaidLoans, 1U);

    BOOST_CHECK_EQUAL(pool.Repay(borrower, loanId, COIN, now).error, CreditError::LOAN_NOT_ACTIVE);
}

BOOST_AUTO_TEST_CASE(partial_repayment_releases_collateral)
{
    SupplyLiquidity(10000 * COIN);
    Subject borrower = InsecureRand160();
    uint64_t loanId = OpenLoan(borrower, 2 * COIN, 800 * COIN, 500);

    BOOST_REQUIRE(pool.Repay(borrower, loanId, 200 * COIN, now).IsOk());
    std::optional<LoanPosition> position = pool.GetPosition(loanId);
    BOOST_CHECK_EQUAL(position->principal, 600 * COIN);
    BOOST_CHECK_EQUAL(position->collateralAmount, 15 * COIN / 10);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, borrower), COIN / 2);
    BOOST_CHECK_EQUAL(ledger.GetLoan(loanId)->repaidSoFar, 200 * COIN);
    BOOST_CHECK(ledger.GetLoan(loanId)->IsActive());
}

BOOST_AUTO_TEST_CASE(interest_paid_before_principal)
{
    SupplyLiquidity(10000 * COIN);
    Subject borrower = InsecureRand160();
    uint64_t loanId = OpenLoan(borrower, COIN, 500 * COIN, 500);

    now += SECONDS_PER_YEAR;
    BOOST_REQUIRE(pool.Repay(borrower, loanId, 10 * COIN, now).IsOk());
    std::optional<LoanPosition> position = pool.GetPosition(loanId);
    BOOST_CHECK_EQUAL(position->principal, 500 * COIN);
    BOOST_CHECK_EQUAL(position->accruedInterest, 5 * COIN);
    BOOST_CHECK_EQUAL(position->collateralAmount, COIN);
    BOOST_CHECK_EQUAL(ledger.GetLoan(loanId)->repaidSoFar, 0);
    BOOST_CHECK_EQUAL(*pool.CalculateDebt(loanId, now), 505 * COIN);
}

BOOST_AUTO_TEST_CASE(repay_rejections)
{
    SupplyLiquidity(10000 * COIN);
    Subject borrower = InsecureRand160();
    uint64_t loanId = OpenLoan(borrower, COIN, 500 * COIN, 500);

    BOOST_CHECK_EQUAL(pool.Repay(borrower, 42, COIN, now).error, CreditError::UNKNOWN_LOAN);
    BOOST_CHECK_EQUAL(pool.Repay(InsecureRand160(), loanId, COIN, now).error, CreditError::UNAUTHORIZED);
    BOOST_CHECK_EQUAL(pool.Repay(borrower, loanId, 0, now).error, CreditError::INVALID_AMOUNT);

    // Repayment the borrower has not approved
    BOOST_REQUIRE(tokens.Approve(usd, borrower, poolAccount, 0));
    BOOST_CHECK_EQUAL(pool.Repay(borrower, loanId, COIN, now).error, CreditError::TRANSFER_FAILED);
    BOOST_CHECK_EQUAL(pool.GetPosition(loanId)->principal, 500 * COIN);
}

BOOST_AUTO_TEST_CASE(position_health_factor)
{
    SupplyLiquidity(10000 * COIN);
    uint64_t bronze = OpenLoan(InsecureRand160(), COIN, 500 * COIN, 500);
    uint64_t silver = OpenLoan(InsecureRand160(), COIN, 500 * COIN, 650);

    int64_t healthFactor = 0;
    BOOST_REQUIRE(pool.CalculateHealthFactor(bronze, now, healthFactor).IsOk());
    BOOST_CHECK_EQUAL(healthFactor, 10000);
    BOOST_REQUIRE(pool.CalculateHealthFactor(silver, now, healthFactor).IsOk());
    BOOST_CHECK_EQUAL(healthFactor, 14000);

    SetEthPrice(700);
    BOOST_REQUIRE(pool.CalculateHealthFactor(silver, now, healthFactor).IsOk());
    BOOST_CHECK_EQUAL(healthFactor, 9800);
    BOOST_CHECK_EQUAL(health.GetRiskLevel(healthFactor), RiskLevel::DANGER);

    BOOST_CHECK_EQUAL(pool.CalculateHealthFactor(77, now, healthFactor).error, CreditError::UNKNOWN_LOAN);
    BOOST_CHECK_EQUAL(pool.CalculateHealthFactor(bronze, now + 2 * SECONDS_PER_HOUR, healthFactor).error,
                      CreditError::STALE_PRICE);
}

BOOST_AUTO_TEST_CASE(failed_disbursement_leaves_no_loan)
{
    SupplyLiquidity(10000 * COIN);
    Subject borrower = InsecureRand160();
    Give(eth, borrower, COIN, poolAccount);

    transfers.FailTransfers(usd);
    uint64_t loanId = NULL_LOAN_ID;
    BOOST_CHECK_EQUAL(pool.Borrow(borrower, eth, COIN, 500 * COIN, 500, now, loanId).error,
                      CreditError::TRANSFER_FAILED);
    BOOST_CHECK_EQUAL(loanId, NULL_LOAN_ID);

    BOOST_CHECK_EQUAL(ledger.GetLoanCount(), 0U);
    BOOST_CHECK_EQUAL(ledger.GetAggregates(borrower).totalLoans, 0U);
    BOOST_CHECK_EQUAL(ledger.GetAggregates(borrower).activeLoans, 0U);
    BOOST_CHECK(pool.GetActiveLoanIds().empty());
    BOOST_CHECK_EQUAL(identity.GetActivity(borrower).firstSeen, 0);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, borrower), COIN);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, poolAccount), 0);
    BOOST_CHECK_EQUAL(pool.GetAvailableLiquidity(), 10000 * COIN);
    BOOST_CHECK_EQUAL(pool.GetTotalBorrows(), 0);

    transfers.Clear();
    BOOST_REQUIRE(tokens.Approve(eth, borrower, poolAccount, COIN));
    BOOST_CHECK(pool.Borrow(borrower, eth, COIN, 500 * COIN, 500, now, loanId).IsOk());
    BOOST_CHECK_EQUAL(loanId, 1U);
}

BOOST_AUTO_TEST_CASE(ledger_rejection_unwinds_borrow)
{
    SupplyLiquidity(10000 * COIN);
    Subject borrower = InsecureRand160();
    Give(eth, borrower, COIN, poolAccount);
    // Lets the pool pull the disbursed principal back
    BOOST_REQUIRE(tokens.Approve(usd, borrower, poolAccount, MAX_MONEY));
    BOOST_REQUIRE(gate.Revoke(admin, Capability::LEDGER_WRITER, poolAccount).IsOk());

    uint64_t loanId = NULL_LOAN_ID;
    BOOST_CHECK_EQUAL(pool.Borrow(borrower, eth, COIN, 500 * COIN, 500, now, loanId).error,
                      CreditError::UNAUTHORIZED);

    BOOST_CHECK_EQUAL(ledger.GetLoanCount(), 0U);
    BOOST_CHECK(pool.GetActiveLoanIds().empty());
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, borrower), 0);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, borrower), COIN);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, poolAccount), 10000 * COIN);
    BOOST_CHECK_EQUAL(pool.GetAvailableLiquidity(), 10000 * COIN);
}

BOOST_AUTO_TEST_CASE(failed_collateral_release_keeps_loan_open)
{
    SupplyLiquidity(10000 * COIN);
    Subject borrower = InsecureRand160();
    uint64_t loanId = OpenLoan(borrower, COIN, 500 * COIN, 500);

    transfers.FailTransfers(eth);
    BOOST_CHECK_EQUAL(pool.Repay(borrower, loanId, 500 * COIN, now).error, CreditError::TRANSFER_FAILED);

    std::optional<LoanPosition> position = pool.GetPosition(loanId);
    BOOST_REQUIRE(position);
    BOOST_CHECK(position->active);
    BOOST_CHECK_EQUAL(position->principal, 500 * COIN);
    BOOST_CHECK_EQUAL(position->collateralAmount, COIN);
    BOOST_CHECK_EQUAL(ledger.GetLoan(loanId)->status, LoanStatus::ACTIVE);
    BOOST_CHECK_EQUAL(ledger.GetLoan(loanId)->repaidSoFar, 0);
    BOOST_CHECK_EQUAL(ledger.GetAggregates(borrower).activeLoans, 1U);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, borrower), 500 * COIN);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, poolAccount), COIN);
    BOOST_CHECK_EQUAL(pool.GetAvailableLiquidity(), 9500 * COIN);
    BOOST_CHECK_EQUAL(pool.GetTotalBorrows(), 500 * COIN);

    transfers.Clear();
    BOOST_CHECK(pool.Repay(borrower, loanId, 500 * COIN, now).IsOk());
    BOOST_CHECK(!pool.GetPosition(loanId)->active);
    BOOST_CHECK_EQUAL(ledger.GetLoan(loanId)->status, LoanStatus::REPAID);
}

BOOST_AUTO_TEST_CASE(ledger_rejection_unwinds_repayment)
{
    SupplyLiquidity(10000 * COIN);
    Subject borrower = InsecureRand160();
    uint64_t loanId = OpenLoan(borrower, COIN, 500 * COIN, 500);
    // Lets the pool pull the released collateral back
    BOOST_REQUIRE(tokens.Approve(eth, borrower, poolAccount, COIN));
    BOOST_REQUIRE(gate.Revoke(admin, Capability::LEDGER_WRITER, poolAccount).IsOk());

    BOOST_CHECK_EQUAL(pool.Repay(borrower, loanId, 500 * COIN, now).error, CreditError::UNAUTHORIZED);

    BOOST_CHECK(pool.GetPosition(loanId)->active);
    BOOST_CHECK_EQUAL(pool.GetPosition(loanId)->principal, 500 * COIN);
    BOOST_CHECK_EQUAL(ledger.GetLoan(loanId)->status, LoanStatus::ACTIVE);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, borrower), 500 * COIN);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, borrower), 0);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, poolAccount), COIN);
    BOOST_CHECK_EQUAL(pool.GetAvailableLiquidity(), 9500 * COIN);
}

BOOST_AUTO_TEST_CASE(failed_collateral_delivery_keeps_loan_open)
{
    SupplyLiquidity(10000 * COIN);
    SeedFund(1000 * COIN);
    Subject borrower = InsecureRand160();
    uint64_t loanId = OpenLoan(borrower, COIN, 500 * COIN, 500);
    Principal executor = InsecureRand160();
    Give(usd, executor, 450 * COIN, poolAccount);

    transfers.FailTransfers(eth);
    BOOST_CHECK_EQUAL(pool.SettleLiquidation(auctionAccount, loanId, executor, 450 * COIN, now).error,
                      CreditError::TRANSFER_FAILED);

    BOOST_CHECK(pool.GetPosition(loanId)->active);
    BOOST_CHECK_EQUAL(ledger.GetLoan(loanId)->status, LoanStatus::ACTIVE);
    BOOST_CHECK_EQUAL(ledger.GetAggregates(borrower).liquidatedLoans, 0U);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, executor), 450 * COIN);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, executor), 0);
    BOOST_CHECK_EQUAL(pool.GetAvailableLiquidity(), 9500 * COIN);
    BOOST_CHECK_EQUAL(fund.GetStatistics().totalCovered, 0);

    transfers.Clear();
    BOOST_CHECK(pool.SettleLiquidation(auctionAccount, loanId, executor, 450 * COIN, now).IsOk());
    BOOST_CHECK(!pool.GetPosition(loanId)->active);
    BOOST_CHECK_EQUAL(ledger.GetLoan(loanId)->status, LoanStatus::LIQUIDATED);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, executor), COIN);
}

BOOST_AUTO_TEST_CASE(ledger_rejection_unwinds_settlement)
{
    SupplyLiquidity(10000 * COIN);
    Subject borrower = InsecureRand160();
    uint64_t loanId = OpenLoan(borrower, COIN, 500 * COIN, 500);
    Principal executor = InsecureRand160();
    Give(usd, executor, 450 * COIN, poolAccount);
    // Lets the pool pull the delivered collateral back
    BOOST_REQUIRE(tokens.Approve(eth, executor, poolAccount, COIN));
    BOOST_REQUIRE(gate.Revoke(admin, Capability::LEDGER_WRITER, poolAccount).IsOk());

    BOOST_CHECK_EQUAL(pool.SettleLiquidation(auctionAccount, loanId, executor, 450 * COIN, now).error,
                      CreditError::UNAUTHORIZED);

    BOOST_CHECK(pool.GetPosition(loanId)->active);
    BOOST_CHECK_EQUAL(ledger.GetLoan(loanId)->status, LoanStatus::ACTIVE);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, executor), 450 * COIN);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, executor), 0);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, poolAccount), COIN);
    BOOST_CHECK_EQUAL(pool.GetAvailableLiquidity(), 9500 * COIN);
}

BOOST_AUTO_TEST_CASE(failed_payout_keeps_deposit)
{
    Principal lender = SupplyLiquidity(1000 * COIN);

    transfers.FailTransfers(usd);
    BOOST_CHECK_EQUAL(pool.Withdraw(lender, 400 * COIN).error, CreditError::TRANSFER_FAILED);
    BOOST_CHECK_EQUAL(pool.GetLenderBalance(lender), 1000 * COIN);
    BOOST_CHECK_EQUAL(pool.GetAvailableLiquidity(), 1000 * COIN);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, lender), 0);
}

BOOST_AUTO_TEST_SUITE_END()
