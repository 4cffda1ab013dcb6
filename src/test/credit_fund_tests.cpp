// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/insurance_fund.h>
#include <test/test_credit.h>

#include <boost/test/unit_test.hpp>

using namespace credit;

BOOST_FIXTURE_TEST_SUITE(credit_fund_tests, CreditTestingSetup)

BOOST_AUTO_TEST_CASE(deposit_tracks_balance)
{
    Principal depositor = InsecureRand160();
    BOOST_CHECK_EQUAL(fund.Deposit(depositor, 0).error, CreditError::INVALID_AMOUNT);

    // Nothing approved yet
    BOOST_REQUIRE(tokens.Mint(usd, depositor, 100 * COIN));
    BOOST_CHECK_EQUAL(fund.Deposit(depositor, 100 * COIN).error, CreditError::TRANSFER_FAILED);
    BOOST_CHECK_EQUAL(fund.GetBalance(), 0);

    BOOST_REQUIRE(tokens.Approve(usd, depositor, fundAccount, 100 * COIN));
    BOOST_CHECK(fund.Deposit(depositor, 100 * COIN).IsOk());
    BOOST_CHECK_EQUAL(fund.GetBalance(), 100 * COIN);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, fundAccount), 100 * COIN);

    FundStatistics stats = fund.GetStatistics();
    BOOST_CHECK_EQUAL(stats.totalDeposited, 100 * COIN);
    BOOST_CHECK_EQUAL(stats.totalCovered, 0);
    BOOST_CHECK_EQUAL(stats.totalDefaults, 0U);
}

BOOST_AUTO_TEST_CASE(coverage_capped_by_principal)
{
    SeedFund(10000 * COIN);
    Subject subject = InsecureRand160();

    // 0.25% of a $100,000 loan is $250
    CAmount covered = 0;
    BOOST_REQUIRE(fund.CoverLoss(poolAccount, subject, 7, 100000 * COIN, 1000 * COIN, now, &covered).IsOk());
    BOOST_CHECK_EQUAL(covered, 250 * COIN);
    BOOST_CHECK_EQUAL(fund.GetBalance(), 9750 * COIN);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, poolAccount), 250 * COIN);

    // Small losses are covered in full
    BOOST_REQUIRE(fund.CoverLoss(poolAccount, subject, 8, 100000 * COIN, 10 * COIN, now + 1, &covered).IsOk());
    BOOST_CHECK_EQUAL(covered, 10 * COIN);

    std::vector<DefaultRecord> history = fund.GetDefaultHistory(subject);
    BOOST_REQUIRE_EQUAL(history.size(), 2U);
    BOOST_CHECK_EQUAL(history[0].loanId, 7U);
    BOOST_CHECK_EQUAL(history[0].lossAmount, 1000 * COIN);
    BOOST_CHECK_EQUAL(history[0].coveredAmount, 250 * COIN);
    BOOST_CHECK_EQUAL(history[1].timestamp, now + 1);

    FundStatistics stats = fund.GetStatistics();
    BOOST_CHECK_EQUAL(stats.totalCovered, 260 * COIN);
    BOOST_CHECK_EQUAL(stats.totalDefaults, 2U);
    BOOST_CHECK(fund.GetDefaultHistory(InsecureRand160()).empty());
}

BOOST_AUTO_TEST_CASE(coverage_capped_by_balance)
{
    SeedFund(100 * COIN);
    CAmount covered = 0;
    BOOST_REQUIRE(fund.CoverLoss(poolAccount, InsecureRand160(), 1, 1000000 * COIN, 5000 * COIN, now, &covered).IsOk());
    BOOST_CHECK_EQUAL(covered, 100 * COIN);
    BOOST_CHECK_EQUAL(fund.GetBalance(), 0);

    // An empty fund still records the default
    BOOST_REQUIRE(fund.CoverLoss(poolAccount, InsecureRand160(), 2, 1000 * COIN, 10 * COIN, now, &covered).IsOk());
    BOOST_CHECK_EQUAL(covered, 0);
    BOOST_CHECK_EQUAL(fund.GetStatistics().totalDefaults, 2U);
}

BOOST_AUTO_TEST_CASE(coverage_requires_coverer)
{
    SeedFund(1000 * COIN);
    CAmount covered = 123;
    CreditResult result = fund.CoverLoss(admin, InsecureRand160(), 1, 1000 * COIN, 10 * COIN, now, &covered);
    BOOST_CHECK_EQUAL(result.error, CreditError::UNAUTHORIZED);
    BOOST_CHECK_EQUAL(covered, 0);
    BOOST_CHECK_EQUAL(fund.GetBalance(), 1000 * COIN);

    BOOST_CHECK_EQUAL(fund.CoverLoss(poolAccount, InsecureRand160(), 1, -1, 10 * COIN, now).error,
                      CreditError::INVALID_AMOUNT);
}

BOOST_AUTO_TEST_CASE(revenue_share)
{
    BOOST_REQUIRE(tokens.Mint(usd, poolAccount, 1000 * COIN));

    CAmount allocated = 0;
    BOOST_REQUIRE(fund.AllocateRevenue(poolAccount, 1000 * COIN, &allocated).IsOk());
    BOOST_CHECK_EQUAL(allocated, 50 * COIN);
    BOOST_CHECK_EQUAL(fund.GetBalance(), 50 * COIN);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, poolAccount), 950 * COIN);
    BOOST_CHECK_EQUAL(fund.GetStatistics().totalRevenueAllocated, 50 * COIN);

    BOOST_CHECK_EQUAL(fund.AllocateRevenue(admin, 1000 * COIN).error, CreditError::UNAUTHORIZED);
    BOOST_CHECK_EQUAL(fund.AllocateRevenue(poolAccount, -1).error, CreditError::INVALID_AMOUNT);

    // Dust rounds to nothing and moves no tokens
    BOOST_REQUIRE(fund.AllocateRevenue(poolAccount, 19, &allocated).IsOk());
    BOOST_CHECK_EQUAL(allocated, 0);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, poolAccount), 950 * COIN);
}

BOOST_AUTO_TEST_CASE(emergency_withdrawal)
{
    SeedFund(500 * COIN);
    Principal recipient = InsecureRand160();

    BOOST_CHECK_EQUAL(fund.EmergencyWithdraw(poolAccount, recipient, 100 * COIN).error, CreditError::UNAUTHORIZED);
    BOOST_CHECK_EQUAL(fund.EmergencyWithdraw(admin, recipient, 0).error, CreditError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(fund.EmergencyWithdraw(admin, recipient, 501 * COIN).error, CreditError::INSUFFICIENT_FUNDS);

    BOOST_CHECK(fund.EmergencyWithdraw(admin, recipient, 200 * COIN).IsOk());
    BOOST_CHECK_EQUAL(fund.GetBalance(), 300 * COIN);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, recipient), 200 * COIN);
}

BOOST_AUTO_TEST_CASE(parameters_apply_to_later_payouts)
{
    SeedFund(10000 * COIN);
    FundParams generous;
    generous.maxCoverageBps = 100;
    fund.SetParams(generous);

    CAmount covered = 0;
    BOOST_REQUIRE(fund.CoverLoss(poolAccount, InsecureRand160(), 1, 100000 * COIN, 5000 * COIN, now, &covered).IsOk());
    BOOST_CHECK_EQUAL(covered, 1000 * COIN);
}

BOOST_AUTO_TEST_SUITE_END()
