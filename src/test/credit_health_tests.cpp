// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/health_monitor.h>
#include <test/test_credit.h>

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace credit;

BOOST_FIXTURE_TEST_SUITE(credit_health_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(health_factor_values)
{
    HealthMonitor health{LiquidationParams()};

    // $1000 of collateral, $500 of debt, 6500 bps threshold
    BOOST_CHECK_EQUAL(health.CalculateHealthFactor(1000 * COIN, 500 * COIN, 6500), 13000);
    BOOST_CHECK_EQUAL(health.CalculateHealthFactor(1000 * COIN, 1000 * COIN, 10000), 10000);
    BOOST_CHECK_EQUAL(health.CalculateHealthFactor(600 * COIN, 500 * COIN, 8000), 9600);

    BOOST_CHECK_EQUAL(health.CalculateHealthFactor(1000 * COIN, 0, 5000), HEALTH_FACTOR_INFINITE);
    BOOST_CHECK_EQUAL(health.CalculateHealthFactor(0, 0, 5000), HEALTH_FACTOR_INFINITE);
    BOOST_CHECK_EQUAL(health.CalculateHealthFactor(0, 500 * COIN, 5000), 0);
}

BOOST_AUTO_TEST_CASE(risk_levels)
{
    HealthMonitor health{LiquidationParams()};

    BOOST_CHECK_EQUAL(health.GetRiskLevel(HEALTH_FACTOR_INFINITE), RiskLevel::SAFE);
    BOOST_CHECK_EQUAL(health.GetRiskLevel(12000), RiskLevel::SAFE);
    BOOST_CHECK_EQUAL(health.GetRiskLevel(11999), RiskLevel::WARNING);
    BOOST_CHECK_EQUAL(health.GetRiskLevel(10500), RiskLevel::WARNING);
    BOOST_CHECK_EQUAL(health.GetRiskLevel(10499), RiskLevel::DANGER);
    BOOST_CHECK_EQUAL(health.GetRiskLevel(9501), RiskLevel::DANGER);
    BOOST_CHECK_EQUAL(health.GetRiskLevel(9500), RiskLevel::CRITICAL);
    BOOST_CHECK_EQUAL(health.GetRiskLevel(0), RiskLevel::CRITICAL);
}

BOOST_AUTO_TEST_CASE(liquidation_threshold)
{
    HealthMonitor health{LiquidationParams()};
    BOOST_CHECK_EQUAL(health.GetLiquidationHealthFactor(), 9500);
    BOOST_CHECK(health.IsLiquidatable(9500));
    BOOST_CHECK(health.IsLiquidatable(0));
    BOOST_CHECK(!health.IsLiquidatable(9501));
    BOOST_CHECK(!health.IsLiquidatable(HEALTH_FACTOR_INFINITE));

    LiquidationParams strict;
    strict.liquidationHealthFactorBps = 10000;
    health.SetParams(strict);
    BOOST_CHECK(health.IsLiquidatable(9999));
    BOOST_CHECK(health.IsLiquidatable(10000));
    BOOST_CHECK_EQUAL(health.GetRiskLevel(10000), RiskLevel::CRITICAL);
}

BOOST_AUTO_TEST_CASE(params_swapped_while_read)
{
    HealthMonitor health{LiquidationParams()};
    LiquidationParams loose, strict;
    strict.liquidationHealthFactorBps = 10000;

    std::atomic<bool> done(false);
    std::atomic<int> bad(0);
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!done) {
                int64_t threshold = health.GetLiquidationHealthFactor();
                if (threshold != 9500 && threshold != 10000) bad++;
                // Either table makes 9000 liquidatable and 10500 safe
                if (!health.IsLiquidatable(9000) || health.IsLiquidatable(10500)) bad++;
            }
        });
    }
    for (int i = 0; i < 2000; ++i) {
        health.SetParams(i % 2 ? strict : loose);
    }
    done = true;
    for (std::thread& reader : readers) reader.join();

    BOOST_CHECK_EQUAL(bad.load(), 0);
}

BOOST_AUTO_TEST_CASE(required_collateral)
{
    HealthMonitor health{LiquidationParams()};

    // Already healthy
    BOOST_CHECK_EQUAL(health.RequiredAdditionalCollateral(1000 * COIN, 500 * COIN, 6500, 12000), 0);
    BOOST_CHECK_EQUAL(health.RequiredAdditionalCollateral(1000 * COIN, 0, 6500, 12000), 0);

    // 500 debt at 5000 bps needs 1200 of collateral for a 12000 bps factor
    CAmount topUp = health.RequiredAdditionalCollateral(1000 * COIN, 500 * COIN, 5000, 12000);
    BOOST_CHECK_EQUAL(topUp, 200 * COIN);
    BOOST_CHECK_EQUAL(health.CalculateHealthFactor(1000 * COIN + topUp, 500 * COIN, 5000), 12000);

    // Rounded up so the target is always reached
    topUp = health.RequiredAdditionalCollateral(0, 1, 3000, 10000);
    BOOST_CHECK_EQUAL(topUp, 4);
    BOOST_CHECK(health.CalculateHealthFactor(topUp, 1, 3000) >= 10000);
}

BOOST_AUTO_TEST_SUITE_END()
