// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/credit_config.h>
#include <test/test_credit.h>
#include <util.h>

#include <boost/test/unit_test.hpp>

using namespace credit;

BOOST_FIXTURE_TEST_SUITE(credit_config_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(defaults_without_options)
{
    CreditParams params;
    std::string strError;
    BOOST_REQUIRE_MESSAGE(LoadCreditParams(params, strError), strError);

    const CreditParams defaults;
    BOOST_CHECK(params.score.weights == defaults.score.weights);
    BOOST_CHECK_EQUAL(params.score.version, 1U);
    BOOST_CHECK_EQUAL(params.tiers.version, 1U);
    for (size_t i = 0; i < TIER_COUNT; ++i) {
        BOOST_CHECK_EQUAL(params.tiers.tiers[i].minScore, defaults.tiers.tiers[i].minScore);
        BOOST_CHECK_EQUAL(params.tiers.tiers[i].maxLtvBps, defaults.tiers.tiers[i].maxLtvBps);
        BOOST_CHECK_EQUAL(params.tiers.tiers[i].rateMultiplierBps, defaults.tiers.tiers[i].rateMultiplierBps);
        BOOST_CHECK_EQUAL(params.tiers.tiers[i].gracePeriod, defaults.tiers.tiers[i].gracePeriod);
    }
    BOOST_CHECK_EQUAL(params.rates.baseRateBps, 200);
    BOOST_CHECK_EQUAL(params.lending.protocolFeeBps, 2000);
    BOOST_CHECK_EQUAL(params.lending.maxPriceAge, SECONDS_PER_HOUR);
    BOOST_CHECK_EQUAL(params.liquidation.liquidationHealthFactorBps, 9500);
    BOOST_CHECK_EQUAL(params.fund.maxCoverageBps, 25);
    BOOST_CHECK_EQUAL(params.attestation.challengeBond, defaults.attestation.challengeBond);
    BOOST_CHECK(ValidateCreditParams(defaults, strError));
}

BOOST_AUTO_TEST_CASE(score_weights_override)
{
    gArgs.ForceSetArg("-scoreweights", "30,30,20,10,10");

    CreditParams params;
    std::string strError;
    BOOST_REQUIRE_MESSAGE(LoadCreditParams(params, strError), strError);
    BOOST_CHECK_EQUAL(params.score.weights[0], 30);
    BOOST_CHECK_EQUAL(params.score.weights[1], 30);
    BOOST_CHECK_EQUAL(params.score.version, 2U);
    BOOST_CHECK_EQUAL(params.tiers.version, 1U);
}

BOOST_AUTO_TEST_CASE(tier_overrides_bump_version_once)
{
    gArgs.ForceSetArg("-tierltv", "4000,6000,7500,8500");
    gArgs.ForceSetArg("-tiergrace", "3600,7200,10800,14400");

    CreditParams params;
    std::string strError;
    BOOST_REQUIRE_MESSAGE(LoadCreditParams(params, strError), strError);
    BOOST_CHECK_EQUAL(params.tiers.version, 2U);
    BOOST_CHECK_EQUAL(params.tiers.Get(Tier::BRONZE).maxLtvBps, 4000);
    BOOST_CHECK_EQUAL(params.tiers.Get(Tier::PLATINUM).maxLtvBps, 8500);
    BOOST_CHECK_EQUAL(params.tiers.Get(Tier::GOLD).gracePeriod, 10800);
    // Untouched tables keep their defaults
    BOOST_CHECK_EQUAL(params.tiers.Get(Tier::SILVER).minScore, 600);
    BOOST_CHECK_EQUAL(params.score.version, 1U);
}

BOOST_AUTO_TEST_CASE(scalar_overrides)
{
    gArgs.ForceSetArg("-baserate", "150");
    gArgs.ForceSetArg("-maxpriceage", "600");
    gArgs.ForceSetArg("-maxdiscount", "1500");
    gArgs.ForceSetArg("-revenueshare", "1000");
    gArgs.ForceSetArg("-challengebond", "250");

    CreditParams params;
    std::string strError;
    BOOST_REQUIRE_MESSAGE(LoadCreditParams(params, strError), strError);
    BOOST_CHECK_EQUAL(params.rates.baseRateBps, 150);
    BOOST_CHECK_EQUAL(params.rates.RateAt(0), 150);
    BOOST_CHECK_EQUAL(params.lending.maxPriceAge, 600);
    BOOST_CHECK_EQUAL(params.liquidation.maxDiscountBps, 1500);
    BOOST_CHECK_EQUAL(params.fund.revenueShareBps, 1000);
    BOOST_CHECK_EQUAL(params.attestation.challengeBond, 250 * COIN);
}

BOOST_AUTO_TEST_CASE(malformed_lists_rejected)
{
    CreditParams params;
    std::string strError;

    gArgs.ForceSetArg("-scoreweights", "40,20,20,20");
    BOOST_CHECK(!LoadCreditParams(params, strError));
    BOOST_CHECK(strError.find("-scoreweights") != std::string::npos);

    gArgs.ForceSetArg("-scoreweights", "40,20,x,10,10");
    BOOST_CHECK(!LoadCreditParams(params, strError));

    gArgs.ForceSetArg("-scoreweights", "");
    BOOST_CHECK(!LoadCreditParams(params, strError));

    gArgs.ClearArgs();
    gArgs.ForceSetArg("-tierbounds", "600,740,800,820");
    BOOST_CHECK(!LoadCreditParams(params, strError));
    BOOST_CHECK(strError.find("-tierbounds") != std::string::npos);

    gArgs.ClearArgs();
    gArgs.ForceSetArg("-challengebond", "lots");
    BOOST_CHECK(!LoadCreditParams(params, strError));
}

BOOST_AUTO_TEST_CASE(inconsistent_tables_rejected)
{
    CreditParams params;
    std::string strError;

    // Sums to 110
    gArgs.ForceSetArg("-scoreweights", "50,20,20,10,10");
    BOOST_CHECK(!LoadCreditParams(params, strError));
    BOOST_CHECK(strError.find("sum") != std::string::npos);

    gArgs.ClearArgs();
    gArgs.ForceSetArg("-tierbounds", "740,600,800");
    BOOST_CHECK(!LoadCreditParams(params, strError));

    gArgs.ClearArgs();
    gArgs.ForceSetArg("-tierltv", "5000,7000,8000,10001");
    BOOST_CHECK(!LoadCreditParams(params, strError));

    gArgs.ClearArgs();
    gArgs.ForceSetArg("-tiergrace", "86400,86400,172800,259200");
    BOOST_CHECK(!LoadCreditParams(params, strError));

    gArgs.ClearArgs();
    gArgs.ForceSetArg("-optimalutil", "10000");
    BOOST_CHECK(!LoadCreditParams(params, strError));

    gArgs.ClearArgs();
    gArgs.ForceSetArg("-challengeperiod", "60");
    BOOST_CHECK(!LoadCreditParams(params, strError));
}

BOOST_AUTO_TEST_CASE(command_line_parsing)
{
    const char* argv[] = {"creditd", "-scoreweights=20,20,20,20,20", "-liqhealth=9000"};
    gArgs.ParseParameters(3, argv);

    CreditParams params;
    std::string strError;
    BOOST_REQUIRE_MESSAGE(LoadCreditParams(params, strError), strError);
    BOOST_CHECK_EQUAL(params.score.weights[4], 20);
    BOOST_CHECK_EQUAL(params.liquidation.liquidationHealthFactorBps, 9000);
}

BOOST_AUTO_TEST_CASE(trusted_issuer)
{
    uint160 issuer;
    BOOST_CHECK(!GetTrustedIssuer(issuer));

    gArgs.ForceSetArg("-trustedissuer", "0123456789abcdef0123456789abcdef0123456");
    BOOST_CHECK(!GetTrustedIssuer(issuer));
    gArgs.ForceSetArg("-trustedissuer", "0123456789abcdef0123456789abcdef012345zz");
    BOOST_CHECK(!GetTrustedIssuer(issuer));

    gArgs.ForceSetArg("-trustedissuer", "0123456789abcdef0123456789abcdef01234567");
    BOOST_REQUIRE(GetTrustedIssuer(issuer));
    BOOST_CHECK_EQUAL(issuer.GetHex(), "0123456789abcdef0123456789abcdef01234567");
}

BOOST_AUTO_TEST_SUITE_END()
