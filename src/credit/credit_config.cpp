// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/credit_config.h>

#include <util.h>
#include <utilmoneystr.h>
#include <utilstrencodings.h>

namespace credit {

std::string GetCreditHelpMessage()
{
    const CreditParams defaults;
    std::string strUsage;

    strUsage += HelpMessageGroup(_("Credit ledger options:"));
    strUsage += HelpMessageOpt("-datadir=<dir>", _("Directory holding the ledger database"));
    strUsage += HelpMessageOpt("-persistledger", strprintf(_("Write ledger transitions to SQLite (default: %u)"), DEFAULT_PERSIST_LEDGER));
    strUsage += HelpMessageOpt("-trustedissuer=<keyid>", _("Key id (hex) of the identity verification issuer"));
    strUsage += HelpMessageOpt("-keeperinterval=<n>", strprintf(_("Seconds between liquidation scans, 0 to disable (default: %d)"), DEFAULT_KEEPER_INTERVAL));

    strUsage += HelpMessageGroup(_("Scoring options:"));
    strUsage += HelpMessageOpt("-scoreweights=<w1,..,w5>", strprintf(_("Weights of the five score factors, summing to 100 (default: %s)"), DEFAULT_SCORE_WEIGHTS));
    strUsage += HelpMessageOpt("-tierbounds=<s,g,p>", strprintf(_("Minimum credit score for Silver, Gold and Platinum (default: %s)"), DEFAULT_TIER_BOUNDS));
    strUsage += HelpMessageOpt("-tierltv=<b,s,g,p>", strprintf(_("Maximum LTV per tier in basis points (default: %s)"), DEFAULT_TIER_LTV));
    strUsage += HelpMessageOpt("-tiermultiplier=<b,s,g,p>", strprintf(_("Interest rate multiplier per tier in basis points (default: %s)"), DEFAULT_TIER_MULTIPLIER));
    strUsage += HelpMessageOpt("-tiergrace=<b,s,g,p>", strprintf(_("Liquidation grace period per tier in seconds (default: %s)"), DEFAULT_TIER_GRACE));
    strUsage += HelpMessageOpt("-maxscoreage=<n>", strprintf(_("Maximum age in seconds of an attested score used for borrowing (default: %d)"), defaults.attestation.maxScoreAge));

    strUsage += HelpMessageGroup(_("Lending options:"));
    strUsage += HelpMessageOpt("-baserate=<bps>", strprintf(_("Base annual interest rate (default: %d)"), defaults.rates.baseRateBps));
    strUsage += HelpMessageOpt("-optimalutil=<bps>", strprintf(_("Utilization at the curve kink (default: %d)"), defaults.rates.optimalUtilizationBps));
    strUsage += HelpMessageOpt("-slope1=<bps>", strprintf(_("Rate increase up to the kink (default: %d)"), defaults.rates.slope1Bps));
    strUsage += HelpMessageOpt("-slope2=<bps>", strprintf(_("Rate increase above the kink (default: %d)"), defaults.rates.slope2Bps));
    strUsage += HelpMessageOpt("-protocolfee=<bps>", strprintf(_("Share of interest taken as protocol revenue (default: %d)"), defaults.lending.protocolFeeBps));
    strUsage += HelpMessageOpt("-maxpriceage=<n>", strprintf(_("Reject prices older than this many seconds (default: %d)"), defaults.lending.maxPriceAge));

    strUsage += HelpMessageGroup(_("Liquidation and fund options:"));
    strUsage += HelpMessageOpt("-liqhealth=<bps>", strprintf(_("Health factor at or below which positions are liquidatable (default: %d)"), defaults.liquidation.liquidationHealthFactorBps));
    strUsage += HelpMessageOpt("-auctionduration=<n>", strprintf(_("Discount window length in seconds (default: %d)"), defaults.liquidation.auctionDuration));
    strUsage += HelpMessageOpt("-maxdiscount=<bps>", strprintf(_("Maximum auction discount (default: %d)"), defaults.liquidation.maxDiscountBps));
    strUsage += HelpMessageOpt("-maxcoverage=<bps>", strprintf(_("Maximum fund payout as share of principal (default: %d)"), defaults.fund.maxCoverageBps));
    strUsage += HelpMessageOpt("-revenueshare=<bps>", strprintf(_("Share of protocol revenue allocated to the fund (default: %d)"), defaults.fund.revenueShareBps));
    strUsage += HelpMessageOpt("-challengeperiod=<n>", strprintf(_("Score attestation challenge window in seconds (default: %d)"), defaults.attestation.challengePeriod));
    strUsage += HelpMessageOpt("-challengebond=<amt>", strprintf(_("Bond required to challenge an attestation (default: %s)"), FormatMoney(defaults.attestation.challengeBond)));

    return strUsage;
}

static bool ReadList(const std::string& strArg, const std::string& strDefault, size_t expected,
                     std::vector<int64_t>& out, std::string& strError)
{
    std::string value = gArgs.GetArg(strArg, strDefault);
    if (!ParseInt64List(value, out) || out.size() != expected) {
        strError = strprintf("Invalid %s value '%s': expected %u comma separated integers", strArg, value, expected);
        return false;
    }
    return true;
}

bool LoadCreditParams(CreditParams& params, std::string& strError)
{
    params = CreditParams();

    std::vector<int64_t> values;
    if (!ReadList("-scoreweights", DEFAULT_SCORE_WEIGHTS, 5, values, strError)) return false;
    for (size_t i = 0; i < 5; ++i) params.score.weights[i] = values[i];

    if (!ReadList("-tierbounds", DEFAULT_TIER_BOUNDS, TIER_COUNT - 1, values, strError)) return false;
    for (size_t i = 1; i < TIER_COUNT; ++i) params.tiers.tiers[i].minScore = values[i - 1];

    if (!ReadList("-tierltv", DEFAULT_TIER_LTV, TIER_COUNT, values, strError)) return false;
    for (size_t i = 0; i < TIER_COUNT; ++i) params.tiers.tiers[i].maxLtvBps = values[i];

    if (!ReadList("-tiermultiplier", DEFAULT_TIER_MULTIPLIER, TIER_COUNT, values, strError)) return false;
    for (size_t i = 0; i < TIER_COUNT; ++i) params.tiers.tiers[i].rateMultiplierBps = values[i];

    if (!ReadList("-tiergrace", DEFAULT_TIER_GRACE, TIER_COUNT, values, strError)) return false;
    for (size_t i = 0; i < TIER_COUNT; ++i) params.tiers.tiers[i].gracePeriod = values[i];

    params.rates.baseRateBps = gArgs.GetArg("-baserate", params.rates.baseRateBps);
    params.rates.optimalUtilizationBps = gArgs.GetArg("-optimalutil", params.rates.optimalUtilizationBps);
    params.rates.slope1Bps = gArgs.GetArg("-slope1", params.rates.slope1Bps);
    params.rates.slope2Bps = gArgs.GetArg("-slope2", params.rates.slope2Bps);

    params.lending.protocolFeeBps = gArgs.GetArg("-protocolfee", params.lending.protocolFeeBps);
    params.lending.maxPriceAge = gArgs.GetArg("-maxpriceage", params.lending.maxPriceAge);

    params.liquidation.liquidationHealthFactorBps = gArgs.GetArg("-liqhealth", params.liquidation.liquidationHealthFactorBps);
    params.liquidation.auctionDuration = gArgs.GetArg("-auctionduration", params.liquidation.auctionDuration);
    params.liquidation.maxDiscountBps = gArgs.GetArg("-maxdiscount", params.liquidation.maxDiscountBps);

    params.fund.maxCoverageBps = gArgs.GetArg("-maxcoverage", params.fund.maxCoverageBps);
    params.fund.revenueShareBps = gArgs.GetArg("-revenueshare", params.fund.revenueShareBps);

    params.attestation.challengePeriod = gArgs.GetArg("-challengeperiod", params.attestation.challengePeriod);
    params.attestation.maxScoreAge = gArgs.GetArg("-maxscoreage", params.attestation.maxScoreAge);
    if (gArgs.IsArgSet("-challengebond")) {
        CAmount bond;
        if (!ParseMoney(gArgs.GetArg("-challengebond", ""), bond)) {
            strError = strprintf("Invalid -challengebond value '%s'", gArgs.GetArg("-challengebond", ""));
            return false;
        }
        params.attestation.challengeBond = bond;
    }

    // A tuned table is a new version of that table
    if (gArgs.IsArgSet("-scoreweights")) params.score.version++;
    for (const char* arg : {"-tierbounds", "-tierltv", "-tiermultiplier", "-tiergrace"}) {
        if (gArgs.IsArgSet(arg)) {
            params.tiers.version++;
            break;
        }
    }

    if (!ValidateCreditParams(params, strError)) {
        return false;
    }

    LogPrintf("Credit: Parameters loaded - weights=%d/%d/%d/%d/%d, tiers=%d/%d/%d, curve=%d+%d/%d@%d\n",
              params.score.weights[0], params.score.weights[1], params.score.weights[2],
              params.score.weights[3], params.score.weights[4],
              params.tiers.tiers[1].minScore, params.tiers.tiers[2].minScore, params.tiers.tiers[3].minScore,
              params.rates.baseRateBps, params.rates.slope1Bps, params.rates.slope2Bps,
              params.rates.optimalUtilizationBps);
    return true;
}

bool GetTrustedIssuer(uint160& issuer)
{
    std::string value = gArgs.GetArg("-trustedissuer", "");
    if (value.size() != 40 || !IsHex(value)) {
        return false;
    }
    issuer.SetHex(value);
    return true;
}

} // namespace credit
