// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#define BOOST_TEST_MODULE CreditCore Test Suite

#include <test/test_credit.h>

#include <credit/credit_protocol.h>
#include <key.h>
#include <util.h>
#include <utiltime.h>

#include <algorithm>
#include <stdexcept>

#include <boost/test/unit_test.hpp>

FastRandomContext insecure_rand_ctx(true);

BasicTestingSetup::BasicTestingSetup()
{
    ECC_Start();
    fPrintToDebugLog = false;
    fPrintToConsole = false;
    gArgs.ClearArgs();
    SetMockTime(0);
}

BasicTestingSetup::~BasicTestingSetup()
{
    SetMockTime(0);
    gArgs.ClearArgs();
    ECC_Stop();
}

using namespace credit;

CreditTestingSetup::CreditTestingSetup()
    : admin(InsecureRand160())
    , poolAccount(CreditProtocol::SystemAccount("credit.pool"))
    , fundAccount(CreditProtocol::SystemAccount("credit.fund"))
    , auctionAccount(CreditProtocol::SystemAccount("credit.auction"))
    , vaultAccount(CreditProtocol::SystemAccount("credit.vault"))
    , usd(InsecureRand160())
    , eth(InsecureRand160())
    , stakeToken(InsecureRand160())
    , gate(admin)
    , transfers(tokens)
    , identity(gate, transfers, stakeToken, vaultAccount, uint160())
    , ledger(gate, nullptr, &identity)
    , scores(params.score, params.tiers, ledger, identity, &external)
    , health(params.liquidation)
    , fund(gate, transfers, params.fund, usd, fundAccount)
    , pool(params, gate, ledger, transfers, prices, fund, health, usd, poolAccount)
    , auctioneer(params.liquidation, params.tiers, gate, pool, health, auctionAccount)
    , now(TEST_GENESIS_TIME)
{
    const struct {
        Capability cap;
        Principal principal;
    } grants[] = {
        {Capability::LEDGER_WRITER, poolAccount},
        {Capability::FUND_COVERER, poolAccount},
        {Capability::REVENUE_ALLOCATOR, poolAccount},
        {Capability::LEDGER_WRITER, auctionAccount},
    };
    for (const auto& grant : grants) {
        if (!gate.Grant(admin, grant.cap, grant.principal)) {
            throw std::runtime_error("test setup could not grant " + CapabilityToString(grant.cap));
        }
    }
    SetEthPrice(1000);
}

void CreditTestingSetup::Give(const AssetId& asset, const Principal& owner, CAmount amount,
                              const Principal& spender)
{
    BOOST_REQUIRE(tokens.Mint(asset, owner, amount));
    CAmount allowance = std::min(MAX_MONEY, tokens.Allowance(asset, owner, spender) + amount);
    BOOST_REQUIRE(tokens.Approve(asset, owner, spender, allowance));
}

Principal CreditTestingSetup::SupplyLiquidity(CAmount amount)
{
    Principal lender = InsecureRand160();
    Give(usd, lender, amount, poolAccount);
    BOOST_REQUIRE(pool.Deposit(lender, amount));
    return lender;
}

void CreditTestingSetup::SeedFund(CAmount amount)
{
    Principal depositor = InsecureRand160();
    Give(usd, depositor, amount, fundAccount);
    BOOST_REQUIRE(fund.Deposit(depositor, amount));
}

void CreditTestingSetup::SetEthPrice(int64_t dollars)
{
    prices.SetPrice(eth, dollars * COIN, 8, now);
}

uint64_t CreditTestingSetup::OpenLoan(const Subject& subject, CAmount collateral, CAmount principal,
                                      int64_t creditScore)
{
    Give(eth, subject, collateral, poolAccount);
    // Borrowers repay through the pool account as well
    BOOST_REQUIRE(tokens.Approve(usd, subject, poolAccount, MAX_MONEY));

    uint64_t loanId = NULL_LOAN_ID;
    CreditResult result = pool.Borrow(subject, eth, collateral, principal, creditScore, now, loanId);
    BOOST_REQUIRE_MESSAGE(result.IsOk(), "Borrow failed: " << result.message);
    return loanId;
}
