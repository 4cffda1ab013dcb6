// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file credit_integration_tests.cpp
 * @brief End-to-end flows through CreditProtocol on a mocked clock
 */

#include <credit/credit_protocol.h>
#include <credit/ledger_db.h>
#include <test/test_credit.h>
#include <utiltime.h>

#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>

#include <memory>
#include <stdexcept>

using namespace credit;

namespace {

struct ProtocolTestingSetup : public BasicTestingSetup {
    Principal admin;
    AssetId usd;
    AssetId eth;
    AssetId stakeToken;
    TokenLedger tokens;
    StaticPriceFeed prices;
    std::unique_ptr<CreditProtocol> protocol;

    ProtocolTestingSetup()
        : admin(InsecureRand160())
        , usd(InsecureRand160())
        , eth(InsecureRand160())
        , stakeToken(InsecureRand160())
    {
        SetMockTime(TEST_GENESIS_TIME);
        protocol.reset(new CreditProtocol(CreditParams(), admin, tokens, prices, nullptr, usd, stakeToken, uint160()));
        SetEthPrice(1000);
    }

    void SetEthPrice(int64_t dollars)
    {
        prices.SetPrice(eth, dollars * COIN, 8, GetTime());
    }

    void Advance(int64_t seconds)
    {
        SetMockTime(GetTime() + seconds);
    }

    /** Fund an account and let the pool pull from it */
    void Fund(const AssetId& asset, const Principal& owner, CAmount amount)
    {
        BOOST_REQUIRE(tokens.Mint(asset, owner, amount));
        BOOST_REQUIRE(tokens.Approve(asset, owner, protocol->PoolAccount(), MAX_MONEY));
    }

    Principal Lender(CAmount amount)
    {
        Principal lender = InsecureRand160();
        Fund(usd, lender, amount);
        BOOST_REQUIRE(protocol->SupplyLiquidity(lender, amount));
        return lender;
    }

    /** Replace the protocol with one backed by db, as a restarted daemon would build it */
    void Restart(LedgerDB& db)
    {
        protocol.reset();
        protocol.reset(new CreditProtocol(CreditParams(), admin, tokens, prices, nullptr, usd, stakeToken,
                                          uint160(), &db));
    }

    uint64_t Borrow(const Subject& subject, CAmount collateral, CAmount principal)
    {
        Fund(eth, subject, collateral);
        BOOST_REQUIRE(tokens.Approve(usd, subject, protocol->PoolAccount(), MAX_MONEY));
        uint64_t loanId = NULL_LOAN_ID;
        CreditResult result = protocol->Borrow(subject, eth, collateral, principal, loanId);
        BOOST_REQUIRE_MESSAGE(result.IsOk(), "Borrow failed: " << result.message);
        return loanId;
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(credit_integration_tests, ProtocolTestingSetup)

BOOST_AUTO_TEST_CASE(system_accounts)
{
    BOOST_CHECK(protocol->PoolAccount() == CreditProtocol::SystemAccount("credit.pool"));
    BOOST_CHECK(protocol->FundAccount() == CreditProtocol::SystemAccount("credit.fund"));
    BOOST_CHECK(protocol->AuctionAccount() == CreditProtocol::SystemAccount("credit.auction"));
    BOOST_CHECK(protocol->VaultAccount() == CreditProtocol::SystemAccount("credit.vault"));
    BOOST_CHECK(protocol->EscrowAccount() == CreditProtocol::SystemAccount("credit.escrow"));
    BOOST_CHECK(protocol->TreasuryAccount() == CreditProtocol::SystemAccount("credit.treasury"));
    BOOST_CHECK(protocol->PoolAccount() != protocol->FundAccount());
    BOOST_CHECK(!protocol->PoolAccount().IsNull());

    const AuthorizationGate& gate = protocol->Gate();
    BOOST_CHECK(gate.IsAllowed(Capability::ADMIN, admin));
    BOOST_CHECK(gate.IsAllowed(Capability::LEDGER_WRITER, protocol->PoolAccount()));
    BOOST_CHECK(gate.IsAllowed(Capability::FUND_COVERER, protocol->PoolAccount()));
    BOOST_CHECK(gate.IsAllowed(Capability::REVENUE_ALLOCATOR, protocol->PoolAccount()));
    BOOST_CHECK(gate.IsAllowed(Capability::LEDGER_WRITER, protocol->AuctionAccount()));
    BOOST_CHECK(!gate.IsAllowed(Capability::LEDGER_WRITER, admin));
}

BOOST_AUTO_TEST_CASE(invalid_params_rejected_at_construction)
{
    CreditParams params;
    params.score.weights[0] = 50;
    std::unique_ptr<CreditProtocol> broken;
    BOOST_CHECK_THROW(broken.reset(new CreditProtocol(params, admin, tokens, prices, nullptr, usd, stakeToken,
                                                      uint160())), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(borrow_and_repay)
{
    Lender(10000 * COIN);
    Subject borrower = InsecureRand160();

    // A subject with no history lands in bronze
    BOOST_CHECK_EQUAL(protocol->GetScore(borrower), 492);
    BOOST_CHECK_EQUAL(protocol->GetTier(borrower), Tier::BRONZE);
    BOOST_CHECK_EQUAL(protocol->GetAPR(borrower), 300);

    Fund(eth, borrower, COIN);
    uint64_t loanId = NULL_LOAN_ID;
    BOOST_CHECK_EQUAL(protocol->Borrow(borrower, eth, COIN, 501 * COIN, loanId).error,
                      CreditError::EXCEEDS_ALLOWED_LTV);
    BOOST_CHECK_EQUAL(protocol->Identity().GetActivity(borrower).firstSeen, 0);

    BOOST_REQUIRE(tokens.Approve(usd, borrower, protocol->PoolAccount(), MAX_MONEY));
    BOOST_REQUIRE(protocol->Borrow(borrower, eth, COIN, 500 * COIN, loanId));
    BOOST_CHECK_EQUAL(protocol->Identity().GetActivity(borrower).firstSeen, TEST_GENESIS_TIME);
    BOOST_REQUIRE_EQUAL(protocol->GetLoans(borrower).size(), 1U);
    BOOST_CHECK_EQUAL(protocol->GetScoreBreakdown(borrower).repayment, 0);

    int64_t healthFactor = 0;
    BOOST_REQUIRE(protocol->GetHealthFactor(loanId, healthFactor));
    BOOST_CHECK_EQUAL(healthFactor, 10000);

    Advance(SECONDS_PER_YEAR);
    Fund(usd, borrower, 15 * COIN);
    CAmount paid = 0;
    BOOST_REQUIRE(protocol->Repay(borrower, loanId, 1000 * COIN, &paid));
    BOOST_CHECK_EQUAL(paid, 515 * COIN);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, borrower), COIN);
    BOOST_CHECK_EQUAL(protocol->GetLoans(borrower)[0].status, LoanStatus::REPAID);
    BOOST_CHECK_EQUAL(protocol->GetScoreBreakdown(borrower).repayment, 100);
    BOOST_CHECK(protocol->GetScore(borrower) > 492);

    // Protocol revenue share landed in the fund
    BOOST_CHECK_EQUAL(protocol->Fund().GetBalance(), 15 * COIN / 100);
}

BOOST_AUTO_TEST_CASE(lender_round_trip)
{
    Principal lender = Lender(1000 * COIN);
    BOOST_CHECK_EQUAL(protocol->WithdrawLiquidity(lender, 1001 * COIN).error, CreditError::INSUFFICIENT_LIQUIDITY);
    BOOST_REQUIRE(protocol->WithdrawLiquidity(lender, 1000 * COIN));
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, lender), 1000 * COIN);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(usd, protocol->PoolAccount()), 0);
}

BOOST_AUTO_TEST_CASE(attested_score_used_while_fresh)
{
    Lender(10000 * COIN);
    Subject borrower = InsecureRand160();
    Principal attester = InsecureRand160();
    BOOST_REQUIRE(protocol->Gate().Grant(admin, Capability::ATTESTER, attester));

    ScoreAttestationRegistry& attestations = protocol->Attestations();
    BOOST_REQUIRE(attestations.AttestScore(attester, borrower, 820, 3, 90, 12000, 90, InsecureRand256(), GetTime()));

    // Pending attestations do not count
    BOOST_CHECK_EQUAL(protocol->GetTier(borrower), Tier::BRONZE);

    Advance(SECONDS_PER_HOUR);
    BOOST_REQUIRE(attestations.FinalizeScore(borrower, 820, 3, 90, 12000, 90, GetTime()));
    BOOST_CHECK_EQUAL(protocol->GetScore(borrower), 820);
    BOOST_CHECK_EQUAL(protocol->GetTier(borrower), Tier::PLATINUM);

    SetEthPrice(1000);
    uint64_t loanId = Borrow(borrower, COIN, 900 * COIN);
    std::optional<LoanPosition> position = protocol->Pool().GetPosition(loanId);
    BOOST_REQUIRE(position);
    BOOST_CHECK_EQUAL(position->tier, Tier::PLATINUM);
    BOOST_CHECK_EQUAL(position->creditScore, 820);

    // Stale attestations fall back to the computed score
    Advance(protocol->GetParams().attestation.maxScoreAge + 1);
    BOOST_CHECK(protocol->GetScore(borrower) != 820);
    BOOST_CHECK_EQUAL(protocol->GetScore(borrower), protocol->GetScoreBreakdown(borrower).creditScore);
}

BOOST_AUTO_TEST_CASE(stake_through_facade)
{
    Subject staker = InsecureRand160();
    BOOST_REQUIRE(tokens.Mint(stakeToken, staker, 100 * COIN));
    BOOST_REQUIRE(tokens.Approve(stakeToken, staker, protocol->VaultAccount(), 100 * COIN));

    BOOST_REQUIRE(protocol->Stake(staker, 100 * COIN, 30 * SECONDS_PER_DAY));
    BOOST_CHECK_EQUAL(tokens.BalanceOf(stakeToken, protocol->VaultAccount()), 100 * COIN);
    BOOST_CHECK_EQUAL(protocol->Unstake(staker, 10 * COIN).error, CreditError::LOCK_ACTIVE);

    Advance(30 * SECONDS_PER_DAY);
    BOOST_REQUIRE(protocol->Unstake(staker, 10 * COIN));
    BOOST_CHECK_EQUAL(protocol->Identity().GetStake(staker).amount, 90 * COIN);

    // Without a configured issuer no proof is accepted
    BOOST_CHECK_EQUAL(protocol->SubmitIdentityProof(staker, InsecureRand256(), GetTime() + 100,
                                                    std::vector<unsigned char>(65, 1)).error,
                      CreditError::INVALID_PROOF);
}

BOOST_AUTO_TEST_CASE(update_params)
{
    Principal outsider = InsecureRand160();
    CreditParams params = protocol->GetParams();
    params.liquidation.liquidationHealthFactorBps = 10000;
    params.liquidation.version++;

    BOOST_CHECK_EQUAL(protocol->UpdateParams(outsider, params).error, CreditError::UNAUTHORIZED);

    CreditParams invalid = params;
    invalid.rates.optimalUtilizationBps = 0;
    BOOST_CHECK_EQUAL(protocol->UpdateParams(admin, invalid).error, CreditError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(protocol->Health().GetLiquidationHealthFactor(), 9500);

    BOOST_REQUIRE(protocol->UpdateParams(admin, params));
    BOOST_CHECK_EQUAL(protocol->Health().GetLiquidationHealthFactor(), 10000);
    BOOST_CHECK_EQUAL(protocol->GetParams().liquidation.version, 2U);

    // A position at exactly 1.0 is now liquidatable
    Lender(10000 * COIN);
    uint64_t loanId = Borrow(InsecureRand160(), COIN, 500 * COIN);
    uint64_t auctionId = 0;
    BOOST_CHECK(protocol->StartLiquidation(outsider, loanId, auctionId));

    // Attestation windows follow the installed table
    Principal attester = InsecureRand160();
    BOOST_REQUIRE(protocol->Gate().Grant(admin, Capability::ATTESTER, attester));
    Subject subject = InsecureRand160();
    ScoreAttestationRegistry& attestations = protocol->Attestations();
    BOOST_REQUIRE(attestations.AttestScore(attester, subject, 700, 2, 80, 11000, 90, InsecureRand256(), GetTime()));

    CreditParams shorter = protocol->GetParams();
    shorter.attestation.challengePeriod = 600;
    shorter.attestation.version++;
    BOOST_REQUIRE(protocol->UpdateParams(admin, shorter));
    BOOST_CHECK_EQUAL(attestations.GetParams().challengePeriod, 600);
    BOOST_CHECK_EQUAL(protocol->GetParams().attestation.challengePeriod, 600);

    BOOST_CHECK_EQUAL(attestations.ChallengeScore(outsider, subject, "late", 500 * COIN, GetTime() + 700).error,
                      CreditError::CHALLENGE_PERIOD_NOT_EXPIRED);
    BOOST_CHECK(attestations.FinalizeScore(subject, 700, 2, 80, 11000, 90, GetTime() + 700));
}

BOOST_AUTO_TEST_CASE(liquidation_end_to_end)
{
    Lender(10000 * COIN);
    BOOST_REQUIRE(tokens.Mint(usd, admin, 1000 * COIN));
    BOOST_REQUIRE(tokens.Approve(usd, admin, protocol->FundAccount(), 1000 * COIN));
    BOOST_REQUIRE(protocol->Fund().Deposit(admin, 1000 * COIN));

    Subject borrower = InsecureRand160();
    uint64_t loanId = Borrow(borrower, COIN, 500 * COIN);

    Principal keeper = InsecureRand160();
    uint64_t auctionId = 0;
    BOOST_CHECK_EQUAL(protocol->StartLiquidation(keeper, loanId, auctionId).error, CreditError::NOT_LIQUIDATABLE);

    SetEthPrice(800);
    int64_t healthFactor = 0;
    BOOST_REQUIRE(protocol->GetHealthFactor(loanId, healthFactor));
    BOOST_CHECK_EQUAL(healthFactor, 8000);
    BOOST_CHECK_EQUAL(protocol->Health().GetRiskLevel(healthFactor), RiskLevel::CRITICAL);

    BOOST_REQUIRE(protocol->StartLiquidation(keeper, loanId, auctionId));
    std::optional<Auction> auction = protocol->GetAuction(auctionId);
    BOOST_REQUIRE(auction);

    Fund(usd, keeper, 1000 * COIN);
    BOOST_CHECK_EQUAL(protocol->ExecuteLiquidation(keeper, auctionId).error, CreditError::GRACE_PERIOD_ACTIVE);

    Advance(auction->graceEnd - GetTime());
    SetEthPrice(800);
    CAmount paid = 0;
    BOOST_REQUIRE(protocol->ExecuteLiquidation(keeper, auctionId, &paid));
    BOOST_CHECK(paid > 500 * COIN);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, keeper), COIN);
    BOOST_CHECK_EQUAL(protocol->GetAuction(auctionId)->state, AuctionState::EXECUTED);

    BOOST_CHECK_EQUAL(protocol->GetLoans(borrower)[0].status, LoanStatus::LIQUIDATED);
    BOOST_CHECK_EQUAL(protocol->GetScoreBreakdown(borrower).repayment, 0);
    // Debt was fully recovered so the fund paid nothing
    BOOST_CHECK_EQUAL(protocol->Fund().GetBalance(), 1000 * COIN);
}

BOOST_AUTO_TEST_CASE(scan_opens_auctions_for_unhealthy_loans)
{
    Lender(10000 * COIN);
    uint64_t risky = Borrow(InsecureRand160(), COIN, 500 * COIN);
    uint64_t safe = Borrow(InsecureRand160(), COIN, 300 * COIN);
    const Principal keeper = CreditProtocol::SystemAccount("credit.keeper");

    std::vector<uint64_t> started;
    BOOST_CHECK_EQUAL(protocol->ScanLiquidations(keeper, &started), 0U);
    BOOST_CHECK(started.empty());

    SetEthPrice(800);
    BOOST_CHECK_EQUAL(protocol->ScanLiquidations(keeper, &started), 1U);
    BOOST_REQUIRE_EQUAL(started.size(), 1U);
    BOOST_CHECK_EQUAL(started[0], risky);
    BOOST_REQUIRE(protocol->Auctioneer().GetAuctionForLoan(risky));
    BOOST_CHECK(!protocol->Auctioneer().GetAuctionForLoan(safe));

    // A live auction is not opened twice
    BOOST_CHECK_EQUAL(protocol->ScanLiquidations(keeper), 0U);

    // Loans without a fresh price are skipped
    Advance(2 * SECONDS_PER_HOUR);
    BOOST_CHECK_EQUAL(protocol->ScanLiquidations(keeper), 0U);
}

BOOST_AUTO_TEST_CASE(state_survives_restart)
{
    boost::filesystem::path testDir = boost::filesystem::temp_directory_path() /
                                      boost::filesystem::unique_path("credit_restart_test_%%%%-%%%%");
    boost::filesystem::create_directories(testDir);
    LedgerDB db;
    BOOST_REQUIRE(db.Initialize(testDir.string()));
    Restart(db);
    BOOST_REQUIRE(protocol->LoadFromDatabase());

    Principal lender = Lender(10000 * COIN);
    BOOST_REQUIRE(tokens.Mint(usd, admin, 1000 * COIN));
    BOOST_REQUIRE(tokens.Approve(usd, admin, protocol->FundAccount(), 1000 * COIN));
    BOOST_REQUIRE(protocol->Fund().Deposit(admin, 1000 * COIN));

    Subject borrower = InsecureRand160();
    uint64_t loanId = Borrow(borrower, COIN, 400 * COIN);
    Subject risky = InsecureRand160();
    uint64_t riskyLoan = Borrow(risky, COIN, 500 * COIN);

    SetEthPrice(800);
    uint64_t auctionId = 0;
    BOOST_REQUIRE(protocol->StartLiquidation(admin, riskyLoan, auctionId));
    const int64_t graceEnd = protocol->GetAuction(auctionId)->graceEnd;

    Principal attester = InsecureRand160();
    BOOST_REQUIRE(protocol->Gate().Grant(admin, Capability::ATTESTER, attester));
    Subject attested = InsecureRand160();
    BOOST_REQUIRE(protocol->Attestations().AttestScore(attester, attested, 700, 2, 80, 11000, 90,
                                                       InsecureRand256(), GetTime()));

    Restart(db);
    BOOST_REQUIRE(protocol->LoadFromDatabase());

    LendingPool& pool = protocol->Pool();
    BOOST_CHECK_EQUAL(pool.GetLenderBalance(lender), 10000 * COIN);
    BOOST_CHECK_EQUAL(pool.GetAvailableLiquidity(), 9100 * COIN);
    BOOST_CHECK_EQUAL(pool.GetTotalBorrows(), 900 * COIN);
    BOOST_REQUIRE(pool.GetPosition(loanId));
    BOOST_CHECK(pool.GetPosition(loanId)->subject == borrower);
    BOOST_CHECK_EQUAL(pool.GetPosition(loanId)->principal, 400 * COIN);
    BOOST_CHECK_EQUAL(pool.GetPosition(loanId)->collateralAmount, COIN);
    BOOST_CHECK_EQUAL(protocol->Fund().GetBalance(), 1000 * COIN);
    BOOST_CHECK_EQUAL(protocol->Identity().GetActivity(borrower).firstSeen, TEST_GENESIS_TIME);

    std::optional<Auction> auction = protocol->GetAuction(auctionId);
    BOOST_REQUIRE(auction);
    BOOST_CHECK_EQUAL(auction->loanId, riskyLoan);
    BOOST_CHECK_EQUAL(auction->graceEnd, graceEnd);
    BOOST_CHECK_EQUAL(protocol->Auctioneer().GetAuctionState(auctionId, GetTime()), AuctionState::GRACE_PENDING);
    BOOST_CHECK_EQUAL(*protocol->Auctioneer().GetAuctionForLoan(riskyLoan), auctionId);
    BOOST_CHECK(protocol->Attestations().GetAttestation(attested));

    // The restored pool can close the loan it opened before the restart
    SetEthPrice(1000);
    CAmount paid = 0;
    BOOST_REQUIRE(protocol->Repay(borrower, loanId, 400 * COIN, &paid));
    BOOST_CHECK_EQUAL(paid, 400 * COIN);
    BOOST_CHECK(!pool.GetPosition(loanId)->active);
    BOOST_CHECK_EQUAL(protocol->GetLoans(borrower)[0].status, LoanStatus::REPAID);
    BOOST_CHECK_EQUAL(tokens.BalanceOf(eth, borrower), COIN);

    // A new auction id continues after the restored one
    uint64_t next = 0;
    BOOST_REQUIRE(protocol->Auctioneer().CancelAuction(admin, auctionId, "restart"));
    SetEthPrice(800);
    BOOST_REQUIRE(protocol->StartLiquidation(admin, riskyLoan, next));
    BOOST_CHECK_EQUAL(next, auctionId + 1);

    Restart(db);
    BOOST_REQUIRE(protocol->LoadFromDatabase());
    BOOST_CHECK(!protocol->Pool().GetPosition(loanId)->active);
    BOOST_CHECK_EQUAL(protocol->Pool().GetTotalBorrows(), 500 * COIN);
    BOOST_CHECK_EQUAL(protocol->Auctioneer().GetAuctionState(auctionId, GetTime()), AuctionState::CANCELLED);

    protocol.reset();
    db.Shutdown();
    boost::filesystem::remove_all(testDir);
}

BOOST_AUTO_TEST_CASE(load_refuses_pool_ledger_mismatch)
{
    boost::filesystem::path testDir = boost::filesystem::temp_directory_path() /
                                      boost::filesystem::unique_path("credit_mismatch_test_%%%%-%%%%");
    boost::filesystem::create_directories(testDir);
    LedgerDB db;
    BOOST_REQUIRE(db.Initialize(testDir.string()));

    // A pool position the ledger never recorded
    LoanPosition orphan;
    orphan.loanId = 7;
    orphan.subject = InsecureRand160();
    orphan.collateralAsset = eth;
    orphan.collateralAmount = COIN;
    orphan.originalPrincipal = 100 * COIN;
    orphan.principal = 100 * COIN;
    orphan.active = true;
    PoolTransition transition;
    transition.position = orphan;
    transition.totals.totalBorrows = 100 * COIN;
    BOOST_REQUIRE(db.ApplyPoolTransition(transition));

    Restart(db);
    BOOST_CHECK(!protocol->LoadFromDatabase());

    protocol.reset();
    db.Shutdown();
    boost::filesystem::remove_all(testDir);
}

BOOST_AUTO_TEST_SUITE_END()
