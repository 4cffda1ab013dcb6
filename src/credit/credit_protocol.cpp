// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/credit_protocol.h>

#include <hash.h>
#include <util.h>
#include <utilmoneystr.h>
#include <utiltime.h>

#include <cstring>
#include <stdexcept>

namespace credit {

static const CreditParams& CheckedParams(const CreditParams& params)
{
    std::string strError;
    if (!ValidateCreditParams(params, strError)) {
        throw std::runtime_error("Invalid credit parameters: " + strError);
    }
    return params;
}

Principal CreditProtocol::SystemAccount(const std::string& name)
{
    uint256 hash = SHA256Hash(reinterpret_cast<const unsigned char*>(name.data()), name.size());
    Principal account;
    memcpy(account.begin(), hash.begin(), account.size());
    return account;
}

CreditProtocol::CreditProtocol(const CreditParams& params, const Principal& admin, ValueTransfer& tokens,
                               const PriceFeed& prices, const ExternalScoreSource* external,
                               const AssetId& poolAsset, const AssetId& stakeAsset,
                               const uint160& trustedIssuer, LedgerDB* db)
    : params_(CheckedParams(params))
    , poolAccount_(SystemAccount("credit.pool"))
    , fundAccount_(SystemAccount("credit.fund"))
    , auctionAccount_(SystemAccount("credit.auction"))
    , vaultAccount_(SystemAccount("credit.vault"))
    , escrowAccount_(SystemAccount("credit.escrow"))
    , treasuryAccount_(SystemAccount("credit.treasury"))
    , gate_(admin)
    , identity_(gate_, tokens, stakeAsset, vaultAccount_, trustedIssuer, db)
    , ledger_(gate_, db, &identity_)
    , scores_(params_.score, params_.tiers, ledger_, identity_, external)
    , attestations_(gate_, tokens, params_.attestation, stakeAsset, escrowAccount_, treasuryAccount_, db)
    , health_(params_.liquidation)
    , fund_(gate_, tokens, params_.fund, poolAsset, fundAccount_, db)
    , pool_(params_, gate_, ledger_, tokens, prices, fund_, health_, poolAsset, poolAccount_, db)
    , auctioneer_(params_.liquidation, params_.tiers, gate_, pool_, health_, auctionAccount_, db)
{
    GrantOrThrow(admin, Capability::LEDGER_WRITER, poolAccount_);
    GrantOrThrow(admin, Capability::FUND_COVERER, poolAccount_);
    GrantOrThrow(admin, Capability::REVENUE_ALLOCATOR, poolAccount_);
    GrantOrThrow(admin, Capability::LEDGER_WRITER, auctionAccount_);

    LogPrintf("Credit: Protocol ready, admin %s, pool %s, score table v%u, tier table v%u\n",
              admin.GetHex(), poolAccount_.GetHex(), params_.score.version, params_.tiers.version);
}

void CreditProtocol::GrantOrThrow(const Principal& admin, Capability cap, const Principal& principal)
{
    CreditResult result = gate_.Grant(admin, cap, principal);
    if (!result) {
        throw std::runtime_error(strprintf("Could not grant %s: %s", CapabilityToString(cap), result.message));
    }
}

bool CreditProtocol::LoadFromDatabase()
{
    LOCK(cs_protocol_);

    if (!identity_.LoadFromDatabase() || !ledger_.LoadFromDatabase() || !attestations_.LoadFromDatabase() ||
        !fund_.LoadFromDatabase() || !pool_.LoadFromDatabase() || !auctioneer_.LoadFromDatabase()) {
        return false;
    }

    const std::vector<uint64_t> ledgerLoans = ledger_.GetActiveLoanIds(poolAccount_);
    const std::vector<uint64_t> poolLoans = pool_.GetActiveLoanIds();
    if (ledgerLoans != poolLoans) {
        LogPrintf("Credit: Ledger has %u active pool loans but the pool holds %u open positions, refusing to load\n",
                  ledgerLoans.size(), poolLoans.size());
        return false;
    }
    for (uint64_t loanId : poolLoans) {
        std::optional<LoanRecord> loan = ledger_.GetLoan(loanId);
        std::optional<LoanPosition> position = pool_.GetPosition(loanId);
        if (!loan || !position || loan->subject != position->subject ||
            loan->RemainingPrincipal() != position->principal) {
            LogPrintf("Credit: Loan %u differs between ledger and pool, refusing to load\n", loanId);
            return false;
        }
    }

    LogPrintf("Credit: Restored %u loans, %u open\n", ledger_.GetLoanCount(), poolLoans.size());
    return true;
}

// ============================================================================
// Reads
// ============================================================================

ScoreBreakdown CreditProtocol::GetScoreBreakdown(const Subject& subject) const
{
    LOCK(cs_protocol_);
    return scores_.ComputeScore(subject, GetTime());
}

int64_t CreditProtocol::ScoreLocked(const Subject& subject, int64_t now) const
{
    if (attestations_.HasValidScore(subject, params_.attestation.maxScoreAge, now)) {
        std::optional<FinalizedScore> attested = attestations_.GetScore(subject);
        if (attested) {
            return attested->score;
        }
    }
    return scores_.ComputeScore(subject, now).creditScore;
}

int64_t CreditProtocol::GetScore(const Subject& subject) const
{
    LOCK(cs_protocol_);
    return ScoreLocked(subject, GetTime());
}

Tier CreditProtocol::GetTier(const Subject& subject) const
{
    LOCK(cs_protocol_);
    return params_.tiers.GetTier(ScoreLocked(subject, GetTime()));
}

int64_t CreditProtocol::GetAPR(const Subject& subject) const
{
    LOCK(cs_protocol_);
    const Tier tier = params_.tiers.GetTier(ScoreLocked(subject, GetTime()));
    return MulDiv(pool_.GetCurrentRate(), params_.tiers.Get(tier).rateMultiplierBps, BPS_ONE);
}

std::vector<LoanRecord> CreditProtocol::GetLoans(const Subject& subject) const
{
    LOCK(cs_protocol_);
    return ledger_.GetLoansBySubject(subject);
}

CreditResult CreditProtocol::GetHealthFactor(uint64_t loanId, int64_t& healthFactorOut) const
{
    LOCK(cs_protocol_);
    return pool_.CalculateHealthFactor(loanId, GetTime(), healthFactorOut);
}

std::optional<Auction> CreditProtocol::GetAuction(uint64_t auctionId) const
{
    LOCK(cs_protocol_);
    return auctioneer_.GetAuction(auctionId);
}

// ============================================================================
// Writes
// ============================================================================

CreditResult CreditProtocol::Borrow(const Principal& caller, const AssetId& collateralAsset,
                                    CAmount collateralAmount, CAmount principal, uint64_t& loanIdOut)
{
    LOCK(cs_protocol_);

    const int64_t now = GetTime();
    const int64_t score = ScoreLocked(caller, now);

    CreditResult result = pool_.Borrow(caller, collateralAsset, collateralAmount, principal, score, now, loanIdOut);
    if (!result) {
        LogPrint(BCLog::CREDIT, "Credit: Borrow by %s rejected: %s\n", caller.GetHex(), result.message);
    }
    return result;
}

CreditResult CreditProtocol::Repay(const Principal& caller, uint64_t loanId, CAmount amount, CAmount* paidOut)
{
    LOCK(cs_protocol_);
    return pool_.Repay(caller, loanId, amount, GetTime(), paidOut);
}

CreditResult CreditProtocol::StartLiquidation(const Principal& caller, uint64_t loanId, uint64_t& auctionIdOut)
{
    LOCK(cs_protocol_);
    return auctioneer_.StartLiquidation(caller, loanId, GetTime(), auctionIdOut);
}

CreditResult CreditProtocol::ExecuteLiquidation(const Principal& caller, uint64_t auctionId, CAmount* paidOut)
{
    LOCK(cs_protocol_);
    return auctioneer_.ExecuteLiquidation(caller, auctionId, GetTime(), paidOut);
}

CreditResult CreditProtocol::Stake(const Principal& caller, CAmount amount, int64_t lockDuration)
{
    LOCK(cs_protocol_);
    return identity_.Stake(caller, amount, lockDuration, GetTime());
}

CreditResult CreditProtocol::Unstake(const Principal& caller, CAmount amount)
{
    LOCK(cs_protocol_);
    return identity_.Unstake(caller, amount, GetTime());
}

CreditResult CreditProtocol::SubmitIdentityProof(const Principal& caller, const uint256& commitmentHash,
                                                 int64_t expiresAt, const std::vector<unsigned char>& signature)
{
    LOCK(cs_protocol_);
    return identity_.SubmitIdentityProof(caller, commitmentHash, expiresAt, signature, GetTime());
}

CreditResult CreditProtocol::SupplyLiquidity(const Principal& caller, CAmount amount)
{
    LOCK(cs_protocol_);
    return pool_.Deposit(caller, amount);
}

CreditResult CreditProtocol::WithdrawLiquidity(const Principal& caller, CAmount amount)
{
    LOCK(cs_protocol_);
    return pool_.Withdraw(caller, amount);
}

size_t CreditProtocol::ScanLiquidations(const Principal& keeper, std::vector<uint64_t>* startedOut)
{
    LOCK(cs_protocol_);

    const int64_t now = GetTime();
    size_t started = 0;

    for (uint64_t loanId : pool_.GetActiveLoanIds()) {
        int64_t healthFactor = 0;
        CreditResult result = pool_.CalculateHealthFactor(loanId, now, healthFactor);
        if (!result) {
            LogPrint(BCLog::CREDIT, "Credit: Scan skipped loan %u: %s\n", loanId, result.message);
            continue;
        }
        if (!health_.IsLiquidatable(healthFactor)) {
            continue;
        }

        std::optional<uint64_t> existing = auctioneer_.GetAuctionForLoan(loanId);
        if (existing) {
            AuctionState state = auctioneer_.GetAuctionState(*existing, now);
            if (state == AuctionState::GRACE_PENDING || state == AuctionState::AUCTION_OPEN) {
                continue;
            }
        }

        uint64_t auctionId = 0;
        result = auctioneer_.StartLiquidation(keeper, loanId, now, auctionId);
        if (!result) {
            LogPrintf("Credit: Scan could not start liquidation of loan %u: %s\n", loanId, result.message);
            continue;
        }
        ++started;
        if (startedOut) startedOut->push_back(loanId);
    }

    if (started > 0) {
        LogPrintf("Credit: Liquidation scan opened %u auctions\n", started);
    }
    return started;
}

// ============================================================================
// Administration
// ============================================================================

CreditResult CreditProtocol::UpdateParams(const Principal& caller, const CreditParams& params)
{
    LOCK(cs_protocol_);

    CreditResult auth = gate_.Require(Capability::ADMIN, caller);
    if (!auth) return auth;

    std::string strError;
    if (!ValidateCreditParams(params, strError)) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT, strError);
    }

    params_ = params;
    scores_.SetParams(params_.score, params_.tiers);
    attestations_.SetParams(params_.attestation);
    health_.SetParams(params_.liquidation);
    fund_.SetParams(params_.fund);
    pool_.SetParams(params_);
    auctioneer_.SetParams(params_.liquidation, params_.tiers);

    LogPrintf("Credit: Parameters updated by %s (score v%u, tiers v%u, rates v%u)\n",
              caller.GetHex(), params_.score.version, params_.tiers.version, params_.rates.version);
    return CreditResult::Ok();
}

CreditParams CreditProtocol::GetParams() const
{
    LOCK(cs_protocol_);
    CreditParams params = params_;
    // The registry's own governance setters may have moved these since
    params.attestation = attestations_.GetParams();
    return params;
}

} // namespace credit
