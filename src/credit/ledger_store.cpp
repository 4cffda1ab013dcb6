// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/ledger_store.h>

#include <credit/identity_registry.h>
#include <credit/ledger_db.h>
#include <util.h>
#include <utilmoneystr.h>

#include <algorithm>

namespace credit {

LedgerStore::LedgerStore(const AuthorizationGate& gate, LedgerDB* db, IdentityRegistry* identity)
    : gate_(gate)
    , db_(db)
    , identity_(identity)
    , nextLoanId_(1)
{
}

bool LedgerStore::LoadFromDatabase()
{
    LOCK(cs_ledger_);

    if (db_ == nullptr || !db_->IsInitialized()) {
        return false;
    }

    std::map<uint64_t, LoanRecord> loans;
    std::map<uint64_t, CollateralRecord> collateral;
    std::map<Subject, AggregateCounters> aggregates;
    std::map<Subject, std::set<AssetId>> subjectAssets;
    uint64_t nextLoanId = 1;

    if (!db_->LoadLedger(loans, collateral, aggregates, subjectAssets, nextLoanId)) {
        LogPrintf("Ledger: Failed to load ledger from database\n");
        return false;
    }

    for (const auto& entry : aggregates) {
        if (!entry.second.IsConsistent()) {
            LogPrintf("Ledger: Stored counters for %s violate total = repaid + liquidated + active\n",
                      entry.first.GetHex());
            return false;
        }
    }

    loans_ = std::move(loans);
    collateral_ = std::move(collateral);
    aggregates_ = std::move(aggregates);
    subjectAssets_ = std::move(subjectAssets);
    nextLoanId_ = nextLoanId;

    // std::map iterates in id order, so each index comes out sorted
    subjectLoans_.clear();
    for (const auto& entry : loans_) {
        subjectLoans_[entry.second.subject].push_back(entry.first);
    }

    LogPrintf("Ledger: Loaded %u loans for %u subjects, next loan id %u\n",
              loans_.size(), aggregates_.size(), nextLoanId_);
    return true;
}

CreditResult LedgerStore::CheckWriter(const Principal& caller) const
{
    return gate_.Require(Capability::LEDGER_WRITER, caller);
}

CreditResult LedgerStore::CheckNewLoan(const Subject& subject, CAmount principal) const
{
    if (subject.IsNull()) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT, "Loan subject must not be null");
    }
    if (principal <= 0 || !MoneyRange(principal)) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT,
            strprintf("Principal %s out of range", FormatMoney(principal)));
    }
    return CreditResult::Ok();
}

CreditResult LedgerStore::CheckCollateral(const CollateralRecord& record) const
{
    if (record.collateralValue < 0 || !MoneyRange(record.collateralValue)) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT, "Collateral value out of range");
    }
    if (record.maxLtvBps <= 0 || record.maxLtvBps > BPS_ONE) {
        return CreditResult::Fail(CreditError::INVALID_LTV,
            strprintf("Max LTV %d bps out of range", record.maxLtvBps));
    }
    return CreditResult::Ok();
}

void LedgerStore::BuildLoanTransition(const Subject& subject, CAmount principal, const Principal& counterparty,
                                      int64_t now, LedgerTransition& transition) const
{
    LoanRecord loan;
    loan.id = nextLoanId_;
    loan.subject = subject;
    loan.principal = principal;
    loan.repaidSoFar = 0;
    loan.openedAt = now;
    loan.status = LoanStatus::ACTIVE;
    loan.counterparty = counterparty;
    transition.loan = loan;

    transition.subject = subject;
    transition.counters = GetAggregates(subject);
    transition.counters.totalLoans++;
    transition.counters.activeLoans++;
    transition.counters.totalBorrowedValue += principal;
    transition.nextLoanId = nextLoanId_ + 1;

    if (identity_ != nullptr && identity_->GetActivity(subject).firstSeen == 0) {
        transition.firstSeen = now;
    }
}

void LedgerStore::AddCollateral(const LoanRecord& loan, const CollateralRecord& record,
                                LedgerTransition& transition) const
{
    transition.collateral = record;
    transition.collateral->loanId = loan.id;
    transition.counters.totalCollateralValue += record.collateralValue;

    // principal / collateral >= maxLTV, compared without division
    __int128 lhs = static_cast<__int128>(loan.principal) * BPS_ONE;
    __int128 rhs = static_cast<__int128>(record.collateralValue) * record.maxLtvBps;
    if (lhs >= rhs) {
        transition.counters.maxLtvBorrowCount++;
    }

    auto assets = subjectAssets_.find(loan.subject);
    if (assets == subjectAssets_.end() || assets->second.count(record.asset) == 0) {
        transition.counters.uniqueCollateralAssets++;
        transition.newAsset = record.asset;
    }
}

CreditResult LedgerStore::RegisterLoan(const Principal& caller, const Subject& subject, CAmount principal,
                                       const Principal& counterparty, int64_t now, uint64_t& loanIdOut)
{
    LOCK(cs_ledger_);

    CreditResult result = CheckWriter(caller);
    if (!result) return result;
    result = CheckNewLoan(subject, principal);
    if (!result) return result;

    LedgerTransition transition;
    BuildLoanTransition(subject, principal, counterparty, now, transition);

    result = Commit(transition);
    if (!result) return result;

    loanIdOut = transition.loan->id;
    LogPrint(BCLog::LEDGER, "Ledger: Registered loan %u for %s, principal=%s\n",
             loanIdOut, subject.GetHex(), FormatMoney(principal));
    return CreditResult::Ok();
}

CreditResult LedgerStore::RegisterCollateralizedLoan(const Principal& caller, const Subject& subject,
                                                     CAmount principal, const Principal& counterparty,
                                                     int64_t now, const CollateralRecord& record,
                                                     uint64_t& loanIdOut, const PoolTransition* pool)
{
    LOCK(cs_ledger_);

    CreditResult result = CheckWriter(caller);
    if (!result) return result;
    result = CheckNewLoan(subject, principal);
    if (!result) return result;
    result = CheckCollateral(record);
    if (!result) return result;

    LedgerTransition transition;
    BuildLoanTransition(subject, principal, counterparty, now, transition);
    AddCollateral(*transition.loan, record, transition);
    if (pool) {
        transition.pool = *pool;
        if (transition.pool->position) {
            transition.pool->position->loanId = transition.loan->id;
        }
    }

    result = Commit(transition);
    if (!result) return result;

    loanIdOut = transition.loan->id;
    LogPrint(BCLog::LEDGER, "Ledger: Registered loan %u for %s, principal=%s collateral=%s\n",
             loanIdOut, subject.GetHex(), FormatMoney(principal), FormatMoney(record.collateralValue));
    return CreditResult::Ok();
}

CreditResult LedgerStore::RegisterRepayment(const Principal& caller, uint64_t loanId, CAmount amount,
                                            bool* settledOut, const PoolTransition* pool)
{
    LOCK(cs_ledger_);

    if (settledOut) *settledOut = false;

    CreditResult auth = CheckWriter(caller);
    if (!auth) return auth;

    if (amount < 0) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT, "Repayment must be non-negative");
    }

    auto it = loans_.find(loanId);
    if (it == loans_.end()) {
        return CreditResult::Fail(CreditError::UNKNOWN_LOAN, strprintf("Loan %u not found", loanId));
    }
    if (!it->second.IsActive()) {
        return CreditResult::Fail(CreditError::LOAN_NOT_ACTIVE,
            strprintf("Loan %u is %s", loanId, LoanStatusToString(it->second.status)));
    }
    if (amount == 0 && !pool) {
        return CreditResult::Ok();
    }

    LedgerTransition transition;
    LoanRecord loan = it->second;
    CAmount applied = std::min(amount, loan.RemainingPrincipal());
    loan.repaidSoFar += applied;

    transition.subject = loan.subject;
    transition.counters = GetAggregates(loan.subject);
    bool settled = loan.RemainingPrincipal() == 0;
    if (settled) {
        loan.status = LoanStatus::REPAID;
        transition.counters.activeLoans--;
        transition.counters.repaidLoans++;
    }
    transition.loan = loan;
    transition.nextLoanId = nextLoanId_;
    if (pool) transition.pool = *pool;

    CreditResult result = Commit(transition);
    if (!result) return result;

    if (settledOut) *settledOut = settled;
    LogPrint(BCLog::LEDGER, "Ledger: Repayment of %s on loan %u%s\n",
             FormatMoney(applied), loanId, settled ? " (settled)" : "");
    return CreditResult::Ok();
}

CreditResult LedgerStore::RegisterLiquidation(const Principal& caller, uint64_t loanId,
                                              const PoolTransition* pool)
{
    LOCK(cs_ledger_);

    CreditResult auth = CheckWriter(caller);
    if (!auth) return auth;

    auto it = loans_.find(loanId);
    if (it == loans_.end()) {
        return CreditResult::Fail(CreditError::UNKNOWN_LOAN, strprintf("Loan %u not found", loanId));
    }
    if (!it->second.IsActive()) {
        return CreditResult::Fail(CreditError::LOAN_NOT_ACTIVE,
            strprintf("Loan %u is %s", loanId, LoanStatusToString(it->second.status)));
    }

    LedgerTransition transition;
    LoanRecord loan = it->second;
    loan.status = LoanStatus::LIQUIDATED;
    transition.loan = loan;
    transition.subject = loan.subject;
    transition.counters = GetAggregates(loan.subject);
    transition.counters.activeLoans--;
    transition.counters.liquidatedLoans++;
    transition.nextLoanId = nextLoanId_;
    if (pool) transition.pool = *pool;

    CreditResult result = Commit(transition);
    if (!result) return result;

    LogPrint(BCLog::LEDGER, "Ledger: Loan %u liquidated\n", loanId);
    return CreditResult::Ok();
}

CreditResult LedgerStore::RecordCollateral(const Principal& caller, const CollateralRecord& record)
{
    LOCK(cs_ledger_);

    CreditResult auth = CheckWriter(caller);
    if (!auth) return auth;

    auto it = loans_.find(record.loanId);
    if (it == loans_.end()) {
        return CreditResult::Fail(CreditError::UNKNOWN_LOAN, strprintf("Loan %u not found", record.loanId));
    }
    const LoanRecord& loan = it->second;
    if (!loan.IsActive()) {
        return CreditResult::Fail(CreditError::LOAN_NOT_ACTIVE,
            strprintf("Loan %u is %s", record.loanId, LoanStatusToString(loan.status)));
    }
    if (collateral_.count(record.loanId)) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT,
            strprintf("Collateral for loan %u already recorded", record.loanId));
    }
    CreditResult result = CheckCollateral(record);
    if (!result) return result;

    LedgerTransition transition;
    transition.subject = loan.subject;
    transition.counters = GetAggregates(loan.subject);
    transition.nextLoanId = nextLoanId_;
    AddCollateral(loan, record, transition);

    result = Commit(transition);
    if (!result) return result;

    LogPrint(BCLog::LEDGER, "Ledger: Collateral %s recorded for loan %u (asset %s)\n",
             FormatMoney(record.collateralValue), record.loanId, record.asset.GetHex());
    return CreditResult::Ok();
}

CreditResult LedgerStore::Commit(const LedgerTransition& transition)
{
    if (db_ != nullptr && db_->IsInitialized()) {
        if (!db_->ApplyTransition(transition)) {
            LogPrintf("Ledger: Failed to persist transition for %s\n", transition.subject.GetHex());
            return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Ledger write could not be persisted");
        }
    }
    ApplyInMemory(transition);
    return CreditResult::Ok();
}

void LedgerStore::ApplyInMemory(const LedgerTransition& transition)
{
    if (transition.loan) {
        const LoanRecord& loan = *transition.loan;
        if (loans_.count(loan.id) == 0) {
            subjectLoans_[loan.subject].push_back(loan.id);
        }
        loans_[loan.id] = loan;
    }
    if (transition.collateral) {
        collateral_[transition.collateral->loanId] = *transition.collateral;
    }
    if (transition.newAsset) {
        subjectAssets_[transition.subject].insert(*transition.newAsset);
    }
    aggregates_[transition.subject] = transition.counters;
    nextLoanId_ = transition.nextLoanId;

    if (transition.firstSeen && identity_ != nullptr) {
        identity_->ApplyFirstSeen(transition.subject, *transition.firstSeen);
    }
}

std::optional<LoanRecord> LedgerStore::GetLoan(uint64_t loanId) const
{
    LOCK(cs_ledger_);
    auto it = loans_.find(loanId);
    if (it != loans_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<CollateralRecord> LedgerStore::GetCollateral(uint64_t loanId) const
{
    LOCK(cs_ledger_);
    auto it = collateral_.find(loanId);
    if (it != collateral_.end()) {
        return it->second;
    }
    return std::nullopt;
}

AggregateCounters LedgerStore::GetAggregates(const Subject& subject) const
{
    LOCK(cs_ledger_);
    auto it = aggregates_.find(subject);
    if (it != aggregates_.end()) {
        return it->second;
    }
    return AggregateCounters();
}

std::vector<uint64_t> LedgerStore::GetLoanIdsBySubject(const Subject& subject) const
{
    LOCK(cs_ledger_);
    auto it = subjectLoans_.find(subject);
    if (it != subjectLoans_.end()) {
        return it->second;
    }
    return {};
}

std::vector<LoanRecord> LedgerStore::GetLoansBySubject(const Subject& subject) const
{
    LOCK(cs_ledger_);
    std::vector<LoanRecord> result;
    auto it = subjectLoans_.find(subject);
    if (it != subjectLoans_.end()) {
        result.reserve(it->second.size());
        for (uint64_t id : it->second) {
            result.push_back(loans_.at(id));
        }
    }
    return result;
}

uint64_t LedgerStore::GetLoanCount() const
{
    LOCK(cs_ledger_);
    return loans_.size();
}

std::vector<uint64_t> LedgerStore::GetActiveLoanIds(const Principal& counterparty) const
{
    LOCK(cs_ledger_);
    std::vector<uint64_t> ids;
    for (const auto& entry : loans_) {
        if (entry.second.IsActive() && entry.second.counterparty == counterparty) ids.push_back(entry.first);
    }
    return ids;
}

} // namespace credit
