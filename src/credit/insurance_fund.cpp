// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/insurance_fund.h>

#include <credit/ledger_db.h>
#include <util.h>
#include <utilmoneystr.h>

#include <algorithm>

namespace credit {

InsuranceFund::InsuranceFund(const AuthorizationGate& gate, ValueTransfer& tokens, const FundParams& params,
                             const AssetId& asset, const Principal& account, LedgerDB* db)
    : gate_(gate)
    , tokens_(tokens)
    , asset_(asset)
    , account_(account)
    , db_(db)
    , params_(params)
{
}

bool InsuranceFund::LoadFromDatabase()
{
    LOCK(cs_fund_);

    if (db_ == nullptr || !db_->IsInitialized()) {
        return false;
    }

    FundStatistics stats;
    std::map<Subject, std::vector<DefaultRecord>> defaults;
    if (!db_->LoadFundState(stats, defaults)) {
        LogPrintf("Fund: Failed to load fund state from database\n");
        return false;
    }

    stats_ = stats;
    defaults_ = std::move(defaults);

    LogPrintf("Fund: Loaded balance %s, %u defaults on record\n", FormatMoney(stats_.balance), stats_.totalDefaults);
    return true;
}

bool InsuranceFund::Persist(const FundStatistics& stats, const DefaultRecord* record)
{
    if (db_ == nullptr || !db_->IsInitialized()) {
        return true;
    }
    return db_->ApplyFundTransition(stats, record);
}

CreditResult InsuranceFund::Deposit(const Principal& from, CAmount amount)
{
    LOCK(cs_fund_);

    if (amount <= 0 || !MoneyRange(amount)) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT, "Deposit must be positive");
    }
    if (!tokens_.TransferFrom(asset_, account_, from, account_, amount)) {
        return CreditResult::Fail(CreditError::TRANSFER_FAILED,
            strprintf("Could not pull %s from %s", FormatMoney(amount), from.GetHex()));
    }

    FundStatistics updated = stats_;
    updated.balance += amount;
    updated.totalDeposited += amount;
    if (!Persist(updated, nullptr)) {
        if (!tokens_.Transfer(asset_, account_, from, amount)) {
            LogPrintf("Fund: Failed to return deposit of %s to %s after storage failure\n",
                      FormatMoney(amount), from.GetHex());
        }
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Fund deposit could not be persisted");
    }
    stats_ = updated;

    LogPrint(BCLog::FUND, "Fund: Deposit of %s from %s, balance %s\n",
             FormatMoney(amount), from.GetHex(), FormatMoney(stats_.balance));
    return CreditResult::Ok();
}

CreditResult InsuranceFund::AllocateRevenue(const Principal& caller, CAmount revenue, CAmount* allocatedOut)
{
    LOCK(cs_fund_);

    if (allocatedOut) *allocatedOut = 0;

    CreditResult auth = gate_.Require(Capability::REVENUE_ALLOCATOR, caller);
    if (!auth) return auth;

    if (revenue < 0 || !MoneyRange(revenue)) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT, "Revenue must be non-negative");
    }

    CAmount allocation = MulDiv(revenue, params_.revenueShareBps, BPS_ONE);
    if (allocation > 0 && !tokens_.Transfer(asset_, caller, account_, allocation)) {
        return CreditResult::Fail(CreditError::TRANSFER_FAILED,
            strprintf("Could not move %s revenue share from %s", FormatMoney(allocation), caller.GetHex()));
    }

    FundStatistics updated = stats_;
    updated.balance += allocation;
    updated.totalRevenueAllocated += allocation;
    if (!Persist(updated, nullptr)) {
        if (allocation > 0 && !tokens_.Transfer(asset_, account_, caller, allocation)) {
            LogPrintf("Fund: Failed to return revenue share of %s to %s after storage failure\n",
                      FormatMoney(allocation), caller.GetHex());
        }
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Revenue allocation could not be persisted");
    }
    stats_ = updated;
    if (allocatedOut) *allocatedOut = allocation;

    LogPrint(BCLog::FUND, "Fund: Allocated %s of %s revenue, balance %s\n",
             FormatMoney(allocation), FormatMoney(revenue), FormatMoney(stats_.balance));
    return CreditResult::Ok();
}

CreditResult InsuranceFund::CoverLoss(const Principal& caller, const Subject& subject, uint64_t loanId,
                                      CAmount principal, CAmount lossAmount, int64_t now,
                                      CAmount* coveredOut)
{
    LOCK(cs_fund_);

    if (coveredOut) *coveredOut = 0;

    CreditResult auth = gate_.Require(Capability::FUND_COVERER, caller);
    if (!auth) return auth;

    if (principal < 0 || lossAmount < 0) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT, "Principal and loss must be non-negative");
    }

    CAmount maxCoverage = MulDiv(principal, params_.maxCoverageBps, BPS_ONE);
    CAmount covered = std::min(std::min(lossAmount, maxCoverage), stats_.balance);

    if (covered > 0 && !tokens_.Transfer(asset_, account_, caller, covered)) {
        return CreditResult::Fail(CreditError::TRANSFER_FAILED, "Fund could not pay out coverage");
    }

    DefaultRecord record;
    record.subject = subject;
    record.loanId = loanId;
    record.principal = principal;
    record.lossAmount = lossAmount;
    record.coveredAmount = covered;
    record.timestamp = now;

    FundStatistics updated = stats_;
    updated.balance -= covered;
    updated.totalCovered += covered;
    updated.totalDefaults++;
    if (!Persist(updated, &record)) {
        if (covered > 0 && !tokens_.Transfer(asset_, caller, account_, covered)) {
            LogPrintf("Fund: Failed to reclaim coverage of %s from %s after storage failure\n",
                      FormatMoney(covered), caller.GetHex());
        }
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Default record could not be persisted");
    }
    stats_ = updated;
    defaults_[subject].push_back(record);

    if (coveredOut) *coveredOut = covered;

    LogPrintf("Fund: Covered %s of %s loss on loan %u, balance %s\n",
              FormatMoney(covered), FormatMoney(lossAmount), loanId, FormatMoney(stats_.balance));
    return CreditResult::Ok();
}

CreditResult InsuranceFund::EmergencyWithdraw(const Principal& caller, const Principal& to, CAmount amount)
{
    LOCK(cs_fund_);

    CreditResult auth = gate_.Require(Capability::ADMIN, caller);
    if (!auth) return auth;

    if (amount <= 0) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT, "Withdrawal must be positive");
    }
    if (amount > stats_.balance) {
        return CreditResult::Fail(CreditError::INSUFFICIENT_FUNDS,
            strprintf("Withdrawal %s exceeds balance %s", FormatMoney(amount), FormatMoney(stats_.balance)));
    }
    FundStatistics updated = stats_;
    updated.balance -= amount;
    if (!Persist(updated, nullptr)) {
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Fund withdrawal could not be persisted");
    }
    if (!tokens_.Transfer(asset_, account_, to, amount)) {
        if (!Persist(stats_, nullptr)) {
            LogPrintf("Fund: Balance record out of sync with fund account\n");
        }
        return CreditResult::Fail(CreditError::TRANSFER_FAILED, "Fund transfer failed");
    }
    stats_ = updated;

    LogPrintf("Fund: Emergency withdrawal of %s to %s\n", FormatMoney(amount), to.GetHex());
    return CreditResult::Ok();
}

FundStatistics InsuranceFund::GetStatistics() const
{
    LOCK(cs_fund_);
    return stats_;
}

std::vector<DefaultRecord> InsuranceFund::GetDefaultHistory(const Subject& subject) const
{
    LOCK(cs_fund_);
    auto it = defaults_.find(subject);
    if (it != defaults_.end()) {
        return it->second;
    }
    return {};
}

CAmount InsuranceFund::GetBalance() const
{
    LOCK(cs_fund_);
    return stats_.balance;
}

void InsuranceFund::SetParams(const FundParams& params)
{
    LOCK(cs_fund_);
    params_ = params;
}

} // namespace credit
