// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_CREDIT_INSURANCE_FUND_H
#define CREDITCORE_CREDIT_INSURANCE_FUND_H

/**
 * @file insurance_fund.h
 * @brief Loss-absorption fund backing lenders against liquidation shortfalls
 *
 * The fund is fed by direct deposits and by a share of protocol revenue.
 * A payout is capped at maxCoverageBps of the defaulted loan's principal and
 * at the fund balance; a low balance reduces the payout instead of failing.
 */

#include <amount.h>
#include <credit/authorization.h>
#include <credit/credit_common.h>
#include <credit/credit_params.h>
#include <credit/token_ledger.h>
#include <sync.h>

#include <map>
#include <vector>

namespace credit {

struct DefaultRecord {
    Subject subject;
    uint64_t loanId = NULL_LOAN_ID;
    CAmount principal = 0;
    CAmount lossAmount = 0;
    CAmount coveredAmount = 0;
    int64_t timestamp = 0;
};

struct FundStatistics {
    CAmount balance = 0;
    CAmount totalCovered = 0;
    uint64_t totalDefaults = 0;
    CAmount totalDeposited = 0;
    CAmount totalRevenueAllocated = 0;
};

class LedgerDB;

class InsuranceFund
{
public:
    /**
     * @param asset Asset the fund is held in
     * @param account Account holding the fund's value; depositors approve it
     * @param db Optional durable backing; not owned
     */
    InsuranceFund(const AuthorizationGate& gate, ValueTransfer& tokens, const FundParams& params,
                  const AssetId& asset, const Principal& account, LedgerDB* db = nullptr);

    bool LoadFromDatabase();

    CreditResult Deposit(const Principal& from, CAmount amount);

    /**
     * Skim revenueShareBps of revenue from caller into the fund.
     * @param[out] allocatedOut Amount moved into the fund
     */
    CreditResult AllocateRevenue(const Principal& caller, CAmount revenue, CAmount* allocatedOut = nullptr);

    /**
     * Pay min(loss, principal * maxCoverage, balance) to caller.
     * @param[out] coveredOut Amount paid, possibly 0
     */
    CreditResult CoverLoss(const Principal& caller, const Subject& subject, uint64_t loanId,
                           CAmount principal, CAmount lossAmount, int64_t now,
                           CAmount* coveredOut = nullptr);

    CreditResult EmergencyWithdraw(const Principal& caller, const Principal& to, CAmount amount);

    FundStatistics GetStatistics() const;
    std::vector<DefaultRecord> GetDefaultHistory(const Subject& subject) const;
    CAmount GetBalance() const;

    void SetParams(const FundParams& params);

    const Principal& GetAccount() const { return account_; }

private:
    /** Write stats and an optional new default record; true when not backed */
    bool Persist(const FundStatistics& stats, const DefaultRecord* record);

    const AuthorizationGate& gate_;
    ValueTransfer& tokens_;
    const AssetId asset_;
    const Principal account_;
    LedgerDB* db_;

    mutable CCriticalSection cs_fund_;
    FundParams params_;
    FundStatistics stats_;
    std::map<Subject, std::vector<DefaultRecord>> defaults_;
};

} // namespace credit

#endif // CREDITCORE_CREDIT_INSURANCE_FUND_H
