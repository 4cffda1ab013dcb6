// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_CREDIT_LEDGER_STORE_H
#define CREDITCORE_CREDIT_LEDGER_STORE_H

/**
 * @file ledger_store.h
 * @brief Durable per-subject loan records and running aggregates
 *
 * Loans live in an arena keyed by id; per-subject AggregateCounters live
 * beside it and are updated in the same transition as the record they
 * describe. Nothing in the ledger ever scans a subject's history, so the
 * cost of every read and write is independent of how many loans the subject
 * has taken.
 *
 * Every write requires the caller to hold LEDGER_WRITER on the
 * AuthorizationGate. When a LedgerDB is attached, a transition is first
 * committed to SQLite and only then applied in memory.
 */

#include <amount.h>
#include <credit/authorization.h>
#include <credit/credit_common.h>
#include <credit/pool_state.h>
#include <sync.h>
#include <uint256.h>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace credit {

class IdentityRegistry;
class LedgerDB;

// ============================================================================
// Records
// ============================================================================

/**
 * @brief One loan; immutable once it leaves ACTIVE except for repaidSoFar
 */
struct LoanRecord {
    /** Unique, monotonically assigned */
    uint64_t id;

    Subject subject;

    /** USD value borrowed */
    CAmount principal;

    /** Principal repaid so far, never above principal */
    CAmount repaidSoFar;

    int64_t openedAt;

    LoanStatus status;

    /** Lender of record (the pool that funded the loan) */
    Principal counterparty;

    LoanRecord()
        : id(NULL_LOAN_ID)
        , principal(0)
        , repaidSoFar(0)
        , openedAt(0)
        , status(LoanStatus::ACTIVE) {}

    CAmount RemainingPrincipal() const { return principal - repaidSoFar; }
    bool IsActive() const { return status == LoanStatus::ACTIVE; }

    bool operator==(const LoanRecord& other) const {
        return id == other.id && subject == other.subject && principal == other.principal &&
               repaidSoFar == other.repaidSoFar && openedAt == other.openedAt &&
               status == other.status && counterparty == other.counterparty;
    }
};

/**
 * @brief Collateral posted for a loan, written once at borrow time
 */
struct CollateralRecord {
    uint64_t loanId;
    AssetId asset;

    /** USD value of the collateral at origination */
    CAmount collateralValue;

    /** Borrower's credit score when the loan was opened */
    int64_t scoreAtOrigination;

    /** Tier LTV limit in force at origination */
    int64_t maxLtvBps;

    CollateralRecord()
        : loanId(NULL_LOAN_ID)
        , collateralValue(0)
        , scoreAtOrigination(0)
        , maxLtvBps(0) {}

    bool operator==(const CollateralRecord& other) const {
        return loanId == other.loanId && asset == other.asset &&
               collateralValue == other.collateralValue &&
               scoreAtOrigination == other.scoreAtOrigination && maxLtvBps == other.maxLtvBps;
    }
};

/**
 * @brief Running totals per subject; the only input the score engine reads
 *
 * Invariant: totalLoans == repaidLoans + liquidatedLoans + activeLoans.
 */
struct AggregateCounters {
    uint64_t totalLoans = 0;
    uint64_t repaidLoans = 0;
    uint64_t liquidatedLoans = 0;
    uint64_t activeLoans = 0;
    CAmount totalCollateralValue = 0;
    CAmount totalBorrowedValue = 0;
    /** Loans opened at the tier's maximum allowed leverage */
    uint64_t maxLtvBorrowCount = 0;
    uint64_t uniqueCollateralAssets = 0;

    bool IsConsistent() const {
        return totalLoans == repaidLoans + liquidatedLoans + activeLoans;
    }

    bool operator==(const AggregateCounters& other) const {
        return totalLoans == other.totalLoans && repaidLoans == other.repaidLoans &&
               liquidatedLoans == other.liquidatedLoans && activeLoans == other.activeLoans &&
               totalCollateralValue == other.totalCollateralValue &&
               totalBorrowedValue == other.totalBorrowedValue &&
               maxLtvBorrowCount == other.maxLtvBorrowCount &&
               uniqueCollateralAssets == other.uniqueCollateralAssets;
    }
};

/**
 * @brief Everything one ledger write changes, persisted as a unit
 */
struct LedgerTransition {
    std::optional<LoanRecord> loan;
    std::optional<CollateralRecord> collateral;
    Subject subject;
    AggregateCounters counters;
    /** Collateral asset seen for the first time by this subject */
    std::optional<AssetId> newAsset;
    uint64_t nextLoanId = 1;
    /** First contact of a subject opening its first loan */
    std::optional<int64_t> firstSeen;
    /** Lending pool state committed in the same database transaction */
    std::optional<PoolTransition> pool;
};

// ============================================================================
// LedgerStore
// ============================================================================

class LedgerStore
{
public:
    /**
     * @param gate Allow-list consulted on every write
     * @param db Optional durable backing; not owned
     * @param identity Stamped with firstSeen when a subject opens a loan; may be null
     */
    explicit LedgerStore(const AuthorizationGate& gate, LedgerDB* db = nullptr,
                         IdentityRegistry* identity = nullptr);

    /**
     * Rebuild the arena, indexes and counters from the attached database.
     * @return false if no database is attached or it cannot be read
     */
    bool LoadFromDatabase();

    /**
     * Open a new ACTIVE loan.
     * @param[out] loanIdOut Assigned id
     */
    CreditResult RegisterLoan(const Principal& caller, const Subject& subject, CAmount principal,
                              const Principal& counterparty, int64_t now, uint64_t& loanIdOut);

    /**
     * Apply a principal repayment. An amount above the remaining principal
     * settles the loan; only the remainder is counted.
     * @param[out] settledOut Set to true when the loan became REPAID
     * @param pool Pool state to persist with the repayment
     */
    CreditResult RegisterRepayment(const Principal& caller, uint64_t loanId, CAmount amount,
                                   bool* settledOut = nullptr, const PoolTransition* pool = nullptr);

    /** Move an ACTIVE loan to LIQUIDATED */
    CreditResult RegisterLiquidation(const Principal& caller, uint64_t loanId,
                                     const PoolTransition* pool = nullptr);

    /** Record collateral for a loan; once per loan */
    CreditResult RecordCollateral(const Principal& caller, const CollateralRecord& record);

    /**
     * RegisterLoan and RecordCollateral as one transition, so a loan can
     * never exist without the collateral it was opened against.
     * record.loanId and pool->position->loanId are ignored and replaced by
     * the assigned id.
     */
    CreditResult RegisterCollateralizedLoan(const Principal& caller, const Subject& subject, CAmount principal,
                                            const Principal& counterparty, int64_t now,
                                            const CollateralRecord& record, uint64_t& loanIdOut,
                                            const PoolTransition* pool = nullptr);

    std::optional<LoanRecord> GetLoan(uint64_t loanId) const;
    std::optional<CollateralRecord> GetCollateral(uint64_t loanId) const;

    /** Zeroed counters for a subject never seen */
    AggregateCounters GetAggregates(const Subject& subject) const;

    std::vector<uint64_t> GetLoanIdsBySubject(const Subject& subject) const;
    std::vector<LoanRecord> GetLoansBySubject(const Subject& subject) const;

    uint64_t GetLoanCount() const;

    /** Ids of active loans funded by counterparty, ascending */
    std::vector<uint64_t> GetActiveLoanIds(const Principal& counterparty) const;

private:
    CreditResult CheckWriter(const Principal& caller) const;

    CreditResult CheckNewLoan(const Subject& subject, CAmount principal) const;
    CreditResult CheckCollateral(const CollateralRecord& record) const;

    /** Fill the loan part of a transition for a new loan */
    void BuildLoanTransition(const Subject& subject, CAmount principal, const Principal& counterparty,
                             int64_t now, LedgerTransition& transition) const;

    /** Fold a collateral record into a transition whose counters are already loaded */
    void AddCollateral(const LoanRecord& loan, const CollateralRecord& record,
                       LedgerTransition& transition) const;

    /** Persist (if backed) then apply; nothing changes when persisting fails */
    CreditResult Commit(const LedgerTransition& transition);

    void ApplyInMemory(const LedgerTransition& transition);

    const AuthorizationGate& gate_;
    LedgerDB* db_;
    IdentityRegistry* identity_;

    mutable CCriticalSection cs_ledger_;

    /** Loan arena */
    std::map<uint64_t, LoanRecord> loans_;
    std::map<uint64_t, CollateralRecord> collateral_;

    std::map<Subject, AggregateCounters> aggregates_;

    /** Distinct collateral assets per subject; bounded by the asset universe */
    std::map<Subject, std::set<AssetId>> subjectAssets_;

    /** Loan list index for the read endpoint; never used for scoring */
    std::map<Subject, std::vector<uint64_t>> subjectLoans_;

    uint64_t nextLoanId_;
};

} // namespace credit

#endif // CREDITCORE_CREDIT_LEDGER_STORE_H
