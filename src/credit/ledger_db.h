// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_CREDIT_LEDGER_DB_H
#define CREDITCORE_CREDIT_LEDGER_DB_H

/**
 * @file ledger_db.h
 * @brief SQLite persistence for every credit engine
 *
 * Every ledger transition is written inside one transaction so that a loan
 * row, the subject's aggregate counters and the pool position funding the
 * loan can never disagree on disk. The in-memory engines apply a transition
 * only after COMMIT succeeds.
 *
 * The database lives at <datadir>/credit_ledger.sqlite and runs in WAL mode.
 */

#include <credit/identity_registry.h>
#include <credit/insurance_fund.h>
#include <credit/ledger_store.h>
#include <credit/liquidation_auction.h>
#include <credit/pool_state.h>
#include <credit/score_attestation.h>

#include <map>
#include <mutex>
#include <set>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace credit {

class LedgerDB
{
public:
    static const int SCHEMA_VERSION = 2;

    LedgerDB();
    ~LedgerDB();

    LedgerDB(const LedgerDB&) = delete;
    LedgerDB& operator=(const LedgerDB&) = delete;

    /**
     * Open or create the database in dataDir.
     * @return true on success or if already open
     */
    bool Initialize(const std::string& dataDir);

    void Shutdown();

    bool IsInitialized() const;

    std::string GetPath() const { return dbPath_; }

    // ========================================================================
    // Ledger
    // ========================================================================

    /** Write every row a transition touches in one transaction */
    bool ApplyTransition(const LedgerTransition& transition);

    bool LoadLedger(std::map<uint64_t, LoanRecord>& loans,
                    std::map<uint64_t, CollateralRecord>& collateral,
                    std::map<Subject, AggregateCounters>& aggregates,
                    std::map<Subject, std::set<AssetId>>& subjectAssets,
                    uint64_t& nextLoanId);

    // ========================================================================
    // Identity
    // ========================================================================

    bool ApplyIdentityTransition(const IdentityTransition& transition);

    bool LoadIdentityState(std::map<Subject, IdentityProof>& proofs,
                           std::map<Subject, StakeCommitment>& stakes,
                           std::map<Subject, ActivityCounters>& activity);

    // ========================================================================
    // Lending pool
    // ========================================================================

    /** Pool write with no ledger counterpart (deposits, interest, pausing) */
    bool ApplyPoolTransition(const PoolTransition& transition);

    bool LoadPoolState(std::map<uint64_t, LoanPosition>& positions,
                       std::map<Principal, CAmount>& lenderBalances, PoolTotals& totals);

    // ========================================================================
    // Insurance fund
    // ========================================================================

    /** @param record Default to append, may be null */
    bool ApplyFundTransition(const FundStatistics& stats, const DefaultRecord* record);

    bool LoadFundState(FundStatistics& stats, std::map<Subject, std::vector<DefaultRecord>>& defaults);

    // ========================================================================
    // Auctions and attestations
    // ========================================================================

    bool WriteAuction(const Auction& auction, uint64_t nextAuctionId);

    bool LoadAuctions(std::map<uint64_t, Auction>& auctions, uint64_t& nextAuctionId);

    bool ApplyAttestationTransition(const AttestationTransition& transition);

    bool LoadAttestationState(std::map<Subject, ScoreAttestation>& attestations,
                              std::map<Subject, ScoreChallenge>& challenges,
                              std::map<Subject, FinalizedScore>& finalized);

private:
    bool CreateSchema();
    int GetSchemaVersion();
    bool SetSchemaVersion(int version);
    bool ExecuteSQL(const std::string& sql);

    bool BeginTransaction();
    bool CommitTransaction();
    bool RollbackTransaction();

    bool WriteLoan(const LoanRecord& loan);
    bool WriteCollateral(const CollateralRecord& record);
    bool WriteAggregates(const Subject& subject, const AggregateCounters& counters);
    bool WriteSubjectAsset(const Subject& subject, const AssetId& asset);
    bool WriteNextLoanId(uint64_t nextLoanId);
    bool WriteFirstSeen(const Subject& subject, int64_t firstSeen);

    bool WriteIdentityProof(const Subject& subject, const IdentityProof& proof);
    bool WriteStake(const Subject& subject, const StakeCommitment& stake);
    bool WriteActivity(const Subject& subject, const ActivityCounters& activity);

    /** Pool rows only; the caller owns the surrounding transaction */
    bool WritePoolRows(const PoolTransition& transition);

    bool WriteMeta(const char* key, int64_t value);
    bool ReadMeta(const char* key, int64_t& value);

    /** Run fn between BEGIN and COMMIT, rolling back if it fails */
    template <typename Fn>
    bool InTransaction(const char* what, Fn fn);

    /** Prepare, let bind fill parameters, step once, finalize */
    template <typename Binder>
    bool ExecuteStatement(const char* sql, const char* what, Binder bind);

    sqlite3* db_;
    std::string dbPath_;
    mutable std::mutex dbMutex_;
};

} // namespace credit

#endif // CREDITCORE_CREDIT_LEDGER_DB_H
