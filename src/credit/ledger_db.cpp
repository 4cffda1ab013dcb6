// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/ledger_db.h>

#include <util.h>

#include <sqlite3.h>

#include <ctime>
#include <sstream>

namespace credit {

const int LedgerDB::SCHEMA_VERSION;

namespace {

void BindHex(sqlite3_stmt* stmt, int index, const std::string& hex)
{
    sqlite3_bind_text(stmt, index, hex.c_str(), -1, SQLITE_TRANSIENT);
}

std::string ColumnText(sqlite3_stmt* stmt, int column)
{
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

uint160 ColumnUint160(sqlite3_stmt* stmt, int column)
{
    uint160 value;
    value.SetHex(ColumnText(stmt, column));
    return value;
}

uint256 ColumnUint256(sqlite3_stmt* stmt, int column)
{
    uint256 value;
    value.SetHex(ColumnText(stmt, column));
    return value;
}

} // namespace

LedgerDB::LedgerDB()
    : db_(nullptr)
{
}

LedgerDB::~LedgerDB()
{
    Shutdown();
}

bool LedgerDB::Initialize(const std::string& dataDir)
{
    std::lock_guard<std::mutex> lock(dbMutex_);

    if (db_ != nullptr) {
        return true;
    }

    dbPath_ = dataDir + "/credit_ledger.sqlite";

    int rc = sqlite3_open(dbPath_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to open database: %s\n", sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    ExecuteSQL("PRAGMA journal_mode=WAL;");
    ExecuteSQL("PRAGMA synchronous=NORMAL;");
    ExecuteSQL("PRAGMA foreign_keys=ON;");

    // Every table is created IF NOT EXISTS, so an older file is upgraded in place
    int currentVersion = GetSchemaVersion();
    if (currentVersion < SCHEMA_VERSION) {
        if (currentVersion >= 0) {
            LogPrintf("LedgerDB: Upgrading schema from version %d to %d\n", currentVersion, SCHEMA_VERSION);
        }
        if (!CreateSchema()) {
            LogPrintf("LedgerDB: Failed to create schema\n");
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }
    } else if (currentVersion > SCHEMA_VERSION) {
        LogPrintf("LedgerDB: Database schema version %d is newer than supported %d\n",
                  currentVersion, SCHEMA_VERSION);
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LogPrintf("LedgerDB: Initialized at %s\n", dbPath_);
    return true;
}

void LedgerDB::Shutdown()
{
    std::lock_guard<std::mutex> lock(dbMutex_);

    if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
        LogPrintf("LedgerDB: Shutdown complete\n");
    }
}

bool LedgerDB::IsInitialized() const
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    return db_ != nullptr;
}

bool LedgerDB::CreateSchema()
{
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY,
            applied_at INTEGER NOT NULL
        );

        -- Loan arena
        CREATE TABLE IF NOT EXISTS loans (
            id INTEGER PRIMARY KEY,
            subject TEXT NOT NULL,
            principal INTEGER NOT NULL,
            repaid INTEGER NOT NULL,
            opened_at INTEGER NOT NULL,
            status INTEGER NOT NULL,
            counterparty TEXT NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_loans_subject ON loans(subject);

        CREATE TABLE IF NOT EXISTS collateral (
            loan_id INTEGER PRIMARY KEY,
            asset TEXT NOT NULL,
            value INTEGER NOT NULL,
            score INTEGER NOT NULL,
            max_ltv INTEGER NOT NULL,
            FOREIGN KEY (loan_id) REFERENCES loans(id)
        );

        -- Per-subject running counters
        CREATE TABLE IF NOT EXISTS aggregates (
            subject TEXT PRIMARY KEY,
            total_loans INTEGER NOT NULL,
            repaid_loans INTEGER NOT NULL,
            liquidated_loans INTEGER NOT NULL,
            active_loans INTEGER NOT NULL,
            total_collateral INTEGER NOT NULL,
            total_borrowed INTEGER NOT NULL,
            max_ltv_count INTEGER NOT NULL,
            unique_assets INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS subject_assets (
            subject TEXT NOT NULL,
            asset TEXT NOT NULL,
            PRIMARY KEY (subject, asset)
        );

        CREATE TABLE IF NOT EXISTS identity_proofs (
            subject TEXT PRIMARY KEY,
            commitment TEXT NOT NULL,
            verified_at INTEGER NOT NULL,
            expires_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS stakes (
            subject TEXT PRIMARY KEY,
            amount INTEGER NOT NULL,
            lock_until INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS activity (
            subject TEXT PRIMARY KEY,
            votes INTEGER NOT NULL,
            proposals INTEGER NOT NULL,
            first_seen INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS meta (
            key TEXT PRIMARY KEY,
            value INTEGER NOT NULL
        );

        -- Lending pool; scalar totals live in meta
        CREATE TABLE IF NOT EXISTS pool_positions (
            loan_id INTEGER PRIMARY KEY,
            subject TEXT NOT NULL,
            collateral_asset TEXT NOT NULL,
            collateral_amount INTEGER NOT NULL,
            original_principal INTEGER NOT NULL,
            principal INTEGER NOT NULL,
            accrued_interest INTEGER NOT NULL,
            rate_bps INTEGER NOT NULL,
            last_accrual INTEGER NOT NULL,
            liquidation_threshold INTEGER NOT NULL,
            tier INTEGER NOT NULL,
            credit_score INTEGER NOT NULL,
            opened_at INTEGER NOT NULL,
            active INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS pool_lenders (
            lender TEXT PRIMARY KEY,
            balance INTEGER NOT NULL
        );

        -- Insurance fund; statistics live in meta
        CREATE TABLE IF NOT EXISTS fund_defaults (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            subject TEXT NOT NULL,
            loan_id INTEGER NOT NULL,
            principal INTEGER NOT NULL,
            loss INTEGER NOT NULL,
            covered INTEGER NOT NULL,
            timestamp INTEGER NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_fund_defaults_subject ON fund_defaults(subject);

        CREATE TABLE IF NOT EXISTS auctions (
            id INTEGER PRIMARY KEY,
            loan_id INTEGER NOT NULL,
            subject TEXT NOT NULL,
            debt INTEGER NOT NULL,
            collateral_amount INTEGER NOT NULL,
            collateral_asset TEXT NOT NULL,
            grace_end INTEGER NOT NULL,
            auction_start INTEGER NOT NULL,
            state INTEGER NOT NULL,
            executor TEXT NOT NULL,
            executed_at INTEGER NOT NULL,
            sale_price INTEGER NOT NULL,
            paid INTEGER NOT NULL,
            covered INTEGER NOT NULL,
            cancel_reason TEXT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS score_attestations (
            subject TEXT PRIMARY KEY,
            score INTEGER NOT NULL,
            tier INTEGER NOT NULL,
            ltv INTEGER NOT NULL,
            rate_multiplier INTEGER NOT NULL,
            data_quality INTEGER NOT NULL,
            merkle_root TEXT NOT NULL,
            score_hash TEXT NOT NULL,
            attester TEXT NOT NULL,
            attested_at INTEGER NOT NULL,
            challenged INTEGER NOT NULL,
            finalized INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS score_challenges (
            subject TEXT PRIMARY KEY,
            challenger TEXT NOT NULL,
            reason TEXT NOT NULL,
            bond INTEGER NOT NULL,
            challenged_at INTEGER NOT NULL,
            resolved INTEGER NOT NULL,
            upheld INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS finalized_scores (
            subject TEXT PRIMARY KEY,
            score INTEGER NOT NULL,
            tier INTEGER NOT NULL,
            ltv INTEGER NOT NULL,
            rate_multiplier INTEGER NOT NULL,
            data_quality INTEGER NOT NULL,
            finalized_at INTEGER NOT NULL
        );
    )";

    if (!ExecuteSQL(schema)) {
        return false;
    }

    return SetSchemaVersion(SCHEMA_VERSION);
}

int LedgerDB::GetSchemaVersion()
{
    if (db_ == nullptr) return -1;

    sqlite3_stmt* stmt;
    const char* sql = "SELECT version FROM schema_version ORDER BY version DESC LIMIT 1;";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return -1;
    }

    int version = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return version;
}

bool LedgerDB::SetSchemaVersion(int version)
{
    std::stringstream ss;
    ss << "INSERT OR REPLACE INTO schema_version (version, applied_at) VALUES ("
       << version << ", " << std::time(nullptr) << ");";
    return ExecuteSQL(ss.str());
}

bool LedgerDB::ExecuteSQL(const std::string& sql)
{
    if (db_ == nullptr) return false;

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);

    if (rc != SQLITE_OK) {
        LogPrintf("LedgerDB: SQL error: %s\n", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }

    return true;
}

bool LedgerDB::BeginTransaction()
{
    return ExecuteSQL("BEGIN TRANSACTION;");
}

bool LedgerDB::CommitTransaction()
{
    return ExecuteSQL("COMMIT;");
}

bool LedgerDB::RollbackTransaction()
{
    return ExecuteSQL("ROLLBACK;");
}

template <typename Binder>
bool LedgerDB::ExecuteStatement(const char* sql, const char* what, Binder bind)
{
    if (db_ == nullptr) return false;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to prepare %s statement: %s\n", what, sqlite3_errmsg(db_));
        return false;
    }

    bind(stmt);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LogPrintf("LedgerDB: Failed to write %s: %s\n", what, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

template <typename Fn>
bool LedgerDB::InTransaction(const char* what, Fn fn)
{
    if (db_ == nullptr) return false;

    if (!BeginTransaction()) {
        return false;
    }
    if (!fn()) {
        LogPrint(BCLog::DB, "LedgerDB: Rolling back %s\n", what);
        RollbackTransaction();
        return false;
    }
    if (!CommitTransaction()) {
        RollbackTransaction();
        return false;
    }
    return true;
}

bool LedgerDB::WriteMeta(const char* key, int64_t value)
{
    const char* sql = "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);";
    return ExecuteStatement(sql, key, [key, value](sqlite3_stmt* stmt) {
        sqlite3_bind_text(stmt, 1, key, -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 2, value);
    });
}

bool LedgerDB::ReadMeta(const char* key, int64_t& value)
{
    if (db_ == nullptr) return false;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT value FROM meta WHERE key = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to prepare meta query: %s\n", sqlite3_errmsg(db_));
        return false;
    }
    sqlite3_bind_text(stmt, 1, key, -1, SQLITE_STATIC);
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        value = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return rc == SQLITE_ROW || rc == SQLITE_DONE;
}

// ============================================================================
// Ledger writes
// ============================================================================

bool LedgerDB::WriteLoan(const LoanRecord& loan)
{
    const char* sql = R"(
        INSERT OR REPLACE INTO loans (id, subject, principal, repaid, opened_at, status, counterparty)
        VALUES (?, ?, ?, ?, ?, ?, ?);
    )";
    return ExecuteStatement(sql, "loan", [&loan](sqlite3_stmt* stmt) {
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(loan.id));
        BindHex(stmt, 2, loan.subject.GetHex());
        sqlite3_bind_int64(stmt, 3, loan.principal);
        sqlite3_bind_int64(stmt, 4, loan.repaidSoFar);
        sqlite3_bind_int64(stmt, 5, loan.openedAt);
        sqlite3_bind_int(stmt, 6, static_cast<int>(loan.status));
        BindHex(stmt, 7, loan.counterparty.GetHex());
    });
}

bool LedgerDB::WriteCollateral(const CollateralRecord& record)
{
    const char* sql = R"(
        INSERT INTO collateral (loan_id, asset, value, score, max_ltv)
        VALUES (?, ?, ?, ?, ?);
    )";
    return ExecuteStatement(sql, "collateral", [&record](sqlite3_stmt* stmt) {
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(record.loanId));
        BindHex(stmt, 2, record.asset.GetHex());
        sqlite3_bind_int64(stmt, 3, record.collateralValue);
        sqlite3_bind_int64(stmt, 4, record.scoreAtOrigination);
        sqlite3_bind_int64(stmt, 5, record.maxLtvBps);
    });
}

bool LedgerDB::WriteAggregates(const Subject& subject, const AggregateCounters& counters)
{
    const char* sql = R"(
        INSERT OR REPLACE INTO aggregates (subject, total_loans, repaid_loans, liquidated_loans,
                                           active_loans, total_collateral, total_borrowed,
                                           max_ltv_count, unique_assets)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";
    return ExecuteStatement(sql, "aggregates", [&subject, &counters](sqlite3_stmt* stmt) {
        BindHex(stmt, 1, subject.GetHex());
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(counters.totalLoans));
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(counters.repaidLoans));
        sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(counters.liquidatedLoans));
        sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(counters.activeLoans));
        sqlite3_bind_int64(stmt, 6, counters.totalCollateralValue);
        sqlite3_bind_int64(stmt, 7, counters.totalBorrowedValue);
        sqlite3_bind_int64(stmt, 8, static_cast<sqlite3_int64>(counters.maxLtvBorrowCount));
        sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(counters.uniqueCollateralAssets));
    });
}

bool LedgerDB::WriteSubjectAsset(const Subject& subject, const AssetId& asset)
{
    const char* sql = "INSERT OR IGNORE INTO subject_assets (subject, asset) VALUES (?, ?);";
    return ExecuteStatement(sql, "subject asset", [&subject, &asset](sqlite3_stmt* stmt) {
        BindHex(stmt, 1, subject.GetHex());
        BindHex(stmt, 2, asset.GetHex());
    });
}

bool LedgerDB::WriteNextLoanId(uint64_t nextLoanId)
{
    const char* sql = "INSERT OR REPLACE INTO meta (key, value) VALUES ('next_loan_id', ?);";
    return ExecuteStatement(sql, "next loan id", [nextLoanId](sqlite3_stmt* stmt) {
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(nextLoanId));
    });
}

bool LedgerDB::WriteFirstSeen(const Subject& subject, int64_t firstSeen)
{
    const char* sql = R"(
        INSERT INTO activity (subject, votes, proposals, first_seen) VALUES (?, 0, 0, ?)
        ON CONFLICT(subject) DO UPDATE SET first_seen = excluded.first_seen
        WHERE activity.first_seen = 0;
    )";
    return ExecuteStatement(sql, "first seen", [&subject, firstSeen](sqlite3_stmt* stmt) {
        BindHex(stmt, 1, subject.GetHex());
        sqlite3_bind_int64(stmt, 2, firstSeen);
    });
}

bool LedgerDB::ApplyTransition(const LedgerTransition& transition)
{
    std::lock_guard<std::mutex> lock(dbMutex_);

    return InTransaction("ledger transition", [this, &transition]() {
        bool success = true;
        if (success && transition.loan) {
            success = WriteLoan(*transition.loan);
        }
        if (success && transition.collateral) {
            success = WriteCollateral(*transition.collateral);
        }
        if (success && transition.newAsset) {
            success = WriteSubjectAsset(transition.subject, *transition.newAsset);
        }
        if (success) {
            success = WriteAggregates(transition.subject, transition.counters);
        }
        if (success) {
            success = WriteNextLoanId(transition.nextLoanId);
        }
        if (success && transition.firstSeen) {
            success = WriteFirstSeen(transition.subject, *transition.firstSeen);
        }
        if (success && transition.pool) {
            success = WritePoolRows(*transition.pool);
        }
        return success;
    });
}

bool LedgerDB::LoadLedger(std::map<uint64_t, LoanRecord>& loans,
                          std::map<uint64_t, CollateralRecord>& collateral,
                          std::map<Subject, AggregateCounters>& aggregates,
                          std::map<Subject, std::set<AssetId>>& subjectAssets,
                          uint64_t& nextLoanId)
{
    std::lock_guard<std::mutex> lock(dbMutex_);

    if (db_ == nullptr) return false;

    sqlite3_stmt* stmt;

    const char* loanSql = "SELECT id, subject, principal, repaid, opened_at, status, counterparty FROM loans;";
    if (sqlite3_prepare_v2(db_, loanSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to prepare loan query: %s\n", sqlite3_errmsg(db_));
        return false;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        LoanRecord loan;
        loan.id = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        loan.subject = ColumnUint160(stmt, 1);
        loan.principal = sqlite3_column_int64(stmt, 2);
        loan.repaidSoFar = sqlite3_column_int64(stmt, 3);
        loan.openedAt = sqlite3_column_int64(stmt, 4);
        int status = sqlite3_column_int(stmt, 5);
        if (status < 0 || status > static_cast<int>(LoanStatus::LIQUIDATED)) {
            LogPrintf("LedgerDB: Loan %u has unknown status %d\n", loan.id, status);
            sqlite3_finalize(stmt);
            return false;
        }
        loan.status = static_cast<LoanStatus>(status);
        loan.counterparty = ColumnUint160(stmt, 6);
        loans[loan.id] = loan;
    }
    sqlite3_finalize(stmt);

    const char* collateralSql = "SELECT loan_id, asset, value, score, max_ltv FROM collateral;";
    if (sqlite3_prepare_v2(db_, collateralSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to prepare collateral query: %s\n", sqlite3_errmsg(db_));
        return false;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        CollateralRecord record;
        record.loanId = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        record.asset = ColumnUint160(stmt, 1);
        record.collateralValue = sqlite3_column_int64(stmt, 2);
        record.scoreAtOrigination = sqlite3_column_int64(stmt, 3);
        record.maxLtvBps = sqlite3_column_int64(stmt, 4);
        collateral[record.loanId] = record;
    }
    sqlite3_finalize(stmt);

    const char* aggregateSql = R"(
        SELECT subject, total_loans, repaid_loans, liquidated_loans, active_loans,
               total_collateral, total_borrowed, max_ltv_count, unique_assets
        FROM aggregates;
    )";
    if (sqlite3_prepare_v2(db_, aggregateSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to prepare aggregate query: %s\n", sqlite3_errmsg(db_));
        return false;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        AggregateCounters counters;
        counters.totalLoans = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
        counters.repaidLoans = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
        counters.liquidatedLoans = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
        counters.activeLoans = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
        counters.totalCollateralValue = sqlite3_column_int64(stmt, 5);
        counters.totalBorrowedValue = sqlite3_column_int64(stmt, 6);
        counters.maxLtvBorrowCount = static_cast<uint64_t>(sqlite3_column_int64(stmt, 7));
        counters.uniqueCollateralAssets = static_cast<uint64_t>(sqlite3_column_int64(stmt, 8));
        aggregates[ColumnUint160(stmt, 0)] = counters;
    }
    sqlite3_finalize(stmt);

    const char* assetSql = "SELECT subject, asset FROM subject_assets;";
    if (sqlite3_prepare_v2(db_, assetSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to prepare asset query: %s\n", sqlite3_errmsg(db_));
        return false;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        subjectAssets[ColumnUint160(stmt, 0)].insert(ColumnUint160(stmt, 1));
    }
    sqlite3_finalize(stmt);

    nextLoanId = 1;
    const char* metaSql = "SELECT value FROM meta WHERE key = 'next_loan_id';";
    if (sqlite3_prepare_v2(db_, metaSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to prepare meta query: %s\n", sqlite3_errmsg(db_));
        return false;
    }
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        nextLoanId = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);

    LogPrint(BCLog::DB, "LedgerDB: Read %u loans, %u collateral records, %u subjects\n",
             loans.size(), collateral.size(), aggregates.size());
    return true;
}

// ============================================================================
// Identity
// ============================================================================

bool LedgerDB::WriteIdentityProof(const Subject& subject, const IdentityProof& proof)
{
    const char* sql = R"(
        INSERT OR REPLACE INTO identity_proofs (subject, commitment, verified_at, expires_at)
        VALUES (?, ?, ?, ?);
    )";
    return ExecuteStatement(sql, "identity proof", [&subject, &proof](sqlite3_stmt* stmt) {
        BindHex(stmt, 1, subject.GetHex());
        BindHex(stmt, 2, proof.commitmentHash.GetHex());
        sqlite3_bind_int64(stmt, 3, proof.verifiedAt);
        sqlite3_bind_int64(stmt, 4, proof.expiresAt);
    });
}

bool LedgerDB::WriteStake(const Subject& subject, const StakeCommitment& stake)
{
    const char* sql = "INSERT OR REPLACE INTO stakes (subject, amount, lock_until) VALUES (?, ?, ?);";
    return ExecuteStatement(sql, "stake", [&subject, &stake](sqlite3_stmt* stmt) {
        BindHex(stmt, 1, subject.GetHex());
        sqlite3_bind_int64(stmt, 2, stake.amount);
        sqlite3_bind_int64(stmt, 3, stake.lockUntil);
    });
}

bool LedgerDB::WriteActivity(const Subject& subject, const ActivityCounters& activity)
{
    // A first_seen already on disk wins over the one being written
    const char* sql = R"(
        INSERT INTO activity (subject, votes, proposals, first_seen) VALUES (?, ?, ?, ?)
        ON CONFLICT(subject) DO UPDATE SET
            votes = excluded.votes,
            proposals = excluded.proposals,
            first_seen = CASE WHEN activity.first_seen = 0 THEN excluded.first_seen
                              ELSE activity.first_seen END;
    )";
    return ExecuteStatement(sql, "activity", [&subject, &activity](sqlite3_stmt* stmt) {
        BindHex(stmt, 1, subject.GetHex());
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(activity.voteCount));
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(activity.proposalCount));
        sqlite3_bind_int64(stmt, 4, activity.firstSeen);
    });
}

bool LedgerDB::ApplyIdentityTransition(const IdentityTransition& transition)
{
    std::lock_guard<std::mutex> lock(dbMutex_);

    return InTransaction("identity update", [this, &transition]() {
        bool success = true;
        if (success && transition.proof) {
            success = WriteIdentityProof(transition.subject, *transition.proof);
        }
        if (success && transition.stake) {
            success = WriteStake(transition.subject, *transition.stake);
        }
        if (success && transition.activity) {
            success = WriteActivity(transition.subject, *transition.activity);
        }
        return success;
    });
}

bool LedgerDB::LoadIdentityState(std::map<Subject, IdentityProof>& proofs,
                                 std::map<Subject, StakeCommitment>& stakes,
                                 std::map<Subject, ActivityCounters>& activity)
{
    std::lock_guard<std::mutex> lock(dbMutex_);

    if (db_ == nullptr) return false;

    sqlite3_stmt* stmt;

    const char* proofSql = "SELECT subject, commitment, verified_at, expires_at FROM identity_proofs;";
    if (sqlite3_prepare_v2(db_, proofSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to prepare proof query: %s\n", sqlite3_errmsg(db_));
        return false;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        IdentityProof proof;
        proof.commitmentHash = ColumnUint256(stmt, 1);
        proof.verifiedAt = sqlite3_column_int64(stmt, 2);
        proof.expiresAt = sqlite3_column_int64(stmt, 3);
        proofs[ColumnUint160(stmt, 0)] = proof;
    }
    sqlite3_finalize(stmt);

    const char* stakeSql = "SELECT subject, amount, lock_until FROM stakes;";
    if (sqlite3_prepare_v2(db_, stakeSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to prepare stake query: %s\n", sqlite3_errmsg(db_));
        return false;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        StakeCommitment stake;
        stake.amount = sqlite3_column_int64(stmt, 1);
        stake.lockUntil = sqlite3_column_int64(stmt, 2);
        stakes[ColumnUint160(stmt, 0)] = stake;
    }
    sqlite3_finalize(stmt);

    const char* activitySql = "SELECT subject, votes, proposals, first_seen FROM activity;";
    if (sqlite3_prepare_v2(db_, activitySql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to prepare activity query: %s\n", sqlite3_errmsg(db_));
        return false;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ActivityCounters counters;
        counters.voteCount = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
        counters.proposalCount = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
        counters.firstSeen = sqlite3_column_int64(stmt, 3);
        activity[ColumnUint160(stmt, 0)] = counters;
    }
    sqlite3_finalize(stmt);

    return true;
}

// ============================================================================
// Lending pool
// ============================================================================

bool LedgerDB::WritePoolRows(const PoolTransition& transition)
{
    if (transition.position) {
        const LoanPosition& position = *transition.position;
        const char* sql = R"(
            INSERT OR REPLACE INTO pool_positions (loan_id, subject, collateral_asset, collateral_amount,
                                                   original_principal, principal, accrued_interest, rate_bps,
                                                   last_accrual, liquidation_threshold, tier, credit_score,
                                                   opened_at, active)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
        )";
        bool written = ExecuteStatement(sql, "pool position", [&position](sqlite3_stmt* stmt) {
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(position.loanId));
            BindHex(stmt, 2, position.subject.GetHex());
            BindHex(stmt, 3, position.collateralAsset.GetHex());
            sqlite3_bind_int64(stmt, 4, position.collateralAmount);
            sqlite3_bind_int64(stmt, 5, position.originalPrincipal);
            sqlite3_bind_int64(stmt, 6, position.principal);
            sqlite3_bind_int64(stmt, 7, position.accruedInterest);
            sqlite3_bind_int64(stmt, 8, position.rateBps);
            sqlite3_bind_int64(stmt, 9, position.lastAccrual);
            sqlite3_bind_int64(stmt, 10, position.liquidationThresholdBps);
            sqlite3_bind_int(stmt, 11, static_cast<int>(position.tier));
            sqlite3_bind_int64(stmt, 12, position.creditScore);
            sqlite3_bind_int64(stmt, 13, position.openedAt);
            sqlite3_bind_int(stmt, 14, position.active ? 1 : 0);
        });
        if (!written) return false;
    }

    if (transition.lender) {
        const Principal& lender = transition.lender->first;
        const CAmount balance = transition.lender->second;
        const char* sql = "INSERT OR REPLACE INTO pool_lenders (lender, balance) VALUES (?, ?);";
        bool written = ExecuteStatement(sql, "lender balance", [&lender, balance](sqlite3_stmt* stmt) {
            BindHex(stmt, 1, lender.GetHex());
            sqlite3_bind_int64(stmt, 2, balance);
        });
        if (!written) return false;
    }

    const PoolTotals& totals = transition.totals;
    return WriteMeta("pool_cash", totals.cash) &&
           WriteMeta("pool_total_borrows", totals.totalBorrows) &&
           WriteMeta("pool_reserves", totals.reserves) &&
           WriteMeta("pool_paused", totals.paused ? 1 : 0);
}

bool LedgerDB::ApplyPoolTransition(const PoolTransition& transition)
{
    std::lock_guard<std::mutex> lock(dbMutex_);

    return InTransaction("pool update", [this, &transition]() {
        return WritePoolRows(transition);
    });
}

bool LedgerDB::LoadPoolState(std::map<uint64_t, LoanPosition>& positions,
                             std::map<Principal, CAmount>& lenderBalances, PoolTotals& totals)
{
    std::lock_guard<std::mutex> lock(dbMutex_);

    if (db_ == nullptr) return false;

    sqlite3_stmt* stmt;

    const char* positionSql = R"(
        SELECT loan_id, subject, collateral_asset, collateral_amount, original_principal, principal,
               accrued_interest, rate_bps, last_accrual, liquidation_threshold, tier, credit_score,
               opened_at, active
        FROM pool_positions;
    )";
    if (sqlite3_prepare_v2(db_, positionSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to prepare position query: %s\n", sqlite3_errmsg(db_));
        return false;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        LoanPosition position;
        position.loanId = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        position.subject = ColumnUint160(stmt, 1);
        position.collateralAsset = ColumnUint160(stmt, 2);
        position.collateralAmount = sqlite3_column_int64(stmt, 3);
        position.originalPrincipal = sqlite3_column_int64(stmt, 4);
        position.principal = sqlite3_column_int64(stmt, 5);
        position.accruedInterest = sqlite3_column_int64(stmt, 6);
        position.rateBps = sqlite3_column_int64(stmt, 7);
        position.lastAccrual = sqlite3_column_int64(stmt, 8);
        position.liquidationThresholdBps = sqlite3_column_int64(stmt, 9);
        int tier = sqlite3_column_int(stmt, 10);
        if (tier < 0 || tier >= static_cast<int>(TIER_COUNT)) {
            LogPrintf("LedgerDB: Position %u has unknown tier %d\n", position.loanId, tier);
            sqlite3_finalize(stmt);
            return false;
        }
        position.tier = static_cast<Tier>(tier);
        position.creditScore = sqlite3_column_int64(stmt, 11);
        position.openedAt = sqlite3_column_int64(stmt, 12);
        position.active = sqlite3_column_int(stmt, 13) != 0;
        positions[position.loanId] = position;
    }
    sqlite3_finalize(stmt);

    const char* lenderSql = "SELECT lender, balance FROM pool_lenders;";
    if (sqlite3_prepare_v2(db_, lenderSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to prepare lender query: %s\n", sqlite3_errmsg(db_));
        return false;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        lenderBalances[ColumnUint160(stmt, 0)] = sqlite3_column_int64(stmt, 1);
    }
    sqlite3_finalize(stmt);

    int64_t paused = 0;
    if (!ReadMeta("pool_cash", totals.cash) || !ReadMeta("pool_total_borrows", totals.totalBorrows) ||
        !ReadMeta("pool_reserves", totals.reserves) || !ReadMeta("pool_paused", paused)) {
        return false;
    }
    totals.paused = paused != 0;

    LogPrint(BCLog::DB, "LedgerDB: Read %u pool positions, %u lenders\n", positions.size(), lenderBalances.size());
    return true;
}

// ============================================================================
// Insurance fund
// ============================================================================

bool LedgerDB::ApplyFundTransition(const FundStatistics& stats, const DefaultRecord* record)
{
    std::lock_guard<std::mutex> lock(dbMutex_);

    return InTransaction("fund update", [this, &stats, record]() {
        if (record) {
            const char* sql = R"(
                INSERT INTO fund_defaults (subject, loan_id, principal, loss, covered, timestamp)
                VALUES (?, ?, ?, ?, ?, ?);
            )";
            bool written = ExecuteStatement(sql, "default record", [record](sqlite3_stmt* stmt) {
                BindHex(stmt, 1, record->subject.GetHex());
                sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(record->loanId));
                sqlite3_bind_int64(stmt, 3, record->principal);
                sqlite3_bind_int64(stmt, 4, record->lossAmount);
                sqlite3_bind_int64(stmt, 5, record->coveredAmount);
                sqlite3_bind_int64(stmt, 6, record->timestamp);
            });
            if (!written) return false;
        }
        return WriteMeta("fund_balance", stats.balance) &&
               WriteMeta("fund_total_covered", stats.totalCovered) &&
               WriteMeta("fund_total_defaults", static_cast<int64_t>(stats.totalDefaults)) &&
               WriteMeta("fund_total_deposited", stats.totalDeposited) &&
               WriteMeta("fund_total_revenue", stats.totalRevenueAllocated);
    });
}

bool LedgerDB::LoadFundState(FundStatistics& stats, std::map<Subject, std::vector<DefaultRecord>>& defaults)
{
    std::lock_guard<std::mutex> lock(dbMutex_);

    if (db_ == nullptr) return false;

    int64_t totalDefaults = 0;
    if (!ReadMeta("fund_balance", stats.balance) || !ReadMeta("fund_total_covered", stats.totalCovered) ||
        !ReadMeta("fund_total_defaults", totalDefaults) ||
        !ReadMeta("fund_total_deposited", stats.totalDeposited) ||
        !ReadMeta("fund_total_revenue", stats.totalRevenueAllocated)) {
        return false;
    }
    stats.totalDefaults = static_cast<uint64_t>(totalDefaults);

    sqlite3_stmt* stmt;
    const char* sql = "SELECT subject, loan_id, principal, loss, covered, timestamp FROM fund_defaults ORDER BY id;";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to prepare default query: %s\n", sqlite3_errmsg(db_));
        return false;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        DefaultRecord record;
        record.subject = ColumnUint160(stmt, 0);
        record.loanId = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
        record.principal = sqlite3_column_int64(stmt, 2);
        record.lossAmount = sqlite3_column_int64(stmt, 3);
        record.coveredAmount = sqlite3_column_int64(stmt, 4);
        record.timestamp = sqlite3_column_int64(stmt, 5);
        defaults[record.subject].push_back(record);
    }
    sqlite3_finalize(stmt);
    return true;
}

// ============================================================================
// Auctions
// ============================================================================

bool LedgerDB::WriteAuction(const Auction& auction, uint64_t nextAuctionId)
{
    std::lock_guard<std::mutex> lock(dbMutex_);

    return InTransaction("auction", [this, &auction, nextAuctionId]() {
        const char* sql = R"(
            INSERT OR REPLACE INTO auctions (id, loan_id, subject, debt, collateral_amount, collateral_asset,
                                             grace_end, auction_start, state, executor, executed_at,
                                             sale_price, paid, covered, cancel_reason)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
        )";
        bool written = ExecuteStatement(sql, "auction", [&auction](sqlite3_stmt* stmt) {
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(auction.id));
            sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(auction.loanId));
            BindHex(stmt, 3, auction.subject.GetHex());
            sqlite3_bind_int64(stmt, 4, auction.debtAmount);
            sqlite3_bind_int64(stmt, 5, auction.collateralAmount);
            BindHex(stmt, 6, auction.collateralAsset.GetHex());
            sqlite3_bind_int64(stmt, 7, auction.graceEnd);
            sqlite3_bind_int64(stmt, 8, auction.auctionStart);
            sqlite3_bind_int(stmt, 9, static_cast<int>(auction.state));
            BindHex(stmt, 10, auction.executor.GetHex());
            sqlite3_bind_int64(stmt, 11, auction.executedAt);
            sqlite3_bind_int64(stmt, 12, auction.salePrice);
            sqlite3_bind_int64(stmt, 13, auction.paidAmount);
            sqlite3_bind_int64(stmt, 14, auction.coveredAmount);
            sqlite3_bind_text(stmt, 15, auction.cancelReason.c_str(), -1, SQLITE_TRANSIENT);
        });
        return written && WriteMeta("next_auction_id", static_cast<int64_t>(nextAuctionId));
    });
}

bool LedgerDB::LoadAuctions(std::map<uint64_t, Auction>& auctions, uint64_t& nextAuctionId)
{
    std::lock_guard<std::mutex> lock(dbMutex_);

    if (db_ == nullptr) return false;

    sqlite3_stmt* stmt;
    const char* sql = R"(
        SELECT id, loan_id, subject, debt, collateral_amount, collateral_asset, grace_end, auction_start,
               state, executor, executed_at, sale_price, paid, covered, cancel_reason
        FROM auctions;
    )";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to prepare auction query: %s\n", sqlite3_errmsg(db_));
        return false;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Auction auction;
        auction.id = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        auction.loanId = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
        auction.subject = ColumnUint160(stmt, 2);
        auction.debtAmount = sqlite3_column_int64(stmt, 3);
        auction.collateralAmount = sqlite3_column_int64(stmt, 4);
        auction.collateralAsset = ColumnUint160(stmt, 5);
        auction.graceEnd = sqlite3_column_int64(stmt, 6);
        auction.auctionStart = sqlite3_column_int64(stmt, 7);
        int state = sqlite3_column_int(stmt, 8);
        if (state < 0 || state > static_cast<int>(AuctionState::CANCELLED)) {
            LogPrintf("LedgerDB: Auction %u has unknown state %d\n", auction.id, state);
            sqlite3_finalize(stmt);
            return false;
        }
        auction.state = static_cast<AuctionState>(state);
        auction.executor = ColumnUint160(stmt, 9);
        auction.executedAt = sqlite3_column_int64(stmt, 10);
        auction.salePrice = sqlite3_column_int64(stmt, 11);
        auction.paidAmount = sqlite3_column_int64(stmt, 12);
        auction.coveredAmount = sqlite3_column_int64(stmt, 13);
        auction.cancelReason = ColumnText(stmt, 14);
        auctions[auction.id] = auction;
    }
    sqlite3_finalize(stmt);

    int64_t next = 1;
    if (!ReadMeta("next_auction_id", next)) {
        return false;
    }
    nextAuctionId = static_cast<uint64_t>(next);
    return true;
}

// ============================================================================
// Score attestations
// ============================================================================

bool LedgerDB::ApplyAttestationTransition(const AttestationTransition& transition)
{
    std::lock_guard<std::mutex> lock(dbMutex_);

    const std::string subject = transition.subject.GetHex();
    return InTransaction("attestation", [this, &transition, &subject]() {
        auto bindSubject = [&subject](sqlite3_stmt* stmt) { BindHex(stmt, 1, subject); };

        if (transition.eraseAttestation &&
            !ExecuteStatement("DELETE FROM score_attestations WHERE subject = ?;", "attestation", bindSubject)) {
            return false;
        }
        if (transition.eraseChallenge &&
            !ExecuteStatement("DELETE FROM score_challenges WHERE subject = ?;", "challenge", bindSubject)) {
            return false;
        }

        if (transition.attestation) {
            const ScoreAttestation& a = *transition.attestation;
            const char* sql = R"(
                INSERT OR REPLACE INTO score_attestations (subject, score, tier, ltv, rate_multiplier,
                                                           data_quality, merkle_root, score_hash, attester,
                                                           attested_at, challenged, finalized)
                VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
            )";
            bool written = ExecuteStatement(sql, "attestation", [&a, &subject](sqlite3_stmt* stmt) {
                BindHex(stmt, 1, subject);
                sqlite3_bind_int64(stmt, 2, a.score);
                sqlite3_bind_int(stmt, 3, a.tier);
                sqlite3_bind_int64(stmt, 4, a.ltv);
                sqlite3_bind_int64(stmt, 5, a.rateMultiplierBps);
                sqlite3_bind_int64(stmt, 6, a.dataQuality);
                BindHex(stmt, 7, a.merkleRoot.GetHex());
                BindHex(stmt, 8, a.scoreHash.GetHex());
                BindHex(stmt, 9, a.attester.GetHex());
                sqlite3_bind_int64(stmt, 10, a.attestedAt);
                sqlite3_bind_int(stmt, 11, a.challenged ? 1 : 0);
                sqlite3_bind_int(stmt, 12, a.finalized ? 1 : 0);
            });
            if (!written) return false;
        }

        if (transition.challenge) {
            const ScoreChallenge& c = *transition.challenge;
            const char* sql = R"(
                INSERT OR REPLACE INTO score_challenges (subject, challenger, reason, bond, challenged_at,
                                                         resolved, upheld)
                VALUES (?, ?, ?, ?, ?, ?, ?);
            )";
            bool written = ExecuteStatement(sql, "challenge", [&c, &subject](sqlite3_stmt* stmt) {
                BindHex(stmt, 1, subject);
                BindHex(stmt, 2, c.challenger.GetHex());
                sqlite3_bind_text(stmt, 3, c.reason.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_int64(stmt, 4, c.bond);
                sqlite3_bind_int64(stmt, 5, c.challengedAt);
                sqlite3_bind_int(stmt, 6, c.resolved ? 1 : 0);
                sqlite3_bind_int(stmt, 7, c.upheld ? 1 : 0);
            });
            if (!written) return false;
        }

        if (transition.finalized) {
            const FinalizedScore& f = *transition.finalized;
            const char* sql = R"(
                INSERT OR REPLACE INTO finalized_scores (subject, score, tier, ltv, rate_multiplier,
                                                         data_quality, finalized_at)
                VALUES (?, ?, ?, ?, ?, ?, ?);
            )";
            bool written = ExecuteStatement(sql, "finalized score", [&f, &subject](sqlite3_stmt* stmt) {
                BindHex(stmt, 1, subject);
                sqlite3_bind_int64(stmt, 2, f.score);
                sqlite3_bind_int(stmt, 3, f.tier);
                sqlite3_bind_int64(stmt, 4, f.ltv);
                sqlite3_bind_int64(stmt, 5, f.rateMultiplierBps);
                sqlite3_bind_int64(stmt, 6, f.dataQuality);
                sqlite3_bind_int64(stmt, 7, f.finalizedAt);
            });
            if (!written) return false;
        }
        return true;
    });
}

bool LedgerDB::LoadAttestationState(std::map<Subject, ScoreAttestation>& attestations,
                                    std::map<Subject, ScoreChallenge>& challenges,
                                    std::map<Subject, FinalizedScore>& finalized)
{
    std::lock_guard<std::mutex> lock(dbMutex_);

    if (db_ == nullptr) return false;

    sqlite3_stmt* stmt;

    const char* attestationSql = R"(
        SELECT subject, score, tier, ltv, rate_multiplier, data_quality, merkle_root, score_hash,
               attester, attested_at, challenged, finalized
        FROM score_attestations;
    )";
    if (sqlite3_prepare_v2(db_, attestationSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to prepare attestation query: %s\n", sqlite3_errmsg(db_));
        return false;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ScoreAttestation a;
        a.subject = ColumnUint160(stmt, 0);
        a.score = sqlite3_column_int64(stmt, 1);
        a.tier = static_cast<uint8_t>(sqlite3_column_int(stmt, 2));
        a.ltv = sqlite3_column_int64(stmt, 3);
        a.rateMultiplierBps = sqlite3_column_int64(stmt, 4);
        a.dataQuality = sqlite3_column_int64(stmt, 5);
        a.merkleRoot = ColumnUint256(stmt, 6);
        a.scoreHash = ColumnUint256(stmt, 7);
        a.attester = ColumnUint160(stmt, 8);
        a.attestedAt = sqlite3_column_int64(stmt, 9);
        a.challenged = sqlite3_column_int(stmt, 10) != 0;
        a.finalized = sqlite3_column_int(stmt, 11) != 0;
        attestations[a.subject] = a;
    }
    sqlite3_finalize(stmt);

    const char* challengeSql = R"(
        SELECT subject, challenger, reason, bond, challenged_at, resolved, upheld FROM score_challenges;
    )";
    if (sqlite3_prepare_v2(db_, challengeSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to prepare challenge query: %s\n", sqlite3_errmsg(db_));
        return false;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ScoreChallenge c;
        c.challenger = ColumnUint160(stmt, 1);
        c.reason = ColumnText(stmt, 2);
        c.bond = sqlite3_column_int64(stmt, 3);
        c.challengedAt = sqlite3_column_int64(stmt, 4);
        c.resolved = sqlite3_column_int(stmt, 5) != 0;
        c.upheld = sqlite3_column_int(stmt, 6) != 0;
        challenges[ColumnUint160(stmt, 0)] = c;
    }
    sqlite3_finalize(stmt);

    const char* finalizedSql = R"(
        SELECT subject, score, tier, ltv, rate_multiplier, data_quality, finalized_at FROM finalized_scores;
    )";
    if (sqlite3_prepare_v2(db_, finalizedSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("LedgerDB: Failed to prepare finalized score query: %s\n", sqlite3_errmsg(db_));
        return false;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        FinalizedScore f;
        f.score = sqlite3_column_int64(stmt, 1);
        f.tier = static_cast<uint8_t>(sqlite3_column_int(stmt, 2));
        f.ltv = sqlite3_column_int64(stmt, 3);
        f.rateMultiplierBps = sqlite3_column_int64(stmt, 4);
        f.dataQuality = sqlite3_column_int64(stmt, 5);
        f.finalizedAt = sqlite3_column_int64(stmt, 6);
        finalized[ColumnUint160(stmt, 0)] = f;
    }
    sqlite3_finalize(stmt);

    return true;
}

} // namespace credit
