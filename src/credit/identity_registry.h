// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_CREDIT_IDENTITY_REGISTRY_H
#define CREDITCORE_CREDIT_IDENTITY_REGISTRY_H

/**
 * @file identity_registry.h
 * @brief Identity proofs, stake commitments and activity counters per subject
 *
 * An identity proof is a compact recoverable secp256k1 signature from the
 * trusted issuer over (subject, commitmentHash, expiresAt). The registry keeps
 * only the latest proof per subject and never learns the identity behind the
 * commitment.
 *
 * Stakes are pulled from the subject into the registry's vault account and
 * are locked until lockUntil. A new stake can extend the lock but never
 * shorten it.
 */

#include <amount.h>
#include <credit/authorization.h>
#include <credit/credit_common.h>
#include <credit/token_ledger.h>
#include <sync.h>
#include <uint256.h>
#include <utiltime.h>

#include <map>
#include <optional>
#include <vector>

namespace credit {

class LedgerDB;

/** Longest lock a single stake may request */
static const int64_t MAX_LOCK_DURATION = 10 * SECONDS_PER_YEAR;

/** Prefix of the digest the identity issuer signs */
static const char* const IDENTITY_PROOF_MAGIC = "CreditCore Identity Proof:\n";

struct IdentityProof {
    uint256 commitmentHash;
    int64_t verifiedAt = 0;
    int64_t expiresAt = 0;

    bool IsValidAt(int64_t now) const { return expiresAt > now; }

    bool operator==(const IdentityProof& other) const {
        return commitmentHash == other.commitmentHash && verifiedAt == other.verifiedAt &&
               expiresAt == other.expiresAt;
    }
};

struct StakeCommitment {
    CAmount amount = 0;
    int64_t lockUntil = 0;

    bool operator==(const StakeCommitment& other) const {
        return amount == other.amount && lockUntil == other.lockUntil;
    }
};

struct ActivityCounters {
    uint64_t voteCount = 0;
    uint64_t proposalCount = 0;
    /** Set on first contact, never moved; 0 means never seen */
    int64_t firstSeen = 0;

    bool operator==(const ActivityCounters& other) const {
        return voteCount == other.voteCount && proposalCount == other.proposalCount &&
               firstSeen == other.firstSeen;
    }
};

/**
 * @brief Everything one identity write changes, persisted as a unit
 */
struct IdentityTransition {
    Subject subject;
    std::optional<IdentityProof> proof;
    std::optional<StakeCommitment> stake;
    /** firstSeen is only ever written over a stored 0 */
    std::optional<ActivityCounters> activity;
};

class IdentityRegistry
{
public:
    /**
     * @param gate Consulted for governance writes and issuer rotation
     * @param tokens Moves the stake asset
     * @param stakeAsset Asset accepted as stake
     * @param vault Account holding staked value; must be approved by stakers
     * @param trustedIssuer Key id of the verification issuer
     * @param db Optional durable backing; not owned
     */
    IdentityRegistry(const AuthorizationGate& gate, ValueTransfer& tokens, const AssetId& stakeAsset,
                     const Principal& vault, const uint160& trustedIssuer, LedgerDB* db = nullptr);

    bool LoadFromDatabase();

    /**
     * Digest the issuer signs:
     * SHA256d(IDENTITY_PROOF_MAGIC || subject || commitmentHash || expiresAt_le64)
     */
    static uint256 IdentityMessageHash(const Subject& subject, const uint256& commitmentHash,
                                       int64_t expiresAt);

    /**
     * Verify and store an identity proof, replacing any earlier one.
     * @param signature 65-byte compact recoverable signature
     */
    CreditResult SubmitIdentityProof(const Subject& subject, const uint256& commitmentHash,
                                     int64_t expiresAt, const std::vector<unsigned char>& signature,
                                     int64_t now);

    bool HasValidIdentity(const Subject& subject, int64_t now) const;
    std::optional<IdentityProof> GetIdentityProof(const Subject& subject) const;

    CreditResult Stake(const Subject& subject, CAmount amount, int64_t lockDuration, int64_t now);
    CreditResult Unstake(const Subject& subject, CAmount amount, int64_t now);
    StakeCommitment GetStake(const Subject& subject) const;

    /** Governance participation; caller must hold ADMIN */
    CreditResult RecordVote(const Principal& caller, const Subject& subject, int64_t now);
    CreditResult RecordProposal(const Principal& caller, const Subject& subject, int64_t now);

    /** Stamp firstSeen if not yet set */
    CreditResult Touch(const Subject& subject, int64_t now);

    /**
     * In-memory half of a firstSeen stamp the ledger already persisted with
     * a loan. No effect once firstSeen is set.
     */
    void ApplyFirstSeen(const Subject& subject, int64_t firstSeen);

    ActivityCounters GetActivity(const Subject& subject) const;

    CreditResult SetTrustedIssuer(const Principal& caller, const uint160& issuer);
    uint160 GetTrustedIssuer() const;

    const AssetId& GetStakeAsset() const { return stakeAsset_; }
    const Principal& GetVault() const { return vault_; }

private:
    /** Add a firstSeen stamp to transition if the subject has none */
    void StampFirstSeen(const Subject& subject, int64_t now, IdentityTransition& transition) const;

    /** Persist (if backed) then apply; nothing changes when persisting fails */
    bool Commit(const IdentityTransition& transition);

    const AuthorizationGate& gate_;
    ValueTransfer& tokens_;
    const AssetId stakeAsset_;
    const Principal vault_;
    LedgerDB* db_;

    mutable CCriticalSection cs_identity_;
    uint160 trustedIssuer_;
    std::map<Subject, IdentityProof> proofs_;
    std::map<Subject, StakeCommitment> stakes_;
    std::map<Subject, ActivityCounters> activity_;
};

} // namespace credit

#endif // CREDITCORE_CREDIT_IDENTITY_REGISTRY_H
