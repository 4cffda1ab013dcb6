// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/identity_registry.h>

#include <credit/ledger_db.h>
#include <hash.h>
#include <pubkey.h>
#include <util.h>
#include <utilmoneystr.h>

#include <algorithm>
#include <cstring>

namespace credit {

IdentityRegistry::IdentityRegistry(const AuthorizationGate& gate, ValueTransfer& tokens,
                                   const AssetId& stakeAsset, const Principal& vault,
                                   const uint160& trustedIssuer, LedgerDB* db)
    : gate_(gate)
    , tokens_(tokens)
    , stakeAsset_(stakeAsset)
    , vault_(vault)
    , db_(db)
    , trustedIssuer_(trustedIssuer)
{
}

bool IdentityRegistry::LoadFromDatabase()
{
    LOCK(cs_identity_);

    if (db_ == nullptr || !db_->IsInitialized()) {
        return false;
    }

    std::map<Subject, IdentityProof> proofs;
    std::map<Subject, StakeCommitment> stakes;
    std::map<Subject, ActivityCounters> activity;
    if (!db_->LoadIdentityState(proofs, stakes, activity)) {
        LogPrintf("Identity: Failed to load identity state from database\n");
        return false;
    }

    proofs_ = std::move(proofs);
    stakes_ = std::move(stakes);
    activity_ = std::move(activity);

    LogPrintf("Identity: Loaded %u proofs, %u stakes, %u activity records\n",
              proofs_.size(), stakes_.size(), activity_.size());
    return true;
}

uint256 IdentityRegistry::IdentityMessageHash(const Subject& subject, const uint256& commitmentHash,
                                              int64_t expiresAt)
{
    CHashWriter ss;
    ss.write(reinterpret_cast<const unsigned char*>(IDENTITY_PROOF_MAGIC), strlen(IDENTITY_PROOF_MAGIC));
    ss << subject << commitmentHash << expiresAt;
    return ss.GetHash();
}

CreditResult IdentityRegistry::SubmitIdentityProof(const Subject& subject, const uint256& commitmentHash,
                                                   int64_t expiresAt,
                                                   const std::vector<unsigned char>& signature,
                                                   int64_t now)
{
    LOCK(cs_identity_);

    if (expiresAt <= now) {
        return CreditResult::Fail(CreditError::PROOF_EXPIRED,
            strprintf("Proof expired at %d (now %d)", expiresAt, now));
    }
    if (trustedIssuer_.IsNull()) {
        return CreditResult::Fail(CreditError::INVALID_PROOF, "No trusted issuer configured");
    }
    if (signature.size() != CPubKey::COMPACT_SIGNATURE_SIZE) {
        return CreditResult::Fail(CreditError::INVALID_PROOF,
            strprintf("Signature must be %u bytes, got %u", CPubKey::COMPACT_SIGNATURE_SIZE, signature.size()));
    }

    uint256 hash = IdentityMessageHash(subject, commitmentHash, expiresAt);
    CPubKey signer;
    if (!signer.RecoverCompact(hash, signature)) {
        return CreditResult::Fail(CreditError::INVALID_PROOF, "Signature could not be recovered");
    }
    if (uint160(signer.GetID()) != trustedIssuer_) {
        LogPrint(BCLog::IDENTITY, "Identity: Rejected proof for %s signed by %s\n",
                 subject.GetHex(), signer.GetID().GetHex());
        return CreditResult::Fail(CreditError::INVALID_PROOF, "Signer is not the trusted issuer");
    }

    IdentityProof proof;
    proof.commitmentHash = commitmentHash;
    proof.verifiedAt = now;
    proof.expiresAt = expiresAt;

    IdentityTransition transition;
    transition.subject = subject;
    transition.proof = proof;
    StampFirstSeen(subject, now, transition);

    if (!Commit(transition)) {
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Identity proof could not be persisted");
    }

    LogPrintf("Identity: Verified %s until %d\n", subject.GetHex(), expiresAt);
    return CreditResult::Ok();
}

bool IdentityRegistry::HasValidIdentity(const Subject& subject, int64_t now) const
{
    LOCK(cs_identity_);
    auto it = proofs_.find(subject);
    return it != proofs_.end() && it->second.IsValidAt(now);
}

std::optional<IdentityProof> IdentityRegistry::GetIdentityProof(const Subject& subject) const
{
    LOCK(cs_identity_);
    auto it = proofs_.find(subject);
    if (it != proofs_.end()) {
        return it->second;
    }
    return std::nullopt;
}

CreditResult IdentityRegistry::Stake(const Subject& subject, CAmount amount, int64_t lockDuration,
                                     int64_t now)
{
    LOCK(cs_identity_);

    if (amount <= 0 || !MoneyRange(amount)) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT, "Stake must be positive");
    }
    if (lockDuration < 0 || lockDuration > MAX_LOCK_DURATION) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT,
            strprintf("Lock duration %d outside [0, %d]", lockDuration, MAX_LOCK_DURATION));
    }

    StakeCommitment updated = GetStake(subject);
    if (!MoneyRange(updated.amount + amount)) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT, "Stake exceeds money range");
    }
    updated.amount += amount;
    updated.lockUntil = std::max(updated.lockUntil, now + lockDuration);

    if (!tokens_.TransferFrom(stakeAsset_, vault_, subject, vault_, amount)) {
        return CreditResult::Fail(CreditError::TRANSFER_FAILED,
            strprintf("Could not pull %s stake from %s", FormatMoney(amount), subject.GetHex()));
    }

    IdentityTransition transition;
    transition.subject = subject;
    transition.stake = updated;
    StampFirstSeen(subject, now, transition);

    if (!Commit(transition)) {
        if (!tokens_.Transfer(stakeAsset_, vault_, subject, amount)) {
            LogPrintf("Identity: Failed to return stake of %s to %s after storage failure\n",
                      FormatMoney(amount), subject.GetHex());
        }
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Stake could not be persisted");
    }

    LogPrintf("Identity: %s staked %s, total %s locked until %d\n",
              subject.GetHex(), FormatMoney(amount), FormatMoney(updated.amount), updated.lockUntil);
    return CreditResult::Ok();
}

CreditResult IdentityRegistry::Unstake(const Subject& subject, CAmount amount, int64_t now)
{
    LOCK(cs_identity_);

    if (amount <= 0) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT, "Unstake amount must be positive");
    }

    StakeCommitment updated = GetStake(subject);
    if (now < updated.lockUntil) {
        return CreditResult::Fail(CreditError::LOCK_ACTIVE,
            strprintf("Stake locked until %d", updated.lockUntil));
    }
    if (amount > updated.amount) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT,
            strprintf("Unstake %s exceeds stake %s", FormatMoney(amount), FormatMoney(updated.amount)));
    }
    const StakeCommitment previous = updated;
    updated.amount -= amount;

    IdentityTransition transition;
    transition.subject = subject;
    transition.stake = updated;
    if (!Commit(transition)) {
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Stake could not be persisted");
    }
    if (!tokens_.Transfer(stakeAsset_, vault_, subject, amount)) {
        transition.stake = previous;
        if (!Commit(transition)) {
            LogPrintf("Identity: Stake record for %s out of sync with vault\n", subject.GetHex());
        }
        return CreditResult::Fail(CreditError::TRANSFER_FAILED, "Vault could not return stake");
    }

    LogPrintf("Identity: %s unstaked %s, remaining %s\n",
              subject.GetHex(), FormatMoney(amount), FormatMoney(updated.amount));
    return CreditResult::Ok();
}

StakeCommitment IdentityRegistry::GetStake(const Subject& subject) const
{
    LOCK(cs_identity_);
    auto it = stakes_.find(subject);
    return it != stakes_.end() ? it->second : StakeCommitment();
}

CreditResult IdentityRegistry::RecordVote(const Principal& caller, const Subject& subject, int64_t now)
{
    LOCK(cs_identity_);

    CreditResult auth = gate_.Require(Capability::ADMIN, caller);
    if (!auth) return auth;

    IdentityTransition transition;
    transition.subject = subject;
    transition.activity = GetActivity(subject);
    transition.activity->voteCount++;
    StampFirstSeen(subject, now, transition);
    if (!Commit(transition)) {
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Activity could not be persisted");
    }

    LogPrint(BCLog::IDENTITY, "Identity: Vote recorded for %s (%u total)\n",
             subject.GetHex(), transition.activity->voteCount);
    return CreditResult::Ok();
}

CreditResult IdentityRegistry::RecordProposal(const Principal& caller, const Subject& subject, int64_t now)
{
    LOCK(cs_identity_);

    CreditResult auth = gate_.Require(Capability::ADMIN, caller);
    if (!auth) return auth;

    IdentityTransition transition;
    transition.subject = subject;
    transition.activity = GetActivity(subject);
    transition.activity->proposalCount++;
    StampFirstSeen(subject, now, transition);
    if (!Commit(transition)) {
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Activity could not be persisted");
    }

    LogPrint(BCLog::IDENTITY, "Identity: Proposal recorded for %s (%u total)\n",
             subject.GetHex(), transition.activity->proposalCount);
    return CreditResult::Ok();
}

CreditResult IdentityRegistry::Touch(const Subject& subject, int64_t now)
{
    LOCK(cs_identity_);

    IdentityTransition transition;
    transition.subject = subject;
    StampFirstSeen(subject, now, transition);
    if (!transition.activity) {
        return CreditResult::Ok();
    }
    if (!Commit(transition)) {
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Activity could not be persisted");
    }
    return CreditResult::Ok();
}

void IdentityRegistry::ApplyFirstSeen(const Subject& subject, int64_t firstSeen)
{
    LOCK(cs_identity_);
    ActivityCounters& activity = activity_[subject];
    if (activity.firstSeen == 0) {
        activity.firstSeen = firstSeen;
    }
}

ActivityCounters IdentityRegistry::GetActivity(const Subject& subject) const
{
    LOCK(cs_identity_);
    auto it = activity_.find(subject);
    return it != activity_.end() ? it->second : ActivityCounters();
}

CreditResult IdentityRegistry::SetTrustedIssuer(const Principal& caller, const uint160& issuer)
{
    LOCK(cs_identity_);

    CreditResult auth = gate_.Require(Capability::ADMIN, caller);
    if (!auth) return auth;

    trustedIssuer_ = issuer;
    LogPrintf("Identity: Trusted issuer set to %s\n", issuer.GetHex());
    return CreditResult::Ok();
}

uint160 IdentityRegistry::GetTrustedIssuer() const
{
    LOCK(cs_identity_);
    return trustedIssuer_;
}

void IdentityRegistry::StampFirstSeen(const Subject& subject, int64_t now, IdentityTransition& transition) const
{
    ActivityCounters activity = transition.activity ? *transition.activity : GetActivity(subject);
    if (activity.firstSeen == 0) {
        activity.firstSeen = now;
        transition.activity = activity;
    }
}

bool IdentityRegistry::Commit(const IdentityTransition& transition)
{
    if (db_ != nullptr && db_->IsInitialized() && !db_->ApplyIdentityTransition(transition)) {
        LogPrintf("Identity: Failed to persist update for %s\n", transition.subject.GetHex());
        return false;
    }

    if (transition.proof) {
        proofs_[transition.subject] = *transition.proof;
    }
    if (transition.stake) {
        stakes_[transition.subject] = *transition.stake;
    }
    if (transition.activity) {
        ActivityCounters& activity = activity_[transition.subject];
        const int64_t firstSeen = activity.firstSeen != 0 ? activity.firstSeen : transition.activity->firstSeen;
        activity = *transition.activity;
        activity.firstSeen = firstSeen;
    }
    return true;
}

} // namespace credit
