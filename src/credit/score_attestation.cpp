// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/score_attestation.h>

#include <credit/ledger_db.h>
#include <hash.h>
#include <util.h>
#include <utilmoneystr.h>

namespace credit {

constexpr int64_t ScoreAttestationRegistry::MIN_ATTESTED_SCORE;
constexpr int64_t ScoreAttestationRegistry::MAX_ATTESTED_SCORE;
constexpr uint8_t ScoreAttestationRegistry::MAX_ATTESTED_TIER;
constexpr int64_t ScoreAttestationRegistry::MAX_ATTESTED_LTV;

ScoreAttestationRegistry::ScoreAttestationRegistry(const AuthorizationGate& gate, ValueTransfer& tokens,
                                                   const AttestationParams& params, const AssetId& bondAsset,
                                                   const Principal& escrow, const Principal& treasury,
                                                   LedgerDB* db)
    : gate_(gate)
    , tokens_(tokens)
    , bondAsset_(bondAsset)
    , escrow_(escrow)
    , treasury_(treasury)
    , db_(db)
    , params_(params)
{
}

bool ScoreAttestationRegistry::LoadFromDatabase()
{
    LOCK(cs_attest_);

    if (db_ == nullptr || !db_->IsInitialized()) {
        return false;
    }

    std::map<Subject, ScoreAttestation> attestations;
    std::map<Subject, ScoreChallenge> challenges;
    std::map<Subject, FinalizedScore> finalized;
    if (!db_->LoadAttestationState(attestations, challenges, finalized)) {
        LogPrintf("Credit: Failed to load attestations from database\n");
        return false;
    }

    attestations_ = std::move(attestations);
    challenges_ = std::move(challenges);
    finalized_ = std::move(finalized);

    LogPrintf("Credit: Loaded %u attestations, %u challenges, %u finalized scores\n",
              attestations_.size(), challenges_.size(), finalized_.size());
    return true;
}

bool ScoreAttestationRegistry::Commit(const AttestationTransition& transition)
{
    if (db_ != nullptr && db_->IsInitialized() && !db_->ApplyAttestationTransition(transition)) {
        LogPrintf("Credit: Failed to persist attestation update for %s\n", transition.subject.GetHex());
        return false;
    }

    if (transition.eraseAttestation) attestations_.erase(transition.subject);
    if (transition.eraseChallenge) challenges_.erase(transition.subject);
    if (transition.attestation) attestations_[transition.subject] = *transition.attestation;
    if (transition.challenge) challenges_[transition.subject] = *transition.challenge;
    if (transition.finalized) finalized_[transition.subject] = *transition.finalized;
    return true;
}

uint256 ScoreAttestationRegistry::ScoreHash(int64_t score, uint8_t tier, int64_t ltv,
                                            int64_t rateMultiplierBps, int64_t dataQuality)
{
    CHashWriter ss;
    ss << score << static_cast<uint32_t>(tier) << ltv << rateMultiplierBps << dataQuality;
    return ss.GetHash();
}

CreditResult ScoreAttestationRegistry::AttestScore(const Principal& caller, const Subject& subject,
                                                   int64_t score, uint8_t tier, int64_t ltv,
                                                   int64_t rateMultiplierBps, int64_t dataQuality,
                                                   const uint256& merkleRoot, int64_t now)
{
    LOCK(cs_attest_);

    CreditResult auth = gate_.Require(Capability::ATTESTER, caller);
    if (!auth) return auth;

    if (score < MIN_ATTESTED_SCORE || score > MAX_ATTESTED_SCORE) {
        return CreditResult::Fail(CreditError::INVALID_SCORE,
            strprintf("Score %d outside [%d, %d]", score, MIN_ATTESTED_SCORE, MAX_ATTESTED_SCORE));
    }
    if (tier > MAX_ATTESTED_TIER) {
        return CreditResult::Fail(CreditError::INVALID_TIER, strprintf("Tier %u out of range", tier));
    }
    if (ltv < 0 || ltv > MAX_ATTESTED_LTV) {
        return CreditResult::Fail(CreditError::INVALID_LTV, strprintf("LTV %d%% out of range", ltv));
    }

    auto existing = attestations_.find(subject);
    if (existing != attestations_.end() && !existing->second.finalized) {
        return CreditResult::Fail(CreditError::ATTESTATION_PENDING,
            strprintf("Attestation for %s awaiting finalization", subject.GetHex()));
    }

    ScoreAttestation attestation;
    attestation.subject = subject;
    attestation.score = score;
    attestation.tier = tier;
    attestation.ltv = ltv;
    attestation.rateMultiplierBps = rateMultiplierBps;
    attestation.dataQuality = dataQuality;
    attestation.merkleRoot = merkleRoot;
    attestation.scoreHash = ScoreHash(score, tier, ltv, rateMultiplierBps, dataQuality);
    attestation.attester = caller;
    attestation.attestedAt = now;

    AttestationTransition transition;
    transition.subject = subject;
    transition.attestation = attestation;
    transition.eraseChallenge = true;
    if (!Commit(transition)) {
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Attestation could not be persisted");
    }

    LogPrintf("Credit: Score %d attested for %s by %s, challengeable until %d\n",
              score, subject.GetHex(), caller.GetHex(), now + params_.challengePeriod);
    return CreditResult::Ok();
}

CreditResult ScoreAttestationRegistry::ChallengeScore(const Principal& challenger, const Subject& subject,
                                                      const std::string& reason, CAmount bond, int64_t now)
{
    LOCK(cs_attest_);

    auto it = attestations_.find(subject);
    if (it == attestations_.end() || it->second.finalized) {
        return CreditResult::Fail(CreditError::UNKNOWN_ATTESTATION,
            strprintf("No pending attestation for %s", subject.GetHex()));
    }
    const ScoreAttestation& attestation = it->second;

    if (now >= attestation.attestedAt + params_.challengePeriod) {
        return CreditResult::Fail(CreditError::CHALLENGE_PERIOD_NOT_EXPIRED,
            strprintf("Challenge window closed at %d", attestation.attestedAt + params_.challengePeriod));
    }
    if (attestation.challenged) {
        return CreditResult::Fail(CreditError::ALREADY_CHALLENGED);
    }
    if (bond < params_.challengeBond) {
        return CreditResult::Fail(CreditError::INSUFFICIENT_BOND,
            strprintf("Bond %s below required %s", FormatMoney(bond), FormatMoney(params_.challengeBond)));
    }
    if (!tokens_.TransferFrom(bondAsset_, escrow_, challenger, escrow_, bond)) {
        return CreditResult::Fail(CreditError::TRANSFER_FAILED, "Challenge bond could not be collected");
    }

    ScoreChallenge challenge;
    challenge.challenger = challenger;
    challenge.reason = reason;
    challenge.bond = bond;
    challenge.challengedAt = now;

    AttestationTransition transition;
    transition.subject = subject;
    transition.attestation = attestation;
    transition.attestation->challenged = true;
    transition.challenge = challenge;
    if (!Commit(transition)) {
        if (!tokens_.Transfer(bondAsset_, escrow_, challenger, bond)) {
            LogPrintf("Credit: Failed to return bond of %s to %s after storage failure\n",
                      FormatMoney(bond), challenger.GetHex());
        }
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Challenge could not be persisted");
    }

    LogPrintf("Credit: Attestation for %s challenged by %s: %s\n",
              subject.GetHex(), challenger.GetHex(), reason);
    return CreditResult::Ok();
}

CreditResult ScoreAttestationRegistry::ResolveChallenge(const Principal& caller, const Subject& subject,
                                                        bool upheld, int64_t now)
{
    LOCK(cs_attest_);

    CreditResult auth = gate_.Require(Capability::ADMIN, caller);
    if (!auth) return auth;

    auto it = challenges_.find(subject);
    if (it == challenges_.end() || it->second.resolved) {
        return CreditResult::Fail(CreditError::CHALLENGE_NOT_FOUND,
            strprintf("No open challenge for %s", subject.GetHex()));
    }
    const ScoreChallenge challenge = it->second;
    const Principal recipient = upheld ? challenge.challenger : treasury_;

    AttestationTransition resolved;
    resolved.subject = subject;
    resolved.challenge = challenge;
    resolved.challenge->resolved = true;
    resolved.challenge->upheld = upheld;
    resolved.eraseAttestation = upheld;

    AttestationTransition previous;
    previous.subject = subject;
    previous.challenge = challenge;
    auto attestation = attestations_.find(subject);
    if (attestation != attestations_.end()) {
        previous.attestation = attestation->second;
    }

    if (!Commit(resolved)) {
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Resolution could not be persisted");
    }
    if (!tokens_.Transfer(bondAsset_, escrow_, recipient, challenge.bond)) {
        if (!Commit(previous)) {
            LogPrintf("Credit: Challenge record for %s out of sync with escrow\n", subject.GetHex());
        }
        return CreditResult::Fail(CreditError::TRANSFER_FAILED, "Escrow could not release challenge bond");
    }

    LogPrintf("Credit: Challenge on %s %s at %d, bond %s to %s\n", subject.GetHex(),
              upheld ? "upheld" : "rejected", now, FormatMoney(challenge.bond), recipient.GetHex());
    return CreditResult::Ok();
}

CreditResult ScoreAttestationRegistry::FinalizeScore(const Subject& subject, int64_t score, uint8_t tier,
                                                     int64_t ltv, int64_t rateMultiplierBps,
                                                     int64_t dataQuality, int64_t now)
{
    LOCK(cs_attest_);

    auto it = attestations_.find(subject);
    if (it == attestations_.end() || it->second.finalized) {
        return CreditResult::Fail(CreditError::UNKNOWN_ATTESTATION,
            strprintf("No pending attestation for %s", subject.GetHex()));
    }
    const ScoreAttestation& attestation = it->second;

    if (now < attestation.attestedAt + params_.challengePeriod) {
        return CreditResult::Fail(CreditError::CHALLENGE_PERIOD_NOT_EXPIRED,
            strprintf("Challenge window open until %d", attestation.attestedAt + params_.challengePeriod));
    }
    auto challenge = challenges_.find(subject);
    if (challenge != challenges_.end() && !challenge->second.resolved) {
        return CreditResult::Fail(CreditError::CHALLENGE_PERIOD_ACTIVE, "Challenge awaiting resolution");
    }
    if (ScoreHash(score, tier, ltv, rateMultiplierBps, dataQuality) != attestation.scoreHash) {
        return CreditResult::Fail(CreditError::INVALID_SCORE, "Terms do not match the attested digest");
    }

    FinalizedScore result;
    result.score = score;
    result.tier = tier;
    result.ltv = ltv;
    result.rateMultiplierBps = rateMultiplierBps;
    result.dataQuality = dataQuality;
    result.finalizedAt = now;

    AttestationTransition transition;
    transition.subject = subject;
    transition.attestation = attestation;
    transition.attestation->finalized = true;
    transition.finalized = result;
    if (!Commit(transition)) {
        return CreditResult::Fail(CreditError::STORAGE_FAILURE, "Finalized score could not be persisted");
    }

    LogPrintf("Credit: Score %d finalized for %s\n", score, subject.GetHex());
    return CreditResult::Ok();
}

bool ScoreAttestationRegistry::HasValidScore(const Subject& subject, int64_t maxAge, int64_t now) const
{
    LOCK(cs_attest_);
    auto it = finalized_.find(subject);
    return it != finalized_.end() && now - it->second.finalizedAt <= maxAge;
}

std::optional<FinalizedScore> ScoreAttestationRegistry::GetScore(const Subject& subject) const
{
    LOCK(cs_attest_);
    auto it = finalized_.find(subject);
    if (it != finalized_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<ScoreAttestation> ScoreAttestationRegistry::GetAttestation(const Subject& subject) const
{
    LOCK(cs_attest_);
    auto it = attestations_.find(subject);
    if (it != attestations_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<ScoreChallenge> ScoreAttestationRegistry::GetChallenge(const Subject& subject) const
{
    LOCK(cs_attest_);
    auto it = challenges_.find(subject);
    if (it != challenges_.end()) {
        return it->second;
    }
    return std::nullopt;
}

CreditResult ScoreAttestationRegistry::SetChallengePeriod(const Principal& caller, int64_t period)
{
    LOCK(cs_attest_);

    CreditResult auth = gate_.Require(Capability::ADMIN, caller);
    if (!auth) return auth;

    if (period < AttestationParams::MIN_CHALLENGE_PERIOD || period > AttestationParams::MAX_CHALLENGE_PERIOD) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT,
            strprintf("Challenge period %d outside [%d, %d]", period,
                      AttestationParams::MIN_CHALLENGE_PERIOD, AttestationParams::MAX_CHALLENGE_PERIOD));
    }
    params_.challengePeriod = period;
    params_.version++;
    LogPrintf("Credit: Challenge period set to %d seconds\n", period);
    return CreditResult::Ok();
}

CreditResult ScoreAttestationRegistry::SetChallengeBond(const Principal& caller, CAmount bond)
{
    LOCK(cs_attest_);

    CreditResult auth = gate_.Require(Capability::ADMIN, caller);
    if (!auth) return auth;

    if (bond < AttestationParams::MIN_CHALLENGE_BOND || bond > AttestationParams::MAX_CHALLENGE_BOND) {
        return CreditResult::Fail(CreditError::INVALID_AMOUNT,
            strprintf("Challenge bond %s out of range", FormatMoney(bond)));
    }
    params_.challengeBond = bond;
    params_.version++;
    LogPrintf("Credit: Challenge bond set to %s\n", FormatMoney(bond));
    return CreditResult::Ok();
}

void ScoreAttestationRegistry::SetParams(const AttestationParams& params)
{
    LOCK(cs_attest_);
    params_ = params;
}

AttestationParams ScoreAttestationRegistry::GetParams() const
{
    LOCK(cs_attest_);
    return params_;
}

} // namespace credit
