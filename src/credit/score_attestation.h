// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_CREDIT_SCORE_ATTESTATION_H
#define CREDITCORE_CREDIT_SCORE_ATTESTATION_H

/**
 * @file score_attestation.h
 * @brief Attested scores with an optimistic challenge window
 *
 * An attester posts a score together with a digest of its terms. During the
 * challenge period anyone may dispute it by posting a bond. Once the window
 * has passed with no open challenge, anyone may finalize the attestation by
 * presenting terms that hash to the stored digest.
 *
 * Lifecycle:
 *   attested -> (challenged -> resolved)? -> finalized
 * An upheld challenge discards the attestation and refunds the bond; a
 * rejected one forfeits the bond to the treasury.
 */

#include <amount.h>
#include <credit/authorization.h>
#include <credit/credit_common.h>
#include <credit/credit_params.h>
#include <credit/token_ledger.h>
#include <sync.h>
#include <uint256.h>

#include <map>
#include <optional>
#include <string>

namespace credit {

struct ScoreAttestation {
    Subject subject;
    int64_t score = 0;
    uint8_t tier = 0;
    /** Whole percent */
    int64_t ltv = 0;
    int64_t rateMultiplierBps = 0;
    int64_t dataQuality = 0;
    /** Root of the off-ledger evidence the score was computed from */
    uint256 merkleRoot;
    uint256 scoreHash;
    Principal attester;
    int64_t attestedAt = 0;
    bool challenged = false;
    bool finalized = false;
};

struct ScoreChallenge {
    Principal challenger;
    std::string reason;
    CAmount bond = 0;
    int64_t challengedAt = 0;
    bool resolved = false;
    bool upheld = false;
};

struct FinalizedScore {
    int64_t score = 0;
    uint8_t tier = 0;
    int64_t ltv = 0;
    int64_t rateMultiplierBps = 0;
    int64_t dataQuality = 0;
    int64_t finalizedAt = 0;
};

/**
 * @brief Everything one attestation write changes, persisted as a unit
 */
struct AttestationTransition {
    Subject subject;
    std::optional<ScoreAttestation> attestation;
    bool eraseAttestation = false;
    std::optional<ScoreChallenge> challenge;
    bool eraseChallenge = false;
    std::optional<FinalizedScore> finalized;
};

class LedgerDB;

class ScoreAttestationRegistry
{
public:
    static constexpr int64_t MIN_ATTESTED_SCORE = 300;
    static constexpr int64_t MAX_ATTESTED_SCORE = 850;
    static constexpr uint8_t MAX_ATTESTED_TIER = 4;
    static constexpr int64_t MAX_ATTESTED_LTV = 90;

    /**
     * @param bondAsset Asset challengers post bonds in
     * @param escrow Account holding open bonds; challengers approve it
     * @param treasury Receives forfeited bonds
     * @param db Optional durable backing; not owned
     */
    ScoreAttestationRegistry(const AuthorizationGate& gate, ValueTransfer& tokens,
                             const AttestationParams& params, const AssetId& bondAsset,
                             const Principal& escrow, const Principal& treasury, LedgerDB* db = nullptr);

    bool LoadFromDatabase();

    /** Digest over the attested terms */
    static uint256 ScoreHash(int64_t score, uint8_t tier, int64_t ltv, int64_t rateMultiplierBps,
                             int64_t dataQuality);

    CreditResult AttestScore(const Principal& caller, const Subject& subject, int64_t score, uint8_t tier,
                             int64_t ltv, int64_t rateMultiplierBps, int64_t dataQuality,
                             const uint256& merkleRoot, int64_t now);

    CreditResult ChallengeScore(const Principal& challenger, const Subject& subject,
                                const std::string& reason, CAmount bond, int64_t now);

    /** @param upheld true if the attestation was wrong */
    CreditResult ResolveChallenge(const Principal& caller, const Subject& subject, bool upheld, int64_t now);

    CreditResult FinalizeScore(const Subject& subject, int64_t score, uint8_t tier, int64_t ltv,
                               int64_t rateMultiplierBps, int64_t dataQuality, int64_t now);

    /** A finalized score exists and is no older than maxAge */
    bool HasValidScore(const Subject& subject, int64_t maxAge, int64_t now) const;

    std::optional<FinalizedScore> GetScore(const Subject& subject) const;
    std::optional<ScoreAttestation> GetAttestation(const Subject& subject) const;
    std::optional<ScoreChallenge> GetChallenge(const Subject& subject) const;

    CreditResult SetChallengePeriod(const Principal& caller, int64_t period);
    CreditResult SetChallengeBond(const Principal& caller, CAmount bond);

    /** Replace the whole table; callers validate first */
    void SetParams(const AttestationParams& params);

    AttestationParams GetParams() const;

private:
    /** Persist (if backed) then apply; nothing changes when persisting fails */
    bool Commit(const AttestationTransition& transition);

    const AuthorizationGate& gate_;
    ValueTransfer& tokens_;
    const AssetId bondAsset_;
    const Principal escrow_;
    const Principal treasury_;
    LedgerDB* db_;

    mutable CCriticalSection cs_attest_;
    AttestationParams params_;
    std::map<Subject, ScoreAttestation> attestations_;
    std::map<Subject, ScoreChallenge> challenges_;
    std::map<Subject, FinalizedScore> finalized_;
};

} // namespace credit

#endif // CREDITCORE_CREDIT_SCORE_ATTESTATION_H
