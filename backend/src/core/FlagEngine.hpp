#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "ChallengeCatalog.hpp"
#include "FlagMinter.hpp"
#include "FlagVerifier.hpp"
#include "Submission.hpp"
#include "SubmissionOrchestrator.hpp"
#include "TimeWindow.hpp"
#include "../auth/AccountManager.hpp"
#include "../auth/SaltRotator.hpp"
#include "../config/EngineConfig.hpp"
#include "../storage/Storage.hpp"

// Entry point for callers: wires the hasher, minter, verifier, rotator and
// orchestrator to one configuration, one clock and the three stores.
// The stores and the clock must outlive the engine. Throws PreconditionError
// if the config fails validateConfig().
class FlagEngine {
public:
    FlagEngine(const EngineConfig& config, const Clock& clock,
        UserStore& users, ChallengeStore& challenges, SubmissionLog& log);

    FlagEngine(const FlagEngine&) = delete;
    FlagEngine& operator=(const FlagEngine&) = delete;

    bool verifyAnswer(const std::string& answer, const TruthDigest& truth_digest) const;

    FlagToken mintFlag(const std::string& user_id,
        const std::string& challenge_id,
        const TruthDigest& truth_digest,
        const std::string& challenge_salt,
        const std::string& user_salt) const;

    // Throws MalformedTokenError if the token does not even have the flag
    // envelope; otherwise Valid or InvalidOrExpired.
    VerificationOutcome verifyFlag(std::string_view token,
        const std::string& user_id,
        const std::string& challenge_id,
        const TruthDigest& truth_digest,
        const std::string& challenge_salt,
        const std::string& user_salt) const;

    SubmissionResult processSubmission(const User& user,
        const Challenge& challenge,
        const std::string& answer,
        const SubmissionMetadata& metadata);

    // processSubmission() after looking both records up by id.
    SubmissionResult submitAnswer(const std::string& user_id,
        const std::string& challenge_id,
        const std::string& answer,
        const SubmissionMetadata& metadata);

    // Direct flag submission against the stored user and challenge.
    VerificationOutcome submitFlag(const std::string& user_id,
        const std::string& challenge_id,
        std::string_view token) const;

    std::size_t attemptsCount(const std::string& user_id, const std::string& challenge_id) const;
    bool hasSolved(const std::string& user_id, const std::string& challenge_id) const;
    std::vector<SubmissionRecord> submissionHistory(const std::string& user_id) const;

    AccountManager& accounts() { return account_manager; }
    ChallengeCatalog& catalog() { return challenge_catalog; }
    const EngineConfig& config() const { return cfg; }

private:
    EngineConfig cfg;
    UserStore& users;
    ChallengeStore& challenges;
    SubmissionLog& log;

    FlagMinter minter;
    FlagVerifier verifier;
    SaltRotator rotator;
    SubmissionOrchestrator orchestrator;
    AccountManager account_manager;
    ChallengeCatalog challenge_catalog;

    User requireUser(const std::string& user_id) const;
    Challenge requireChallenge(const std::string& challenge_id) const;
};
