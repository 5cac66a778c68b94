#include "FlagEngine.hpp"
#include "Errors.hpp"
#include "../crypto/Crypto.hpp"
#include <spdlog/spdlog.h>

FlagEngine::FlagEngine(const EngineConfig& config, const Clock& clock,
    UserStore& u, ChallengeStore& c, SubmissionLog& l)
    : cfg(config),
    users(u),
    challenges(c),
    log(l),
    minter(cfg, clock),
    verifier(minter),
    rotator(cfg, clock, users),
    orchestrator(cfg, clock, minter, rotator, users, log),
    account_manager(users, clock),
    challenge_catalog(challenges, clock)
{
    Crypto::init();
    spdlog::info("FlagEngine initialized: window={} min, salt rotation={} h",
        cfg.windowMinutes(), cfg.salt_rotation_seconds / 3600);
}

bool FlagEngine::verifyAnswer(const std::string& answer, const TruthDigest& truth_digest) const {
    return TruthHasher::verify(answer, truth_digest);
}

FlagToken FlagEngine::mintFlag(const std::string& user_id,
    const std::string& challenge_id,
    const TruthDigest& truth_digest,
    const std::string& challenge_salt,
    const std::string& user_salt) const
{
    return minter.mintCurrent(user_id, challenge_id, truth_digest, challenge_salt, user_salt);
}

VerificationOutcome FlagEngine::verifyFlag(std::string_view token,
    const std::string& user_id,
    const std::string& challenge_id,
    const TruthDigest& truth_digest,
    const std::string& challenge_salt,
    const std::string& user_salt) const
{
    if (!minter.hasValidShape(token)) {
        spdlog::warn("Malformed flag submitted by user '{}' for challenge '{}'", user_id, challenge_id);
        throw MalformedTokenError();
    }
    return verifier.verify(token, user_id, challenge_id, truth_digest, challenge_salt, user_salt);
}

SubmissionResult FlagEngine::processSubmission(const User& user,
    const Challenge& challenge,
    const std::string& answer,
    const SubmissionMetadata& metadata)
{
    return orchestrator.process(user, challenge, answer, metadata);
}

SubmissionResult FlagEngine::submitAnswer(const std::string& user_id,
    const std::string& challenge_id,
    const std::string& answer,
    const SubmissionMetadata& metadata)
{
    const User user = requireUser(user_id);
    const Challenge challenge = requireChallenge(challenge_id);
    return orchestrator.process(user, challenge, answer, metadata);
}

VerificationOutcome FlagEngine::submitFlag(const std::string& user_id,
    const std::string& challenge_id,
    std::string_view token) const
{
    const User user = requireUser(user_id);
    const Challenge challenge = requireChallenge(challenge_id);
    if (!challenge.is_active) {
        spdlog::warn("Flag submitted to inactive challenge '{}'", challenge_id);
        throw ChallengeInactiveError(challenge_id);
    }

    const VerificationOutcome outcome = verifyFlag(token, user.id, challenge.id,
        challenge.truth_digest, challenge.challenge_salt, user.flag_salt);
    spdlog::info("Flag submission by user '{}' for challenge '{}': {}",
        user_id, challenge_id, outcomeReason(outcome));
    return outcome;
}

std::size_t FlagEngine::attemptsCount(const std::string& user_id, const std::string& challenge_id) const {
    return log.countAttempts(user_id, challenge_id);
}

bool FlagEngine::hasSolved(const std::string& user_id, const std::string& challenge_id) const {
    return log.hasCorrectSubmission(user_id, challenge_id);
}

std::vector<SubmissionRecord> FlagEngine::submissionHistory(const std::string& user_id) const {
    return log.recordsForUser(user_id);
}

User FlagEngine::requireUser(const std::string& user_id) const {
    auto user = users.findUser(user_id);
    if (!user) {
        spdlog::warn("Unknown user '{}'", user_id);
        throw UserNotFoundError(user_id);
    }
    return *user;
}

Challenge FlagEngine::requireChallenge(const std::string& challenge_id) const {
    auto challenge = challenges.findChallenge(challenge_id);
    if (!challenge) {
        spdlog::warn("Unknown challenge '{}'", challenge_id);
        throw ChallengeNotFoundError(challenge_id);
    }
    return *challenge;
}
