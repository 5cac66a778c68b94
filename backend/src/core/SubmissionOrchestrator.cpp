#include "SubmissionOrchestrator.hpp"
#include "Errors.hpp"
#include "../utils/Ids.hpp"
#include <spdlog/spdlog.h>

SubmissionOrchestrator::SubmissionOrchestrator(const EngineConfig& cfg,
    const Clock& clk,
    const FlagMinter& m,
    SaltRotator& r,
    UserStore& u,
    SubmissionLog& l)
    : config(cfg), clock(clk), minter(m), rotator(r), users(u), log(l)
{
}

SubmissionResult SubmissionOrchestrator::process(const User& user,
    const Challenge& challenge,
    const std::string& answer,
    const SubmissionMetadata& metadata)
{
    spdlog::info("Submission from user '{}' for challenge '{}'", user.id, challenge.id);

    if (!challenge.is_active) {
        spdlog::warn("Submission to inactive challenge '{}'", challenge.id);
        throw ChallengeInactiveError(challenge.id);
    }

    User current = rotateWithRetry(user);

    const bool already_solved = log.hasCorrectSubmission(current.id, challenge.id);
    const bool is_correct = TruthHasher::verify(answer, challenge.truth_digest);

    SubmissionRecord record;
    record.id = generateID();
    record.user_id = current.id;
    record.challenge_id = challenge.id;
    record.submitted_answer_hash = TruthHasher::hash(answer).toHex();
    record.is_correct = is_correct;
    record.created_at = clock.now();
    record.metadata = metadata;

    // throws StorageError; nothing has been handed out yet
    log.append(record);
    spdlog::debug("Recorded submission ID={} (correct={})", record.id, is_correct);

    SubmissionResult result;
    result.is_correct = is_correct;

    if (!is_correct) {
        result.message = INCORRECT_MESSAGE;
        return result;
    }

    // Mint with whatever salt is durable now; a rotation that landed after
    // ours must not leave the user holding a flag for a dead salt.
    const User stored = reload(current.id);
    if (stored.version != current.version) {
        spdlog::debug("User '{}' salt changed during submission; minting with stored salt", current.id);
    }

    result.flag = minter.mintCurrent(stored.id, challenge.id, challenge.truth_digest,
        challenge.challenge_salt, stored.flag_salt);

    const auto minutes = config.windowMinutes();
    if (already_solved) {
        result.message = "Correct! You've already solved this challenge. Flag expires in "
            + std::to_string(minutes) + " minutes.";
        result.points = 0;
    } else {
        result.message = "Correct! Here is your unique flag. It expires in "
            + std::to_string(minutes) + " minutes.";
        result.points = challenge.points;
    }

    spdlog::info("User '{}' solved challenge '{}'{}", current.id, challenge.id,
        already_solved ? " again" : "");
    return result;
}

User SubmissionOrchestrator::rotateWithRetry(const User& user) {
    User candidate = user;
    for (std::uint32_t attempt = 1; attempt <= config.max_rotation_retries; ++attempt) {
        try {
            return rotator.maybeRotate(candidate);
        } catch (const SaltConflictError&) {
            spdlog::debug("Rotation attempt {} for user '{}' conflicted; re-reading", attempt, user.id);
            candidate = reload(user.id);
        }
    }

    spdlog::error("Salt rotation for user '{}' did not settle after {} attempts",
        user.id, config.max_rotation_retries);
    throw StorageError("salt rotation contention for user " + user.id);
}

User SubmissionOrchestrator::reload(const std::string& user_id) const {
    auto fresh = users.findUser(user_id);
    if (!fresh) {
        spdlog::error("User '{}' disappeared during submission", user_id);
        throw UserNotFoundError(user_id);
    }
    return *fresh;
}
