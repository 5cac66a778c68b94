#include "FlagVerifier.hpp"
#include "../crypto/Crypto.hpp"
#include <spdlog/spdlog.h>

const char* outcomeReason(VerificationOutcome outcome) {
    switch (outcome) {
    case VerificationOutcome::Valid:
        return "valid";
    case VerificationOutcome::InvalidOrExpired:
        return "invalid_or_expired";
    }
    return "invalid_or_expired";
}

FlagVerifier::FlagVerifier(const FlagMinter& m)
    : minter(m)
{
}

VerificationOutcome FlagVerifier::verify(std::string_view submitted,
    const std::string& user_id,
    const std::string& challenge_id,
    const TruthDigest& truth_digest,
    const std::string& challenge_salt,
    const std::string& user_salt) const
{
    return verifyAt(submitted, user_id, challenge_id, truth_digest,
        challenge_salt, user_salt, minter.currentEpoch());
}

VerificationOutcome FlagVerifier::verifyAt(std::string_view submitted,
    const std::string& user_id,
    const std::string& challenge_id,
    const TruthDigest& truth_digest,
    const std::string& challenge_salt,
    const std::string& user_salt,
    std::int64_t current_epoch) const
{
    const FlagToken expected_current = minter.mint(user_id, challenge_id, truth_digest,
        challenge_salt, user_salt, current_epoch);
    const FlagToken expected_previous = minter.mint(user_id, challenge_id, truth_digest,
        challenge_salt, user_salt, current_epoch - 1);

    // both comparisons always run; neither result gates the other
    const bool match_current = Crypto::equal(submitted, expected_current);
    const bool match_previous = Crypto::equal(submitted, expected_previous);

    if (match_current | match_previous) {
        spdlog::debug("Flag verified for user '{}' on challenge '{}'", user_id, challenge_id);
        return VerificationOutcome::Valid;
    }

    spdlog::debug("Flag rejected for user '{}' on challenge '{}'", user_id, challenge_id);
    return VerificationOutcome::InvalidOrExpired;
}
