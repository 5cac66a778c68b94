#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include "FlagMinter.hpp"

enum class VerificationOutcome {
    Valid,
    InvalidOrExpired
};

// "valid" / "invalid_or_expired"
const char* outcomeReason(VerificationOutcome outcome);

// Recomputes the expected flag for the current and the previous window and
// compares in fixed time. A token minted in epoch n verifies while the
// verifier is in n or n+1; tokens from a window ahead of the verifier's clock
// are rejected.
class FlagVerifier {
public:
    explicit FlagVerifier(const FlagMinter& minter);

    VerificationOutcome verify(std::string_view submitted,
        const std::string& user_id,
        const std::string& challenge_id,
        const TruthDigest& truth_digest,
        const std::string& challenge_salt,
        const std::string& user_salt) const;

    // As verify(), with the verifier's current epoch given explicitly.
    VerificationOutcome verifyAt(std::string_view submitted,
        const std::string& user_id,
        const std::string& challenge_id,
        const TruthDigest& truth_digest,
        const std::string& challenge_salt,
        const std::string& user_salt,
        std::int64_t current_epoch) const;

private:
    const FlagMinter& minter;
};
