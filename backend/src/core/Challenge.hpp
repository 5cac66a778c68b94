#pragma once
#include <cstdint>
#include <string>
#include "../crypto/TruthHasher.hpp"

// A challenge as the engine sees it. The answer itself is never held here,
// only its digest.
class Challenge {
public:
    Challenge() = default;

    // Authoring: hashes the truth and draws a fresh challenge salt.
    Challenge(const std::string& title, const std::string& truth, int points,
        std::int64_t now);

    std::string id;
    std::string title;
    TruthDigest truth_digest;
    std::string challenge_salt;   // hex-encoded
    int points = 0;
    bool is_active = true;
    std::int64_t created_at = 0;

    // Replaces the digest and forces a new salt, so every flag issued
    // under the old truth stops verifying.
    void replaceTruth(const std::string& truth);
};
