#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "TimeWindow.hpp"
#include "../config/EngineConfig.hpp"
#include "../crypto/TruthHasher.hpp"

// prefix + base64url(PRF output, truncated) + suffix
using FlagToken = std::string;

/*
  Derives per-user, per-challenge, per-window flags:

    HMAC-SHA256(secret, label | user_id | challenge_id | truth_digest
                        | challenge_salt | user_salt | epoch)

  Every variable-length field is length-prefixed, so no two distinct inputs
  share a message. The first TOKEN_BYTES bytes of the MAC become the token
  body. Minting is pure: same inputs, same token; nothing is stored.
*/
class FlagMinter {
public:
    // 192 bits survive truncation; the body is 32 URL-safe characters.
    static constexpr std::size_t TOKEN_BYTES = 24;
    static constexpr std::size_t BODY_CHARS = TOKEN_BYTES / 3 * 4;

    FlagMinter(const EngineConfig& config, const Clock& clock);
    ~FlagMinter();

    FlagMinter(const FlagMinter&) = delete;
    FlagMinter& operator=(const FlagMinter&) = delete;

    FlagToken mint(const std::string& user_id,
        const std::string& challenge_id,
        const TruthDigest& truth_digest,
        const std::string& challenge_salt,
        const std::string& user_salt,
        std::int64_t epoch) const;

    // mint() for the clock's current window
    FlagToken mintCurrent(const std::string& user_id,
        const std::string& challenge_id,
        const TruthDigest& truth_digest,
        const std::string& challenge_salt,
        const std::string& user_salt) const;

    // Envelope check only (prefix, body alphabet and length, suffix). Says
    // nothing about whether the token verifies.
    bool hasValidShape(std::string_view token) const;

    std::size_t tokenLength() const { return prefix.size() + BODY_CHARS + suffix.size(); }

    std::int64_t currentEpoch() const;

private:
    std::vector<unsigned char> key;
    std::string prefix;
    std::string suffix;
    std::uint64_t window_seconds;
    const Clock& clock;
};
