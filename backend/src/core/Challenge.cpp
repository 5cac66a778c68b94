#include "Challenge.hpp"
#include "../crypto/Crypto.hpp"
#include "../utils/Ids.hpp"
#include <spdlog/spdlog.h>

Challenge::Challenge(const std::string& t, const std::string& truth, int pts,
    std::int64_t now)
    : title(t), points(pts), created_at(now)
{
    id = generateID();
    truth_digest = TruthHasher::hash(truth);
    challenge_salt = Crypto::randomSaltHex();
    spdlog::info("Created Challenge: ID={}, Title={}, points={}", id, title, points);
}

void Challenge::replaceTruth(const std::string& truth) {
    truth_digest = TruthHasher::hash(truth);
    challenge_salt = Crypto::randomSaltHex();
    spdlog::info("Challenge ID={} truth replaced; issued flags invalidated", id);
}
