#include "SaltRotator.hpp"
#include "../core/Errors.hpp"
#include "../crypto/Crypto.hpp"
#include <spdlog/spdlog.h>

SaltRotator::SaltRotator(const EngineConfig& config, const Clock& clk, UserStore& store)
    : interval_seconds(config.salt_rotation_seconds),
    clock(clk),
    users(store)
{
    if (interval_seconds == 0) {
        spdlog::error("Refusing salt rotation interval of zero");
        throw PreconditionError("salt rotation interval must be positive");
    }
}

bool SaltRotator::needsRotation(const User& user) const {
    const std::int64_t age = clock.now() - user.salt_rotated_at;
    // a rotated_at ahead of the clock counts as fresh
    if (age < 0) return false;
    return static_cast<std::uint64_t>(age) >= interval_seconds;
}

User SaltRotator::maybeRotate(const User& user) {
    if (!needsRotation(user)) {
        return user;
    }

    const std::int64_t now = clock.now();
    const std::string fresh = Crypto::randomSaltHex();

    if (!users.updateUserSalt(user.id, fresh, now, user.version)) {
        spdlog::warn("Salt rotation for user '{}' conflicted with a concurrent update", user.id);
        throw SaltConflictError(user.id);
    }

    User rotated = user;
    rotated.flag_salt = fresh;
    rotated.salt_rotated_at = now;
    rotated.version = user.version + 1;

    spdlog::info("Rotated flag salt for user '{}'", user.id);
    return rotated;
}
