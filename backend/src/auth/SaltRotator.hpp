#pragma once
#include <cstdint>
#include "User.hpp"
#include "../config/EngineConfig.hpp"
#include "../core/TimeWindow.hpp"
#include "../storage/Storage.hpp"

// Replaces a user's flag salt once it is salt_rotation_seconds old. Every
// flag minted under the previous salt stops verifying at that moment, leaked
// or not.
class SaltRotator {
public:
    SaltRotator(const EngineConfig& config, const Clock& clock, UserStore& users);

    // now - salt_rotated_at >= rotation interval
    bool needsRotation(const User& user) const;

    // Returns the user unchanged when no rotation is due. Otherwise writes a
    // new salt through UserStore::updateUserSalt and returns the user exactly
    // as now stored. Throws SaltConflictError if another writer updated the
    // record since `user` was read, StorageError if the write failed.
    User maybeRotate(const User& user);

private:
    std::uint64_t interval_seconds;
    const Clock& clock;
    UserStore& users;
};
