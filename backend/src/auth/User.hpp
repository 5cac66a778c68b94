#pragma once
#include <cstdint>
#include <string>

class User {
public:
    User() = default;
    User(const std::string& id, const std::string& username,
        const std::string& salt_hex, std::int64_t rotated_at);

    std::string id;
    std::string username;
    std::string flag_salt;              // hex-encoded, rotated by SaltRotator
    std::int64_t salt_rotated_at = 0;   // Unix seconds
    std::int64_t created_at = 0;

    // Optimistic-concurrency token; the store bumps it on every salt write.
    std::uint64_t version = 0;
};
