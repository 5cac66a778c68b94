#pragma once
#include <array>
#include <optional>
#include <string>
#include <string_view>

// SHA-256 of a normalized answer. Persisted as 64 lowercase hex characters.
struct TruthDigest {
    std::array<unsigned char, 32> bytes{};

    std::string toHex() const;
    static std::optional<TruthDigest> fromHex(std::string_view hex);
};

// One-way, case- and surrounding-whitespace-insensitive answer hashing.
// Stateless; safe to share between threads.
class TruthHasher {
public:
    // Trims ASCII whitespace and lowercases ASCII letters.
    static std::string normalize(std::string_view answer);

    static TruthDigest hash(std::string_view answer);

    // Fixed-time comparison of hash(answer) against the stored digest.
    static bool verify(std::string_view answer, const TruthDigest& expected);
};
