#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Thin helpers over libsodium shared by the hasher, minter and stores.
namespace Crypto
{
    // Size of every salt (challenge and user) in bytes.
    constexpr std::size_t SALT_BYTES = 32;

    // sodium_init() wrapper; safe to call from any thread, any number of times.
    // Throws std::runtime_error if libsodium cannot be initialised.
    void init();

    std::string toHex(const unsigned char* data, std::size_t len);

    // Decodes exactly expected_len bytes of hex; false on any other input.
    bool fromHex(std::string_view hex, std::size_t expected_len, std::vector<unsigned char>& out);

    // Fresh random salt, hex encoded (2 * SALT_BYTES characters).
    std::string randomSaltHex();

    // Fixed-time equality. Inputs of different length compare unequal, but
    // the work done depends only on the length of `expected`.
    bool equal(std::string_view submitted, std::string_view expected);
}
