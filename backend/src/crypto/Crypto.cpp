#include "Crypto.hpp"
#include <sodium.h>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace Crypto
{
    void init() {
        if (sodium_init() < 0) {
            spdlog::error("sodium_init failed");
            throw std::runtime_error("libsodium initialisation failed");
        }
    }

    std::string toHex(const unsigned char* data, std::size_t len) {
        std::string hex(2 * len + 1, '\0');
        sodium_bin2hex(&hex[0], hex.size(), data, len);
        hex.pop_back();
        return hex;
    }

    bool fromHex(std::string_view hex, std::size_t expected_len, std::vector<unsigned char>& out) {
        if (hex.size() != 2 * expected_len) {
            return false;
        }

        out.assign(expected_len, 0);
        size_t bin_len = 0;
        const char* end = nullptr;

        if (sodium_hex2bin(out.data(), out.size(),
            hex.data(), hex.size(),
            nullptr, &bin_len, &end) != 0)
        {
            out.clear();
            return false;
        }

        if (bin_len != expected_len || end != hex.data() + hex.size()) {
            out.clear();
            return false;
        }
        return true;
    }

    std::string randomSaltHex() {
        unsigned char salt[SALT_BYTES];
        randombytes_buf(salt, SALT_BYTES);
        std::string hex = toHex(salt, SALT_BYTES);
        sodium_memzero(salt, SALT_BYTES);
        return hex;
    }

    bool equal(std::string_view submitted, std::string_view expected) {
        if (submitted.size() != expected.size()) {
            // keep the cost identical to a same-length comparison
            (void)sodium_memcmp(expected.data(), expected.data(), expected.size());
            return false;
        }
        return sodium_memcmp(submitted.data(), expected.data(), expected.size()) == 0;
    }
}
