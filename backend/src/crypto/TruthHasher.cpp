#include "TruthHasher.hpp"
#include "Crypto.hpp"
#include <algorithm>
#include <cctype>
#include <vector>
#include <sodium.h>

static_assert(crypto_hash_sha256_BYTES == 32, "TruthDigest expects a 256-bit hash");

std::string TruthDigest::toHex() const {
    return Crypto::toHex(bytes.data(), bytes.size());
}

std::optional<TruthDigest> TruthDigest::fromHex(std::string_view hex) {
    std::vector<unsigned char> raw;
    if (!Crypto::fromHex(hex, 32, raw)) {
        return std::nullopt;
    }

    TruthDigest digest;
    std::copy(raw.begin(), raw.end(), digest.bytes.begin());
    return digest;
}

std::string TruthHasher::normalize(std::string_view answer) {
    std::string s(answer);
    while (!s.empty() && std::isspace((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();

    for (auto& ch : s) {
        ch = static_cast<char>(std::tolower((unsigned char)ch));
    }
    return s;
}

TruthDigest TruthHasher::hash(std::string_view answer) {
    const std::string normalized = normalize(answer);

    TruthDigest digest;
    crypto_hash_sha256(digest.bytes.data(),
        reinterpret_cast<const unsigned char*>(normalized.data()),
        static_cast<unsigned long long>(normalized.size()));
    return digest;
}

bool TruthHasher::verify(std::string_view answer, const TruthDigest& expected) {
    const TruthDigest submitted = hash(answer);
    return sodium_memcmp(submitted.bytes.data(), expected.bytes.data(), expected.bytes.size()) == 0;
}
