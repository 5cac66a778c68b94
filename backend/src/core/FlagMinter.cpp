#include "FlagMinter.hpp"
#include "Errors.hpp"
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char FLAG_LABEL[] = "flagforge/flag/v1";

static_assert(FlagMinter::TOKEN_BYTES % 3 == 0, "token bytes must encode without padding");
static_assert(FlagMinter::TOKEN_BYTES <= crypto_auth_hmacsha256_BYTES, "cannot keep more than the MAC");

// u32be length || bytes
static void absorbField(crypto_auth_hmacsha256_state& st, const unsigned char* data, std::size_t len) {
    const auto n = static_cast<std::uint32_t>(len);
    const unsigned char prefix[4] = {
        static_cast<unsigned char>((n >> 24) & 0xFF),
        static_cast<unsigned char>((n >> 16) & 0xFF),
        static_cast<unsigned char>((n >> 8) & 0xFF),
        static_cast<unsigned char>(n & 0xFF) };
    crypto_auth_hmacsha256_update(&st, prefix, sizeof(prefix));
    if (len > 0) {
        crypto_auth_hmacsha256_update(&st, data, len);
    }
}

static void absorbField(crypto_auth_hmacsha256_state& st, const std::string& s) {
    absorbField(st, reinterpret_cast<const unsigned char*>(s.data()), s.size());
}

static bool isBodyChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
        (c >= '0' && c <= '9') || c == '-' || c == '_';
}

// Rejects a config that would key the HMAC with nothing or divide by a zero
// window, before any member copies the secret.
static std::vector<unsigned char> checkedKey(const EngineConfig& config) {
    std::string error;
    if (!validateConfig(config, error)) {
        spdlog::error("Refusing flag engine config: {}", error);
        throw PreconditionError("invalid flag engine config: " + error);
    }
    return std::vector<unsigned char>(config.secret_key.begin(), config.secret_key.end());
}

FlagMinter::FlagMinter(const EngineConfig& config, const Clock& clk)
    : key(checkedKey(config)),
    prefix(config.flag_prefix),
    suffix(config.flag_suffix),
    window_seconds(config.window_seconds),
    clock(clk)
{
    spdlog::debug("FlagMinter ready: window={}s, token length={}", window_seconds, tokenLength());
}

FlagMinter::~FlagMinter() {
    if (!key.empty()) {
        sodium_memzero(key.data(), key.size());
    }
}

FlagToken FlagMinter::mint(const std::string& user_id,
    const std::string& challenge_id,
    const TruthDigest& truth_digest,
    const std::string& challenge_salt,
    const std::string& user_salt,
    std::int64_t epoch) const
{
    crypto_auth_hmacsha256_state st;
    crypto_auth_hmacsha256_init(&st, key.data(), key.size());

    absorbField(st, reinterpret_cast<const unsigned char*>(FLAG_LABEL), sizeof(FLAG_LABEL) - 1);
    absorbField(st, user_id);
    absorbField(st, challenge_id);
    absorbField(st, truth_digest.bytes.data(), truth_digest.bytes.size());
    absorbField(st, challenge_salt);
    absorbField(st, user_salt);

    const auto e = static_cast<std::uint64_t>(epoch);
    unsigned char epoch_be[8];
    for (int i = 0; i < 8; ++i) {
        epoch_be[i] = static_cast<unsigned char>((e >> (56 - 8 * i)) & 0xFF);
    }
    crypto_auth_hmacsha256_update(&st, epoch_be, sizeof(epoch_be));

    unsigned char mac[crypto_auth_hmacsha256_BYTES];
    crypto_auth_hmacsha256_final(&st, mac);

    char body[sodium_base64_ENCODED_LEN(TOKEN_BYTES, sodium_base64_VARIANT_URLSAFE_NO_PADDING)];
    sodium_bin2base64(body, sizeof(body), mac, TOKEN_BYTES, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    sodium_memzero(mac, sizeof(mac));

    FlagToken token;
    token.reserve(tokenLength());
    token.append(prefix);
    token.append(body, BODY_CHARS);
    token.append(suffix);
    return token;
}

FlagToken FlagMinter::mintCurrent(const std::string& user_id,
    const std::string& challenge_id,
    const TruthDigest& truth_digest,
    const std::string& challenge_salt,
    const std::string& user_salt) const
{
    return mint(user_id, challenge_id, truth_digest, challenge_salt, user_salt, currentEpoch());
}

bool FlagMinter::hasValidShape(std::string_view token) const {
    if (token.size() != tokenLength()) {
        return false;
    }
    if (token.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    if (token.compare(token.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return false;
    }

    const std::string_view body = token.substr(prefix.size(), BODY_CHARS);
    for (char c : body) {
        if (!isBodyChar(c)) return false;
    }
    return true;
}

std::int64_t FlagMinter::currentEpoch() const {
    return TimeWindow::currentEpoch(clock, window_seconds);
}
