#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

// Process-wide flag engine settings. Passed explicitly into every component
// that needs them; there is no global instance.
struct EngineConfig {
    // HMAC key for flag derivation. Never logged.
    std::string secret_key;

    std::uint64_t window_seconds = 60 * 60;                 // flag expiry window
    std::uint64_t salt_rotation_seconds = 24 * 60 * 60;     // user salt lifetime

    std::string flag_prefix = "FORENSIC{";
    std::string flag_suffix = "}";

    // Read-rotate attempts before a contended submission gives up.
    std::uint32_t max_rotation_retries = 5;

    std::string data_dir = "data";
    std::string log_file = "flagforge.log";
    std::string log_level = "info";

    std::uint64_t windowMinutes() const { return window_seconds / 60; }
};

// Minimum accepted secret length in bytes.
constexpr std::size_t MIN_SECRET_BYTES = 16;

// Reads an INI file into out_config, then applies the FLAG_SECRET_KEY,
// FLAG_EXPIRY_MINUTES and FLAG_SALT_ROTATION_HOURS environment overrides and
// validates the result. On failure returns false and describes why in error.
bool loadConfig(const std::string& path, EngineConfig& out_config, std::string& error);

// Environment overrides + validation only; used when no file is given.
bool finalizeConfig(EngineConfig& config, std::string& error);

// Checks a config however it was built. Components that divide by the window
// or key the HMAC refuse a config that fails this.
bool validateConfig(const EngineConfig& config, std::string& error);
