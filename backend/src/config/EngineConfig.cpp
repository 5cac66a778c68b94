#include "EngineConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {

std::string trim(const std::string& input) {
    const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    auto begin = std::find_if_not(input.begin(), input.end(), is_space);
    auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string stripInlineComment(const std::string& input) {
    for (std::size_t i = 0; i < input.size(); ++i) {
        const char ch = input[i];
        if ((ch == '#' || ch == ';') &&
            (i == 0 || std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
            return trim(input.substr(0, i));
        }
    }
    return input;
}

bool parseUint64(const std::string& text, std::uint64_t& out) {
    if (text.empty() || text.front() == '-') {
        return false;
    }
    errno = 0;
    char* end_ptr = nullptr;
    const unsigned long long value = std::strtoull(text.c_str(), &end_ptr, 10);
    if (end_ptr == text.c_str() || *end_ptr != '\0' || errno == ERANGE) {
        return false;
    }
    out = static_cast<std::uint64_t>(value);
    return true;
}

bool parseMinutes(const std::string& text, std::uint64_t& out_seconds) {
    std::uint64_t minutes = 0;
    if (!parseUint64(text, minutes) || minutes > UINT64_MAX / 60) {
        return false;
    }
    out_seconds = minutes * 60;
    return true;
}

bool parseHours(const std::string& text, std::uint64_t& out_seconds) {
    std::uint64_t hours = 0;
    if (!parseUint64(text, hours) || hours > UINT64_MAX / 3600) {
        return false;
    }
    out_seconds = hours * 3600;
    return true;
}

struct IniState {
    std::string section;
    EngineConfig* cfg{nullptr};
};

bool applyKV(IniState& state, const std::string& key, const std::string& value) {
    EngineConfig& cfg = *state.cfg;
    if (state.section == "flags") {
        if (key == "secret_key") {
            cfg.secret_key = value;
        } else if (key == "window_minutes") {
            return parseMinutes(value, cfg.window_seconds);
        } else if (key == "salt_rotation_hours") {
            return parseHours(value, cfg.salt_rotation_seconds);
        } else if (key == "prefix") {
            cfg.flag_prefix = value;
        } else if (key == "suffix") {
            cfg.flag_suffix = value;
        } else if (key == "max_rotation_retries") {
            std::uint64_t retries = 0;
            if (!parseUint64(value, retries) || retries > UINT32_MAX) {
                return false;
            }
            cfg.max_rotation_retries = static_cast<std::uint32_t>(retries);
        }
        return true;
    }
    if (state.section == "storage") {
        if (key == "data_dir") {
            cfg.data_dir = value;
        }
        return true;
    }
    if (state.section == "log") {
        if (key == "file") {
            cfg.log_file = value;
        } else if (key == "level") {
            cfg.log_level = value;
        }
        return true;
    }
    return true;
}

bool parseIni(const std::string& path, EngineConfig& out, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "config file not found: " + path;
        return false;
    }

    IniState state;
    state.cfg = &out;

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        const std::string trimmed = stripInlineComment(trim(line));
        if (trimmed.empty()) {
            continue;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']') {
            state.section = trimmed.substr(1, trimmed.size() - 2);
            continue;
        }
        const auto pos = trimmed.find('=');
        if (pos == std::string::npos) {
            std::ostringstream oss;
            oss << "invalid line " << line_no;
            error = oss.str();
            return false;
        }
        std::string key = trim(trimmed.substr(0, pos));
        std::string value = trim(trimmed.substr(pos + 1));
        if (!applyKV(state, key, value)) {
            std::ostringstream oss;
            oss << "invalid value for '" << key << "' on line " << line_no;
            error = oss.str();
            return false;
        }
    }
    return true;
}

bool applyEnvironment(EngineConfig& cfg, std::string& error) {
    if (const char* secret = std::getenv("FLAG_SECRET_KEY")) {
        cfg.secret_key = secret;
    }
    if (const char* minutes = std::getenv("FLAG_EXPIRY_MINUTES")) {
        if (!parseMinutes(minutes, cfg.window_seconds)) {
            error = "invalid FLAG_EXPIRY_MINUTES";
            return false;
        }
    }
    if (const char* hours = std::getenv("FLAG_SALT_ROTATION_HOURS")) {
        if (!parseHours(hours, cfg.salt_rotation_seconds)) {
            error = "invalid FLAG_SALT_ROTATION_HOURS";
            return false;
        }
    }
    return true;
}

}  // namespace

bool validateConfig(const EngineConfig& cfg, std::string& error) {
    if (cfg.secret_key.size() < MIN_SECRET_BYTES) {
        error = "flag secret_key missing or shorter than 16 bytes";
        return false;
    }
    if (cfg.window_seconds == 0) {
        error = "window_minutes must be positive";
        return false;
    }
    if (cfg.window_seconds > static_cast<std::uint64_t>(INT64_MAX)) {
        error = "window_minutes too large";
        return false;
    }
    if (cfg.salt_rotation_seconds == 0) {
        error = "salt_rotation_hours must be positive";
        return false;
    }
    if (cfg.flag_prefix.empty() || cfg.flag_suffix.empty()) {
        error = "flag prefix and suffix must not be empty";
        return false;
    }
    if (cfg.max_rotation_retries == 0) {
        error = "max_rotation_retries must be positive";
        return false;
    }
    return true;
}

bool finalizeConfig(EngineConfig& config, std::string& error) {
    if (!applyEnvironment(config, error)) {
        return false;
    }
    return validateConfig(config, error);
}

bool loadConfig(const std::string& path, EngineConfig& out_config, std::string& error) {
    out_config = EngineConfig{};
    if (!parseIni(path, out_config, error)) {
        return false;
    }
    return finalizeConfig(out_config, error);
}
