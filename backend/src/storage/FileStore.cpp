#include "FileStore.hpp"
#include "../core/Errors.hpp"
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

static const char BLOCK_END[] = "---";

// Records are line-based; a stray newline in a free-text field would split it.
static std::string oneLine(const std::string& s) {
    std::string out = s;
    for (auto& c : out) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    return out;
}

static bool parseInt64(const std::string& text, std::int64_t& out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || errno == ERANGE) return false;
    out = static_cast<std::int64_t>(v);
    return true;
}

static bool parseUint64(const std::string& text, std::uint64_t& out) {
    if (text.empty() || text.front() == '-') return false;
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || errno == ERANGE) return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

// Truncated: the input ended inside a block.
enum class BlockRead { Ok, End, Truncated, Malformed };

// Reads `count` field lines followed by the block terminator. `consumed`
// grows by the bytes of every complete block read.
static BlockRead readBlock(std::istream& in, std::size_t count, std::vector<std::string>& fields,
    std::uintmax_t& consumed)
{
    fields.clear();
    std::uintmax_t bytes = 0;
    std::string line;
    if (!std::getline(in, line)) return BlockRead::End;
    fields.push_back(line);
    bytes += line.size() + 1;

    while (fields.size() < count) {
        if (!std::getline(in, line)) return BlockRead::Truncated;
        fields.push_back(line);
        bytes += line.size() + 1;
    }
    if (!std::getline(in, line)) return BlockRead::Truncated;
    // a last line without its newline was cut short, whatever it holds
    if (in.eof()) return BlockRead::Truncated;
    if (line != BLOCK_END) return BlockRead::Malformed;
    consumed += bytes + line.size() + 1;
    return BlockRead::Ok;
}

// Write to a sibling temp file, then rename over the target.
static void replaceFile(const std::string& path, const std::string& content) {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for writing", tmp);
            throw StorageError("cannot write " + tmp);
        }
        out << content;
        out.flush();
        if (!out) {
            spdlog::error("Short write to '{}'", tmp);
            throw StorageError("cannot write " + tmp);
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        spdlog::error("Failed to replace '{}': {}", path, ec.message());
        throw StorageError("cannot replace " + path);
    }
}

FileStore::FileStore(const std::string& dataDir)
    : dir(dataDir)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        spdlog::error("Cannot create data directory '{}': {}", dir, ec.message());
        throw StorageError("cannot create data directory " + dir);
    }

    loadUsers();
    loadChallenges();
    loadSubmissions();
    spdlog::info("FileStore opened '{}': {} users, {} challenges, {} submissions",
        dir, users.size(), challenges.size(), submissions.size());
}

std::string FileStore::usersPath() const { return (fs::path(dir) / "users.txt").string(); }
std::string FileStore::challengesPath() const { return (fs::path(dir) / "challenges.txt").string(); }
std::string FileStore::submissionsPath() const { return (fs::path(dir) / "submissions.log").string(); }

void FileStore::loadUsers() {
    std::ifstream in(usersPath());
    if (!in) {
        spdlog::warn("User file '{}' not found; treating as empty", usersPath());
        return;
    }

    std::vector<std::string> f;
    std::uintmax_t consumed = 0;
    BlockRead r;
    while ((r = readBlock(in, 6, f, consumed)) == BlockRead::Ok) {
        User u;
        u.id = f[0];
        u.username = f[1];
        u.flag_salt = f[2];
        if (u.id.empty() || !parseInt64(f[3], u.salt_rotated_at) ||
            !parseInt64(f[4], u.created_at) || !parseUint64(f[5], u.version))
        {
            r = BlockRead::Malformed;
            break;
        }
        users[u.id] = u;
    }
    if (r == BlockRead::Malformed || r == BlockRead::Truncated) {
        spdlog::error("Malformed user file '{}'", usersPath());
        throw StorageError("malformed " + usersPath());
    }
}

void FileStore::loadChallenges() {
    std::ifstream in(challengesPath());
    if (!in) {
        spdlog::warn("Challenge file '{}' not found; treating as empty", challengesPath());
        return;
    }

    std::vector<std::string> f;
    std::uintmax_t consumed = 0;
    BlockRead r;
    while ((r = readBlock(in, 7, f, consumed)) == BlockRead::Ok) {
        Challenge c;
        c.id = f[0];
        c.title = f[1];
        auto digest = TruthDigest::fromHex(f[2]);
        c.challenge_salt = f[3];
        std::int64_t points = 0;
        if (c.id.empty() || !digest || !parseInt64(f[4], points) ||
            (f[5] != "0" && f[5] != "1") || !parseInt64(f[6], c.created_at))
        {
            r = BlockRead::Malformed;
            break;
        }
        c.truth_digest = *digest;
        c.points = static_cast<int>(points);
        c.is_active = f[5] == "1";
        if (challenges.count(c.id) == 0) challenge_order.push_back(c.id);
        challenges[c.id] = c;
    }
    if (r == BlockRead::Malformed || r == BlockRead::Truncated) {
        spdlog::error("Malformed challenge file '{}'", challengesPath());
        throw StorageError("malformed " + challengesPath());
    }
}

void FileStore::loadSubmissions() {
    std::ifstream in(submissionsPath());
    if (!in) {
        spdlog::debug("No submission log at '{}' yet", submissionsPath());
        return;
    }

    std::vector<std::string> f;
    std::uintmax_t consumed = 0;
    BlockRead r;
    while ((r = readBlock(in, 9, f, consumed)) == BlockRead::Ok) {
        SubmissionRecord s;
        s.id = f[0];
        s.user_id = f[1];
        s.challenge_id = f[2];
        s.submitted_answer_hash = f[3];
        if ((f[4] != "0" && f[4] != "1") || !parseInt64(f[5], s.created_at)) {
            r = BlockRead::Malformed;
            break;
        }
        s.is_correct = f[4] == "1";
        s.metadata.ip_address = f[6];
        s.metadata.user_agent = f[7];
        if (f[8] != "-") {
            std::int64_t spent = 0;
            if (!parseInt64(f[8], spent)) {
                r = BlockRead::Malformed;
                break;
            }
            s.metadata.time_spent_seconds = spent;
        }
        submissions.push_back(s);
    }
    if (r == BlockRead::Malformed) {
        spdlog::error("Malformed submission log '{}'", submissionsPath());
        throw StorageError("malformed " + submissionsPath());
    }
    if (r == BlockRead::Truncated) {
        // an append that died mid-record; cut it so the next append starts clean
        in.close();
        spdlog::warn("Dropping incomplete last record of '{}'", submissionsPath());
        std::error_code ec;
        fs::resize_file(submissionsPath(), consumed, ec);
        if (ec) {
            spdlog::error("Cannot truncate '{}': {}", submissionsPath(), ec.message());
            throw StorageError("cannot repair " + submissionsPath());
        }
    }
}

void FileStore::persistUsers(const UserMap& next) {
    std::string out;
    for (const auto& p : next) {
        const User& u = p.second;
        out += u.id + "\n"
            + oneLine(u.username) + "\n"
            + u.flag_salt + "\n"
            + std::to_string(u.salt_rotated_at) + "\n"
            + std::to_string(u.created_at) + "\n"
            + std::to_string(u.version) + "\n"
            + BLOCK_END + "\n";
    }
    replaceFile(usersPath(), out);
    spdlog::debug("Saved {} users to '{}'", next.size(), usersPath());
}

void FileStore::persistChallenges(const ChallengeMap& next, const std::vector<std::string>& order) {
    std::string out;
    for (const auto& id : order) {
        const Challenge& c = next.at(id);
        out += c.id + "\n"
            + oneLine(c.title) + "\n"
            + c.truth_digest.toHex() + "\n"
            + c.challenge_salt + "\n"
            + std::to_string(c.points) + "\n"
            + (c.is_active ? "1" : "0") + "\n"
            + std::to_string(c.created_at) + "\n"
            + BLOCK_END + "\n";
    }
    replaceFile(challengesPath(), out);
    spdlog::debug("Saved {} challenges to '{}'", order.size(), challengesPath());
}

void FileStore::persistSubmission(const SubmissionRecord& s) {
    std::string block = s.id + "\n"
        + s.user_id + "\n"
        + s.challenge_id + "\n"
        + s.submitted_answer_hash + "\n"
        + (s.is_correct ? "1" : "0") + "\n"
        + std::to_string(s.created_at) + "\n"
        + oneLine(s.metadata.ip_address) + "\n"
        + oneLine(s.metadata.user_agent) + "\n"
        + (s.metadata.time_spent_seconds ? std::to_string(*s.metadata.time_spent_seconds) : "-") + "\n"
        + BLOCK_END + "\n";

    std::error_code ec;
    const std::string path = submissionsPath();
    std::uintmax_t previous = fs::exists(path, ec) ? fs::file_size(path, ec) : 0;
    if (ec) {
        spdlog::error("Cannot stat '{}': {}", path, ec.message());
        throw StorageError("cannot append to " + path);
    }

    bool written = false;
    {
        std::ofstream out(path, std::ios::binary | std::ios::app);
        if (out) {
            out.write(block.data(), static_cast<std::streamsize>(block.size()));
            out.flush();
            written = static_cast<bool>(out);
        }
    }

    if (!written) {
        spdlog::error("Failed to append to '{}'", path);
        fs::resize_file(path, previous, ec);
        if (ec) {
            spdlog::error("Cannot roll back '{}': {}", path, ec.message());
        }
        throw StorageError("cannot append to " + path);
    }
}
