#include "MemoryStore.hpp"
#include "../core/Errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

std::optional<User> MemoryStore::findUser(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = users.find(id);
    if (it == users.end()) return std::nullopt;
    return it->second;
}

std::optional<User> MemoryStore::findUserByName(const std::string& username) const {
    std::lock_guard<std::mutex> lock(mtx);
    for (const auto& p : users) {
        if (p.second.username == username) return p.second;
    }
    return std::nullopt;
}

void MemoryStore::addUser(const User& user) {
    std::lock_guard<std::mutex> lock(mtx);
    if (users.count(user.id) != 0) {
        spdlog::error("Refusing to store duplicate user ID={}", user.id);
        throw StorageError("duplicate user id " + user.id);
    }
    // checked under the lock, so concurrent registrations of one name agree
    for (const auto& p : users) {
        if (p.second.username == user.username) {
            spdlog::warn("Username '{}' already exists", user.username);
            throw PreconditionError("username already exists: " + user.username);
        }
    }

    UserMap next = users;
    next.emplace(user.id, user);
    persistUsers(next);
    users.swap(next);
    spdlog::debug("Stored user ID={}", user.id);
}

bool MemoryStore::updateUserSalt(const std::string& id, const std::string& salt_hex,
    std::int64_t rotated_at, std::uint64_t expected_version)
{
    std::lock_guard<std::mutex> lock(mtx);
    auto it = users.find(id);
    if (it == users.end()) {
        spdlog::error("Salt update for unknown user ID={}", id);
        throw StorageError("salt update for unknown user " + id);
    }
    if (it->second.version != expected_version) {
        spdlog::debug("Salt update for user ID={} lost the race (v{} != v{})",
            id, it->second.version, expected_version);
        return false;
    }

    UserMap next = users;
    User& u = next[id];
    u.flag_salt = salt_hex;
    u.salt_rotated_at = rotated_at;
    u.version += 1;
    persistUsers(next);
    users.swap(next);
    return true;
}

std::optional<Challenge> MemoryStore::findChallenge(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = challenges.find(id);
    if (it == challenges.end()) return std::nullopt;
    return it->second;
}

std::vector<Challenge> MemoryStore::listChallenges() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<Challenge> out;
    out.reserve(challenge_order.size());
    for (const auto& id : challenge_order) {
        out.push_back(challenges.at(id));
    }
    return out;
}

void MemoryStore::addChallenge(const Challenge& challenge) {
    std::lock_guard<std::mutex> lock(mtx);
    if (challenges.count(challenge.id) != 0) {
        spdlog::error("Refusing to store duplicate challenge ID={}", challenge.id);
        throw StorageError("duplicate challenge id " + challenge.id);
    }

    ChallengeMap next = challenges;
    next.emplace(challenge.id, challenge);
    std::vector<std::string> next_order = challenge_order;
    next_order.push_back(challenge.id);
    persistChallenges(next, next_order);
    challenges.swap(next);
    challenge_order.swap(next_order);
}

void MemoryStore::updateChallenge(const Challenge& challenge) {
    std::lock_guard<std::mutex> lock(mtx);
    if (challenges.count(challenge.id) == 0) {
        spdlog::error("Update for unknown challenge ID={}", challenge.id);
        throw StorageError("update for unknown challenge " + challenge.id);
    }

    ChallengeMap next = challenges;
    next[challenge.id] = challenge;
    persistChallenges(next, challenge_order);
    challenges.swap(next);
}

void MemoryStore::append(const SubmissionRecord& record) {
    std::lock_guard<std::mutex> lock(mtx);
    persistSubmission(record);
    submissions.push_back(record);
}

bool MemoryStore::hasCorrectSubmission(const std::string& user_id, const std::string& challenge_id) const {
    std::lock_guard<std::mutex> lock(mtx);
    return std::any_of(submissions.begin(), submissions.end(), [&](const SubmissionRecord& r) {
        return r.is_correct && r.user_id == user_id && r.challenge_id == challenge_id;
    });
}

std::size_t MemoryStore::countAttempts(const std::string& user_id, const std::string& challenge_id) const {
    std::lock_guard<std::mutex> lock(mtx);
    return static_cast<std::size_t>(std::count_if(submissions.begin(), submissions.end(),
        [&](const SubmissionRecord& r) {
            return r.user_id == user_id && r.challenge_id == challenge_id;
        }));
}

std::vector<SubmissionRecord> MemoryStore::recordsForUser(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<SubmissionRecord> out;
    for (const auto& r : submissions) {
        if (r.user_id == user_id) out.push_back(r);
    }
    return out;
}
