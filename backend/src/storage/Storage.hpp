#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../auth/User.hpp"
#include "../core/Challenge.hpp"
#include "../core/Submission.hpp"

// Persistence collaborators of the flag engine. Implementations must be safe
// to call from several threads and report failed writes by throwing
// StorageError; a method that returns has made its write durable.

class UserStore {
public:
    virtual ~UserStore() = default;

    virtual std::optional<User> findUser(const std::string& id) const = 0;
    virtual std::optional<User> findUserByName(const std::string& username) const = 0;

    // Throws PreconditionError if the username is taken, StorageError if the
    // id is.
    virtual void addUser(const User& user) = 0;

    // Compare-and-swap on User::version. Returns false, writing nothing, if
    // the stored version is no longer expected_version; on success the stored
    // version becomes expected_version + 1.
    virtual bool updateUserSalt(const std::string& id, const std::string& salt_hex,
        std::int64_t rotated_at, std::uint64_t expected_version) = 0;
};

class ChallengeStore {
public:
    virtual ~ChallengeStore() = default;

    virtual std::optional<Challenge> findChallenge(const std::string& id) const = 0;
    virtual std::vector<Challenge> listChallenges() const = 0;
    virtual void addChallenge(const Challenge& challenge) = 0;

    // Throws StorageError if the challenge does not exist.
    virtual void updateChallenge(const Challenge& challenge) = 0;
};

class SubmissionLog {
public:
    virtual ~SubmissionLog() = default;

    virtual void append(const SubmissionRecord& record) = 0;
    virtual bool hasCorrectSubmission(const std::string& user_id, const std::string& challenge_id) const = 0;
    virtual std::size_t countAttempts(const std::string& user_id, const std::string& challenge_id) const = 0;
    virtual std::vector<SubmissionRecord> recordsForUser(const std::string& user_id) const = 0;
};
