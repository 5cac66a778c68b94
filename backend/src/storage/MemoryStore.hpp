#pragma once
#include <mutex>
#include <unordered_map>
#include "Storage.hpp"

// All three collaborators in process memory, one mutex around everything.
//
// Every write builds the next state, hands it to the matching persist hook
// and only commits it if the hook returned. The hooks are no-ops here;
// FileStore overrides them to make each write durable first.
class MemoryStore : public UserStore, public ChallengeStore, public SubmissionLog {
public:
    MemoryStore() = default;

    std::optional<User> findUser(const std::string& id) const override;
    std::optional<User> findUserByName(const std::string& username) const override;
    void addUser(const User& user) override;
    bool updateUserSalt(const std::string& id, const std::string& salt_hex,
        std::int64_t rotated_at, std::uint64_t expected_version) override;

    std::optional<Challenge> findChallenge(const std::string& id) const override;
    std::vector<Challenge> listChallenges() const override;
    void addChallenge(const Challenge& challenge) override;
    void updateChallenge(const Challenge& challenge) override;

    void append(const SubmissionRecord& record) override;
    bool hasCorrectSubmission(const std::string& user_id, const std::string& challenge_id) const override;
    std::size_t countAttempts(const std::string& user_id, const std::string& challenge_id) const override;
    std::vector<SubmissionRecord> recordsForUser(const std::string& user_id) const override;

protected:
    using UserMap = std::unordered_map<std::string, User>;
    using ChallengeMap = std::unordered_map<std::string, Challenge>;

    // Called with the store lock held. Throw StorageError to abort the write.
    virtual void persistUsers(const UserMap&) {}
    virtual void persistChallenges(const ChallengeMap&, const std::vector<std::string>&) {}
    virtual void persistSubmission(const SubmissionRecord&) {}

    mutable std::mutex mtx;
    UserMap users;
    ChallengeMap challenges;
    std::vector<std::string> challenge_order;   // insertion order for listing
    std::vector<SubmissionRecord> submissions;
};
