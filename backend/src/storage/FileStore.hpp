#pragma once
#include <string>
#include "MemoryStore.hpp"

// FileStore keeps the MemoryStore state on disk as plain text under one
// directory:
//
//   users.txt        id, username, flag_salt, salt_rotated_at, created_at,
//                    version, ---
//   challenges.txt   id, title, truth_digest, challenge_salt, points,
//                    is_active, created_at, ---
//   submissions.log  id, user_id, challenge_id, answer_hash, is_correct,
//                    created_at, ip, user_agent, time_spent (or "-"), ---
//
// users.txt and challenges.txt are rewritten through a temporary file and a
// rename; submissions.log is append-only. The constructor loads whatever is
// present and throws StorageError on a malformed file.
class FileStore : public MemoryStore {
public:
    explicit FileStore(const std::string& dataDir);

    const std::string& directory() const { return dir; }

protected:
    void persistUsers(const UserMap& next) override;
    void persistChallenges(const ChallengeMap& next, const std::vector<std::string>& order) override;
    void persistSubmission(const SubmissionRecord& record) override;

private:
    std::string dir;

    std::string usersPath() const;
    std::string challengesPath() const;
    std::string submissionsPath() const;

    void loadUsers();
    void loadChallenges();
    void loadSubmissions();
};
