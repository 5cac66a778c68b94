#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

#include "auth/User.hpp"
#include "core/Challenge.hpp"
#include "crypto/Crypto.hpp"
#include "storage/FileStore.hpp"
#include "TestSupport.hpp"

namespace fs = std::filesystem;

int main() {
    Crypto::init();

    const std::string dir = "tmp_flagforge_store";
    fs::remove_all(dir);

    std::string user_salt;
    std::string challenge_id;
    TruthDigest digest;
    {
        FileStore store(dir);
        assert(store.directory() == dir);
        assert(store.listChallenges().empty());

        user_salt = Crypto::randomSaltHex();
        store.addUser(User("u1", "alice", user_salt, 1000));
        assert(store.updateUserSalt("u1", Crypto::randomSaltHex(), 5000, 0));
        assert(!store.updateUserSalt("u1", user_salt, 6000, 0));

        Challenge c("Breach", "admin_password_reuse", 100, 2000);
        challenge_id = c.id;
        digest = c.truth_digest;
        store.addChallenge(c);
        c.is_active = false;
        store.updateChallenge(c);
        store.addChallenge(Challenge("Second", "other", 5, 2001));

        SubmissionRecord r;
        r.id = "s1";
        r.user_id = "u1";
        r.challenge_id = challenge_id;
        r.submitted_answer_hash = digest.toHex();
        r.is_correct = true;
        r.created_at = 3000;
        r.metadata.ip_address = "10.0.0.1";
        r.metadata.user_agent = "agent\nwith newline";
        store.append(r);

        r.id = "s2";
        r.is_correct = false;
        r.metadata.time_spent_seconds = 17;
        store.append(r);
    }

    {
        FileStore store(dir);

        auto u = store.findUser("u1");
        assert(u);
        assert(u->username == "alice");
        assert(u->flag_salt != user_salt);
        assert(u->salt_rotated_at == 5000);
        assert(u->created_at == 1000);
        assert(u->version == 1);
        assert(store.findUserByName("alice"));

        auto list = store.listChallenges();
        assert(list.size() == 2);
        assert(list[0].id == challenge_id);
        assert(list[1].title == "Second");
        assert(list[0].truth_digest.bytes == digest.bytes);
        assert(!list[0].is_active);
        assert(list[0].points == 100);
        assert(list[0].created_at == 2000);

        auto records = store.recordsForUser("u1");
        assert(records.size() == 2);
        assert(records[0].is_correct);
        assert(records[0].metadata.user_agent == "agent with newline");
        assert(!records[0].metadata.time_spent_seconds);
        assert(records[1].metadata.time_spent_seconds && *records[1].metadata.time_spent_seconds == 17);
        assert(store.hasCorrectSubmission("u1", challenge_id));
        assert(store.countAttempts("u1", challenge_id) == 2);
    }

    {
        // duplicate writes are refused and nothing changes on disk
        FileStore store(dir);
        bool threw = false;
        try {
            store.addUser(User("u2", "alice", Crypto::randomSaltHex(), 0));
        } catch (const PreconditionError& e) {
            threw = true;
            assert(!e.retryable());
        }
        assert(threw);

        threw = false;
        try {
            store.addUser(User("u1", "someone", Crypto::randomSaltHex(), 0));
        } catch (const StorageError&) {
            threw = true;
        }
        assert(threw);

        FileStore reopened(dir);
        assert(!reopened.findUser("u2"));
        assert(!reopened.findUserByName("someone"));
    }

    {
        // an append cut short mid-record leaves the store usable
        {
            std::ofstream torn(dir + "/submissions.log", std::ios::binary | std::ios::app);
            torn << "s3\nu1\n" << challenge_id << "\n";
        }

        {
            FileStore store(dir);
            assert(store.findUser("u1"));
            assert(store.listChallenges().size() == 2);
            assert(store.recordsForUser("u1").size() == 2);

            SubmissionRecord r;
            r.id = "s4";
            r.user_id = "u1";
            r.challenge_id = challenge_id;
            r.submitted_answer_hash = digest.toHex();
            r.created_at = 4000;
            store.append(r);
        }

        FileStore reopened(dir);
        auto records = reopened.recordsForUser("u1");
        assert(records.size() == 3);
        assert(records[2].id == "s4");
        assert(records[2].created_at == 4000);
    }

    {
        // terminator written without its newline
        const std::string torn_dir = "tmp_flagforge_store_torn";
        fs::remove_all(torn_dir);
        fs::create_directories(torn_dir);
        writeFile(torn_dir + "/submissions.log",
                  "s1\nu1\nc1\nhash\n0\n10\nip\nua\n-\n---\n"
                  "s2\nu1\nc1\nhash\n0\n11\nip\nua\n-\n---");
        {
            FileStore store(torn_dir);
            assert(store.countAttempts("u1", "c1") == 1);
        }
        assert(fs::file_size(torn_dir + "/submissions.log") == 31);
        fs::remove_all(torn_dir);
    }

    {
        const std::string bad = "tmp_flagforge_store_bad";
        fs::remove_all(bad);
        fs::create_directories(bad);
        writeFile(bad + "/users.txt", "u1\nalice\nsalt\nnot-a-number\n0\n0\n---\n");
        bool threw = false;
        try {
            FileStore store(bad);
        } catch (const StorageError&) {
            threw = true;
        }
        assert(threw);

        writeFile(bad + "/users.txt", "u1\nalice\nsalt\n");
        threw = false;
        try {
            FileStore store(bad);
        } catch (const StorageError&) {
            threw = true;
        }
        assert(threw);
        fs::remove_all(bad);
    }

    fs::remove_all(dir);
    return 0;
}
