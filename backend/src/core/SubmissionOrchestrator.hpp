#pragma once
#include <string>
#include "Challenge.hpp"
#include "FlagMinter.hpp"
#include "Submission.hpp"
#include "TimeWindow.hpp"
#include "../auth/SaltRotator.hpp"
#include "../auth/User.hpp"
#include "../config/EngineConfig.hpp"
#include "../storage/Storage.hpp"

/*
  One answer submission, start to finish:

    Received -> Rotated? -> AnswerChecked -> Minted | Rejected -> Recorded -> Responded

  - the user's salt is rotated first if due; a lost rotation race re-reads
    the user and tries again (max_rotation_retries times)
  - every attempt is recorded with the digest of the answer, never the answer
  - the flag is minted only after the record is durable, with the salt the
    store holds at that point
  - a wrong answer is a normal result, not an error; its message is the same
    whether or not the user solved the challenge before
*/
class SubmissionOrchestrator {
public:
    static constexpr const char* INCORRECT_MESSAGE = "Incorrect. Continue your investigation.";

    SubmissionOrchestrator(const EngineConfig& config,
        const Clock& clock,
        const FlagMinter& minter,
        SaltRotator& rotator,
        UserStore& users,
        SubmissionLog& log);

    // Throws ChallengeInactiveError for a disabled challenge, UserNotFoundError
    // if the user vanished mid-flight, StorageError on any failed write.
    SubmissionResult process(const User& user,
        const Challenge& challenge,
        const std::string& answer,
        const SubmissionMetadata& metadata);

private:
    const EngineConfig& config;
    const Clock& clock;
    const FlagMinter& minter;
    SaltRotator& rotator;
    UserStore& users;
    SubmissionLog& log;

    User rotateWithRetry(const User& user);
    User reload(const std::string& user_id) const;
};
