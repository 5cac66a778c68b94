#pragma once
#include <optional>
#include <string>
#include <vector>
#include "Challenge.hpp"
#include "TimeWindow.hpp"
#include "../storage/Storage.hpp"

// Authoring side of challenges. The truth passed in is hashed immediately
// and never stored or logged.
class ChallengeCatalog {
public:
    ChallengeCatalog(ChallengeStore& store, const Clock& clock);

    Challenge authorChallenge(const std::string& title, const std::string& truth, int points);

    // New digest and a new challenge salt: all flags issued so far die.
    Challenge updateTruth(const std::string& challenge_id, const std::string& truth);

    Challenge setActive(const std::string& challenge_id, bool active);

    std::optional<Challenge> find(const std::string& challenge_id) const;
    std::vector<Challenge> list() const;

private:
    ChallengeStore& store;
    const Clock& clock;

    Challenge require(const std::string& challenge_id) const;
};
