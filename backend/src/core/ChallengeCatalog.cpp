#include "ChallengeCatalog.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>

static bool isBlank(const std::string& s) {
    return TruthHasher::normalize(s).empty();
}

ChallengeCatalog::ChallengeCatalog(ChallengeStore& s, const Clock& clk)
    : store(s), clock(clk)
{
}

Challenge ChallengeCatalog::authorChallenge(const std::string& title, const std::string& truth, int points) {
    if (title.empty() || isBlank(truth)) {
        spdlog::warn("Refusing to author challenge with empty title or truth");
        throw PreconditionError("challenge title and truth are required");
    }
    if (points < 0) {
        spdlog::warn("Refusing to author challenge '{}' with negative points", title);
        throw PreconditionError("challenge points must not be negative");
    }

    Challenge c(title, truth, points, clock.now());
    store.addChallenge(c);
    return c;
}

Challenge ChallengeCatalog::updateTruth(const std::string& challenge_id, const std::string& truth) {
    if (isBlank(truth)) {
        spdlog::warn("Refusing empty truth for challenge '{}'", challenge_id);
        throw PreconditionError("challenge truth is required");
    }

    Challenge c = require(challenge_id);
    c.replaceTruth(truth);
    store.updateChallenge(c);
    return c;
}

Challenge ChallengeCatalog::setActive(const std::string& challenge_id, bool active) {
    Challenge c = require(challenge_id);
    c.is_active = active;
    store.updateChallenge(c);
    spdlog::info("Challenge ID={} is now {}", challenge_id, active ? "active" : "inactive");
    return c;
}

std::optional<Challenge> ChallengeCatalog::find(const std::string& challenge_id) const {
    return store.findChallenge(challenge_id);
}

std::vector<Challenge> ChallengeCatalog::list() const {
    return store.listChallenges();
}

Challenge ChallengeCatalog::require(const std::string& challenge_id) const {
    auto c = store.findChallenge(challenge_id);
    if (!c) {
        spdlog::warn("Unknown challenge '{}'", challenge_id);
        throw ChallengeNotFoundError(challenge_id);
    }
    return *c;
}
