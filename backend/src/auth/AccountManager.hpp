#pragma once

#include <optional>
#include <string>
#include "User.hpp"
#include "../core/TimeWindow.hpp"
#include "../storage/Storage.hpp"

// Account creation: every new user starts with a fresh random flag salt.
class AccountManager {
public:
    AccountManager(UserStore& users, const Clock& clock);

    // Returns the stored user. Throws PreconditionError on an empty or taken
    // username, StorageError if the write fails.
    User registerUser(const std::string& username);

    std::optional<User> findUser(const std::string& id) const;
    std::optional<User> findUserByName(const std::string& username) const;

private:
    UserStore& users;
    const Clock& clock;
};
