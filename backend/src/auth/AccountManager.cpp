#include "AccountManager.hpp"
#include "../core/Errors.hpp"
#include "../crypto/Crypto.hpp"
#include "../utils/Ids.hpp"
#include <spdlog/spdlog.h>

AccountManager::AccountManager(UserStore& store, const Clock& clk)
    : users(store), clock(clk)
{
}

User AccountManager::registerUser(const std::string& username) {
    spdlog::info("Attempting registration for username '{}'", username);

    if (username.empty()) {
        spdlog::warn("Registration failed: empty username");
        throw PreconditionError("username must not be empty");
    }

    if (users.findUserByName(username)) {
        spdlog::warn("Registration failed: username '{}' already exists", username);
        throw PreconditionError("username already exists: " + username);
    }

    User user(generateID(), username, Crypto::randomSaltHex(), clock.now());
    users.addUser(user);

    spdlog::info("Registration successful for username '{}' (ID={})", username, user.id);
    return user;
}

std::optional<User> AccountManager::findUser(const std::string& id) const {
    return users.findUser(id);
}

std::optional<User> AccountManager::findUserByName(const std::string& username) const {
    return users.findUserByName(username);
}
