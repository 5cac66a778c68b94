#pragma once
#include <stdexcept>
#include <string>

// Base for everything the flag engine throws.
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& what) : std::runtime_error(what) {}

    // Whether the caller may retry the whole operation unchanged.
    virtual bool retryable() const { return false; }
};

// Caller error: the request can never succeed as issued.
class PreconditionError : public EngineError {
public:
    explicit PreconditionError(const std::string& what) : EngineError(what) {}
};

class ChallengeNotFoundError : public PreconditionError {
public:
    explicit ChallengeNotFoundError(const std::string& id)
        : PreconditionError("challenge not found: " + id) {}
};

class ChallengeInactiveError : public PreconditionError {
public:
    explicit ChallengeInactiveError(const std::string& id)
        : PreconditionError("challenge inactive: " + id) {}
};

class UserNotFoundError : public PreconditionError {
public:
    explicit UserNotFoundError(const std::string& id)
        : PreconditionError("user not found: " + id) {}
};

class MalformedTokenError : public PreconditionError {
public:
    MalformedTokenError() : PreconditionError("malformed flag token") {}
};

// Collaborator (persistence) failure. Nothing was returned to the user.
class StorageError : public EngineError {
public:
    explicit StorageError(const std::string& what) : EngineError(what) {}

    bool retryable() const override { return true; }
};

// Optimistic-concurrency loss on a user's salt record.
class SaltConflictError : public StorageError {
public:
    explicit SaltConflictError(const std::string& user_id)
        : StorageError("concurrent salt update for user " + user_id) {}
};
