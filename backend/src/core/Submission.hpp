#pragma once
#include <cstdint>
#include <optional>
#include <string>

// Client details kept for the audit trail only. Never consulted when
// deciding a verdict.
struct SubmissionMetadata {
    std::string ip_address;
    std::string user_agent;
    std::optional<std::int64_t> time_spent_seconds;
};

// Immutable audit entry, one per attempt. Holds the digest of the
// submitted answer, never the answer.
struct SubmissionRecord {
    std::string id;
    std::string user_id;
    std::string challenge_id;
    std::string submitted_answer_hash;   // TruthDigest hex
    bool is_correct = false;
    std::int64_t created_at = 0;
    SubmissionMetadata metadata;
};

struct SubmissionResult {
    bool is_correct = false;
    std::string message;
    std::optional<std::string> flag;   // only when correct
    std::optional<int> points;         // 0 on a repeat solve
};
