/**
 * @file Execution.hpp
 * @brief Domain entities produced by executing or undoing a plan.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace sortwell::domain {

/**
 * @struct RollbackEntry
 * @brief Maps a post-move location back to the original location.
 */
struct RollbackEntry {
    std::string from; ///< New location.
    std::string to;   ///< Original location.
    std::string actionId;
    std::string timestamp;
};

/**
 * @struct Rollback
 * @brief Reverse mapping of a plan. Replayed in reverse order by undo.
 */
struct Rollback {
    std::string planId;
    std::string createdAt;
    std::vector<RollbackEntry> entries;
    std::vector<std::string> createdDirectories; ///< Created by execution, shallowest first.
};

enum class ExecutionStatus {
    Completed,
    Failed,
    Skipped
};

inline std::string ExecutionStatusToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Completed: return "completed";
        case ExecutionStatus::Failed: return "failed";
        case ExecutionStatus::Skipped: return "skipped";
    }
    return "skipped";
}

inline ExecutionStatus ExecutionStatusFromString(const std::string& value) {
    if (value == "completed") return ExecutionStatus::Completed;
    if (value == "failed") return ExecutionStatus::Failed;
    return ExecutionStatus::Skipped;
}

struct ExecutionResult {
    std::string actionId;
    ExecutionStatus status = ExecutionStatus::Skipped;
    std::optional<std::string> error;
    std::optional<std::string> actualDestination;
    std::string timestamp;
};

struct ExecutionSummary {
    int total = 0;
    int completed = 0;
    int failed = 0;
    int skipped = 0;
};

/**
 * @struct ExecutionReport
 * @brief Outcome of one executor run. Its rollback covers completed actions only.
 */
struct ExecutionReport {
    std::string planId;
    std::string executedAt;
    bool dryRun = false;
    std::vector<ExecutionResult> results;
    ExecutionSummary summary;
    Rollback rollback;
};

} // namespace sortwell::domain
