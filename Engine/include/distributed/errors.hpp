/**
 * @file errors.hpp
 * @brief Task-level failure taxonomy
 */

#pragma once

#include <export.hpp>
#include <map>
#include <stdexcept>
#include <string>

namespace Synod {

enum class ErrorKind {
    NodeUnavailable,       // No live capable node, or require_all_nodes unmet
    TaskTimeout,           // Deadline elapsed before aggregation
    ConsensusNotReached,   // Consensus-based aggregation below threshold
    AggregationFailure,    // Zero usable node results
    InvalidQuery,          // Rejected before dispatch
    NodeExecutionError,    // Per-node failure; task-level only when nothing else remains
    TaskCancelled
};

SYNOD_API std::string to_string(ErrorKind kind);

/**
 * @brief Raised by the coordinator when a task cannot produce a result.
 *
 * Carries the kind, the task and which nodes failed with what reason, so a
 * partial outage can be diagnosed without re-running the task.
 */
class SYNOD_API ReasoningError : public std::runtime_error {
public:
    ReasoningError(ErrorKind kind, std::string task_id, const std::string& message,
                   std::map<std::string, std::string> node_failures = {});

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& task_id() const noexcept { return task_id_; }
    const std::map<std::string, std::string>& node_failures() const noexcept { return node_failures_; }

private:
    ErrorKind kind_;
    std::string task_id_;
    std::map<std::string, std::string> node_failures_;
};

} // namespace Synod
