#include <distributed/errors.hpp>

namespace Synod {

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NodeUnavailable:     return "NodeUnavailable";
        case ErrorKind::TaskTimeout:         return "TaskTimeout";
        case ErrorKind::ConsensusNotReached: return "ConsensusNotReached";
        case ErrorKind::AggregationFailure:  return "AggregationFailure";
        case ErrorKind::InvalidQuery:        return "InvalidQuery";
        case ErrorKind::NodeExecutionError:  return "NodeExecutionError";
        case ErrorKind::TaskCancelled:       return "TaskCancelled";
    }
    return "Unknown";
}

namespace {

std::string describe(ErrorKind kind, const std::string& task_id, const std::string& message,
                     const std::map<std::string, std::string>& failures) {
    std::string out = to_string(kind) + " [" + task_id + "]: " + message;
    if (!failures.empty()) {
        out += " (";
        bool first = true;
        for (const auto& [node, why] : failures) {
            if (!first) out += "; ";
            out += node + ": " + why;
            first = false;
        }
        out += ")";
    }
    return out;
}

} // anonymous namespace

ReasoningError::ReasoningError(ErrorKind kind, std::string task_id, const std::string& message,
                               std::map<std::string, std::string> node_failures)
    : std::runtime_error(describe(kind, task_id, message, node_failures)),
      kind_(kind), task_id_(std::move(task_id)), node_failures_(std::move(node_failures)) {}

} // namespace Synod
