/**
 * @file types.hpp
 * @brief Value types shared by the coordination components
 *
 * Nodes, tasks, constraints and the per-node / aggregated result records.
 * Every enum has a stable textual name (used in JSON config and logs);
 * parsing an unknown name throws std::invalid_argument.
 */

#pragma once

#include <reasoning/types.hpp>
#include <utils/time.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Synod {

// =============================================================================
// Enumerations
// =============================================================================

enum class Capability {
    Deductive,
    Inductive,
    Abductive,
    PatternMatching,
    DomainAnalysis,
    CodeAnalysis,
    MultiModal
};

enum class NodeStatus { Online, Busy, Error, Maintenance, Offline };

enum class TaskPriority { Low = 0, Medium = 1, High = 2, Critical = 3 };

/**
 * pending -> assigned -> running -> {completed | failed | timeout | cancelled}
 * Any non-terminal state may also go to cancelled or failed.
 */
enum class TaskStatus { Pending, Assigned, Running, Completed, Failed, Timeout, Cancelled };

enum class AggregationStrategy {
    MajorityVote,
    WeightedAverage,
    ConfidenceWeighted,
    PerformanceWeighted,
    ConsensusBased,
    BestResult
};

enum class ConsensusAlgorithm {
    SimpleMajority,
    WeightedConsensus,
    ByzantineFaultTolerant,
    ConfidenceThreshold
};

enum class LoadBalancingStrategy {
    RoundRobin,
    LeastLoaded,
    PerformanceBased,
    CapabilityOptimized,
    Random
};

enum class FaultToleranceLevel { None, Basic, High, Byzantine };

SYNOD_API std::string to_string(Capability c);
SYNOD_API std::string to_string(NodeStatus s);
SYNOD_API std::string to_string(TaskPriority p);
SYNOD_API std::string to_string(TaskStatus s);
SYNOD_API std::string to_string(AggregationStrategy s);
SYNOD_API std::string to_string(ConsensusAlgorithm a);
SYNOD_API std::string to_string(LoadBalancingStrategy s);
SYNOD_API std::string to_string(FaultToleranceLevel l);

SYNOD_API Capability parse_capability(const std::string& name);
SYNOD_API NodeStatus parse_node_status(const std::string& name);
SYNOD_API TaskPriority parse_task_priority(const std::string& name);
SYNOD_API TaskStatus parse_task_status(const std::string& name);
SYNOD_API AggregationStrategy parse_aggregation_strategy(const std::string& name);
SYNOD_API ConsensusAlgorithm parse_consensus_algorithm(const std::string& name);
SYNOD_API LoadBalancingStrategy parse_load_balancing_strategy(const std::string& name);
SYNOD_API FaultToleranceLevel parse_fault_tolerance_level(const std::string& name);

inline bool is_terminal(TaskStatus s) {
    return s == TaskStatus::Completed || s == TaskStatus::Failed ||
           s == TaskStatus::Timeout || s == TaskStatus::Cancelled;
}

SYNOD_API bool can_transition(TaskStatus from, TaskStatus to);

/**
 * @brief Capability a query type needs: "deductive" -> Deductive, etc.
 *
 * Unrecognised types need only Deductive (the hybrid path runs anywhere).
 */
SYNOD_API Capability capability_for_query_type(const std::string& query_type);

// =============================================================================
// Nodes
// =============================================================================

struct NodePerformance {
    double avg_response_time_ms = 0.0;
    uint64_t tasks_completed = 0;
    uint64_t tasks_errored = 0;
    int64_t uptime_ms = 0;
    double reliability = 1.0;      // [0,1]
};

struct ReasoningNode {
    std::string id;
    std::string endpoint;
    std::set<Capability> capabilities;
    NodeStatus status = NodeStatus::Online;
    TimePoint last_heartbeat{};
    TimePoint registered_at{};
    NodePerformance performance;
    double workload = 0.0;         // [0,1]
    size_t in_flight = 0;          // Assignments handed out by the coordinator
    nlohmann::json metadata = nlohmann::json::object();

    bool has_capability(Capability c) const { return capabilities.count(c) > 0; }

    bool has_all(const std::set<Capability>& required) const {
        for (auto c : required)
            if (!has_capability(c)) return false;
        return true;
    }
};

struct NodeRegistration {
    std::string endpoint;
    std::set<Capability> capabilities;
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<std::string> auth_token;
};

struct NodeHeartbeat {
    std::string node_id;
    NodeStatus status = NodeStatus::Online;
    double workload = 0.0;
    NodePerformance performance;
};

// =============================================================================
// Tasks
// =============================================================================

struct TaskConstraints {
    std::optional<int64_t> max_execution_time_ms;
    std::optional<double> min_confidence;
    std::optional<size_t> max_nodes;
    std::vector<std::string> preferred_nodes;
    std::vector<std::string> excluded_nodes;
    bool require_all_nodes = false;

    // Per-task overrides of the deployment defaults
    std::optional<AggregationStrategy> aggregation;
    std::optional<LoadBalancingStrategy> load_balancing;
    std::set<Capability> required_capabilities;   // Empty = infer from query type
};

struct NodeReasoningResult {
    std::string node_id;
    ReasoningResult result;
    double execution_time_ms = 0.0;
    double reliability = 1.0;
    std::optional<std::string> error;

    bool ok() const { return !error.has_value(); }
};

struct QualityMetrics {
    double accuracy = 0.0;
    double precision = 0.0;
    double recall = 0.0;
    double f1_score = 0.0;
    double consistency = 0.0;
    double reliability = 0.0;
};

struct ResultMetadata {
    AggregationStrategy aggregation_strategy = AggregationStrategy::ConfidenceWeighted;
    ConsensusAlgorithm consensus_algorithm = ConsensusAlgorithm::WeightedConsensus;
    std::map<std::string, double> node_participation;   // node -> 1 (usable) / 0
    QualityMetrics quality;
    double distribution_efficiency = 0.0;
    double weighted_consensus = 0.0;                    // Agreement weighted by the consensus algorithm
    std::map<std::string, std::string> failed_nodes;    // Timed out or lost, with reason
    std::vector<std::string> excluded_nodes;            // Screened out as suspicious
    std::vector<std::string> redistributed_from;        // Nodes replaced mid-task
};

struct DistributedReasoningResult {
    std::string task_id;
    std::vector<NodeReasoningResult> node_results;      // Arrival order
    ReasoningResult aggregated_result;
    double consensus_level = 0.0;
    double execution_time_ms = 0.0;
    size_t nodes_used = 0;
    ResultMetadata metadata;
};

struct DistributedReasoningTask {
    std::string id;
    ReasoningQuery query;
    TaskPriority priority = TaskPriority::Medium;
    std::set<Capability> required_capabilities;
    TaskConstraints constraints;
    TaskStatus status = TaskStatus::Pending;
    std::vector<std::string> assigned_nodes;
    TimePoint created_at{};
    TimePoint updated_at{};
    uint64_t sequence = 0;                              // Submission order tie-breaker
    std::optional<std::string> error;
    std::optional<DistributedReasoningResult> result;
};

// =============================================================================
// Reporting
// =============================================================================

struct DistributedReasoningStats {
    size_t total_nodes = 0;
    size_t active_nodes = 0;
    size_t total_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    double average_response_time_ms = 0.0;
    double system_throughput = 0.0;                     // Tasks per second, last minute
    std::map<std::string, double> node_utilization;
    std::map<std::string, size_t> capability_distribution;
    double system_reliability = 1.0;
};

struct HealthReport {
    bool healthy = true;
    std::vector<std::string> issues;
};

} // namespace Synod
