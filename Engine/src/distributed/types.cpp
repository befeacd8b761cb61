#include <distributed/types.hpp>
#include <stdexcept>
#include <utility>

namespace Synod {

namespace {

template <typename E, size_t N>
std::string name_of(const std::pair<E, const char*> (&table)[N], E value) {
    for (const auto& [v, name] : table)
        if (v == value) return name;
    return "unknown";
}

template <typename E, size_t N>
E parse_from(const std::pair<E, const char*> (&table)[N], const std::string& name, const char* what) {
    for (const auto& [v, text] : table)
        if (name == text) return v;
    throw std::invalid_argument(std::string("Unknown ") + what + ": '" + name + "'");
}

constexpr std::pair<Capability, const char*> CAPABILITIES[] = {
    {Capability::Deductive, "deductive"},
    {Capability::Inductive, "inductive"},
    {Capability::Abductive, "abductive"},
    {Capability::PatternMatching, "pattern-matching"},
    {Capability::DomainAnalysis, "domain-analysis"},
    {Capability::CodeAnalysis, "code-analysis"},
    {Capability::MultiModal, "multi-modal"},
};

constexpr std::pair<NodeStatus, const char*> NODE_STATUSES[] = {
    {NodeStatus::Online, "online"},
    {NodeStatus::Busy, "busy"},
    {NodeStatus::Error, "error"},
    {NodeStatus::Maintenance, "maintenance"},
    {NodeStatus::Offline, "offline"},
};

constexpr std::pair<TaskPriority, const char*> PRIORITIES[] = {
    {TaskPriority::Low, "low"},
    {TaskPriority::Medium, "medium"},
    {TaskPriority::High, "high"},
    {TaskPriority::Critical, "critical"},
};

constexpr std::pair<TaskStatus, const char*> TASK_STATUSES[] = {
    {TaskStatus::Pending, "pending"},
    {TaskStatus::Assigned, "assigned"},
    {TaskStatus::Running, "running"},
    {TaskStatus::Completed, "completed"},
    {TaskStatus::Failed, "failed"},
    {TaskStatus::Timeout, "timeout"},
    {TaskStatus::Cancelled, "cancelled"},
};

constexpr std::pair<AggregationStrategy, const char*> AGGREGATIONS[] = {
    {AggregationStrategy::MajorityVote, "majority-vote"},
    {AggregationStrategy::WeightedAverage, "weighted-average"},
    {AggregationStrategy::ConfidenceWeighted, "confidence-weighted"},
    {AggregationStrategy::PerformanceWeighted, "performance-weighted"},
    {AggregationStrategy::ConsensusBased, "consensus-based"},
    {AggregationStrategy::BestResult, "best-result"},
};

constexpr std::pair<ConsensusAlgorithm, const char*> CONSENSUS[] = {
    {ConsensusAlgorithm::SimpleMajority, "simple-majority"},
    {ConsensusAlgorithm::WeightedConsensus, "weighted-consensus"},
    {ConsensusAlgorithm::ByzantineFaultTolerant, "byzantine-fault-tolerant"},
    {ConsensusAlgorithm::ConfidenceThreshold, "confidence-threshold"},
};

constexpr std::pair<LoadBalancingStrategy, const char*> BALANCING[] = {
    {LoadBalancingStrategy::RoundRobin, "round-robin"},
    {LoadBalancingStrategy::LeastLoaded, "least-loaded"},
    {LoadBalancingStrategy::PerformanceBased, "performance-based"},
    {LoadBalancingStrategy::CapabilityOptimized, "capability-optimized"},
    {LoadBalancingStrategy::Random, "random"},
};

constexpr std::pair<FaultToleranceLevel, const char*> FAULT_LEVELS[] = {
    {FaultToleranceLevel::None, "none"},
    {FaultToleranceLevel::Basic, "basic"},
    {FaultToleranceLevel::High, "high"},
    {FaultToleranceLevel::Byzantine, "byzantine"},
};

} // anonymous namespace

std::string to_string(Capability c) { return name_of(CAPABILITIES, c); }
std::string to_string(NodeStatus s) { return name_of(NODE_STATUSES, s); }
std::string to_string(TaskPriority p) { return name_of(PRIORITIES, p); }
std::string to_string(TaskStatus s) { return name_of(TASK_STATUSES, s); }
std::string to_string(AggregationStrategy s) { return name_of(AGGREGATIONS, s); }
std::string to_string(ConsensusAlgorithm a) { return name_of(CONSENSUS, a); }
std::string to_string(LoadBalancingStrategy s) { return name_of(BALANCING, s); }
std::string to_string(FaultToleranceLevel l) { return name_of(FAULT_LEVELS, l); }

Capability parse_capability(const std::string& name) {
    return parse_from(CAPABILITIES, name, "capability");
}

NodeStatus parse_node_status(const std::string& name) {
    return parse_from(NODE_STATUSES, name, "node status");
}

TaskPriority parse_task_priority(const std::string& name) {
    return parse_from(PRIORITIES, name, "task priority");
}

TaskStatus parse_task_status(const std::string& name) {
    return parse_from(TASK_STATUSES, name, "task status");
}

AggregationStrategy parse_aggregation_strategy(const std::string& name) {
    return parse_from(AGGREGATIONS, name, "aggregation strategy");
}

ConsensusAlgorithm parse_consensus_algorithm(const std::string& name) {
    return parse_from(CONSENSUS, name, "consensus algorithm");
}

LoadBalancingStrategy parse_load_balancing_strategy(const std::string& name) {
    return parse_from(BALANCING, name, "load balancing strategy");
}

FaultToleranceLevel parse_fault_tolerance_level(const std::string& name) {
    return parse_from(FAULT_LEVELS, name, "fault tolerance level");
}

bool can_transition(TaskStatus from, TaskStatus to) {
    if (is_terminal(from)) return false;
    if (to == TaskStatus::Cancelled || to == TaskStatus::Failed) return true;

    switch (from) {
        case TaskStatus::Pending:  return to == TaskStatus::Assigned;
        case TaskStatus::Assigned: return to == TaskStatus::Running || to == TaskStatus::Timeout;
        case TaskStatus::Running:  return to == TaskStatus::Completed || to == TaskStatus::Timeout;
        default:                   return false;
    }
}

Capability capability_for_query_type(const std::string& query_type) {
    for (const auto& [cap, name] : CAPABILITIES)
        if (query_type == name) return cap;
    return Capability::Deductive;
}

} // namespace Synod
