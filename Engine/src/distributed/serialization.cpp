#include <distributed/serialization.hpp>
#include <algorithm>

namespace Synod {

namespace {

nlohmann::json capabilities_to_json(const std::set<Capability>& caps) {
    auto arr = nlohmann::json::array();
    for (auto c : caps) arr.push_back(to_string(c));
    return arr;
}

std::set<Capability> capabilities_from_json(const nlohmann::json& j) {
    std::set<Capability> caps;
    for (const auto& c : j) caps.insert(parse_capability(c.get<std::string>()));
    return caps;
}

} // anonymous namespace

void to_json(nlohmann::json& j, const NodePerformance& p) {
    j = nlohmann::json{
        {"averageResponseTime", p.avg_response_time_ms},
        {"tasksCompleted", p.tasks_completed},
        {"tasksErrored", p.tasks_errored},
        {"uptime", p.uptime_ms},
        {"reliability", p.reliability}
    };
}

void from_json(const nlohmann::json& j, NodePerformance& p) {
    p = NodePerformance{};
    p.avg_response_time_ms = j.value("averageResponseTime", 0.0);
    p.tasks_completed = j.value("tasksCompleted", uint64_t{0});
    p.tasks_errored = j.value("tasksErrored", uint64_t{0});
    p.uptime_ms = j.value("uptime", int64_t{0});
    p.reliability = std::clamp(j.value("reliability", 1.0), 0.0, 1.0);
}

void to_json(nlohmann::json& j, const NodeRegistration& r) {
    j = nlohmann::json{
        {"endpoint", r.endpoint},
        {"capabilities", capabilities_to_json(r.capabilities)},
        {"metadata", r.metadata}
    };
    if (r.auth_token) j["authToken"] = *r.auth_token;
}

void from_json(const nlohmann::json& j, NodeRegistration& r) {
    r = NodeRegistration{};
    r.endpoint = j.value("endpoint", std::string());
    if (j.contains("capabilities")) r.capabilities = capabilities_from_json(j["capabilities"]);
    if (j.contains("metadata")) r.metadata = j["metadata"];
    if (j.contains("authToken")) r.auth_token = j["authToken"].get<std::string>();
}

void to_json(nlohmann::json& j, const NodeHeartbeat& h) {
    j = nlohmann::json{
        {"nodeId", h.node_id},
        {"status", to_string(h.status)},
        {"workload", h.workload},
        {"performance", h.performance}
    };
}

void from_json(const nlohmann::json& j, NodeHeartbeat& h) {
    h = NodeHeartbeat{};
    h.node_id = j.at("nodeId").get<std::string>();
    h.status = parse_node_status(j.value("status", std::string("online")));
    h.workload = std::clamp(j.value("workload", 0.0), 0.0, 1.0);
    if (j.contains("performance")) h.performance = j["performance"].get<NodePerformance>();
}

void to_json(nlohmann::json& j, const TaskConstraints& c) {
    j = nlohmann::json::object();
    if (c.max_execution_time_ms) j["maxExecutionTime"] = *c.max_execution_time_ms;
    if (c.min_confidence) j["minConfidence"] = *c.min_confidence;
    if (c.max_nodes) j["maxNodes"] = *c.max_nodes;
    j["preferredNodes"] = c.preferred_nodes;
    j["excludedNodes"] = c.excluded_nodes;
    j["requireAllNodes"] = c.require_all_nodes;
    if (c.aggregation) j["aggregationStrategy"] = to_string(*c.aggregation);
    if (c.load_balancing) j["loadBalancingStrategy"] = to_string(*c.load_balancing);
    if (!c.required_capabilities.empty())
        j["requiredCapabilities"] = capabilities_to_json(c.required_capabilities);
}

void from_json(const nlohmann::json& j, TaskConstraints& c) {
    c = TaskConstraints{};
    if (j.contains("maxExecutionTime")) c.max_execution_time_ms = j["maxExecutionTime"].get<int64_t>();
    if (j.contains("minConfidence")) c.min_confidence = j["minConfidence"].get<double>();
    if (j.contains("maxNodes")) c.max_nodes = j["maxNodes"].get<size_t>();
    if (j.contains("preferredNodes")) c.preferred_nodes = j["preferredNodes"].get<std::vector<std::string>>();
    if (j.contains("excludedNodes")) c.excluded_nodes = j["excludedNodes"].get<std::vector<std::string>>();
    c.require_all_nodes = j.value("requireAllNodes", false);
    if (j.contains("aggregationStrategy"))
        c.aggregation = parse_aggregation_strategy(j["aggregationStrategy"].get<std::string>());
    if (j.contains("loadBalancingStrategy"))
        c.load_balancing = parse_load_balancing_strategy(j["loadBalancingStrategy"].get<std::string>());
    if (j.contains("requiredCapabilities"))
        c.required_capabilities = capabilities_from_json(j["requiredCapabilities"]);
}

void to_json(nlohmann::json& j, const NodeReasoningResult& r) {
    j = nlohmann::json{
        {"nodeId", r.node_id},
        {"result", r.result},
        {"executionTime", r.execution_time_ms},
        {"reliability", r.reliability}
    };
    if (r.error) j["error"] = *r.error;
}

void to_json(nlohmann::json& j, const QualityMetrics& q) {
    j = nlohmann::json{
        {"accuracy", q.accuracy},
        {"precision", q.precision},
        {"recall", q.recall},
        {"f1Score", q.f1_score},
        {"consistency", q.consistency},
        {"reliability", q.reliability}
    };
}

void to_json(nlohmann::json& j, const ResultMetadata& m) {
    j = nlohmann::json{
        {"aggregationStrategy", to_string(m.aggregation_strategy)},
        {"consensusAlgorithm", to_string(m.consensus_algorithm)},
        {"nodeParticipation", m.node_participation},
        {"qualityMetrics", m.quality},
        {"distributionEfficiency", m.distribution_efficiency},
        {"weightedConsensus", m.weighted_consensus},
        {"failedNodes", m.failed_nodes},
        {"excludedNodes", m.excluded_nodes},
        {"redistributedFrom", m.redistributed_from}
    };
}

void to_json(nlohmann::json& j, const DistributedReasoningResult& r) {
    j = nlohmann::json{
        {"taskId", r.task_id},
        {"nodeResults", r.node_results},
        {"aggregatedResult", r.aggregated_result},
        {"consensusLevel", r.consensus_level},
        {"executionTime", r.execution_time_ms},
        {"nodesUsed", r.nodes_used},
        {"metadata", r.metadata}
    };
}

void to_json(nlohmann::json& j, const DistributedReasoningStats& s) {
    j = nlohmann::json{
        {"totalNodes", s.total_nodes},
        {"activeNodes", s.active_nodes},
        {"totalTasks", s.total_tasks},
        {"completedTasks", s.completed_tasks},
        {"failedTasks", s.failed_tasks},
        {"averageResponseTime", s.average_response_time_ms},
        {"systemThroughput", s.system_throughput},
        {"nodeUtilization", s.node_utilization},
        {"capabilityDistribution", s.capability_distribution},
        {"systemReliability", s.system_reliability}
    };
}

void to_json(nlohmann::json& j, const HealthReport& h) {
    j = nlohmann::json{{"healthy", h.healthy}};
    if (!h.issues.empty()) j["issues"] = h.issues;
}

nlohmann::json node_to_json(const ReasoningNode& node, TimePoint now) {
    return nlohmann::json{
        {"id", node.id},
        {"endpoint", node.endpoint},
        {"capabilities", capabilities_to_json(node.capabilities)},
        {"status", to_string(node.status)},
        {"msSinceHeartbeat", ms_between(node.last_heartbeat, now)},
        {"performance", node.performance},
        {"workload", node.workload},
        {"metadata", node.metadata}
    };
}

nlohmann::json task_to_json(const DistributedReasoningTask& task, TimePoint now) {
    nlohmann::json j{
        {"id", task.id},
        {"query", task.query},
        {"priority", to_string(task.priority)},
        {"requiredCapabilities", capabilities_to_json(task.required_capabilities)},
        {"constraints", task.constraints},
        {"status", to_string(task.status)},
        {"assignedNodes", task.assigned_nodes},
        {"ageMs", ms_between(task.created_at, now)}
    };
    if (task.error) j["error"] = *task.error;
    if (task.result) j["result"] = *task.result;
    return j;
}

} // namespace Synod
