#include <distributed/config.hpp>
#include <utils/logger.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace Synod {

namespace {

template <typename T>
void read_positive(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    const auto v = j.at(key).get<int64_t>();
    if (v <= 0) throw std::invalid_argument(std::string(key) + " must be positive");
    out = static_cast<T>(v);
}

void read_unit(const nlohmann::json& j, const char* key, double& out) {
    if (!j.contains(key)) return;
    const double v = j.at(key).get<double>();
    if (v < 0.0 || v > 1.0) throw std::invalid_argument(std::string(key) + " must be in [0,1]");
    out = v;
}

} // anonymous namespace

void DistributedConfig::apply(const nlohmann::json& patch) {
    if (!patch.is_object()) throw std::invalid_argument("Config patch must be a JSON object");

    DistributedConfig next = *this;

    if (patch.contains("maxNodes")) {
        const auto v = patch.at("maxNodes").get<int64_t>();
        if (v < 0) throw std::invalid_argument("maxNodes must not be negative");
        next.max_nodes = static_cast<size_t>(v);
    }
    read_positive(patch, "defaultFanout", next.default_fanout);
    read_positive(patch, "defaultTimeout", next.default_timeout_ms);
    read_positive(patch, "heartbeatInterval", next.heartbeat_interval_ms);
    read_positive(patch, "nodeTimeoutThreshold", next.node_timeout_threshold_ms);
    read_positive(patch, "suspicionStrikes", next.suspicion_strikes);
    read_positive(patch, "taskRetention", next.task_retention_ms);
    read_positive(patch, "maxConcurrentTasks", next.max_concurrent_tasks);
    read_positive(patch, "dispatchThreads", next.dispatch_threads);

    read_unit(patch, "minConsensusLevel", next.min_consensus_level);
    read_unit(patch, "similarityThreshold", next.similarity_threshold);
    read_unit(patch, "confidenceTolerance", next.confidence_tolerance);

    if (patch.contains("aggregationStrategy"))
        next.aggregation_strategy = parse_aggregation_strategy(patch.at("aggregationStrategy").get<std::string>());
    if (patch.contains("consensusAlgorithm"))
        next.consensus_algorithm = parse_consensus_algorithm(patch.at("consensusAlgorithm").get<std::string>());
    if (patch.contains("loadBalancingStrategy"))
        next.load_balancing_strategy = parse_load_balancing_strategy(patch.at("loadBalancingStrategy").get<std::string>());
    if (patch.contains("faultToleranceLevel"))
        next.fault_tolerance_level = parse_fault_tolerance_level(patch.at("faultToleranceLevel").get<std::string>());

    if (patch.contains("enablePerformanceMonitoring"))
        next.enable_performance_monitoring = patch.at("enablePerformanceMonitoring").get<bool>();
    if (patch.contains("logLevel")) {
        next.log_level = patch.at("logLevel").get<std::string>();
        Logger::set_min_level(Logger::parse_level(next.log_level));
    }

    *this = std::move(next);
}

nlohmann::json DistributedConfig::to_json() const {
    return nlohmann::json{
        {"maxNodes", max_nodes},
        {"defaultFanout", default_fanout},
        {"defaultTimeout", default_timeout_ms},
        {"heartbeatInterval", heartbeat_interval_ms},
        {"nodeTimeoutThreshold", node_timeout_threshold_ms},
        {"aggregationStrategy", to_string(aggregation_strategy)},
        {"consensusAlgorithm", to_string(consensus_algorithm)},
        {"minConsensusLevel", min_consensus_level},
        {"loadBalancingStrategy", to_string(load_balancing_strategy)},
        {"faultToleranceLevel", to_string(fault_tolerance_level)},
        {"similarityThreshold", similarity_threshold},
        {"confidenceTolerance", confidence_tolerance},
        {"suspicionStrikes", suspicion_strikes},
        {"taskRetention", task_retention_ms},
        {"maxConcurrentTasks", max_concurrent_tasks},
        {"dispatchThreads", dispatch_threads},
        {"enablePerformanceMonitoring", enable_performance_monitoring},
        {"logLevel", log_level}
    };
}

DistributedConfig DistributedConfig::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw std::runtime_error("Cannot open config file: " + path);

    DistributedConfig config;
    config.apply(nlohmann::json::parse(file));
    Logger::info("Loaded configuration from " + path);
    return config;
}

DistributedConfig DistributedConfig::load_from_env() {
    const char* path = std::getenv("SYNOD_CONFIG");
    if (!path || !*path) return DistributedConfig{};
    return from_file(path);
}

} // namespace Synod
