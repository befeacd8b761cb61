/**
 * @file config.hpp
 * @brief Deployment configuration for the coordination subsystem
 */

#pragma once

#include <distributed/types.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace Synod {

struct SYNOD_API DistributedConfig {
    size_t max_nodes = 10;
    size_t default_fanout = 3;
    int64_t default_timeout_ms = 30000;
    int64_t heartbeat_interval_ms = 5000;
    int64_t node_timeout_threshold_ms = 15000;
    AggregationStrategy aggregation_strategy = AggregationStrategy::ConfidenceWeighted;
    ConsensusAlgorithm consensus_algorithm = ConsensusAlgorithm::WeightedConsensus;
    double min_consensus_level = 0.7;
    LoadBalancingStrategy load_balancing_strategy = LoadBalancingStrategy::LeastLoaded;
    FaultToleranceLevel fault_tolerance_level = FaultToleranceLevel::Basic;
    double similarity_threshold = 0.8;
    double confidence_tolerance = 0.25;
    size_t suspicion_strikes = 3;
    int64_t task_retention_ms = 300000;
    size_t max_concurrent_tasks = 16;
    size_t dispatch_threads = 8;                // Warm workers; busier bursts get extra threads
    bool enable_performance_monitoring = true;
    std::string log_level = "info";

    /**
     * @brief Overlay the keys present in `patch` onto this config.
     *
     * Keys use the JSON names (camelCase). Unknown keys are ignored; unknown
     * enum names and out-of-range numbers throw std::invalid_argument and
     * leave the config untouched.
     */
    void apply(const nlohmann::json& patch);

    nlohmann::json to_json() const;

    /**
     * @brief Defaults overlaid with a JSON file.
     * @throws std::runtime_error if the file cannot be read
     */
    static DistributedConfig from_file(const std::string& path);

    /**
     * @brief Defaults, overlaid with the file named by SYNOD_CONFIG when set.
     */
    static DistributedConfig load_from_env();
};

} // namespace Synod
