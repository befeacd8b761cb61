/**
 * @file test_config.cpp
 * @brief Deployment configuration, enum names and JSON codecs
 */

#include <gtest/gtest.h>
#include <distributed/config.hpp>
#include <distributed/errors.hpp>
#include <distributed/serialization.hpp>
#include <utils/logger.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace Synod;
namespace fs = std::filesystem;

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() / ("synod_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path_, ec);
        unsetenv("SYNOD_CONFIG");
    }

    void write(const std::string& text) {
        std::ofstream out(path_);
        out << text;
    }

    fs::path path_;
};

TEST(ConfigTest, Defaults) {
    DistributedConfig config;
    EXPECT_EQ(config.max_nodes, 10u);
    EXPECT_EQ(config.default_timeout_ms, 30000);
    EXPECT_EQ(config.heartbeat_interval_ms, 5000);
    EXPECT_EQ(config.node_timeout_threshold_ms, 15000);
    EXPECT_EQ(config.aggregation_strategy, AggregationStrategy::ConfidenceWeighted);
    EXPECT_EQ(config.consensus_algorithm, ConsensusAlgorithm::WeightedConsensus);
    EXPECT_DOUBLE_EQ(config.min_consensus_level, 0.7);
    EXPECT_EQ(config.load_balancing_strategy, LoadBalancingStrategy::LeastLoaded);
    EXPECT_EQ(config.fault_tolerance_level, FaultToleranceLevel::Basic);
    EXPECT_TRUE(config.enable_performance_monitoring);
}

TEST(ConfigTest, ApplyOverlaysPresentKeys) {
    DistributedConfig config;
    config.apply({{"maxNodes", 4},
                  {"defaultTimeout", 2500},
                  {"aggregationStrategy", "majority-vote"},
                  {"consensusAlgorithm", "byzantine-fault-tolerant"},
                  {"loadBalancingStrategy", "round-robin"},
                  {"faultToleranceLevel", "byzantine"},
                  {"minConsensusLevel", 0.6},
                  {"somethingElse", true}});

    EXPECT_EQ(config.max_nodes, 4u);
    EXPECT_EQ(config.default_timeout_ms, 2500);
    EXPECT_EQ(config.aggregation_strategy, AggregationStrategy::MajorityVote);
    EXPECT_EQ(config.consensus_algorithm, ConsensusAlgorithm::ByzantineFaultTolerant);
    EXPECT_EQ(config.load_balancing_strategy, LoadBalancingStrategy::RoundRobin);
    EXPECT_EQ(config.fault_tolerance_level, FaultToleranceLevel::Byzantine);
    EXPECT_DOUBLE_EQ(config.min_consensus_level, 0.6);
    EXPECT_EQ(config.heartbeat_interval_ms, 5000);
}

TEST(ConfigTest, ApplyIsAllOrNothing) {
    DistributedConfig config;
    EXPECT_THROW(config.apply({{"maxNodes", 2}, {"aggregationStrategy", "telepathy"}}), std::invalid_argument);
    EXPECT_EQ(config.max_nodes, 10u);

    EXPECT_THROW(config.apply({{"defaultTimeout", 0}}), std::invalid_argument);
    EXPECT_THROW(config.apply({{"maxNodes", -1}}), std::invalid_argument);
    EXPECT_THROW(config.apply({{"minConsensusLevel", 1.5}}), std::invalid_argument);
    EXPECT_THROW(config.apply(nlohmann::json::array()), std::invalid_argument);
    EXPECT_EQ(config.default_timeout_ms, 30000);
}

TEST(ConfigTest, MaxNodesMayBeZero) {
    DistributedConfig config;
    config.apply({{"maxNodes", 0}});
    EXPECT_EQ(config.max_nodes, 0u);
}

TEST(ConfigTest, JsonRoundTrip) {
    DistributedConfig config;
    config.apply({{"aggregationStrategy", "best-result"}, {"suspicionStrikes", 5}});

    DistributedConfig copy;
    copy.apply(config.to_json());
    EXPECT_EQ(copy.to_json(), config.to_json());
    EXPECT_EQ(config.to_json()["aggregationStrategy"], "best-result");
}

TEST(ConfigTest, LogLevelDrivesLogger) {
    const auto before = Logger::min_level();
    DistributedConfig config;
    config.apply({{"logLevel", "error"}});
    EXPECT_EQ(Logger::min_level(), Logger::Level::Error);
    Logger::set_min_level(before);
}

TEST_F(ConfigFileTest, FromFile) {
    write(R"({"maxNodes": 6, "loadBalancingStrategy": "capability-optimized"})");
    auto config = DistributedConfig::from_file(path_.string());
    EXPECT_EQ(config.max_nodes, 6u);
    EXPECT_EQ(config.load_balancing_strategy, LoadBalancingStrategy::CapabilityOptimized);
}

TEST_F(ConfigFileTest, MissingFileThrows) {
    EXPECT_THROW(DistributedConfig::from_file(path_.string() + ".missing"), std::runtime_error);
}

TEST_F(ConfigFileTest, LoadFromEnvironment) {
    unsetenv("SYNOD_CONFIG");
    EXPECT_EQ(DistributedConfig::load_from_env().max_nodes, 10u);

    write(R"({"maxNodes": 3})");
    setenv("SYNOD_CONFIG", path_.c_str(), 1);
    EXPECT_EQ(DistributedConfig::load_from_env().max_nodes, 3u);
}

// ============================================================================
// Enum names
// ============================================================================

TEST(EnumNamesTest, RoundTrip) {
    for (auto s : {AggregationStrategy::MajorityVote, AggregationStrategy::WeightedAverage,
                   AggregationStrategy::ConfidenceWeighted, AggregationStrategy::PerformanceWeighted,
                   AggregationStrategy::ConsensusBased, AggregationStrategy::BestResult})
        EXPECT_EQ(parse_aggregation_strategy(to_string(s)), s);

    for (auto c : {Capability::Deductive, Capability::Inductive, Capability::Abductive,
                   Capability::PatternMatching, Capability::DomainAnalysis, Capability::CodeAnalysis,
                   Capability::MultiModal})
        EXPECT_EQ(parse_capability(to_string(c)), c);

    EXPECT_EQ(to_string(Capability::PatternMatching), "pattern-matching");
    EXPECT_EQ(to_string(ConsensusAlgorithm::ConfidenceThreshold), "confidence-threshold");
    EXPECT_EQ(to_string(TaskStatus::Cancelled), "cancelled");
    EXPECT_EQ(parse_task_priority("critical"), TaskPriority::Critical);
    EXPECT_THROW(parse_node_status("asleep"), std::invalid_argument);
}

TEST(EnumNamesTest, QueryTypeToCapability) {
    EXPECT_EQ(capability_for_query_type("deductive"), Capability::Deductive);
    EXPECT_EQ(capability_for_query_type("pattern-matching"), Capability::PatternMatching);
    EXPECT_EQ(capability_for_query_type("code-analysis"), Capability::CodeAnalysis);
    EXPECT_EQ(capability_for_query_type("whatever"), Capability::Deductive);
}

TEST(ReasoningErrorTest, MessageCarriesNodeDetail) {
    ReasoningError e(ErrorKind::TaskTimeout, "task-1", "deadline elapsed", {{"n1", "no response"}});
    const std::string what = e.what();
    EXPECT_NE(what.find(to_string(ErrorKind::TaskTimeout)), std::string::npos);
    EXPECT_NE(what.find("task-1"), std::string::npos);
    EXPECT_NE(what.find("n1: no response"), std::string::npos);
    EXPECT_EQ(e.node_failures().size(), 1u);
}

// ============================================================================
// JSON codecs
// ============================================================================

TEST(SerializationTest, RegistrationFromJson) {
    auto reg = nlohmann::json::parse(R"({
        "endpoint": "tcp://10.0.0.5:7000",
        "capabilities": ["deductive", "multi-modal"],
        "metadata": {"rack": 3},
        "authToken": "s3cret"
    })").get<NodeRegistration>();

    EXPECT_EQ(reg.endpoint, "tcp://10.0.0.5:7000");
    EXPECT_EQ(reg.capabilities, (std::set<Capability>{Capability::Deductive, Capability::MultiModal}));
    EXPECT_EQ(reg.metadata["rack"], 3);
    EXPECT_EQ(reg.auth_token, std::optional<std::string>("s3cret"));

    EXPECT_THROW(nlohmann::json::parse(R"({"endpoint": "x", "capabilities": ["telepathy"]})").get<NodeRegistration>(),
                 std::invalid_argument);
}

TEST(SerializationTest, HeartbeatRequiresNodeId) {
    auto hb = nlohmann::json::parse(R"({"nodeId": "node-1", "status": "busy", "workload": 2.0})").get<NodeHeartbeat>();
    EXPECT_EQ(hb.status, NodeStatus::Busy);
    EXPECT_DOUBLE_EQ(hb.workload, 1.0);

    EXPECT_THROW(nlohmann::json::parse(R"({"status": "online"})").get<NodeHeartbeat>(), nlohmann::json::exception);
}

TEST(SerializationTest, ConstraintsCodec) {
    TaskConstraints c;
    c.max_nodes = 3;
    c.require_all_nodes = true;
    c.aggregation = AggregationStrategy::MajorityVote;
    c.excluded_nodes = {"node-9"};

    nlohmann::json j = c;
    EXPECT_EQ(j["maxNodes"], 3);
    EXPECT_EQ(j["aggregationStrategy"], "majority-vote");
    EXPECT_FALSE(j.contains("minConfidence"));

    auto back = j.get<TaskConstraints>();
    EXPECT_EQ(back.max_nodes, std::optional<size_t>(3));
    EXPECT_TRUE(back.require_all_nodes);
    EXPECT_EQ(back.excluded_nodes, std::vector<std::string>{"node-9"});
    EXPECT_EQ(back.aggregation, std::optional<AggregationStrategy>(AggregationStrategy::MajorityVote));
}

TEST(SerializationTest, HealthReportOmitsEmptyIssues) {
    HealthReport ok;
    EXPECT_EQ(nlohmann::json(ok), (nlohmann::json{{"healthy", true}}));

    HealthReport bad{false, {"No active nodes available"}};
    EXPECT_EQ(nlohmann::json(bad)["issues"].size(), 1u);
}
