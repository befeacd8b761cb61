/**
 * @file test_load_balancer.cpp
 * @brief Node selection strategies and filtering
 */

#include <gtest/gtest.h>
#include <distributed/load_balancer.hpp>
#include "../support/manual_clock.hpp"
#include <algorithm>
#include <set>

using namespace Synod;
using Synod::testing::ManualClock;

namespace {

std::vector<std::string> ids_of(const std::vector<ReasoningNode>& nodes) {
    std::vector<std::string> out;
    for (const auto& n : nodes) out.push_back(n.id);
    return out;
}

} // anonymous namespace

class LoadBalancerTest : public ::testing::Test {
protected:
    std::string add(std::set<Capability> caps, double workload = 0.0) {
        NodeRegistration r;
        r.endpoint = "local://n" + std::to_string(registry.size());
        r.capabilities = std::move(caps);
        auto id = registry.register_node(r);
        NodeHeartbeat hb;
        hb.node_id = id;
        hb.workload = workload;
        registry.process_heartbeat(hb);
        return id;
    }

    ManualClock clock;
    NodeRegistry registry{1000, clock.fn()};
    LoadBalancer balancer{registry, 7u};
    TaskConstraints none;
};

TEST_F(LoadBalancerTest, LeastLoadedPrefersIdleNodes) {
    auto busy = add({Capability::Deductive}, 0.9);
    auto idle = add({Capability::Deductive}, 0.1);
    auto mid = add({Capability::Deductive}, 0.5);

    auto picked = balancer.select_nodes({Capability::Deductive}, none, LoadBalancingStrategy::LeastLoaded, 2);
    EXPECT_EQ(ids_of(picked), (std::vector<std::string>{idle, mid}));
    (void)busy;
}

TEST_F(LoadBalancerTest, LeastLoadedBreaksTiesByInFlight) {
    auto a = add({Capability::Deductive});
    auto b = add({Capability::Deductive});
    registry.adjust_in_flight(a, 3);

    auto picked = balancer.select_nodes({Capability::Deductive}, none, LoadBalancingStrategy::LeastLoaded, 1);
    ASSERT_EQ(picked.size(), 1u);
    EXPECT_EQ(picked[0].id, b);
}

TEST_F(LoadBalancerTest, FiltersByCapabilityAndActivity) {
    auto ded = add({Capability::Deductive});
    add({Capability::Inductive});
    auto down = add({Capability::Deductive});
    registry.update_status(down, NodeStatus::Error);

    auto picked = balancer.select_nodes({Capability::Deductive}, none, LoadBalancingStrategy::LeastLoaded, 5);
    EXPECT_EQ(ids_of(picked), std::vector<std::string>{ded});

    clock.advance(5000);
    EXPECT_TRUE(balancer.select_nodes({Capability::Deductive}, none, LoadBalancingStrategy::LeastLoaded, 5).empty());
}

TEST_F(LoadBalancerTest, ExcludedAndPreferredNodes) {
    auto a = add({Capability::Deductive}, 0.1);
    auto b = add({Capability::Deductive}, 0.2);
    auto c = add({Capability::Deductive}, 0.8);

    TaskConstraints constraints;
    constraints.excluded_nodes = {a};
    constraints.preferred_nodes = {c, "node-gone"};

    auto picked = balancer.select_nodes({Capability::Deductive}, constraints, LoadBalancingStrategy::LeastLoaded, 3);
    EXPECT_EQ(ids_of(picked), (std::vector<std::string>{c, b}));
}

TEST_F(LoadBalancerTest, RoundRobinRotates) {
    add({Capability::Deductive});
    add({Capability::Deductive});
    add({Capability::Deductive});

    std::vector<std::string> firsts;
    for (int i = 0; i < 3; ++i) {
        auto picked = balancer.select_nodes({Capability::Deductive}, none, LoadBalancingStrategy::RoundRobin, 1);
        ASSERT_EQ(picked.size(), 1u);
        firsts.push_back(picked[0].id);
    }
    EXPECT_EQ(std::set<std::string>(firsts.begin(), firsts.end()).size(), 3u);
}

TEST_F(LoadBalancerTest, PerformanceBasedPrefersReliableThenFast) {
    auto flaky = add({Capability::Deductive});
    auto slow = add({Capability::Deductive});
    auto fast = add({Capability::Deductive});
    registry.record_execution(flaky, 10.0, false);
    registry.record_execution(slow, 500.0, true);
    registry.record_execution(fast, 20.0, true);

    auto picked = balancer.select_nodes({Capability::Deductive}, none, LoadBalancingStrategy::PerformanceBased, 3);
    EXPECT_EQ(ids_of(picked), (std::vector<std::string>{fast, slow, flaky}));
}

TEST_F(LoadBalancerTest, CapabilityOptimizedAdmitsPartialCoverageLast) {
    auto generalist = add({Capability::Deductive, Capability::Inductive, Capability::Abductive});
    auto specialist = add({Capability::Deductive, Capability::Inductive});
    auto partial = add({Capability::Deductive});
    add({Capability::MultiModal});

    std::set<Capability> required{Capability::Deductive, Capability::Inductive};
    auto picked = balancer.select_nodes(required, none, LoadBalancingStrategy::CapabilityOptimized, 5);
    EXPECT_EQ(ids_of(picked), (std::vector<std::string>{specialist, generalist, partial}));

    auto strict = balancer.select_nodes(required, none, LoadBalancingStrategy::LeastLoaded, 5);
    EXPECT_EQ(strict.size(), 2u);
}

TEST_F(LoadBalancerTest, RandomIsAPermutationOfEligibleNodes) {
    std::set<std::string> all;
    for (int i = 0; i < 5; ++i) all.insert(add({Capability::Deductive}));

    auto picked = balancer.select_nodes({Capability::Deductive}, none, LoadBalancingStrategy::Random, 5);
    auto got = ids_of(picked);
    EXPECT_EQ(std::set<std::string>(got.begin(), got.end()), all);
}

TEST_F(LoadBalancerTest, RequireAllReturnsNothingWhenShort) {
    add({Capability::Deductive});
    add({Capability::Deductive});

    TaskConstraints constraints;
    constraints.require_all_nodes = true;
    EXPECT_TRUE(balancer.select_nodes({Capability::Deductive}, constraints, LoadBalancingStrategy::LeastLoaded, 3).empty());
    EXPECT_EQ(balancer.select_nodes({Capability::Deductive}, constraints, LoadBalancingStrategy::LeastLoaded, 2).size(), 2u);
}

TEST_F(LoadBalancerTest, ZeroRequestedSelectsNothing) {
    add({Capability::Deductive});
    EXPECT_TRUE(balancer.select_nodes({Capability::Deductive}, none, LoadBalancingStrategy::LeastLoaded, 0).empty());
}

TEST_F(LoadBalancerTest, TaskSelectionUsesConfigAndOverrides) {
    for (int i = 0; i < 6; ++i) add({Capability::Deductive}, 0.1 * i);

    DistributedConfig config;
    DistributedReasoningTask task;
    task.required_capabilities = {Capability::Deductive};

    EXPECT_EQ(balancer.select_nodes(task, config).size(), config.default_fanout);

    task.constraints.max_nodes = 5;
    EXPECT_EQ(balancer.select_nodes(task, config).size(), 5u);

    config.max_nodes = 2;
    EXPECT_EQ(balancer.select_nodes(task, config).size(), 2u);
}

TEST(LoadBalancerCountTest, RequestedCountIsCappedByMaxNodes) {
    DistributedConfig config;
    TaskConstraints c;
    EXPECT_EQ(LoadBalancer::requested_count(c, config), 3u);

    c.max_nodes = 20;
    EXPECT_EQ(LoadBalancer::requested_count(c, config), 10u);

    config.max_nodes = 0;
    EXPECT_EQ(LoadBalancer::requested_count(c, config), 0u);
}
