#include <distributed/load_balancer.hpp>
#include <utils/logger.hpp>
#include <algorithm>

namespace Synod {

namespace {

size_t coverage(const ReasoningNode& node, const std::set<Capability>& required) {
    size_t n = 0;
    for (auto c : required)
        if (node.has_capability(c)) ++n;
    return n;
}

bool contains(const std::vector<std::string>& ids, const std::string& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

} // anonymous namespace

LoadBalancer::LoadBalancer(const NodeRegistry& registry)
    : registry_(registry), rng_(std::random_device{}()) {}

LoadBalancer::LoadBalancer(const NodeRegistry& registry, uint32_t seed)
    : registry_(registry), rng_(seed) {}

size_t LoadBalancer::requested_count(const TaskConstraints& constraints, const DistributedConfig& config) {
    if (constraints.max_nodes) return std::min(*constraints.max_nodes, config.max_nodes);
    return std::min(config.default_fanout, config.max_nodes);
}

std::vector<ReasoningNode> LoadBalancer::select_nodes(const DistributedReasoningTask& task,
                                                      const DistributedConfig& config) {
    const auto strategy = task.constraints.load_balancing.value_or(config.load_balancing_strategy);
    return select_nodes(task.required_capabilities, task.constraints, strategy,
                        requested_count(task.constraints, config));
}

std::vector<ReasoningNode> LoadBalancer::select_nodes(const std::set<Capability>& required,
                                                      const TaskConstraints& constraints,
                                                      LoadBalancingStrategy strategy,
                                                      size_t requested) {
    if (requested == 0) return {};

    auto ranked = rank(registry_.get_active_nodes(), required, constraints, strategy);

    if (constraints.require_all_nodes && ranked.size() < requested) {
        Logger::warn("Load balancer: " + std::to_string(ranked.size()) + " eligible nodes, " +
                     std::to_string(requested) + " required");
        return {};
    }

    if (ranked.size() > requested) ranked.resize(requested);
    return ranked;
}

std::vector<ReasoningNode> LoadBalancer::rank(std::vector<ReasoningNode> candidates,
                                              const std::set<Capability>& required,
                                              const TaskConstraints& constraints,
                                              LoadBalancingStrategy strategy) {
    const bool allow_partial = strategy == LoadBalancingStrategy::CapabilityOptimized;

    candidates.erase(std::remove_if(candidates.begin(), candidates.end(), [&](const ReasoningNode& n) {
        if (contains(constraints.excluded_nodes, n.id)) return true;
        if (n.status != NodeStatus::Online && n.status != NodeStatus::Busy) return true;
        const size_t covered = coverage(n, required);
        if (covered == required.size()) return false;
        return !(allow_partial && covered > 0);
    }), candidates.end());

    // Preferred nodes keep the caller's order
    std::vector<ReasoningNode> preferred;
    for (const auto& id : constraints.preferred_nodes) {
        auto it = std::find_if(candidates.begin(), candidates.end(), [&](const ReasoningNode& n) { return n.id == id; });
        if (it != candidates.end()) {
            preferred.push_back(std::move(*it));
            candidates.erase(it);
        }
    }

    order_by_strategy(candidates, required, strategy);

    preferred.insert(preferred.end(), std::make_move_iterator(candidates.begin()),
                     std::make_move_iterator(candidates.end()));
    return preferred;
}

void LoadBalancer::order_by_strategy(std::vector<ReasoningNode>& nodes, const std::set<Capability>& required,
                                     LoadBalancingStrategy strategy) {
    std::sort(nodes.begin(), nodes.end(), [](const auto& a, const auto& b) { return a.id < b.id; });

    switch (strategy) {
        case LoadBalancingStrategy::RoundRobin: {
            if (nodes.empty()) return;
            std::lock_guard<std::mutex> lock(mutex_);
            const size_t start = rr_cursor_ % nodes.size();
            std::rotate(nodes.begin(), nodes.begin() + static_cast<std::ptrdiff_t>(start), nodes.end());
            ++rr_cursor_;
            return;
        }

        case LoadBalancingStrategy::LeastLoaded:
            std::stable_sort(nodes.begin(), nodes.end(), [](const auto& a, const auto& b) {
                if (a.workload != b.workload) return a.workload < b.workload;
                return a.in_flight < b.in_flight;
            });
            return;

        case LoadBalancingStrategy::PerformanceBased:
            std::stable_sort(nodes.begin(), nodes.end(), [](const auto& a, const auto& b) {
                if (a.performance.reliability != b.performance.reliability)
                    return a.performance.reliability > b.performance.reliability;
                return a.performance.avg_response_time_ms < b.performance.avg_response_time_ms;
            });
            return;

        case LoadBalancingStrategy::CapabilityOptimized:
            // Full coverage first; among those the least over-provisioned, then the idlest
            std::stable_sort(nodes.begin(), nodes.end(), [&](const auto& a, const auto& b) {
                const size_t ca = coverage(a, required), cb = coverage(b, required);
                if (ca != cb) return ca > cb;
                if (a.capabilities.size() != b.capabilities.size())
                    return a.capabilities.size() < b.capabilities.size();
                return a.workload < b.workload;
            });
            return;

        case LoadBalancingStrategy::Random: {
            std::lock_guard<std::mutex> lock(mutex_);
            std::shuffle(nodes.begin(), nodes.end(), rng_);
            return;
        }
    }
}

} // namespace Synod
