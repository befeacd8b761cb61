/**
 * @file result_aggregator.hpp
 * @brief Reduces per-node results to one answer and a consensus level
 */

#pragma once

#include <consensus/similarity.hpp>
#include <distributed/config.hpp>
#include <distributed/types.hpp>
#include <export.hpp>
#include <map>
#include <string>
#include <vector>

namespace Synod {

struct AggregationSettings {
    AggregationStrategy strategy = AggregationStrategy::ConfidenceWeighted;
    ConsensusAlgorithm consensus = ConsensusAlgorithm::WeightedConsensus;
    double min_consensus_level = 0.7;
    SimilarityThresholds thresholds;

    static AggregationSettings from_config(const DistributedConfig& config) {
        AggregationSettings s;
        s.strategy = config.aggregation_strategy;
        s.consensus = config.consensus_algorithm;
        s.min_consensus_level = config.min_consensus_level;
        s.thresholds.similarity = config.similarity_threshold;
        s.thresholds.confidence_tolerance = config.confidence_tolerance;
        return s;
    }
};

struct Aggregation {
    ReasoningResult result;
    double consensus_level = 0.0;       // Agreeing / participating nodes
    double weighted_consensus = 0.0;    // Agreement weighted by the consensus algorithm
    QualityMetrics quality;
    std::map<std::string, double> participation;   // node -> 1 used / 0 not
    double distribution_efficiency = 0.0;
    std::vector<std::string> agreeing_nodes;
};

/**
 * @brief Stateless reduction of node results.
 *
 * Only results without an error and with a positive node weight take part.
 * Every strategy is an order-independent reduction apart from tie-breaks,
 * which favour the earliest arrival.
 *
 * consensus_level is the plain share of participating nodes that agree with
 * the chosen aggregate (see agrees()); majority-vote reports the winning
 * group's share. weighted_consensus is the same agreement weighted by the
 * consensus algorithm (reliability, confidence or one vote per node), and is
 * what consensus-based aggregation compares against its floor.
 */
class SYNOD_API ResultAggregator {
public:
    /**
     * @param node_weights Per-node multipliers (fault-tolerance down-weighting);
     *        nodes not listed weigh 1
     * @throws ReasoningError AggregationFailure with no usable result,
     *         ConsensusNotReached when consensus-based falls short
     */
    Aggregation aggregate(const std::string& task_id,
                          const std::vector<NodeReasoningResult>& results,
                          const AggregationSettings& settings,
                          const std::map<std::string, double>& node_weights = {}) const;

    /**
     * @brief Fraction of `usable` agreeing with an already chosen aggregate.
     */
    double consensus_level(const std::vector<const NodeReasoningResult*>& usable,
                           const ReasoningResult& aggregate,
                           const AggregationSettings& settings,
                           std::vector<std::string>* agreeing = nullptr) const;

    /**
     * @brief Agreement share weighted per settings.consensus; falls back to
     *        consensus_level() when every weight is zero.
     */
    double weighted_support(const std::vector<const NodeReasoningResult*>& usable,
                            const ReasoningResult& aggregate,
                            const AggregationSettings& settings) const;

private:
    ReasoningResult union_of(const std::vector<const NodeReasoningResult*>& usable,
                             const std::vector<double>& weights,
                             const std::string& method) const;
};

} // namespace Synod
