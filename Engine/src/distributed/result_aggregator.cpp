#include <distributed/result_aggregator.hpp>
#include <distributed/errors.hpp>
#include <consensus/weighting.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <unordered_map>

namespace Synod {

namespace {

const char* method_label(AggregationStrategy s) {
    switch (s) {
        case AggregationStrategy::MajorityVote:        return "Majority vote";
        case AggregationStrategy::WeightedAverage:     return "Weighted average";
        case AggregationStrategy::ConfidenceWeighted:  return "Confidence-weighted";
        case AggregationStrategy::PerformanceWeighted: return "Performance-weighted";
        case AggregationStrategy::ConsensusBased:      return "Consensus-based";
        case AggregationStrategy::BestResult:          return "Best";
    }
    return "Aggregated";
}

double weight_of(const std::map<std::string, double>& node_weights, const std::string& node_id) {
    auto it = node_weights.find(node_id);
    return it == node_weights.end() ? 1.0 : it->second;
}

std::vector<double> strategy_weights(AggregationStrategy strategy,
                                     const std::vector<const NodeReasoningResult*>& usable,
                                     const std::vector<double>& node_weight) {
    std::vector<double> w(usable.size());
    for (size_t i = 0; i < usable.size(); ++i) {
        double base = 1.0;
        if (strategy == AggregationStrategy::ConfidenceWeighted ||
            strategy == AggregationStrategy::ConsensusBased ||
            strategy == AggregationStrategy::MajorityVote)
            base = usable[i]->result.confidence;
        else if (strategy == AggregationStrategy::PerformanceWeighted)
            base = usable[i]->reliability;
        w[i] = base * node_weight[i];
    }
    return w;
}

} // anonymous namespace

ReasoningResult ResultAggregator::union_of(const std::vector<const NodeReasoningResult*>& usable,
                                           const std::vector<double>& weights,
                                           const std::string& method) const {
    struct Merge {
        size_t position;
        std::vector<double> strengths, confidences, weights;
    };

    ReasoningResult out;
    std::unordered_map<std::string, Merge> merged;
    std::vector<double> confidences;
    confidences.reserve(usable.size());

    for (size_t i = 0; i < usable.size(); ++i) {
        confidences.push_back(usable[i]->result.confidence);
        for (const auto& atom : usable[i]->result.conclusion) {
            const auto key = structural_key(atom);
            auto it = merged.find(key);
            if (it == merged.end()) {
                it = merged.emplace(key, Merge{out.conclusion.size(), {}, {}, {}}).first;
                out.conclusion.push_back(atom);
            }
            if (atom.truth_value) {
                it->second.strengths.push_back(atom.truth_value->strength());
                it->second.confidences.push_back(atom.truth_value->confidence());
                it->second.weights.push_back(weights[i]);
            }
        }
    }

    for (const auto& [key, m] : merged) {
        if (m.strengths.empty()) continue;
        out.conclusion[m.position].truth_value = TruthValue(weighted_mean(m.strengths, m.weights),
                                                            weighted_mean(m.confidences, m.weights));
    }

    out.confidence = clamp_unit(weighted_mean(confidences, weights));
    out.explanation = method + " result from " + std::to_string(usable.size()) + " nodes";
    out.metadata = {{"participatingNodes", usable.size()}};
    return out;
}

double ResultAggregator::consensus_level(const std::vector<const NodeReasoningResult*>& usable,
                                         const ReasoningResult& aggregate,
                                         const AggregationSettings& settings,
                                         std::vector<std::string>* agreeing) const {
    if (usable.empty()) return 0.0;

    size_t agree = 0;
    for (const auto* r : usable) {
        if (!agrees(r->result, aggregate, settings.thresholds)) continue;
        ++agree;
        if (agreeing) agreeing->push_back(r->node_id);
    }
    return static_cast<double>(agree) / static_cast<double>(usable.size());
}

double ResultAggregator::weighted_support(const std::vector<const NodeReasoningResult*>& usable,
                                          const ReasoningResult& aggregate,
                                          const AggregationSettings& settings) const {
    if (usable.empty()) return 0.0;

    double agree_weight = 0.0, total_weight = 0.0;
    for (const auto* r : usable) {
        double w = 1.0;
        if (settings.consensus == ConsensusAlgorithm::WeightedConsensus) w = r->reliability;
        else if (settings.consensus == ConsensusAlgorithm::ConfidenceThreshold) w = r->result.confidence;

        total_weight += w;
        if (agrees(r->result, aggregate, settings.thresholds)) agree_weight += w;
    }

    // Every weight vanished: fall back to a plain head count
    if (total_weight <= 0.0) return consensus_level(usable, aggregate, settings);
    return agree_weight / total_weight;
}

Aggregation ResultAggregator::aggregate(const std::string& task_id,
                                        const std::vector<NodeReasoningResult>& results,
                                        const AggregationSettings& settings,
                                        const std::map<std::string, double>& node_weights) const {
    Aggregation agg;
    std::vector<const NodeReasoningResult*> usable;
    std::vector<double> node_weight;
    std::map<std::string, std::string> failures;

    for (const auto& r : results) {
        const double w = weight_of(node_weights, r.node_id);
        const bool use = r.ok() && w > 0.0;
        agg.participation[r.node_id] = use ? 1.0 : 0.0;
        if (use) {
            usable.push_back(&r);
            node_weight.push_back(w);
        } else {
            failures[r.node_id] = r.error ? *r.error : "excluded";
        }
    }

    if (usable.empty()) {
        throw ReasoningError(ErrorKind::AggregationFailure, task_id,
                             "No usable node results (" + std::to_string(results.size()) + " received)",
                             std::move(failures));
    }

    const auto weights = strategy_weights(settings.strategy, usable, node_weight);
    const std::string method = method_label(settings.strategy);

    switch (settings.strategy) {
        case AggregationStrategy::MajorityVote: {
            std::vector<const ReasoningResult*> plain;
            for (const auto* r : usable) plain.push_back(&r->result);
            const auto group = majority_group(plain, node_weight);

            std::vector<const NodeReasoningResult*> members;
            std::vector<double> member_weights;
            for (size_t idx : group) {
                members.push_back(usable[idx]);
                member_weights.push_back(weights[idx]);
                agg.agreeing_nodes.push_back(usable[idx]->node_id);
            }
            agg.result = union_of(members, member_weights, method);
            agg.result.metadata["groupSize"] = group.size();
            agg.consensus_level = static_cast<double>(group.size()) / static_cast<double>(usable.size());
            break;
        }

        case AggregationStrategy::WeightedAverage:
        case AggregationStrategy::ConfidenceWeighted:
        case AggregationStrategy::PerformanceWeighted:
            agg.result = union_of(usable, weights, method);
            agg.consensus_level = consensus_level(usable, agg.result, settings, &agg.agreeing_nodes);
            break;

        case AggregationStrategy::ConsensusBased: {
            std::vector<const ReasoningResult*> plain;
            for (const auto* r : usable) plain.push_back(&r->result);
            const auto group = majority_group(plain, node_weight);

            std::vector<const NodeReasoningResult*> members;
            std::vector<double> member_weights;
            for (size_t idx : group) {
                members.push_back(usable[idx]);
                member_weights.push_back(weights[idx]);
            }
            agg.result = union_of(members, member_weights, method);
            agg.consensus_level = consensus_level(usable, agg.result, settings, &agg.agreeing_nodes);
            agg.weighted_consensus = weighted_support(usable, agg.result, settings);

            double required = settings.min_consensus_level;
            if (settings.consensus == ConsensusAlgorithm::ByzantineFaultTolerant)
                required = std::max(required, 2.0 / 3.0);

            if (agg.weighted_consensus < required) {
                throw ReasoningError(ErrorKind::ConsensusNotReached, task_id,
                                     "Consensus " + std::to_string(agg.weighted_consensus) +
                                     " below required " + std::to_string(required),
                                     std::move(failures));
            }
            break;
        }

        case AggregationStrategy::BestResult: {
            size_t best = 0;
            for (size_t i = 1; i < usable.size(); ++i)
                if (usable[i]->result.confidence > usable[best]->result.confidence) best = i;
            agg.result = usable[best]->result;
            agg.consensus_level = consensus_level(usable, agg.result, settings, &agg.agreeing_nodes);
            break;
        }
    }

    if (settings.strategy != AggregationStrategy::ConsensusBased)
        agg.weighted_consensus = weighted_support(usable, agg.result, settings);
    if (settings.strategy != AggregationStrategy::BestResult)
        agg.result.metadata["aggregationMethod"] = to_string(settings.strategy);

    // Quality metrics
    const double precision = agg.consensus_level;
    const double recall = static_cast<double>(usable.size()) / static_cast<double>(results.size());
    double reliability = 0.0;
    for (const auto* r : usable) reliability += r->reliability;

    agg.quality.accuracy = agg.consensus_level;
    agg.quality.precision = precision;
    agg.quality.recall = recall;
    agg.quality.f1_score = (precision + recall) > 0.0 ? 2.0 * precision * recall / (precision + recall) : 0.0;
    agg.quality.consistency = agg.consensus_level;
    agg.quality.reliability = reliability / static_cast<double>(usable.size());
    agg.distribution_efficiency = recall;

    Logger::debug("Aggregated task " + task_id + " (" + to_string(settings.strategy) + "): " +
                  std::to_string(usable.size()) + " results, consensus " + std::to_string(agg.consensus_level));
    return agg;
}

} // namespace Synod
