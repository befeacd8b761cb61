#include <reasoning/hybrid_engine.hpp>
#include <consensus/weighting.hpp>

namespace Synod {

ReasoningResult HybridEngine::infer(const ReasoningQuery& query) const {
    ReasoningResult merged;
    std::vector<double> confidences;
    nlohmann::json contributions = nlohmann::json::object();

    for (const ReasoningEngine* engine : variants_) {
        ReasoningResult partial = engine->reason(query);
        const bool failed = partial.metadata.value("error", false);

        contributions[engine->name()] = {
            {"confidence", partial.confidence},
            {"conclusions", partial.conclusion.size()},
            {"failed", failed}
        };
        if (failed) continue;

        confidences.push_back(partial.confidence);
        for (auto& atom : partial.conclusion) merged.conclusion.push_back(std::move(atom));
    }

    merged.confidence = confidence_weighted_mean(confidences);
    merged.explanation = "Hybrid reasoning combined " + std::to_string(confidences.size()) + " of " +
                         std::to_string(variants_.size()) + " engines";
    merged.metadata = {{"reasoningType", "hybrid"}, {"contributions", contributions}};
    return merged;
}

} // namespace Synod
