#pragma once

#include <reasoning/reasoning_engine.hpp>
#include <vector>

namespace Synod {

/**
 * @brief Fans a query out to every local variant and merges the answers.
 *
 * Conclusions are concatenated; confidence uses the same confidence-weighted
 * mean as the distributed aggregator. Variants that failed (error metadata)
 * do not contribute to the mean.
 */
class SYNOD_API HybridEngine : public ReasoningEngine {
public:
    explicit HybridEngine(std::vector<const ReasoningEngine*> variants)
        : variants_(std::move(variants)) {}

    std::string name() const override { return "hybrid"; }

protected:
    ReasoningResult infer(const ReasoningQuery& query) const override;

private:
    std::vector<const ReasoningEngine*> variants_;  // Not owned
};

} // namespace Synod
