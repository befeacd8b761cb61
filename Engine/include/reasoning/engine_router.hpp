/**
 * @file engine_router.hpp
 * @brief Owns one instance of every variant and routes by query type
 */

#pragma once

#include <reasoning/reasoning_engine.hpp>
#include <reasoning/pattern_matching_engine.hpp>
#include <reasoning/domain_analysis_engine.hpp>
#include <reasoning/hybrid_engine.hpp>
#include <memory>
#include <string>
#include <vector>

namespace Synod {

class SYNOD_API EngineRouter {
public:
    explicit EngineRouter(const AtomSpace* store = nullptr);

    // Hybrid holds pointers into this object
    EngineRouter(const EngineRouter&) = delete;
    EngineRouter& operator=(const EngineRouter&) = delete;

    /**
     * @brief Route to the variant named by query.type; unknown types go hybrid.
     */
    ReasoningResult reason(const ReasoningQuery& query) const;

    const ReasoningEngine& engine_for(const std::string& query_type) const;

    /**
     * @brief Variant names this router can serve (hybrid excluded).
     */
    std::vector<std::string> variant_names() const;

private:
    DeductiveEngine deductive_;
    InductiveEngine inductive_;
    AbductiveEngine abductive_;
    PatternMatchingEngine pattern_;
    DomainAnalysisEngine domain_;
    HybridEngine hybrid_;
};

} // namespace Synod
