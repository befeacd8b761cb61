#pragma once

#include <reasoning/reasoning_engine.hpp>

namespace Synod {

/**
 * @brief Summarises the atom population of a query into ConceptNode findings
 *
 * One finding per atom type ("domain:<type>"), weighted by how much of the
 * query it covers, plus a link-density finding when links are present.
 */
class SYNOD_API DomainAnalysisEngine : public ReasoningEngine {
public:
    std::string name() const override { return "domain-analysis"; }

protected:
    ReasoningResult infer(const ReasoningQuery& query) const override;
};

} // namespace Synod
