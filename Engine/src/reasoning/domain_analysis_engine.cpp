#include <reasoning/domain_analysis_engine.hpp>
#include <algorithm>
#include <map>

namespace Synod {

ReasoningResult DomainAnalysisEngine::infer(const ReasoningQuery& query) const {
    ReasoningResult result;
    result.metadata = {{"reasoningType", "domain-analysis"}};

    if (query.atoms.empty()) {
        result.explanation = "Domain analysis found nothing to analyse";
        return result;
    }

    std::map<std::string, size_t> histogram;
    size_t links = 0;
    double truth_sum = 0.0;
    size_t truth_count = 0;

    for (const auto& atom : query.atoms) {
        histogram[atom.type]++;
        if (atom.is_link()) ++links;
        if (atom.truth_value) {
            truth_sum += atom.truth_value->strength();
            ++truth_count;
        }
    }

    const double total = static_cast<double>(query.atoms.size());
    const double avg_truth = truth_count ? truth_sum / static_cast<double>(truth_count) : 0.5;

    for (const auto& [type, count] : histogram) {
        Atom finding;
        finding.type = "ConceptNode";
        finding.name = "domain:" + type;
        finding.truth_value = TruthValue(static_cast<double>(count) / total,
                                         std::min(0.9, static_cast<double>(count) / 10.0 + 0.3));
        finding.metadata = {{"count", count}};
        result.conclusion.push_back(std::move(finding));
    }

    if (links > 0) {
        Atom density;
        density.type = "ConceptNode";
        density.name = "link-density";
        density.truth_value = TruthValue(static_cast<double>(links) / total, 0.6);
        result.conclusion.push_back(std::move(density));
    }

    // Coverage of truth-valued atoms scales how far the summary can be trusted
    const double coverage = static_cast<double>(truth_count) / total;
    result.confidence = std::min(0.9, 0.4 + 0.5 * coverage * avg_truth);
    result.explanation = "Domain analysis of " + std::to_string(query.atoms.size()) + " atoms across " +
                         std::to_string(histogram.size()) + " types";
    result.metadata["types"] = histogram.size();
    result.metadata["links"] = links;
    return result;
}

} // namespace Synod
