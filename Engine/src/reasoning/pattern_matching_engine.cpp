#include <reasoning/pattern_matching_engine.hpp>
#include <knowledge/atom_space.hpp>
#include <algorithm>
#include <map>
#include <unordered_set>

namespace Synod {

ReasoningResult PatternMatchingEngine::infer(const ReasoningQuery& query) const {
    if (!store_) return recurring_structures(query);

    std::vector<Atom> matches;
    std::unordered_set<std::string> seen;

    for (const auto& probe : query.atoms) {
        AtomPattern pattern;
        pattern.type = probe.type;
        if (probe.name) pattern.name = probe.name;
        if (!probe.outgoing.empty()) {
            std::vector<std::string> types;
            for (const auto& child : probe.outgoing) types.push_back(child.type);
            pattern.outgoing_types = std::move(types);
        }

        for (auto& match : store_->query_atoms(pattern)) {
            if (seen.insert(match.id).second) matches.push_back(std::move(match));
        }
    }

    double confidence = 0.0;
    for (const auto& m : matches) confidence += m.truth_value ? m.truth_value->confidence() : 0.5;
    if (!matches.empty()) confidence /= static_cast<double>(matches.size());

    ReasoningResult result;
    result.confidence = confidence;
    result.explanation = "Pattern matching found " + std::to_string(matches.size()) + " matching atoms for " +
                         std::to_string(query.atoms.size()) + " patterns";
    result.metadata = {{"reasoningType", "pattern-matching"}, {"matches", matches.size()}};
    result.conclusion = std::move(matches);
    return result;
}

ReasoningResult PatternMatchingEngine::recurring_structures(const ReasoningQuery& query) const {
    std::map<std::string, std::pair<const Atom*, size_t>> counts;
    for (const auto& atom : query.atoms) {
        auto& slot = counts[structural_key(atom)];
        if (!slot.first) slot.first = &atom;
        slot.second++;
    }

    ReasoningResult result;
    const double total = static_cast<double>(query.atoms.size());
    double confidence = 0.0;

    for (const auto& [key, entry] : counts) {
        if (entry.second < 2) continue;
        Atom pattern = *entry.first;
        pattern.id.clear();
        pattern.truth_value = TruthValue(static_cast<double>(entry.second) / total,
                                         std::min(0.9, static_cast<double>(entry.second) / 10.0));
        pattern.metadata = {{"occurrences", entry.second}};
        confidence += pattern.truth_value->confidence();
        result.conclusion.push_back(std::move(pattern));
    }

    if (!result.conclusion.empty()) confidence /= static_cast<double>(result.conclusion.size());
    result.confidence = confidence;
    result.explanation = "Pattern recognition found " + std::to_string(result.conclusion.size()) + " recurring structures";
    result.metadata = {{"reasoningType", "pattern-matching"}, {"patterns", result.conclusion.size()}};
    return result;
}

} // namespace Synod
