#include <consensus/similarity.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <unordered_map>

namespace Synod {

std::vector<std::string> conclusion_keys(const ReasoningResult& result) {
    std::vector<std::string> keys;
    keys.reserve(result.conclusion.size());
    for (const auto& atom : result.conclusion) keys.push_back(structural_key(atom));
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    return keys;
}

ContentHash::Hash conclusion_fingerprint(const ReasoningResult& result) {
    return ContentHash::hash_set(conclusion_keys(result));
}

double jaccard(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    if (a.empty() && b.empty()) return 1.0;

    std::vector<std::string> common;
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(common));
    const size_t uni = a.size() + b.size() - common.size();
    return static_cast<double>(common.size()) / static_cast<double>(uni);
}

bool agrees(const ReasoningResult& result, const ReasoningResult& reference, const SimilarityThresholds& thresholds) {
    if (std::abs(result.confidence - reference.confidence) > thresholds.confidence_tolerance) return false;
    return jaccard(conclusion_keys(result), conclusion_keys(reference)) >= thresholds.similarity;
}

std::vector<size_t> majority_group(const std::vector<const ReasoningResult*>& results, const std::vector<double>& weights) {
    struct Group {
        std::vector<size_t> members;
        double weight = 0.0;
    };

    std::unordered_map<ContentHash::Hash, Group, ContentHashHasher> groups;
    for (size_t i = 0; i < results.size(); ++i) {
        auto& g = groups[conclusion_fingerprint(*results[i])];
        g.members.push_back(i);
        g.weight += i < weights.size() ? std::max(0.0, weights[i]) : 1.0;
    }

    const Group* best = nullptr;
    for (const auto& [hash, g] : groups) {
        if (!best ||
            g.weight > best->weight ||
            (g.weight == best->weight && g.members.size() > best->members.size()) ||
            (g.weight == best->weight && g.members.size() == best->members.size() &&
             g.members.front() < best->members.front())) {
            best = &g;
        }
    }
    return best ? best->members : std::vector<size_t>{};
}

} // namespace Synod
