/**
 * @file similarity.hpp
 * @brief When two node answers count as "the same" conclusion
 *
 * Conclusions are compared by the set of structural keys of their atoms
 * (type, name, recursive outgoing structure). Ids, truth values and
 * metadata do not take part, so two nodes that derive the same facts with
 * different local ids or slightly different strengths agree.
 */

#pragma once

#include <hashing/content_hash.hpp>
#include <reasoning/types.hpp>
#include <export.hpp>
#include <string>
#include <vector>

namespace Synod {

/**
 * @brief Sorted, deduplicated structural keys of a conclusion.
 */
SYNOD_API std::vector<std::string> conclusion_keys(const ReasoningResult& result);

/**
 * @brief BLAKE3 fingerprint of the conclusion's key set.
 */
SYNOD_API ContentHash::Hash conclusion_fingerprint(const ReasoningResult& result);

/**
 * @brief |A ∩ B| / |A ∪ B| over sorted key sets; two empty sets score 1.
 */
SYNOD_API double jaccard(const std::vector<std::string>& a, const std::vector<std::string>& b);

struct SimilarityThresholds {
    double similarity = 0.8;
    double confidence_tolerance = 0.25;
};

/**
 * @brief `result` agrees with `reference` when the conclusions overlap by at
 *        least `similarity` and the confidences differ by at most the tolerance.
 */
SYNOD_API bool agrees(const ReasoningResult& result, const ReasoningResult& reference,
                      const SimilarityThresholds& thresholds);

/**
 * @brief Indices of the largest group of identical conclusions.
 *
 * Groups are ranked by summed weight, then size, then earliest member, so
 * the outcome does not depend on the order of equal-ranked groups.
 * Missing weights count as 1.
 */
SYNOD_API std::vector<size_t> majority_group(const std::vector<const ReasoningResult*>& results,
                                             const std::vector<double>& weights = {});

} // namespace Synod
