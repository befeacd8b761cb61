/**
 * @file weighting.hpp
 * @brief The confidence averaging rule shared by local and distributed merging
 *
 * Both the hybrid engine (merging local variants) and the result aggregator
 * (merging node results) reduce confidences through these functions so the
 * two paths never drift apart.
 */

#pragma once

#include <Eigen/Core>
#include <vector>
#include <algorithm>

namespace Synod {

/**
 * @brief Weighted arithmetic mean.
 *
 * Negative weights are treated as zero. Falls back to the uniform mean when
 * every weight is zero; empty input yields 0.
 */
inline double weighted_mean(const std::vector<double>& values, const std::vector<double>& weights) {
    if (values.empty()) return 0.0;

    Eigen::Map<const Eigen::VectorXd> v(values.data(), static_cast<Eigen::Index>(values.size()));
    Eigen::VectorXd w = Eigen::VectorXd::Zero(v.size());
    for (Eigen::Index i = 0; i < v.size() && static_cast<size_t>(i) < weights.size(); ++i)
        w[i] = std::max(0.0, weights[static_cast<size_t>(i)]);

    const double total = w.sum();
    if (total <= 0.0) return v.mean();
    return v.dot(w) / total;
}

/**
 * @brief Confidence-weighted mean: each confidence weighs itself.
 */
inline double confidence_weighted_mean(const std::vector<double>& confidences) {
    return weighted_mean(confidences, confidences);
}

inline double clamp_unit(double x) {
    return std::clamp(x, 0.0, 1.0);
}

} // namespace Synod
