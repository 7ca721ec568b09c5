#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace hybridstore::vector {

/**
 * @brief Distance metrics for vector similarity
 */
enum class DistanceMetric {
    Cosine,      ///< 1 - cos(a, b), range [0, 2]
    L2,          ///< Euclidean distance
    InnerProduct ///< Negated dot product
};

std::string toString(DistanceMetric metric);

/**
 * @brief Parse "cosine", "l2"/"euclidean", "inner_product"/"ip" (case-insensitive)
 */
std::optional<DistanceMetric> parseDistanceMetric(std::string_view name);

/**
 * @brief Cosine distance 1 - a·b/(|a||b|)
 *
 * Returns 2.0 (maximal distance) when either vector has zero magnitude.
 * @throws std::invalid_argument when the lengths differ
 */
double cosineDistance(std::span<const float> a, std::span<const float> b);

/**
 * @brief Euclidean distance sqrt(sum((a_i - b_i)^2))
 * @throws std::invalid_argument when the lengths differ
 */
double l2Distance(std::span<const float> a, std::span<const float> b);

/**
 * @brief Negated inner product -(a·b)
 * @throws std::invalid_argument when the lengths differ
 */
double innerProductDistance(std::span<const float> a, std::span<const float> b);

double computeDistance(DistanceMetric metric, std::span<const float> a, std::span<const float> b);

/**
 * @brief Map a native distance to a higher-is-better similarity: 1 - distance
 */
inline double distanceToSimilarity(double distance) {
    return 1.0 - distance;
}

inline double computeSimilarity(DistanceMetric metric, std::span<const float> a,
                                std::span<const float> b) {
    return distanceToSimilarity(computeDistance(metric, a, b));
}

} // namespace hybridstore::vector
