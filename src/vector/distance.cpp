#include <hybridstore/vector/distance.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace hybridstore::vector {

namespace {

void requireSameLength(std::span<const float> a, std::span<const float> b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("Vector length mismatch: " + std::to_string(a.size()) +
                                    " vs " + std::to_string(b.size()));
    }
}

double dot(std::span<const float> a, std::span<const float> b) {
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    return sum;
}

} // namespace

std::string toString(DistanceMetric metric) {
    switch (metric) {
        case DistanceMetric::Cosine:
            return "cosine";
        case DistanceMetric::L2:
            return "l2";
        case DistanceMetric::InnerProduct:
            return "inner_product";
    }
    return "cosine";
}

std::optional<DistanceMetric> parseDistanceMetric(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "cosine") {
        return DistanceMetric::Cosine;
    }
    if (lower == "l2" || lower == "euclidean") {
        return DistanceMetric::L2;
    }
    if (lower == "inner_product" || lower == "ip" || lower == "dot") {
        return DistanceMetric::InnerProduct;
    }
    return std::nullopt;
}

double cosineDistance(std::span<const float> a, std::span<const float> b) {
    requireSameLength(a, b);
    double normA = 0.0;
    double normB = 0.0;
    double ab = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double x = a[i];
        double y = b[i];
        ab += x * y;
        normA += x * x;
        normB += y * y;
    }
    if (normA == 0.0 || normB == 0.0) {
        return 2.0;
    }
    double cos = ab / (std::sqrt(normA) * std::sqrt(normB));
    // Rounding can push |cos| slightly past 1
    cos = std::clamp(cos, -1.0, 1.0);
    return 1.0 - cos;
}

double l2Distance(std::span<const float> a, std::span<const float> b) {
    requireSameLength(a, b);
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += d * d;
    }
    return std::sqrt(sum);
}

double innerProductDistance(std::span<const float> a, std::span<const float> b) {
    requireSameLength(a, b);
    return -dot(a, b);
}

double computeDistance(DistanceMetric metric, std::span<const float> a, std::span<const float> b) {
    switch (metric) {
        case DistanceMetric::Cosine:
            return cosineDistance(a, b);
        case DistanceMetric::L2:
            return l2Distance(a, b);
        case DistanceMetric::InnerProduct:
            return innerProductDistance(a, b);
    }
    return cosineDistance(a, b);
}

} // namespace hybridstore::vector
