#pragma once

#include <memory>
#include <span>
#include <vector>
#include <hybridstore/core/types.h>
#include <hybridstore/search/search_types.h>
#include <hybridstore/storage/storage_backend.h>
#include <hybridstore/vector/distance.h>

namespace hybridstore::search {

/**
 * @brief Ranks documents by vector similarity to a query vector
 *
 * similarity = 1 - distance under the store metric, so higher is better for every metric.
 * Results are ordered by similarity descending, ties by insertion order.
 */
class SimilaritySearchEngine {
public:
    SimilaritySearchEngine(std::shared_ptr<storage::IStorageBackend> backend, size_t dimensions,
                           vector::DistanceMetric metric);

    /**
     * @brief Top results for @p query
     * @return ValidationError for limit < 1 or a non-finite threshold, DimensionMismatch for a
     *         query of the wrong length, FilterError for a malformed filter
     */
    Result<std::vector<SearchResult>> search(std::span<const float> query,
                                             const SearchOptions& options) const;

    size_t dimensions() const { return dimensions_; }
    vector::DistanceMetric metric() const { return metric_; }

private:
    std::shared_ptr<storage::IStorageBackend> backend_;
    size_t dimensions_;
    vector::DistanceMetric metric_;
};

} // namespace hybridstore::search
