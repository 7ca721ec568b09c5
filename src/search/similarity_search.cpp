#include <hybridstore/search/similarity_search.h>

#include <spdlog/spdlog.h>
#include <chrono>
#include <cmath>

namespace hybridstore::search {

SimilaritySearchEngine::SimilaritySearchEngine(std::shared_ptr<storage::IStorageBackend> backend,
                                               size_t dimensions, vector::DistanceMetric metric)
    : backend_(std::move(backend)), dimensions_(dimensions), metric_(metric) {}

Result<std::vector<SearchResult>>
SimilaritySearchEngine::search(std::span<const float> query, const SearchOptions& options) const {
    if (options.limit < 1) {
        return Error{ErrorCode::ValidationError, "Search limit must be at least 1"};
    }
    if (options.threshold && !std::isfinite(*options.threshold)) {
        return Error{ErrorCode::ValidationError, "Similarity threshold must be finite"};
    }
    if (query.size() != dimensions_) {
        return Error{ErrorCode::DimensionMismatch,
                     "Query vector has " + std::to_string(query.size()) +
                         " dimensions, store expects " + std::to_string(dimensions_)};
    }
    for (float v : query) {
        if (!std::isfinite(v)) {
            return Error{ErrorCode::ValidationError, "Query vector contains a non-finite value"};
        }
    }
    auto valid = options.filter.validate();
    if (!valid) {
        return valid.error();
    }

    auto start = std::chrono::steady_clock::now();
    auto hits = backend_->vectorTopK(query, options.limit, options.filter, options.threshold);
    if (!hits) {
        spdlog::error("Similarity search failed: {}", hits.error().message);
        return Error{hits.error().code, "vectorTopK: " + hits.error().message};
    }

    std::vector<SearchResult> results;
    results.reserve(hits.value().size());
    for (const auto& hit : hits.value()) {
        SearchResult r;
        r.id = hit.id;
        r.seq = hit.seq;
        r.similarity = vector::distanceToSimilarity(hit.distance);
        results.push_back(std::move(r));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::debug("Similarity search ({}) returned {} results in {}us", vector::toString(metric_),
                  results.size(), elapsed.count());
    return results;
}

} // namespace hybridstore::search
