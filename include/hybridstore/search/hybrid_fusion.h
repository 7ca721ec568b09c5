#pragma once

#include <memory>
#include <string>
#include <vector>
#include <hybridstore/core/types.h>
#include <hybridstore/search/lexical_search.h>
#include <hybridstore/search/search_types.h>
#include <hybridstore/search/similarity_search.h>
#include <hybridstore/vector/embedding_client.h>

namespace hybridstore::search {

struct FusionWeights {
    double text = kDefaultTextWeight;
    double vector = kDefaultVectorWeight;
};

/**
 * @brief Weighted linear fusion of two ranked lists
 *
 * Every id appearing in either list appears in the output (before truncation). A component
 * missing for an id counts as 0. fusedScore = text * textRank + vector * similarity; results
 * are ordered by fusedScore descending, ties by insertion order, and truncated to @p limit.
 *
 * @param textHits Results carrying textRank
 * @param vectorHits Results carrying similarity
 */
std::vector<SearchResult> fuseRankings(const std::vector<SearchResult>& textHits,
                                       const std::vector<SearchResult>& vectorHits,
                                       FusionWeights weights, size_t limit);

/**
 * @brief Check weights are finite and non-negative
 */
Result<void> validateWeights(FusionWeights weights);

/**
 * @brief Combines lexical and vector rankings for one text query
 */
class HybridFusionRanker {
public:
    HybridFusionRanker(std::shared_ptr<vector::EmbeddingClient> embedder,
                       std::shared_ptr<SimilaritySearchEngine> similarity,
                       std::shared_ptr<LexicalSearchEngine> lexical);

    /**
     * @brief Embed @p queryText, run both engines with @p options.limit candidates and fuse
     *
     * Fails closed: an error from either engine is returned unless
     * options.degradeOnPartialFailure is set. Embedding failures are always returned.
     */
    Result<std::vector<SearchResult>> search(const std::string& queryText,
                                             const HybridSearchOptions& options) const;

private:
    std::shared_ptr<vector::EmbeddingClient> embedder_;
    std::shared_ptr<SimilaritySearchEngine> similarity_;
    std::shared_ptr<LexicalSearchEngine> lexical_;
};

} // namespace hybridstore::search
