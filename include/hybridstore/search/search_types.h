#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <hybridstore/core/types.h>
#include <hybridstore/metadata/metadata_filter.h>
#include <hybridstore/metadata/metadata_value.h>

namespace hybridstore::search {

inline constexpr size_t kDefaultLimit = 10;
inline constexpr double kDefaultTextWeight = 0.5;
inline constexpr double kDefaultVectorWeight = 0.5;

/**
 * @brief Fields copied into each SearchResult
 */
struct ResultFields {
    bool includeContent = true;
    bool includeMetadata = true;
    bool includeEmbedding = false;
};

/**
 * @brief Options for vector similarity search
 */
struct SearchOptions {
    size_t limit = kDefaultLimit;        ///< Must be >= 1
    std::optional<double> threshold;     ///< Inclusive minimum similarity, applied before limit
    metadata::MetadataFilter filter;     ///< Applied before ranking
    ResultFields fields;
};

/**
 * @brief Options for full-text search
 */
struct LexicalOptions {
    size_t limit = kDefaultLimit;
    metadata::MetadataFilter filter;
    ResultFields fields;
};

/**
 * @brief Options for hybrid search
 *
 * Weights scale each signal independently and need not sum to 1.
 */
struct HybridSearchOptions {
    size_t limit = kDefaultLimit;
    double textWeight = kDefaultTextWeight;
    double vectorWeight = kDefaultVectorWeight;
    metadata::MetadataFilter filter;
    ResultFields fields;
    /// When set, a failing engine contributes nothing instead of failing the query
    bool degradeOnPartialFailure = false;
};

/**
 * @brief One ranked hit
 *
 * content/metadata/embedding are present only when requested. Scores are present when the
 * producing engine computed them; fusedScore orders hybrid results.
 */
struct SearchResult {
    std::string id;
    std::optional<std::string> content;
    std::optional<metadata::Metadata> metadata;
    std::optional<Embedding> embedding;

    std::optional<double> similarity;
    std::optional<double> textRank;
    std::optional<double> vectorRank;
    std::optional<double> fusedScore;

    int64_t seq = 0; ///< Insertion order, used for tie-breaking
};

} // namespace hybridstore::search
