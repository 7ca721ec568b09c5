#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <hybridstore/core/types.h>
#include <hybridstore/metadata/metadata_filter.h>
#include <hybridstore/metadata/metadata_value.h>
#include <hybridstore/vector/distance.h>

namespace hybridstore::storage {

/**
 * @brief A persisted document row
 */
struct StoredDocument {
    std::string id;
    std::string content;
    metadata::Metadata metadata;
    Embedding embedding;
    int64_t seq = 0;       ///< Insertion order, assigned by the backend
    std::string createdAt; ///< ISO 8601 UTC, assigned by the backend
    std::string updatedAt;
};

/**
 * @brief Partial update of a row; unset fields are left untouched
 */
struct RowPatch {
    std::optional<std::string> content;
    std::optional<metadata::Metadata> metadata;
    std::optional<Embedding> embedding;

    bool empty() const { return !content && !metadata && !embedding; }
};

/**
 * @brief Vector candidate: native metric distance, lower is closer
 */
struct VectorHit {
    std::string id;
    double distance = 0.0;
    int64_t seq = 0;
};

/**
 * @brief Full-text candidate: non-negative rank, higher is better
 */
struct TextHit {
    std::string id;
    double textRank = 0.0;
    int64_t seq = 0;
};

/**
 * @brief Abstract interface for document storage backends
 *
 * A backend persists rows and ranks them both by vector distance and by text relevance.
 * Implementations never build SQL or queries from caller values; values are always bound.
 */
class IStorageBackend {
public:
    virtual ~IStorageBackend() = default;

    /**
     * @brief Create or verify storage for @p dimensions-long vectors under @p metric
     * @return DimensionMismatch when existing storage was created with other dimensions
     */
    virtual Result<void> createSchema(size_t dimensions, vector::DistanceMetric metric) = 0;

    /**
     * @brief Insert rows atomically: either all rows are persisted or none
     * @return AlreadyExists when an id is already stored
     */
    virtual Result<void> insertRows(const std::vector<StoredDocument>& rows) = 0;

    Result<void> insertRow(const StoredDocument& row) {
        return insertRows(std::vector<StoredDocument>{row});
    }

    virtual Result<std::optional<StoredDocument>> selectById(const std::string& id) = 0;

    /**
     * @brief Fetch several rows; result follows @p ids order, missing ids are skipped
     */
    virtual Result<std::vector<StoredDocument>>
    selectByIds(const std::vector<std::string>& ids) = 0;

    /**
     * @return false when no row has @p id
     */
    virtual Result<bool> updateRow(const std::string& id, const RowPatch& patch) = 0;

    /**
     * @return false when no row has @p id
     */
    virtual Result<bool> deleteRow(const std::string& id) = 0;

    /**
     * @brief Delete every row whose metadata matches @p filter
     * @return Number of rows deleted; ValidationError for an empty filter
     */
    virtual Result<size_t> deleteWhere(const metadata::MetadataFilter& filter) = 0;

    /**
     * @brief Closest rows to @p query under the schema metric
     *
     * Ordered by distance ascending, then insertion order.
     * @param minSimilarity Rows with 1 - distance below this are excluded before the limit
     */
    virtual Result<std::vector<VectorHit>>
    vectorTopK(std::span<const float> query, size_t k, const metadata::MetadataFilter& filter,
               std::optional<double> minSimilarity = std::nullopt) = 0;

    /**
     * @brief Most relevant rows for @p text, all query terms required
     *
     * Ordered by rank descending, then insertion order.
     */
    virtual Result<std::vector<TextHit>> textTopK(const std::string& text, size_t k,
                                                  const metadata::MetadataFilter& filter) = 0;

    virtual Result<size_t> count() = 0;

    /**
     * @brief Remove every row
     */
    virtual Result<void> truncate() = 0;

    virtual std::string backendName() const = 0;
};

} // namespace hybridstore::storage
