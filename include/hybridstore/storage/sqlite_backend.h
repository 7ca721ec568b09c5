#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <hybridstore/storage/storage_backend.h>

namespace hybridstore::storage {

/**
 * @brief Configuration for the SQLite backend
 */
struct SqliteBackendConfig {
    std::string path = ":memory:";               ///< Database file, or ":memory:"
    std::string tableName = "documents";         ///< Must be a plain identifier
    std::chrono::milliseconds busyTimeout{5000}; ///< Lock wait before Timeout
    bool enableWal = true;                       ///< Ignored for in-memory databases
};

/**
 * @brief Split text into full-text query terms
 *
 * Terms are maximal runs of ASCII letters/digits or non-ASCII bytes, lower-cased.
 */
std::vector<std::string> tokenizeQuery(const std::string& text);

/**
 * @brief Build an FTS5 MATCH expression requiring every term: "a" AND "b"
 * @return Empty string when @p text has no terms
 */
std::string buildMatchExpression(const std::string& text);

/**
 * @brief SQLite storage backend
 *
 * One table per store holds the rows; an external-content FTS5 table kept in sync by triggers
 * ranks text with bm25. Vector distance is computed in SQL by a registered scalar function, so
 * ranking is an exact scan. A companion info table records dimensions and metric.
 *
 * All calls are serialized on the single connection.
 */
class SqliteStorageBackend : public IStorageBackend {
public:
    explicit SqliteStorageBackend(SqliteBackendConfig config = {});
    ~SqliteStorageBackend() override;

    SqliteStorageBackend(const SqliteStorageBackend&) = delete;
    SqliteStorageBackend& operator=(const SqliteStorageBackend&) = delete;

    /**
     * @brief Open the connection and register SQL functions
     * @return ValidationError for an invalid table name, NotSupported without FTS5
     */
    Result<void> open();

    void close();

    [[nodiscard]] bool isOpen() const;

    Result<void> createSchema(size_t dimensions, vector::DistanceMetric metric) override;
    Result<void> insertRows(const std::vector<StoredDocument>& rows) override;
    Result<std::optional<StoredDocument>> selectById(const std::string& id) override;
    Result<std::vector<StoredDocument>> selectByIds(const std::vector<std::string>& ids) override;
    Result<bool> updateRow(const std::string& id, const RowPatch& patch) override;
    Result<bool> deleteRow(const std::string& id) override;
    Result<size_t> deleteWhere(const metadata::MetadataFilter& filter) override;
    Result<std::vector<VectorHit>>
    vectorTopK(std::span<const float> query, size_t k, const metadata::MetadataFilter& filter,
               std::optional<double> minSimilarity = std::nullopt) override;
    Result<std::vector<TextHit>> textTopK(const std::string& text, size_t k,
                                          const metadata::MetadataFilter& filter) override;
    Result<size_t> count() override;
    Result<void> truncate() override;
    std::string backendName() const override { return "sqlite"; }

    const SqliteBackendConfig& config() const;

    /**
     * @brief Dimensions recorded by createSchema(), 0 before it
     */
    size_t dimensions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace hybridstore::storage
