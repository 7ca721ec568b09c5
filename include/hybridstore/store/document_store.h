#pragma once

#include <memory>
#include <string>
#include <vector>
#include <hybridstore/core/types.h>
#include <hybridstore/metadata/metadata_filter.h>
#include <hybridstore/storage/storage_backend.h>
#include <hybridstore/store/document.h>
#include <hybridstore/vector/distance.h>
#include <hybridstore/vector/embedding_client.h>

namespace hybridstore::store {

struct DocumentStoreConfig {
    size_t dimensions = 0;
    vector::DistanceMetric metric = vector::DistanceMetric::Cosine;
    std::string tableName = "documents";
};

/**
 * @brief Document lifecycle over a storage backend
 *
 * Every operation validates its input before calling the embedding provider, and calls the
 * provider before writing anything. A batch insert persists either every document or none.
 */
class DocumentStore {
public:
    DocumentStore(std::shared_ptr<storage::IStorageBackend> backend,
                  std::shared_ptr<vector::EmbeddingClient> embedder, DocumentStoreConfig config);

    /**
     * @brief Insert a batch of documents
     * @return Ids in input order. ValidationError for empty content or bad ids,
     *         DimensionMismatch for an explicit embedding of the wrong length, AlreadyExists when
     *         a supplied id is already stored
     */
    Result<std::vector<std::string>> insert(const std::vector<DocumentInput>& documents);

    Result<std::string> insertOne(const DocumentInput& document);

    /**
     * @return NotFound when @p id is not stored
     */
    Result<Document> get(const std::string& id);

    /**
     * @brief Apply @p patch to a stored document
     *
     * Changed content without an explicit embedding is re-embedded. Metadata-only patches never
     * call the provider.
     */
    Result<void> update(const std::string& id, const DocumentPatch& patch);

    Result<void> remove(const std::string& id);

    /**
     * @return Number of documents removed; ValidationError for an empty filter
     */
    Result<size_t> removeByFilter(const metadata::MetadataFilter& filter);

    Result<void> clear();

    Result<StoreStats> stats();

    const DocumentStoreConfig& config() const { return config_; }

private:
    Result<void> validateEmbedding(const Embedding& embedding, const std::string& context) const;

    std::shared_ptr<storage::IStorageBackend> backend_;
    std::shared_ptr<vector::EmbeddingClient> embedder_;
    DocumentStoreConfig config_;
};

} // namespace hybridstore::store
