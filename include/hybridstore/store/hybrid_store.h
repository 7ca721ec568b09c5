#pragma once

#include <memory>
#include <span>
#include <string>
#include <vector>
#include <hybridstore/config/store_config.h>
#include <hybridstore/core/types.h>
#include <hybridstore/metadata/metadata_filter.h>
#include <hybridstore/search/hybrid_fusion.h>
#include <hybridstore/search/lexical_search.h>
#include <hybridstore/search/search_types.h>
#include <hybridstore/search/similarity_search.h>
#include <hybridstore/storage/storage_backend.h>
#include <hybridstore/store/document.h>
#include <hybridstore/store/document_store.h>
#include <hybridstore/vector/embedding_cache.h>
#include <hybridstore/vector/embedding_client.h>
#include <hybridstore/vector/embedding_provider.h>

namespace hybridstore::store {

/**
 * @brief Document store with vector, full-text and hybrid search
 *
 * Holds no document state of its own: every call goes to the storage backend, so several
 * HybridStore instances over the same database see each other's writes.
 *
 * Usage:
 * @code
 *   config::StoreConfig cfg;
 *   cfg.dimensions = 384;
 *   auto store = HybridStore::open(cfg, std::make_shared<vector::MockEmbeddingProvider>(384));
 *   auto ids = store.value()->insert({{.content = "hello world"}});
 *   auto hits = store.value()->hybridSearch("hello", {});
 * @endcode
 */
class HybridStore {
public:
    /**
     * @brief Open a store on the SQLite backend described by @p config
     *
     * Without @p provider, config.embeddingProvider is looked up in the provider registry.
     * Without @p cache, a TtlEmbeddingCache is created when config.enableEmbeddingCache is set.
     * Log levels are left alone; call config::configureLogging(config.logLevel) to apply them.
     * @return ValidationError for invalid configuration, DimensionMismatch when the provider's
     *         dimensions disagree with config.dimensions or with an existing table
     */
    static Result<std::unique_ptr<HybridStore>>
    open(const config::StoreConfig& config,
         std::shared_ptr<vector::IEmbeddingProvider> provider = {},
         std::shared_ptr<vector::IEmbeddingCache> cache = {});

    /**
     * @brief Open a store on a caller-supplied backend
     */
    static Result<std::unique_ptr<HybridStore>>
    open(const config::StoreConfig& config, std::shared_ptr<storage::IStorageBackend> backend,
         std::shared_ptr<vector::IEmbeddingProvider> provider = {},
         std::shared_ptr<vector::IEmbeddingCache> cache = {});

    ~HybridStore();

    HybridStore(const HybridStore&) = delete;
    HybridStore& operator=(const HybridStore&) = delete;

    // Document lifecycle
    Result<std::vector<std::string>> insert(const std::vector<DocumentInput>& documents);
    Result<std::string> insertOne(const DocumentInput& document);
    Result<Document> get(const std::string& id);
    Result<void> update(const std::string& id, const DocumentPatch& patch);
    Result<void> remove(const std::string& id);
    Result<size_t> removeByFilter(const metadata::MetadataFilter& filter);
    Result<void> clear();

    // Search
    /**
     * @brief Embed @p queryText and rank by vector similarity
     */
    Result<std::vector<search::SearchResult>> search(const std::string& queryText,
                                                     const search::SearchOptions& options = {});

    Result<std::vector<search::SearchResult>>
    searchByEmbedding(std::span<const float> queryVector,
                      const search::SearchOptions& options = {});

    Result<std::vector<search::SearchResult>>
    lexicalSearch(const std::string& queryText, const search::LexicalOptions& options = {});

    Result<std::vector<search::SearchResult>>
    hybridSearch(const std::string& queryText, const search::HybridSearchOptions& options = {});

    Result<StoreStats> stats();

    const config::StoreConfig& config() const { return config_; }
    bool hasEmbeddingProvider() const;

private:
    HybridStore(config::StoreConfig config, std::shared_ptr<storage::IStorageBackend> backend,
                std::shared_ptr<vector::EmbeddingClient> embedder);

    Result<std::vector<search::SearchResult>>
    hydrate(Result<std::vector<search::SearchResult>> results,
            const search::ResultFields& fields);

    config::StoreConfig config_;
    std::shared_ptr<storage::IStorageBackend> backend_;
    std::shared_ptr<vector::EmbeddingClient> embedder_;
    std::unique_ptr<DocumentStore> documents_;
    std::shared_ptr<search::SimilaritySearchEngine> similarity_;
    std::shared_ptr<search::LexicalSearchEngine> lexical_;
    std::unique_ptr<search::HybridFusionRanker> ranker_;
};

} // namespace hybridstore::store
