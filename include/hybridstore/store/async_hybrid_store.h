#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>
#include <hybridstore/store/hybrid_store.h>

namespace hybridstore::store {

/**
 * @brief Non-blocking wrapper over HybridStore
 *
 * Every operation runs on a worker pool and returns a future. Arguments are copied into the
 * task, so callers may release them as soon as the call returns.
 */
class AsyncHybridStore {
public:
    AsyncHybridStore(std::shared_ptr<HybridStore> store, size_t threads);
    ~AsyncHybridStore();

    AsyncHybridStore(const AsyncHybridStore&) = delete;
    AsyncHybridStore& operator=(const AsyncHybridStore&) = delete;

    /**
     * @brief Open a HybridStore and wrap it with config.asyncThreads workers
     */
    static Result<std::unique_ptr<AsyncHybridStore>>
    open(const config::StoreConfig& config,
         std::shared_ptr<vector::IEmbeddingProvider> provider = {},
         std::shared_ptr<vector::IEmbeddingCache> cache = {});

    [[nodiscard]] std::future<Result<std::vector<std::string>>>
    insertAsync(std::vector<DocumentInput> documents);
    [[nodiscard]] std::future<Result<Document>> getAsync(std::string id);
    [[nodiscard]] std::future<Result<void>> updateAsync(std::string id, DocumentPatch patch);
    [[nodiscard]] std::future<Result<void>> removeAsync(std::string id);
    [[nodiscard]] std::future<Result<size_t>> removeByFilterAsync(metadata::MetadataFilter filter);
    [[nodiscard]] std::future<Result<void>> clearAsync();

    [[nodiscard]] std::future<Result<std::vector<search::SearchResult>>>
    searchAsync(std::string queryText, search::SearchOptions options = {});
    [[nodiscard]] std::future<Result<std::vector<search::SearchResult>>>
    searchByEmbeddingAsync(Embedding queryVector, search::SearchOptions options = {});
    [[nodiscard]] std::future<Result<std::vector<search::SearchResult>>>
    hybridSearchAsync(std::string queryText, search::HybridSearchOptions options = {});

    [[nodiscard]] std::future<Result<StoreStats>> statsAsync();

    /**
     * @brief Block until every submitted operation has finished
     */
    void waitAll();

    size_t pendingOperations() const;

    std::shared_ptr<HybridStore> store() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace hybridstore::store
