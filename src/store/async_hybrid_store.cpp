#include <hybridstore/store/async_hybrid_store.h>

#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace hybridstore::store {

struct AsyncHybridStore::Impl {
    std::shared_ptr<HybridStore> store;
    boost::asio::thread_pool pool;

    // Operation tracking
    mutable std::mutex opMutex;
    std::condition_variable opCv;
    std::atomic<size_t> pendingOps{0};

    Impl(std::shared_ptr<HybridStore> s, size_t threads)
        : store(std::move(s)), pool(threads == 0 ? 1 : threads) {}

    void releaseSlot() {
        {
            std::lock_guard lock(opMutex);
            --pendingOps;
        }
        opCv.notify_all();
    }

    template <typename F> auto runAsync(F&& func) -> std::future<decltype(func())> {
        using R = decltype(func());
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(func));
        auto future = task->get_future();
        {
            std::lock_guard lock(opMutex);
            ++pendingOps;
        }
        boost::asio::post(pool, [this, task]() {
            // Ensure slot is released even if the task throws
            struct SlotGuard {
                Impl* impl;
                ~SlotGuard() { impl->releaseSlot(); }
            } guard{this};
            (*task)();
        });
        return future;
    }

    void waitAll() {
        std::unique_lock lock(opMutex);
        opCv.wait(lock, [this] { return pendingOps == 0; });
    }
};

AsyncHybridStore::AsyncHybridStore(std::shared_ptr<HybridStore> store, size_t threads)
    : pImpl(std::make_unique<Impl>(std::move(store), threads)) {}

AsyncHybridStore::~AsyncHybridStore() {
    // Wait for all pending operations
    pImpl->waitAll();
    pImpl->pool.join();
}

Result<std::unique_ptr<AsyncHybridStore>>
AsyncHybridStore::open(const config::StoreConfig& config,
                       std::shared_ptr<vector::IEmbeddingProvider> provider,
                       std::shared_ptr<vector::IEmbeddingCache> cache) {
    auto store = HybridStore::open(config, std::move(provider), std::move(cache));
    if (!store) {
        return store.error();
    }
    std::shared_ptr<HybridStore> shared = std::move(store).value();
    spdlog::debug("Async store using {} worker threads", config.asyncThreads);
    return std::make_unique<AsyncHybridStore>(std::move(shared), config.asyncThreads);
}

std::future<Result<std::vector<std::string>>>
AsyncHybridStore::insertAsync(std::vector<DocumentInput> documents) {
    return pImpl->runAsync([store = pImpl->store, documents = std::move(documents)]() {
        return store->insert(documents);
    });
}

std::future<Result<Document>> AsyncHybridStore::getAsync(std::string id) {
    return pImpl->runAsync([store = pImpl->store, id = std::move(id)]() { return store->get(id); });
}

std::future<Result<void>> AsyncHybridStore::updateAsync(std::string id, DocumentPatch patch) {
    return pImpl->runAsync([store = pImpl->store, id = std::move(id), patch = std::move(patch)]() {
        return store->update(id, patch);
    });
}

std::future<Result<void>> AsyncHybridStore::removeAsync(std::string id) {
    return pImpl->runAsync(
        [store = pImpl->store, id = std::move(id)]() { return store->remove(id); });
}

std::future<Result<size_t>> AsyncHybridStore::removeByFilterAsync(metadata::MetadataFilter filter) {
    return pImpl->runAsync([store = pImpl->store, filter = std::move(filter)]() {
        return store->removeByFilter(filter);
    });
}

std::future<Result<void>> AsyncHybridStore::clearAsync() {
    return pImpl->runAsync([store = pImpl->store]() { return store->clear(); });
}

std::future<Result<std::vector<search::SearchResult>>>
AsyncHybridStore::searchAsync(std::string queryText, search::SearchOptions options) {
    return pImpl->runAsync(
        [store = pImpl->store, queryText = std::move(queryText), options = std::move(options)]() {
            return store->search(queryText, options);
        });
}

std::future<Result<std::vector<search::SearchResult>>>
AsyncHybridStore::searchByEmbeddingAsync(Embedding queryVector, search::SearchOptions options) {
    return pImpl->runAsync([store = pImpl->store, queryVector = std::move(queryVector),
                            options = std::move(options)]() {
        return store->searchByEmbedding(queryVector, options);
    });
}

std::future<Result<std::vector<search::SearchResult>>>
AsyncHybridStore::hybridSearchAsync(std::string queryText, search::HybridSearchOptions options) {
    return pImpl->runAsync(
        [store = pImpl->store, queryText = std::move(queryText), options = std::move(options)]() {
            return store->hybridSearch(queryText, options);
        });
}

std::future<Result<StoreStats>> AsyncHybridStore::statsAsync() {
    return pImpl->runAsync([store = pImpl->store]() { return store->stats(); });
}

void AsyncHybridStore::waitAll() {
    pImpl->waitAll();
}

size_t AsyncHybridStore::pendingOperations() const {
    return pImpl->pendingOps.load();
}

std::shared_ptr<HybridStore> AsyncHybridStore::store() const {
    return pImpl->store;
}

} // namespace hybridstore::store
