#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <hybridstore/core/types.h>

namespace hybridstore::vector {

/**
 * @brief Cache collaborator for computed embeddings
 *
 * Purely an optimization: the store behaves identically when no cache is injected.
 */
class IEmbeddingCache {
public:
    virtual ~IEmbeddingCache() = default;

    virtual std::optional<Embedding> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const Embedding& embedding) = 0;
    virtual void evict(const std::string& key) = 0;
    virtual void clear() = 0;
    virtual size_t size() const = 0;
};

/**
 * @brief Build a cache key scoped to a provider
 */
std::string makeEmbeddingCacheKey(const std::string& providerName, const std::string& text);

/**
 * @brief Configuration for the TTL embedding cache
 */
struct EmbeddingCacheConfig {
    size_t maxEntries = 10000;           ///< LRU bound
    std::chrono::milliseconds ttl{3600000}; ///< Entry lifetime; zero or negative never expires
};

struct EmbeddingCacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t insertions = 0;
    uint64_t evictions = 0;   ///< LRU evictions and explicit evict() calls
    uint64_t expirations = 0; ///< Entries dropped because their TTL passed
    size_t size = 0;

    double hitRate() const {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }
};

/**
 * @brief Thread-safe LRU cache with per-entry TTL
 */
class TtlEmbeddingCache : public IEmbeddingCache {
public:
    explicit TtlEmbeddingCache(const EmbeddingCacheConfig& config = {});
    ~TtlEmbeddingCache() override = default;

    // ===== Core Operations =====

    /**
     * @brief Get a cached embedding
     * @return nullopt if absent or expired; expired entries are dropped
     */
    std::optional<Embedding> get(const std::string& key) override;

    void set(const std::string& key, const Embedding& embedding) override;
    void evict(const std::string& key) override;
    void clear() override;

    // ===== Cache Management =====

    size_t size() const override;
    bool contains(const std::string& key) const;

    /**
     * @brief Remove every expired entry
     * @return Number of entries removed
     */
    size_t removeExpired();

    // ===== Statistics =====

    EmbeddingCacheStats getStats() const;
    void resetStats();

    const EmbeddingCacheConfig& config() const { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    struct CacheEntry {
        Embedding data;
        Clock::time_point insertTime;
        std::list<std::string>::iterator lruIt;
    };

    bool isExpired(const CacheEntry& entry, Clock::time_point now) const;
    void eraseLocked(std::unordered_map<std::string, CacheEntry>::iterator it);

    EmbeddingCacheConfig config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, CacheEntry> cache_;
    std::list<std::string> lruList_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> insertions_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> expirations_{0};
};

} // namespace hybridstore::vector
