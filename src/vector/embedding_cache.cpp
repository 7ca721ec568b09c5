#include <hybridstore/vector/embedding_cache.h>

#include <spdlog/spdlog.h>
#include <mutex>

namespace hybridstore::vector {

std::string makeEmbeddingCacheKey(const std::string& providerName, const std::string& text) {
    std::string key;
    key.reserve(providerName.size() + 1 + text.size());
    key.append(providerName);
    key.push_back('\x1f');
    key.append(text);
    return key;
}

TtlEmbeddingCache::TtlEmbeddingCache(const EmbeddingCacheConfig& config) : config_(config) {
    if (config_.maxEntries == 0) {
        config_.maxEntries = 1;
    }
    spdlog::debug("TtlEmbeddingCache created (maxEntries={}, ttl={}ms)", config_.maxEntries,
                  config_.ttl.count());
}

bool TtlEmbeddingCache::isExpired(const CacheEntry& entry, Clock::time_point now) const {
    if (config_.ttl.count() <= 0) {
        return false;
    }
    return (now - entry.insertTime) > config_.ttl;
}

void TtlEmbeddingCache::eraseLocked(std::unordered_map<std::string, CacheEntry>::iterator it) {
    lruList_.erase(it->second.lruIt);
    cache_.erase(it);
}

std::optional<Embedding> TtlEmbeddingCache::get(const std::string& key) {
    // Hits reorder the LRU list, so take the write lock
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it == cache_.end()) {
        misses_.fetch_add(1);
        return std::nullopt;
    }

    if (isExpired(it->second, Clock::now())) {
        eraseLocked(it);
        expirations_.fetch_add(1);
        misses_.fetch_add(1);
        return std::nullopt;
    }

    // Move to front for LRU
    lruList_.splice(lruList_.begin(), lruList_, it->second.lruIt);
    hits_.fetch_add(1);
    return it->second.data;
}

void TtlEmbeddingCache::set(const std::string& key, const Embedding& embedding) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it != cache_.end()) {
        it->second.data = embedding;
        it->second.insertTime = Clock::now();
        lruList_.splice(lruList_.begin(), lruList_, it->second.lruIt);
        return;
    }

    while (cache_.size() >= config_.maxEntries && !lruList_.empty()) {
        auto victim = cache_.find(lruList_.back());
        if (victim == cache_.end()) {
            lruList_.pop_back();
            continue;
        }
        eraseLocked(victim);
        evictions_.fetch_add(1);
    }

    lruList_.push_front(key);
    cache_.emplace(key, CacheEntry{embedding, Clock::now(), lruList_.begin()});
    insertions_.fetch_add(1);
}

void TtlEmbeddingCache::evict(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        eraseLocked(it);
        evictions_.fetch_add(1);
    }
}

void TtlEmbeddingCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.clear();
    lruList_.clear();
}

size_t TtlEmbeddingCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.size();
}

bool TtlEmbeddingCache::contains(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return false;
    }
    return !isExpired(it->second, Clock::now());
}

size_t TtlEmbeddingCache::removeExpired() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto now = Clock::now();
    size_t removed = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (isExpired(it->second, now)) {
            lruList_.erase(it->second.lruIt);
            it = cache_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    expirations_.fetch_add(removed);
    return removed;
}

EmbeddingCacheStats TtlEmbeddingCache::getStats() const {
    EmbeddingCacheStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.insertions = insertions_.load();
    stats.evictions = evictions_.load();
    stats.expirations = expirations_.load();
    stats.size = size();
    return stats;
}

void TtlEmbeddingCache::resetStats() {
    hits_.store(0);
    misses_.store(0);
    insertions_.store(0);
    evictions_.store(0);
    expirations_.store(0);
}

} // namespace hybridstore::vector
