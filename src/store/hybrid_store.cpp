#include <hybridstore/store/hybrid_store.h>

#include <spdlog/spdlog.h>
#include <unordered_map>
#include <hybridstore/storage/sqlite_backend.h>

namespace hybridstore::store {

namespace {

Result<std::shared_ptr<vector::IEmbeddingProvider>>
resolveProvider(const config::StoreConfig& config,
                std::shared_ptr<vector::IEmbeddingProvider> provider) {
    if (provider || config.embeddingProvider.empty()) {
        return provider;
    }
    std::shared_ptr<vector::IEmbeddingProvider> created =
        vector::createEmbeddingProvider(config.embeddingProvider, config.dimensions);
    if (!created) {
        return Error{ErrorCode::ValidationError,
                     "Unknown embedding provider '" + config.embeddingProvider + "'"};
    }
    return created;
}

} // namespace

HybridStore::HybridStore(config::StoreConfig config,
                         std::shared_ptr<storage::IStorageBackend> backend,
                         std::shared_ptr<vector::EmbeddingClient> embedder)
    : config_(std::move(config)), backend_(std::move(backend)), embedder_(std::move(embedder)) {
    DocumentStoreConfig docConfig;
    docConfig.dimensions = config_.dimensions;
    docConfig.metric = config_.metric;
    docConfig.tableName = config_.tableName;
    documents_ = std::make_unique<DocumentStore>(backend_, embedder_, docConfig);

    similarity_ = std::make_shared<search::SimilaritySearchEngine>(backend_, config_.dimensions,
                                                                   config_.metric);
    lexical_ = std::make_shared<search::LexicalSearchEngine>(backend_);
    ranker_ = std::make_unique<search::HybridFusionRanker>(embedder_, similarity_, lexical_);
}

HybridStore::~HybridStore() = default;

Result<std::unique_ptr<HybridStore>>
HybridStore::open(const config::StoreConfig& config,
                  std::shared_ptr<vector::IEmbeddingProvider> provider,
                  std::shared_ptr<vector::IEmbeddingCache> cache) {
    if (auto valid = config::validateStoreConfig(config); !valid) {
        return valid.error();
    }

    storage::SqliteBackendConfig backendConfig;
    backendConfig.path = config.databasePath;
    backendConfig.tableName = config.tableName;
    backendConfig.busyTimeout = config.storageTimeout;
    backendConfig.enableWal = config.enableWal;

    auto backend = std::make_shared<storage::SqliteStorageBackend>(backendConfig);
    if (auto opened = backend->open(); !opened) {
        spdlog::error("Failed to open database '{}': {}", config.databasePath,
                      opened.error().message);
        return opened.error();
    }
    return open(config, std::static_pointer_cast<storage::IStorageBackend>(backend),
                std::move(provider), std::move(cache));
}

Result<std::unique_ptr<HybridStore>>
HybridStore::open(const config::StoreConfig& config,
                  std::shared_ptr<storage::IStorageBackend> backend,
                  std::shared_ptr<vector::IEmbeddingProvider> provider,
                  std::shared_ptr<vector::IEmbeddingCache> cache) {
    if (auto valid = config::validateStoreConfig(config); !valid) {
        return valid.error();
    }
    if (!backend) {
        return Error{ErrorCode::ValidationError, "A storage backend is required"};
    }

    auto resolved = resolveProvider(config, std::move(provider));
    if (!resolved) {
        return resolved.error();
    }
    provider = std::move(resolved).value();

    config::StoreConfig effective = config;
    if (provider) {
        size_t providerDims = provider->getDimensions();
        if (effective.dimensions == 0) {
            effective.dimensions = providerDims;
        } else if (providerDims != effective.dimensions) {
            return Error{ErrorCode::DimensionMismatch,
                         "Embedding provider '" + provider->getProviderName() + "' produces " +
                             std::to_string(providerDims) + " dimensions, store configured for " +
                             std::to_string(effective.dimensions)};
        }
        if (!provider->isAvailable()) {
            spdlog::warn("Embedding provider '{}' reports it is unavailable",
                         provider->getProviderName());
        }
    }
    if (effective.dimensions == 0) {
        return Error{ErrorCode::ValidationError,
                     "dimensions must be positive when no embedding provider is configured"};
    }

    if (!cache && provider && effective.enableEmbeddingCache) {
        vector::EmbeddingCacheConfig cacheConfig;
        cacheConfig.maxEntries = effective.embeddingCacheEntries;
        cacheConfig.ttl =
            std::chrono::duration_cast<std::chrono::milliseconds>(effective.embeddingCacheTtl);
        cache = std::make_shared<vector::TtlEmbeddingCache>(cacheConfig);
    } else if (!effective.enableEmbeddingCache && !cache) {
        spdlog::debug("Embedding cache disabled");
    }

    vector::EmbeddingClientConfig clientConfig;
    clientConfig.dimensions = effective.dimensions;
    clientConfig.timeout = effective.embeddingTimeout;
    auto embedder = std::make_shared<vector::EmbeddingClient>(provider, cache, clientConfig);

    if (auto schema = backend->createSchema(effective.dimensions, effective.metric); !schema) {
        spdlog::error("Schema setup for '{}' failed: {}", effective.tableName,
                      schema.error().message);
        return schema.error();
    }

    spdlog::info("Opened hybrid store '{}' on {} ({} dims, {}, provider: {})",
                 effective.tableName, backend->backendName(), effective.dimensions,
                 vector::toString(effective.metric),
                 provider ? provider->getProviderName() : std::string("none"));

    return std::unique_ptr<HybridStore>(
        new HybridStore(std::move(effective), std::move(backend), std::move(embedder)));
}

bool HybridStore::hasEmbeddingProvider() const {
    return embedder_->hasProvider();
}

Result<std::vector<std::string>> HybridStore::insert(const std::vector<DocumentInput>& documents) {
    return documents_->insert(documents);
}

Result<std::string> HybridStore::insertOne(const DocumentInput& document) {
    return documents_->insertOne(document);
}

Result<Document> HybridStore::get(const std::string& id) {
    return documents_->get(id);
}

Result<void> HybridStore::update(const std::string& id, const DocumentPatch& patch) {
    return documents_->update(id, patch);
}

Result<void> HybridStore::remove(const std::string& id) {
    return documents_->remove(id);
}

Result<size_t> HybridStore::removeByFilter(const metadata::MetadataFilter& filter) {
    return documents_->removeByFilter(filter);
}

Result<void> HybridStore::clear() {
    return documents_->clear();
}

Result<StoreStats> HybridStore::stats() {
    return documents_->stats();
}

Result<std::vector<search::SearchResult>>
HybridStore::search(const std::string& queryText, const search::SearchOptions& options) {
    if (queryText.empty()) {
        return Error{ErrorCode::ValidationError, "Query text must not be empty"};
    }
    auto queryVector = embedder_->embedOne(queryText);
    if (!queryVector) {
        return queryVector.error();
    }
    return hydrate(similarity_->search(queryVector.value(), options), options.fields);
}

Result<std::vector<search::SearchResult>>
HybridStore::searchByEmbedding(std::span<const float> queryVector,
                               const search::SearchOptions& options) {
    return hydrate(similarity_->search(queryVector, options), options.fields);
}

Result<std::vector<search::SearchResult>>
HybridStore::lexicalSearch(const std::string& queryText, const search::LexicalOptions& options) {
    return hydrate(lexical_->search(queryText, options), options.fields);
}

Result<std::vector<search::SearchResult>>
HybridStore::hybridSearch(const std::string& queryText,
                          const search::HybridSearchOptions& options) {
    return hydrate(ranker_->search(queryText, options), options.fields);
}

Result<std::vector<search::SearchResult>>
HybridStore::hydrate(Result<std::vector<search::SearchResult>> results,
                     const search::ResultFields& fields) {
    if (!results) {
        return results;
    }
    auto& hits = results.value();
    if (hits.empty() ||
        (!fields.includeContent && !fields.includeMetadata && !fields.includeEmbedding)) {
        return results;
    }

    std::vector<std::string> ids;
    ids.reserve(hits.size());
    for (const auto& hit : hits) {
        ids.push_back(hit.id);
    }
    auto rows = backend_->selectByIds(ids);
    if (!rows) {
        return rows.error();
    }

    std::unordered_map<std::string, storage::StoredDocument*> byId;
    for (auto& row : rows.value()) {
        byId.emplace(row.id, &row);
    }

    // A row deleted between ranking and hydration is dropped from the results
    std::vector<search::SearchResult> hydrated;
    hydrated.reserve(hits.size());
    for (auto& hit : hits) {
        auto it = byId.find(hit.id);
        if (it == byId.end()) {
            continue;
        }
        auto* row = it->second;
        if (fields.includeContent) {
            hit.content = std::move(row->content);
        }
        if (fields.includeMetadata) {
            hit.metadata = std::move(row->metadata);
        }
        if (fields.includeEmbedding) {
            hit.embedding = std::move(row->embedding);
        }
        hydrated.push_back(std::move(hit));
    }
    return hydrated;
}

} // namespace hybridstore::store
