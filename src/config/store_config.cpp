#include <hybridstore/config/store_config.h>

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <functional>
#include <hybridstore/config/config_helpers.h>
#include <hybridstore/config/logging.h>
#include <hybridstore/storage/database.h>

namespace hybridstore::config {

namespace {

using Setter = std::function<Result<void>(StoreConfig&, const std::string&)>;

Error badValue(const std::string& source, const std::string& key, const std::string& value,
               const std::string& expected) {
    return Error{ErrorCode::ValidationError,
                 source + ": '" + key + "' = '" + value + "' is not " + expected};
}

Setter sizeSetter(size_t StoreConfig::*field, bool allowZero) {
    return [field, allowZero](StoreConfig& c, const std::string& v) -> Result<void> {
        auto n = parse_integer(v);
        if (!n || *n < 0 || (!allowZero && *n == 0)) {
            return Error{ErrorCode::ValidationError,
                         allowZero ? "a non-negative integer" : "a positive integer"};
        }
        c.*field = static_cast<size_t>(*n);
        return Result<void>();
    };
}

Setter boolSetter(bool StoreConfig::*field) {
    return [field](StoreConfig& c, const std::string& v) -> Result<void> {
        auto b = parse_bool(v);
        if (!b) {
            return Error{ErrorCode::ValidationError, "a boolean"};
        }
        c.*field = *b;
        return Result<void>();
    };
}

Setter millisSetter(std::chrono::milliseconds StoreConfig::*field) {
    return [field](StoreConfig& c, const std::string& v) -> Result<void> {
        auto n = parse_integer(v);
        if (!n || *n <= 0) {
            return Error{ErrorCode::ValidationError, "a positive number of milliseconds"};
        }
        c.*field = std::chrono::milliseconds(*n);
        return Result<void>();
    };
}

Setter stringSetter(std::string StoreConfig::*field) {
    return [field](StoreConfig& c, const std::string& v) -> Result<void> {
        c.*field = v;
        return Result<void>();
    };
}

// Canonical "section.key" names and how each one is applied
const std::map<std::string, Setter>& settersByKey() {
    static const std::map<std::string, Setter> setters = {
        {"store.dimensions", sizeSetter(&StoreConfig::dimensions, true)},
        {"store.metric",
         [](StoreConfig& c, const std::string& v) -> Result<void> {
             auto m = vector::parseDistanceMetric(v);
             if (!m) {
                 return Error{ErrorCode::ValidationError, "one of cosine, l2, inner_product"};
             }
             c.metric = *m;
             return Result<void>();
         }},
        {"store.database_path",
         [](StoreConfig& c, const std::string& v) -> Result<void> {
             c.databasePath = (v == ":memory:") ? v : expand_tilde(v).string();
             return Result<void>();
         }},
        {"store.table_name", stringSetter(&StoreConfig::tableName)},
        {"store.storage_timeout_ms", millisSetter(&StoreConfig::storageTimeout)},
        {"store.enable_wal", boolSetter(&StoreConfig::enableWal)},
        {"store.async_threads", sizeSetter(&StoreConfig::asyncThreads, false)},
        {"embedding.provider", stringSetter(&StoreConfig::embeddingProvider)},
        {"embedding.timeout_ms", millisSetter(&StoreConfig::embeddingTimeout)},
        {"cache.enabled", boolSetter(&StoreConfig::enableEmbeddingCache)},
        {"cache.max_entries", sizeSetter(&StoreConfig::embeddingCacheEntries, false)},
        {"cache.ttl_seconds",
         [](StoreConfig& c, const std::string& v) -> Result<void> {
             auto n = parse_integer(v);
             if (!n) {
                 return Error{ErrorCode::ValidationError, "an integer number of seconds"};
             }
             c.embeddingCacheTtl = std::chrono::seconds(*n);
             return Result<void>();
         }},
        {"logging.level", stringSetter(&StoreConfig::logLevel)},
    };
    return setters;
}

const std::map<std::string, std::string>& envToKey() {
    static const std::map<std::string, std::string> vars = {
        {"HYBRIDSTORE_DIMENSIONS", "store.dimensions"},
        {"HYBRIDSTORE_METRIC", "store.metric"},
        {"HYBRIDSTORE_DATABASE_PATH", "store.database_path"},
        {"HYBRIDSTORE_TABLE_NAME", "store.table_name"},
        {"HYBRIDSTORE_STORAGE_TIMEOUT_MS", "store.storage_timeout_ms"},
        {"HYBRIDSTORE_ENABLE_WAL", "store.enable_wal"},
        {"HYBRIDSTORE_ASYNC_THREADS", "store.async_threads"},
        {"HYBRIDSTORE_EMBEDDING_PROVIDER", "embedding.provider"},
        {"HYBRIDSTORE_EMBEDDING_TIMEOUT_MS", "embedding.timeout_ms"},
        {"HYBRIDSTORE_CACHE_ENABLED", "cache.enabled"},
        {"HYBRIDSTORE_CACHE_MAX_ENTRIES", "cache.max_entries"},
        {"HYBRIDSTORE_CACHE_TTL_SECONDS", "cache.ttl_seconds"},
        {"HYBRIDSTORE_LOG_LEVEL", "logging.level"},
    };
    return vars;
}

Result<void> applyOne(StoreConfig& config, const std::string& key, const std::string& value,
                      const std::string& source) {
    auto it = settersByKey().find(key);
    if (it == settersByKey().end()) {
        spdlog::debug("{}: ignoring unknown key '{}'", source, key);
        return Result<void>();
    }
    auto r = it->second(config, value);
    if (!r) {
        return badValue(source, key, value, r.error().message);
    }
    return r;
}

} // namespace

Result<void> validateStoreConfig(const StoreConfig& config) {
    if (config.databasePath.empty()) {
        return Error{ErrorCode::ValidationError, "databasePath must not be empty"};
    }
    if (!storage::isValidIdentifier(config.tableName)) {
        return Error{ErrorCode::ValidationError,
                     "tableName '" + config.tableName + "' is not a valid identifier"};
    }
    if (config.embeddingTimeout.count() <= 0) {
        return Error{ErrorCode::ValidationError, "embeddingTimeout must be positive"};
    }
    if (config.storageTimeout.count() <= 0) {
        return Error{ErrorCode::ValidationError, "storageTimeout must be positive"};
    }
    if (config.enableEmbeddingCache && config.embeddingCacheEntries == 0) {
        return Error{ErrorCode::ValidationError,
                     "embeddingCacheEntries must be positive when the cache is enabled"};
    }
    if (config.asyncThreads == 0) {
        return Error{ErrorCode::ValidationError, "asyncThreads must be at least 1"};
    }
    if (!parseLogLevel(config.logLevel)) {
        return Error{ErrorCode::ValidationError, "logLevel '" + config.logLevel + "' is unknown"};
    }
    return Result<void>();
}

Result<void> applyConfigValues(StoreConfig& config, const std::map<std::string, std::string>& values,
                               const std::string& source) {
    for (const auto& [key, value] : values) {
        if (auto r = applyOne(config, key, value, source); !r) {
            return r;
        }
    }
    return Result<void>();
}

Result<void> applyEnvironmentOverrides(StoreConfig& config) {
    for (const auto& [var, key] : envToKey()) {
        const char* value = std::getenv(var.c_str());
        if (!value || !*value) {
            continue;
        }
        if (auto r = applyOne(config, key, value, var); !r) {
            return r;
        }
    }
    return Result<void>();
}

Result<StoreConfig> loadStoreConfig(const std::filesystem::path& path) {
    StoreConfig config;

    std::filesystem::path configPath = path;
    if (configPath.empty()) {
        auto standard = get_config_path();
        std::error_code ec;
        if (std::filesystem::exists(standard, ec)) {
            configPath = standard;
        }
    } else if (std::error_code ec; !std::filesystem::exists(configPath, ec)) {
        return Error{ErrorCode::NotFound, "Config file not found: " + configPath.string()};
    }

    if (!configPath.empty()) {
        auto values = parse_config_file(configPath);
        if (!values) {
            return Error{ErrorCode::ValidationError,
                         "Config file could not be read: " + configPath.string()};
        }
        if (auto r = applyConfigValues(config, *values, configPath.string()); !r) {
            return r.error();
        }
        spdlog::debug("Loaded {} config values from {}", values->size(), configPath.string());
    }

    if (auto r = applyEnvironmentOverrides(config); !r) {
        return r.error();
    }
    if (auto r = validateStoreConfig(config); !r) {
        return r.error();
    }
    return config;
}

} // namespace hybridstore::config
