#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <hybridstore/core/types.h>
#include <hybridstore/vector/distance.h>

namespace hybridstore::config {

/**
 * @brief Settings for one store, fixed once the store is opened
 */
struct StoreConfig {
    size_t dimensions = 0; ///< 0 takes the provider's dimensions
    vector::DistanceMetric metric = vector::DistanceMetric::Cosine;
    std::string databasePath = ":memory:";
    std::string tableName = "documents";
    std::string embeddingProvider; ///< Registry name; empty for none

    std::chrono::milliseconds embeddingTimeout{30000};
    std::chrono::milliseconds storageTimeout{5000};

    bool enableEmbeddingCache = true;
    size_t embeddingCacheEntries = 10000;
    std::chrono::seconds embeddingCacheTtl{3600};

    bool enableWal = true;
    std::string logLevel = "info"; ///< Applied by the caller through configureLogging()
    size_t asyncThreads = 2;
};

/**
 * @brief Reject values a store cannot run with
 *
 * dimensions may be 0 here; it is resolved against the provider when the store opens.
 */
Result<void> validateStoreConfig(const StoreConfig& config);

/**
 * @brief Apply "section.key" values, e.g. from a TOML file
 * @param source Named in error messages
 * @return ValidationError for a malformed value; unknown keys are ignored
 */
Result<void> applyConfigValues(StoreConfig& config, const std::map<std::string, std::string>& values,
                               const std::string& source);

/**
 * @brief Apply HYBRIDSTORE_* environment variables
 */
Result<void> applyEnvironmentOverrides(StoreConfig& config);

/**
 * @brief Build a config from defaults, then the TOML file, then the environment
 *
 * With an empty @p path, HYBRIDSTORE_CONFIG or the user config file is read when it exists.
 * @return NotFound when an explicit @p path does not exist
 */
Result<StoreConfig> loadStoreConfig(const std::filesystem::path& path = {});

} // namespace hybridstore::config
