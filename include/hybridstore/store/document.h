#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <hybridstore/core/types.h>
#include <hybridstore/metadata/metadata_value.h>

namespace hybridstore::store {

/**
 * @brief A document to insert
 *
 * Without an id a UUID is assigned. Without an embedding the content is embedded by the
 * configured provider.
 */
struct DocumentInput {
    std::optional<std::string> id;
    std::string content;
    metadata::Metadata metadata;
    std::optional<Embedding> embedding;
};

/**
 * @brief Fields to change on an existing document
 */
struct DocumentPatch {
    std::optional<std::string> content;
    std::optional<metadata::Metadata> metadata;
    std::optional<Embedding> embedding; ///< Explicit vector; skips re-embedding

    bool empty() const { return !content && !metadata && !embedding; }
};

struct Document {
    std::string id;
    std::string content;
    metadata::Metadata metadata;
    Embedding embedding;
    std::string createdAt;
    std::string updatedAt;
};

struct StoreStats {
    size_t totalDocuments = 0;
    size_t dimensions = 0;
    std::string metric;
    std::string tableName;
    std::string backend;
    std::string indexType = "exact";
};

} // namespace hybridstore::store
