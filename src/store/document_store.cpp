#include <hybridstore/store/document_store.h>

#include <spdlog/spdlog.h>
#include <cmath>
#include <string_view>
#include <unordered_set>
#include <hybridstore/core/uuid.h>

namespace hybridstore::store {

namespace {

bool isFiniteValue(const metadata::MetadataValue& value) {
    switch (value.type()) {
        case metadata::MetadataValueType::Real:
            return std::isfinite(std::get<double>(value.value));
        case metadata::MetadataValueType::Array:
            for (const auto& item : value.asArray()) {
                if (!isFiniteValue(item)) {
                    return false;
                }
            }
            return true;
        case metadata::MetadataValueType::Object:
            for (const auto& [key, item] : value.asObject()) {
                if (!isFiniteValue(item)) {
                    return false;
                }
            }
            return true;
        default:
            return true;
    }
}

Result<void> validateMetadata(const metadata::Metadata& meta, const std::string& context) {
    for (const auto& [key, value] : meta) {
        if (key.empty()) {
            return Error{ErrorCode::ValidationError, context + ": metadata key must not be empty"};
        }
        if (!metadata::isValidUtf8(std::string_view(key))) {
            return Error{ErrorCode::ValidationError,
                         context + ": metadata key is not valid UTF-8"};
        }
        if (!metadata::isValidUtf8(value)) {
            return Error{ErrorCode::ValidationError,
                         context + ": metadata '" + key + "' contains text that is not valid UTF-8"};
        }
        if (!isFiniteValue(value)) {
            return Error{ErrorCode::ValidationError,
                         context + ": metadata '" + key + "' contains a non-finite number"};
        }
    }
    return Result<void>();
}

Document toDocument(storage::StoredDocument row) {
    Document doc;
    doc.id = std::move(row.id);
    doc.content = std::move(row.content);
    doc.metadata = std::move(row.metadata);
    doc.embedding = std::move(row.embedding);
    doc.createdAt = std::move(row.createdAt);
    doc.updatedAt = std::move(row.updatedAt);
    return doc;
}

} // namespace

DocumentStore::DocumentStore(std::shared_ptr<storage::IStorageBackend> backend,
                             std::shared_ptr<vector::EmbeddingClient> embedder,
                             DocumentStoreConfig config)
    : backend_(std::move(backend)), embedder_(std::move(embedder)), config_(std::move(config)) {}

Result<void> DocumentStore::validateEmbedding(const Embedding& embedding,
                                              const std::string& context) const {
    if (embedding.size() != config_.dimensions) {
        return Error{ErrorCode::DimensionMismatch,
                     context + ": embedding has " + std::to_string(embedding.size()) +
                         " dimensions, store expects " + std::to_string(config_.dimensions)};
    }
    for (float v : embedding) {
        if (!std::isfinite(v)) {
            return Error{ErrorCode::ValidationError,
                         context + ": embedding contains a non-finite value"};
        }
    }
    return Result<void>();
}

Result<std::vector<std::string>>
DocumentStore::insert(const std::vector<DocumentInput>& documents) {
    if (documents.empty()) {
        return std::vector<std::string>{};
    }

    // Validate the whole batch before any provider or storage call
    std::unordered_set<std::string> seenIds;
    std::vector<size_t> needsEmbedding;
    for (size_t i = 0; i < documents.size(); ++i) {
        const auto& doc = documents[i];
        std::string context = "Document " + (doc.id ? "'" + *doc.id + "'" : "#" + std::to_string(i));

        if (doc.content.empty()) {
            return Error{ErrorCode::ValidationError, context + ": content must not be empty"};
        }
        if (doc.id) {
            if (doc.id->empty()) {
                return Error{ErrorCode::ValidationError, context + ": id must not be empty"};
            }
            if (!seenIds.insert(*doc.id).second) {
                return Error{ErrorCode::ValidationError,
                             context + ": id appears more than once in the batch"};
            }
        }
        if (auto r = validateMetadata(doc.metadata, context); !r) {
            return r.error();
        }
        if (doc.embedding) {
            if (auto r = validateEmbedding(*doc.embedding, context); !r) {
                return r.error();
            }
        } else {
            needsEmbedding.push_back(i);
        }
    }

    std::vector<Embedding> generated;
    if (!needsEmbedding.empty()) {
        std::vector<std::string> texts;
        texts.reserve(needsEmbedding.size());
        for (size_t i : needsEmbedding) {
            texts.push_back(documents[i].content);
        }
        auto embedded = embedder_->embed(texts);
        if (!embedded) {
            spdlog::error("Insert of {} documents aborted, embedding failed: {}", documents.size(),
                          embedded.error().message);
            return embedded.error();
        }
        generated = std::move(embedded).value();
    }

    std::vector<storage::StoredDocument> rows;
    rows.reserve(documents.size());
    size_t nextGenerated = 0;
    for (const auto& doc : documents) {
        storage::StoredDocument row;
        row.id = doc.id ? *doc.id : core::generateUUID();
        row.content = doc.content;
        row.metadata = doc.metadata;
        if (doc.embedding) {
            row.embedding = *doc.embedding;
        } else {
            row.embedding = std::move(generated[nextGenerated++]);
        }
        rows.push_back(std::move(row));
    }

    auto stored = backend_->insertRows(rows);
    if (!stored) {
        return stored.error();
    }

    std::vector<std::string> ids;
    ids.reserve(rows.size());
    for (auto& row : rows) {
        ids.push_back(std::move(row.id));
    }
    spdlog::debug("Inserted {} documents ({} embedded by provider)", ids.size(),
                  needsEmbedding.size());
    return ids;
}

Result<std::string> DocumentStore::insertOne(const DocumentInput& document) {
    auto ids = insert(std::vector<DocumentInput>{document});
    if (!ids) {
        return ids.error();
    }
    return std::move(ids.value().front());
}

Result<Document> DocumentStore::get(const std::string& id) {
    auto row = backend_->selectById(id);
    if (!row) {
        return row.error();
    }
    if (!row.value()) {
        return Error{ErrorCode::NotFound, "Document '" + id + "' not found"};
    }
    return toDocument(std::move(*row.value()));
}

Result<void> DocumentStore::update(const std::string& id, const DocumentPatch& patch) {
    if (patch.empty()) {
        return Error{ErrorCode::ValidationError, "Update of '" + id + "' has no fields"};
    }
    std::string context = "Document '" + id + "'";
    if (patch.content && patch.content->empty()) {
        return Error{ErrorCode::ValidationError, context + ": content must not be empty"};
    }
    if (patch.metadata) {
        if (auto r = validateMetadata(*patch.metadata, context); !r) {
            return r;
        }
    }
    if (patch.embedding) {
        if (auto r = validateEmbedding(*patch.embedding, context); !r) {
            return r;
        }
    }

    auto existing = backend_->selectById(id);
    if (!existing) {
        return existing.error();
    }
    if (!existing.value()) {
        return Error{ErrorCode::NotFound, context + " not found"};
    }

    storage::RowPatch rowPatch;
    rowPatch.content = patch.content;
    rowPatch.metadata = patch.metadata;
    rowPatch.embedding = patch.embedding;

    bool contentChanged = patch.content && *patch.content != existing.value()->content;
    if (contentChanged && !patch.embedding) {
        auto embedded = embedder_->embedOne(*patch.content);
        if (!embedded) {
            spdlog::error("Update of '{}' aborted, re-embedding failed: {}", id,
                          embedded.error().message);
            return embedded.error();
        }
        rowPatch.embedding = std::move(embedded).value();
    }

    auto updated = backend_->updateRow(id, rowPatch);
    if (!updated) {
        return updated.error();
    }
    if (!updated.value()) {
        return Error{ErrorCode::NotFound, context + " not found"};
    }
    spdlog::debug("Updated '{}'{}", id, contentChanged && !patch.embedding ? " (re-embedded)" : "");
    return Result<void>();
}

Result<void> DocumentStore::remove(const std::string& id) {
    auto deleted = backend_->deleteRow(id);
    if (!deleted) {
        return deleted.error();
    }
    if (!deleted.value()) {
        return Error{ErrorCode::NotFound, "Document '" + id + "' not found"};
    }
    spdlog::debug("Removed '{}'", id);
    return Result<void>();
}

Result<size_t> DocumentStore::removeByFilter(const metadata::MetadataFilter& filter) {
    if (filter.empty()) {
        return Error{ErrorCode::ValidationError,
                     "removeByFilter requires a non-empty filter; use clear() to remove all"};
    }
    if (auto valid = filter.validate(); !valid) {
        return valid.error();
    }
    auto removed = backend_->deleteWhere(filter);
    if (!removed) {
        return removed.error();
    }
    spdlog::debug("Removed {} documents matching {}", removed.value(), filter.toString());
    return removed;
}

Result<void> DocumentStore::clear() {
    auto r = backend_->truncate();
    if (r) {
        spdlog::info("Cleared table '{}'", config_.tableName);
    }
    return r;
}

Result<StoreStats> DocumentStore::stats() {
    auto total = backend_->count();
    if (!total) {
        return total.error();
    }
    StoreStats s;
    s.totalDocuments = total.value();
    s.dimensions = config_.dimensions;
    s.metric = vector::toString(config_.metric);
    s.tableName = config_.tableName;
    s.backend = backend_->backendName();
    return s;
}

} // namespace hybridstore::store
