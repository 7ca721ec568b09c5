#include <hybridstore/storage/sqlite_backend.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <mutex>
#include <unordered_map>
#include <hybridstore/core/uuid.h>
#include <hybridstore/storage/database.h>

namespace hybridstore::storage {

namespace {

constexpr const char* kFilterPointerType = "hybridstore_metadata_filter";
constexpr const char* kDistanceFunction = "hs_distance";
constexpr const char* kMetadataMatchFunction = "hs_metadata_match";
constexpr size_t kSelectChunkSize = 500;
constexpr const char* kRowColumns =
    "seq, id, content, metadata, embedding, created_at, updated_at";

std::vector<std::byte> embeddingToBlob(std::span<const float> embedding) {
    std::vector<std::byte> blob(embedding.size() * sizeof(float));
    if (!blob.empty()) {
        std::memcpy(blob.data(), embedding.data(), blob.size());
    }
    return blob;
}

Result<Embedding> blobToEmbedding(const std::vector<std::byte>& blob) {
    if (blob.size() % sizeof(float) != 0) {
        return Error{ErrorCode::DatabaseError,
                     "Stored embedding has invalid size " + std::to_string(blob.size())};
    }
    Embedding embedding(blob.size() / sizeof(float));
    if (!blob.empty()) {
        std::memcpy(embedding.data(), blob.data(), blob.size());
    }
    return embedding;
}

// hs_distance(stored_blob, query_blob) -> native metric distance
void distanceFunction(sqlite3_context* ctx, int /*argc*/, sqlite3_value** argv) {
    const auto* metric = static_cast<const vector::DistanceMetric*>(sqlite3_user_data(ctx));
    if (sqlite3_value_type(argv[0]) != SQLITE_BLOB || sqlite3_value_type(argv[1]) != SQLITE_BLOB) {
        sqlite3_result_error(ctx, "hs_distance: arguments must be embedding blobs", -1);
        return;
    }
    const void* pa = sqlite3_value_blob(argv[0]);
    const int na = sqlite3_value_bytes(argv[0]);
    const void* pb = sqlite3_value_blob(argv[1]);
    const int nb = sqlite3_value_bytes(argv[1]);
    if (na != nb || na % static_cast<int>(sizeof(float)) != 0) {
        sqlite3_result_error(ctx, "hs_distance: embedding length mismatch", -1);
        return;
    }

    // Blob memory carries no alignment guarantee
    thread_local std::vector<float> a;
    thread_local std::vector<float> b;
    const size_t n = static_cast<size_t>(na) / sizeof(float);
    a.resize(n);
    b.resize(n);
    if (n > 0) {
        std::memcpy(a.data(), pa, static_cast<size_t>(na));
        std::memcpy(b.data(), pb, static_cast<size_t>(nb));
    }
    sqlite3_result_double(ctx, vector::computeDistance(*metric, a, b));
}

// hs_metadata_match(metadata_json, filter_pointer) -> 0/1
void metadataMatchFunction(sqlite3_context* ctx, int /*argc*/, sqlite3_value** argv) {
    const auto* filter = static_cast<const metadata::MetadataFilter*>(
        sqlite3_value_pointer(argv[1], kFilterPointerType));
    if (!filter || filter->empty()) {
        sqlite3_result_int(ctx, 1);
        return;
    }
    const auto* text = reinterpret_cast<const char*>(sqlite3_value_text(argv[0]));
    const int n = sqlite3_value_bytes(argv[0]);
    auto parsed =
        metadata::parseMetadata(text ? std::string(text, static_cast<size_t>(n)) : std::string{});
    if (!parsed) {
        sqlite3_result_error(ctx, "hs_metadata_match: stored metadata is not a JSON object", -1);
        return;
    }
    sqlite3_result_int(ctx, filter->matches(parsed.value()) ? 1 : 0);
}

bool isTermByte(unsigned char c) {
    return std::isalnum(c) || c >= 0x80;
}

} // namespace

std::vector<std::string> tokenizeQuery(const std::string& text) {
    std::vector<std::string> terms;
    std::string current;
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (isTermByte(c)) {
            current.push_back(c < 0x80 ? static_cast<char>(std::tolower(c)) : ch);
        } else if (!current.empty()) {
            terms.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        terms.push_back(std::move(current));
    }
    return terms;
}

std::string buildMatchExpression(const std::string& text) {
    std::string expr;
    for (const auto& term : tokenizeQuery(text)) {
        if (!expr.empty()) {
            expr += " AND ";
        }
        // Terms never contain quotes, so wrapping is enough to make them literal
        expr += '"';
        expr += term;
        expr += '"';
    }
    return expr;
}

class SqliteStorageBackend::Impl {
public:
    explicit Impl(SqliteBackendConfig cfg) : config(std::move(cfg)) {}

    SqliteBackendConfig config;
    Database db;
    std::mutex mutex;
    // Read by hs_distance through sqlite3_user_data(); address must stay stable
    vector::DistanceMetric metric = vector::DistanceMetric::Cosine;
    size_t dimensions = 0;
    bool schemaReady = false;

    const std::string& table() const { return config.tableName; }
    std::string ftsTable() const { return config.tableName + "_fts"; }
    std::string infoTable() const { return config.tableName + "_info"; }

    Result<void> requireSchema() const {
        if (!db.isOpen()) {
            return Error{ErrorCode::NotInitialized, "SQLite backend is not open"};
        }
        if (!schemaReady) {
            return Error{ErrorCode::NotInitialized, "Schema has not been created"};
        }
        return {};
    }

    Result<StoredDocument> readRow(const Statement& stmt) const {
        StoredDocument doc;
        doc.seq = stmt.getInt64(0);
        doc.id = stmt.getString(1);
        doc.content = stmt.getString(2);
        auto meta = metadata::parseMetadata(stmt.getString(3));
        if (!meta) {
            return Error{ErrorCode::DatabaseError,
                         "Corrupt metadata for document '" + doc.id + "': " +
                             meta.error().message};
        }
        doc.metadata = std::move(meta).value();
        auto embedding = blobToEmbedding(stmt.getBlob(4));
        if (!embedding) {
            return Error{embedding.error().code,
                         embedding.error().message + " (document '" + doc.id + "')"};
        }
        doc.embedding = std::move(embedding).value();
        doc.createdAt = stmt.getString(5);
        doc.updatedAt = stmt.getString(6);
        return doc;
    }

    Result<void> createTables() {
        const auto& t = table();
        const auto fts = ftsTable();

        std::string ddl;
        ddl += "CREATE TABLE IF NOT EXISTS " + t +
               " ("
               "seq INTEGER PRIMARY KEY AUTOINCREMENT, "
               "id TEXT NOT NULL UNIQUE, "
               "content TEXT NOT NULL, "
               "metadata TEXT NOT NULL DEFAULT '{}', "
               "embedding BLOB NOT NULL, "
               "created_at TEXT NOT NULL, "
               "updated_at TEXT NOT NULL);";
        ddl += "CREATE VIRTUAL TABLE IF NOT EXISTS " + fts +
               " USING fts5(content, content='" + t +
               "', content_rowid='seq', tokenize='porter unicode61');";
        ddl += "CREATE TRIGGER IF NOT EXISTS " + t + "_ai AFTER INSERT ON " + t +
               " BEGIN INSERT INTO " + fts + "(rowid, content) VALUES (new.seq, new.content); END;";
        ddl += "CREATE TRIGGER IF NOT EXISTS " + t + "_ad AFTER DELETE ON " + t +
               " BEGIN INSERT INTO " + fts + "(" + fts +
               ", rowid, content) VALUES ('delete', old.seq, old.content); END;";
        ddl += "CREATE TRIGGER IF NOT EXISTS " + t + "_au AFTER UPDATE OF content ON " + t +
               " BEGIN INSERT INTO " + fts + "(" + fts +
               ", rowid, content) VALUES ('delete', old.seq, old.content); INSERT INTO " + fts +
               "(rowid, content) VALUES (new.seq, new.content); END;";
        ddl += "CREATE TABLE IF NOT EXISTS " + infoTable() +
               " (key TEXT PRIMARY KEY, value TEXT NOT NULL);";
        return db.execute(ddl);
    }

    Result<std::optional<std::string>> readInfo(const std::string& key) {
        auto stmtResult = db.prepare("SELECT value FROM " + infoTable() + " WHERE key = ?");
        if (!stmtResult)
            return stmtResult.error();
        auto stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bind(1, key);
        if (!bindResult)
            return bindResult.error();
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            return std::optional<std::string>{};
        return std::optional<std::string>{stmt.getString(0)};
    }

    Result<void> writeInfo(const std::string& key, const std::string& value) {
        auto stmtResult =
            db.prepare("INSERT OR REPLACE INTO " + infoTable() + " (key, value) VALUES (?, ?)");
        if (!stmtResult)
            return stmtResult.error();
        auto stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bindAll(key, value);
        if (!bindResult)
            return bindResult;
        return stmt.execute();
    }

    Result<void> bindFilter(Statement& stmt, int index, const metadata::MetadataFilter& filter) {
        // SQLite only reads the pointer while the statement runs; the filter outlives it
        return stmt.bindPointer(index, const_cast<metadata::MetadataFilter*>(&filter),
                                kFilterPointerType);
    }
};

SqliteStorageBackend::SqliteStorageBackend(SqliteBackendConfig config)
    : pImpl(std::make_unique<Impl>(std::move(config))) {}

SqliteStorageBackend::~SqliteStorageBackend() {
    close();
}

Result<void> SqliteStorageBackend::open() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto& cfg = pImpl->config;

    if (!isValidIdentifier(cfg.tableName)) {
        return Error{ErrorCode::ValidationError,
                     "Invalid table name '" + cfg.tableName +
                         "': use letters, digits and underscores"};
    }
    if (pImpl->db.isOpen()) {
        return {};
    }

    const bool inMemory = cfg.path.empty() || cfg.path == ":memory:";
    auto openResult = inMemory ? pImpl->db.open(":memory:", ConnectionMode::Memory)
                               : pImpl->db.open(cfg.path, ConnectionMode::Create);
    if (!openResult) {
        spdlog::error("SqliteStorageBackend: failed to open '{}': {}", cfg.path,
                      openResult.error().message);
        return openResult;
    }

    auto timeoutResult = pImpl->db.setBusyTimeout(cfg.busyTimeout);
    if (!timeoutResult)
        return timeoutResult;

    if (cfg.enableWal && !inMemory) {
        auto walResult = pImpl->db.enableWAL();
        if (!walResult) {
            spdlog::warn("SqliteStorageBackend: WAL unavailable for '{}': {}", cfg.path,
                         walResult.error().message);
        }
    }

    auto fts5 = pImpl->db.hasFTS5();
    if (!fts5)
        return fts5.error();
    if (!fts5.value()) {
        pImpl->db.close();
        return Error{ErrorCode::NotSupported, "SQLite was built without FTS5"};
    }

    auto distanceResult =
        pImpl->db.createFunction(kDistanceFunction, 2, &distanceFunction, &pImpl->metric);
    if (!distanceResult)
        return distanceResult;
    auto matchResult = pImpl->db.createFunction(kMetadataMatchFunction, 2, &metadataMatchFunction);
    if (!matchResult)
        return matchResult;

    spdlog::info("SqliteStorageBackend opened '{}' (table '{}', SQLite {})",
                 inMemory ? ":memory:" : cfg.path, cfg.tableName, Database::version());
    return {};
}

void SqliteStorageBackend::close() {
    if (!pImpl) {
        return;
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->db.isOpen()) {
        pImpl->db.close();
        spdlog::debug("SqliteStorageBackend closed");
    }
    pImpl->schemaReady = false;
}

bool SqliteStorageBackend::isOpen() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->db.isOpen();
}

const SqliteBackendConfig& SqliteStorageBackend::config() const {
    return pImpl->config;
}

size_t SqliteStorageBackend::dimensions() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->dimensions;
}

Result<void> SqliteStorageBackend::createSchema(size_t dimensions, vector::DistanceMetric metric) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->db.isOpen()) {
        return Error{ErrorCode::NotInitialized, "SQLite backend is not open"};
    }
    if (dimensions == 0) {
        return Error{ErrorCode::ValidationError, "Dimensions must be positive"};
    }

    auto result = pImpl->db.transaction([&]() -> Result<void> {
        auto created = pImpl->createTables();
        if (!created)
            return created;

        auto storedDims = pImpl->readInfo("dimensions");
        if (!storedDims)
            return storedDims.error();
        auto storedMetric = pImpl->readInfo("metric");
        if (!storedMetric)
            return storedMetric.error();

        if (storedDims.value()) {
            const auto& dimsText = *storedDims.value();
            if (dimsText != std::to_string(dimensions)) {
                return Error{ErrorCode::DimensionMismatch,
                             "Table '" + pImpl->table() + "' stores " + dimsText +
                                 "-dimensional embeddings, configured " +
                                 std::to_string(dimensions)};
            }
        } else {
            auto w = pImpl->writeInfo("dimensions", std::to_string(dimensions));
            if (!w)
                return w;
        }

        if (storedMetric.value()) {
            const auto& metricText = *storedMetric.value();
            if (metricText != vector::toString(metric)) {
                return Error{ErrorCode::ValidationError,
                             "Table '" + pImpl->table() + "' was created with metric '" +
                                 metricText + "', configured '" + vector::toString(metric) + "'"};
            }
        } else {
            auto w = pImpl->writeInfo("metric", vector::toString(metric));
            if (!w)
                return w;
        }
        return {};
    });

    if (!result) {
        spdlog::error("SqliteStorageBackend: createSchema failed: {}", result.error().message);
        return result;
    }

    pImpl->dimensions = dimensions;
    pImpl->metric = metric;
    pImpl->schemaReady = true;
    spdlog::info("Schema ready for table '{}' ({} dimensions, {} metric)", pImpl->table(),
                 dimensions, vector::toString(metric));
    return {};
}

Result<void> SqliteStorageBackend::insertRows(const std::vector<StoredDocument>& rows) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto ready = pImpl->requireSchema();
    if (!ready)
        return ready;
    if (rows.empty()) {
        return {};
    }

    for (const auto& row : rows) {
        if (row.embedding.size() != pImpl->dimensions) {
            return Error{ErrorCode::DimensionMismatch,
                         "Document '" + row.id + "' has " + std::to_string(row.embedding.size()) +
                             " dimensions, expected " + std::to_string(pImpl->dimensions)};
        }
    }

    const auto sql = QueryBuilder()
                         .insertInto(pImpl->table())
                         .values({"id", "content", "metadata", "embedding", "created_at",
                                  "updated_at"})
                         .build();
    const auto now = core::formatTimestamp(std::chrono::system_clock::now());

    auto result = pImpl->db.transaction([&]() -> Result<void> {
        auto stmtResult = pImpl->db.prepare(sql);
        if (!stmtResult)
            return stmtResult.error();
        auto stmt = std::move(stmtResult).value();

        for (const auto& row : rows) {
            auto blob = embeddingToBlob(row.embedding);
            auto meta = metadata::serializeMetadata(row.metadata);
            const auto& createdAt = row.createdAt.empty() ? now : row.createdAt;
            const auto& updatedAt = row.updatedAt.empty() ? now : row.updatedAt;

            auto bindResult = stmt.bindAll(row.id, row.content, meta,
                                           std::span<const std::byte>(blob), createdAt, updatedAt);
            if (!bindResult)
                return bindResult;

            auto execResult = stmt.execute();
            if (!execResult) {
                if (execResult.error().code == ErrorCode::AlreadyExists) {
                    return Error{ErrorCode::AlreadyExists,
                                 "Document '" + row.id + "' already exists"};
                }
                return Error{execResult.error().code, "Failed to insert document '" + row.id +
                                                          "': " + execResult.error().message};
            }

            auto resetResult = stmt.reset();
            if (!resetResult)
                return resetResult;
            auto clearResult = stmt.clearBindings();
            if (!clearResult)
                return clearResult;
        }
        return {};
    });

    if (!result) {
        spdlog::error("SqliteStorageBackend: batch insert of {} rows rolled back: {}", rows.size(),
                      result.error().message);
        return result;
    }
    spdlog::debug("SqliteStorageBackend: inserted {} rows", rows.size());
    return {};
}

Result<std::optional<StoredDocument>> SqliteStorageBackend::selectById(const std::string& id) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto ready = pImpl->requireSchema();
    if (!ready)
        return ready.error();

    auto sql = QueryBuilder().select({kRowColumns}).from(pImpl->table()).where("id = ?").build();
    auto stmtResult = pImpl->db.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    auto bindResult = stmt.bind(1, id);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return std::optional<StoredDocument>{};

    auto row = pImpl->readRow(stmt);
    if (!row)
        return row.error();
    return std::optional<StoredDocument>{std::move(row).value()};
}

Result<std::vector<StoredDocument>>
SqliteStorageBackend::selectByIds(const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto ready = pImpl->requireSchema();
    if (!ready)
        return ready.error();

    std::unordered_map<std::string, StoredDocument> found;
    for (size_t start = 0; start < ids.size(); start += kSelectChunkSize) {
        const size_t end = std::min(ids.size(), start + kSelectChunkSize);

        std::string placeholders;
        for (size_t i = start; i < end; ++i) {
            placeholders += (i == start) ? "?" : ", ?";
        }
        auto sql = QueryBuilder()
                       .select({kRowColumns})
                       .from(pImpl->table())
                       .where("id IN (" + placeholders + ")")
                       .build();
        auto stmtResult = pImpl->db.prepare(sql);
        if (!stmtResult)
            return stmtResult.error();
        auto stmt = std::move(stmtResult).value();

        int index = 1;
        for (size_t i = start; i < end; ++i) {
            auto bindResult = stmt.bind(index++, ids[i]);
            if (!bindResult)
                return bindResult.error();
        }

        while (true) {
            auto stepResult = stmt.step();
            if (!stepResult)
                return stepResult.error();
            if (!stepResult.value())
                break;
            auto row = pImpl->readRow(stmt);
            if (!row)
                return row.error();
            auto doc = std::move(row).value();
            auto key = doc.id;
            found.emplace(std::move(key), std::move(doc));
        }
    }

    std::vector<StoredDocument> ordered;
    ordered.reserve(found.size());
    for (const auto& id : ids) {
        auto it = found.find(id);
        if (it != found.end()) {
            ordered.push_back(it->second);
        }
    }
    return ordered;
}

Result<bool> SqliteStorageBackend::updateRow(const std::string& id, const RowPatch& patch) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto ready = pImpl->requireSchema();
    if (!ready)
        return ready.error();
    if (patch.empty()) {
        return Error{ErrorCode::ValidationError, "Update of '" + id + "' changes nothing"};
    }
    if (patch.embedding && patch.embedding->size() != pImpl->dimensions) {
        return Error{ErrorCode::DimensionMismatch,
                     "Update of '" + id + "' has " + std::to_string(patch.embedding->size()) +
                         " dimensions, expected " + std::to_string(pImpl->dimensions)};
    }

    QueryBuilder qb;
    qb.update(pImpl->table());
    if (patch.content)
        qb.set("content");
    if (patch.metadata)
        qb.set("metadata");
    if (patch.embedding)
        qb.set("embedding");
    qb.set("updated_at");
    qb.where("id = ?");

    auto stmtResult = pImpl->db.prepare(qb.build());
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    int index = 1;
    Result<void> bindResult;
    if (patch.content) {
        bindResult = stmt.bind(index++, *patch.content);
        if (!bindResult)
            return bindResult.error();
    }
    if (patch.metadata) {
        bindResult = stmt.bind(index++, metadata::serializeMetadata(*patch.metadata));
        if (!bindResult)
            return bindResult.error();
    }
    std::vector<std::byte> blob;
    if (patch.embedding) {
        blob = embeddingToBlob(*patch.embedding);
        bindResult = stmt.bind(index++, std::span<const std::byte>(blob));
        if (!bindResult)
            return bindResult.error();
    }
    bindResult = stmt.bind(index++, core::formatTimestamp(std::chrono::system_clock::now()));
    if (!bindResult)
        return bindResult.error();
    bindResult = stmt.bind(index++, id);
    if (!bindResult)
        return bindResult.error();

    auto execResult = stmt.execute();
    if (!execResult) {
        return Error{execResult.error().code,
                     "Failed to update document '" + id + "': " + execResult.error().message};
    }
    return pImpl->db.changes() > 0;
}

Result<bool> SqliteStorageBackend::deleteRow(const std::string& id) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto ready = pImpl->requireSchema();
    if (!ready)
        return ready.error();

    auto stmtResult =
        pImpl->db.prepare(QueryBuilder().deleteFrom(pImpl->table()).where("id = ?").build());
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    auto bindResult = stmt.bind(1, id);
    if (!bindResult)
        return bindResult.error();
    auto execResult = stmt.execute();
    if (!execResult) {
        return Error{execResult.error().code,
                     "Failed to delete document '" + id + "': " + execResult.error().message};
    }
    return pImpl->db.changes() > 0;
}

Result<size_t> SqliteStorageBackend::deleteWhere(const metadata::MetadataFilter& filter) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto ready = pImpl->requireSchema();
    if (!ready)
        return ready.error();
    if (filter.empty()) {
        return Error{ErrorCode::ValidationError, "deleteWhere requires a non-empty filter"};
    }
    auto valid = filter.validate();
    if (!valid)
        return valid.error();

    auto sql = QueryBuilder()
                   .deleteFrom(pImpl->table())
                   .where(std::string(kMetadataMatchFunction) + "(metadata, ?)")
                   .build();
    auto stmtResult = pImpl->db.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    auto bindResult = pImpl->bindFilter(stmt, 1, filter);
    if (!bindResult)
        return bindResult.error();
    auto execResult = stmt.execute();
    if (!execResult) {
        return Error{execResult.error().code, "Failed to delete by filter " + filter.toString() +
                                                  ": " + execResult.error().message};
    }
    auto deleted = static_cast<size_t>(pImpl->db.changes());
    spdlog::debug("SqliteStorageBackend: deleted {} rows matching {}", deleted, filter.toString());
    return deleted;
}

Result<std::vector<VectorHit>>
SqliteStorageBackend::vectorTopK(std::span<const float> query, size_t k,
                                 const metadata::MetadataFilter& filter,
                                 std::optional<double> minSimilarity) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto ready = pImpl->requireSchema();
    if (!ready)
        return ready.error();
    if (query.size() != pImpl->dimensions) {
        return Error{ErrorCode::DimensionMismatch,
                     "Query vector has " + std::to_string(query.size()) +
                         " dimensions, expected " + std::to_string(pImpl->dimensions)};
    }
    if (k == 0) {
        return std::vector<VectorHit>{};
    }

    std::string inner = "SELECT id, seq, " + std::string(kDistanceFunction) +
                        "(embedding, ?) AS distance FROM " + pImpl->table();
    if (!filter.empty()) {
        inner += " WHERE " + std::string(kMetadataMatchFunction) + "(metadata, ?)";
    }

    QueryBuilder qb;
    qb.select({"id", "seq", "distance"}).from("(" + inner + ")");
    if (minSimilarity) {
        qb.where("(1.0 - distance) >= ?");
    }
    qb.orderBy("distance", true).thenBy("seq", true).limitPlaceholder();

    auto stmtResult = pImpl->db.prepare(qb.build());
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    auto blob = embeddingToBlob(query);
    int index = 1;
    auto bindResult = stmt.bind(index++, std::span<const std::byte>(blob));
    if (!bindResult)
        return bindResult.error();
    if (!filter.empty()) {
        bindResult = pImpl->bindFilter(stmt, index++, filter);
        if (!bindResult)
            return bindResult.error();
    }
    if (minSimilarity) {
        bindResult = stmt.bind(index++, *minSimilarity);
        if (!bindResult)
            return bindResult.error();
    }
    bindResult = stmt.bind(index++, static_cast<int64_t>(k));
    if (!bindResult)
        return bindResult.error();

    std::vector<VectorHit> hits;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        hits.push_back(VectorHit{stmt.getString(0), stmt.getDouble(2), stmt.getInt64(1)});
    }
    return hits;
}

Result<std::vector<TextHit>> SqliteStorageBackend::textTopK(const std::string& text, size_t k,
                                                            const metadata::MetadataFilter& filter) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto ready = pImpl->requireSchema();
    if (!ready)
        return ready.error();

    const auto match = buildMatchExpression(text);
    if (match.empty() || k == 0) {
        return std::vector<TextHit>{};
    }

    const auto fts = pImpl->ftsTable();
    QueryBuilder qb;
    qb.select({"d.id", "d.seq", "bm25(" + fts + ") AS score"})
        .from(fts)
        .join(pImpl->table() + " d", "d.seq = " + fts + ".rowid")
        .where(fts + " MATCH ?");
    if (!filter.empty()) {
        qb.andWhere(std::string(kMetadataMatchFunction) + "(d.metadata, ?)");
    }
    // bm25() is lower-is-better
    qb.orderBy("score", true).thenBy("d.seq", true).limitPlaceholder();

    auto stmtResult = pImpl->db.prepare(qb.build());
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    int index = 1;
    auto bindResult = stmt.bind(index++, match);
    if (!bindResult)
        return bindResult.error();
    if (!filter.empty()) {
        bindResult = pImpl->bindFilter(stmt, index++, filter);
        if (!bindResult)
            return bindResult.error();
    }
    bindResult = stmt.bind(index++, static_cast<int64_t>(k));
    if (!bindResult)
        return bindResult.error();

    std::vector<TextHit> hits;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        const double rank = std::max(0.0, -stmt.getDouble(2));
        hits.push_back(TextHit{stmt.getString(0), rank, stmt.getInt64(1)});
    }
    return hits;
}

Result<size_t> SqliteStorageBackend::count() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto ready = pImpl->requireSchema();
    if (!ready)
        return ready.error();

    auto stmtResult =
        pImpl->db.prepare(QueryBuilder().select({"COUNT(*)"}).from(pImpl->table()).build());
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    return static_cast<size_t>(stmt.getInt64(0));
}

Result<void> SqliteStorageBackend::truncate() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto ready = pImpl->requireSchema();
    if (!ready)
        return ready;

    // Row triggers keep the full-text index in step
    auto result = pImpl->db.execute("DELETE FROM " + pImpl->table());
    if (!result) {
        spdlog::error("SqliteStorageBackend: truncate failed: {}", result.error().message);
        return result;
    }
    spdlog::info("SqliteStorageBackend: table '{}' truncated", pImpl->table());
    return {};
}

} // namespace hybridstore::storage
