#include <hybridstore/storage/database.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <thread>

namespace hybridstore::storage {

namespace {

constexpr int kMaxRetries = 5;
constexpr std::chrono::milliseconds kInitialBackoff{10};

std::string describeFailure(const char* what, int rc, sqlite3_stmt* stmt) {
    std::string errMsg = std::string(what) + ": " + sqlite3_errstr(rc);
    if ((rc & 0xff) == SQLITE_CONSTRAINT && stmt) {
        if (sqlite3* db = sqlite3_db_handle(stmt)) {
            errMsg += " (" + std::string(sqlite3_errmsg(db)) + ")";
        }
        if (const char* sql = sqlite3_sql(stmt)) {
            // First 100 chars of SQL for context
            std::string sqlSnippet(sql, std::min(std::strlen(sql), size_t{100}));
            errMsg += " [SQL: " + sqlSnippet + (std::strlen(sql) > 100 ? "..." : "") + "]";
        }
    } else if (stmt) {
        if (sqlite3* db = sqlite3_db_handle(stmt)) {
            errMsg += " (" + std::string(sqlite3_errmsg(db)) + ")";
        }
    }
    return errMsg;
}

} // namespace

ErrorCode translateResultCode(int sqliteResult) {
    switch (sqliteResult) {
        case SQLITE_CONSTRAINT_UNIQUE:
        case SQLITE_CONSTRAINT_PRIMARYKEY:
            return ErrorCode::AlreadyExists;
        default:
            break;
    }
    switch (sqliteResult & 0xff) {
        case SQLITE_OK:
        case SQLITE_ROW:
        case SQLITE_DONE:
            return ErrorCode::Success;
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return ErrorCode::Timeout;
        case SQLITE_NOTFOUND:
            return ErrorCode::NotFound;
        case SQLITE_MISUSE:
            return ErrorCode::InvalidState;
        default:
            return ErrorCode::DatabaseError;
    }
}

bool isValidIdentifier(std::string_view name) {
    if (name.empty() || name.size() > 64) {
        return false;
    }
    auto first = static_cast<unsigned char>(name.front());
    if (!(std::isalpha(first) || first == '_')) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || uc == '_';
    });
}

// Statement implementation
Statement::Statement(sqlite3* db, const std::string& sql) {
    const char* tail;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, &tail);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Result<void> Statement::checkBind(int rc, const char* what) const {
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError,
                     std::string("Failed to bind ") + what + ": " + sqlite3_errstr(rc)};
    }
    return {};
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    return checkBind(sqlite3_bind_null(stmt_, index), "null");
}

Result<void> Statement::bind(int index, int value) {
    return checkBind(sqlite3_bind_int(stmt_, index, value), "int");
}

Result<void> Statement::bind(int index, int64_t value) {
    return checkBind(sqlite3_bind_int64(stmt_, index, value), "int64");
}

Result<void> Statement::bind(int index, double value) {
    return checkBind(sqlite3_bind_double(stmt_, index, value), "double");
}

Result<void> Statement::bind(int index, const std::string& value) {
    return checkBind(sqlite3_bind_text(stmt_, index, value.c_str(),
                                       static_cast<int>(value.size()), SQLITE_TRANSIENT),
                     "string");
}

Result<void> Statement::bind(int index, std::string_view value) {
    return checkBind(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                                       SQLITE_TRANSIENT),
                     "string_view");
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    return checkBind(sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()),
                                       SQLITE_TRANSIENT),
                     "blob");
}

Result<void> Statement::bindPointer(int index, void* pointer, const char* type) {
    return checkBind(sqlite3_bind_pointer(stmt_, index, pointer, type, nullptr), "pointer");
}

Result<void> Statement::execute() {
    // Retry transient lock errors (SQLITE_BUSY, SQLITE_LOCKED) with exponential backoff
    auto backoff = kInitialBackoff;
    int rc = SQLITE_OK;
    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        rc = sqlite3_step(stmt_);
        if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
            return {};
        }
        int primary = rc & 0xff;
        if ((primary == SQLITE_BUSY || primary == SQLITE_LOCKED) && attempt + 1 < kMaxRetries) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
            continue;
        }
        break;
    }
    auto code = translateResultCode(rc);
    auto msg = describeFailure("Failed to execute statement", rc, stmt_);
    sqlite3_reset(stmt_);
    return Error{code, msg};
}

Result<bool> Statement::step() {
    auto backoff = kInitialBackoff;
    int rc = SQLITE_OK;
    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        } else if (rc == SQLITE_DONE) {
            return false;
        }
        int primary = rc & 0xff;
        if ((primary == SQLITE_BUSY || primary == SQLITE_LOCKED) && attempt + 1 < kMaxRetries) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
            continue;
        }
        break;
    }
    auto code = translateResultCode(rc);
    auto msg = describeFailure("Failed to step statement", rc, stmt_);
    sqlite3_reset(stmt_);
    return Error{code, msg};
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getString(int column) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text)
        return "";
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::vector<std::byte> Statement::getBlob(int column) const {
    const void* blob = sqlite3_column_blob(stmt_, column);
    int size = sqlite3_column_bytes(stmt_, column);
    if (!blob || size <= 0)
        return {};

    std::vector<std::byte> result(static_cast<size_t>(size));
    std::memcpy(result.data(), blob, static_cast<size_t>(size));
    return result;
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

int Statement::columnCount() const {
    return sqlite3_column_count(stmt_);
}

std::string Statement::columnName(int column) const {
    const char* name = sqlite3_column_name(stmt_, column);
    return name ? name : "";
}

Result<void> Statement::reset() {
    if (!stmt_) {
        return Error{ErrorCode::DatabaseError, "Statement is null"};
    }
    int rc = sqlite3_reset(stmt_);
    if (rc != SQLITE_OK) {
        return Error{translateResultCode(rc), "Failed to reset statement"};
    }
    return {};
}

Result<void> Statement::clearBindings() {
    if (!stmt_) {
        return Error{ErrorCode::DatabaseError, "Statement is null"};
    }
    int rc = sqlite3_clear_bindings(stmt_);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to clear bindings"};
    }
    return {};
}

// Database implementation
Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), inTransaction_(other.inTransaction_) {
    other.db_ = nullptr;
    other.inTransaction_ = false;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        inTransaction_ = other.inTransaction_;
        other.db_ = nullptr;
        other.inTransaction_ = false;
    }
    return *this;
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    int flags = 0;
    switch (mode) {
        case ConnectionMode::Create:
            flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
            break;
        case ConnectionMode::Memory:
            flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY;
            break;
    }
    // Connections are guarded by the owning backend's mutex
    flags |= SQLITE_OPEN_NOMUTEX;

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "Unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return Error{ErrorCode::DatabaseError, "Failed to open database: " + error};
    }

    sqlite3_extended_result_codes(db_, 1);
    // Set busy timeout to avoid indefinite blocking
    sqlite3_busy_timeout(db_, 5000);

    path_ = path;
    spdlog::debug("Opened SQLite database '{}' (SQLite {})", path_, version());
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    try {
        return Statement(db_, sql);
    } catch (const std::exception& e) {
        spdlog::error("SQL prepare failed: {} [{}]", e.what(), sql);
        return Error{ErrorCode::DatabaseError, e.what()};
    }
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        spdlog::error("SQL exec failed ({}): {}", error, sql);
        return Error{translateResultCode(rc), "Failed to execute SQL: " + error};
    }
    return {};
}

Result<void> Database::beginTransaction() {
    if (inTransaction_) {
        return Error{ErrorCode::InvalidState, "Already in transaction"};
    }

    auto result = execute("BEGIN IMMEDIATE");
    if (result) {
        inTransaction_ = true;
    }
    return result;
}

Result<void> Database::commit() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }

    auto result = execute("COMMIT");
    if (result) {
        inTransaction_ = false;
    }
    return result;
}

Result<void> Database::rollback() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }

    auto result = execute("ROLLBACK");
    inTransaction_ = false; // Always clear flag, even on error
    return result;
}

Result<void> Database::createFunction(const std::string& name, int argc, ScalarFunction fn,
                                      void* userData) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }
    int rc = sqlite3_create_function_v2(db_, name.c_str(), argc,
                                        SQLITE_UTF8 | SQLITE_DETERMINISTIC, userData, fn, nullptr,
                                        nullptr, nullptr);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError,
                     "Failed to register SQL function '" + name + "': " + getErrorMessage()};
    }
    return {};
}

int64_t Database::lastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<bool> Database::tableExists(const std::string& table) {
    auto stmtResult = prepare("SELECT COUNT(*) FROM sqlite_master "
                              "WHERE type='table' AND name=?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, table);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    return stmt.getInt(0) > 0;
}

Result<bool> Database::hasFTS5() {
    int enabled = sqlite3_compileoption_used("ENABLE_FTS5");
    if (enabled == 1) {
        return true;
    }
    // Some distributions build FTS5 in without advertising the compile option
    if (!db_) {
        return false;
    }
    auto created = execute("CREATE VIRTUAL TABLE IF NOT EXISTS temp.__fts5_check USING fts5(x)");
    if (!created) {
        return false;
    }
    auto drop = execute("DROP TABLE IF EXISTS temp.__fts5_check");
    if (!drop) {
        return drop.error();
    }
    return true;
}

Result<void> Database::setBusyTimeout(std::chrono::milliseconds timeout) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    int rc = sqlite3_busy_timeout(db_, static_cast<int>(timeout.count()));
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to set busy timeout"};
    }
    return {};
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode=WAL");
}

std::string Database::version() {
    return sqlite3_libversion();
}

std::string Database::getErrorMessage() const {
    return db_ ? sqlite3_errmsg(db_) : "No database connection";
}

// QueryBuilder implementation
QueryBuilder& QueryBuilder::select(const std::vector<std::string>& columns) {
    type_ = QueryType::Select;
    selectColumns_ = columns;
    return *this;
}

QueryBuilder& QueryBuilder::from(const std::string& table) {
    table_ = table;
    return *this;
}

QueryBuilder& QueryBuilder::where(const std::string& condition) {
    whereClauses_.clear();
    whereClauses_.push_back(condition);
    return *this;
}

QueryBuilder& QueryBuilder::andWhere(const std::string& condition) {
    if (whereClauses_.empty()) {
        whereClauses_.push_back(condition);
    } else {
        whereClauses_.push_back("AND " + condition);
    }
    return *this;
}

QueryBuilder& QueryBuilder::join(const std::string& table, const std::string& on) {
    joinClauses_.push_back("JOIN " + table + " ON " + on);
    return *this;
}

QueryBuilder& QueryBuilder::orderBy(const std::string& column, bool ascending) {
    orderByClauses_.clear();
    orderByClauses_.push_back(column + (ascending ? " ASC" : " DESC"));
    return *this;
}

QueryBuilder& QueryBuilder::thenBy(const std::string& column, bool ascending) {
    orderByClauses_.push_back(column + (ascending ? " ASC" : " DESC"));
    return *this;
}

QueryBuilder& QueryBuilder::limitPlaceholder() {
    limitPlaceholder_ = true;
    return *this;
}

QueryBuilder& QueryBuilder::insertInto(const std::string& table) {
    type_ = QueryType::Insert;
    table_ = table;
    return *this;
}

QueryBuilder& QueryBuilder::values(const std::vector<std::string>& columns) {
    insertColumns_ = columns;
    return *this;
}

QueryBuilder& QueryBuilder::update(const std::string& table) {
    type_ = QueryType::Update;
    table_ = table;
    return *this;
}

QueryBuilder& QueryBuilder::set(const std::string& column, const std::string& placeholder) {
    setClauses_.push_back({column, placeholder});
    return *this;
}

QueryBuilder& QueryBuilder::deleteFrom(const std::string& table) {
    type_ = QueryType::Delete;
    table_ = table;
    return *this;
}

void QueryBuilder::appendWhere(std::string& sql) const {
    if (whereClauses_.empty()) {
        return;
    }
    sql += " WHERE ";
    for (size_t i = 0; i < whereClauses_.size(); ++i) {
        if (i > 0)
            sql += " ";
        sql += whereClauses_[i];
    }
}

std::string QueryBuilder::build() const {
    std::string sql;

    switch (type_) {
        case QueryType::Select: {
            sql = "SELECT ";
            if (selectColumns_.empty()) {
                sql += "*";
            } else {
                for (size_t i = 0; i < selectColumns_.size(); ++i) {
                    if (i > 0)
                        sql += ", ";
                    sql += selectColumns_[i];
                }
            }
            sql += " FROM " + table_;

            for (const auto& join : joinClauses_) {
                sql += " " + join;
            }

            appendWhere(sql);

            if (!orderByClauses_.empty()) {
                sql += " ORDER BY ";
                for (size_t i = 0; i < orderByClauses_.size(); ++i) {
                    if (i > 0)
                        sql += ", ";
                    sql += orderByClauses_[i];
                }
            }

            if (limitPlaceholder_) {
                sql += " LIMIT ?";
            }
            break;
        }

        case QueryType::Insert: {
            sql = "INSERT INTO " + table_;
            if (!insertColumns_.empty()) {
                sql += " (";
                for (size_t i = 0; i < insertColumns_.size(); ++i) {
                    if (i > 0)
                        sql += ", ";
                    sql += insertColumns_[i];
                }
                sql += ") VALUES (";
                for (size_t i = 0; i < insertColumns_.size(); ++i) {
                    if (i > 0)
                        sql += ", ";
                    sql += "?";
                }
                sql += ")";
            }
            break;
        }

        case QueryType::Update: {
            sql = "UPDATE " + table_ + " SET ";
            for (size_t i = 0; i < setClauses_.size(); ++i) {
                if (i > 0)
                    sql += ", ";
                sql += setClauses_[i].first + " = " + setClauses_[i].second;
            }
            appendWhere(sql);
            break;
        }

        case QueryType::Delete: {
            sql = "DELETE FROM " + table_;
            appendWhere(sql);
            break;
        }

        default:
            break;
    }

    return sql;
}

void QueryBuilder::reset() {
    type_ = QueryType::None;
    table_.clear();
    selectColumns_.clear();
    insertColumns_.clear();
    setClauses_.clear();
    whereClauses_.clear();
    joinClauses_.clear();
    orderByClauses_.clear();
    limitPlaceholder_ = false;
}

} // namespace hybridstore::storage
