#pragma once

#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <hybridstore/core/types.h>

namespace hybridstore::storage {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    Memory, ///< In-memory database
    Create  ///< Read-write file database, created if missing
};

/**
 * @brief Map an SQLite result code to an ErrorCode
 *
 * Busy/locked become Timeout, unique and primary key violations become AlreadyExists.
 */
ErrorCode translateResultCode(int sqliteResult);

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind parameters to statement
     */
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, std::span<const std::byte> blob);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Bind a host pointer readable only by SQL functions expecting @p type
     *
     * The pointer must outlive every step of this statement.
     */
    Result<void> bindPointer(int index, void* pointer, const char* type);

    /**
     * @brief Bind multiple parameters using variadic templates
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindHelper(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Execute statement (for non-SELECT queries)
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     */
    Result<bool> step();

    /**
     * @brief Get column values
     */
    int getInt(int column) const;
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    std::vector<std::byte> getBlob(int column) const;
    bool isNull(int column) const;

    int columnCount() const;
    std::string columnName(int column) const;

    /**
     * @brief Reset statement for reuse
     */
    Result<void> reset();

    /**
     * @brief Clear all bindings
     */
    Result<void> clearBindings();

private:
    sqlite3_stmt* stmt_ = nullptr;

    Result<void> checkBind(int rc, const char* what) const;

    template <typename T, typename... Rest>
    Result<void> bindHelper(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindHelper(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindHelper(int) { return {}; }
};

/**
 * @brief Database connection wrapper
 */
class Database {
public:
    /// Scalar SQL function body: (context, argc, argv)
    using ScalarFunction = void (*)(sqlite3_context*, int, sqlite3_value**);

    Database() = default;
    ~Database();

    // Move-only
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Open database connection
     */
    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::Create);

    /**
     * @brief Close database connection
     */
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    /**
     * @brief Prepare SQL statement
     */
    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (for non-SELECT queries)
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    /**
     * @brief Execute within transaction; rolls back when @p func fails or throws
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        auto beginResult = beginTransaction();
        if (!beginResult)
            return beginResult;

        try {
            auto result = func();
            if (!result) {
                rollback();
                return result;
            }
            return commit();
        } catch (...) {
            rollback();
            throw;
        }
    }

    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    /**
     * @brief Register a deterministic scalar SQL function
     * @param userData Available to the function through sqlite3_user_data()
     */
    Result<void> createFunction(const std::string& name, int argc, ScalarFunction fn,
                                void* userData = nullptr);

    int64_t lastInsertRowId() const;

    /**
     * @brief Get number of rows affected by last query
     */
    int changes() const;

    Result<bool> tableExists(const std::string& table);

    /**
     * @brief Check if FTS5 is available
     */
    Result<bool> hasFTS5();

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();

    static std::string version();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;

    std::string getErrorMessage() const;
};

/**
 * @brief Query builder for constructing SQL queries
 *
 * Only identifiers and placeholders go through the builder; values are always bound.
 */
class QueryBuilder {
public:
    QueryBuilder() = default;

    // SELECT
    QueryBuilder& select(const std::vector<std::string>& columns = {});
    QueryBuilder& from(const std::string& table);
    QueryBuilder& where(const std::string& condition);
    QueryBuilder& andWhere(const std::string& condition);
    QueryBuilder& join(const std::string& table, const std::string& on);
    QueryBuilder& orderBy(const std::string& column, bool ascending = true);
    QueryBuilder& thenBy(const std::string& column, bool ascending = true);
    QueryBuilder& limitPlaceholder();

    // INSERT
    QueryBuilder& insertInto(const std::string& table);
    QueryBuilder& values(const std::vector<std::string>& columns);

    // UPDATE
    QueryBuilder& update(const std::string& table);
    QueryBuilder& set(const std::string& column, const std::string& placeholder = "?");

    // DELETE
    QueryBuilder& deleteFrom(const std::string& table);

    [[nodiscard]] std::string build() const;

    void reset();

private:
    enum class QueryType { None, Select, Insert, Update, Delete };

    void appendWhere(std::string& sql) const;

    QueryType type_ = QueryType::None;
    std::string table_;
    std::vector<std::string> selectColumns_;
    std::vector<std::string> insertColumns_;
    std::vector<std::pair<std::string, std::string>> setClauses_;
    std::vector<std::string> whereClauses_;
    std::vector<std::string> joinClauses_;
    std::vector<std::string> orderByClauses_;
    bool limitPlaceholder_ = false;
};

/**
 * @brief Check that @p name is a plain SQL identifier ([A-Za-z_][A-Za-z0-9_]*)
 */
bool isValidIdentifier(std::string_view name);

} // namespace hybridstore::storage
