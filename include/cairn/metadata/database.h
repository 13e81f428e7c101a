#pragma once

#include <cairn/core/types.h>

#include <sqlite3.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cairn::metadata {

class Database;

/**
 * Prepared statement. Owned handle, finalized on destruction; obtained from
 * Database::prepare().
 */
class Statement {
public:
    Statement() = default;
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Parameter indexes are 1-based, as in SQLite
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const std::string& value) {
        return bind(index, std::string_view(value));
    }
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }
    Result<void> bind(int index, std::span<const std::byte> blob);

    template <typename T> Result<void> bind(int index, const std::optional<T>& value) {
        if (!value)
            return bind(index, nullptr);
        return bind(index, *value);
    }

    // Binds args to ?1, ?2, ... in order
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        int index = 1;
        Result<void> status;
        ((status = status ? bind(index++, std::forward<Args>(args)) : status), ...);
        return status;
    }

    // Runs to completion; for statements that return no rows
    Result<void> execute();

    // true while a row is available
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    std::vector<std::byte> getBlob(int column) const;
    bool isNull(int column) const;

    std::optional<std::string> getOptionalString(int column) const;
    std::optional<int64_t> getOptionalInt64(int column) const;

private:
    friend class Database;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    Result<int> stepWithRetry(const char* what);

    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * One SQLite connection. Opened read-write, creating the file if needed.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // ":memory:" opens a private in-memory database
    Result<void> open(const std::string& path);
    void close();

    Result<Statement> prepare(const std::string& sql);

    // May hold several ';'-separated statements
    Result<void> execute(const std::string& sql);

    /**
     * @brief Run func inside BEGIN IMMEDIATE / COMMIT.
     * An error result from func rolls back and is returned unchanged; an exception
     * rolls back and propagates.
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        if (inTransaction_)
            return Error{ErrorCode::InvalidState, "Nested transactions are not supported"};
        if (auto begun = execute("BEGIN IMMEDIATE"); !begun)
            return begun;
        inTransaction_ = true;

        Result<void> result;
        try {
            result = func();
        } catch (...) {
            rollback();
            throw;
        }
        if (!result) {
            rollback();
            return result;
        }
        auto committed = execute("COMMIT");
        if (!committed) {
            rollback();
            return committed;
        }
        inTransaction_ = false;
        return {};
    }

    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();
    Result<void> enableForeignKeys();

private:
    // Best effort; the original error is what the caller reports
    void rollback();

    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

} // namespace cairn::metadata
