#include <cairn/metadata/database.h>

#include <spdlog/spdlog.h>

#include <thread>
#include <utility>

namespace cairn::metadata {

namespace {

constexpr int kBusyAttempts = 5;
constexpr auto kFirstBusyWait = std::chrono::milliseconds(10);
constexpr std::size_t kSqlSnippetLength = 100;

Result<void> checkBind(int rc, int index, const char* kind) {
    if (rc == SQLITE_OK)
        return {};
    return Error{ErrorCode::DatabaseError,
                 fmt::format("Binding {} to parameter {} failed: {}", kind, index,
                             sqlite3_errstr(rc))};
}

std::string sqlSnippet(sqlite3_stmt* stmt) {
    const char* sql = stmt ? sqlite3_sql(stmt) : nullptr;
    if (!sql)
        return {};
    std::string_view text(sql);
    if (text.size() <= kSqlSnippetLength)
        return std::string(text);
    return std::string(text.substr(0, kSqlSnippetLength)) + "...";
}

} // namespace

Statement::~Statement() {
    if (stmt_)
        sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_)
            sqlite3_finalize(stmt_);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    return checkBind(sqlite3_bind_null(stmt_, index), index, "null");
}

Result<void> Statement::bind(int index, int value) {
    return checkBind(sqlite3_bind_int(stmt_, index, value), index, "int");
}

Result<void> Statement::bind(int index, int64_t value) {
    return checkBind(sqlite3_bind_int64(stmt_, index, value), index, "int64");
}

Result<void> Statement::bind(int index, double value) {
    return checkBind(sqlite3_bind_double(stmt_, index, value), index, "double");
}

Result<void> Statement::bind(int index, std::string_view value) {
    return checkBind(sqlite3_bind_text64(stmt_, index, value.data(), value.size(),
                                         SQLITE_TRANSIENT, SQLITE_UTF8),
                     index, "text");
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    return checkBind(sqlite3_bind_blob64(stmt_, index, blob.data(), blob.size(), SQLITE_TRANSIENT),
                     index, "blob");
}

// Steps once, backing off while another connection holds the lock
Result<int> Statement::stepWithRetry(const char* what) {
    auto wait = kFirstBusyWait;
    int rc = SQLITE_OK;
    for (int attempt = 1;; ++attempt) {
        rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW || rc == SQLITE_DONE)
            return rc;
        if ((rc != SQLITE_BUSY && rc != SQLITE_LOCKED) || attempt == kBusyAttempts)
            break;
        spdlog::debug("Database busy, retrying {} in {}ms", what, wait.count());
        sqlite3_reset(stmt_);
        std::this_thread::sleep_for(wait);
        wait *= 2;
    }

    std::string message = fmt::format("Failed to {} statement: {}", what, sqlite3_errstr(rc));
    if (rc == SQLITE_CONSTRAINT)
        message += fmt::format(" [SQL: {}]", sqlSnippet(stmt_));
    return Error{ErrorCode::DatabaseError, std::move(message)};
}

Result<void> Statement::execute() {
    auto rc = stepWithRetry("execute");
    if (!rc)
        return rc.error();
    return {};
}

Result<bool> Statement::step() {
    auto rc = stepWithRetry("step");
    if (!rc)
        return rc.error();
    return rc.value() == SQLITE_ROW;
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
    const auto* text = sqlite3_column_text(stmt_, column);
    if (!text)
        return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::vector<std::byte> Statement::getBlob(int column) const {
    const auto* data = static_cast<const std::byte*>(sqlite3_column_blob(stmt_, column));
    const auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column));
    if (!data || size == 0)
        return {};
    return std::vector<std::byte>(data, data + size);
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

std::optional<std::string> Statement::getOptionalString(int column) const {
    if (isNull(column))
        return std::nullopt;
    return getString(column);
}

std::optional<int64_t> Statement::getOptionalInt64(int column) const {
    if (isNull(column))
        return std::nullopt;
    return getInt64(column);
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), path_(std::move(other.path_)),
      inTransaction_(std::exchange(other.inTransaction_, false)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
        inTransaction_ = std::exchange(other.inTransaction_, false);
    }
    return *this;
}

Result<void> Database::open(const std::string& path) {
    close();
    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &handle,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close(handle);
        return Error{ErrorCode::DatabaseError,
                     fmt::format("Failed to open database {}: {}", path, reason)};
    }
    db_ = handle;
    path_ = path;
    return {};
}

void Database::close() {
    if (!db_)
        return;
    if (inTransaction_)
        rollback();
    sqlite3_close_v2(db_);
    db_ = nullptr;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_)
        return Error{ErrorCode::NotInitialized, "Database is not open"};
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return Error{ErrorCode::DatabaseError,
                     fmt::format("Failed to prepare statement: {}", sqlite3_errmsg(db_))};
    }
    return Statement(stmt);
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_)
        return Error{ErrorCode::NotInitialized, "Database is not open"};
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string reason = errmsg ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        return Error{ErrorCode::DatabaseError, "Failed to execute SQL: " + reason};
    }
    return {};
}

void Database::rollback() {
    inTransaction_ = false;
    if (auto rolled = execute("ROLLBACK"); !rolled)
        spdlog::warn("Rollback on {} failed: {}", path_, rolled.error().message);
}

Result<void> Database::setBusyTimeout(std::chrono::milliseconds timeout) {
    if (!db_)
        return Error{ErrorCode::NotInitialized, "Database is not open"};
    int rc = sqlite3_busy_timeout(db_, static_cast<int>(timeout.count()));
    if (rc != SQLITE_OK)
        return Error{ErrorCode::DatabaseError,
                     fmt::format("Failed to set busy timeout: {}", sqlite3_errstr(rc))};
    return {};
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode=WAL");
}

Result<void> Database::enableForeignKeys() {
    return execute("PRAGMA foreign_keys=ON");
}

} // namespace cairn::metadata
