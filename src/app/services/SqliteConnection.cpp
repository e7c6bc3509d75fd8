#include "SqliteConnection.hpp"

#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

SqliteStatement::SqliteStatement(sqlite3* db, const std::string_view sql) {
    if (sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr) != SQLITE_OK) {
        throw DatabaseError(fmt::format("sqlite3_prepare_v2: {}", sqlite3_errmsg(db)));
    }
}

SqliteStatement::~SqliteStatement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept : stmt_(std::exchange(other.stmt_, nullptr)) {}

SqliteStatement& SqliteStatement::operator=(SqliteStatement&& other) noexcept {
    if (this != &other) {
        if (stmt_) sqlite3_finalize(stmt_);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

void SqliteStatement::Reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

void SqliteStatement::BindText(const int index, const std::string_view value) {
    if (sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
        throw DatabaseError(fmt::format("sqlite3_bind_text: {}", sqlite3_errmsg(sqlite3_db_handle(stmt_))));
    }
}

bool SqliteStatement::Step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc != SQLITE_DONE) {
        throw DatabaseError(fmt::format("sqlite3_step: {}", sqlite3_errmsg(sqlite3_db_handle(stmt_))));
    }
    return false;
}

void SqliteStatement::Execute() {
    while (Step()) {
    }
}

int64_t SqliteStatement::ColumnInt64(const int column) const {
    return sqlite3_column_int64(stmt_, column);
}

std::string SqliteStatement::ColumnText(const int column) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    return text ? std::string(text) : std::string{};
}

SqliteConnection::SqliteConnection(const std::filesystem::path& path,
                                   const formid::shared::StoreSettings& settings)
    : path_(path) {
    const int rc = sqlite3_open_v2(path.string().c_str(), &db_,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw DatabaseError(fmt::format("sqlite3_open_v2({}): {}", path.string(), msg));
    }

    try {
        sqlite3_busy_timeout(db_, settings.busyTimeoutMs);
        const auto journalMode = QueryText("PRAGMA journal_mode=WAL");
        if (journalMode != "wal") {
            spdlog::debug("Database {} stays in journal mode '{}'", path.string(), journalMode);
        }
        Execute("PRAGMA synchronous=NORMAL");
        Execute(fmt::format("PRAGMA cache_size=-{}", settings.cacheSizeKb));
        Execute("PRAGMA temp_store=MEMORY");
        Execute("PRAGMA foreign_keys=OFF");
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteConnection::~SqliteConnection() {
    if (db_) sqlite3_close(db_);
}

SqliteConnection::SqliteConnection(SqliteConnection&& other) noexcept
    : db_(std::exchange(other.db_, nullptr))
    , path_(std::move(other.path_))
    , savepointDepth_(std::exchange(other.savepointDepth_, 0)) {}

SqliteConnection& SqliteConnection::operator=(SqliteConnection&& other) noexcept {
    if (this != &other) {
        if (db_) sqlite3_close(db_);
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
        savepointDepth_ = std::exchange(other.savepointDepth_, 0);
    }
    return *this;
}

void SqliteConnection::Execute(const std::string_view sql) {
    const std::string statement(sql);
    char* err = nullptr;
    if (sqlite3_exec(db_, statement.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw DatabaseError(fmt::format("sqlite3_exec: {}", msg));
    }
}

SqliteStatement SqliteConnection::Prepare(const std::string_view sql) {
    return SqliteStatement(db_, sql);
}

std::optional<int64_t> SqliteConnection::QueryInt64(const std::string_view sql) {
    auto stmt = Prepare(sql);
    if (!stmt.Step()) {
        return std::nullopt;
    }
    return stmt.ColumnInt64(0);
}

std::string SqliteConnection::QueryText(const std::string_view sql) {
    auto stmt = Prepare(sql);
    if (!stmt.Step()) {
        return {};
    }
    return stmt.ColumnText(0);
}

bool SqliteConnection::InTransaction() const {
    return sqlite3_get_autocommit(db_) == 0;
}

SqliteTransaction::SqliteTransaction(SqliteConnection& connection)
    : connection_(connection)
    , name_(fmt::format("formid_sp{}", connection.savepointDepth_ + 1)) {
    connection_.Execute(fmt::format("SAVEPOINT {}", name_));
    ++connection_.savepointDepth_;
}

SqliteTransaction::~SqliteTransaction() {
    if (!active_) {
        return;
    }
    try {
        Rollback();
    } catch (const std::exception& error) {
        spdlog::warn("Rollback of {} failed: {}", name_, error.what());
    }
}

void SqliteTransaction::Commit() {
    if (!active_) {
        throw DatabaseError(fmt::format("Transaction {} is no longer active", name_));
    }
    connection_.Execute(fmt::format("RELEASE {}", name_));
    active_ = false;
    --connection_.savepointDepth_;
}

void SqliteTransaction::Rollback() {
    if (!active_) {
        return;
    }
    active_ = false;
    --connection_.savepointDepth_;
    // SQLite may already have rolled the whole transaction back (e.g. SQLITE_FULL)
    if (!connection_.InTransaction()) {
        return;
    }
    connection_.Execute(fmt::format("ROLLBACK TO {}", name_));
    connection_.Execute(fmt::format("RELEASE {}", name_));
}
