#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <sqlite3.h>

#include "config.hpp"

class DatabaseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SqliteStatement {
public:
    SqliteStatement(sqlite3* db, std::string_view sql);
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;
    SqliteStatement(SqliteStatement&& other) noexcept;
    SqliteStatement& operator=(SqliteStatement&& other) noexcept;

    void Reset();
    void BindText(int index, std::string_view value);

    // Returns true while a result row is available.
    bool Step();
    void Execute();

    [[nodiscard]] int64_t ColumnInt64(int column) const;
    [[nodiscard]] std::string ColumnText(int column) const;

private:
    sqlite3_stmt* stmt_ = nullptr;
};

// Owns one sqlite3 handle configured for a single writer with concurrent readers (WAL).
class SqliteConnection {
public:
    explicit SqliteConnection(const std::filesystem::path& path,
                              const formid::shared::StoreSettings& settings = {});
    ~SqliteConnection();

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;
    SqliteConnection(SqliteConnection&& other) noexcept;
    SqliteConnection& operator=(SqliteConnection&& other) noexcept;

    void Execute(std::string_view sql);
    [[nodiscard]] SqliteStatement Prepare(std::string_view sql);
    [[nodiscard]] std::optional<int64_t> QueryInt64(std::string_view sql);
    [[nodiscard]] std::string QueryText(std::string_view sql);

    [[nodiscard]] bool InTransaction() const;
    [[nodiscard]] sqlite3* Handle() const { return db_; }
    [[nodiscard]] const std::filesystem::path& Path() const { return path_; }

private:
    friend class SqliteTransaction;

    sqlite3* db_ = nullptr;
    std::filesystem::path path_;
    int savepointDepth_ = 0;
};

// Savepoint-backed, so transactions nest: a batch inside a plugin-wide transaction
// commits into the outer one, and only the outermost RELEASE reaches the file.
// Destroying an uncommitted transaction rolls it back.
class SqliteTransaction {
public:
    explicit SqliteTransaction(SqliteConnection& connection);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void Commit();
    void Rollback();

private:
    SqliteConnection& connection_;
    std::string name_;
    bool active_ = true;
};
