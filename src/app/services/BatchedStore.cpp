#include "BatchedStore.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "Cancellation.hpp"

using formid::shared::GameRelease;
using formid::shared::RecordRow;
using formid::shared::SafeTableName;

BatchedStore::BatchedStore(formid::shared::StoreSettings settings) : settings_(settings) {}

auto BatchedStore::InitializeSchema(const std::filesystem::path& databasePath, const GameRelease release) const -> void {
    const auto table = SafeTableName(release);

    if (databasePath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(databasePath.parent_path(), ec);
        if (ec) {
            throw DatabaseError(fmt::format("Cannot create directory {}: {}",
                                            databasePath.parent_path().string(), ec.message()));
        }
    }

    auto connection = OpenConnection(databasePath);
    connection.Execute(fmt::format(
        "CREATE TABLE IF NOT EXISTS {0} ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "plugin TEXT NOT NULL, "
        "formid TEXT NOT NULL, "
        "entry TEXT NOT NULL)", table));
    // Plugin lookups compare with NOCASE, so the index must carry the same collation to be usable.
    connection.Execute(fmt::format("DROP INDEX IF EXISTS idx_{0}_plugin", table));
    connection.Execute(fmt::format("CREATE INDEX IF NOT EXISTS idx_{0}_plugin_nocase ON {0}(plugin COLLATE NOCASE)", table));
    connection.Execute(fmt::format("CREATE INDEX IF NOT EXISTS idx_{0}_formid ON {0}(formid)", table));

    spdlog::debug("Schema ready for table {} in {}", table, databasePath.string());
}

auto BatchedStore::OpenConnection(const std::filesystem::path& databasePath) const -> SqliteConnection {
    return SqliteConnection(databasePath, settings_);
}

auto BatchedStore::InsertSql_(const GameRelease release) -> std::string {
    return fmt::format("INSERT INTO {} (plugin, formid, entry) VALUES (?, ?, ?)", SafeTableName(release));
}

auto BatchedStore::InsertBatch(SqliteConnection& connection, const GameRelease release,
                               const std::span<const RecordRow> rows, const std::stop_token token) const -> void {
    if (rows.empty()) {
        return;
    }

    SqliteTransaction transaction(connection);
    auto stmt = connection.Prepare(InsertSql_(release));
    for (const auto& row : rows) {
        ThrowIfCancelled(token);
        stmt.Reset();
        stmt.BindText(1, row.plugin);
        stmt.BindText(2, row.formId);
        stmt.BindText(3, row.entry);
        stmt.Execute();
    }
    transaction.Commit();

    spdlog::trace("Inserted batch of {} rows into {}", rows.size(), SafeTableName(release));
}

auto BatchedStore::InsertRecord(SqliteConnection& connection, const GameRelease release, const RecordRow& row) const -> void {
    auto stmt = connection.Prepare(InsertSql_(release));
    stmt.BindText(1, row.plugin);
    stmt.BindText(2, row.formId);
    stmt.BindText(3, row.entry);
    stmt.Execute();
}

auto BatchedStore::ClearPluginEntries(SqliteConnection& connection, const GameRelease release,
                                      const std::string_view pluginName) const -> void {
    auto stmt = connection.Prepare(fmt::format("DELETE FROM {} WHERE plugin = ? COLLATE NOCASE", SafeTableName(release)));
    stmt.BindText(1, pluginName);
    stmt.Execute();

    spdlog::debug("Cleared {} rows of {} from {}", sqlite3_changes(connection.Handle()),
                  pluginName, SafeTableName(release));
}

auto BatchedStore::Optimize(SqliteConnection& connection) const -> void {
    if (connection.InTransaction()) {
        throw DatabaseError("Cannot optimize while a transaction is open");
    }
    connection.Execute("VACUUM");
    connection.Execute("PRAGMA optimize");
}

auto BatchedStore::CountRows(SqliteConnection& connection, const GameRelease release,
                             const std::optional<std::string_view> pluginName) const -> int64_t {
    if (!pluginName) {
        return connection.QueryInt64(fmt::format("SELECT COUNT(*) FROM {}", SafeTableName(release))).value_or(0);
    }

    auto stmt = connection.Prepare(fmt::format("SELECT COUNT(*) FROM {} WHERE plugin = ? COLLATE NOCASE", SafeTableName(release)));
    stmt.BindText(1, *pluginName);
    return stmt.Step() ? stmt.ColumnInt64(0) : 0;
}
