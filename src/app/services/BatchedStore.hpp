#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <stop_token>
#include <string_view>

#include "GameRelease.hpp"
#include "SqliteConnection.hpp"
#include "config.hpp"
#include "entities.hpp"

// Writes record rows into the per-release table. Every table name comes from
// formid::shared::SafeTableName.
class BatchedStore {
public:
    explicit BatchedStore(formid::shared::StoreSettings settings = {});

    // Creates the database file, the release table and its two indexes if missing.
    auto InitializeSchema(const std::filesystem::path& databasePath, formid::shared::GameRelease release) const -> void;

    [[nodiscard]] auto OpenConnection(const std::filesystem::path& databasePath) const -> SqliteConnection;

    // All rows in one transaction through a single prepared statement. Nothing is
    // written if the token fires or a row fails.
    auto InsertBatch(SqliteConnection& connection, formid::shared::GameRelease release,
                     std::span<const formid::shared::RecordRow> rows, std::stop_token token = {}) const -> void;

    auto InsertRecord(SqliteConnection& connection, formid::shared::GameRelease release,
                      const formid::shared::RecordRow& row) const -> void;

    // Removes every row of the plugin, matching the name case-insensitively.
    // A plugin without rows is not an error.
    auto ClearPluginEntries(SqliteConnection& connection, formid::shared::GameRelease release,
                            std::string_view pluginName) const -> void;

    auto Optimize(SqliteConnection& connection) const -> void;

    // Per-plugin counts match names case-insensitively, like ClearPluginEntries.
    [[nodiscard]] auto CountRows(SqliteConnection& connection, formid::shared::GameRelease release,
                                 std::optional<std::string_view> pluginName = std::nullopt) const -> int64_t;

    [[nodiscard]] auto Settings() const -> const formid::shared::StoreSettings& { return settings_; }

private:
    static auto InsertSql_(formid::shared::GameRelease release) -> std::string;

private:
    formid::shared::StoreSettings settings_;
};
