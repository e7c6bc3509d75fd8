#include <BatchedStore.hpp>
#include <Cancellation.hpp>

#include <stop_token>
#include <string>
#include <vector>

#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>

#include "TestHelpers.hpp"

using formid::shared::GameRelease;
using formid::shared::RecordRow;

namespace {
    auto Rows(const std::string& plugin, size_t count) -> std::vector<RecordRow> {
        std::vector<RecordRow> rows;
        for (size_t i = 0; i < count; ++i) {
            rows.push_back(RecordRow{.plugin = plugin, .formId = formid::shared::FormatFormId(static_cast<uint32_t>(i)), .entry = "Entry" + std::to_string(i)});
        }
        return rows;
    }
}

TEST_CASE("Schema initialization is idempotent", "[store][schema]") {
    TempDirectory dir;
    const auto db = dir / "formids.db";
    const BatchedStore store;

    store.InitializeSchema(db, GameRelease::SkyrimSE);
    store.InitializeSchema(db, GameRelease::SkyrimSE);
    store.InitializeSchema(db, GameRelease::Fallout4);

    auto connection = store.OpenConnection(db);
    REQUIRE(connection.QueryInt64("SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = 'SkyrimSE'") == 1);
    REQUIRE(connection.QueryInt64("SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = 'Fallout4'") == 1);
    REQUIRE(connection.QueryInt64("SELECT COUNT(*) FROM sqlite_master WHERE type = 'index' AND name = 'idx_SkyrimSE_plugin_nocase'") == 1);
    REQUIRE(connection.QueryInt64("SELECT COUNT(*) FROM sqlite_master WHERE type = 'index' AND name = 'idx_SkyrimSE_formid'") == 1);
    REQUIRE(store.CountRows(connection, GameRelease::SkyrimSE) == 0);
}

TEST_CASE("Connections run in WAL mode", "[store][schema]") {
    TempDirectory dir;
    const BatchedStore store;
    store.InitializeSchema(dir / "formids.db", GameRelease::SkyrimSE);

    auto connection = store.OpenConnection(dir / "formids.db");
    REQUIRE(connection.QueryText("PRAGMA journal_mode") == "wal");
    REQUIRE(connection.QueryInt64("PRAGMA foreign_keys") == 0);
}

TEST_CASE("Batches insert every row and allow duplicate form ids", "[store][insert]") {
    TempDirectory dir;
    const auto db = dir / "formids.db";
    const BatchedStore store;
    store.InitializeSchema(db, GameRelease::SkyrimSE);
    auto connection = store.OpenConnection(db);

    store.InsertBatch(connection, GameRelease::SkyrimSE, Rows("Mod.esp", 250));
    const std::vector<RecordRow> duplicates{
        {.plugin = "Skyrim.esm", .formId = "000001", .entry = "Sword"},
        {.plugin = "Skyrim.esm", .formId = "000001", .entry = "Blade"},
    };
    store.InsertBatch(connection, GameRelease::SkyrimSE, duplicates);
    store.InsertRecord(connection, GameRelease::SkyrimSE, {.plugin = "Other.esp", .formId = "000ABC", .entry = "Single"});

    REQUIRE(store.CountRows(connection, GameRelease::SkyrimSE) == 253);
    REQUIRE(store.CountRows(connection, GameRelease::SkyrimSE, "Mod.esp") == 250);
    REQUIRE(store.CountRows(connection, GameRelease::SkyrimSE, "Skyrim.esm") == 2);
    REQUIRE_FALSE(connection.InTransaction());
}

TEST_CASE("Empty batches are a no-op", "[store][insert]") {
    TempDirectory dir;
    const BatchedStore store;
    store.InitializeSchema(dir / "formids.db", GameRelease::SkyrimSE);
    auto connection = store.OpenConnection(dir / "formids.db");

    store.InsertBatch(connection, GameRelease::SkyrimSE, std::vector<RecordRow>{});
    REQUIRE(store.CountRows(connection, GameRelease::SkyrimSE) == 0);
}

TEST_CASE("A cancelled batch writes nothing", "[store][cancel]") {
    TempDirectory dir;
    const BatchedStore store;
    store.InitializeSchema(dir / "formids.db", GameRelease::SkyrimSE);
    auto connection = store.OpenConnection(dir / "formids.db");

    store.InsertBatch(connection, GameRelease::SkyrimSE, Rows("First.esp", 10));

    std::stop_source source;
    source.request_stop();
    REQUIRE_THROWS_AS(store.InsertBatch(connection, GameRelease::SkyrimSE, Rows("Second.esp", 10), source.get_token()),
                      OperationCancelled);

    REQUIRE(store.CountRows(connection, GameRelease::SkyrimSE) == 10);
    REQUIRE(store.CountRows(connection, GameRelease::SkyrimSE, "Second.esp") == 0);
    REQUIRE_FALSE(connection.InTransaction());
}

TEST_CASE("A failing batch rolls back inside an outer transaction", "[store][transaction]") {
    TempDirectory dir;
    const BatchedStore store;
    store.InitializeSchema(dir / "formids.db", GameRelease::SkyrimSE);
    auto connection = store.OpenConnection(dir / "formids.db");
    connection.Execute("CREATE TRIGGER reject_bad BEFORE INSERT ON SkyrimSE WHEN NEW.entry = 'bad' "
                       "BEGIN SELECT RAISE(ABORT, 'rejected'); END");

    SqliteTransaction outer(connection);
    store.InsertBatch(connection, GameRelease::SkyrimSE, Rows("Mod.esp", 3));

    auto rows = Rows("Mod.esp", 3);
    rows.back().entry = "bad";
    REQUIRE_THROWS_AS(store.InsertBatch(connection, GameRelease::SkyrimSE, rows), DatabaseError);

    outer.Commit();
    REQUIRE(store.CountRows(connection, GameRelease::SkyrimSE) == 3);
}

TEST_CASE("Clearing removes only the named plugin and tolerates absent plugins", "[store][clear]") {
    TempDirectory dir;
    const BatchedStore store;
    store.InitializeSchema(dir / "formids.db", GameRelease::Fallout4);
    auto connection = store.OpenConnection(dir / "formids.db");

    store.InsertBatch(connection, GameRelease::Fallout4, Rows("A.esp", 5));
    store.InsertBatch(connection, GameRelease::Fallout4, Rows("B.esp", 7));

    store.ClearPluginEntries(connection, GameRelease::Fallout4, "A.esp");
    REQUIRE(store.CountRows(connection, GameRelease::Fallout4, "A.esp") == 0);
    REQUIRE(store.CountRows(connection, GameRelease::Fallout4, "B.esp") == 7);

    REQUIRE_NOTHROW(store.ClearPluginEntries(connection, GameRelease::Fallout4, "Missing.esp"));
    REQUIRE_NOTHROW(store.ClearPluginEntries(connection, GameRelease::Fallout4, "A.esp"));
    REQUIRE(store.CountRows(connection, GameRelease::Fallout4) == 7);
}

TEST_CASE("Plugin names are bound, never spliced into SQL", "[store][clear]") {
    TempDirectory dir;
    const BatchedStore store;
    store.InitializeSchema(dir / "formids.db", GameRelease::SkyrimSE);
    auto connection = store.OpenConnection(dir / "formids.db");

    store.InsertBatch(connection, GameRelease::SkyrimSE, Rows("Keep.esp", 2));
    store.ClearPluginEntries(connection, GameRelease::SkyrimSE, "x' OR '1'='1");
    REQUIRE(store.CountRows(connection, GameRelease::SkyrimSE) == 2);
}

TEST_CASE("Optimize keeps the data and refuses to run inside a transaction", "[store][optimize]") {
    TempDirectory dir;
    const BatchedStore store;
    store.InitializeSchema(dir / "formids.db", GameRelease::SkyrimSE);
    auto connection = store.OpenConnection(dir / "formids.db");
    store.InsertBatch(connection, GameRelease::SkyrimSE, Rows("Mod.esp", 20));
    store.ClearPluginEntries(connection, GameRelease::SkyrimSE, "Mod.esp");
    store.InsertBatch(connection, GameRelease::SkyrimSE, Rows("Mod.esp", 4));

    REQUIRE_NOTHROW(store.Optimize(connection));
    REQUIRE(store.CountRows(connection, GameRelease::SkyrimSE) == 4);

    SqliteTransaction transaction(connection);
    REQUIRE_THROWS_AS(store.Optimize(connection), DatabaseError);
}

TEST_CASE("Clearing matches plugin names regardless of case", "[store][clear]") {
    TempDirectory dir;
    const BatchedStore store;
    store.InitializeSchema(dir / "formids.db", GameRelease::SkyrimSE);
    auto connection = store.OpenConnection(dir / "formids.db");

    store.InsertBatch(connection, GameRelease::SkyrimSE, Rows("MyMod.esp", 2));
    store.InsertBatch(connection, GameRelease::SkyrimSE, Rows("mymod.ESP", 3));
    // Counting sees exactly the rows a clear would remove.
    REQUIRE(store.CountRows(connection, GameRelease::SkyrimSE, "MYMOD.esp") == 5);
    store.ClearPluginEntries(connection, GameRelease::SkyrimSE, "MYMOD.esp");

    REQUIRE(store.CountRows(connection, GameRelease::SkyrimSE) == 0);
}

TEST_CASE("Plugin clears and counts use the plugin index", "[store][clear][index]") {
    TempDirectory dir;
    const BatchedStore store;
    store.InitializeSchema(dir / "formids.db", GameRelease::SkyrimSE);
    auto connection = store.OpenConnection(dir / "formids.db");

    const auto plan = [&](const std::string& sql) {
        auto stmt = connection.Prepare("EXPLAIN QUERY PLAN " + sql);
        std::string details;
        while (stmt.Step()) {
            details += stmt.ColumnText(3) + "\n";
        }
        return details;
    };

    const auto clearPlan = plan("DELETE FROM SkyrimSE WHERE plugin = ? COLLATE NOCASE");
    INFO(clearPlan);
    REQUIRE(clearPlan.find("USING") != std::string::npos);
    REQUIRE(clearPlan.find("idx_SkyrimSE_plugin_nocase") != std::string::npos);

    const auto countPlan = plan("SELECT COUNT(*) FROM SkyrimSE WHERE plugin = ? COLLATE NOCASE");
    INFO(countPlan);
    REQUIRE(countPlan.find("idx_SkyrimSE_plugin_nocase") != std::string::npos);
}

TEST_CASE("An existing database is migrated to the case-insensitive plugin index", "[store][schema][index]") {
    TempDirectory dir;
    const auto db = dir / "formids.db";
    const BatchedStore store;
    {
        SqliteConnection legacy(db);
        legacy.Execute("CREATE TABLE SkyrimSE (id INTEGER PRIMARY KEY AUTOINCREMENT, plugin TEXT NOT NULL, "
                       "formid TEXT NOT NULL, entry TEXT NOT NULL)");
        legacy.Execute("CREATE INDEX idx_SkyrimSE_plugin ON SkyrimSE(plugin)");
        legacy.Execute("INSERT INTO SkyrimSE (plugin, formid, entry) VALUES ('Old.esp', '000001', 'Kept')");
    }

    store.InitializeSchema(db, GameRelease::SkyrimSE);

    auto connection = store.OpenConnection(db);
    REQUIRE(connection.QueryInt64("SELECT COUNT(*) FROM sqlite_master WHERE type = 'index' AND name = 'idx_SkyrimSE_plugin'") == 0);
    REQUIRE(connection.QueryInt64("SELECT COUNT(*) FROM sqlite_master WHERE type = 'index' AND name = 'idx_SkyrimSE_plugin_nocase'") == 1);
    REQUIRE(store.CountRows(connection, GameRelease::SkyrimSE, "OLD.ESP") == 1);
}
