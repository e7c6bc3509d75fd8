#include <Cancellation.hpp>
#include <TextListExtractor.hpp>

#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "TestHelpers.hpp"

using formid::shared::GameRelease;
using formid::shared::RecordRow;

namespace {
    struct TextListFixture {
        TextListFixture() {
            store.InitializeSchema(database, GameRelease::SkyrimSE);
        }

        auto Run(const std::string& content, bool updateMode, std::stop_token token = {}) -> TextListResult {
            WriteFile(listPath, content);
            auto connection = store.OpenConnection(database);
            TextListExtractor extractor(store, [this](const formid::shared::ErrorReport& report) {
                errors.push_back(report.message);
            }, batchSize, progressInterval);
            return extractor.ProcessList(listPath, connection, GameRelease::SkyrimSE, updateMode, token,
                                         [this](const formid::shared::ProgressReport& report) { progress.push_back(report); });
        }

        auto AllRows() -> std::vector<RecordRow> {
            auto connection = store.OpenConnection(database);
            auto stmt = connection.Prepare("SELECT plugin, formid, entry FROM SkyrimSE ORDER BY id");
            std::vector<RecordRow> rows;
            while (stmt.Step()) {
                rows.push_back(RecordRow{.plugin = stmt.ColumnText(0), .formId = stmt.ColumnText(1), .entry = stmt.ColumnText(2)});
            }
            return rows;
        }

        TempDirectory dir;
        std::filesystem::path database = dir / "formids.db";
        std::filesystem::path listPath = dir / "formids.txt";
        BatchedStore store;
        size_t batchSize = 10000;
        size_t progressInterval = 1000;
        std::vector<std::string> errors;
        std::vector<formid::shared::ProgressReport> progress;
    };
}

TEST_CASE("Line parsing accepts exactly two separators", "[text][parse]") {
    const auto row = TextListExtractor::ParseLine("  Skyrim.esm | 000001 |  Iron Sword ");
    REQUIRE(row.has_value());
    REQUIRE(row->plugin == "Skyrim.esm");
    REQUIRE(row->formId == "000001");
    REQUIRE(row->entry == "Iron Sword");

    REQUIRE_FALSE(TextListExtractor::ParseLine("").has_value());
    REQUIRE_FALSE(TextListExtractor::ParseLine("   \t ").has_value());
    REQUIRE_FALSE(TextListExtractor::ParseLine("Skyrim.esm|000001").has_value());
    REQUIRE_FALSE(TextListExtractor::ParseLine("Skyrim.esm|000001|Sword|extra").has_value());
    REQUIRE_FALSE(TextListExtractor::ParseLine("no separators at all").has_value());
}

TEST_CASE("Every well-formed line becomes one row and malformed lines are ignored", "[text]") {
    TextListFixture fixture;
    const auto result = fixture.Run(
        "Skyrim.esm|000001|Sword\n"
        "\n"
        "   \n"
        "Skyrim.esm|000002\n"
        "Update.esm|000003|Shield|Extra\n"
        "Update.esm|000004|Helmet\r\n"
        "Dawnguard.esm|000005|Crossbow", false);

    REQUIRE(result.recordCount == 3);
    REQUIRE(result.pluginCount == 3);
    REQUIRE(result.rowsInserted == 3);
    REQUIRE(fixture.errors.empty());

    const std::vector<RecordRow> expected{
        {.plugin = "Skyrim.esm", .formId = "000001", .entry = "Sword"},
        {.plugin = "Update.esm", .formId = "000004", .entry = "Helmet"},
        {.plugin = "Dawnguard.esm", .formId = "000005", .entry = "Crossbow"},
    };
    REQUIRE(fixture.AllRows() == expected);
}

TEST_CASE("Update mode replaces a plugin's rows", "[text][update]") {
    TextListFixture fixture;

    fixture.Run("Skyrim.esm|000001|Sword\nSkyrim.esm|000001|Blade\n", false);
    auto rows = fixture.AllRows();
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].formId == rows[1].formId);
    REQUIRE(rows[0].entry == "Sword");
    REQUIRE(rows[1].entry == "Blade");

    fixture.Run("Skyrim.esm|000001|Blade\n", true);
    rows = fixture.AllRows();
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].entry == "Blade");
}

TEST_CASE("Update mode runs are idempotent", "[text][update]") {
    TextListFixture fixture;
    fixture.batchSize = 2;
    const std::string content =
        "A.esp|000001|One\n"
        "A.esp|000002|Two\n"
        "A.esp|000003|Three\n"
        "B.esp|000001|Four\n"
        "a.esp|000004|Five\n";

    fixture.Run(content, true);
    const auto once = fixture.AllRows();
    fixture.Run(content, true);
    const auto twice = fixture.AllRows();

    REQUIRE(once.size() == 5);
    REQUIRE(twice == once);
}

TEST_CASE("Rows with an empty plugin column are replaced like any other plugin", "[text][update]") {
    TextListFixture fixture;
    const std::string content =
        "|000001|NoPlugin\n"
        "A.esp|000002|x\n";

    const auto first = fixture.Run(content, true);
    const auto once = fixture.AllRows();
    const auto second = fixture.Run(content, true);
    const auto twice = fixture.AllRows();

    REQUIRE(first.pluginCount == 2);
    REQUIRE(second.pluginCount == 2);
    REQUIRE(once == std::vector<RecordRow>{
        {.plugin = "", .formId = "000001", .entry = "NoPlugin"},
        {.plugin = "A.esp", .formId = "000002", .entry = "x"},
    });
    REQUIRE(twice == once);
}

TEST_CASE("Update mode leaves plugins missing from the input untouched", "[text][update]") {
    TextListFixture fixture;
    fixture.Run("Keep.esp|000001|Old\nReplace.esp|000001|Old\n", false);
    fixture.Run("Replace.esp|000002|New\n", true);

    const auto rows = fixture.AllRows();
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0] == RecordRow{.plugin = "Keep.esp", .formId = "000001", .entry = "Old"});
    REQUIRE(rows[1] == RecordRow{.plugin = "Replace.esp", .formId = "000002", .entry = "New"});
}

TEST_CASE("Progress is reported at the record interval", "[text][progress]") {
    TextListFixture fixture;
    fixture.progressInterval = 2;

    std::string content;
    for (int i = 0; i < 5; ++i) {
        content += "Mod.esp|00000" + std::to_string(i) + "|Entry\n";
    }
    fixture.Run(content, false);

    REQUIRE(fixture.progress.size() == 4);
    REQUIRE(fixture.progress.front().message == "Starting processing...");
    REQUIRE(fixture.progress.front().percent == 0.0);
    REQUIRE(fixture.progress[1].message.starts_with("Processing: "));
    REQUIRE(fixture.progress[1].message.ends_with("(2 records)"));
    REQUIRE(fixture.progress.back().message == "Completed processing 1 plugins (5 total records)");
    REQUIRE(fixture.progress.back().percent == 100.0);
}

TEST_CASE("Update mode announces each plugin once", "[text][progress]") {
    TextListFixture fixture;
    fixture.Run("A.esp|000001|x\nB.esp|000001|x\nA.esp|000002|x\n", true);

    size_t announcements = 0;
    for (const auto& report : fixture.progress) {
        if (report.message.starts_with("Processing plugin: ")) ++announcements;
    }
    REQUIRE(announcements == 2);
}

TEST_CASE("A missing input file is fatal", "[text][errors]") {
    TextListFixture fixture;
    auto connection = fixture.store.OpenConnection(fixture.database);
    TextListExtractor extractor(fixture.store, {});

    REQUIRE_THROWS_AS(extractor.ProcessList(fixture.dir / "missing.txt", connection, GameRelease::SkyrimSE, false, {}),
                      std::runtime_error);
    REQUIRE(fixture.AllRows().empty());
}

TEST_CASE("Cancellation keeps only committed batches", "[text][cancel]") {
    TextListFixture fixture;
    fixture.batchSize = 2;
    fixture.progressInterval = 3;

    std::stop_source source;
    WriteFile(fixture.listPath,
              "Mod.esp|000001|a\nMod.esp|000002|b\nMod.esp|000003|c\nMod.esp|000004|d\nMod.esp|000005|e\n");
    auto connection = fixture.store.OpenConnection(fixture.database);
    TextListExtractor extractor(fixture.store, {}, fixture.batchSize, fixture.progressInterval);

    // The third record's progress report fires after the first batch committed.
    REQUIRE_THROWS_AS(extractor.ProcessList(fixture.listPath, connection, GameRelease::SkyrimSE, false,
                                            source.get_token(),
                                            [&source](const formid::shared::ProgressReport& report) {
                                                if (report.message.starts_with("Processing: ")) source.request_stop();
                                            }),
                      OperationCancelled);

    REQUIRE_FALSE(connection.InTransaction());
    const auto rows = fixture.AllRows();
    REQUIRE(rows.size() == 2);
    REQUIRE(rows.back().formId == "000002");
}

TEST_CASE("A failed batch is reported and the run continues", "[text][errors]") {
    TextListFixture fixture;
    fixture.batchSize = 2;
    {
        auto connection = fixture.store.OpenConnection(fixture.database);
        connection.Execute("CREATE TRIGGER reject_bad BEFORE INSERT ON SkyrimSE WHEN NEW.entry = 'bad' "
                           "BEGIN SELECT RAISE(ABORT, 'rejected'); END");
    }

    const auto result = fixture.Run("A.esp|000001|ok\nA.esp|000002|bad\nB.esp|000003|ok\n", false);

    REQUIRE(result.batchesDropped == 1);
    REQUIRE(result.rowsInserted == 1);
    REQUIRE(fixture.errors.size() == 1);
    REQUIRE(fixture.errors.front().starts_with("Warning: Failed to insert batch for A.esp"));

    const auto rows = fixture.AllRows();
    REQUIRE(rows.size() == 1);
    REQUIRE(rows.front().plugin == "B.esp");
}

TEST_CASE("A UTF-8 byte order mark does not reach the first plugin name", "[text][parse]") {
    TextListFixture fixture;
    fixture.Run("\xEF\xBB\xBFSkyrim.esm|000001|Sword\n", false);

    const auto rows = fixture.AllRows();
    REQUIRE(rows.size() == 1);
    REQUIRE(rows.front().plugin == "Skyrim.esm");
}
