#include "TextListExtractor.hpp"

#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "Cancellation.hpp"
#include "Utils.hpp"

namespace fs = std::filesystem;
using formid::shared::ErrorReport;
using formid::shared::GameRelease;
using formid::shared::ProgressReport;
using formid::shared::RecordRow;

namespace {
    constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
}

TextListExtractor::TextListExtractor(const BatchedStore& store, formid::shared::ErrorCallback onError,
                                     const size_t batchSize, const size_t progressInterval)
    : store_(store)
    , onError_(std::move(onError))
    , batchSize_(batchSize)
    , progressInterval_(progressInterval == 0 ? 1 : progressInterval) {}

auto TextListExtractor::ParseLine(const std::string_view line) -> std::optional<RecordRow> {
    const auto first = line.find('|');
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    const auto second = line.find('|', first + 1);
    if (second == std::string_view::npos || line.find('|', second + 1) != std::string_view::npos) {
        return std::nullopt;
    }

    return RecordRow{
        .plugin = std::string(formid::shared::Trim(line.substr(0, first))),
        .formId = std::string(formid::shared::Trim(line.substr(first + 1, second - first - 1))),
        .entry = std::string(formid::shared::Trim(line.substr(second + 1)))
    };
}

auto TextListExtractor::ProcessList(const fs::path& listPath, SqliteConnection& connection,
                                    const GameRelease release, const bool updateMode, const std::stop_token token,
                                    const formid::shared::ProgressCallback& progress) -> TextListResult {
    std::ifstream input(listPath, std::ios::binary);
    if (!input) {
        throw std::runtime_error(fmt::format("FormID list file not found: {}", listPath.string()));
    }

    std::error_code ec;
    const auto totalBytes = fs::file_size(listPath, ec);
    const auto report = [&](std::string message, std::optional<double> percent) {
        if (progress) {
            progress(ProgressReport{.message = std::move(message), .percent = percent});
        }
    };

    report("Starting processing...", 0.0);

    TextListResult result;
    BatchBuffer<RecordRow> batch(batchSize_);
    std::unordered_set<std::string> seenPlugins;
    // Unset until the first row, so an empty plugin column still starts a plugin.
    std::optional<std::string> currentPlugin;

    std::string line;
    auto firstLine = true;
    while (true) {
        ThrowIfCancelled(token);
        if (!std::getline(input, line)) {
            break;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (firstLine) {
            firstLine = false;
            if (line.starts_with(kUtf8Bom)) {
                line.erase(0, kUtf8Bom.size());
            }
        }

        auto row = ParseLine(line);
        if (!row) {
            continue;
        }

        ++result.recordCount;
        if (result.recordCount % progressInterval_ == 0) {
            const auto position = input.tellg();
            const auto percent = (ec || totalBytes == 0 || position < 0)
                ? 0.0
                : static_cast<double>(position) / static_cast<double>(totalBytes) * 100.0;
            report(fmt::format("Processing: {:.1f}% ({} records)", percent, result.recordCount), percent);
        }

        if (!currentPlugin || !formid::shared::EqualsIgnoreCase(*currentPlugin, row->plugin)) {
            // A batch never spans two plugins, so the clear below cannot delete rows of this run.
            flush_(connection, release, batch, token, result);
            currentPlugin = row->plugin;

            if (seenPlugins.insert(formid::shared::ToLower(row->plugin)).second && updateMode) {
                report(fmt::format("Processing plugin: {}", row->plugin), std::nullopt);
                store_.ClearPluginEntries(connection, release, row->plugin);
            }
        }

        if (batch.Add(std::move(*row))) {
            flush_(connection, release, batch, token, result);
        }
    }

    flush_(connection, release, batch, token, result);

    result.pluginCount = seenPlugins.size();
    report(fmt::format("Completed processing {} plugins ({} total records)", result.pluginCount, result.recordCount), 100.0);
    return result;
}

auto TextListExtractor::flush_(SqliteConnection& connection, const GameRelease release,
                               BatchBuffer<RecordRow>& batch, const std::stop_token& token,
                               TextListResult& result) -> void {
    if (batch.Empty()) {
        return;
    }

    try {
        store_.InsertBatch(connection, release, batch.Rows(), token);
        result.rowsInserted += batch.Size();
    } catch (const OperationCancelled&) {
        throw;
    } catch (const std::exception& error) {
        ++result.batchesDropped;
        spdlog::debug("Dropping {} rows of {}: {}", batch.Size(), batch.Rows().front().plugin, error.what());
        if (onError_) {
            onError_(ErrorReport{
                .message = fmt::format("Warning: Failed to insert batch for {}: {}", batch.Rows().front().plugin, error.what())
            });
        }
    }
    batch.Clear();
}
