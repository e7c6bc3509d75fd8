#include "RecordExtractor.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "Cancellation.hpp"
#include "GameRelease.hpp"
#include "Utils.hpp"

namespace fs = std::filesystem;
using formid::shared::ErrorReport;
using formid::shared::GameRelease;
using formid::shared::RecordRow;

auto IsIgnorableRecordError(const std::string_view message) -> bool {
    const auto lowered = formid::shared::ToLower(message);
    return std::ranges::any_of(kIgnorableRecordErrors, [&](const std::string_view pattern) {
        return lowered.find(formid::shared::ToLower(pattern)) != std::string::npos;
    });
}

RecordExtractor::RecordExtractor(const BatchedStore& store, PluginDecoder& decoder,
                                 formid::shared::ErrorCallback onError, const size_t batchSize)
    : store_(store)
    , decoder_(decoder)
    , onError_(std::move(onError))
    , batchSize_(batchSize) {}

auto RecordExtractor::ProcessPlugin(const fs::path& gameDirectory, SqliteConnection& connection,
                                    const GameRelease release, const std::string_view pluginName,
                                    const LoadOrderSnapshot& loadOrder, const bool updateMode,
                                    const std::stop_token token) -> PluginExtractionResult {
    PluginExtractionResult result;

    const auto listedName = loadOrder.ResolvePluginName(pluginName);
    if (!listedName) {
        report_(fmt::format("Warning: Could not find plugin in load order: {}", pluginName));
        result.outcome = ExtractionOutcome::NotInLoadOrder;
        return result;
    }

    const std::string name(pluginName);
    const auto pluginPath = formid::shared::ResolveDataPath(gameDirectory) / *listedName;
    std::error_code ec;
    if (!fs::is_regular_file(pluginPath, ec)) {
        report_(fmt::format("Warning: Could not find plugin file: {}", pluginPath.string()));
        result.outcome = ExtractionOutcome::FileMissing;
        return result;
    }

    SqliteTransaction transaction(connection);
    try {
        if (updateMode) {
            store_.ClearPluginEntries(connection, release, name);
        }

        // Opening the plugin is one uninterruptible step; cancellation is seen before and after it.
        ThrowIfCancelled(token);
        auto stream = decoder_.Open(pluginPath, release, loadOrder.ReadParameters());
        ThrowIfCancelled(token);

        extractRecords_(connection, release, name, *stream, token, result);
        transaction.Commit();
    } catch (const OperationCancelled&) {
        transaction.Rollback();
        throw;
    } catch (const std::exception& error) {
        report_(fmt::format("Error processing {}: {}", name, error.what()));
        transaction.Rollback();
        throw;
    }

    spdlog::debug("{}: {} records read, {} rows inserted, {} skipped", name,
                  result.recordsRead, result.rowsInserted, result.recordsSkipped);
    return result;
}

auto RecordExtractor::CachedAccessorCount() const -> size_t {
    std::lock_guard lock(accessorMutex_);
    return accessors_.size();
}

auto RecordExtractor::extractRecords_(SqliteConnection& connection, const GameRelease release,
                                      const std::string& pluginName, RecordStream& stream,
                                      const std::stop_token& token, PluginExtractionResult& result) -> void {
    BatchBuffer<RecordRow> batch(batchSize_);

    while (const auto* record = stream.Next()) {
        ThrowIfCancelled(token);
        ++result.recordsRead;

        try {
            std::string formId;
            try {
                formId = formid::shared::FormatFormId(record->FormKeyId());
            } catch (const std::exception& error) {
                spdlog::trace("{}: skipping record without readable id: {}", pluginName, error.what());
                ++result.recordsSkipped;
                continue;
            }

            std::string label;
            try {
                label = resolveLabel_(*record, formId);
            } catch (const std::exception&) {
                label = fmt::format("[{}_{}]", record->TypeName(), formId);
            }

            const auto full = batch.Add(RecordRow{
                .plugin = pluginName,
                .formId = std::move(formId),
                .entry = formid::shared::SanitizeString(label)
            });
            if (full) {
                flush_(connection, release, pluginName, batch, token, result, false);
            }
        } catch (const OperationCancelled&) {
            throw;
        } catch (const std::exception& error) {
            ++result.recordsSkipped;
            if (!IsIgnorableRecordError(error.what())) {
                report_(fmt::format("Warning: Error processing record in {}: {}", pluginName, error.what()), true);
            }
        }
    }

    if (!batch.Empty()) {
        flush_(connection, release, pluginName, batch, token, result, true);
    }
}

auto RecordExtractor::flush_(SqliteConnection& connection, const GameRelease release, const std::string& pluginName,
                             BatchBuffer<RecordRow>& batch, const std::stop_token& token,
                             PluginExtractionResult& result, const bool finalBatch) -> void {
    try {
        store_.InsertBatch(connection, release, batch.Rows(), token);
        result.rowsInserted += batch.Size();
    } catch (const OperationCancelled&) {
        throw;
    } catch (const std::exception& error) {
        ++result.batchesDropped;
        report_(fmt::format("Warning: Failed to insert {} in {}: {}",
                            finalBatch ? "final batch" : "batch", pluginName, error.what()));
    }
    batch.Clear();
}

auto RecordExtractor::resolveLabel_(const DecodedRecord& record, const std::string& formId) -> std::string {
    if (auto editorId = record.EditorId(); editorId && !editorId->empty()) {
        return *editorId;
    }

    if (const auto* named = dynamic_cast<const NamedRecord*>(&record)) {
        if (auto name = named->Name(); name && !name->empty()) {
            return *name;
        }
    }

    if (const auto& accessor = accessorFor_(record)) {
        if (auto name = accessor(record); name && !name->empty()) {
            return *name;
        }
    }

    return fmt::format("[{}_{}]", record.TypeName(), formId);
}

auto RecordExtractor::accessorFor_(const DecodedRecord& record) -> const LabelAccessor& {
    const std::type_index type(typeid(record));
    std::lock_guard lock(accessorMutex_);
    if (const auto it = accessors_.find(type); it != accessors_.end()) {
        return it->second;
    }
    LabelAccessor accessor;
    try {
        accessor = decoder_.ResolveLabelAccessor(record);
    } catch (const std::exception& error) {
        spdlog::debug("No label accessor for {}: {}", record.TypeName(), error.what());
    }
    return accessors_.emplace(type, std::move(accessor)).first->second;
}

auto RecordExtractor::report_(std::string message, const bool informational) const -> void {
    if (onError_) {
        onError_(ErrorReport{.message = std::move(message), .informational = informational});
    }
}
