#pragma once
#include <array>
#include <filesystem>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>

#include "BatchBuffer.hpp"
#include "BatchedStore.hpp"
#include "LoadOrderResolver.hpp"
#include "PluginDecoder.hpp"
#include "entities.hpp"

enum class ExtractionOutcome {
    Processed,
    NotInLoadOrder,
    FileMissing,
};

struct PluginExtractionResult {
    ExtractionOutcome outcome = ExtractionOutcome::Processed;
    size_t recordsRead = 0;
    size_t rowsInserted = 0;
    size_t recordsSkipped = 0;
    size_t batchesDropped = 0;
};

// Substrings of decoder messages that describe known-benign malformed subrecords.
constexpr std::array<std::string_view, 7> kIgnorableRecordErrors{
    "KSIZ",
    "KWDA",
    "Expected EDID",
    "List with a non zero counter",
    "Unexpected record type",
    "Failed to parse record header",
    "Object reference not set to an instance",
};

[[nodiscard]] auto IsIgnorableRecordError(std::string_view message) -> bool;

// Decodes one plugin into (formid, label) rows. The per-type label accessor
// cache lives as long as the extractor, so reuse one instance across plugins.
class RecordExtractor {
public:
    RecordExtractor(const BatchedStore& store, PluginDecoder& decoder,
                    formid::shared::ErrorCallback onError, size_t batchSize = 1000);

    // Plugin-wide failures are reported with the plugin name and rethrown after
    // rollback. A plugin that is not listed or not on disk is reported and skipped.
    auto ProcessPlugin(const std::filesystem::path& gameDirectory, SqliteConnection& connection,
                       formid::shared::GameRelease release, std::string_view pluginName,
                       const LoadOrderSnapshot& loadOrder, bool updateMode,
                       std::stop_token token) -> PluginExtractionResult;

    [[nodiscard]] auto CachedAccessorCount() const -> size_t;

private:
    auto extractRecords_(SqliteConnection& connection, formid::shared::GameRelease release,
                         const std::string& pluginName, RecordStream& stream,
                         const std::stop_token& token, PluginExtractionResult& result) -> void;
    auto flush_(SqliteConnection& connection, formid::shared::GameRelease release, const std::string& pluginName,
                BatchBuffer<formid::shared::RecordRow>& batch, const std::stop_token& token,
                PluginExtractionResult& result, bool finalBatch) -> void;
    auto resolveLabel_(const DecodedRecord& record, const std::string& formId) -> std::string;
    auto accessorFor_(const DecodedRecord& record) -> const LabelAccessor&;
    auto report_(std::string message, bool informational = false) const -> void;

private:
    const BatchedStore& store_;
    PluginDecoder& decoder_;
    formid::shared::ErrorCallback onError_;
    size_t batchSize_;

    mutable std::mutex accessorMutex_;
    std::unordered_map<std::type_index, LabelAccessor> accessors_;
};
