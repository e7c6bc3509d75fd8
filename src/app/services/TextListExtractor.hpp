#pragma once
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string_view>

#include "BatchBuffer.hpp"
#include "BatchedStore.hpp"
#include "entities.hpp"

struct TextListResult {
    size_t recordCount = 0;
    size_t pluginCount = 0;
    size_t rowsInserted = 0;
    size_t batchesDropped = 0;
};

// Streams a "plugin|formid|entry" export into the release table.
class TextListExtractor {
public:
    TextListExtractor(const BatchedStore& store, formid::shared::ErrorCallback onError,
                      size_t batchSize = 10000, size_t progressInterval = 1000);

    // Throws std::runtime_error when the file cannot be opened, OperationCancelled on cancellation.
    auto ProcessList(const std::filesystem::path& listPath, SqliteConnection& connection,
                     formid::shared::GameRelease release, bool updateMode, std::stop_token token,
                     const formid::shared::ProgressCallback& progress = {}) -> TextListResult;

    // Exactly two '|' separators, fields trimmed. Blank lines and other shapes yield nullopt.
    [[nodiscard]] static auto ParseLine(std::string_view line) -> std::optional<formid::shared::RecordRow>;

private:
    auto flush_(SqliteConnection& connection, formid::shared::GameRelease release,
                BatchBuffer<formid::shared::RecordRow>& batch, const std::stop_token& token,
                TextListResult& result) -> void;

private:
    const BatchedStore& store_;
    formid::shared::ErrorCallback onError_;
    size_t batchSize_;
    size_t progressInterval_;
};
