#pragma once
#include <memory>
#include <mutex>
#include <stop_token>

#include "BatchedStore.hpp"
#include "LoadOrderProvider.hpp"
#include "LoadOrderResolver.hpp"
#include "PluginDecoder.hpp"
#include "RecordExtractor.hpp"
#include "TextListExtractor.hpp"
#include "config.hpp"
#include "entities.hpp"

// Holds at most one live stop source. Beginning a run cancels the previous one.
class RunSupervisor {
public:
    auto Begin() -> std::shared_ptr<std::stop_source>;
    auto Cancel() -> bool;
    // Drops handle if it is still the current one.
    auto Release(const std::shared_ptr<std::stop_source>& handle) -> void;
    [[nodiscard]] auto IsActive() const -> bool;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<std::stop_source> current_;
};

enum class RunStatus {
    Succeeded,
    CompletedWithFailures,
    DryRun,
};

struct RunReport {
    RunStatus status = RunStatus::Succeeded;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t rowsInserted = 0;
};

class IngestionOrchestrator {
public:
    IngestionOrchestrator(const BatchedStore& store, const LoadOrderProvider& provider, PluginDecoder& decoder,
                          formid::shared::IngestConfiguration config, formid::shared::ErrorCallback onError);

    // Cancellation reports "Processing cancelled." and rethrows OperationCancelled.
    // Schema, connection, load order and text input failures propagate.
    auto Run(const formid::shared::IngestionRequest& request,
             const formid::shared::ProgressCallback& progress = {}) -> RunReport;

    // No effect while idle.
    auto CancelProcessing() -> void;
    [[nodiscard]] auto IsRunning() const -> bool;

private:
    auto dryRun_(const formid::shared::IngestionRequest& request,
                 const formid::shared::ProgressCallback& progress) const -> RunReport;
    auto runTextList_(const formid::shared::IngestionRequest& request, SqliteConnection& connection,
                      const std::stop_token& token, const formid::shared::ProgressCallback& progress) -> RunReport;
    auto runPlugins_(const formid::shared::IngestionRequest& request, SqliteConnection& connection,
                     const std::stop_token& token, const formid::shared::ProgressCallback& progress) -> RunReport;
    auto optimize_(SqliteConnection& connection) const -> void;
    auto report_(std::string message, bool informational = false) const -> void;

private:
    const BatchedStore& store_;
    formid::shared::IngestConfiguration config_;
    formid::shared::ErrorCallback onError_;
    LoadOrderResolver resolver_;
    RecordExtractor extractor_;
    TextListExtractor textExtractor_;
    RunSupervisor supervisor_;
};
