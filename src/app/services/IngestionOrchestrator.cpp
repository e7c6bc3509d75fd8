#include "IngestionOrchestrator.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "Cancellation.hpp"
#include "GameRelease.hpp"

using formid::shared::ErrorReport;
using formid::shared::IngestionRequest;
using formid::shared::ProgressCallback;
using formid::shared::ProgressReport;

namespace {
    auto Notify(const ProgressCallback& progress, std::string message, std::optional<double> percent = std::nullopt) -> void {
        if (progress) {
            progress(ProgressReport{.message = std::move(message), .percent = percent});
        }
    }
}

auto RunSupervisor::Begin() -> std::shared_ptr<std::stop_source> {
    auto next = std::make_shared<std::stop_source>();
    std::lock_guard lock(mutex_);
    if (current_) {
        current_->request_stop();
    }
    current_ = next;
    return next;
}

auto RunSupervisor::Cancel() -> bool {
    std::lock_guard lock(mutex_);
    if (!current_) {
        return false;
    }
    return current_->request_stop();
}

auto RunSupervisor::Release(const std::shared_ptr<std::stop_source>& handle) -> void {
    std::lock_guard lock(mutex_);
    if (current_ == handle) {
        current_.reset();
    }
}

auto RunSupervisor::IsActive() const -> bool {
    std::lock_guard lock(mutex_);
    return current_ != nullptr;
}

IngestionOrchestrator::IngestionOrchestrator(const BatchedStore& store, const LoadOrderProvider& provider,
                                             PluginDecoder& decoder, formid::shared::IngestConfiguration config,
                                             formid::shared::ErrorCallback onError)
    : store_(store)
    , config_(std::move(config))
    , onError_(std::move(onError))
    , resolver_(provider, decoder)
    , extractor_(store, decoder, onError_, config_.pluginBatchSize)
    , textExtractor_(store, onError_, config_.textBatchSize, config_.progressInterval) {}

auto IngestionOrchestrator::Run(const IngestionRequest& request, const ProgressCallback& progress) -> RunReport {
    const auto handle = supervisor_.Begin();
    const auto token = handle->get_token();

    struct ReleaseOnExit {
        RunSupervisor& supervisor;
        const std::shared_ptr<std::stop_source>& handle;
        ~ReleaseOnExit() { supervisor.Release(handle); }
    } releaseOnExit{supervisor_, handle};

    if (request.dryRun) {
        return dryRun_(request, progress);
    }

    try {
        store_.InitializeSchema(request.databasePath, request.release);
        auto connection = store_.OpenConnection(request.databasePath);

        if (request.formIdListPath) {
            return runTextList_(request, connection, token, progress);
        }
        return runPlugins_(request, connection, token, progress);

    } catch (const OperationCancelled&) {
        Notify(progress, "Processing cancelled.");
        throw;
    } catch (const std::exception& error) {
        Notify(progress, fmt::format("Error during processing: {}", error.what()));
        throw;
    }
}

auto IngestionOrchestrator::CancelProcessing() -> void {
    if (supervisor_.Cancel()) {
        spdlog::debug("Cancellation requested");
    }
}

auto IngestionOrchestrator::IsRunning() const -> bool {
    return supervisor_.IsActive();
}

auto IngestionOrchestrator::dryRun_(const IngestionRequest& request, const ProgressCallback& progress) const -> RunReport {
    if (request.formIdListPath) {
        Notify(progress, fmt::format("Would process FormID list file: {}", request.formIdListPath->string()));
        return RunReport{.status = RunStatus::DryRun};
    }

    for (const auto& plugin : request.selectedPlugins) {
        Notify(progress, fmt::format("Would process {}", plugin));
        if (request.updateMode) {
            Notify(progress, fmt::format("Would delete existing entries for {}", plugin));
        }
    }
    return RunReport{.status = RunStatus::DryRun};
}

auto IngestionOrchestrator::runTextList_(const IngestionRequest& request, SqliteConnection& connection,
                                         const std::stop_token& token, const ProgressCallback& progress) -> RunReport {
    const auto result = textExtractor_.ProcessList(*request.formIdListPath, connection, request.release,
                                                   request.updateMode, token, progress);
    ThrowIfCancelled(token);

    optimize_(connection);
    Notify(progress, "Processing completed successfully!", 100.0);
    return RunReport{
        .status = RunStatus::Succeeded,
        .succeeded = result.pluginCount,
        .rowsInserted = result.rowsInserted
    };
}

auto IngestionOrchestrator::runPlugins_(const IngestionRequest& request, SqliteConnection& connection,
                                        const std::stop_token& token, const ProgressCallback& progress) -> RunReport {
    Notify(progress, "Initializing plugin processing...", 0.0);

    const auto dataPath = formid::shared::ResolveDataPath(request.gameDirectory);
    const auto loadOrder = resolver_.BuildSnapshot(request.release, dataPath, true);

    RunReport report;
    const auto total = request.selectedPlugins.size();
    for (size_t i = 0; i < total; ++i) {
        ThrowIfCancelled(token);

        const auto& plugin = request.selectedPlugins[i];
        const auto percent = static_cast<double>(i + 1) / static_cast<double>(total) * 100.0;
        Notify(progress, fmt::format("Processing plugin {} of {}: {}", i + 1, total, plugin), percent);

        try {
            const auto result = extractor_.ProcessPlugin(request.gameDirectory, connection, request.release,
                                                         plugin, loadOrder, request.updateMode, token);
            report.rowsInserted += result.rowsInserted;
            ++report.succeeded;
        } catch (const OperationCancelled&) {
            throw;
        } catch (const std::exception& error) {
            ++report.failed;
            report_(fmt::format("Failed to process plugin {}: {}", plugin, error.what()));
            Notify(progress, fmt::format("Error processing plugin {}: {}", plugin, error.what()));
            report_("Continuing with next plugin...", true);
        }
    }

    ThrowIfCancelled(token);
    optimize_(connection);

    if (report.failed > 0) {
        report.status = RunStatus::CompletedWithFailures;
        Notify(progress, fmt::format("Processing completed with {} successful and {} failed plugins.",
                                     report.succeeded, report.failed), 100.0);
    } else {
        report.status = RunStatus::Succeeded;
        Notify(progress, "Processing completed successfully!", 100.0);
    }
    return report;
}

auto IngestionOrchestrator::optimize_(SqliteConnection& connection) const -> void {
    try {
        store_.Optimize(connection);
    } catch (const DatabaseError& error) {
        report_(fmt::format("Warning: Failed to optimize database: {}", error.what()));
    }
}

auto IngestionOrchestrator::report_(std::string message, const bool informational) const -> void {
    spdlog::debug("{}", message);
    if (onError_) {
        onError_(ErrorReport{.message = std::move(message), .informational = informational});
    }
}
