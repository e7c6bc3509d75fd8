#include <args.hxx>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "services/BatchedStore.hpp"
#include "services/Cancellation.hpp"
#include "services/IngestionOrchestrator.hpp"
#include "services/LoadOrderProvider.hpp"
#include "services/LoadOrderResolver.hpp"
#include "services/PluginDecoder.hpp"
#include "services/PluginListScanner.hpp"
#include "../shared/GameRelease.hpp"
#include "../shared/config.hpp"
#include "../shared/entities.hpp"

#ifndef FORMID_INGEST_VERSION
#define FORMID_INGEST_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitPartialFailure = 2;
constexpr int kExitCancelled = 130;

volatile std::sig_atomic_t gInterrupted = 0;

void OnInterrupt(int)
{
    gInterrupted = 1;
}

std::unique_ptr<LoadOrderProvider> MakeLoadOrderProvider(const formid::shared::IngestConfiguration& config,
                                                         spdlog::logger& logger)
{
    if (config.loadOrderFile) {
        logger.info("Load order: {}", *config.loadOrderFile);
        return std::make_unique<PluginsTxtLoadOrderProvider>(*config.loadOrderFile);
    }
    logger.info("Load order: derived from the Data directory");
    return std::make_unique<DirectoryLoadOrderProvider>();
}

formid::shared::ErrorCallback MakeErrorSink(spdlog::logger& logger)
{
    return [&logger](const formid::shared::ErrorReport& report) {
        if (report.informational) {
            logger.info("{}", report.message);
        }
        else {
            logger.warn("{}", report.message);
        }
    };
}

std::vector<formid::shared::PluginListItem> ScanCandidates(const LoadOrderResolver& resolver,
                                                           const formid::shared::IngestConfiguration& config,
                                                           const fs::path& gameDirectory,
                                                           formid::shared::GameRelease release,
                                                           bool includeBasePlugins,
                                                           const std::string& filter,
                                                           spdlog::logger& logger)
{
    PluginListScanner scanner(resolver, MakeErrorSink(logger), config.scanPublishInterval);
    PluginCollection candidates;

    auto pending = scanner.RefreshList(gameDirectory, release, candidates, includeBasePlugins);

    using namespace std::chrono_literals;
    int logIntervalCount = 0;
    while (pending.wait_for(100ms) != std::future_status::ready) {
        // Destroying the scanner on unwind stops and joins its worker.
        if (gInterrupted) {
            logger.warn("Interrupt received, cancelling scan...");
            throw OperationCancelled();
        }
        // Log progress every 2 seconds
        if (++logIntervalCount % 20 == 0) {
            const auto progress = scanner.snapshot();
            logger.info("  Scanning: {}/{} listed plugins checked, {} candidates",
                        progress.processedFiles, progress.totalFiles, progress.candidatesFound);
        }
    }

    if (pending.get() != ScanResult::Published) {
        throw std::runtime_error("Plugin scan did not complete");
    }
    auto visible = candidates.Filtered(filter);
    if (!filter.empty()) {
        logger.info("Filter '{}' matches {} of {} candidates", filter, visible.size(), candidates.Size());
    }
    return visible;
}

} // namespace

int main(int argc, char* argv[])
{
    try {
        auto logger = spdlog::stdout_color_mt("formid-cli");
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
        logger->info("FormID Ingest CLI {}", FORMID_INGEST_VERSION);

        args::ArgumentParser parser("FormID Ingest CLI", "Extract FormID/label pairs from game plugins or a FormID list into SQLite.");
        args::HelpFlag helpFlag(parser, "help", "Show this help message", {'h', "help"});
        args::Flag versionFlag(parser, "version", "Print version", {"version"});
        args::Flag verboseFlag(parser, "verbose", "Enable debug logging", {'v', "verbose"});
        args::ValueFlag<std::string> releaseFlag(parser, "name", "Game release (e.g. SkyrimSE, Fallout4, Starfield)", {"release"});
        args::ValueFlag<std::string> gameFlag(parser, "path", "Game directory or its Data folder", {"game"});
        args::ValueFlag<std::string> dbFlag(parser, "file", "SQLite database to write", {"db"});
        args::ValueFlag<std::string> listFlag(parser, "file", "FormID list (plugin|formid|entry per line) instead of plugins", {"formid-list"});
        args::ValueFlagList<std::string> pluginFlags(parser, "name", "Plugin to process (repeatable)", {"plugin"});
        args::Flag allFlag(parser, "all", "Process every non-base plugin found in the load order", {"all"});
        args::Flag updateFlag(parser, "update", "Replace existing entries of each processed plugin", {"update"});
        args::Flag dryRunFlag(parser, "dry-run", "Report what would be done without touching files", {"dry-run"});
        args::Flag scanFlag(parser, "scan", "List candidate plugins and exit", {"scan"});
        args::Flag advancedFlag(parser, "advanced", "Include base game plugins in the candidate list", {"advanced"});
        args::ValueFlag<std::string> filterFlag(parser, "text", "Only keep candidates whose name contains this text (--scan, --all)", {"filter"});
        args::ValueFlag<std::string> loadOrderFlag(parser, "file", "plugins.txt to read the load order from", {"load-order"});
        args::ValueFlag<std::string> configFlag(parser, "file", "JSON configuration file", {"config"});

        try {
            parser.ParseCLI(argc, argv);
        } catch (const args::Completion& e) {
            std::cout << e.what();
            return kExitSuccess;
        } catch (const args::Help&) {
            std::cout << parser.Help() << std::endl;
            return kExitSuccess;
        } catch (const args::ParseError& error) {
            std::cerr << error.what() << std::endl;
            std::cerr << parser.Help() << std::endl;
            return kExitFailure;
        }

        if (versionFlag) {
            logger->info("Version: {}", FORMID_INGEST_VERSION);
            return kExitSuccess;
        }

        formid::shared::IngestConfiguration config;
        if (configFlag) {
            auto loaded = formid::shared::LoadConfiguration(args::get(configFlag));
            if (!loaded) {
                return kExitFailure;
            }
            config = std::move(*loaded);
        }
        if (loadOrderFlag) {
            config.loadOrderFile = args::get(loadOrderFlag);
        }
        logger->set_level(verboseFlag ? spdlog::level::debug : spdlog::level::from_str(config.logLevel));

        if (!releaseFlag) {
            logger->error("--release is required");
            std::cerr << parser.Help() << std::endl;
            return kExitFailure;
        }
        const auto release = formid::shared::ParseGameRelease(args::get(releaseFlag));
        if (!release) {
            logger->error("Unsupported game release: {}", args::get(releaseFlag));
            return kExitFailure;
        }

        std::signal(SIGINT, OnInterrupt);

        const auto provider = MakeLoadOrderProvider(config, *logger);
        const auto filter = filterFlag ? args::get(filterFlag) : std::string{};
        UnlinkedPluginDecoder decoder;

        if (scanFlag) {
            if (!gameFlag) {
                logger->error("--scan needs --game");
                return kExitFailure;
            }
            const LoadOrderResolver resolver(*provider, decoder);
            std::vector<formid::shared::PluginListItem> candidates;
            try {
                candidates = ScanCandidates(resolver, config, args::get(gameFlag), *release, args::get(advancedFlag), filter, *logger);
            } catch (const OperationCancelled&) {
                return kExitCancelled;
            }
            for (const auto& item : candidates) {
                std::cout << item.name << '\n';
            }
            return kExitSuccess;
        }

        formid::shared::IngestionRequest request{
            .release = *release,
            .updateMode = args::get(updateFlag),
            .dryRun = args::get(dryRunFlag)
        };
        request.databasePath = dbFlag
            ? fs::path(args::get(dbFlag))
            : fs::current_path() / fmt::format("{}.db", formid::shared::SafeTableName(*release));
        logger->info("Database: {}", request.databasePath.string());

        if (listFlag) {
            request.formIdListPath = fs::path(args::get(listFlag));
        }
        else {
            if (!gameFlag) {
                logger->error("Either --formid-list or --game is required");
                return kExitFailure;
            }
            request.gameDirectory = args::get(gameFlag);
            request.selectedPlugins = args::get(pluginFlags);

            if (allFlag) {
                const LoadOrderResolver resolver(*provider, decoder);
                PluginCollection candidates;
                try {
                    candidates.Replace(ScanCandidates(resolver, config, request.gameDirectory, *release, args::get(advancedFlag), filter, *logger));
                } catch (const OperationCancelled&) {
                    return kExitCancelled;
                }
                candidates.SelectAll();
                request.selectedPlugins = candidates.SelectedNames();
            }
            if (request.selectedPlugins.empty()) {
                logger->error("No plugins selected; pass --plugin or --all");
                return kExitFailure;
            }
        }

        BatchedStore store(config.store);
        IngestionOrchestrator orchestrator(store, *provider, decoder, config, MakeErrorSink(*logger));

        // Keeps cancelling after an interrupt so one that lands before Run() starts is not lost.
        std::jthread interruptWatcher([&orchestrator, &logger](std::stop_token stop) {
            using namespace std::chrono_literals;
            bool warned = false;
            while (!stop.stop_requested()) {
                if (gInterrupted) {
                    if (!warned) {
                        logger->warn("Interrupt received, cancelling...");
                        warned = true;
                    }
                    orchestrator.CancelProcessing();
                }
                std::this_thread::sleep_for(100ms);
            }
        });

        const auto onProgress = [&logger](const formid::shared::ProgressReport& progress) {
            if (progress.percent) {
                logger->info("[{:5.1f}%] {}", *progress.percent, progress.message);
            }
            else {
                logger->info("{}", progress.message);
            }
        };

        if (gInterrupted) {
            return kExitCancelled;
        }

        try {
            const auto report = orchestrator.Run(request, onProgress);
            logger->info("{} rows inserted", report.rowsInserted);
            return report.status == RunStatus::CompletedWithFailures ? kExitPartialFailure : kExitSuccess;
        } catch (const OperationCancelled&) {
            return kExitCancelled;
        }
    } catch (const std::exception& error) {
        std::cerr << "Fatal error: " << error.what() << std::endl;
        return kExitFailure;
    }
}
