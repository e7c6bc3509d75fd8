#include "PluginListScanner.hpp"

#include <unordered_set>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "GameRelease.hpp"
#include "Utils.hpp"

namespace fs = std::filesystem;
using formid::shared::ErrorReport;
using formid::shared::PluginListItem;

auto PluginCollection::Replace(std::vector<PluginListItem> items) -> void {
    std::lock_guard lock(mutex_);
    items_ = std::move(items);
}

auto PluginCollection::Clear() -> void {
    std::lock_guard lock(mutex_);
    items_.clear();
}

auto PluginCollection::Items() const -> std::vector<PluginListItem> {
    std::lock_guard lock(mutex_);
    return items_;
}

auto PluginCollection::Size() const -> size_t {
    std::lock_guard lock(mutex_);
    return items_.size();
}

auto PluginCollection::SelectAll() -> void {
    std::lock_guard lock(mutex_);
    for (auto& item : items_) {
        item.selected = true;
    }
}

auto PluginCollection::SelectNone() -> void {
    std::lock_guard lock(mutex_);
    for (auto& item : items_) {
        item.selected = false;
    }
}

auto PluginCollection::SetSelected(const std::string_view pluginName, const bool selected) -> bool {
    std::lock_guard lock(mutex_);
    auto found = false;
    for (auto& item : items_) {
        if (formid::shared::EqualsIgnoreCase(item.name, pluginName)) {
            item.selected = selected;
            found = true;
        }
    }
    return found;
}

auto PluginCollection::SelectedNames() const -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    std::vector<std::string> names;
    for (const auto& item : items_) {
        if (item.selected) {
            names.push_back(item.name);
        }
    }
    return names;
}

auto PluginCollection::Filtered(const std::string_view filter) const -> std::vector<PluginListItem> {
    std::lock_guard lock(mutex_);
    if (formid::shared::Trim(filter).empty()) {
        return items_;
    }

    const auto needle = formid::shared::ToLower(filter);
    std::vector<PluginListItem> filtered;
    for (const auto& item : items_) {
        if (formid::shared::ToLower(item.name).find(needle) != std::string::npos) {
            filtered.push_back(item);
        }
    }
    return filtered;
}

PluginListScanner::PluginListScanner(const LoadOrderResolver& resolver, formid::shared::ErrorCallback onMessage,
                                     const size_t publishInterval, FileExists fileExists)
    : resolver_(resolver)
    , onMessage_(std::move(onMessage))
    , publishInterval_(publishInterval == 0 ? 1 : publishInterval)
    , fileExists_(std::move(fileExists)) {
    if (!fileExists_) {
        fileExists_ = [](const fs::path& path) {
            std::error_code ec;
            return fs::is_regular_file(path, ec);
        };
    }
}

PluginListScanner::~PluginListScanner() {
    stop_ = true;
    std::lock_guard lock(workersMutex_);
    for (auto& worker : workers_) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

auto PluginListScanner::RefreshList(const fs::path& gameDirectory, const formid::shared::GameRelease release,
                                    PluginCollection& target, const bool includeBasePlugins) -> std::future<ScanResult> {
    const auto generation = ++generation_;

    auto promise = std::make_shared<std::promise<ScanResult>>();
    auto result = promise->get_future();
    auto finished = std::make_shared<std::atomic_bool>(false);

    std::lock_guard lock(workersMutex_);
    reapWorkers_();
    workers_.push_back(Worker{
        .thread = std::thread([this, promise, finished, generation, gameDirectory, release, &target, includeBasePlugins] {
            try {
                promise->set_value(worker_(generation, gameDirectory, release, target, includeBasePlugins));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
            *finished = true;
        }),
        .finished = finished
    });
    return result;
}

auto PluginListScanner::snapshot() const -> ScanProgress {
    std::lock_guard lock(progressMutex_);
    return progress_;
}

auto PluginListScanner::worker_(const uint64_t generation, fs::path gameDirectory, const formid::shared::GameRelease release,
                                PluginCollection& target, const bool includeBasePlugins) -> ScanResult {
    try {
        const auto dataPath = formid::shared::ResolveDataPath(gameDirectory);
        const auto listed = resolver_.GetListedPluginNames(release, dataPath);

        ScanProgress progress{.totalFiles = listed.size()};
        updateProgress_(generation, progress);

        std::vector<PluginListItem> items;
        std::unordered_set<std::string> seen;
        for (const auto& name : listed) {
            if (stop_) {
                return ScanResult::Superseded;
            }

            ++progress.processedFiles;
            progress.currentFile = name;

            if (!includeBasePlugins && formid::shared::IsBaseGamePlugin(release, name)) {
                continue;
            }
            if (!seen.insert(formid::shared::ToLower(name)).second) {
                continue;
            }
            if (!fileExists_(dataPath / name)) {
                spdlog::debug("Skipping {}: not found in {}", name, dataPath.string());
                continue;
            }

            items.push_back(PluginListItem{.name = name, .selected = false});
            progress.candidatesFound = items.size();
            if (progress.processedFiles % publishInterval_ == 0) {
                updateProgress_(generation, progress);
            }
        }

        const auto count = items.size();
        {
            std::lock_guard lock(publishMutex_);
            if (generation != generation_) {
                spdlog::debug("Scan {} superseded by {}, discarding {} candidates", generation, generation_.load(), count);
                return ScanResult::Superseded;
            }
            target.Replace(std::move(items));
        }

        progress.currentFile.clear();
        progress.done = true;
        updateProgress_(generation, progress);

        spdlog::debug("Scan {} published {} candidates", generation, count);
        if (onMessage_) {
            onMessage_(ErrorReport{.message = fmt::format("Loaded {} non-base game plugins", count), .informational = true});
        }
        return ScanResult::Published;

    } catch (const std::exception& error) {
        {
            std::lock_guard lock(publishMutex_);
            if (generation != generation_) {
                spdlog::debug("Scan {} failed after being superseded: {}", generation, error.what());
                return ScanResult::Superseded;
            }
            target.Clear();
        }

        {
            std::lock_guard lock(progressMutex_);
            progress_.done = true;
            progress_.currentFile.clear();
        }

        spdlog::debug("Scan {} failed: {}", generation, error.what());
        if (onMessage_) {
            onMessage_(ErrorReport{.message = fmt::format("Failed to load plugins: {}", error.what())});
            onMessage_(ErrorReport{.message = "Ensure you selected the correct game Data directory"});
        }
        return ScanResult::Failed;
    }
}

auto PluginListScanner::updateProgress_(const uint64_t generation, const ScanProgress& progress) -> void {
    std::lock_guard lock(progressMutex_);
    if (generation == generation_) {
        progress_ = progress;
    }
}

auto PluginListScanner::reapWorkers_() -> void {
    std::erase_if(workers_, [](Worker& worker) {
        if (!*worker.finished) {
            return false;
        }
        worker.thread.join();
        return true;
    });
}
