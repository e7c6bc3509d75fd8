#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "LoadOrderResolver.hpp"
#include "entities.hpp"

// Selectable candidate list shared between the scanner thread and its owner.
class PluginCollection {
public:
    auto Replace(std::vector<formid::shared::PluginListItem> items) -> void;
    auto Clear() -> void;

    [[nodiscard]] auto Items() const -> std::vector<formid::shared::PluginListItem>;
    [[nodiscard]] auto Size() const -> size_t;

    auto SelectAll() -> void;
    auto SelectNone() -> void;
    // Returns false when no candidate has that name.
    auto SetSelected(std::string_view pluginName, bool selected) -> bool;
    [[nodiscard]] auto SelectedNames() const -> std::vector<std::string>;
    // Candidates whose name contains filter, ignoring case. A blank filter keeps every candidate.
    [[nodiscard]] auto Filtered(std::string_view filter) const -> std::vector<formid::shared::PluginListItem>;

private:
    mutable std::mutex mutex_;
    std::vector<formid::shared::PluginListItem> items_;
};

struct ScanProgress {
    size_t totalFiles = 0;
    size_t processedFiles = 0;
    size_t candidatesFound = 0;
    std::string currentFile;
    bool done = false;
};

enum class ScanResult {
    Published,
    Superseded,
    Failed,
};

// Builds the candidate plugin list off the calling thread. Every request takes a
// generation number; only the most recently started request may publish.
// Callbacks run on the scan thread. The target collection must outlive the future.
class PluginListScanner {
public:
    using FileExists = std::function<bool(const std::filesystem::path&)>;

    PluginListScanner(const LoadOrderResolver& resolver, formid::shared::ErrorCallback onMessage,
                      size_t publishInterval = 10, FileExists fileExists = {});
    ~PluginListScanner();

    PluginListScanner(const PluginListScanner&) = delete;
    PluginListScanner& operator=(const PluginListScanner&) = delete;

    auto RefreshList(const std::filesystem::path& gameDirectory, formid::shared::GameRelease release,
                     PluginCollection& target, bool includeBasePlugins) -> std::future<ScanResult>;

    [[nodiscard]] auto snapshot() const -> ScanProgress;
    [[nodiscard]] auto generation() const -> uint64_t { return generation_; }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic_bool> finished;
    };

    auto worker_(uint64_t generation, std::filesystem::path gameDirectory, formid::shared::GameRelease release,
                 PluginCollection& target, bool includeBasePlugins) -> ScanResult;
    auto updateProgress_(uint64_t generation, const ScanProgress& progress) -> void;
    auto reapWorkers_() -> void;

private:
    const LoadOrderResolver& resolver_;
    formid::shared::ErrorCallback onMessage_;
    size_t publishInterval_;
    FileExists fileExists_;

    std::atomic<uint64_t> generation_{0};
    std::atomic_bool stop_{false};

    std::mutex publishMutex_;
    mutable std::mutex progressMutex_;
    ScanProgress progress_;

    std::mutex workersMutex_;
    std::vector<Worker> workers_;
};
