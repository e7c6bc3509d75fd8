#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "GameRelease.hpp"

namespace formid::shared {

// One persisted row. formId is the six-digit hex id, not unique per plugin.
struct RecordRow {
    std::string plugin;
    std::string formId;
    std::string entry;

    bool operator==(const RecordRow&) const = default;
};

// Master addressing scheme of a plugin (how reference bits split between id and master index).
enum class MasterStyle {
    Full,
    Medium,
    Small,
};

struct PluginMasterStyle {
    std::string pluginName;
    MasterStyle style = MasterStyle::Full;
};

struct PluginListItem {
    std::string name;
    bool selected = false;
};

struct IngestionRequest {
    std::filesystem::path gameDirectory;
    std::filesystem::path databasePath;
    GameRelease release = GameRelease::SkyrimSE;
    std::vector<std::string> selectedPlugins;
    bool updateMode = false;
    bool dryRun = false;
    std::optional<std::filesystem::path> formIdListPath;  // set -> text list run, plugins ignored
};

struct ProgressReport {
    std::string message;
    std::optional<double> percent;  // 0-100
};

// informational = true for notes the user may ignore, false for actionable problems
struct ErrorReport {
    std::string message;
    bool informational = false;
};

using ProgressCallback = std::function<void(const ProgressReport&)>;
using ErrorCallback = std::function<void(const ErrorReport&)>;

} // namespace formid::shared
