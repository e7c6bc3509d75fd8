#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "LoadOrderProvider.hpp"
#include "PluginDecoder.hpp"
#include "entities.hpp"

// Listed plugin names exactly as the provider reported them, plus a
// case-insensitive membership index and, for releases with separated master
// load orders, the master style of every listed plugin present on disk.
class LoadOrderSnapshot {
public:
    LoadOrderSnapshot() = default;
    explicit LoadOrderSnapshot(std::vector<std::string> listedPluginNames,
                               std::optional<std::vector<formid::shared::PluginMasterStyle>> masterStyles = std::nullopt);

    [[nodiscard]] auto ListedPluginNames() const -> const std::vector<std::string>& { return listed_; }
    [[nodiscard]] auto MasterStyles() const -> const std::optional<std::vector<formid::shared::PluginMasterStyle>>& { return masterStyles_; }

    [[nodiscard]] auto ContainsPlugin(std::string_view pluginName) const -> bool;
    // Listed spelling of pluginName, matched case-insensitively on the whole file name.
    [[nodiscard]] auto ResolvePluginName(std::string_view pluginName) const -> std::optional<std::string>;

    [[nodiscard]] auto ReadParameters() const -> DecodeParameters;

private:
    std::vector<std::string> listed_;
    std::unordered_map<std::string, std::string> byLowerName_;
    std::optional<std::vector<formid::shared::PluginMasterStyle>> masterStyles_;
};

class LoadOrderResolver {
public:
    using FileExists = std::function<bool(const std::filesystem::path&)>;

    LoadOrderResolver(const LoadOrderProvider& provider, PluginDecoder& decoder, FileExists fileExists = {});

    // Provider exceptions propagate unchanged.
    [[nodiscard]] auto BuildSnapshot(formid::shared::GameRelease release, const std::filesystem::path& dataPath,
                                     bool includeMasterInfo) const -> LoadOrderSnapshot;

    [[nodiscard]] auto GetListedPluginNames(formid::shared::GameRelease release,
                                            const std::filesystem::path& dataPath) const -> std::vector<std::string>;

private:
    const LoadOrderProvider& provider_;
    PluginDecoder& decoder_;
    FileExists fileExists_;
};
