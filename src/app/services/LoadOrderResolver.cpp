#include "LoadOrderResolver.hpp"

#include <spdlog/spdlog.h>

#include "Utils.hpp"

namespace fs = std::filesystem;
using formid::shared::PluginMasterStyle;
using formid::shared::ToLower;

LoadOrderSnapshot::LoadOrderSnapshot(std::vector<std::string> listedPluginNames,
                                     std::optional<std::vector<PluginMasterStyle>> masterStyles)
    : listed_(std::move(listedPluginNames))
    , masterStyles_(std::move(masterStyles)) {
    for (const auto& name : listed_) {
        byLowerName_.try_emplace(ToLower(name), name);
    }
}

auto LoadOrderSnapshot::ContainsPlugin(const std::string_view pluginName) const -> bool {
    return byLowerName_.contains(ToLower(pluginName));
}

auto LoadOrderSnapshot::ResolvePluginName(const std::string_view pluginName) const -> std::optional<std::string> {
    if (const auto it = byLowerName_.find(ToLower(pluginName)); it != byLowerName_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto LoadOrderSnapshot::ReadParameters() const -> DecodeParameters {
    return DecodeParameters{
        .masterStyles = masterStyles_.value_or(std::vector<PluginMasterStyle>{})
    };
}

LoadOrderResolver::LoadOrderResolver(const LoadOrderProvider& provider, PluginDecoder& decoder, FileExists fileExists)
    : provider_(provider)
    , decoder_(decoder)
    , fileExists_(std::move(fileExists)) {
    if (!fileExists_) {
        fileExists_ = [](const fs::path& path) {
            std::error_code ec;
            return fs::exists(path, ec);
        };
    }
}

auto LoadOrderResolver::BuildSnapshot(const formid::shared::GameRelease release, const fs::path& dataPath,
                                      const bool includeMasterInfo) const -> LoadOrderSnapshot {
    auto listed = provider_.Listings(release, dataPath);

    if (!includeMasterInfo || !formid::shared::UsesSeparatedMasterLoadOrders(release)) {
        return LoadOrderSnapshot(std::move(listed));
    }

    std::vector<PluginMasterStyle> masterStyles;
    masterStyles.reserve(listed.size());
    for (const auto& name : listed) {
        const auto pluginPath = dataPath / name;
        // Listed but not installed.
        if (!fileExists_(pluginPath)) {
            continue;
        }
        try {
            masterStyles.push_back(PluginMasterStyle{
                .pluginName = name,
                .style = decoder_.ReadMasterStyle(pluginPath, release)
            });
        } catch (const DecodeError& error) {
            spdlog::warn("Could not read master style of {}: {}", name, error.what());
        }
    }

    spdlog::debug("Load order snapshot: {} listed, {} master styles", listed.size(), masterStyles.size());
    return LoadOrderSnapshot(std::move(listed), std::move(masterStyles));
}

auto LoadOrderResolver::GetListedPluginNames(const formid::shared::GameRelease release,
                                             const fs::path& dataPath) const -> std::vector<std::string> {
    return BuildSnapshot(release, dataPath, false).ListedPluginNames();
}
