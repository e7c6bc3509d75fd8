#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace formid::shared {

enum class GameRelease {
    SkyrimSE,
    SkyrimSEGog,
    SkyrimVR,
    SkyrimLE,
    Fallout4,
    Fallout4VR,
    Starfield,
    Oblivion,
    EnderalLE,
    EnderalSE,
};

constexpr std::array kSupportedReleases{
    GameRelease::SkyrimSE,
    GameRelease::SkyrimSEGog,
    GameRelease::SkyrimVR,
    GameRelease::SkyrimLE,
    GameRelease::Fallout4,
    GameRelease::Fallout4VR,
    GameRelease::Starfield,
    GameRelease::Oblivion,
    GameRelease::EnderalLE,
    GameRelease::EnderalSE,
};

// The only place a table name is produced. Every SQL statement that names a
// release table goes through here; throws std::invalid_argument otherwise.
[[nodiscard]] std::string_view SafeTableName(GameRelease release);

[[nodiscard]] std::optional<GameRelease> ParseGameRelease(std::string_view name);

// Lower-cased file names of the official masters shipped with the release.
[[nodiscard]] const std::unordered_set<std::string>& BaseGamePlugins(GameRelease release);
[[nodiscard]] bool IsBaseGamePlugin(GameRelease release, std::string_view pluginName);

// Masters the game loads regardless of plugins.txt, in load order.
[[nodiscard]] const std::vector<std::string>& ImplicitPlugins(GameRelease release);

[[nodiscard]] bool UsesSeparatedMasterLoadOrders(GameRelease release);

// "<game>/Data" unless the directory already is the Data folder.
[[nodiscard]] std::filesystem::path ResolveDataPath(const std::filesystem::path& gameDirectory);

} // namespace formid::shared
