#include "GameRelease.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include "Utils.hpp"

namespace formid::shared {

namespace {
    const std::unordered_set<std::string> kSkyrimPlugins{
        "skyrim.esm", "update.esm", "dawnguard.esm", "hearthfires.esm",
        "dragonborn.esm", "ccbgssse001-fish.esm", "ccqdrsse001-survivalmode.esm"
    };

    const std::unordered_set<std::string> kFalloutPlugins{
        "fallout4.esm", "dlcrobot.esm", "dlcworkshop01.esm",
        "dlccoast.esm", "dlcworkshop02.esm", "dlcworkshop03.esm",
        "dlcnukaworld.esm"
    };

    const std::unordered_set<std::string> kStarfieldPlugins{
        "starfield.esm", "blueprintships-starfield.esm",
        "oldmars.esm", "constellation.esm"
    };

    const std::unordered_set<std::string> kNoPlugins{};

    const std::vector<std::string> kSkyrimImplicit{
        "Skyrim.esm", "Update.esm", "Dawnguard.esm", "HearthFires.esm", "Dragonborn.esm"
    };
    const std::vector<std::string> kSkyrimLEImplicit{"Skyrim.esm", "Update.esm"};
    const std::vector<std::string> kFalloutImplicit{
        "Fallout4.esm", "DLCRobot.esm", "DLCworkshop01.esm", "DLCCoast.esm",
        "DLCworkshop02.esm", "DLCworkshop03.esm", "DLCNukaWorld.esm"
    };
    const std::vector<std::string> kStarfieldImplicit{
        "Starfield.esm", "Constellation.esm", "OldMars.esm", "BlueprintShips-Starfield.esm"
    };
    const std::vector<std::string> kOblivionImplicit{"Oblivion.esm"};
    const std::vector<std::string> kNoImplicit{};
}

std::string_view SafeTableName(const GameRelease release) {
    switch (release) {
    case GameRelease::SkyrimSE: return "SkyrimSE";
    case GameRelease::SkyrimSEGog: return "SkyrimSEGog";
    case GameRelease::SkyrimVR: return "SkyrimVR";
    case GameRelease::SkyrimLE: return "SkyrimLE";
    case GameRelease::Fallout4: return "Fallout4";
    case GameRelease::Fallout4VR: return "Fallout4VR";
    case GameRelease::Starfield: return "Starfield";
    case GameRelease::Oblivion: return "Oblivion";
    case GameRelease::EnderalLE: return "EnderalLE";
    case GameRelease::EnderalSE: return "EnderalSE";
    }
    throw std::invalid_argument(
        fmt::format("Unsupported game release: {}", static_cast<int>(release)));
}

std::optional<GameRelease> ParseGameRelease(const std::string_view name) {
    for (const auto release : kSupportedReleases) {
        if (EqualsIgnoreCase(SafeTableName(release), Trim(name))) {
            return release;
        }
    }
    return std::nullopt;
}

const std::unordered_set<std::string>& BaseGamePlugins(const GameRelease release) {
    switch (release) {
    case GameRelease::SkyrimSE:
    case GameRelease::SkyrimSEGog:
    case GameRelease::SkyrimVR:
        return kSkyrimPlugins;
    case GameRelease::Fallout4:
    case GameRelease::Fallout4VR:
        return kFalloutPlugins;
    case GameRelease::Starfield:
        return kStarfieldPlugins;
    default:
        return kNoPlugins;
    }
}

bool IsBaseGamePlugin(const GameRelease release, const std::string_view pluginName) {
    return BaseGamePlugins(release).contains(ToLower(pluginName));
}

const std::vector<std::string>& ImplicitPlugins(const GameRelease release) {
    switch (release) {
    case GameRelease::SkyrimSE:
    case GameRelease::SkyrimSEGog:
    case GameRelease::SkyrimVR:
        return kSkyrimImplicit;
    case GameRelease::SkyrimLE:
    case GameRelease::EnderalLE:
    case GameRelease::EnderalSE:
        return kSkyrimLEImplicit;
    case GameRelease::Fallout4:
    case GameRelease::Fallout4VR:
        return kFalloutImplicit;
    case GameRelease::Starfield:
        return kStarfieldImplicit;
    case GameRelease::Oblivion:
        return kOblivionImplicit;
    }
    return kNoImplicit;
}

bool UsesSeparatedMasterLoadOrders(const GameRelease release) {
    return release == GameRelease::Starfield;
}

std::filesystem::path ResolveDataPath(const std::filesystem::path& gameDirectory) {
    auto leaf = gameDirectory.filename();
    if (leaf.empty()) {
        // trailing separator, e.g. "C:/Game/Data/"
        leaf = gameDirectory.parent_path().filename();
    }
    if (EqualsIgnoreCase(leaf.string(), "Data")) {
        return gameDirectory;
    }
    return gameDirectory / "Data";
}

} // namespace formid::shared
