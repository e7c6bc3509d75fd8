#include "LoadOrderProvider.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <unordered_set>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "Utils.hpp"

namespace fs = std::filesystem;
using formid::shared::ToLower;

namespace {
    const auto kPluginExtensions = std::unordered_set<std::string>{".esm", ".esl", ".esp"};

    auto AppendImplicitPlugins(formid::shared::GameRelease release, const fs::path& dataPath,
                               std::vector<std::string>& out, std::unordered_set<std::string>& seen) -> void {
        for (const auto& name : formid::shared::ImplicitPlugins(release)) {
            std::error_code ec;
            if (fs::exists(dataPath / name, ec) && seen.insert(ToLower(name)).second) {
                out.push_back(name);
            }
        }
    }

    auto LessIgnoreCase(const std::string& lhs, const std::string& rhs) -> bool {
        return ToLower(lhs) < ToLower(rhs);
    }
}

PluginsTxtLoadOrderProvider::PluginsTxtLoadOrderProvider(fs::path pluginsFile) : pluginsFile_(std::move(pluginsFile)) {}

auto PluginsTxtLoadOrderProvider::Listings(const formid::shared::GameRelease release,
                                           const fs::path& dataPath) const -> std::vector<std::string> {
    std::ifstream input(pluginsFile_);
    if (!input) {
        throw std::runtime_error(fmt::format("Cannot read load order file {}", pluginsFile_.string()));
    }

    std::vector<std::string> listings;
    std::unordered_set<std::string> seen;
    AppendImplicitPlugins(release, dataPath, listings, seen);

    std::string line;
    while (std::getline(input, line)) {
        auto entry = formid::shared::Trim(line);
        if (entry.empty() || entry.starts_with('#')) {
            continue;
        }
        if (entry.starts_with('*')) {
            entry = formid::shared::Trim(entry.substr(1));
        }
        // Implicit masters are already placed; a listed duplicate keeps that position.
        if (!entry.empty() && !seen.contains(ToLower(entry))) {
            listings.emplace_back(entry);
        }
    }

    spdlog::debug("Read {} listings from {}", listings.size(), pluginsFile_.string());
    return listings;
}

auto DirectoryLoadOrderProvider::Listings(const formid::shared::GameRelease release,
                                          const fs::path& dataPath) const -> std::vector<std::string> {
    std::error_code ec;
    if (!fs::is_directory(dataPath, ec)) {
        throw std::runtime_error(fmt::format("Data directory {} does not exist", dataPath.string()));
    }

    std::vector<std::string> listings;
    std::unordered_set<std::string> seen;
    AppendImplicitPlugins(release, dataPath, listings, seen);

    std::vector<std::string> masters;
    std::vector<std::string> plugins;
    for (auto it = fs::directory_iterator(dataPath, kDirectoryOptions, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file()) continue;
        const auto ext = ToLower(it->path().extension().string());
        if (!kPluginExtensions.contains(ext)) continue;

        auto name = it->path().filename().string();
        if (seen.contains(ToLower(name))) continue;
        (ext == ".esp" ? plugins : masters).push_back(std::move(name));
    }
    if (ec) {
        throw std::runtime_error(fmt::format("Cannot list {}: {}", dataPath.string(), ec.message()));
    }

    std::ranges::sort(masters, LessIgnoreCase);
    std::ranges::sort(plugins, LessIgnoreCase);
    listings.insert(listings.end(), masters.begin(), masters.end());
    listings.insert(listings.end(), plugins.begin(), plugins.end());
    return listings;
}
