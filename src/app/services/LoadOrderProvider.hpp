#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "GameRelease.hpp"

constexpr auto kDirectoryOptions = std::filesystem::directory_options::skip_permission_denied;

// Source of the ordered plugin listing for a data directory.
class LoadOrderProvider {
public:
    virtual ~LoadOrderProvider() = default;

    // Plugin file names in load order, as listed. May throw when the listing cannot be read.
    [[nodiscard]] virtual auto Listings(formid::shared::GameRelease release,
                                        const std::filesystem::path& dataPath) const -> std::vector<std::string> = 0;
};

// Reads a plugins.txt: implicit masters found on disk first, then every listed line.
// Lines starting with '#' are comments; a leading '*' only marks the plugin active.
class PluginsTxtLoadOrderProvider final : public LoadOrderProvider {
public:
    explicit PluginsTxtLoadOrderProvider(std::filesystem::path pluginsFile);

    [[nodiscard]] auto Listings(formid::shared::GameRelease release,
                                const std::filesystem::path& dataPath) const -> std::vector<std::string> override;

private:
    std::filesystem::path pluginsFile_;
};

// Derives an order from the data directory itself: implicit masters, then the
// remaining .esm/.esl files, then .esp files, each group sorted by name.
class DirectoryLoadOrderProvider final : public LoadOrderProvider {
public:
    [[nodiscard]] auto Listings(formid::shared::GameRelease release,
                                const std::filesystem::path& dataPath) const -> std::vector<std::string> override;
};
