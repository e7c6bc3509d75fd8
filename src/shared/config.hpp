#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace formid::shared {

struct StoreSettings {
    int busyTimeoutMs = 30000;
    int cacheSizeKb = 64000;
};

struct IngestConfiguration {
    // Decoded records share the buffer's memory budget; keep pluginBatchSize well below textBatchSize.
    std::size_t textBatchSize = 10000;
    std::size_t pluginBatchSize = 1000;
    std::size_t progressInterval = 1000;
    std::size_t scanPublishInterval = 10;
    StoreSettings store;
    std::string logLevel = "info";
    std::optional<std::string> loadOrderFile;
};

// Reads a JSON configuration; fields missing from the file keep their defaults.
// Returns nullopt (after logging) when the file cannot be read or holds invalid values.
std::optional<IngestConfiguration> LoadConfiguration(const std::filesystem::path& jsonPath);

[[nodiscard]] bool ValidateConfiguration(const IngestConfiguration& config);

} // namespace formid::shared
