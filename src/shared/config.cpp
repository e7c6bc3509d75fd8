#include "config.hpp"

#include <rfl/DefaultIfMissing.hpp>
#include <rfl/json.hpp>

#include "spdlog/spdlog.h"

namespace formid::shared {

std::optional<IngestConfiguration> LoadConfiguration(const std::filesystem::path& jsonPath) {
    try {
        auto result = rfl::json::load<IngestConfiguration, rfl::DefaultIfMissing>(jsonPath.string());
        if (!result) {
            spdlog::error("Failed to parse configuration {}: {}", jsonPath.string(), result.error().what());
            return std::nullopt;
        }

        auto config = std::move(result.value());
        if (!ValidateConfiguration(config)) {
            return std::nullopt;
        }

        spdlog::debug("Loaded configuration from {}", jsonPath.string());
        return config;
    }
    catch (const std::exception& e) {
        spdlog::error("Exception loading configuration {}: {}", jsonPath.string(), e.what());
        return std::nullopt;
    }
}

bool ValidateConfiguration(const IngestConfiguration& config) {
    if (config.textBatchSize == 0 || config.pluginBatchSize == 0) {
        spdlog::error("Batch sizes must be greater than zero (text {}, plugin {})",
                      config.textBatchSize, config.pluginBatchSize);
        return false;
    }
    if (config.progressInterval == 0 || config.scanPublishInterval == 0) {
        spdlog::error("Progress intervals must be greater than zero");
        return false;
    }
    if (config.store.busyTimeoutMs < 0 || config.store.cacheSizeKb <= 0) {
        spdlog::error("Invalid store settings (busyTimeoutMs {}, cacheSizeKb {})",
                      config.store.busyTimeoutMs, config.store.cacheSizeKb);
        return false;
    }
    if (spdlog::level::from_str(config.logLevel) == spdlog::level::off && config.logLevel != "off") {
        spdlog::error("Unknown log level '{}'", config.logLevel);
        return false;
    }
    return true;
}

} // namespace formid::shared
