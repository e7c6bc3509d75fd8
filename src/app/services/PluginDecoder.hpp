#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "GameRelease.hpp"
#include "entities.hpp"

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DecodedRecord {
public:
    virtual ~DecodedRecord() = default;

    // Full 32-bit record id, master index included. May throw for a damaged header.
    [[nodiscard]] virtual uint32_t FormKeyId() const = 0;
    [[nodiscard]] virtual std::optional<std::string> EditorId() const = 0;
    [[nodiscard]] virtual std::string TypeName() const = 0;
};

// Implemented by record types that carry a display name.
class NamedRecord {
public:
    virtual ~NamedRecord() = default;

    [[nodiscard]] virtual std::optional<std::string> Name() const = 0;
};

// Label strategy for one concrete record type. Empty when the type has none.
using LabelAccessor = std::function<std::optional<std::string>(const DecodedRecord&)>;

class RecordStream {
public:
    virtual ~RecordStream() = default;

    // nullptr once exhausted. The returned record lives until the next call.
    virtual auto Next() -> const DecodedRecord* = 0;
};

struct DecodeParameters {
    std::vector<formid::shared::PluginMasterStyle> masterStyles;
};

class PluginDecoder {
public:
    virtual ~PluginDecoder() = default;

    // Opening reads the whole plugin header; this call cannot be interrupted.
    virtual auto Open(const std::filesystem::path& pluginPath, formid::shared::GameRelease release,
                      const DecodeParameters& parameters) -> std::unique_ptr<RecordStream> = 0;

    virtual auto ReadMasterStyle(const std::filesystem::path& pluginPath,
                                 formid::shared::GameRelease release) -> formid::shared::MasterStyle = 0;

    // Inspects the concrete type of sample. Expensive; callers cache the result per type.
    virtual auto ResolveLabelAccessor(const DecodedRecord& sample) -> LabelAccessor = 0;
};

// Stands in when no binary decoder is linked: every open fails at plugin level.
class UnlinkedPluginDecoder final : public PluginDecoder {
public:
    auto Open(const std::filesystem::path& pluginPath, formid::shared::GameRelease release,
              const DecodeParameters& parameters) -> std::unique_ptr<RecordStream> override;
    auto ReadMasterStyle(const std::filesystem::path& pluginPath,
                         formid::shared::GameRelease release) -> formid::shared::MasterStyle override;
    auto ResolveLabelAccessor(const DecodedRecord& sample) -> LabelAccessor override;
};
