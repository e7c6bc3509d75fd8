#include "PluginDecoder.hpp"

#include <fmt/format.h>

auto UnlinkedPluginDecoder::Open(const std::filesystem::path& pluginPath, formid::shared::GameRelease,
                                 const DecodeParameters&) -> std::unique_ptr<RecordStream> {
    throw DecodeError(fmt::format("No binary plugin decoder is linked into this build, cannot read {}",
                                  pluginPath.filename().string()));
}

auto UnlinkedPluginDecoder::ReadMasterStyle(const std::filesystem::path& pluginPath,
                                            formid::shared::GameRelease) -> formid::shared::MasterStyle {
    throw DecodeError(fmt::format("No binary plugin decoder is linked into this build, cannot read {}",
                                  pluginPath.filename().string()));
}

auto UnlinkedPluginDecoder::ResolveLabelAccessor(const DecodedRecord&) -> LabelAccessor {
    return {};
}
