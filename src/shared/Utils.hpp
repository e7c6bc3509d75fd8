#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace formid::shared {

std::string SanitizeString(std::string_view text);

[[nodiscard]] std::string_view Trim(std::string_view text);
[[nodiscard]] std::string ToLower(std::string_view text);
[[nodiscard]] bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs);

// Low 24 bits as six uppercase hex digits, e.g. 0x0A012345 -> "012345".
[[nodiscard]] std::string FormatFormId(uint32_t rawId);

} // namespace formid::shared
