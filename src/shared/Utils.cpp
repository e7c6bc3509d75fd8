#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

#include <fmt/format.h>
#include <utf8cpp/utf8.h>

namespace formid::shared {

std::string SanitizeString(const std::string_view text) {
    if (utf8::is_valid(text.begin(), text.end())) {
        return std::string(text);
    }

    std::string sanitized;
    sanitized.reserve(text.size());
    utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(sanitized));
    return sanitized;
}

std::string_view Trim(std::string_view text) {
    const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!text.empty() && isSpace(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && isSpace(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

std::string ToLower(const std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    std::ranges::transform(text, std::back_inserter(lower),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool EqualsIgnoreCase(const std::string_view lhs, const std::string_view rhs) {
    return std::ranges::equal(lhs, rhs, [](unsigned char a, unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    });
}

std::string FormatFormId(const uint32_t rawId) {
    return fmt::format("{:06X}", rawId & 0x00FFFFFFu);
}

} // namespace formid::shared
