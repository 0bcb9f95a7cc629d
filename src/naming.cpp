#include "toonfetch/naming.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace toonfetch {

std::size_t paddingWidth(std::uint64_t largest) noexcept {
    std::size_t digits = 1;
    while (largest >= 10) {
        largest /= 10;
        ++digits;
    }
    return std::max<std::size_t>(3, digits);
}

std::string pageEntryName(std::size_t index, std::string_view extension, std::size_t width) {
    return fmt::format("{:0{}}.{}", index, width, extension);
}

std::string chapterBaseName(std::int64_t number, std::size_t width) {
    return fmt::format("{:0{}}", number, width);
}

std::string sanitizeFileName(std::string_view name) {
    std::string cleaned;
    cleaned.reserve(name.size());
    for (const char c : name) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || c == '/' || c == '\\' || c == ':' || c == '*' || c == '?' || c == '"' || c == '<' ||
            c == '>' || c == '|') {
            cleaned.push_back('_');
        } else {
            cleaned.push_back(c);
        }
    }

    const auto first = cleaned.find_first_not_of(" .");
    if (first == std::string::npos) {
        return "untitled";
    }
    const auto last = cleaned.find_last_not_of(" .");
    return cleaned.substr(first, last - first + 1);
}

} // namespace toonfetch
