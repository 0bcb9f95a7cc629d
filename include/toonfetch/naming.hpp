#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace toonfetch {

// Zero-padding width for numbers up to `largest`: its digit count, at least 3,
// so lexical order of the generated names equals numeric order.
[[nodiscard]] std::size_t paddingWidth(std::uint64_t largest) noexcept;

// "007.png"
[[nodiscard]] std::string pageEntryName(std::size_t index, std::string_view extension, std::size_t width);

// "012"
[[nodiscard]] std::string chapterBaseName(std::int64_t number, std::size_t width);

// Makes a series title usable as a single path component.
[[nodiscard]] std::string sanitizeFileName(std::string_view name);

} // namespace toonfetch
