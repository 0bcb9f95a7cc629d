#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace toonfetch {

enum class ImageFormat {
    Jpeg,
    Png,
    Gif,
    Webp,
};

struct ImageInfo {
    ImageFormat format{ImageFormat::Jpeg};
    std::uint32_t width{0};
    std::uint32_t height{0};
};

[[nodiscard]] std::string extensionFor(ImageFormat format);

// "image/png; charset=binary" -> Png. Unknown or empty types yield nullopt.
[[nodiscard]] std::optional<ImageFormat> formatFromMediaType(std::string_view media_type);

[[nodiscard]] std::optional<ImageFormat> sniffFormat(const Bytes& bytes);

// Declared type first; the byte signature decides when the header is missing,
// unknown, or names a different format than the payload actually is.
// Throws UnsupportedMediaType when neither source is a supported image.
[[nodiscard]] ImageFormat resolveFormat(std::string_view declared, const Bytes& bytes);

[[nodiscard]] std::string resolveExtension(std::string_view declared, const Bytes& bytes);

// Fully decodes the payload as `format` and reports the canvas size. Throws
// UnsupportedMediaType when the signature disagrees or decoding fails.
[[nodiscard]] ImageInfo decodeImage(const Bytes& bytes, ImageFormat format);

} // namespace toonfetch
