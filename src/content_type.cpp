#include "toonfetch/content_type.hpp"

#include "toonfetch/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <limits>
#include <memory>

#include <fmt/format.h>
#include <webp/decode.h>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_JPEG
#define STBI_ONLY_PNG
#define STBI_ONLY_GIF
#define STBI_NO_STDIO
#include <stb_image.h>

namespace toonfetch {

namespace {

bool matches(const Bytes& b, std::size_t pos, std::string_view tag) {
    if (pos + tag.size() > b.size()) {
        return false;
    }
    return std::equal(tag.begin(), tag.end(), b.begin() + static_cast<std::ptrdiff_t>(pos),
                      [](char c, std::uint8_t byte) { return static_cast<std::uint8_t>(c) == byte; });
}

[[noreturn]] void rejectImage(ImageFormat format, const std::string& reason) {
    throw UnsupportedMediaType(fmt::format("payload is not a decodable {} image: {}",
                                           extensionFor(format), reason));
}

constexpr std::array<std::uint8_t, 8> kPngSignature{0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};

struct StbPixelsDeleter {
    void operator()(stbi_uc* pixels) const noexcept { stbi_image_free(pixels); }
};

struct WebpPixelsDeleter {
    void operator()(std::uint8_t* pixels) const noexcept { WebPFree(pixels); }
};

// JPEG, PNG and GIF (first frame) go through stb_image.
ImageInfo decodeWithStb(const Bytes& b, ImageFormat format) {
    if (b.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        rejectImage(format, "payload too large");
    }
    int width = 0;
    int height = 0;
    int channels = 0;
    const std::unique_ptr<stbi_uc, StbPixelsDeleter> pixels{
        stbi_load_from_memory(b.data(), static_cast<int>(b.size()), &width, &height, &channels, 0)};
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        rejectImage(format, reason ? reason : "decode failed");
    }
    return ImageInfo{format, static_cast<std::uint32_t>(width), static_cast<std::uint32_t>(height)};
}

ImageInfo decodeWebp(const Bytes& b) {
    int width = 0;
    int height = 0;
    const std::unique_ptr<std::uint8_t, WebpPixelsDeleter> pixels{
        WebPDecodeRGBA(b.data(), b.size(), &width, &height)};
    if (!pixels) {
        rejectImage(ImageFormat::Webp, "decode failed");
    }
    return ImageInfo{ImageFormat::Webp, static_cast<std::uint32_t>(width), static_cast<std::uint32_t>(height)};
}

} // namespace

std::string extensionFor(ImageFormat format) {
    switch (format) {
    case ImageFormat::Jpeg:
        return "jpeg";
    case ImageFormat::Png:
        return "png";
    case ImageFormat::Gif:
        return "gif";
    case ImageFormat::Webp:
        return "webp";
    }
    return "bin";
}

std::optional<ImageFormat> formatFromMediaType(std::string_view media_type) {
    const auto semicolon = media_type.find(';');
    if (semicolon != std::string_view::npos) {
        media_type = media_type.substr(0, semicolon);
    }

    std::string essence;
    essence.reserve(media_type.size());
    for (const char c : media_type) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            essence.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }

    if (essence == "image/jpeg" || essence == "image/jpg" || essence == "image/pjpeg") {
        return ImageFormat::Jpeg;
    }
    if (essence == "image/png" || essence == "image/x-png") {
        return ImageFormat::Png;
    }
    if (essence == "image/gif") {
        return ImageFormat::Gif;
    }
    if (essence == "image/webp") {
        return ImageFormat::Webp;
    }
    return std::nullopt;
}

std::optional<ImageFormat> sniffFormat(const Bytes& bytes) {
    if (bytes.size() >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF) {
        return ImageFormat::Jpeg;
    }
    if (bytes.size() >= kPngSignature.size() &&
        std::equal(kPngSignature.begin(), kPngSignature.end(), bytes.begin())) {
        return ImageFormat::Png;
    }
    if (matches(bytes, 0, "GIF87a") || matches(bytes, 0, "GIF89a")) {
        return ImageFormat::Gif;
    }
    if (matches(bytes, 0, "RIFF") && matches(bytes, 8, "WEBP")) {
        return ImageFormat::Webp;
    }
    return std::nullopt;
}

ImageFormat resolveFormat(std::string_view declared, const Bytes& bytes) {
    const auto from_header = formatFromMediaType(declared);
    const auto from_bytes = sniffFormat(bytes);

    if (from_header && (!from_bytes || *from_bytes == *from_header)) {
        return *from_header;
    }
    if (from_bytes) {
        return *from_bytes;
    }
    throw UnsupportedMediaType(fmt::format("unsupported media type '{}' and unrecognised payload signature",
                                           declared.empty() ? "(none)" : std::string(declared)));
}

std::string resolveExtension(std::string_view declared, const Bytes& bytes) {
    return extensionFor(resolveFormat(declared, bytes));
}

ImageInfo decodeImage(const Bytes& bytes, ImageFormat format) {
    const auto signature = sniffFormat(bytes);
    if (!signature || *signature != format) {
        rejectImage(format, "payload signature does not match");
    }

    const auto info = format == ImageFormat::Webp ? decodeWebp(bytes) : decodeWithStb(bytes, format);
    if (info.width == 0 || info.height == 0) {
        rejectImage(format, "empty canvas");
    }
    return info;
}

} // namespace toonfetch
