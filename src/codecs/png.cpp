#include <gwd_image/codecs/png.hpp>
#include "byte_io.hpp"
#include "decode_helpers.hpp"
#include "../file_io.hpp"
#include <lodepng.h>

#include <limits>
#include <string>

namespace gwd_image {

namespace {

// PNG signature: 89 50 4E 47 0D 0A 1A 0A
constexpr std::uint8_t PNG_SIGNATURE[] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
constexpr std::size_t PNG_SIGNATURE_SIZE = sizeof(PNG_SIGNATURE);

// IHDR follows the signature: length, type, then width and height (big-endian)
constexpr std::size_t PNG_IHDR_LENGTH_OFFSET = 8;
constexpr std::size_t PNG_IHDR_TYPE_OFFSET = 12;
constexpr std::size_t PNG_IHDR_WIDTH_OFFSET = 16;
constexpr std::size_t PNG_IHDR_HEIGHT_OFFSET = 20;
constexpr std::size_t PNG_MIN_SIZE_FOR_DIMENSIONS = 24;
constexpr std::uint32_t PNG_IHDR_TYPE = 0x49484452;  // "IHDR"
constexpr std::uint32_t PNG_IHDR_LENGTH = 13;

constexpr auto MAX_INT = static_cast<std::uint32_t>(std::numeric_limits<int>::max());

// Reject oversized images from IHDR before lodepng allocates anything
decode_result precheck_dimensions(std::span<const std::uint8_t> data,
                                  const decode_options& options) {
    if (data.size() < PNG_MIN_SIZE_FOR_DIMENSIONS ||
        read_be32(data.data() + PNG_IHDR_LENGTH_OFFSET) != PNG_IHDR_LENGTH ||
        read_be32(data.data() + PNG_IHDR_TYPE_OFFSET) != PNG_IHDR_TYPE) {
        // Leave malformed headers to lodepng
        return decode_result::success();
    }

    const std::uint32_t width = read_be32(data.data() + PNG_IHDR_WIDTH_OFFSET);
    const std::uint32_t height = read_be32(data.data() + PNG_IHDR_HEIGHT_OFFSET);
    if (width > MAX_INT || height > MAX_INT) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "PNG dimensions exceed maximum supported size");
    }

    return validate_dimensions(static_cast<int>(width), static_cast<int>(height), options);
}

// Expand any surface format to tightly packed RGBA
std::vector<std::uint8_t> to_rgba(const memory_surface& surf) {
    const std::size_t pixel_count = static_cast<std::size_t>(surf.width()) *
                                    static_cast<std::size_t>(surf.height());
    const auto* src = surf.pixels().data();
    const auto palette = surf.palette();

    std::vector<std::uint8_t> rgba(pixel_count * 4, 255);
    auto* dst = rgba.data();

    switch (surf.format()) {
        case pixel_format::rgba8888:
            rgba.assign(surf.pixels().begin(), surf.pixels().end());
            break;
        case pixel_format::rgb888:
            for (std::size_t i = 0; i < pixel_count; ++i) {
                dst[i * 4 + 0] = src[i * 3 + 0];
                dst[i * 4 + 1] = src[i * 3 + 1];
                dst[i * 4 + 2] = src[i * 3 + 2];
            }
            break;
        case pixel_format::indexed8:
            for (std::size_t i = 0; i < pixel_count; ++i) {
                const std::size_t pal_offset = static_cast<std::size_t>(src[i]) * 3;
                const bool known = pal_offset + 2 < palette.size();
                // Missing palette entry - use black
                dst[i * 4 + 0] = known ? palette[pal_offset + 0] : 0;
                dst[i * 4 + 1] = known ? palette[pal_offset + 1] : 0;
                dst[i * 4 + 2] = known ? palette[pal_offset + 2] : 0;
            }
            break;
    }

    return rgba;
}

} // namespace

// ============================================================================
// PNG Decoder
// ============================================================================

bool png_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < PNG_SIGNATURE_SIZE) {
        return false;
    }

    for (std::size_t i = 0; i < PNG_SIGNATURE_SIZE; ++i) {
        if (data[i] != PNG_SIGNATURE[i]) {
            return false;
        }
    }

    return true;
}

decode_result png_decoder::decode(std::span<const std::uint8_t> data,
                                  surface& surf,
                                  const decode_options& options) {
    if (!sniff(data)) {
        return decode_result::failure(decode_error::invalid_format, "Not a valid PNG file");
    }

    auto result = precheck_dimensions(data, options);
    if (!result) return result;

    unsigned width = 0;
    unsigned height = 0;
    std::vector<std::uint8_t> pixels;

    unsigned error = lodepng::decode(pixels, width, height, data.data(), data.size());
    if (error) {
        return decode_result::failure(decode_error::invalid_format,
            std::string("PNG decode error: ") + lodepng_error_text(error));
    }

    if (width > MAX_INT || height > MAX_INT) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "PNG dimensions exceed maximum supported size");
    }

    result = validate_dimensions(static_cast<int>(width), static_cast<int>(height), options);
    if (!result) return result;

    if (!surf.set_size(static_cast<int>(width), static_cast<int>(height), pixel_format::rgba8888)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
    }

    write_rows(surf, pixels.data(), static_cast<std::size_t>(width) * 4, static_cast<int>(height));

    return decode_result::success();
}

// ============================================================================
// PNG Encoder
// ============================================================================

std::vector<std::uint8_t> encode_png(const memory_surface& surf) {
    if (surf.width() <= 0 || surf.height() <= 0) {
        return {};
    }

    const auto rgba_pixels = to_rgba(surf);

    std::vector<std::uint8_t> png_data;
    unsigned error = lodepng::encode(png_data, rgba_pixels,
                                     static_cast<unsigned>(surf.width()),
                                     static_cast<unsigned>(surf.height()));
    if (error) {
        return {};
    }

    return png_data;
}

bool save_png(const memory_surface& surf, const std::filesystem::path& path) {
    auto png_data = encode_png(surf);
    if (png_data.empty()) {
        return false;
    }
    return write_file_replacing(path, png_data);
}

// ============================================================================
// PNG Surface
// ============================================================================

std::vector<std::uint8_t> png_surface::encode() const {
    return encode_png(*this);
}

bool png_surface::save(const std::filesystem::path& path) const {
    return save_png(*this, path);
}

} // namespace gwd_image
