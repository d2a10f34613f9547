#include <gwd_image/codecs/gwd.hpp>
#include "bit_io.hpp"
#include "byte_io.hpp"
#include "decode_helpers.hpp"
#include "gwd_scanline.hpp"
#include "../file_io.hpp"

#include <cstring>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace gwd_image {

namespace {

constexpr std::uint8_t GWD_MAGIC[] = {'G', 'W', 'D'};

constexpr std::size_t GWD_PAYLOAD_SIZE_OFFSET = 0;
constexpr std::size_t GWD_MAGIC_OFFSET = 4;
constexpr std::size_t GWD_WIDTH_OFFSET = 7;
constexpr std::size_t GWD_HEIGHT_OFFSET = 9;
constexpr std::size_t GWD_BPP_OFFSET = 11;

// payload_size is counted from here
constexpr std::size_t GWD_PAYLOAD_BASE = 4;

constexpr std::uint16_t GWD_MAX_DIMENSION = std::numeric_limits<std::uint16_t>::max();

// Planes stored in the primary bitstream for a given depth, 0 if unsupported
int planes_for_bpp(std::uint8_t bpp) noexcept {
    switch (bpp) {
        case 8:  return 1;
        case 24: return 3;
        case 32: return 3;
        default: return 0;
    }
}

// Decode `planes` interleaved channels, row by row, channel 0 first
decode_result decode_planes(bit_reader& reader, raster& out, int planes) {
    std::vector<std::uint8_t> line(static_cast<std::size_t>(out.width()));

    for (int y = 0; y < out.height(); ++y) {
        for (int c = 0; c < planes; ++c) {
            auto result = decode_scanline(reader, line);
            if (!result) {
                result.message += " (row " + std::to_string(y) +
                                  ", channel " + std::to_string(c) + ")";
                return result;
            }
            out.write_plane_row(y, c, line);
        }
    }

    return decode_result::success();
}

// Look for the alpha trailer behind the primary payload. Any inconsistency
// leaves the image opaque.
void merge_alpha(std::span<const std::uint8_t> data, const gwd_header& hdr, raster& image) {
    const std::size_t flag_offset = GWD_PAYLOAD_BASE + static_cast<std::size_t>(hdr.payload_size);
    if (flag_offset >= data.size() || data[flag_offset] != GWD_ALPHA_FLAG) {
        return;
    }

    const auto nested = data.subspan(flag_offset + 1);
    gwd_header alpha_hdr;
    if (!read_gwd_header(nested, alpha_hdr)) {
        return;
    }
    if (alpha_hdr.bits_per_pixel != 8 ||
        alpha_hdr.width != hdr.width || alpha_hdr.height != hdr.height) {
        return;
    }

    raster plane;
    if (!plane.allocate(image.width(), image.height(), 1)) {
        return;
    }

    bit_reader reader(nested.subspan(GWD_HEADER_SIZE));
    if (!decode_planes(reader, plane, 1)) {
        return;
    }

    raster merged;
    if (!merged.allocate(image.width(), image.height(), 4)) {
        return;
    }

    std::vector<std::uint8_t> line(static_cast<std::size_t>(image.width()));
    for (int y = 0; y < image.height(); ++y) {
        for (int c = 0; c < 3; ++c) {
            image.read_plane_row(y, c, line);
            merged.write_plane_row(y, c, line);
        }
        plane.read_plane_row(y, 0, line);
        for (auto& v : line) {
            v = static_cast<std::uint8_t>(255 - v);
        }
        merged.write_plane_row(y, 3, line);
    }

    image = std::move(merged);
}

} // namespace

// ============================================================================
// GWD Header
// ============================================================================

decode_result read_gwd_header(std::span<const std::uint8_t> data, gwd_header& hdr) {
    if (data.size() < GWD_HEADER_SIZE) {
        return decode_result::failure(decode_error::invalid_format,
            "GWD header too short: expected 12 bytes");
    }

    if (std::memcmp(data.data() + GWD_MAGIC_OFFSET, GWD_MAGIC, sizeof(GWD_MAGIC)) != 0) {
        return decode_result::failure(decode_error::invalid_format, "Invalid GWD magic");
    }

    hdr.payload_size = read_le32(data.data() + GWD_PAYLOAD_SIZE_OFFSET);
    hdr.width = read_be16(data.data() + GWD_WIDTH_OFFSET);
    hdr.height = read_be16(data.data() + GWD_HEIGHT_OFFSET);
    hdr.bits_per_pixel = data[GWD_BPP_OFFSET];

    return decode_result::success();
}

std::array<std::uint8_t, GWD_HEADER_SIZE> write_gwd_header(const gwd_header& hdr) noexcept {
    std::array<std::uint8_t, GWD_HEADER_SIZE> bytes{};
    write_le32(bytes.data() + GWD_PAYLOAD_SIZE_OFFSET, hdr.payload_size);
    std::memcpy(bytes.data() + GWD_MAGIC_OFFSET, GWD_MAGIC, sizeof(GWD_MAGIC));
    write_be16(bytes.data() + GWD_WIDTH_OFFSET, hdr.width);
    write_be16(bytes.data() + GWD_HEIGHT_OFFSET, hdr.height);
    bytes[GWD_BPP_OFFSET] = hdr.bits_per_pixel;
    return bytes;
}

// ============================================================================
// Raster-level codec
// ============================================================================

decode_result decode_gwd_raster(std::span<const std::uint8_t> data,
                                raster& out,
                                const decode_options& options) {
    gwd_header hdr;
    auto result = read_gwd_header(data, hdr);
    if (!result) return result;

    const int planes = planes_for_bpp(hdr.bits_per_pixel);
    if (planes == 0) {
        return decode_result::failure(decode_error::unsupported_bit_depth,
            "Unsupported GWD bit depth: " + std::to_string(hdr.bits_per_pixel));
    }

    if (hdr.width == 0 || hdr.height == 0) {
        return decode_result::failure(decode_error::invalid_format, "Invalid GWD dimensions");
    }

    result = validate_dimensions(hdr.width, hdr.height, options);
    if (!result) return result;

    raster image;
    if (!image.allocate(hdr.width, hdr.height, planes)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate raster");
    }

    bit_reader reader(data.subspan(GWD_HEADER_SIZE));
    result = decode_planes(reader, image, planes);
    if (!result) return result;

    if (planes == 3) {
        merge_alpha(data, hdr, image);
    }

    out = std::move(image);
    return decode_result::success();
}

std::vector<std::uint8_t> encode_gwd_raster(const raster& src) {
    std::uint8_t bpp = 0;
    switch (src.channels()) {
        case 1: bpp = 8; break;
        case 3: bpp = 24; break;
        default: return {};
    }

    if (src.width() <= 0 || src.height() <= 0 ||
        src.width() > GWD_MAX_DIMENSION || src.height() > GWD_MAX_DIMENSION) {
        return {};
    }

    const std::uint64_t payload_size = static_cast<std::uint64_t>(src.width()) *
                                       static_cast<std::uint64_t>(src.height()) *
                                       (bpp / 8u);
    if (payload_size > std::numeric_limits<std::uint32_t>::max()) {
        return {};
    }

    gwd_header hdr;
    hdr.payload_size = static_cast<std::uint32_t>(payload_size);
    hdr.width = static_cast<std::uint16_t>(src.width());
    hdr.height = static_cast<std::uint16_t>(src.height());
    hdr.bits_per_pixel = bpp;

    const auto header_bytes = write_gwd_header(hdr);
    std::vector<std::uint8_t> out(header_bytes.begin(), header_bytes.end());

    bit_writer writer(out);
    std::vector<std::uint8_t> line(static_cast<std::size_t>(src.width()));
    for (int y = 0; y < src.height(); ++y) {
        for (int c = 0; c < src.channels(); ++c) {
            src.read_plane_row(y, c, line);
            encode_scanline(writer, line);
        }
    }
    writer.flush();

    return out;
}

// ============================================================================
// GWD Decoder
// ============================================================================

bool gwd_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < GWD_HEADER_SIZE) {
        return false;
    }
    return std::memcmp(data.data() + GWD_MAGIC_OFFSET, GWD_MAGIC, sizeof(GWD_MAGIC)) == 0;
}

decode_result gwd_decoder::decode(std::span<const std::uint8_t> data,
                                  surface& surf,
                                  const decode_options& options) {
    raster image;
    auto result = decode_gwd_raster(data, image, options);
    if (!result) return result;

    const int width = image.width();
    const int height = image.height();

    if (image.channels() == 1) {
        if (!surf.set_size(width, height, pixel_format::indexed8)) {
            return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
        }

        std::uint8_t grey[256 * 3];
        for (int i = 0; i < 256; ++i) {
            grey[i * 3 + 0] = static_cast<std::uint8_t>(i);
            grey[i * 3 + 1] = static_cast<std::uint8_t>(i);
            grey[i * 3 + 2] = static_cast<std::uint8_t>(i);
        }
        surf.set_palette_size(256);
        surf.write_palette(0, grey);

        write_rows(surf, image.samples().data(), image.pitch(), height);
        return decode_result::success();
    }

    // Stored channel order is B, G, R
    const bool has_alpha = image.channels() == 4;
    const pixel_format fmt = has_alpha ? pixel_format::rgba8888 : pixel_format::rgb888;
    if (!surf.set_size(width, height, fmt)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
    }

    const std::size_t channels = static_cast<std::size_t>(image.channels());
    std::vector<std::uint8_t> row(image.pitch());
    for (int y = 0; y < height; ++y) {
        const auto src = image.row(y);
        for (std::size_t x = 0; x < static_cast<std::size_t>(width); ++x) {
            const std::size_t i = x * channels;
            row[i + 0] = src[i + 2];
            row[i + 1] = src[i + 1];
            row[i + 2] = src[i + 0];
            if (has_alpha) {
                row[i + 3] = src[i + 3];
            }
        }
        surf.write_pixels(0, y, static_cast<int>(row.size()), row.data());
    }

    return decode_result::success();
}

// ============================================================================
// GWD Encoder
// ============================================================================

std::vector<std::uint8_t> encode_gwd(const memory_surface& surf) {
    if (surf.width() <= 0 || surf.height() <= 0) {
        return {};
    }

    raster image;
    if (!image.allocate(surf.width(), surf.height(), 3)) {
        return {};
    }

    const std::size_t w = static_cast<std::size_t>(surf.width());
    const auto pixels = surf.pixels();
    const auto palette = surf.palette();

    for (int y = 0; y < surf.height(); ++y) {
        const auto* src = pixels.data() + static_cast<std::size_t>(y) * surf.pitch();
        auto dst = image.mutable_row(y);

        // Channels go out in surface order (R, G, B)
        for (std::size_t x = 0; x < w; ++x) {
            switch (surf.format()) {
                case pixel_format::rgb888:
                    dst[x * 3 + 0] = src[x * 3 + 0];
                    dst[x * 3 + 1] = src[x * 3 + 1];
                    dst[x * 3 + 2] = src[x * 3 + 2];
                    break;
                case pixel_format::rgba8888:
                    dst[x * 3 + 0] = src[x * 4 + 0];
                    dst[x * 3 + 1] = src[x * 4 + 1];
                    dst[x * 3 + 2] = src[x * 4 + 2];
                    break;
                case pixel_format::indexed8: {
                    const std::size_t pal_offset = static_cast<std::size_t>(src[x]) * 3;
                    if (pal_offset + 2 < palette.size()) {
                        dst[x * 3 + 0] = palette[pal_offset + 0];
                        dst[x * 3 + 1] = palette[pal_offset + 1];
                        dst[x * 3 + 2] = palette[pal_offset + 2];
                    }
                    // Missing palette entry stays black
                    break;
                }
            }
        }
    }

    return encode_gwd_raster(image);
}

bool save_gwd(const memory_surface& surf, const std::filesystem::path& path) {
    auto gwd_data = encode_gwd(surf);
    if (gwd_data.empty()) {
        return false;
    }
    return write_file_replacing(path, gwd_data);
}

} // namespace gwd_image
