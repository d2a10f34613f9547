#ifndef GWD_IMAGE_RASTER_HPP_
#define GWD_IMAGE_RASTER_HPP_

#include <gwd_image/gwd_image_export.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace gwd_image {

// ============================================================================
// Raster
// ============================================================================

/**
 * Owned grid of 8-bit samples, row major with interleaved channels.
 *
 * Unlike a surface, a raster carries no pixel format: channel k is exactly
 * the k-th plane of the source bitstream. The channel count is one of
 * 1, 3 or 4.
 */
class GWD_IMAGE_EXPORT raster {
public:
    raster() = default;

    /**
     * Allocate a zero-filled raster.
     * @return false for empty dimensions, an unsupported channel count,
     *         or if the buffer cannot be allocated
     */
    [[nodiscard]] bool allocate(int width, int height, int channels);

    [[nodiscard]] static constexpr bool valid_channel_count(int channels) noexcept {
        return channels == 1 || channels == 3 || channels == 4;
    }

    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] int channels() const noexcept { return channels_; }
    [[nodiscard]] bool empty() const noexcept { return samples_.empty(); }
    [[nodiscard]] std::size_t pitch() const noexcept {
        return static_cast<std::size_t>(width_) * static_cast<std::size_t>(channels_);
    }

    [[nodiscard]] std::span<const std::uint8_t> samples() const noexcept { return samples_; }
    [[nodiscard]] std::span<std::uint8_t> mutable_samples() noexcept { return samples_; }

    [[nodiscard]] std::span<const std::uint8_t> row(int y) const noexcept;
    [[nodiscard]] std::span<std::uint8_t> mutable_row(int y) noexcept;

    [[nodiscard]] std::uint8_t at(int x, int y, int channel) const noexcept;
    void set(int x, int y, int channel, std::uint8_t value) noexcept;

    /**
     * Copy one channel of row y into dst (dst.size() == width).
     */
    void read_plane_row(int y, int channel, std::span<std::uint8_t> dst) const noexcept;

    /**
     * Scatter src (src.size() == width) into one channel of row y.
     */
    void write_plane_row(int y, int channel, std::span<const std::uint8_t> src) noexcept;

private:
    std::vector<std::uint8_t> samples_;
    int width_ = 0;
    int height_ = 0;
    int channels_ = 0;
};

} // namespace gwd_image

#endif // GWD_IMAGE_RASTER_HPP_
