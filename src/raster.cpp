#include <gwd_image/raster.hpp>

#include <algorithm>
#include <limits>
#include <new>

namespace gwd_image {

bool raster::allocate(int width, int height, int channels) {
    if (width <= 0 || height <= 0 || !valid_channel_count(channels)) {
        return false;
    }

    const std::size_t w = static_cast<std::size_t>(width);
    const std::size_t h = static_cast<std::size_t>(height);
    const std::size_t c = static_cast<std::size_t>(channels);

    if (w > std::numeric_limits<std::size_t>::max() / c ||
        w * c > std::numeric_limits<std::size_t>::max() / h) {
        return false;
    }

    try {
        samples_.assign(w * c * h, 0);
    } catch (const std::bad_alloc&) {
        return false;
    }

    width_ = width;
    height_ = height;
    channels_ = channels;
    return true;
}

std::span<const std::uint8_t> raster::row(int y) const noexcept {
    if (y < 0 || y >= height_) {
        return {};
    }
    return std::span<const std::uint8_t>(samples_).subspan(static_cast<std::size_t>(y) * pitch(), pitch());
}

std::span<std::uint8_t> raster::mutable_row(int y) noexcept {
    if (y < 0 || y >= height_) {
        return {};
    }
    return std::span<std::uint8_t>(samples_).subspan(static_cast<std::size_t>(y) * pitch(), pitch());
}

std::uint8_t raster::at(int x, int y, int channel) const noexcept {
    if (x < 0 || x >= width_ || y < 0 || y >= height_ || channel < 0 || channel >= channels_) {
        return 0;
    }
    return samples_[static_cast<std::size_t>(y) * pitch() +
                    static_cast<std::size_t>(x) * static_cast<std::size_t>(channels_) +
                    static_cast<std::size_t>(channel)];
}

void raster::set(int x, int y, int channel, std::uint8_t value) noexcept {
    if (x < 0 || x >= width_ || y < 0 || y >= height_ || channel < 0 || channel >= channels_) {
        return;
    }
    samples_[static_cast<std::size_t>(y) * pitch() +
             static_cast<std::size_t>(x) * static_cast<std::size_t>(channels_) +
             static_cast<std::size_t>(channel)] = value;
}

void raster::read_plane_row(int y, int channel, std::span<std::uint8_t> dst) const noexcept {
    const auto src = row(y);
    if (src.empty() || channel < 0 || channel >= channels_) {
        return;
    }

    const std::size_t stride = static_cast<std::size_t>(channels_);
    const std::size_t count = std::min(dst.size(), static_cast<std::size_t>(width_));
    for (std::size_t x = 0; x < count; ++x) {
        dst[x] = src[x * stride + static_cast<std::size_t>(channel)];
    }
}

void raster::write_plane_row(int y, int channel, std::span<const std::uint8_t> src) noexcept {
    auto dst = mutable_row(y);
    if (dst.empty() || channel < 0 || channel >= channels_) {
        return;
    }

    const std::size_t stride = static_cast<std::size_t>(channels_);
    const std::size_t count = std::min(src.size(), static_cast<std::size_t>(width_));
    for (std::size_t x = 0; x < count; ++x) {
        dst[x * stride + static_cast<std::size_t>(channel)] = src[x];
    }
}

} // namespace gwd_image
