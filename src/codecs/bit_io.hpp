#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace gwd_image {

// MSB-first bit reader over a byte span.
// Bytes are pulled into the accumulator one at a time, so the cursor runs
// continuously across scanlines with no byte alignment between them.
class bit_reader {
public:
    explicit bit_reader(std::span<const std::uint8_t> data) noexcept
        : data_(data) {}

    // Read n bits (1..32). Returns false at end of stream; value is left
    // unchanged in that case.
    [[nodiscard]] bool get_bits(unsigned n, std::uint32_t& value) noexcept {
        while (bits_ < n) {
            if (pos_ >= data_.size()) {
                return false;
            }
            acc_ = (acc_ << 8) | data_[pos_++];
            bits_ += 8;
        }

        bits_ -= n;
        value = static_cast<std::uint32_t>((acc_ >> bits_) & low_mask(n));
        acc_ &= low_mask(bits_);
        return true;
    }

    [[nodiscard]] bool get_next_bit(std::uint32_t& bit) noexcept {
        return get_bits(1, bit);
    }

    // Bytes pulled from the span so far
    [[nodiscard]] std::size_t bytes_consumed() const noexcept { return pos_; }

private:
    static constexpr std::uint64_t low_mask(unsigned n) noexcept {
        return n >= 64 ? ~std::uint64_t{0} : (std::uint64_t{1} << n) - 1;
    }

    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
    std::uint64_t acc_ = 0;
    unsigned bits_ = 0;
};

// MSB-first bit writer appending to a byte vector.
class bit_writer {
public:
    explicit bit_writer(std::vector<std::uint8_t>& out) noexcept
        : out_(out) {}

    // Append the low n bits (0..32) of value.
    void write_bits(std::uint32_t value, unsigned n) {
        acc_ = (acc_ << n) | (value & low_mask(n));
        bits_ += n;

        while (bits_ >= 8) {
            bits_ -= 8;
            out_.push_back(static_cast<std::uint8_t>(acc_ >> bits_));
        }
        acc_ &= low_mask(bits_);
    }

    // Emit pending bits left-justified in a zero-padded byte.
    // A second call, or a call with nothing pending, writes nothing.
    void flush() {
        if (bits_ > 0) {
            out_.push_back(static_cast<std::uint8_t>(acc_ << (8 - bits_)));
            acc_ = 0;
            bits_ = 0;
        }
    }

    [[nodiscard]] unsigned pending_bits() const noexcept { return bits_; }

private:
    static constexpr std::uint64_t low_mask(unsigned n) noexcept {
        return n >= 64 ? ~std::uint64_t{0} : (std::uint64_t{1} << n) - 1;
    }

    std::vector<std::uint8_t>& out_;
    std::uint64_t acc_ = 0;
    unsigned bits_ = 0;
};

} // namespace gwd_image
