#include <gwd_image/codec.hpp>
#include <gwd_image/codecs/gwd.hpp>
#include <gwd_image/codecs/png.hpp>

namespace gwd_image {

// ============================================================================
// Decoder Wrappers
// ============================================================================

namespace {

class gwd_decoder_impl : public decoder {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return gwd_decoder::name;
    }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return gwd_decoder::extensions;
    }

    [[nodiscard]] bool sniff(std::span<const std::uint8_t> data) const noexcept override {
        return gwd_decoder::sniff(data);
    }

    [[nodiscard]] decode_result decode(std::span<const std::uint8_t> data,
                                        surface& surf,
                                        const decode_options& options) const override {
        return gwd_decoder::decode(data, surf, options);
    }
};

class png_decoder_impl : public decoder {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return png_decoder::name;
    }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return png_decoder::extensions;
    }

    [[nodiscard]] bool sniff(std::span<const std::uint8_t> data) const noexcept override {
        return png_decoder::sniff(data);
    }

    [[nodiscard]] decode_result decode(std::span<const std::uint8_t> data,
                                        surface& surf,
                                        const decode_options& options) const override {
        return png_decoder::decode(data, surf, options);
    }
};

} // namespace

// ============================================================================
// Codec Registry Implementation
// ============================================================================

codec_registry& codec_registry::instance() {
    static codec_registry registry;
    return registry;
}

codec_registry::codec_registry() {
    register_builtin_codecs();
}

codec_registry::~codec_registry() = default;

void codec_registry::register_builtin_codecs() {
    // PNG first: its 8-byte signature is stricter than the GWD magic at offset 4
    decoders_.push_back(std::make_unique<png_decoder_impl>());
    decoders_.push_back(std::make_unique<gwd_decoder_impl>());
}

void codec_registry::register_decoder(std::unique_ptr<decoder> dec) {
    if (dec) {
        decoders_.push_back(std::move(dec));
    }
}

const decoder* codec_registry::find_decoder(std::span<const std::uint8_t> data) const {
    for (const auto& dec : decoders_) {
        if (dec->sniff(data)) {
            return dec.get();
        }
    }
    return nullptr;
}

const decoder* codec_registry::find_decoder(std::string_view name) const {
    for (const auto& dec : decoders_) {
        if (dec->name() == name) {
            return dec.get();
        }
    }
    return nullptr;
}

// ============================================================================
// Convenience Functions
// ============================================================================

decode_result decode(std::span<const std::uint8_t> data,
                     surface& surf,
                     const decode_options& options) {
    const auto* dec = codec_registry::instance().find_decoder(data);
    if (!dec) {
        return decode_result::failure(decode_error::invalid_format, "Unknown image format");
    }
    return dec->decode(data, surf, options);
}

decode_result decode(std::span<const std::uint8_t> data,
                     surface& surf,
                     std::string_view codec_name,
                     const decode_options& options) {
    const auto* dec = codec_registry::instance().find_decoder(codec_name);
    if (!dec) {
        return decode_result::failure(decode_error::invalid_format,
            std::string("Unknown codec: ") + std::string(codec_name));
    }
    return dec->decode(data, surf, options);
}

} // namespace gwd_image
