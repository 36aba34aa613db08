/**
 * @file png_codec.hpp
 * @brief PNG decoding and encoding using libpng.
 */

#ifndef SQUISHER_PNG_CODEC_HPP
#define SQUISHER_PNG_CODEC_HPP

#include "image_codec.hpp"
#include <array>

namespace squisher {

    /**
     * @brief Decodes any PNG colour type and bit depth into RGBA8.
     *
     * @details 16-bit samples are stripped to 8 bits, palettes and grey
     * are expanded, tRNS becomes a real alpha channel.
     */
    class PngDecoder final : public IImageDecoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override { return "PngDecoder"; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/png" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".png" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] ImageBuffer decode(const std::vector<std::uint8_t>& data) const override;
    };

    /**
     * @brief Writes 8-bit RGBA, or RGB when the image has no alpha.
     */
    class PngEncoder final : public IImageEncoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override { return "PngEncoder"; }
        [[nodiscard]] std::string_view extension() const noexcept override { return "png"; }
        [[nodiscard]] ArtifactKind kind() const noexcept override { return ArtifactKind::Png; }

        [[nodiscard]] std::vector<std::uint8_t> encode(const ImageBuffer& image) const override;
    };

} // namespace squisher

#endif // SQUISHER_PNG_CODEC_HPP
