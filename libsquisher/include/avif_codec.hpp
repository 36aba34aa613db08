/**
 * @file avif_codec.hpp
 * @brief AVIF decoding and encoding using libavif.
 */

#ifndef SQUISHER_AVIF_CODEC_HPP
#define SQUISHER_AVIF_CODEC_HPP

#include "image_codec.hpp"
#include <array>

namespace squisher {

    /**
     * @brief Decodes the primary image of an AVIF file into RGBA8.
     */
    class AvifDecoder final : public IImageDecoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override { return "AvifDecoder"; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/avif" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".avif" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] ImageBuffer decode(const std::vector<std::uint8_t>& data) const override;
    };

    /**
     * @brief 8-bit YUV444 AVIF at quality 80, speed 4.
     */
    class AvifEncoder final : public IImageEncoder {
    public:
        static constexpr int kQuality = 80;
        static constexpr int kSpeed = 4;

        [[nodiscard]] std::string_view get_name() const noexcept override { return "AvifEncoder"; }
        [[nodiscard]] std::string_view extension() const noexcept override { return "avif"; }
        [[nodiscard]] ArtifactKind kind() const noexcept override { return ArtifactKind::Avif; }

        [[nodiscard]] std::vector<std::uint8_t> encode(const ImageBuffer& image) const override;
    };

} // namespace squisher

#endif // SQUISHER_AVIF_CODEC_HPP
