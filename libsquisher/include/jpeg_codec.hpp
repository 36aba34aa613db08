/**
 * @file jpeg_codec.hpp
 * @brief JPEG decoding and encoding using libjpeg.
 */

#ifndef SQUISHER_JPEG_CODEC_HPP
#define SQUISHER_JPEG_CODEC_HPP

#include "image_codec.hpp"
#include <array>

namespace squisher {

    /**
     * @brief Decodes baseline and progressive JPEG into opaque RGBA8.
     */
    class JpegDecoder final : public IImageDecoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override { return "JpegDecoder"; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/jpeg", "image/pjpeg" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 2> kExts = { ".jpg", ".jpeg" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] ImageBuffer decode(const std::vector<std::uint8_t>& data) const override;
    };

    /**
     * @brief Baseline RGB JPEG. Alpha, if any, is discarded.
     */
    class JpegEncoder final : public IImageEncoder {
    public:
        static constexpr int kDefaultQuality = 75;

        explicit JpegEncoder(const int quality = kDefaultQuality) : quality_(quality) {}

        [[nodiscard]] std::string_view get_name() const noexcept override { return "JpegEncoder"; }
        [[nodiscard]] std::string_view extension() const noexcept override { return "jpeg"; }
        [[nodiscard]] ArtifactKind kind() const noexcept override { return ArtifactKind::Jpeg; }

        [[nodiscard]] std::vector<std::uint8_t> encode(const ImageBuffer& image) const override;

    private:
        int quality_;
    };

} // namespace squisher

#endif // SQUISHER_JPEG_CODEC_HPP
