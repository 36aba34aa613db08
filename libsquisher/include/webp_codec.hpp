/**
 * @file webp_codec.hpp
 * @brief WebP decoding and encoding using libwebp.
 */

#ifndef SQUISHER_WEBP_CODEC_HPP
#define SQUISHER_WEBP_CODEC_HPP

#include "config.hpp"
#include "image_codec.hpp"
#include <array>

namespace squisher {

    class WebpDecoder final : public IImageDecoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override { return "WebpDecoder"; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/webp" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".webp" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] ImageBuffer decode(const std::vector<std::uint8_t>& data) const override;
    };

    /**
     * @brief Encodes lossy or lossless WebP according to a WebpMode.
     *
     * @details Lossless mode always encodes at quality 75. Alpha is kept
     * only when the image has it.
     */
    class WebpEncoder final : public IImageEncoder {
    public:
        explicit WebpEncoder(const WebpMode mode) : mode_(mode) {}

        [[nodiscard]] std::string_view get_name() const noexcept override { return "WebpEncoder"; }
        [[nodiscard]] std::string_view extension() const noexcept override { return "webp"; }
        [[nodiscard]] ArtifactKind kind() const noexcept override { return ArtifactKind::Webp; }

        [[nodiscard]] std::vector<std::uint8_t> encode(const ImageBuffer& image) const override;

    private:
        WebpMode mode_;
    };

} // namespace squisher

#endif // SQUISHER_WEBP_CODEC_HPP
