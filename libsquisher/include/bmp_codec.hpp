/**
 * @file bmp_codec.hpp
 * @brief BMP decoding using stb_image.
 */

#ifndef SQUISHER_BMP_CODEC_HPP
#define SQUISHER_BMP_CODEC_HPP

#include "image_codec.hpp"
#include <array>

namespace squisher {

    /**
     * @brief Decodes uncompressed and RLE BMP into RGBA8.
     *
     * @details BMP is decode-only: no variant is ever written as BMP.
     */
    class BmpDecoder final : public IImageDecoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override { return "BmpDecoder"; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 3> kMimes = { "image/bmp", "image/x-ms-bmp", "image/x-bmp" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".bmp" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] ImageBuffer decode(const std::vector<std::uint8_t>& data) const override;
    };

} // namespace squisher

#endif // SQUISHER_BMP_CODEC_HPP
