/**
 * @file image_codec.hpp
 * @brief Interfaces for in-memory image decoders and encoders.
 */

#ifndef SQUISHER_IMAGE_CODEC_HPP
#define SQUISHER_IMAGE_CODEC_HPP

#include "artifact.hpp"
#include "image_buffer.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace squisher {

/**
 * @brief Decodes one encoded image format into an RGBA8 ImageBuffer.
 *
 * Implementations are stateless and shared across worker threads.
 */
class IImageDecoder {
public:
    virtual ~IImageDecoder() = default;

    /// @return Human-readable name of the decoder (e.g. "PngDecoder").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return MIME types as reported by libmagic (e.g. "image/png").
    [[nodiscard]] virtual std::span<const std::string_view> get_supported_mime_types() const noexcept = 0;

    /// @return Extensions including the dot (e.g. ".png").
    [[nodiscard]] virtual std::span<const std::string_view> get_supported_extensions() const noexcept = 0;

    /**
     * @brief Decode @p data.
     * @throws DecodeError if the data is not a valid image of this format.
     */
    [[nodiscard]] virtual ImageBuffer decode(const std::vector<std::uint8_t>& data) const = 0;
};

/**
 * @brief Encodes an ImageBuffer into one output format.
 */
class IImageEncoder {
public:
    virtual ~IImageEncoder() = default;

    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return Output extension without the dot (e.g. "webp").
    [[nodiscard]] virtual std::string_view extension() const noexcept = 0;

    [[nodiscard]] virtual ArtifactKind kind() const noexcept = 0;

    /**
     * @brief Encode @p image into a complete file image.
     * @throws EncodeError on encoder failure.
     */
    [[nodiscard]] virtual std::vector<std::uint8_t> encode(const ImageBuffer& image) const = 0;
};

} // namespace squisher

#endif // SQUISHER_IMAGE_CODEC_HPP
