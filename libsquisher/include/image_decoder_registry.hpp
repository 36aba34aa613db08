/**
 * @file image_decoder_registry.hpp
 * @brief Owns the image decoders and picks one for a given input.
 */

#ifndef SQUISHER_IMAGE_DECODER_REGISTRY_HPP
#define SQUISHER_IMAGE_DECODER_REGISTRY_HPP

#include "image_codec.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace squisher {

/**
 * @brief Registry of the built-in image decoders (PNG, JPEG, WebP, AVIF, BMP).
 *
 * @details Lookup prefers the content's MIME type, as detected by
 * libmagic, and falls back to the file extension. A file named .png that
 * actually holds JPEG data is therefore decoded as JPEG.
 */
class ImageDecoderRegistry {
public:
    ImageDecoderRegistry();

    [[nodiscard]] const IImageDecoder* find_by_mime(const std::string& mime) const;

    /**
     * @param ext Extension including the dot. Comparison is case-insensitive.
     */
    [[nodiscard]] const IImageDecoder* find_by_extension(const std::string& ext) const;

    /**
     * @brief Decoder for @p data read from @p path.
     * @throws DecodeError if neither the content nor the extension matches a decoder.
     */
    [[nodiscard]] const IImageDecoder& select(const std::filesystem::path& path,
                                              const std::vector<std::uint8_t>& data) const;

private:
    std::vector<std::unique_ptr<IImageDecoder>> decoders_;
};

} // namespace squisher

#endif // SQUISHER_IMAGE_DECODER_REGISTRY_HPP
