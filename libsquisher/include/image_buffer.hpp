/**
 * @file image_buffer.hpp
 * @brief Decoded raster shared by every image decoder, encoder and the resampler.
 */

#ifndef SQUISHER_IMAGE_BUFFER_HPP
#define SQUISHER_IMAGE_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace squisher {

/**
 * @brief 8-bit RGBA pixels, row-major, no padding between rows.
 *
 * has_alpha records whether the source carried an alpha channel. When it
 * is false every alpha byte is 0xFF and encoders may drop the channel.
 */
struct ImageBuffer {
    unsigned width = 0;
    unsigned height = 0;
    bool has_alpha = false;
    std::vector<std::uint8_t> pixels;

    [[nodiscard]] std::size_t stride() const noexcept { return static_cast<std::size_t>(width) * 4; }
    [[nodiscard]] bool empty() const noexcept { return width == 0 || height == 0; }

    /**
     * @brief Packs the colour channels into tightly packed RGB.
     */
    [[nodiscard]] std::vector<std::uint8_t> to_rgb() const;
};

/**
 * @brief Dimensions that fit @p width x @p height inside a
 * @p max_dimension square, preserving aspect ratio.
 *
 * Never upscales: if the longest side already fits, the input dimensions
 * are returned. Each side is at least 1.
 */
[[nodiscard]] std::pair<unsigned, unsigned> fit_within(unsigned width, unsigned height, unsigned max_dimension);

/**
 * @brief Box-filter downscale so the longest side is at most @p max_dimension.
 * @return A copy of @p src when no downscale is needed.
 */
[[nodiscard]] ImageBuffer resize_to_fit(const ImageBuffer& src, unsigned max_dimension);

} // namespace squisher

#endif // SQUISHER_IMAGE_BUFFER_HPP
