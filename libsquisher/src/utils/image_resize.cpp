#include "../../include/image_buffer.hpp"
#include "../../include/errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace squisher {

std::vector<std::uint8_t> ImageBuffer::to_rgb() const {
    std::vector<std::uint8_t> rgb(static_cast<std::size_t>(width) * height * 3);
    const std::uint8_t* src = pixels.data();
    std::uint8_t* dst = rgb.data();
    const std::size_t count = static_cast<std::size_t>(width) * height;
    for (std::size_t i = 0; i < count; ++i) {
        dst[0] = src[0];
        dst[1] = src[1];
        dst[2] = src[2];
        src += 4;
        dst += 3;
    }
    return rgb;
}

std::pair<unsigned, unsigned> fit_within(const unsigned width, const unsigned height, const unsigned max_dimension) {
    const unsigned longest = std::max(width, height);
    if (longest <= max_dimension || longest == 0) {
        return {width, height};
    }
    const double scale = static_cast<double>(max_dimension) / longest;
    const auto scaled = [scale](const unsigned v) {
        return std::max(1u, static_cast<unsigned>(std::lround(v * scale)));
    };
    return {std::min(scaled(width), max_dimension), std::min(scaled(height), max_dimension)};
}

ImageBuffer resize_to_fit(const ImageBuffer& src, const unsigned max_dimension) {
    if (src.pixels.size() != src.stride() * src.height) {
        throw DecodeError("pixel buffer does not match its dimensions");
    }
    const auto [dst_w, dst_h] = fit_within(src.width, src.height, max_dimension);
    if (dst_w == src.width && dst_h == src.height) {
        return src;
    }

    ImageBuffer dst;
    dst.width = dst_w;
    dst.height = dst_h;
    dst.has_alpha = src.has_alpha;
    dst.pixels.resize(dst.stride() * dst_h);

    const double scale_x = static_cast<double>(src.width) / dst_w;
    const double scale_y = static_cast<double>(src.height) / dst_h;

    // source column span of every output column
    std::vector<unsigned> x0(dst_w), x1(dst_w);
    for (unsigned dx = 0; dx < dst_w; ++dx) {
        x0[dx] = static_cast<unsigned>(dx * scale_x);
        x1[dx] = std::min(static_cast<unsigned>((dx + 1) * scale_x), src.width);
        if (x1[dx] <= x0[dx]) x1[dx] = std::min(x0[dx] + 1, src.width);
    }

    std::vector<std::uint32_t> acc(static_cast<std::size_t>(dst_w) * 4);
    for (unsigned dy = 0; dy < dst_h; ++dy) {
        const unsigned sy0 = static_cast<unsigned>(dy * scale_y);
        unsigned sy1 = std::min(static_cast<unsigned>((dy + 1) * scale_y), src.height);
        if (sy1 <= sy0) sy1 = std::min(sy0 + 1, src.height);

        std::memset(acc.data(), 0, acc.size() * sizeof(std::uint32_t));
        for (unsigned sy = sy0; sy < sy1; ++sy) {
            const std::uint8_t* row = src.pixels.data() + sy * src.stride();
            for (unsigned dx = 0; dx < dst_w; ++dx) {
                const std::uint8_t* p = row + static_cast<std::size_t>(x0[dx]) * 4;
                std::uint32_t r = 0, g = 0, b = 0, a = 0;
                for (unsigned sx = x0[dx]; sx < x1[dx]; ++sx) {
                    r += p[0]; g += p[1]; b += p[2]; a += p[3];
                    p += 4;
                }
                acc[dx * 4 + 0] += r;
                acc[dx * 4 + 1] += g;
                acc[dx * 4 + 2] += b;
                acc[dx * 4 + 3] += a;
            }
        }

        std::uint8_t* out = dst.pixels.data() + dy * dst.stride();
        const unsigned box_h = sy1 - sy0;
        for (unsigned dx = 0; dx < dst_w; ++dx) {
            const std::uint32_t area = (x1[dx] - x0[dx]) * box_h;
            const std::uint32_t half = area >> 1;
            for (int c = 0; c < 4; ++c) {
                out[dx * 4 + c] = static_cast<std::uint8_t>((acc[dx * 4 + c] + half) / area);
            }
        }
    }
    return dst;
}

} // namespace squisher
