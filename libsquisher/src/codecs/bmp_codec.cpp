#include "../../include/bmp_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <climits>
#include <memory>
#include <mutex>
#include <string>

// --- STB Implementation ---
// define the implementation in this single .cpp file
#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_BMP
#include <stb_image.h>
// --------------------------

namespace squisher {

namespace {

    struct StbiFree {
        void operator()(stbi_uc* p) const { stbi_image_free(p); }
    };
    using unique_stbi = std::unique_ptr<stbi_uc, StbiFree>;

    // stbi_failure_reason is a global, so load + reason must not interleave
    std::mutex& stbi_mutex() {
        static std::mutex mtx;
        return mtx;
    }

} // namespace

ImageBuffer BmpDecoder::decode(const std::vector<std::uint8_t>& data) const {
    if (data.empty() || data.size() > static_cast<std::size_t>(INT_MAX)) {
        throw DecodeError("BMP stream is empty or too large");
    }

    int width = 0, height = 0, channels = 0;
    unique_stbi pixels;
    {
        std::lock_guard lock(stbi_mutex());
        pixels.reset(stbi_load_from_memory(data.data(), static_cast<int>(data.size()),
                                           &width, &height, &channels, 4));
        if (!pixels) {
            throw DecodeError(std::string("Failed to load BMP: ") + stbi_failure_reason());
        }
    }

    ImageBuffer image;
    image.width = static_cast<unsigned>(width);
    image.height = static_cast<unsigned>(height);
    image.has_alpha = channels == 4 || channels == 2;
    image.pixels.assign(pixels.get(), pixels.get() + image.stride() * image.height);

    return image;
}

} // namespace squisher
