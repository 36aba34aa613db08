#include "../../include/webp_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <webp/encode.h>
#include <cstring>

namespace squisher {

namespace {

    struct PictureGuard {
        WebPPicture* picture;
        ~PictureGuard() { WebPPictureFree(picture); }
    };

    struct WriterGuard {
        WebPMemoryWriter* writer;
        ~WriterGuard() { WebPMemoryWriterClear(writer); }
    };

} // namespace

ImageBuffer WebpDecoder::decode(const std::vector<std::uint8_t>& data) const {
    WebPBitstreamFeatures features;
    if (WebPGetFeatures(data.data(), data.size(), &features) != VP8_STATUS_OK) {
        throw DecodeError("WebP feature detection failed");
    }
    if (features.has_animation) {
        throw DecodeError("animated WebP is not supported");
    }

    int width = 0, height = 0;
    uint8_t* decoded = WebPDecodeRGBA(data.data(), data.size(), &width, &height);
    if (!decoded) {
        throw DecodeError("WebP decode failed");
    }

    ImageBuffer image;
    image.width = static_cast<unsigned>(width);
    image.height = static_cast<unsigned>(height);
    image.has_alpha = features.has_alpha != 0;
    image.pixels.assign(decoded, decoded + image.stride() * image.height);
    WebPFree(decoded);

    return image;
}

std::vector<std::uint8_t> WebpEncoder::encode(const ImageBuffer& image) const {
    if (image.empty()) throw EncodeError("cannot encode an empty image as WebP");

    WebPConfig config;
    if (!WebPConfigInit(&config)) {
        throw EncodeError("WebPConfigInit failed");
    }
    config.lossless = mode_.is_lossless() ? 1 : 0;
    config.quality = mode_.quality();
    if (!WebPValidateConfig(&config)) {
        throw EncodeError("invalid WebP configuration");
    }

    WebPPicture picture;
    if (!WebPPictureInit(&picture)) {
        throw EncodeError("WebPPictureInit failed");
    }
    PictureGuard picture_guard{&picture};
    picture.use_argb = config.lossless;
    picture.width = static_cast<int>(image.width);
    picture.height = static_cast<int>(image.height);

    int imported = 0;
    if (image.has_alpha) {
        imported = WebPPictureImportRGBA(&picture, image.pixels.data(), static_cast<int>(image.stride()));
    } else {
        const std::vector<std::uint8_t> rgb = image.to_rgb();
        imported = WebPPictureImportRGB(&picture, rgb.data(), static_cast<int>(image.width) * 3);
    }
    if (!imported) {
        throw EncodeError("WebPPictureImport failed");
    }

    WebPMemoryWriter writer;
    WebPMemoryWriterInit(&writer);
    WriterGuard writer_guard{&writer};
    picture.writer = WebPMemoryWrite;
    picture.custom_ptr = &writer;

    if (!WebPEncode(&config, &picture)) {
        throw EncodeError("WebPEncode failed (error " + std::to_string(picture.error_code) + ")");
    }

    return {writer.mem, writer.mem + writer.size};
}

} // namespace squisher
