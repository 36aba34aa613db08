#include "../../include/avif_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <avif/avif.h>
#include <memory>
#include <string>

namespace squisher {

namespace {

    struct AvifDecoderDeleter {
        void operator()(avifDecoder* d) const { if (d) avifDecoderDestroy(d); }
    };
    struct AvifEncoderDeleter {
        void operator()(avifEncoder* e) const { if (e) avifEncoderDestroy(e); }
    };
    struct AvifImageDeleter {
        void operator()(avifImage* i) const { if (i) avifImageDestroy(i); }
    };

    using unique_avif_decoder = std::unique_ptr<avifDecoder, AvifDecoderDeleter>;
    using unique_avif_encoder = std::unique_ptr<avifEncoder, AvifEncoderDeleter>;
    using unique_avif_image = std::unique_ptr<avifImage, AvifImageDeleter>;

    struct RWDataGuard {
        avifRWData* data;
        ~RWDataGuard() { avifRWDataFree(data); }
    };

    template <typename Error>
    void check_avif(const avifResult result, const char* what) {
        if (result != AVIF_RESULT_OK) {
            throw Error(std::string(what) + ": " + avifResultToString(result));
        }
    }

} // namespace

ImageBuffer AvifDecoder::decode(const std::vector<std::uint8_t>& data) const {
    const unique_avif_decoder dec(avifDecoderCreate());
    if (!dec) throw DecodeError("avifDecoderCreate failed");

    check_avif<DecodeError>(avifDecoderSetIOMemory(dec.get(), data.data(), data.size()), "avifDecoderSetIOMemory");
    check_avif<DecodeError>(avifDecoderParse(dec.get()), "avifDecoderParse");
    check_avif<DecodeError>(avifDecoderNextImage(dec.get()), "avifDecoderNextImage");

    const avifImage* decoded = dec->image;

    ImageBuffer image;
    image.width = decoded->width;
    image.height = decoded->height;
    image.has_alpha = decoded->alphaPlane != nullptr;
    image.pixels.resize(image.stride() * image.height);

    avifRGBImage rgb;
    avifRGBImageSetDefaults(&rgb, decoded);
    rgb.format = AVIF_RGB_FORMAT_RGBA;
    rgb.depth = 8;
    rgb.pixels = image.pixels.data();
    rgb.rowBytes = static_cast<uint32_t>(image.stride());
    check_avif<DecodeError>(avifImageYUVToRGB(decoded, &rgb), "avifImageYUVToRGB");

    return image;
}

std::vector<std::uint8_t> AvifEncoder::encode(const ImageBuffer& image) const {
    if (image.empty()) throw EncodeError("cannot encode an empty image as AVIF");

    const unique_avif_image avif(avifImageCreate(image.width, image.height, 8, AVIF_PIXEL_FORMAT_YUV444));
    if (!avif) throw EncodeError("avifImageCreate failed");

    avifRGBImage rgb;
    avifRGBImageSetDefaults(&rgb, avif.get());
    rgb.format = AVIF_RGB_FORMAT_RGBA;
    rgb.depth = 8;
    rgb.ignoreAlpha = image.has_alpha ? AVIF_FALSE : AVIF_TRUE;
    // libavif only reads from the RGB buffer here
    rgb.pixels = const_cast<uint8_t*>(image.pixels.data());
    rgb.rowBytes = static_cast<uint32_t>(image.stride());
    check_avif<EncodeError>(avifImageRGBToYUV(avif.get(), &rgb), "avifImageRGBToYUV");

    const unique_avif_encoder enc(avifEncoderCreate());
    if (!enc) throw EncodeError("avifEncoderCreate failed");
    enc->quality = kQuality;
    enc->qualityAlpha = kQuality;
    enc->speed = kSpeed;

    avifRWData output = AVIF_DATA_EMPTY;
    RWDataGuard guard{&output};
    check_avif<EncodeError>(avifEncoderWrite(enc.get(), avif.get(), &output), "avifEncoderWrite");

    return {output.data, output.data + output.size};
}

} // namespace squisher
