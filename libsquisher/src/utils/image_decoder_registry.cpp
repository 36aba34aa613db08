#include "../../include/image_decoder_registry.hpp"
#include "../../include/avif_codec.hpp"
#include "../../include/bmp_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/png_codec.hpp"
#include "../../include/webp_codec.hpp"
#include <algorithm>
#include <cctype>

namespace squisher {

ImageDecoderRegistry::ImageDecoderRegistry() {
    decoders_.push_back(std::make_unique<PngDecoder>());
    decoders_.push_back(std::make_unique<JpegDecoder>());
    decoders_.push_back(std::make_unique<WebpDecoder>());
    decoders_.push_back(std::make_unique<AvifDecoder>());
    decoders_.push_back(std::make_unique<BmpDecoder>());
}

const IImageDecoder* ImageDecoderRegistry::find_by_mime(const std::string& mime) const {
    for (const auto& decoder : decoders_) {
        for (const auto supported_mime : decoder->get_supported_mime_types()) {
            if (supported_mime == mime) {
                return decoder.get();
            }
        }
    }
    return nullptr;
}

const IImageDecoder* ImageDecoderRegistry::find_by_extension(const std::string& ext) const {
    if (ext.empty() || ext[0] != '.') return nullptr;

    auto iequals = [](const std::string_view s1, const std::string_view s2) {
        return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    };

    for (const auto& decoder : decoders_) {
        for (const auto supported_ext : decoder->get_supported_extensions()) {
            if (iequals(supported_ext, ext)) {
                return decoder.get();
            }
        }
    }
    return nullptr;
}

const IImageDecoder& ImageDecoderRegistry::select(const std::filesystem::path& path,
                                                  const std::vector<std::uint8_t>& data) const {
    const std::string mime = MimeDetector::detect(data);
    if (const auto* decoder = find_by_mime(mime)) {
        Logger::log(LogLevel::Debug, path.string() + " detected as " + mime, "decoder_registry");
        return *decoder;
    }
    if (const auto* decoder = find_by_extension(path.extension().string())) {
        Logger::log(LogLevel::Debug, "No decoder for MIME '" + mime + "', using extension of " + path.string(),
                    "decoder_registry");
        return *decoder;
    }
    throw DecodeError("no image decoder for " + path.string() + (mime.empty() ? "" : " (" + mime + ")"));
}

} // namespace squisher
