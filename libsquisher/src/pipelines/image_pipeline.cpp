#include "../../include/image_pipeline.hpp"
#include "../../include/avif_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/logger.hpp"
#include "../../include/path_mapper.hpp"
#include "../../include/png_codec.hpp"
#include "../../include/webp_codec.hpp"

namespace fs = std::filesystem;

namespace squisher {

ImageTranscodingPipeline::ImageTranscodingPipeline(ImageVariantConfig config)
    : config_(std::move(config)) {
    encoders_.push_back(std::make_unique<WebpEncoder>(config_.webp_mode()));
    encoders_.push_back(std::make_unique<AvifEncoder>());
    encoders_.push_back(std::make_unique<JpegEncoder>());
    encoders_.push_back(std::make_unique<PngEncoder>());
}

std::vector<OutputArtifact> ImageTranscodingPipeline::run(const SourceFile& source,
                                                          const fs::path& destination) const {
    ensure_parent_dirs(destination);
    std::vector<OutputArtifact> artifacts;

    if (config_.skip_recompression()) {
        if (copy_if_absent(source.absolute_path, destination)) {
            artifacts.push_back({destination, source, ArtifactKind::Original, std::nullopt});
        } else {
            Logger::log(LogLevel::Debug, "destination exists, copy skipped: " + destination.string(), "image_pipeline");
        }
        return artifacts;
    }

    const std::vector<std::uint8_t> bytes = read_file_bytes(source.absolute_path);
    const IImageDecoder& decoder = decoders_.select(source.absolute_path, bytes);
    const ImageBuffer image = decoder.decode(bytes);
    Logger::log(LogLevel::Debug, std::string(decoder.get_name()) + " decoded " +
                std::to_string(image.width) + "x" + std::to_string(image.height) +
                (image.has_alpha ? " with alpha" : "") + ": " + source.relative_path.string(),
                "image_pipeline");

    render(source, destination, image, std::nullopt, artifacts);

    if (config_.resize_enabled()) {
        for (const auto& tier : config_.resize_tiers()) {
            const ImageBuffer resized = resize_to_fit(image, tier.max_dimension);
            render(source, destination, resized, tier.label, artifacts);
        }
    }

    return artifacts;
}

void ImageTranscodingPipeline::render(const SourceFile& source,
                                      const fs::path& destination,
                                      const ImageBuffer& image,
                                      const std::optional<std::string>& tier,
                                      std::vector<OutputArtifact>& artifacts) const {
    std::optional<std::string_view> tier_view;
    if (tier) tier_view = *tier;

    for (const auto& encoder : encoders_) {
        const fs::path out_path = PathMapper::variant(destination, tier_view, encoder->extension());
        const std::vector<std::uint8_t> encoded = encoder->encode(image);
        write_new_file(out_path, encoded);
        Logger::log(LogLevel::Debug, std::string(artifact_kind_to_string(encoder->kind())) + " " +
                    std::to_string(image.width) + "x" + std::to_string(image.height) + ", " +
                    std::to_string(encoded.size()) + " bytes -> " + out_path.string(), "image_pipeline");
        artifacts.push_back({out_path, source, encoder->kind(), tier});
    }
}

} // namespace squisher
