/**
 * @file image_pipeline.hpp
 * @brief Decodes an image once and renders it into every target format and size.
 */

#ifndef SQUISHER_IMAGE_PIPELINE_HPP
#define SQUISHER_IMAGE_PIPELINE_HPP

#include "config.hpp"
#include "image_codec.hpp"
#include "image_decoder_registry.hpp"
#include "pipeline.hpp"
#include <memory>
#include <vector>

namespace squisher {

    /**
     * @brief Pipeline for FileCategory::Image.
     *
     * @details Renders the original size, then each configured tier
     * (when resizing is enabled), each one as WebP, AVIF, JPEG and PNG,
     * to `<stem>[-<tier>].<ext>` next to the mirrored destination. The
     * first encode or write error ends the file.
     *
     * With skip_recompression set nothing is decoded: the source is copied
     * to the destination unless a file already sits there, in which case
     * the copy is skipped instead of failing.
     */
    class ImageTranscodingPipeline final : public IPipeline {
    public:
        explicit ImageTranscodingPipeline(ImageVariantConfig config);

        [[nodiscard]] std::string_view get_name() const noexcept override { return "image"; }
        [[nodiscard]] FileCategory category() const noexcept override { return FileCategory::Image; }

        std::vector<OutputArtifact> run(const SourceFile& source,
                                        const std::filesystem::path& destination) const override;

    private:
        /**
         * @brief Encode @p image with every encoder and write the results.
         */
        void render(const SourceFile& source,
                    const std::filesystem::path& destination,
                    const ImageBuffer& image,
                    const std::optional<std::string>& tier,
                    std::vector<OutputArtifact>& artifacts) const;

        ImageVariantConfig config_;
        ImageDecoderRegistry decoders_;
        std::vector<std::unique_ptr<IImageEncoder>> encoders_; ///< WebP, AVIF, JPEG, PNG
    };

} // namespace squisher

#endif // SQUISHER_IMAGE_PIPELINE_HPP
