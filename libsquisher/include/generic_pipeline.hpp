/**
 * @file generic_pipeline.hpp
 * @brief Compresses a generic file with every stream codec and copies it.
 */

#ifndef SQUISHER_GENERIC_PIPELINE_HPP
#define SQUISHER_GENERIC_PIPELINE_HPP

#include "config.hpp"
#include "pipeline.hpp"
#include "stream_codec.hpp"
#include <memory>
#include <vector>

namespace squisher {

    /**
     * @brief Pipeline for FileCategory::Generic.
     *
     * @details For a destination `d` it writes, in order, `d.br`, `d.gz`,
     * `d.zst`, `d.zz` and finally a verbatim copy at `d`. One read handle
     * is shared by the four codecs and rewound between them. Every output
     * is created fail-if-exists, the final copy included, so a second run
     * over the same output tree fails with DestinationExistsError without
     * touching what is already there.
     */
    class GenericCompressionPipeline final : public IPipeline {
    public:
        explicit GenericCompressionPipeline(const CompressionConfig& config);

        [[nodiscard]] std::string_view get_name() const noexcept override { return "generic"; }
        [[nodiscard]] FileCategory category() const noexcept override { return FileCategory::Generic; }

        std::vector<OutputArtifact> run(const SourceFile& source,
                                        const std::filesystem::path& destination) const override;

        [[nodiscard]] const std::vector<std::unique_ptr<IStreamCodec>>& codecs() const noexcept { return codecs_; }

    private:
        std::vector<std::unique_ptr<IStreamCodec>> codecs_;
    };

} // namespace squisher

#endif // SQUISHER_GENERIC_PIPELINE_HPP
