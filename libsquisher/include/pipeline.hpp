/**
 * @file pipeline.hpp
 * @brief Interface of a per-file transcoding pipeline.
 */

#ifndef SQUISHER_PIPELINE_HPP
#define SQUISHER_PIPELINE_HPP

#include "artifact.hpp"
#include "file_category.hpp"
#include <filesystem>
#include <string_view>
#include <vector>

/**
 * @namespace squisher
 * @brief The main namespace of the asset-squisher library.
 *
 * @details Holds the configuration types, the classifier, the stream and
 * image codecs, the pipelines built from them, and the ParallelExecutor
 * that drives a whole run.
 */
namespace squisher {

/**
 * @brief Turns one source file into its set of output artifacts.
 *
 * Each implementation handles one FileCategory. Pipelines are built once
 * from an immutable configuration and shared by every worker, so run()
 * must not touch any per-call state outside its own stack.
 */
class IPipeline {
public:
    virtual ~IPipeline() = default;

    /// @return Human-readable name of the pipeline (e.g. "generic").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return The category of files this pipeline accepts.
    [[nodiscard]] virtual FileCategory category() const noexcept = 0;

    /**
     * @brief Produce every artifact for @p source.
     *
     * Steps run in a fixed order and the first failure ends the file;
     * artifacts already written stay on disk.
     *
     * @param source The file to transcode.
     * @param destination Mirrored output path of @p source (no suffix).
     * @return The artifacts written, in creation order.
     * @throws Error (or a subclass) on the first failing step.
     */
    virtual std::vector<OutputArtifact> run(const SourceFile& source,
                                            const std::filesystem::path& destination) const = 0;
};

} // namespace squisher

#endif // SQUISHER_PIPELINE_HPP
