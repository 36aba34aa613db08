/**
 * @file artifact.hpp
 * @brief Value types flowing through a run: source files, produced
 * artifacts and per-file outcomes.
 */

#ifndef SQUISHER_ARTIFACT_HPP
#define SQUISHER_ARTIFACT_HPP

#include "errors.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace squisher {

/**
 * @brief A regular file discovered under the input root.
 *
 * The relative path is the join key between the input and output trees.
 */
struct SourceFile {
    std::filesystem::path absolute_path;
    std::filesystem::path relative_path;

    /**
     * @brief Build a SourceFile for @p path found under @p input_root.
     * @throws PathError if @p path does not lie inside @p input_root.
     */
    static SourceFile from(const std::filesystem::path& input_root,
                           const std::filesystem::path& path);
};

/**
 * @brief What produced an artifact: a stream codec, an image format,
 * or a verbatim copy of the source.
 */
enum class ArtifactKind {
    Brotli,
    Gzip,
    Zstd,
    Deflate,
    Original,
    Webp,
    Avif,
    Jpeg,
    Png
};

[[nodiscard]] std::string_view artifact_kind_to_string(ArtifactKind kind) noexcept;

/**
 * @brief One file written by a pipeline. Never modified after creation.
 */
struct OutputArtifact {
    std::filesystem::path path;
    SourceFile produced_from;
    ArtifactKind kind;
    std::optional<std::string> variant_label; ///< Resize tier, if any
};

/**
 * @brief What a per-file task hands back to the executor.
 *
 * A skipped file is neither a success with artifacts nor a failure
 * (e.g. a file that is already compressed).
 */
struct FileResult {
    std::vector<OutputArtifact> artifacts;
    bool skipped = false;
    std::string skip_reason;
};

enum class OutcomeStatus {
    Succeeded,
    Skipped,
    Failed
};

/**
 * @brief The recorded result of running one file's pipeline.
 */
struct PipelineOutcome {
    SourceFile source;
    OutcomeStatus status = OutcomeStatus::Succeeded;
    std::vector<OutputArtifact> artifacts;
    std::optional<ErrorKind> error_kind; ///< Unset for non-library exceptions
    std::string message;                 ///< Error text or skip reason
    std::chrono::milliseconds elapsed{0};
};

} // namespace squisher

#endif // SQUISHER_ARTIFACT_HPP
