/**
 * @file path_mapper.hpp
 * @brief Derives destination paths in the output tree.
 */

#ifndef SQUISHER_PATH_MAPPER_HPP
#define SQUISHER_PATH_MAPPER_HPP

#include <filesystem>
#include <optional>
#include <string_view>

namespace squisher {

struct SourceFile;

/**
 * @brief Maps input-relative paths onto the output root.
 *
 * @details For one source file every (codec extension, tier suffix,
 * image extension) combination yields a distinct path, so a fail-if-exists
 * collision can only come from a previous run, never from two artifacts
 * of the same file.
 */
class PathMapper {
public:
    explicit PathMapper(std::filesystem::path output_root);

    /// output_root / relative_path
    [[nodiscard]] std::filesystem::path map(const std::filesystem::path& relative_path) const;

    [[nodiscard]] std::filesystem::path map(const SourceFile& source) const;

    /**
     * @brief Append a codec extension: "a/b.txt" + "br" -> "a/b.txt.br".
     */
    [[nodiscard]] static std::filesystem::path with_codec(const std::filesystem::path& destination,
                                                          std::string_view extension);

    /**
     * @brief Image variant path: stem, optional "-tier" suffix, new extension.
     *
     * "a/photo.png" with tier "small" and extension "webp" -> "a/photo-small.webp";
     * without a tier -> "a/photo.webp".
     */
    [[nodiscard]] static std::filesystem::path variant(const std::filesystem::path& destination,
                                                       std::optional<std::string_view> tier,
                                                       std::string_view extension);

private:
    std::filesystem::path output_root_;
};

} // namespace squisher

#endif // SQUISHER_PATH_MAPPER_HPP
