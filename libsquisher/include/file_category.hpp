/**
 * @file file_category.hpp
 * @brief Extension-based classification of source files.
 *
 * The category decides which pipeline a file goes through. Matching is
 * exact and case-sensitive: "photo.PNG" is a generic file, not an image.
 */

#ifndef SQUISHER_FILE_CATEGORY_HPP
#define SQUISHER_FILE_CATEGORY_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>

namespace squisher {

enum class FileCategory {
    AlreadyCompressed,
    Image,
    Generic
};

///< Extensions (without the dot) that are not Generic.
inline const std::unordered_map<std::string, FileCategory> extension_to_category = {
    { "png",  FileCategory::Image },
    { "jpg",  FileCategory::Image },
    { "jpeg", FileCategory::Image },
    { "bmp",  FileCategory::Image },
    { "avif", FileCategory::Image },
    { "webp", FileCategory::Image },
    { "br",   FileCategory::AlreadyCompressed },
    { "gz",   FileCategory::AlreadyCompressed },
    { "zst",  FileCategory::AlreadyCompressed },
    { "zz",   FileCategory::AlreadyCompressed },
};

/**
 * @brief Classify a file by its extension.
 * @param path File path; only its final extension is inspected.
 * @return The category of the file.
 * @throws ClassificationError if the file name has no extension.
 */
FileCategory classify(const std::filesystem::path& path);

[[nodiscard]] std::string_view category_to_string(FileCategory category) noexcept;

} // namespace squisher

#endif // SQUISHER_FILE_CATEGORY_HPP
