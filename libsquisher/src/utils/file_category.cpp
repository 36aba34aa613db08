#include "../../include/file_category.hpp"
#include "../../include/errors.hpp"

namespace squisher {

FileCategory classify(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    if (ext.empty()) {
        throw ClassificationError("file has no extension: " + path.string());
    }
    // "name." leaves an empty string here, which is Generic
    ext.erase(0, 1);

    const auto it = extension_to_category.find(ext);
    return it != extension_to_category.end() ? it->second : FileCategory::Generic;
}

std::string_view category_to_string(const FileCategory category) noexcept {
    switch (category) {
        case FileCategory::AlreadyCompressed: return "already-compressed";
        case FileCategory::Image:             return "image";
        case FileCategory::Generic:           return "generic";
    }
    return "unknown";
}

} // namespace squisher
