#include "../../include/artifact.hpp"

namespace fs = std::filesystem;

namespace squisher {

SourceFile SourceFile::from(const fs::path& input_root, const fs::path& path) {
    std::error_code ec;
    const fs::path root = fs::absolute(input_root, ec).lexically_normal();
    if (ec) {
        throw PathError("cannot resolve input root " + input_root.string() + ": " + ec.message());
    }
    const fs::path absolute = fs::absolute(path, ec).lexically_normal();
    if (ec) {
        throw PathError("cannot resolve " + path.string() + ": " + ec.message());
    }

    const fs::path relative = absolute.lexically_relative(root);
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        throw PathError(path.string() + " is not inside " + input_root.string());
    }
    return SourceFile{absolute, relative};
}

std::string_view artifact_kind_to_string(const ArtifactKind kind) noexcept {
    switch (kind) {
        case ArtifactKind::Brotli:   return "brotli";
        case ArtifactKind::Gzip:     return "gzip";
        case ArtifactKind::Zstd:     return "zstd";
        case ArtifactKind::Deflate:  return "deflate";
        case ArtifactKind::Original: return "original";
        case ArtifactKind::Webp:     return "webp";
        case ArtifactKind::Avif:     return "avif";
        case ArtifactKind::Jpeg:     return "jpeg";
        case ArtifactKind::Png:      return "png";
    }
    return "unknown";
}

} // namespace squisher
