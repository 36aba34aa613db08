#include "../../include/path_mapper.hpp"
#include "../../include/artifact.hpp"
#include "../../include/errors.hpp"

namespace fs = std::filesystem;

namespace squisher {

PathMapper::PathMapper(fs::path output_root) : output_root_(std::move(output_root)) {}

fs::path PathMapper::map(const fs::path& relative_path) const {
    if (relative_path.is_absolute()) {
        throw PathError("expected a relative path, got " + relative_path.string());
    }
    return output_root_ / relative_path;
}

fs::path PathMapper::map(const SourceFile& source) const {
    return map(source.relative_path);
}

fs::path PathMapper::with_codec(const fs::path& destination, const std::string_view extension) {
    fs::path extended = destination;
    extended += ".";
    extended += extension;
    return extended;
}

fs::path PathMapper::variant(const fs::path& destination,
                             const std::optional<std::string_view> tier,
                             const std::string_view extension) {
    std::string name = destination.stem().string();
    if (tier) {
        name += "-";
        name += *tier;
    }
    name += ".";
    name += extension;
    return destination.parent_path() / name;
}

} // namespace squisher
