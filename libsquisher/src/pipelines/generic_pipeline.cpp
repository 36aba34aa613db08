#include "../../include/generic_pipeline.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/path_mapper.hpp"
#include <cerrno>
#include <cstring>

namespace fs = std::filesystem;

namespace squisher {

std::vector<std::unique_ptr<IStreamCodec>> make_stream_codecs(const CompressionConfig& config) {
    std::vector<std::unique_ptr<IStreamCodec>> codecs;
    codecs.push_back(std::make_unique<BrotliCodec>(config.brotli_level()));
    codecs.push_back(std::make_unique<ZlibCodec>(ZlibCodec::Framing::Gzip, config.gzip_level()));
    codecs.push_back(std::make_unique<ZstdCodec>(config.zstd_level()));
    codecs.push_back(std::make_unique<ZlibCodec>(ZlibCodec::Framing::RawDeflate, config.deflate_level()));
    return codecs;
}

GenericCompressionPipeline::GenericCompressionPipeline(const CompressionConfig& config)
    : codecs_(make_stream_codecs(config)) {}

std::vector<OutputArtifact> GenericCompressionPipeline::run(const SourceFile& source,
                                                            const fs::path& destination) const {
    ensure_parent_dirs(destination);

    std::vector<OutputArtifact> artifacts;
    const unique_FILE in = open_for_reading(source.absolute_path);

    for (const auto& codec : codecs_) {
        const fs::path out_path = PathMapper::with_codec(destination, codec->extension());
        unique_FILE out = create_new_file(out_path);
        codec->compress(in.get(), out.get(), out_path);
        finish_file(out, out_path);
        artifacts.push_back({out_path, source, codec->kind(), std::nullopt});

        // rewind for the next codec
        if (std::fseek(in.get(), 0, SEEK_SET) != 0) {
            throw IoError("cannot rewind " + source.absolute_path.string() + ": " + std::strerror(errno));
        }
        std::clearerr(in.get());
    }

    copy_new_file(source.absolute_path, destination);
    artifacts.push_back({destination, source, ArtifactKind::Original, std::nullopt});

    Logger::log(LogLevel::Debug, "wrote " + std::to_string(artifacts.size()) + " artifacts for " +
                source.relative_path.string(), "generic_pipeline");
    return artifacts;
}

} // namespace squisher
