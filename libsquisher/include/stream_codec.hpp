/**
 * @file stream_codec.hpp
 * @brief Interface and implementations of the generic pipeline's
 * streaming compressors.
 */

#ifndef SQUISHER_STREAM_CODEC_HPP
#define SQUISHER_STREAM_CODEC_HPP

#include "artifact.hpp"
#include "config.hpp"
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

namespace squisher {

/**
 * @brief A streaming compressor producing one sibling artifact.
 *
 * compress() reads @p in from its current position to EOF and writes the
 * complete compressed stream to @p out. It does not rewind @p in; the
 * caller owns the read position.
 */
class IStreamCodec {
public:
    virtual ~IStreamCodec() = default;

    /// @return Human-readable codec name (e.g. "brotli").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return Extension appended to the destination, without the dot.
    [[nodiscard]] virtual std::string_view extension() const noexcept = 0;

    [[nodiscard]] virtual ArtifactKind kind() const noexcept = 0;

    /// @return The level every encode of this codec uses.
    [[nodiscard]] virtual int level() const noexcept = 0;

    /**
     * @param in Source stream.
     * @param out Destination stream, opened by the caller.
     * @param destination Path of @p out, for error messages.
     * @throws IoError on read/write failure, EncodeError on codec failure.
     */
    virtual void compress(FILE* in, FILE* out, const std::filesystem::path& destination) const = 0;
};

/**
 * @brief Brotli via libbrotlienc, fixed window (lgwin 20).
 */
class BrotliCodec final : public IStreamCodec {
public:
    static constexpr int kWindowBits = 20;

    explicit BrotliCodec(const int quality) : quality_(quality) {}

    [[nodiscard]] std::string_view get_name() const noexcept override { return "brotli"; }
    [[nodiscard]] std::string_view extension() const noexcept override { return "br"; }
    [[nodiscard]] ArtifactKind kind() const noexcept override { return ArtifactKind::Brotli; }
    [[nodiscard]] int level() const noexcept override { return quality_; }

    void compress(FILE* in, FILE* out, const std::filesystem::path& destination) const override;

private:
    int quality_;
};

/**
 * @brief zlib deflate with either a gzip wrapper or no wrapper at all.
 */
class ZlibCodec final : public IStreamCodec {
public:
    enum class Framing { Gzip, RawDeflate };

    ZlibCodec(const Framing framing, const int level) : framing_(framing), level_(level) {}

    [[nodiscard]] std::string_view get_name() const noexcept override {
        return framing_ == Framing::Gzip ? "gzip" : "deflate";
    }
    [[nodiscard]] std::string_view extension() const noexcept override {
        return framing_ == Framing::Gzip ? "gz" : "zz";
    }
    [[nodiscard]] ArtifactKind kind() const noexcept override {
        return framing_ == Framing::Gzip ? ArtifactKind::Gzip : ArtifactKind::Deflate;
    }
    [[nodiscard]] int level() const noexcept override { return level_; }

    void compress(FILE* in, FILE* out, const std::filesystem::path& destination) const override;

private:
    Framing framing_;
    int level_;
};

/**
 * @brief Zstandard via the libzstd streaming API.
 */
class ZstdCodec final : public IStreamCodec {
public:
    explicit ZstdCodec(const int level) : level_(level) {}

    [[nodiscard]] std::string_view get_name() const noexcept override { return "zstd"; }
    [[nodiscard]] std::string_view extension() const noexcept override { return "zst"; }
    [[nodiscard]] ArtifactKind kind() const noexcept override { return ArtifactKind::Zstd; }
    [[nodiscard]] int level() const noexcept override { return level_; }

    void compress(FILE* in, FILE* out, const std::filesystem::path& destination) const override;

private:
    int level_;
};

/**
 * @brief The generic pipeline's codecs in their fixed order:
 * brotli, gzip, zstd, raw deflate.
 */
std::vector<std::unique_ptr<IStreamCodec>> make_stream_codecs(const CompressionConfig& config);

} // namespace squisher

#endif // SQUISHER_STREAM_CODEC_HPP
