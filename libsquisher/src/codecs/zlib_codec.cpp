#include "../../include/stream_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <vector>
#include <zlib.h>

namespace squisher {

namespace {

constexpr std::size_t kChunkSize = 64 * 1024;

// 15 + 16 asks zlib for a gzip wrapper, a negative value for no wrapper
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kRawWindowBits = -15;
constexpr int kMemLevel = 8;

struct DeflateGuard {
    z_stream* strm;
    ~DeflateGuard() { deflateEnd(strm); }
};

} // namespace

void ZlibCodec::compress(FILE* in, FILE* out, const std::filesystem::path& destination) const {
    z_stream strm{};
    const int window_bits = framing_ == Framing::Gzip ? kGzipWindowBits : kRawWindowBits;
    if (deflateInit2(&strm, level_, Z_DEFLATED, window_bits, kMemLevel, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw EncodeError(std::string(get_name()) + ": deflateInit2 failed at level " + std::to_string(level_));
    }
    DeflateGuard guard{&strm};

    std::vector<unsigned char> in_buf(kChunkSize);
    std::vector<unsigned char> out_buf(kChunkSize);

    int flush = Z_NO_FLUSH;
    do {
        const std::size_t n = std::fread(in_buf.data(), 1, in_buf.size(), in);
        if (std::ferror(in)) {
            throw IoError("read error while compressing into " + destination.string());
        }
        flush = std::feof(in) ? Z_FINISH : Z_NO_FLUSH;
        strm.next_in = in_buf.data();
        strm.avail_in = static_cast<uInt>(n);

        do {
            strm.next_out = out_buf.data();
            strm.avail_out = static_cast<uInt>(out_buf.size());
            if (const int ret = deflate(&strm, flush); ret == Z_STREAM_ERROR) {
                throw EncodeError(std::string(get_name()) + " stream error for " + destination.string());
            }
            write_all(out, out_buf.data(), out_buf.size() - strm.avail_out, destination);
        } while (strm.avail_out == 0);
    } while (flush != Z_FINISH);

    Logger::log(LogLevel::Debug, std::string(get_name()) + " l" + std::to_string(level_) + " -> " + destination.string(), "zlib_codec");
}

} // namespace squisher
