#include "../../include/stream_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <memory>
#include <vector>
#include <zstd.h>

namespace squisher {

namespace {

struct ZstdCCtxDeleter {
    void operator()(ZSTD_CCtx* c) const { ZSTD_freeCCtx(c); }
};
using unique_cctx = std::unique_ptr<ZSTD_CCtx, ZstdCCtxDeleter>;

void check_zstd(const size_t code, const std::string& what) {
    if (ZSTD_isError(code)) {
        throw EncodeError(what + ": " + ZSTD_getErrorName(code));
    }
}

} // namespace

void ZstdCodec::compress(FILE* in, FILE* out, const std::filesystem::path& destination) const {
    const unique_cctx cctx(ZSTD_createCCtx());
    if (!cctx) {
        throw EncodeError("ZSTD_createCCtx failed");
    }
    check_zstd(ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_compressionLevel, level_),
               "zstd rejected level " + std::to_string(level_));

    std::vector<char> in_buf(ZSTD_CStreamInSize());
    std::vector<char> out_buf(ZSTD_CStreamOutSize());

    bool last_chunk = false;
    while (!last_chunk) {
        const std::size_t n = std::fread(in_buf.data(), 1, in_buf.size(), in);
        if (std::ferror(in)) {
            throw IoError("read error while compressing into " + destination.string());
        }
        last_chunk = std::feof(in) != 0;
        const ZSTD_EndDirective mode = last_chunk ? ZSTD_e_end : ZSTD_e_continue;
        ZSTD_inBuffer input{in_buf.data(), n, 0};

        bool finished = false;
        do {
            ZSTD_outBuffer output{out_buf.data(), out_buf.size(), 0};
            const size_t remaining = ZSTD_compressStream2(cctx.get(), &output, &input, mode);
            check_zstd(remaining, "zstd stream error for " + destination.string());
            write_all(out, out_buf.data(), output.pos, destination);
            finished = last_chunk ? remaining == 0 : input.pos == input.size;
        } while (!finished);
    }

    Logger::log(LogLevel::Debug, "zstd l" + std::to_string(level_) + " -> " + destination.string(), "zstd_codec");
}

} // namespace squisher
