#include "../../include/stream_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <brotli/encode.h>
#include <memory>
#include <vector>

namespace squisher {

namespace {

struct BrotliEncoderDeleter {
    void operator()(BrotliEncoderState* s) const { if (s) BrotliEncoderDestroyInstance(s); }
};
using unique_brotli = std::unique_ptr<BrotliEncoderState, BrotliEncoderDeleter>;

constexpr std::size_t kChunkSize = 64 * 1024;

} // namespace

void BrotliCodec::compress(FILE* in, FILE* out, const std::filesystem::path& destination) const {
    const unique_brotli state(BrotliEncoderCreateInstance(nullptr, nullptr, nullptr));
    if (!state) {
        throw EncodeError("BrotliEncoderCreateInstance failed");
    }
    if (!BrotliEncoderSetParameter(state.get(), BROTLI_PARAM_QUALITY, static_cast<uint32_t>(quality_)) ||
        !BrotliEncoderSetParameter(state.get(), BROTLI_PARAM_LGWIN, kWindowBits)) {
        throw EncodeError("brotli rejected quality " + std::to_string(quality_));
    }

    std::vector<uint8_t> in_buf(kChunkSize);
    std::vector<uint8_t> out_buf(kChunkSize);

    bool eof = false;
    while (!BrotliEncoderIsFinished(state.get())) {
        size_t available_in = 0;
        const uint8_t* next_in = nullptr;
        if (!eof) {
            available_in = std::fread(in_buf.data(), 1, in_buf.size(), in);
            if (std::ferror(in)) {
                throw IoError("read error while compressing into " + destination.string());
            }
            eof = std::feof(in) != 0;
            next_in = in_buf.data();
        }
        const BrotliEncoderOperation op = eof ? BROTLI_OPERATION_FINISH : BROTLI_OPERATION_PROCESS;

        do {
            size_t available_out = out_buf.size();
            uint8_t* next_out = out_buf.data();
            if (!BrotliEncoderCompressStream(state.get(), op,
                                             &available_in, &next_in,
                                             &available_out, &next_out, nullptr)) {
                throw EncodeError("brotli stream error for " + destination.string());
            }
            write_all(out, out_buf.data(), out_buf.size() - available_out, destination);
        } while (available_in > 0 || BrotliEncoderHasMoreOutput(state.get()));
    }

    Logger::log(LogLevel::Debug, "brotli q" + std::to_string(quality_) + " -> " + destination.string(), "brotli_codec");
}

} // namespace squisher
