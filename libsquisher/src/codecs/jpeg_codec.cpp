#include "../../include/jpeg_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <jpeglib.h>
#include <string>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

template <typename Error>
[[noreturn]] void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    Logger::log(LogLevel::Debug, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw Error(std::string("libjpeg: ") + err->msg);
}

// warnings are routed to the logger instead of stderr
void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    Logger::log(LogLevel::Debug, std::string("libjpeg: ") + buffer, "libjpeg");
}

struct DecompressGuard {
    jpeg_decompress_struct* cinfo;
    ~DecompressGuard() { jpeg_destroy_decompress(cinfo); }
};

struct CompressGuard {
    jpeg_compress_struct* cinfo;
    unsigned char** buffer;
    ~CompressGuard() {
        jpeg_destroy_compress(cinfo);
        // jpeg_mem_dest allocates with malloc
        std::free(*buffer);
    }
};

} // namespace

namespace squisher {

ImageBuffer JpegDecoder::decode(const std::vector<std::uint8_t>& data) const {
    if (data.empty()) throw DecodeError("empty JPEG stream");

    jpeg_decompress_struct cinfo{};
    JpegErrorMgr jerr{};
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_throw<DecodeError>;
    jerr.pub.output_message = jpeg_output_message_log;

    jpeg_create_decompress(&cinfo);
    DecompressGuard guard{&cinfo};

    jpeg_mem_src(&cinfo, data.data(), static_cast<unsigned long>(data.size()));
    if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
        throw DecodeError("invalid JPEG header");
    }
    cinfo.out_color_space = JCS_RGB;
    jpeg_start_decompress(&cinfo);

    ImageBuffer image;
    image.width = cinfo.output_width;
    image.height = cinfo.output_height;
    image.has_alpha = false;
    image.pixels.resize(image.stride() * image.height);

    std::vector<unsigned char> row(static_cast<std::size_t>(cinfo.output_width) * cinfo.output_components);
    JSAMPROW row_ptr = row.data();
    while (cinfo.output_scanline < cinfo.output_height) {
        const unsigned y = cinfo.output_scanline;
        if (jpeg_read_scanlines(&cinfo, &row_ptr, 1) != 1) {
            throw DecodeError("truncated JPEG scanline data");
        }
        std::uint8_t* dst = image.pixels.data() + y * image.stride();
        for (unsigned x = 0; x < image.width; ++x) {
            dst[x * 4 + 0] = row[x * 3 + 0];
            dst[x * 4 + 1] = row[x * 3 + 1];
            dst[x * 4 + 2] = row[x * 3 + 2];
            dst[x * 4 + 3] = 0xFF;
        }
    }
    jpeg_finish_decompress(&cinfo);

    return image;
}

std::vector<std::uint8_t> JpegEncoder::encode(const ImageBuffer& image) const {
    if (image.empty()) throw EncodeError("cannot encode an empty image as JPEG");

    const std::vector<std::uint8_t> rgb = image.to_rgb();

    jpeg_compress_struct cinfo{};
    JpegErrorMgr jerr{};
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_throw<EncodeError>;
    jerr.pub.output_message = jpeg_output_message_log;

    unsigned char* mem = nullptr;
    unsigned long mem_size = 0;

    jpeg_create_compress(&cinfo);
    CompressGuard guard{&cinfo, &mem};

    jpeg_mem_dest(&cinfo, &mem, &mem_size);
    cinfo.image_width = image.width;
    cinfo.image_height = image.height;
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality_, TRUE);

    jpeg_start_compress(&cinfo, TRUE);
    const std::size_t row_stride = static_cast<std::size_t>(image.width) * 3;
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row_ptr = const_cast<JSAMPROW>(rgb.data() + cinfo.next_scanline * row_stride);
        jpeg_write_scanlines(&cinfo, &row_ptr, 1);
    }
    jpeg_finish_compress(&cinfo);

    return {mem, mem + mem_size};
}

} // namespace squisher
