#include "../../include/png_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <cstring>
#include <string>

namespace squisher {

namespace {

    /**
     * @brief libpng error handlers that throw a C++ exception.
     */
    void png_read_error_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
        throw DecodeError(std::string("libpng: ") + msg);
    }

    void png_write_error_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Error, std::string("libpng: ") + msg, "libpng");
        throw EncodeError(std::string("libpng: ") + msg);
    }

    void png_warning_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
    }

    /**
     * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
     */
    struct PngRead {
        png_structp png = nullptr;
        png_infop info = nullptr;

        ~PngRead() {
            if (png || info) png_destroy_read_struct(&png, &info, nullptr);
        }
    };

    /**
     * @brief RAII wrapper for libpng write structs (png_structp, png_infop).
     */
    struct PngWrite {
        png_structp png = nullptr;
        png_infop info = nullptr;

        ~PngWrite() {
            if (png || info) png_destroy_write_struct(&png, &info);
        }
    };

    struct MemoryReader {
        const std::vector<std::uint8_t>& data;
        std::size_t offset = 0;
    };

    void read_from_memory(const png_structp png, const png_bytep out, const png_size_t length) {
        auto* reader = static_cast<MemoryReader*>(png_get_io_ptr(png));
        if (reader->offset + length > reader->data.size()) {
            png_error(png, "unexpected end of PNG data");
        }
        std::memcpy(out, reader->data.data() + reader->offset, length);
        reader->offset += length;
    }

    void write_to_memory(const png_structp png, const png_bytep data, const png_size_t length) {
        auto* out = static_cast<std::vector<std::uint8_t>*>(png_get_io_ptr(png));
        out->insert(out->end(), data, data + length);
    }

    void flush_memory(png_structp) {}

} // namespace

ImageBuffer PngDecoder::decode(const std::vector<std::uint8_t>& data) const {
    if (data.size() < 8 || png_sig_cmp(data.data(), 0, 8) != 0) {
        throw DecodeError("not a PNG stream");
    }

    PngRead rd;
    rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!rd.png) throw DecodeError("png_create_read_struct failed");
    png_set_error_fn(rd.png, nullptr, png_read_error_fn, png_warning_fn);

    rd.info = png_create_info_struct(rd.png);
    if (!rd.info) throw DecodeError("png_create_info_struct failed");
    if (setjmp(png_jmpbuf(rd.png))) throw DecodeError("libpng read error");

    MemoryReader reader{data};
    png_set_read_fn(rd.png, &reader, read_from_memory);
    png_read_info(rd.png, rd.info);

    png_uint_32 width = 0, height = 0;
    int bit_depth = 0, color_type = 0;
    png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

    const bool has_trns = png_get_valid(rd.png, rd.info, PNG_INFO_tRNS) != 0;
    const bool has_alpha = (color_type & PNG_COLOR_MASK_ALPHA) != 0 || has_trns;

    if (bit_depth == 16) png_set_strip_16(rd.png);
    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(rd.png);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
    if (has_trns) png_set_tRNS_to_alpha(rd.png);
    if (!has_alpha) png_set_filler(rd.png, 0xFF, PNG_FILLER_AFTER);
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(rd.png);
    png_set_interlace_handling(rd.png);

    png_read_update_info(rd.png, rd.info);
    // the buffer is now guaranteed to be rgba8

    const std::size_t rowbytes = png_get_rowbytes(rd.png, rd.info);
    if (rowbytes != static_cast<std::size_t>(width) * 4) {
        throw DecodeError("rowbytes mismatch, expected RGBA8");
    }

    ImageBuffer image;
    image.width = width;
    image.height = height;
    image.has_alpha = has_alpha;
    image.pixels.resize(rowbytes * height);

    std::vector<png_bytep> rows(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        rows[y] = image.pixels.data() + y * rowbytes;
    }
    png_read_image(rd.png, rows.data());
    png_read_end(rd.png, nullptr);

    return image;
}

std::vector<std::uint8_t> PngEncoder::encode(const ImageBuffer& image) const {
    if (image.empty()) throw EncodeError("cannot encode an empty image as PNG");

    std::vector<std::uint8_t> out;

    PngWrite wr;
    wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!wr.png) throw EncodeError("png_create_write_struct failed");
    png_set_error_fn(wr.png, nullptr, png_write_error_fn, png_warning_fn);
    wr.info = png_create_info_struct(wr.png);
    if (!wr.info) throw EncodeError("png_create_info_struct failed");
    if (setjmp(png_jmpbuf(wr.png))) throw EncodeError("libpng write error");

    png_set_write_fn(wr.png, &out, write_to_memory, flush_memory);

    const int color_type = image.has_alpha ? PNG_COLOR_TYPE_RGBA : PNG_COLOR_TYPE_RGB;
    png_set_IHDR(wr.png, wr.info, image.width, image.height, 8, color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
    png_write_info(wr.png, wr.info);

    if (image.has_alpha) {
        for (unsigned y = 0; y < image.height; ++y) {
            png_write_row(wr.png, image.pixels.data() + y * image.stride());
        }
    } else {
        std::vector<std::uint8_t> row(static_cast<std::size_t>(image.width) * 3);
        for (unsigned y = 0; y < image.height; ++y) {
            const std::uint8_t* src = image.pixels.data() + y * image.stride();
            for (unsigned x = 0; x < image.width; ++x) {
                row[x * 3 + 0] = src[x * 4 + 0];
                row[x * 3 + 1] = src[x * 4 + 1];
                row[x * 3 + 2] = src[x * 4 + 2];
            }
            png_write_row(wr.png, row.data());
        }
    }
    png_write_end(wr.png, nullptr);

    return out;
}

} // namespace squisher
