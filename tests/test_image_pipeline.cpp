#include <cassert>
#include <cstdio>
#include <iostream>
#include <map>
#include <jpeglib.h>
#include "../libsquisher/include/artifact.hpp"
#include "../libsquisher/include/avif_codec.hpp"
#include "../libsquisher/include/errors.hpp"
#include "../libsquisher/include/file_utils.hpp"
#include "../libsquisher/include/image_decoder_registry.hpp"
#include "../libsquisher/include/image_pipeline.hpp"
#include "../libsquisher/include/jpeg_codec.hpp"
#include "../libsquisher/include/png_codec.hpp"
#include "../libsquisher/include/webp_codec.hpp"
#include "test_utils.hpp"

using namespace squisher;
namespace fs = std::filesystem;

namespace {

ImageBuffer decode_artifact(const ImageDecoderRegistry& decoders, const OutputArtifact& artifact) {
    const auto bytes = read_file_bytes(artifact.path);
    assert(!bytes.empty());
    return decoders.select(artifact.path, bytes).decode(bytes);
}

SourceFile put_image(const fs::path& root, const fs::path& rel, const std::vector<std::uint8_t>& bytes) {
    test_utils::write_file(root / rel, bytes);
    return SourceFile::from(root, root / rel);
}

SourceFile put_png(const fs::path& root, const fs::path& rel, const ImageBuffer& image) {
    return put_image(root, rel, PngEncoder().encode(image));
}

/// Channel count recorded in a JPEG header, read straight from libjpeg.
int jpeg_components(const std::vector<std::uint8_t>& bytes) {
    jpeg_decompress_struct cinfo{};
    jpeg_error_mgr jerr{};
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, bytes.data(), static_cast<unsigned long>(bytes.size()));
    const int header = jpeg_read_header(&cinfo, TRUE);
    assert(header == JPEG_HEADER_OK);
    const int components = cinfo.num_components;
    jpeg_destroy_decompress(&cinfo);
    return components;
}

void put_u16(std::vector<std::uint8_t>& out, const unsigned v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
}

void put_u32(std::vector<std::uint8_t>& out, const std::uint32_t v) {
    put_u16(out, v & 0xFFFF);
    put_u16(out, v >> 16);
}

/**
 * @brief Uncompressed bottom-up BMP with a BITMAPINFOHEADER.
 *
 * 24 bpp stores BGR with rows padded to 4 bytes; 32 bpp stores BGRA.
 */
std::vector<std::uint8_t> encode_bmp(const ImageBuffer& image, const unsigned bpp) {
    const std::size_t bytes_pp = bpp / 8;
    const std::size_t row = (image.width * bytes_pp + 3) & ~static_cast<std::size_t>(3);
    const auto pixel_bytes = static_cast<std::uint32_t>(row * image.height);

    std::vector<std::uint8_t> out;
    out.push_back('B');
    out.push_back('M');
    put_u32(out, 54 + pixel_bytes);
    put_u32(out, 0);
    put_u32(out, 54);
    put_u32(out, 40);
    put_u32(out, image.width);
    put_u32(out, image.height);
    put_u16(out, 1);
    put_u16(out, bpp);
    put_u32(out, 0); // BI_RGB
    put_u32(out, pixel_bytes);
    put_u32(out, 2835);
    put_u32(out, 2835);
    put_u32(out, 0);
    put_u32(out, 0);

    for (unsigned y = image.height; y-- > 0;) {
        const std::uint8_t* src = image.pixels.data() + y * image.stride();
        std::size_t written = 0;
        for (unsigned x = 0; x < image.width; ++x, src += 4) {
            out.push_back(src[2]);
            out.push_back(src[1]);
            out.push_back(src[0]);
            if (bpp == 32) out.push_back(src[3]);
            written += bytes_pp;
        }
        for (; written < row; ++written) out.push_back(0);
    }
    return out;
}

const std::map<std::string, std::pair<unsigned, unsigned>> kExpectedDims = {
    {"", {600, 300}}, {"small", {256, 128}}, {"medium", {512, 256}}, {"large", {600, 300}},
};

/**
 * @brief Checks the 16 outputs of a 600x300 source rendered with the default tiers.
 */
void check_full_render(const ImageDecoderRegistry& decoders,
                       const std::vector<OutputArtifact>& artifacts,
                       const fs::path& dest,
                       const bool source_alpha) {
    assert(artifacts.size() == 16);
    const ArtifactKind order[] = {ArtifactKind::Webp, ArtifactKind::Avif, ArtifactKind::Jpeg, ArtifactKind::Png};

    for (std::size_t i = 0; i < artifacts.size(); ++i) {
        const auto& a = artifacts[i];
        assert(a.kind == order[i % 4]);
        assert(a.path.parent_path() == dest.parent_path());
        assert(fs::exists(a.path));

        const ImageBuffer decoded = decode_artifact(decoders, a);
        const auto [w, h] = kExpectedDims.at(a.variant_label.value_or(""));
        assert(decoded.width == w && decoded.height == h);

        switch (a.kind) {
            case ArtifactKind::Jpeg: assert(jpeg_components(read_file_bytes(a.path)) == 3); break;
            case ArtifactKind::Png:  assert(decoded.has_alpha == source_alpha); break;
            case ArtifactKind::Webp: assert(decoded.has_alpha == source_alpha); break;
            default: break;
        }
    }
}

} // namespace

int main() {
    test_utils::ScratchDir scratch("image");
    const fs::path in_root = scratch / "in";
    const fs::path out_root = scratch / "out";
    const ImageDecoderRegistry decoders;

    std::cout << "[Test] Original plus three tiers in four formats..." << std::endl;
    {
        const ImageTranscodingPipeline pipeline{ImageVariantConfig()};
        const SourceFile source = put_png(in_root, "img/photo.png", test_utils::gradient(600, 300, true));
        const fs::path dest = out_root / source.relative_path;

        const auto artifacts = pipeline.run(source, dest);
        check_full_render(decoders, artifacts, dest, true);
        assert(artifacts[0].path == dest.parent_path() / "photo.webp");
        assert(artifacts[6].path == dest.parent_path() / "photo-small.jpeg");
        assert(artifacts[15].path == dest.parent_path() / "photo-large.png");
        // the source itself is never copied when recompressing
        assert(!fs::exists(dest));

        std::cout << "[Test] Second run fails on the first existing output..." << std::endl;
        bool threw = false;
        try {
            (void)pipeline.run(source, dest);
        } catch (const DestinationExistsError& e) {
            threw = true;
            assert(e.path() == dest.parent_path() / "photo.webp");
        }
        assert(threw);
    }

    std::cout << "[Test] Every supported source format renders all sixteen outputs..." << std::endl;
    {
        const ImageTranscodingPipeline pipeline{ImageVariantConfig()};
        const ImageBuffer opaque = test_utils::gradient(600, 300, false);
        const ImageBuffer translucent = test_utils::gradient(600, 300, true);

        struct Case {
            const char* rel;
            std::vector<std::uint8_t> bytes;
            bool alpha;
        };
        const Case cases[] = {
            {"bmp24/photo.bmp", encode_bmp(opaque, 24), false},
            {"bmp32/photo.bmp", encode_bmp(translucent, 32), true},
            {"jpg/photo.jpg", JpegEncoder().encode(opaque), false},
            {"webp/photo.webp", WebpEncoder(WebpMode::lossless()).encode(translucent), true},
            {"avif/photo.avif", AvifEncoder().encode(opaque), false},
        };
        for (const auto& c : cases) {
            std::cout << "[Test]   " << c.rel << std::endl;
            const SourceFile source = put_image(in_root, c.rel, c.bytes);
            const fs::path dest = out_root / source.relative_path;
            check_full_render(decoders, pipeline.run(source, dest), dest, c.alpha);
        }

        std::cout << "[Test] BMP pixels survive decoding..." << std::endl;
        const auto bmp24 = read_file_bytes(in_root / "bmp24/photo.bmp");
        const ImageBuffer from24 = decoders.select("photo.bmp", bmp24).decode(bmp24);
        assert(!from24.has_alpha);
        assert(from24.pixels == opaque.pixels);
        const auto bmp32 = read_file_bytes(in_root / "bmp32/photo.bmp");
        const ImageBuffer from32 = decoders.select("photo.bmp", bmp32).decode(bmp32);
        assert(from32.has_alpha);
        assert(from32.pixels == translucent.pixels);
    }

    std::cout << "[Test] Resizing disabled gives four outputs..." << std::endl;
    {
        const ImageTranscodingPipeline pipeline{
            ImageVariantConfig(WebpMode::lossless(), false, default_resize_tiers(), false)};
        const SourceFile source = put_png(in_root, "opaque.png", test_utils::gradient(120, 80, false));
        const auto artifacts = pipeline.run(source, out_root / source.relative_path);
        assert(artifacts.size() == 4);
        for (const auto& a : artifacts) {
            assert(!a.variant_label);
            const ImageBuffer decoded = decode_artifact(decoders, a);
            assert(decoded.width == 120 && decoded.height == 80);
            if (a.kind == ArtifactKind::Png) assert(!decoded.has_alpha);
        }

        std::cout << "[Test] Lossless WebP keeps pixels exactly..." << std::endl;
        const ImageBuffer webp = decode_artifact(decoders, artifacts[0]);
        assert(webp.pixels == test_utils::gradient(120, 80, false).pixels);
    }

    std::cout << "[Test] Skipping recompression copies the source once..." << std::endl;
    {
        const ImageTranscodingPipeline pipeline{
            ImageVariantConfig(WebpMode::lossy(80.0f), true, default_resize_tiers(), true)};
        const SourceFile source = put_png(in_root, "copy/raw.png", test_utils::gradient(32, 32, true));
        const fs::path dest = out_root / source.relative_path;

        const auto first = pipeline.run(source, dest);
        assert(first.size() == 1);
        assert(first[0].kind == ArtifactKind::Original);
        assert(read_file_bytes(dest) == read_file_bytes(source.absolute_path));
        assert(!fs::exists(dest.parent_path() / "raw.webp"));

        // an existing destination is skipped, not an error
        const auto second = pipeline.run(source, dest);
        assert(second.empty());
    }

    std::cout << "[Test] Undecodable bytes are a decode error..." << std::endl;
    {
        const ImageTranscodingPipeline pipeline{ImageVariantConfig()};
        test_utils::write_text(in_root / "broken.png", "this is not a png");
        const SourceFile source = SourceFile::from(in_root, in_root / "broken.png");
        bool threw = false;
        try {
            (void)pipeline.run(source, out_root / source.relative_path);
        } catch (const DecodeError& e) {
            threw = true;
            assert(e.kind() == ErrorKind::Decode);
        }
        assert(threw);
        assert(!fs::exists(out_root / "broken.webp"));
    }

    std::cout << "[Test] PASSED" << std::endl;
    return 0;
}
