#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include "../libsquisher/include/config.hpp"
#include "../libsquisher/include/errors.hpp"
#include "../libsquisher/include/generic_pipeline.hpp"

using namespace squisher;

namespace {

template <typename F>
bool throws_config_error(F&& f) {
    try {
        f();
    } catch (const ConfigError& e) {
        assert(e.kind() == ErrorKind::Config);
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Default compression levels..." << std::endl;
    const CompressionConfig defaults;
    assert(defaults.brotli_level() == 5);
    assert(defaults.gzip_level() == 6);
    assert(defaults.deflate_level() == 6);
    assert(defaults.zstd_level() == 7);

    std::cout << "[Test] Out-of-range levels are rejected, never clamped..." << std::endl;
    assert(throws_config_error([] { CompressionConfig(12, 6, 6, 7); }));
    assert(throws_config_error([] { CompressionConfig(0, 6, 6, 7); }));
    assert(throws_config_error([] { CompressionConfig(5, 10, 6, 7); }));
    assert(throws_config_error([] { CompressionConfig(5, 6, 0, 7); }));
    assert(throws_config_error([] { CompressionConfig(5, 6, 6, CompressionConfig::max_zstd_level() + 1); }));

    std::cout << "[Test] Boundary levels are accepted and used verbatim..." << std::endl;
    const CompressionConfig high(11, 9, 1, CompressionConfig::max_zstd_level());
    assert(high.brotli_level() == 11);
    assert(high.gzip_level() == 9);
    assert(high.deflate_level() == 1);
    assert(high.zstd_level() == CompressionConfig::max_zstd_level());

    const GenericCompressionPipeline pipeline(CompressionConfig(5, 6, 6, 7));
    assert(pipeline.codecs().size() == 4);
    assert(pipeline.codecs()[0]->extension() == "br");
    assert(pipeline.codecs()[0]->level() == 5);
    assert(pipeline.codecs()[1]->extension() == "gz");
    assert(pipeline.codecs()[2]->extension() == "zst");
    assert(pipeline.codecs()[2]->level() == 7);
    assert(pipeline.codecs()[3]->extension() == "zz");

    std::cout << "[Test] WebP modes..." << std::endl;
    assert(WebpMode::lossless().is_lossless());
    assert(WebpMode::lossless().quality() == 75.0f);
    assert(WebpMode::lossy(0.0f).quality() == 0.0f);
    assert(WebpMode::lossy(100.0f).quality() == 100.0f);
    assert(throws_config_error([] { (void)WebpMode::lossy(100.5f); }));
    assert(throws_config_error([] { (void)WebpMode::lossy(-1.0f); }));
    assert(throws_config_error([] { (void)WebpMode::lossy(std::numeric_limits<float>::quiet_NaN()); }));

    std::cout << "[Test] Image variant config..." << std::endl;
    const ImageVariantConfig images;
    assert(!images.webp_mode().is_lossless());
    assert(images.webp_mode().quality() == 80.0f);
    assert(images.resize_enabled());
    assert(!images.skip_recompression());
    assert(images.resize_tiers().size() == 3);
    assert(images.resize_tiers()[0].label == "small" && images.resize_tiers()[0].max_dimension == 256);
    assert(images.resize_tiers()[1].label == "medium" && images.resize_tiers()[1].max_dimension == 512);
    assert(images.resize_tiers()[2].label == "large" && images.resize_tiers()[2].max_dimension == 1024);

    assert(throws_config_error([] {
        ImageVariantConfig(WebpMode::lossless(), true, {{"", 100}}, false);
    }));
    assert(throws_config_error([] {
        ImageVariantConfig(WebpMode::lossless(), true, {{"tiny", 0}}, false);
    }));
    assert(throws_config_error([] {
        ImageVariantConfig(WebpMode::lossless(), true, {{"a", 10}, {"a", 20}}, false);
    }));

    std::cout << "[Test] PASSED" << std::endl;
    return 0;
}
