#include "../../include/config.hpp"
#include "../../include/errors.hpp"
#include <zstd.h>
#include <cmath>
#include <unordered_set>

namespace squisher {

namespace {

int checked_level(const char* name, const int value, const int min, const int max) {
    if (value < min || value > max) {
        throw ConfigError(std::string(name) + " must be between " + std::to_string(min) +
                          " and " + std::to_string(max) + ", inclusive (got " +
                          std::to_string(value) + ")");
    }
    return value;
}

} // namespace

CompressionConfig::CompressionConfig()
    : CompressionConfig(kDefaultBrotliLevel, kDefaultGzipLevel, kDefaultDeflateLevel, kDefaultZstdLevel) {}

CompressionConfig::CompressionConfig(const int brotli_level,
                                     const int gzip_level,
                                     const int deflate_level,
                                     const int zstd_level)
    : brotli_level_(checked_level("brotli level", brotli_level, 1, 11)),
      gzip_level_(checked_level("gzip level", gzip_level, 1, 9)),
      deflate_level_(checked_level("deflate level", deflate_level, 1, 9)),
      zstd_level_(checked_level("zstd level", zstd_level, min_zstd_level(), max_zstd_level())) {}

int CompressionConfig::min_zstd_level() noexcept {
    return ZSTD_minCLevel();
}

int CompressionConfig::max_zstd_level() noexcept {
    return ZSTD_maxCLevel();
}

WebpMode WebpMode::lossy(const float quality) {
    if (std::isnan(quality) || quality < 0.0f || quality > 100.0f) {
        throw ConfigError("webp quality must be a number between 0 and 100, inclusive (got " +
                          std::to_string(quality) + ")");
    }
    return WebpMode(false, quality);
}

std::vector<ResizeTier> default_resize_tiers() {
    return {
        {"small", 256},
        {"medium", 512},
        {"large", 1024},
    };
}

ImageVariantConfig::ImageVariantConfig()
    : ImageVariantConfig(WebpMode::lossy(kDefaultWebpQuality), true, default_resize_tiers(), false) {}

ImageVariantConfig::ImageVariantConfig(WebpMode webp_mode,
                                       const bool resize_enabled,
                                       std::vector<ResizeTier> resize_tiers,
                                       const bool skip_recompression)
    : webp_mode_(webp_mode),
      resize_enabled_(resize_enabled),
      resize_tiers_(std::move(resize_tiers)),
      skip_recompression_(skip_recompression) {
    std::unordered_set<std::string> seen;
    for (const auto& tier : resize_tiers_) {
        if (tier.label.empty()) {
            throw ConfigError("resize tier label must not be empty");
        }
        if (tier.max_dimension == 0) {
            throw ConfigError("resize tier '" + tier.label + "' must have a positive max dimension");
        }
        if (!seen.insert(tier.label).second) {
            throw ConfigError("resize tier '" + tier.label + "' is defined twice");
        }
    }
}

} // namespace squisher
