/**
 * @file config.hpp
 * @brief Validated, immutable parameter sets consumed by the pipelines.
 *
 * Configuration is built once at startup and passed by reference into
 * every pipeline; pipeline code never looks anything up on its own.
 * Every constructor validates its input and throws ConfigError on an
 * out-of-range value. Nothing is ever clamped.
 */

#ifndef SQUISHER_CONFIG_HPP
#define SQUISHER_CONFIG_HPP

#include <string>
#include <vector>

namespace squisher {

inline constexpr int kDefaultBrotliLevel = 5;
inline constexpr int kDefaultGzipLevel = 6;
inline constexpr int kDefaultDeflateLevel = kDefaultGzipLevel;
inline constexpr int kDefaultZstdLevel = 7;
inline constexpr float kDefaultWebpQuality = 80.0f;
inline constexpr float kLosslessWebpQuality = 75.0f;

/**
 * @brief Levels for the four stream codecs of the generic pipeline.
 */
class CompressionConfig {
public:
    /// Original tool defaults: brotli 5, gzip 6, deflate 6, zstd 7.
    CompressionConfig();

    /**
     * @throws ConfigError if a level is outside its codec's legal range
     * (brotli 1..11, gzip 1..9, deflate 1..9, zstd ZSTD_minCLevel()..ZSTD_maxCLevel()).
     */
    CompressionConfig(int brotli_level, int gzip_level, int deflate_level, int zstd_level);

    [[nodiscard]] int brotli_level() const noexcept { return brotli_level_; }
    [[nodiscard]] int gzip_level() const noexcept { return gzip_level_; }
    [[nodiscard]] int deflate_level() const noexcept { return deflate_level_; }
    [[nodiscard]] int zstd_level() const noexcept { return zstd_level_; }

    [[nodiscard]] static int min_zstd_level() noexcept;
    [[nodiscard]] static int max_zstd_level() noexcept;

private:
    int brotli_level_;
    int gzip_level_;
    int deflate_level_;
    int zstd_level_;
};

/**
 * @brief WebP encoding mode: lossless, or lossy at a quality in [0, 100].
 */
class WebpMode {
public:
    static WebpMode lossless() { return WebpMode(true, kLosslessWebpQuality); }

    /// @throws ConfigError if @p quality is not within [0, 100].
    static WebpMode lossy(float quality);

    [[nodiscard]] bool is_lossless() const noexcept { return lossless_; }

    /// Quality handed to the encoder; fixed at 75 for lossless mode.
    [[nodiscard]] float quality() const noexcept { return quality_; }

private:
    WebpMode(const bool lossless, const float quality) : lossless_(lossless), quality_(quality) {}

    bool lossless_;
    float quality_;
};

/**
 * @brief A named size bound for resized image variants.
 */
struct ResizeTier {
    std::string label;
    unsigned max_dimension;
};

/// small/256, medium/512, large/1024
std::vector<ResizeTier> default_resize_tiers();

/**
 * @brief Settings of the image pipeline.
 */
class ImageVariantConfig {
public:
    /// Lossy WebP at 80, resizing enabled with the default tiers.
    ImageVariantConfig();

    /**
     * @throws ConfigError if a tier label is empty or repeated, or a tier
     * has a zero max dimension.
     */
    ImageVariantConfig(WebpMode webp_mode,
                       bool resize_enabled,
                       std::vector<ResizeTier> resize_tiers,
                       bool skip_recompression);

    [[nodiscard]] const WebpMode& webp_mode() const noexcept { return webp_mode_; }
    [[nodiscard]] bool resize_enabled() const noexcept { return resize_enabled_; }
    [[nodiscard]] const std::vector<ResizeTier>& resize_tiers() const noexcept { return resize_tiers_; }
    [[nodiscard]] bool skip_recompression() const noexcept { return skip_recompression_; }

private:
    WebpMode webp_mode_;
    bool resize_enabled_;
    std::vector<ResizeTier> resize_tiers_;
    bool skip_recompression_;
};

/**
 * @brief Everything a run needs, assembled once at startup.
 */
struct Config {
    CompressionConfig compression;
    ImageVariantConfig images;
};

} // namespace squisher

#endif // SQUISHER_CONFIG_HPP
