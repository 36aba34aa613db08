#include "cli_parser.hpp"
#include <CLI/CLI.hpp>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Positional Arguments ---
    app.add_option("input_dir", settings.input_dir, "Directory tree to transcode.")
        ->required()
        ->check(CLI::ExistingDirectory);

    app.add_option("output_dir", settings.output_dir, "Directory receiving the mirrored artifacts.")
        ->required()
        ->check(!CLI::ExistingFile);

    // --- Codec levels ---
    app.add_option("--brotli-level", settings.brotli_level, "Brotli quality (1-11).")
        ->envname("BROTLI_LEVEL")
        ->capture_default_str();

    app.add_option("--gzip-level", settings.gzip_level, "gzip level (1-9).")
        ->envname("GZIP_LEVEL")
        ->capture_default_str();

    app.add_option("--deflate-level", settings.deflate_level, "Raw deflate level (1-9).")
        ->envname("DEFLATE_LEVEL")
        ->capture_default_str();

    app.add_option("--zstd-level", settings.zstd_level, "zstd level.")
        ->envname("ZSTD_LEVEL")
        ->capture_default_str();

    // --- Images ---
    app.add_flag("--webp-lossless", settings.webp_lossless,
                 "Encode WebP variants losslessly (quality is then fixed at 75).")
        ->envname("WEBP_LOSSLESS");

    app.add_option("--webp-quality", settings.webp_quality, "Lossy WebP quality (0-100).")
        ->envname("WEBP_QUALITY")
        ->capture_default_str();

    app.add_flag("--no-resize-images", settings.no_resize_images,
                 "Only render images at their original size.")
        ->envname("NO_RESIZE_IMAGES");

    app.add_flag("--no-compress-images", settings.no_compress_images,
                 "Copy images verbatim instead of re-encoding them.")
        ->envname("NO_COMPRESS_IMAGES");

    // --- Run ---
    app.add_option("--threads", settings.num_threads,
                   "Worker threads (0 = one per hardware thread).")
        ->capture_default_str()
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress console log output.");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
        ->default_val("INFO")
        ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Also append logs to this file.");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
        ->take_last();
}

squisher::Config make_config(const Settings& settings) {
    squisher::CompressionConfig compression(settings.brotli_level,
                                            settings.gzip_level,
                                            settings.deflate_level,
                                            settings.zstd_level);

    const squisher::WebpMode webp_mode = settings.webp_lossless
        ? squisher::WebpMode::lossless()
        : squisher::WebpMode::lossy(settings.webp_quality);

    squisher::ImageVariantConfig images(webp_mode,
                                        !settings.no_resize_images,
                                        squisher::default_resize_tiers(),
                                        settings.no_compress_images);

    return squisher::Config{std::move(compression), std::move(images)};
}
