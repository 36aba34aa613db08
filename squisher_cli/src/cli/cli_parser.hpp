#ifndef SQUISHER_CLI_PARSER_HPP
#define SQUISHER_CLI_PARSER_HPP

#include "../../../libsquisher/include/config.hpp"
#include <filesystem>
#include <string>

// forward declaration
namespace CLI { class App; }

struct Settings {
    std::filesystem::path input_dir;
    std::filesystem::path output_dir;

    int brotli_level = squisher::kDefaultBrotliLevel;
    int gzip_level = squisher::kDefaultGzipLevel;
    int deflate_level = squisher::kDefaultDeflateLevel;
    int zstd_level = squisher::kDefaultZstdLevel;

    bool webp_lossless = false;
    float webp_quality = squisher::kDefaultWebpQuality;
    bool no_resize_images = false;
    bool no_compress_images = false;

    bool quiet = false;
    unsigned num_threads = 0; ///< 0 = hardware concurrency
    std::string log_level = "INFO";
    std::filesystem::path log_file;
    std::filesystem::path report_path;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 *
 * Every codec and image option also reads the environment variable the
 * tool has always honoured (BROTLI_LEVEL, WEBP_QUALITY, ...) when the
 * option is not given on the command line.
 *
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

/**
 * @brief Builds the validated run configuration from parsed settings.
 * @throws squisher::ConfigError if a value is out of range.
 */
squisher::Config make_config(const Settings& settings);

#endif // SQUISHER_CLI_PARSER_HPP
