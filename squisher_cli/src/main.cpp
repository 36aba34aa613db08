#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libsquisher/include/directory_walker.hpp"
#include "../../libsquisher/include/errors.hpp"
#include "../../libsquisher/include/event_bus.hpp"
#include "../../libsquisher/include/events.hpp"
#include "../../libsquisher/include/logger.hpp"
#include "../../libsquisher/include/parallel_executor.hpp"
#include "../../libsquisher/include/path_mapper.hpp"
#include "../../libsquisher/include/pipeline_registry.hpp"

using namespace squisher;
namespace fs = std::filesystem;

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

double to_seconds(const std::chrono::milliseconds ms) {
    return static_cast<double>(ms.count()) / 1000.0;
}

std::string format_seconds(const double seconds) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", seconds);
    return buf;
}

uintmax_t artifacts_size(const std::vector<OutputArtifact>& artifacts) {
    uintmax_t total = 0;
    for (const auto& a : artifacts) {
        std::error_code ec;
        const auto s = fs::file_size(a.path, ec);
        if (!ec) total += s;
    }
    return total;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"asset-squisher: pre-compress a directory tree into web-ready artifacts."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp& e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion& e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError& e) {
        (void)app.exit(e);
        return kExitUsage;
    }

    Logger::clear_sinks();
    const std::optional<LogLevel> console_level = Logger::string_to_level(settings.log_level);
    if (!settings.quiet && console_level) {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = *console_level;
        Logger::add_sink(std::move(console_sink));
    }
    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file);
        if (!file_sink->is_open()) {
            std::cerr << "Cannot open log file: " << settings.log_file.string() << std::endl;
            return kExitUsage;
        }
        Logger::add_sink(std::move(file_sink));
    }

    std::optional<Config> config;
    try {
        config = make_config(settings);
    } catch (const ConfigError& e) {
        Logger::log(LogLevel::Error, std::string("Invalid configuration: ") + e.what(), "main");
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return kExitUsage;
    }

    const auto files = collect_regular_files(settings.input_dir);
    Logger::log(LogLevel::Info, "found " + std::to_string(files.size()) + " files under " +
                settings.input_dir.string(), "main");

    EventBus bus;
    std::mutex results_mtx;
    std::vector<Result> results;

    bus.subscribe<FileProcessStartEvent>([](const FileProcessStartEvent& e) {
        Logger::log(LogLevel::Info, "compressing file " + e.path.string(), "main");
    });

    bus.subscribe<FileProcessCompleteEvent>([&](const FileProcessCompleteEvent& e) {
        const double seconds = to_seconds(e.duration);
        Logger::log(LogLevel::Info, "compressed " + e.path.string() + " in " + format_seconds(seconds) + " seconds", "main");

        Result r;
        r.path = e.path;
        r.status = "OK";
        r.artifact_count = e.artifacts.size();
        r.size_before = e.original_size;
        r.size_artifacts = artifacts_size(e.artifacts);
        r.seconds = seconds;
        std::lock_guard lock(results_mtx);
        results.push_back(std::move(r));
    });

    bus.subscribe<FileProcessSkippedEvent>([&](const FileProcessSkippedEvent& e) {
        Logger::log(LogLevel::Info, "skipping " + e.path.string() + ": " + e.reason, "main");

        Result r;
        r.path = e.path;
        r.status = "SKIPPED";
        r.error_msg = e.reason;
        std::lock_guard lock(results_mtx);
        results.push_back(std::move(r));
    });

    bus.subscribe<FileProcessErrorEvent>([&](const FileProcessErrorEvent& e) {
        Result r;
        r.path = e.path;
        r.status = "FAIL";
        r.seconds = to_seconds(e.duration);
        r.error_msg = e.kind ? std::string(error_kind_to_string(*e.kind)) + ": " + e.error_message
                             : e.error_message;
        std::lock_guard lock(results_mtx);
        results.push_back(std::move(r));
    });

    const unsigned threads = settings.num_threads != 0 ? settings.num_threads
                                                       : std::thread::hardware_concurrency();

    const PipelineRegistry registry(*config);
    ParallelExecutor executor(registry, PathMapper(settings.output_dir), settings.input_dir, bus, threads);

    const auto start_total = std::chrono::steady_clock::now();
    (void)executor.run(files);
    const double total_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_total).count();

    if (!settings.report_path.empty()) {
        if (!export_csv_report(results, settings.report_path, total_seconds)) {
            Logger::log(LogLevel::Error, "Cannot write report: " + settings.report_path.string(), "main");
        }
    }
    if (!settings.quiet) {
        print_console_report(results, threads == 0 ? 1 : threads, total_seconds);
    }

    return executor.any_failure() ? kExitFailure : 0;
}
