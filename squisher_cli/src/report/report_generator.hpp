#ifndef SQUISHER_REPORT_GENERATOR_HPP
#define SQUISHER_REPORT_GENERATOR_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct Result {
    std::filesystem::path path;   // relative to the input root
    std::string status;           // OK, SKIPPED or FAIL
    std::size_t artifact_count{}; // files written for this source
    uintmax_t size_before{};      // source size in bytes
    uintmax_t size_artifacts{};   // sum of every artifact's size in bytes
    double seconds{};             // processing time
    std::string error_msg;        // failure or skip reason
};

void print_console_report(const std::vector<Result>& results,
                          unsigned num_threads,
                          double total_seconds);

/**
 * @brief Writes one CSV row per file plus a totals row.
 * @return false if @p output_path could not be written.
 */
bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       double total_seconds);

#endif // SQUISHER_REPORT_GENERATOR_HPP
