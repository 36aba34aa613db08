#include "report_generator.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

std::string fixed2(const double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

struct Totals {
    std::size_t ok = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::size_t artifacts = 0;
};

Totals count(const std::vector<Result>& results) {
    Totals t;
    for (const auto& r : results) {
        if (r.status == "OK") ++t.ok;
        else if (r.status == "SKIPPED") ++t.skipped;
        else ++t.failed;
        t.artifacts += r.artifact_count;
    }
    return t;
}

} // namespace

void print_console_report(const std::vector<Result>& results,
                          const unsigned num_threads,
                          const double total_seconds) {
    auto sorted = results;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) {
        return a.path < b.path;
    });

    std::size_t file_col = 10;
    for (const auto& r : sorted) {
        file_col = std::max(file_col, r.path.string().size() + 2);
    }

    std::cerr << "\n"
              << std::left << std::setw(static_cast<int>(file_col)) << "File"
              << std::setw(9)  << "Result"
              << std::setw(11) << "Artifacts"
              << std::setw(12) << "Before(KB)"
              << std::setw(14) << "Outputs(KB)"
              << std::setw(10) << "Time(s)"
              << "Error"
              << "\n";
    for (const auto& r : sorted) {
        std::cerr << std::left << std::setw(static_cast<int>(file_col)) << r.path.string()
                  << std::setw(9)  << r.status
                  << std::setw(11) << r.artifact_count
                  << std::setw(12) << (r.size_before / 1024)
                  << std::setw(14) << (r.size_artifacts / 1024)
                  << std::setw(10) << fixed2(r.seconds)
                  << r.error_msg
                  << "\n";
    }

    const Totals t = count(results);
    std::cerr << "\nFiles: " << results.size()
              << " (" << t.ok << " ok, " << t.skipped << " skipped, " << t.failed << " failed)\n"
              << "Artifacts written: " << t.artifacts << "\n"
              << "Total time: " << fixed2(total_seconds) << " s (" << num_threads << " thread"
              << (num_threads > 1U ? "s" : "") << ")\n";
}

bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "File,Result,Artifacts,Before(KB),Outputs(KB),Time(s),Error\n";
    for (const auto& r : results) {
        out << csv_escape(r.path.string()) << ","
            << csv_escape(r.status) << ","
            << r.artifact_count << ","
            << (r.size_before / 1024) << ","
            << (r.size_artifacts / 1024) << ","
            << fixed2(r.seconds) << ","
            << csv_escape(r.error_msg) << "\n";
    }

    const Totals t = count(results);
    out << "\n\nFiles,Succeeded,Skipped,Failed,Artifacts,Total time(s)\n";
    out << results.size() << "," << t.ok << "," << t.skipped << "," << t.failed << ","
        << t.artifacts << "," << fixed2(total_seconds) << "\n";
    return static_cast<bool>(out);
}
