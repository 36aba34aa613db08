#include "../../include/directory_walker.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace squisher {

std::vector<fs::path> collect_regular_files(const fs::path& root) {
    std::vector<fs::path> result;
    std::vector<fs::path> pending{root};

    while (!pending.empty()) {
        const fs::path dir = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error, "Error finding file: " + dir.string() + ": " + ec.message(), "walker");
            continue;
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            std::error_code status_ec;
            const fs::file_status status = it->symlink_status(status_ec);
            if (status_ec) {
                Logger::log(LogLevel::Error, "Error finding file: " + it->path().string() + ": " + status_ec.message(), "walker");
                continue;
            }
            if (fs::is_directory(status)) {
                pending.push_back(it->path());
            } else if (fs::is_regular_file(status)) {
                result.push_back(it->path());
            }
        }
        if (ec) {
            Logger::log(LogLevel::Error, "Error finding file: " + dir.string() + ": " + ec.message(), "walker");
        }
    }

    std::ranges::sort(result);
    Logger::log(LogLevel::Debug, "walker collected " + std::to_string(result.size()) + " files", "walker");
    return result;
}

} // namespace squisher
