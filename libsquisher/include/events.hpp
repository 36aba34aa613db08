#ifndef SQUISHER_EVENTS_HPP
#define SQUISHER_EVENTS_HPP

#include "artifact.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace squisher {

/**
 * @brief Events published by ParallelExecutor while a run is in flight.
 *
 * Plain data carriers; subscribers (console output, CSV report) decide
 * what to do with them. Paths are the source file's relative path.
 */

/**
 * @brief Emitted when a worker picks up a file.
 */
struct FileProcessStartEvent {
    std::filesystem::path path;
};

/**
 * @brief Emitted when a file's pipeline finished and wrote all its outputs.
 */
struct FileProcessCompleteEvent {
    std::filesystem::path path;
    uintmax_t original_size = 0;           ///< Source size in bytes
    std::vector<OutputArtifact> artifacts; ///< Everything written for this file
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when a file's pipeline failed.
 */
struct FileProcessErrorEvent {
    std::filesystem::path path;
    std::optional<ErrorKind> kind; ///< Unset for exceptions not raised by the library
    std::string error_message;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when a file needed no work (e.g. already compressed).
 */
struct FileProcessSkippedEvent {
    std::filesystem::path path;
    std::string reason;
};

} // namespace squisher

#endif // SQUISHER_EVENTS_HPP
