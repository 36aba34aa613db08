#ifndef SQUISHER_LOG_SINK_HPP
#define SQUISHER_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Per-codec progress, useful when chasing a single file
    Info,    ///< Per-file start/finish lines and run summary
    Warning, ///< Traversal problems and other recoverable oddities
    Error    ///< Failed files and fatal startup errors
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file). The Logger
 * facade forwards every message to each installed sink.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that produced the message.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // SQUISHER_LOG_SINK_HPP
