/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 *
 * Every component of the library logs through Logger::log with its own
 * tag; the CLI decides which sinks receive the messages.
 */

#ifndef SQUISHER_LOGGER_HPP
#define SQUISHER_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class Logger {
public:
    /**
     * @brief Add a sink. The Logger takes ownership.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /// Remove all configured sinks.
    static void clear_sinks();

    /**
     * @brief Forward a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "squisher").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "squisher");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parse a level name as accepted by --log-level.
     *
     * Case-insensitive. "NONE" and unknown names yield std::nullopt,
     * which the console sink treats as "log nothing".
     */
    static std::optional<LogLevel> string_to_level(const std::string& level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

#endif // SQUISHER_LOGGER_HPP
