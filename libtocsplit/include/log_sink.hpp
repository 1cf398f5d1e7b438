/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface behind Logger.
 */

#ifndef TOCSPLIT_LOG_SINK_HPP
#define TOCSPLIT_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information, useful for developers
    Info,    ///< General informational messages about normal operation
    Warning, ///< Indications of potential issues or unexpected states
    Error    ///< Errors that require attention or intervention
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink define how log messages are delivered
 * (console, file, an embedding application). Logger fans every
 * message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // TOCSPLIT_LOG_SINK_HPP
