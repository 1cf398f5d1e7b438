/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * Logger is the single entry point for all logging in tocsplit. It
 * delegates messages to the registered ILogSink implementations; with
 * no sink installed, messages are dropped.
 */

#ifndef TOCSPLIT_LOGGER_HPP
#define TOCSPLIT_LOGGER_HPP

#include "log_sink.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class Logger {
public:
    ///< Handle returned by add_sink(), used to remove that sink again.
    using SinkId = std::size_t;

    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     * @return Identifier usable with remove_sink(), or 0 if sink was null.
     */
    static SinkId add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove one sink previously added with add_sink().
     * @return true if a sink with that id was installed.
     */
    static bool remove_sink(SinkId id);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "tocsplit").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "tocsplit");

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
     * @brief Converts a string to its LogLevel.
     * Accepts "DEBUG", "INFO", "WARN"/"WARNING" and "ERROR" in any case.
     * Anything else maps to LogLevel::Error.
     */
    static LogLevel string_to_level(const std::string& level);

private:
    static std::vector<std::pair<SinkId, std::unique_ptr<ILogSink>>> sinks_;
    static SinkId next_id_;
    static std::mutex mtx_;
};

#endif // TOCSPLIT_LOGGER_HPP
