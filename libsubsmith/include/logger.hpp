//
// Created by Giuseppe Francione on 02/10/26.
//

/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade shared by the library and the CLI.
 */

#ifndef SUBSMITH_LOGGER_HPP
#define SUBSMITH_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for subsmith.
 *
 * Workers of the job scheduler log concurrently, so every call takes
 * the sink lock. Sinks are owned by the Logger.
 */
class Logger {
public:
    /**
     * @brief Register a sink. The Logger takes ownership.
     * @param sink Sink implementation; null pointers are ignored.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /// @brief Remove all configured sinks.
    static void clear_sinks();

    /**
     * @brief Log a message to every sink whose threshold admits @p level.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "subsmith").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "subsmith");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::None:    return "NONE";
        }
        return "";
    }

    /**
     * @brief Parse a level name as accepted by --log-level.
     * Case-insensitive; "WARN" and "WARNING" are both accepted.
     * Unknown names map to LogLevel::Error.
     */
    static LogLevel string_to_level(std::string level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

#endif // SUBSMITH_LOGGER_HPP
