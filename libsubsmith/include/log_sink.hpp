//
// Created by Giuseppe Francione on 02/10/26.
//

#ifndef SUBSMITH_LOG_SINK_HPP
#define SUBSMITH_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Ordered from most to least verbose, so a sink threshold can be
 * compared with the usual relational operators.
 */
enum class LogLevel {
    Debug,   ///< Per-entry and per-command diagnostics
    Info,    ///< Job lifecycle and batch progress
    Warning, ///< Recoverable problems (skipped artifact, unreadable file)
    Error,   ///< Failed jobs and fatal batch errors
    None     ///< Threshold only: a sink set to None receives nothing
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where a message ends up (console, file, a
 * test buffer). The Logger drops messages below the sink threshold
 * before calling log().
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Deliver a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that produced the message (e.g. "scheduler").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;

    LogLevel min_level = LogLevel::Debug; ///< Messages below this level are not delivered
};

#endif // SUBSMITH_LOG_SINK_HPP
