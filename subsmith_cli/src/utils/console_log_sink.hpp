//
// Created by Giuseppe Francione on 12/10/26.
//

#ifndef SUBSMITH_CONSOLE_LOG_SINK_HPP
#define SUBSMITH_CONSOLE_LOG_SINK_HPP

#include "../../../libsubsmith/include/log_sink.hpp"
#include <iostream>

// Everything goes to stderr: stdout is left to the summary table.
class ConsoleLogSink final : public ILogSink {
public:
    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        switch (level) {
            case LogLevel::Debug:
                std::cerr << "\r[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cerr << "\r[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << "\r[WARN ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << "\r[ERROR][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::None:
                break;
        }
    }
};

#endif // SUBSMITH_CONSOLE_LOG_SINK_HPP
