//
// Created by Giuseppe Francione on 12/10/26.
//

#ifndef SUBSMITH_FILE_LOG_SINK_HPP
#define SUBSMITH_FILE_LOG_SINK_HPP

#include "../../../libsubsmith/include/log_sink.hpp"
#include "../../../libsubsmith/include/logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <stdexcept>
#include <string>

class FileLogSink final : public ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {
        if (!out_.is_open()) {
            throw std::runtime_error("Cannot open log file: " + filename.string());
        }
    }

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);

        std::lock_guard lock(mtx_);
        out_ << std::put_time(&local, "%Y-%m-%d %H:%M:%S ");
        out_ << "[" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // SUBSMITH_FILE_LOG_SINK_HPP
