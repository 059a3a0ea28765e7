//
// Created by Giuseppe Francione on 12/10/26.
//

#include "report_generator.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <sys/ioctl.h>
#include <unistd.h>

static bool is_stdout_a_tty() {
    return isatty(fileno(stdout)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string strip_ansi(const std::string& s) {
    static const std::regex ansi_pattern("\033\\[[0-9;]*m");
    return std::regex_replace(s, ansi_pattern, "");
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string artifact_list(const Result& r, const char* separator) {
    std::string out;
    for (size_t i = 0; i < r.artifacts.size(); ++i) {
        if (i > 0) out += separator;
        out += r.artifacts[i].filename().string();
    }
    return out;
}

static std::string seconds_str(const double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << seconds;
    return oss.str();
}

void print_console_report(const std::vector<Result>& results,
                          const std::size_t completed,
                          const std::size_t total,
                          const unsigned num_jobs,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stdout_a_tty();

    size_t max_lang = 10;
    size_t max_time = 10;
    size_t max_result = 8;
    size_t max_outputs = 8;
    for (const auto& r : results) {
        max_lang    = std::max(max_lang, r.language.size() + r.method.size() + 4);
        max_time    = std::max(max_time, seconds_str(r.seconds).size() + 2);
        max_outputs = std::max(max_outputs, std::min<size_t>(artifact_list(r, " ").size() + 2, 60));
    }

    const unsigned fixed_cols_width = static_cast<unsigned>(max_lang + max_time + max_result + max_outputs);
    const unsigned file_col_width = term_width > fixed_cols_width + 20
                                ? term_width - fixed_cols_width
                                : 20;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() + 1 <= max_len ? s : s.substr(0, max_len > 4 ? max_len - 4 : 0) + "...";
    };

    std::cout << "\n"
              << std::left << std::setw(file_col_width) << "File"
              << std::setw(max_lang)    << "Language"
              << std::setw(max_result)  << "Result"
              << std::setw(max_time)    << "Time(s)"
              << std::setw(max_outputs) << "Outputs"
              << "\n";

    auto sorted = results;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) {
        return a.path < b.path;
    });

    for (const auto& r : sorted) {
        const std::string outcome = r.success ? "OK" : "FAIL";
        const std::string colored = !use_colors ? outcome
                                  : r.success ? "\033[1;32mOK\033[0m" : "\033[1;31mFAIL\033[0m";
        const std::size_t pad = max_result > strip_ansi(colored).size() ? max_result - strip_ansi(colored).size() : 1;

        std::cout << std::left << std::setw(file_col_width) << truncate(r.path.filename().string(), file_col_width)
                  << std::setw(max_lang) << (r.language + " (" + r.method + ")")
                  << colored << std::string(pad, ' ')
                  << std::setw(max_time) << seconds_str(r.seconds)
                  << truncate(artifact_list(r, " "), max_outputs)
                  << "\n";
        if (!r.error_msg.empty()) {
            std::cout << "    " << (r.success ? "Warning: " : "Error: ") << r.error_msg << "\n";
        }
    }

    const auto failed = static_cast<std::size_t>(std::ranges::count_if(results, [](const Result& r) {
        return !r.success;
    }));
    std::cout << "\nCompleted: " << completed << "/" << total
              << " (" << (completed - std::min(failed, completed)) << " succeeded, " << failed << " failed)\n";
    std::cout << "Total time: " << seconds_str(total_seconds) << " s (" << num_jobs << " parallel job"
              << (num_jobs > 1U ? "s" : "") << ")\n";
}

void export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       const std::size_t completed,
                       const std::size_t total,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) {
        throw std::runtime_error("Cannot write report: " + output_path.string());
    }

    out << "File,Language,Detection,Result,Time(s),Outputs,Error\n";

    for (const auto& r : results) {
        out << csv_escape(r.path.filename().string()) << ","
            << csv_escape(r.language) << ","
            << csv_escape(r.method) << ","
            << (r.success ? "OK" : "FAIL") << ","
            << seconds_str(r.seconds) << ","
            << csv_escape(artifact_list(r, ";")) << ","
            << csv_escape(r.error_msg) << "\n";
    }

    out << "\n\nCompleted,Total,Total time(s)\n";
    out << completed << "," << total << "," << seconds_str(total_seconds) << "\n";
    if (!out) {
        throw std::runtime_error("Cannot write report: " + output_path.string());
    }
}
