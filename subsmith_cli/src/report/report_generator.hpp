//
// Created by Giuseppe Francione on 12/10/26.
//

#ifndef SUBSMITH_REPORT_GENERATOR_HPP
#define SUBSMITH_REPORT_GENERATOR_HPP

#include <vector>
#include <string>
#include <filesystem>

struct Result {
    std::filesystem::path path;  // source media file
    std::string language;        // language passed to the engine
    std::string method;          // detector that chose it
    bool success{};              // transcription succeeded
    std::vector<std::filesystem::path> artifacts; // final artifact paths
    double seconds{};            // transcription time
    std::string error_msg;       // engine error, or post-processing warnings
};

void print_console_report(const std::vector<Result>& results,
                          std::size_t completed,
                          std::size_t total,
                          unsigned num_jobs,
                          double total_seconds);

/**
 * @brief Writes the same rows as print_console_report() as CSV.
 * @throws std::runtime_error if the file cannot be written.
 */
void export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       std::size_t completed,
                       std::size_t total,
                       double total_seconds);

unsigned get_terminal_width();

#endif //SUBSMITH_REPORT_GENERATOR_HPP
