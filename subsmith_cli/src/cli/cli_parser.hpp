//
// Created by Giuseppe Francione on 12/10/26.
//

#ifndef SUBSMITH_CLI_PARSER_HPP
#define SUBSMITH_CLI_PARSER_HPP

#include <string>
#include <vector>
#include <filesystem>
#include "../../../libsubsmith/include/batch_config.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool recursive = false;
    bool quiet = false;

    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path report_path;

    // output toggles, folded into config.transcription.formats
    bool srt = true;
    bool vtt = true;
    bool json = false;
    bool text = false;
    bool words = false;
    bool lrc = false;
    bool csv = false;
    std::vector<std::string> formats; ///< --formats list; replaces the toggles when given

    bool remove_wav = true;
    std::string language_map;
    std::string detection_method = "auto";

    std::vector<std::filesystem::path> inputs{"videos"};

    subsmith::BatchConfig config;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 *
 * Every option can also be set through its environment variable or a
 * --config file. After parsing, settings.config holds the complete
 * batch configuration (not yet validated).
 *
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //SUBSMITH_CLI_PARSER_HPP
