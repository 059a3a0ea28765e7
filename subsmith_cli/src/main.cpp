//
// Created by Giuseppe Francione on 12/10/26.
//

#include <algorithm>
#include <iostream>
#include <filesystem>
#include <csignal>
#include <clocale>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <map>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "../../libsubsmith/include/event_bus.hpp"
#include "../../libsubsmith/include/events.hpp"
#include "../../libsubsmith/include/job_scheduler.hpp"
#include "../../libsubsmith/include/logger.hpp"
#include "../../libsubsmith/include/whisper_cli_transcriber.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/file_scanner.hpp"

// simple progress bar printer
inline void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (done > 0 ? 1.0 : 0.0);
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }
    if (done == total) {
        percent = 100.0;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else if (i == pos && done == total) std::cerr << "=";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace subsmith;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};
static JobScheduler* g_scheduler = nullptr;

// handle ctrl+c or termination signals
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        std::cerr << CYAN
                  << "\n[INTERRUPT] Stop detected. Waiting for running transcriptions to finish..."
                  << RESET << std::endl;
        if (g_scheduler) {
            g_scheduler->request_stop();
        }
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}


int main(int argc, char* argv[]) {

    CLI::App app{"subsmith: batch video transcription with caption clean-up."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    // set loggers
    Logger::clear_sinks();
    auto consoleSink = std::make_unique<ConsoleLogSink>();
    consoleSink->min_level = settings.quiet ? LogLevel::Error : Logger::string_to_level(settings.log_level);
    Logger::add_sink(std::move(consoleSink));

    if (!settings.log_file.empty()) {
        try {
            Logger::add_sink(std::make_unique<FileLogSink>(settings.log_file, false));
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, e.what(), "main");
            return 1;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    init_utf8_locale();

    const BatchConfig& config = settings.config;
    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        Logger::log(LogLevel::Error, std::string("Invalid configuration: ") + e.what(), "main");
        return 1;
    }

    Logger::log(LogLevel::Debug,
                std::string("Detection: ") + to_string(config.detection.method) + ", patterns " +
                format_language_map(config.detection.patterns), "main");

    std::error_code ec;
    if (!fs::exists(config.model_path(), ec)) {
        Logger::log(LogLevel::Error, "Model file not found: " + config.model_path().string(), "main");
        return 1;
    }
    if (!config.output_dir.empty()) {
        fs::create_directories(config.output_dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error, "Failed to create output directory: " + config.output_dir.string() +
                        " (" + ec.message() + ")", "main");
            return 1;
        }
    }

    // collect input files
    std::vector<fs::path> inputs;
    try {
        inputs = collect_input_files(settings.inputs, settings.recursive);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        return 1;
    }
    if (inputs.empty()) {
        Logger::log(LogLevel::Warning, "No media files found.", "main");
        if (!settings.quiet) {
            std::cerr << YELLOW << "No media files found." << RESET << std::endl;
        }
        return 0;
    }

    EventBus bus;

    // results collected for reporting, keyed by source path
    std::map<fs::path, Result> results;
    auto start_total = std::chrono::steady_clock::now();

    bus.subscribe<JobStartEvent>([&](const JobStartEvent& e) {
        Result& r = results[e.path];
        r.path = e.path;
        r.language = e.language;
        r.method = e.method;
    });

    bus.subscribe<JobSucceededEvent>([&](const JobSucceededEvent& e) {
        Result& r = results[e.path];
        r.success = true;
        r.artifacts = e.artifacts;
        r.seconds = static_cast<double>(e.duration.count()) / 1000.0;
        if (!settings.quiet) {
            std::cerr << GREEN << "\n[DONE] " << e.path.filename().string()
                      << " (" << e.artifacts.size() << " file" << (e.artifacts.size() == 1 ? "" : "s") << ")"
                      << RESET << std::endl;
        }
    });

    bus.subscribe<JobFailedEvent>([&](const JobFailedEvent& e) {
        Result& r = results[e.path];
        r.path = e.path;
        r.success = false;
        r.error_msg = e.error_message;
        r.seconds = static_cast<double>(e.duration.count()) / 1000.0;
        if (!settings.quiet) {
            std::cerr << RED << "\n[FAIL] " << e.path.filename().string() << ": " << e.error_message
                      << RESET << std::endl;
        }
    });

    bus.subscribe<PostProcessErrorEvent>([&](const PostProcessErrorEvent& e) {
        Result& r = results[e.path];
        if (!r.error_msg.empty()) r.error_msg += "; ";
        r.error_msg += e.artifact.filename().string() + ": " + e.error_message;
    });

    bus.subscribe<ProgressEvent>([&](const ProgressEvent& e) {
        if (settings.quiet) return;
        const double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_total).count();
        print_progress_bar(e.completed, e.total, elapsed);
    });

    WhisperCliTranscriber engine(config.whisper_settings());
    std::size_t completed = 0;
    std::size_t total = 0;
    try {
        JobScheduler scheduler(config, engine, bus);
        scheduler.submit_batch(inputs);
        g_scheduler = &scheduler;
        if (!settings.quiet) {
            print_progress_bar(0, inputs.size(), 0.0);
        }
        scheduler.run();
        g_scheduler = nullptr;
        completed = scheduler.progress().completed;
        total = scheduler.progress().total;
    } catch (const std::exception& e) {
        g_scheduler = nullptr;
        Logger::log(LogLevel::Error, std::string("Batch aborted: ") + e.what(), "main");
        return 1;
    }
    if (!settings.quiet) {
        std::cerr << std::endl;
    }

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    std::vector<Result> rows;
    rows.reserve(results.size());
    for (auto& [path, r] : results) {
        rows.push_back(std::move(r));
    }

    if (!settings.quiet) {
        print_console_report(rows, completed, total, config.concurrency, total_seconds);
    }

    // export CSV if requested
    if (!settings.report_path.empty()) {
        try {
            export_csv_report(rows, settings.report_path, completed, total, total_seconds);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, e.what(), "main");
        }
    }

    if (interrupted.load()) {
        return 130; // standard exit code for SIGINT
    }
    const bool any_failed = std::ranges::any_of(rows, [](const Result& r) { return !r.success; });
    return any_failed ? 2 : 0;
}
