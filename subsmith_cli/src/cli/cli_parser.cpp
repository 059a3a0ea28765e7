//
// Created by Giuseppe Francione on 12/10/26.
//

#include "cli_parser.hpp"
#include "../../../libsubsmith/include/language_detector.hpp"
#include <CLI/CLI.hpp>

using namespace subsmith;

void setup_cli_parser(CLI::App& app, Settings& settings) {
    auto& config = settings.config;
    auto& transcription = config.transcription;

    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.set_config("--config", "", "Read options from an INI or TOML file.");

    // --- Input / output ---
    app.add_flag("-r,--recursive", settings.recursive,
                 "Recursively scan input folders.");

    app.add_option("-o,--output-dir", config.output_dir,
                   "Write transcripts to DIR instead of next to each video.")
                   ->envname("OUTPUT_DIR");

    app.add_option("-j,--jobs", config.concurrency,
                   "Maximum number of videos transcribed in parallel.")
                   ->default_val(1)
                   ->check(CLI::PositiveNumber)
                   ->envname("MAX_CONCURRENT_PROCESSES");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one

    // --- Engine ---
    app.add_option("--model", transcription.model,
                   "Whisper model name.")
                   ->default_val("base")
                   ->check(CLI::IsMember(available_models()))
                   ->envname("WHISPER_MODEL");

    app.add_option("--models-dir", transcription.models_dir,
                   "Directory holding ggml-<model>.bin files.")
                   ->default_val("models");

    app.add_option("--whisper-bin", transcription.whisper_bin,
                   "whisper.cpp command line executable.")
                   ->default_val("whisper-cli");

    app.add_option("--ffmpeg-bin", transcription.ffmpeg_bin,
                   "ffmpeg executable used to extract audio.")
                   ->default_val("ffmpeg");

    app.add_flag("--cuda,!--no-cuda", transcription.use_cuda,
                 "Let whisper use the GPU.")
                 ->envname("USE_CUDA");

    app.add_flag("--word-timestamps,!--no-word-timestamps", transcription.word_timestamps,
                 "Emit one caption per word (grouped again by --min-words).")
                 ->envname("WORD_TIMESTAMPS");

    app.add_flag("--split-on-word,!--no-split-on-word", transcription.split_on_word,
                 "Split segments on word boundaries.")
                 ->envname("SPLIT_ON_WORD");

    app.add_flag("--translate", transcription.translate,
                 "Translate the transcript to English.")
                 ->envname("TRANSLATE_TO_ENGLISH");

    app.add_flag("--remove-wav,!--keep-wav", settings.remove_wav,
                 "Remove the intermediate 16 kHz WAV file (default) or keep it next to the transcripts.")
                 ->envname("REMOVE_WAV_FILE");

    // --- Output formats ---
    app.add_flag("--srt,!--no-srt", settings.srt, "Write SRT captions.");
    app.add_flag("--vtt,!--no-vtt", settings.vtt, "Write WebVTT captions.");
    app.add_flag("--json", settings.json, "Write a JSON transcript.")->envname("OUTPUT_JSON");
    app.add_flag("--text", settings.text, "Write a plain text transcript.")->envname("OUTPUT_TEXT");
    app.add_flag("--words", settings.words, "Write a karaoke words script.")->envname("OUTPUT_WORDS");
    app.add_flag("--lrc", settings.lrc, "Write LRC lyrics.")->envname("OUTPUT_LRC");
    app.add_flag("--csv", settings.csv, "Write a CSV transcript.")->envname("OUTPUT_CSV");
    app.add_option("--formats", settings.formats,
                   "Comma-separated formats (srt,vtt,json,txt,wts,lrc,csv); replaces the flags above.")
                   ->delimiter(',')
                   ->check([](const std::string& name) {
                       return parse_output_format(name) ? std::string() : "unknown output format: " + name;
                   })
                   ->envname("OUTPUT_FORMATS");

    // --- Caption post-processing ---
    app.add_option("--min-words", config.postprocess.min_words_per_line,
                   "Minimum words per caption line.")
                   ->default_val(7)
                   ->check(CLI::PositiveNumber)
                   ->envname("MIN_WORDS_PER_LINE");

    app.add_flag("--dedup,!--no-dedup", config.postprocess.deduplicate,
                 "Drop consecutive repeated captions.")
                 ->envname("DEDUPLICATE_SUBTITLES");

    app.add_option("--max-duplicates", config.postprocess.max_duplicates,
                   "Consecutive identical captions kept before dropping.")
                   ->default_val(1)
                   ->check(CLI::PositiveNumber)
                   ->envname("MAX_DUPLICATES");

    // --- Language detection ---
    app.add_flag("--detect-language,!--no-detect-language", config.detection.enabled,
                 "Guess the language from the file name.")
                 ->envname("DETECT_LANGUAGE");

    app.add_option("--default-language", config.detection.default_language,
                   "Language used when detection is disabled (empty: auto).")
                   ->envname("DEFAULT_LANGUAGE");

    app.add_option("--language-map", settings.language_map,
                   "Filename patterns, as pattern:code,pattern:code,...")
                   ->envname("LANGUAGE_MAP");

    app.add_option("--detection-method", settings.detection_method,
                   "Detection method: 'manual', 'enhanced' or 'auto' (default).")
                   ->default_val("auto")
                   ->check([](const std::string& name) {
                       return parse_detection_method(name) ? std::string() : "unknown detection method: " + name;
                   })
                   ->envname("DETECTION_METHOD");

    // --- Logging ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "Video files or directories (default: ./videos)")
        ->envname("VIDEOS_DIR");

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        auto& cfg = settings.config;

        cfg.transcription.keep_wav = !settings.remove_wav;

        // checked above, so the parse cannot fail here
        cfg.detection.method = parse_detection_method(settings.detection_method).value_or(DetectionMethod::Auto);

        auto& formats = cfg.transcription.formats;
        formats.clear();
        if (!settings.formats.empty()) {
            for (const auto& name : settings.formats) {
                if (const auto format = parse_output_format(name)) formats.insert(*format);
            }
        } else {
            const std::pair<bool, OutputFormat> toggles[] = {
                {settings.srt, OutputFormat::Srt}, {settings.vtt, OutputFormat::Vtt},
                {settings.json, OutputFormat::Json}, {settings.text, OutputFormat::Txt},
                {settings.words, OutputFormat::Wts}, {settings.lrc, OutputFormat::Lrc},
                {settings.csv, OutputFormat::Csv}
            };
            for (const auto& [enabled, format] : toggles) {
                if (enabled) formats.insert(format);
            }
        }
        if (formats.empty()) {
            throw CLI::ValidationError("At least one output format must be enabled.");
        }

        if (!settings.language_map.empty()) {
            cfg.detection.patterns = parse_language_map(settings.language_map);
            if (cfg.detection.patterns.empty()) {
                throw CLI::ValidationError("--language-map contains no valid pattern:code pair.");
            }
        }

        if (settings.inputs.empty()) {
            settings.inputs.emplace_back("videos");
        }
    });
}
