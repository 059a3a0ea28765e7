//
// Created by Giuseppe Francione on 10/10/26.
//

#include "../../include/whisper_cli_transcriber.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/process_runner.hpp"
#include <stdexcept>

namespace fs = std::filesystem;

namespace subsmith {

namespace {

const char* whisper_flag(const OutputFormat format) {
    switch (format) {
        case OutputFormat::Srt:  return "-osrt";
        case OutputFormat::Vtt:  return "-ovtt";
        case OutputFormat::Json: return "-oj";
        case OutputFormat::Txt:  return "-otxt";
        case OutputFormat::Wts:  return "-owts";
        case OutputFormat::Lrc:  return "-olrc";
        case OutputFormat::Csv:  return "-ocsv";
    }
    return "";
}

std::string failure_message(const std::string& program, const ProcessOutcome& outcome) {
    std::string msg = program + " exited with status " + std::to_string(outcome.exit_code);
    if (!outcome.output_tail.empty()) {
        msg += ": " + outcome.output_tail.substr(outcome.output_tail.rfind('\n') + 1);
    }
    return msg;
}

} // namespace

WhisperCliTranscriber::WhisperCliTranscriber(WhisperCliSettings settings)
    : settings_(std::move(settings)) {}

std::vector<std::string> WhisperCliTranscriber::ffmpeg_command(const fs::path& source,
                                                               const fs::path& wav) const {
    return {settings_.ffmpeg_bin, "-nostdin", "-y", "-i", source.string(),
            "-ar", "16000", "-ac", "1", "-c:a", "pcm_s16le", wav.string()};
}

std::vector<std::string> WhisperCliTranscriber::whisper_command(const TranscriptionRequest& request,
                                                                const fs::path& wav) const {
    std::vector<std::string> args = {
        settings_.whisper_bin,
        "-m", settings_.model_path.string(),
        "-f", wav.string(),
        "-of", request.output_base.string()
    };
    if (request.language) {
        args.emplace_back("-l");
        args.push_back(*request.language);
    }
    if (request.translate) args.emplace_back("-tr");
    if (request.word_timestamps) {
        args.emplace_back("-ml");
        args.emplace_back("1");
    }
    if (request.split_on_word) args.emplace_back("-sow");
    if (!settings_.use_gpu) args.emplace_back("-ng");
    for (const auto format : request.formats) {
        args.emplace_back(whisper_flag(format));
    }
    return args;
}

fs::path WhisperCliTranscriber::kept_wav_path(const TranscriptionRequest& request) const {
    fs::path wav = request.output_base;
    wav += ".wav";
    std::error_code ec;
    const bool same_file = wav.lexically_normal() == request.source.lexically_normal() ||
                           fs::equivalent(wav, request.source, ec);
    if (same_file) {
        // a .wav source transcribed in place: never convert onto the input
        wav = request.output_base;
        wav += ".16k.wav";
    }
    return wav;
}

TranscriptionResult WhisperCliTranscriber::transcribe(const TranscriptionRequest& request) {
    if (request.formats.empty()) {
        throw std::invalid_argument("no output format requested for " + request.source.string());
    }

    fs::path temp_dir;
    fs::path wav;
    if (settings_.keep_wav) {
        wav = kept_wav_path(request);
    } else {
        temp_dir = make_temp_dir_for(request.source, "wav");
        wav = temp_dir / (request.source.stem().string() + ".wav");
    }

    try {
        Logger::log(LogLevel::Debug, "Converting " + request.source.string() + " to " + wav.string(), "whisper");
        const auto converted = run_process(ffmpeg_command(request.source, wav), "ffmpeg");
        if (converted.exit_code != 0) {
            throw std::runtime_error(failure_message(settings_.ffmpeg_bin, converted));
        }

        Logger::log(LogLevel::Debug, "Transcribing " + wav.string(), "whisper");
        const auto transcribed = run_process(whisper_command(request, wav), "whisper");
        if (transcribed.exit_code != 0) {
            throw std::runtime_error(failure_message(settings_.whisper_bin, transcribed));
        }
    } catch (...) {
        if (!temp_dir.empty()) cleanup_temp_dir(temp_dir, "whisper");
        throw;
    }
    if (!temp_dir.empty()) cleanup_temp_dir(temp_dir, "whisper");

    TranscriptionResult result;
    for (const auto format : request.formats) {
        fs::path artifact = request.output_base;
        artifact += extension_of(format);
        std::error_code ec;
        if (fs::exists(artifact, ec)) {
            result.artifacts.push_back(std::move(artifact));
        } else {
            Logger::log(LogLevel::Warning, "Expected artifact missing: " + artifact.string(), "whisper");
        }
    }
    return result;
}

} // namespace subsmith
