//
// Created by Giuseppe Francione on 10/10/26.
//

/**
 * @file whisper_cli_transcriber.hpp
 * @brief Transcription engine backed by the ffmpeg and whisper.cpp executables.
 */

#ifndef SUBSMITH_WHISPER_CLI_TRANSCRIBER_HPP
#define SUBSMITH_WHISPER_CLI_TRANSCRIBER_HPP

#include "transcriber.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace subsmith {

/**
 * @brief Executables and model used by WhisperCliTranscriber.
 */
struct WhisperCliSettings {
    std::string whisper_bin = "whisper-cli";
    std::string ffmpeg_bin = "ffmpeg";
    std::filesystem::path model_path;  ///< Full path of the ggml model file
    bool use_gpu = false;              ///< false passes -ng
    bool keep_wav = false;             ///< Keep the 16 kHz WAV next to the artifacts
};

/**
 * @brief Runs ffmpeg, then whisper-cli, once per request.
 *
 * @details The source is first converted to 16 kHz mono PCM WAV (the only
 * input whisper.cpp accepts), then whisper-cli writes the requested
 * artifacts to request.output_base + extension. A non-zero exit status of
 * either program fails the request; a clean run that left no artifact
 * returns an empty result. The object holds no mutable state and
 * can serve several worker threads at once.
 */
class WhisperCliTranscriber final : public ITranscriber {
public:
    explicit WhisperCliTranscriber(WhisperCliSettings settings);

    TranscriptionResult transcribe(const TranscriptionRequest& request) override;

    [[nodiscard]] std::string_view name() const override { return "whisper-cli"; }

    /// @brief ffmpeg command line converting @p source to @p wav.
    [[nodiscard]] std::vector<std::string> ffmpeg_command(const std::filesystem::path& source,
                                                          const std::filesystem::path& wav) const;

    /// @brief whisper-cli command line for @p request reading @p wav.
    [[nodiscard]] std::vector<std::string> whisper_command(const TranscriptionRequest& request,
                                                           const std::filesystem::path& wav) const;

    /// @brief Where the WAV goes when keep_wav is set: output_base + ".wav",
    /// or output_base + ".16k.wav" when that would be the source itself.
    [[nodiscard]] std::filesystem::path kept_wav_path(const TranscriptionRequest& request) const;

private:
    WhisperCliSettings settings_;
};

} // namespace subsmith

#endif // SUBSMITH_WHISPER_CLI_TRANSCRIBER_HPP
