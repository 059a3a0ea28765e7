//
// Created by Giuseppe Francione on 11/10/26.
//

/**
 * @file batch_config.hpp
 * @brief Every setting of a transcription batch, validated once up front.
 */

#ifndef SUBSMITH_BATCH_CONFIG_HPP
#define SUBSMITH_BATCH_CONFIG_HPP

#include "language_detector.hpp"
#include "subtitle_postprocessor.hpp"
#include "transcriber.hpp"
#include "whisper_cli_transcriber.hpp"
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace subsmith {

/// @brief Model names the engine ships (ggml-<name>.bin).
const std::vector<std::string>& available_models();

/**
 * @brief Engine options.
 */
struct TranscriptionOptions {
    std::string model = "base";
    std::filesystem::path models_dir = "models";
    std::string whisper_bin = "whisper-cli";
    std::string ffmpeg_bin = "ffmpeg";
    bool use_cuda = false;
    std::set<OutputFormat> formats = {OutputFormat::Srt, OutputFormat::Vtt};
    bool word_timestamps = true;
    bool split_on_word = true;
    bool translate = false;
    bool keep_wav = false;
};

/**
 * @brief Settings of one batch run.
 */
struct BatchConfig {
    std::filesystem::path output_dir;  ///< Empty: artifacts go next to each source
    unsigned concurrency = 1;          ///< Maximum number of Running jobs
    TranscriptionOptions transcription;
    PostProcessOptions postprocess;
    DetectionOptions detection;

    /**
     * @brief Checks every option.
     * @throws std::invalid_argument naming the first offending option.
     */
    void validate() const;

    /// @return models_dir / "ggml-<model>.bin".
    [[nodiscard]] std::filesystem::path model_path() const;

    /// @return Engine settings derived from the transcription options.
    [[nodiscard]] WhisperCliSettings whisper_settings() const;

    /// @return <output dir>/<source stem>, the output dir defaulting to the source's own directory.
    [[nodiscard]] std::filesystem::path output_base_for(const std::filesystem::path& source) const;

    /**
     * @brief Builds the engine request for one source.
     *
     * Artifacts are written as output_base_for(source) + extension. The
     * scheduler may replace the base when two sources share it.
     */
    [[nodiscard]] TranscriptionRequest make_request(const std::filesystem::path& source,
                                                    const std::string& language_param) const;
};

} // namespace subsmith

#endif // SUBSMITH_BATCH_CONFIG_HPP
