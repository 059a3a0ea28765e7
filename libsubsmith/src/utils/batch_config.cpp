//
// Created by Giuseppe Francione on 11/10/26.
//

#include "../../include/batch_config.hpp"
#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

namespace subsmith {

const std::vector<std::string>& available_models() {
    static const std::vector<std::string> models = {
        "tiny", "tiny.en", "base", "base.en", "small", "small.en",
        "medium", "medium.en", "large-v1", "large", "large-v3-turbo"
    };
    return models;
}

void BatchConfig::validate() const {
    if (concurrency < 1) {
        throw std::invalid_argument("jobs: concurrency must be at least 1");
    }
    const auto& models = available_models();
    if (std::ranges::find(models, transcription.model) == models.end()) {
        throw std::invalid_argument("model: unknown model '" + transcription.model + "'");
    }
    if (transcription.formats.empty()) {
        throw std::invalid_argument("formats: at least one output format must be enabled");
    }
    if (transcription.whisper_bin.empty()) {
        throw std::invalid_argument("whisper-bin: must not be empty");
    }
    if (transcription.ffmpeg_bin.empty()) {
        throw std::invalid_argument("ffmpeg-bin: must not be empty");
    }
    if (postprocess.min_words_per_line < 1) {
        throw std::invalid_argument("min-words: must be at least 1");
    }
    if (postprocess.max_duplicates < 1) {
        throw std::invalid_argument("max-duplicates: must be at least 1");
    }
    if (detection.min_confidence < 0.0 || detection.min_confidence > 1.0) {
        throw std::invalid_argument("min-confidence: must be between 0 and 1");
    }
    if (detection.enabled && detection.patterns.empty() && detection.method == DetectionMethod::Manual) {
        throw std::invalid_argument("language-map: manual detection needs at least one pattern");
    }
}

fs::path BatchConfig::model_path() const {
    return transcription.models_dir / ("ggml-" + transcription.model + ".bin");
}

WhisperCliSettings BatchConfig::whisper_settings() const {
    WhisperCliSettings settings;
    settings.whisper_bin = transcription.whisper_bin;
    settings.ffmpeg_bin = transcription.ffmpeg_bin;
    settings.model_path = model_path();
    settings.use_gpu = transcription.use_cuda;
    settings.keep_wav = transcription.keep_wav;
    return settings;
}

fs::path BatchConfig::output_base_for(const fs::path& source) const {
    const fs::path dir = output_dir.empty() ? source.parent_path() : output_dir;
    return dir / source.stem();
}

TranscriptionRequest BatchConfig::make_request(const fs::path& source,
                                               const std::string& language_param) const {
    TranscriptionRequest request;
    request.source = source;
    request.output_base = output_base_for(source);
    request.language = language_param;
    request.formats = transcription.formats;
    request.word_timestamps = transcription.word_timestamps;
    request.split_on_word = transcription.split_on_word;
    request.translate = transcription.translate;
    return request;
}

} // namespace subsmith
