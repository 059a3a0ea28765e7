#include <cassert>
#include <stdexcept>
#include <string>
#include "../libsubsmith/include/batch_config.hpp"
#include "../libsubsmith/include/whisper_cli_transcriber.hpp"

using namespace subsmith;

static bool rejects(const BatchConfig& config) {
    try {
        config.validate();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

static bool has(const std::vector<std::string>& args, const std::string& value) {
    for (const auto& a : args) if (a == value) return true;
    return false;
}

int main() {
    BatchConfig config;
    config.validate();

    { auto c = config; c.concurrency = 0; assert(rejects(c)); }
    { auto c = config; c.transcription.model = "huge"; assert(rejects(c)); }
    { auto c = config; c.transcription.formats.clear(); assert(rejects(c)); }
    { auto c = config; c.postprocess.min_words_per_line = 0; assert(rejects(c)); }
    { auto c = config; c.postprocess.max_duplicates = 0; assert(rejects(c)); }
    { auto c = config; c.detection.min_confidence = 1.5; assert(rejects(c)); }
    { auto c = config; c.transcription.model = "large-v3-turbo"; c.concurrency = 8; c.validate(); }

    config.transcription.models_dir = "/opt/models";
    config.transcription.model = "small.en";
    assert(config.model_path() == std::filesystem::path("/opt/models/ggml-small.en.bin"));

    // artifacts next to the source unless an output directory is set
    {
        const auto req = config.make_request("/videos/talk-viAB1.mp4", "auto");
        assert(req.output_base == std::filesystem::path("/videos/talk-viAB1"));
        assert(req.language == std::string("auto"));
        config.output_dir = "/out";
        assert(config.make_request("/videos/talk-viAB1.mp4", "fr").output_base ==
               std::filesystem::path("/out/talk-viAB1"));
    }

    // engine command lines
    {
        config.transcription.formats = {OutputFormat::Srt, OutputFormat::Json};
        config.transcription.translate = true;
        WhisperCliTranscriber engine(config.whisper_settings());

        const auto req = config.make_request("/videos/talk.mp4", "de");
        const auto whisper = engine.whisper_command(req, "/tmp/talk.wav");
        assert(whisper.front() == "whisper-cli");
        assert(has(whisper, "/opt/models/ggml-small.en.bin"));
        assert(has(whisper, "-l") && has(whisper, "de"));
        assert(has(whisper, "-tr"));
        assert(has(whisper, "-ml") && has(whisper, "-sow"));
        assert(has(whisper, "-ng"));
        assert(has(whisper, "-osrt") && has(whisper, "-oj"));
        assert(!has(whisper, "-ovtt"));

        const auto ffmpeg = engine.ffmpeg_command("/videos/talk.mp4", "/tmp/talk.wav");
        assert(ffmpeg.front() == "ffmpeg");
        assert(has(ffmpeg, "16000") && has(ffmpeg, "pcm_s16le"));
        assert(ffmpeg.back() == "/tmp/talk.wav");

        config.transcription.use_cuda = true;
        config.transcription.word_timestamps = false;
        WhisperCliTranscriber gpu(config.whisper_settings());
        const auto gpu_args = gpu.whisper_command(req, "/tmp/talk.wav");
        assert(!has(gpu_args, "-ng"));
        assert(!has(gpu_args, "-ml"));
    }

    // a kept WAV never lands on a .wav source
    {
        BatchConfig local;
        local.transcription.keep_wav = true;
        WhisperCliTranscriber engine(local.whisper_settings());
        assert(engine.kept_wav_path(local.make_request("/v/x.wav", "auto")) ==
               std::filesystem::path("/v/x.16k.wav"));
        assert(engine.kept_wav_path(local.make_request("/v/x.mp4", "auto")) ==
               std::filesystem::path("/v/x.wav"));
        local.output_dir = "/out";
        assert(engine.kept_wav_path(local.make_request("/v/x.wav", "auto")) ==
               std::filesystem::path("/out/x.wav"));
    }

    assert(parse_output_format("vtt") == OutputFormat::Vtt);
    assert(!parse_output_format("docx"));
    assert(std::string(extension_of(OutputFormat::Wts)) == ".wts");
    return 0;
}
