//
// Created by Giuseppe Francione on 10/10/26.
//

/**
 * @file transcriber.hpp
 * @brief Abstract seam between the job scheduler and a speech-to-text engine.
 */

#ifndef SUBSMITH_TRANSCRIBER_HPP
#define SUBSMITH_TRANSCRIBER_HPP

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace subsmith {

/**
 * @brief Output artifacts an engine can produce.
 */
enum class OutputFormat {
    Srt,
    Vtt,
    Json,
    Txt,
    Wts,
    Lrc,
    Csv
};

/// @return The artifact extension including the dot (".srt").
const char* extension_of(OutputFormat format);

/// @brief Parses "srt", "vtt", "json", "txt", "wts", "lrc" or "csv".
std::optional<OutputFormat> parse_output_format(std::string_view name);

/// @brief Every format the engine supports.
const std::set<OutputFormat>& all_output_formats();

/**
 * @brief One transcription to perform.
 */
struct TranscriptionRequest {
    std::filesystem::path source;              ///< Media file to transcribe
    std::filesystem::path output_base;         ///< Artifacts are written as output_base + extension
    std::optional<std::string> language;       ///< Language code; nullopt lets the engine detect
    std::set<OutputFormat> formats = all_output_formats();
    bool word_timestamps = false;              ///< One word per cue
    bool split_on_word = false;                ///< Split segments on word boundaries
    bool translate = false;                    ///< Translate to English
};

/**
 * @brief What a successful transcription produced.
 */
struct TranscriptionResult {
    std::vector<std::filesystem::path> artifacts; ///< Files actually present on disk
};

/**
 * @brief Interface implemented by every transcription engine.
 *
 * @details transcribe() is called concurrently from the scheduler's
 * worker threads, one request per call. Implementations must not share
 * mutable state between calls and report any failure by throwing.
 */
class ITranscriber {
public:
    virtual ~ITranscriber() = default;

    /**
     * @brief Transcribes one media file.
     * @return The artifacts found on disk; empty when the engine ran cleanly but wrote none.
     * @throws std::runtime_error (or a subclass) when the engine itself failed.
     */
    virtual TranscriptionResult transcribe(const TranscriptionRequest& request) = 0;

    /// @brief Short engine name used in logs.
    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace subsmith

#endif // SUBSMITH_TRANSCRIBER_HPP
