//
// Created by Giuseppe Francione on 08/10/26.
//

/**
 * @file language_detector.hpp
 * @brief Picks the transcription language of a media file from its name.
 *
 * Filenames are short and noisy, so detection runs an ordered cascade of
 * detectors, cheapest and most certain first, and falls back to letting
 * the transcription engine detect the language itself.
 */

#ifndef SUBSMITH_LANGUAGE_DETECTOR_HPP
#define SUBSMITH_LANGUAGE_DETECTOR_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace subsmith {

/**
 * @brief How far the cascade may escalate.
 */
enum class DetectionMethod {
    Manual,   ///< Pattern map only
    Enhanced, ///< Pattern map, then Unicode script ranges
    Auto      ///< All of the above, then the trigram classifier
};

/// @brief Parses "manual", "enhanced" or "auto" (case-insensitive).
std::optional<DetectionMethod> parse_detection_method(std::string_view name);

const char* to_string(DetectionMethod method);

/**
 * @brief Outcome of language detection.
 */
struct LanguageResult {
    enum class Kind {
        Detected, ///< A detector produced a code
        Default,  ///< Detection disabled, configured default used
        Auto      ///< Let the engine detect
    };

    Kind kind = Kind::Auto;
    std::string code;   ///< Language code; empty for Auto
    std::string method; ///< "pattern", "script", "classifier", "default" or "fallback"

    /// @return The value passed to the engine: the code, or "auto".
    [[nodiscard]] std::string param() const { return kind == Kind::Auto ? "auto" : code; }

    bool operator==(const LanguageResult&) const = default;
};

/**
 * @brief Ordered pattern → language table; the first matching pattern wins.
 */
using LanguagePatternMap = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Parses "pattern:code,pattern:code,...".
 *
 * Pairs are split on the last ':'. Whitespace around patterns and codes
 * is trimmed. Malformed pairs (no ':' or an empty side) are logged and
 * skipped; order is preserved.
 */
LanguagePatternMap parse_language_map(std::string_view serialized);

/// @brief Serializes a table back to "pattern:code,..." form.
std::string format_language_map(const LanguagePatternMap& map);

/// @brief Table used when none is configured.
const LanguagePatternMap& default_language_map();

/**
 * @brief A Unicode block associated with a language.
 */
struct ScriptRange {
    char32_t first;
    char32_t last;
    const char* language;
    const char* script;
};

/**
 * @brief Script table in evaluation order.
 *
 * Kana and Hangul precede Han so Japanese and Korean names containing
 * ideographs are not reported as Chinese.
 */
const std::vector<ScriptRange>& script_ranges();

/**
 * @brief Reduces a filename to the words it contains.
 *
 * Drops the extension and any embedded video ID, replaces digits and
 * ASCII punctuation with spaces, collapses whitespace and lower-cases.
 */
std::string clean_filename_phrase(std::string_view filename);

/**
 * @brief Maps a classifier ISO 639-3 code to the engine's code set.
 */
std::optional<std::string> map_classifier_code(std::string_view iso639_3);

/**
 * @brief Detection settings.
 */
struct DetectionOptions {
    bool enabled = true;                          ///< false: always return the default
    std::string default_language;                 ///< Empty means "auto"
    DetectionMethod method = DetectionMethod::Auto;
    LanguagePatternMap patterns = default_language_map();
    std::size_t min_phrase_length = 10;           ///< Code points required before classifying
    double min_confidence = 0.15;                 ///< Classifier verdicts below this fall through
};

/**
 * @brief The detection cascade.
 *
 * @details Detectors are evaluated in order; each returns an optional
 * result and the first non-empty one wins. A detector only runs when the
 * requested method level is at least its own level.
 */
class LanguageDetector {
public:
    using Detector = std::function<std::optional<LanguageResult>(std::string_view filename)>;

    explicit LanguageDetector(DetectionOptions options);

    // stages capture this
    LanguageDetector(const LanguageDetector&) = delete;
    LanguageDetector& operator=(const LanguageDetector&) = delete;

    /// @brief Runs the cascade at the configured method level.
    [[nodiscard]] LanguageResult detect(std::string_view filename) const;

    /// @brief Runs the cascade at an explicit method level.
    [[nodiscard]] LanguageResult detect(std::string_view filename, DetectionMethod level) const;

    // --- individual stages, usable on their own ---

    [[nodiscard]] std::optional<LanguageResult> match_pattern(std::string_view filename) const;
    [[nodiscard]] static std::optional<LanguageResult> match_script(std::string_view filename);
    [[nodiscard]] std::optional<LanguageResult> classify(std::string_view filename) const;

    [[nodiscard]] const DetectionOptions& options() const noexcept { return options_; }

private:
    struct Stage {
        const char* name;
        DetectionMethod level;
        Detector run;
    };

    DetectionOptions options_;
    std::vector<Stage> stages_;
};

} // namespace subsmith

#endif // SUBSMITH_LANGUAGE_DETECTOR_HPP
