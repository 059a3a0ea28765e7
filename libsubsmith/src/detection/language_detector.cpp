//
// Created by Giuseppe Francione on 08/10/26.
//

#include "../../include/language_detector.hpp"
#include "../../include/logger.hpp"
#include "../../include/text_utils.hpp"
#include "../../include/trigram_classifier.hpp"
#include "../../include/video_id.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>

namespace subsmith {

namespace {

std::string ascii_lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_ascii_punct_or_digit(const char32_t cp) {
    return cp < 0x80 && (std::isdigit(static_cast<int>(cp)) || std::ispunct(static_cast<int>(cp)));
}

} // namespace

std::optional<DetectionMethod> parse_detection_method(const std::string_view name) {
    const auto lowered = ascii_lower(name);
    if (lowered == "manual") return DetectionMethod::Manual;
    if (lowered == "enhanced") return DetectionMethod::Enhanced;
    if (lowered == "auto") return DetectionMethod::Auto;
    return std::nullopt;
}

const char* to_string(const DetectionMethod method) {
    switch (method) {
        case DetectionMethod::Manual:   return "manual";
        case DetectionMethod::Enhanced: return "enhanced";
        case DetectionMethod::Auto:     return "auto";
    }
    return "";
}

LanguagePatternMap parse_language_map(const std::string_view serialized) {
    LanguagePatternMap map;
    std::string_view rest = serialized;
    while (!rest.empty()) {
        const auto comma = rest.find(',');
        const auto pair = rest.substr(0, comma);
        rest = comma == std::string_view::npos ? std::string_view{} : rest.substr(comma + 1);

        if (text::trim(pair).empty()) continue;
        const auto colon = pair.rfind(':');
        if (colon == std::string_view::npos) {
            Logger::log(LogLevel::Warning, "Ignoring language map entry without ':' : " + std::string(pair), "detector");
            continue;
        }
        const auto pattern = text::trim(pair.substr(0, colon));
        const auto code = text::trim(pair.substr(colon + 1));
        if (pattern.empty() || code.empty()) {
            Logger::log(LogLevel::Warning, "Ignoring incomplete language map entry: " + std::string(pair), "detector");
            continue;
        }
        map.emplace_back(std::string(pattern), std::string(code));
    }
    return map;
}

std::string format_language_map(const LanguagePatternMap& map) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < map.size(); ++i) {
        if (i > 0) oss << ',';
        oss << map[i].first << ':' << map[i].second;
    }
    return oss.str();
}

const LanguagePatternMap& default_language_map() {
    static const LanguagePatternMap map = parse_language_map(
        "arabic:ar,english:en,french:fr,spanish:es,german:de,italian:it,portuguese:pt,"
        "russian:ru,turkish:tr,chinese:zh,japanese:ja,korean:ko,hindi:hi,urdu:ur,"
        "persian:fa,farsi:fa");
    return map;
}

const std::vector<ScriptRange>& script_ranges() {
    static const std::vector<ScriptRange> ranges = {
        {0x0600, 0x06FF, "ar", "Arabic"},
        {0x0750, 0x077F, "ar", "Arabic Supplement"},
        {0xFB50, 0xFDFF, "ar", "Arabic Presentation Forms-A"},
        {0xFE70, 0xFEFF, "ar", "Arabic Presentation Forms-B"},
        {0x0590, 0x05FF, "he", "Hebrew"},
        {0x3040, 0x309F, "ja", "Hiragana"},
        {0x30A0, 0x30FF, "ja", "Katakana"},
        {0x31F0, 0x31FF, "ja", "Katakana Phonetic Extensions"},
        {0xAC00, 0xD7AF, "ko", "Hangul Syllables"},
        {0x1100, 0x11FF, "ko", "Hangul Jamo"},
        {0x3130, 0x318F, "ko", "Hangul Compatibility Jamo"},
        {0x4E00, 0x9FFF, "zh", "CJK Unified Ideographs"},
        {0x3400, 0x4DBF, "zh", "CJK Extension A"},
        {0x0400, 0x04FF, "ru", "Cyrillic"},
        {0x0370, 0x03FF, "el", "Greek"},
        {0x0900, 0x097F, "hi", "Devanagari"},
        {0x0980, 0x09FF, "bn", "Bengali"},
        {0x0A00, 0x0A7F, "pa", "Gurmukhi"},
        {0x0A80, 0x0AFF, "gu", "Gujarati"},
        {0x0B80, 0x0BFF, "ta", "Tamil"},
        {0x0C00, 0x0C7F, "te", "Telugu"},
        {0x0C80, 0x0CFF, "kn", "Kannada"},
        {0x0D00, 0x0D7F, "ml", "Malayalam"},
        {0x0E00, 0x0E7F, "th", "Thai"},
        {0x0E80, 0x0EFF, "lo", "Lao"},
        {0x0F00, 0x0FFF, "bo", "Tibetan"},
        {0x1000, 0x109F, "my", "Myanmar"},
        {0x10A0, 0x10FF, "ka", "Georgian"},
        {0x0530, 0x058F, "hy", "Armenian"},
        {0x1200, 0x137F, "am", "Ethiopic"},
        {0x1780, 0x17FF, "km", "Khmer"},
    };
    return ranges;
}

std::string clean_filename_phrase(const std::string_view filename) {
    const auto identity = extract_video_id(std::filesystem::path(std::string(filename)));

    std::string cleaned;
    bool pending_space = false;
    for (const char32_t cp : text::decode_utf8(identity.base_name)) {
        const bool separator = is_ascii_punct_or_digit(cp) || cp == U' ' || cp == U'\t';
        if (separator) {
            pending_space = !cleaned.empty();
            continue;
        }
        if (pending_space) {
            cleaned.push_back(' ');
            pending_space = false;
        }
        text::append_utf8(cleaned, cp);
    }
    return text::to_lower(cleaned);
}

std::optional<std::string> map_classifier_code(const std::string_view iso639_3) {
    // one entry per built-in classifier profile
    static const std::unordered_map<std::string_view, std::string_view> table = {
        {"eng", "en"}, {"fra", "fr"}, {"spa", "es"}, {"deu", "de"}, {"ita", "it"},
        {"por", "pt"}, {"nld", "nl"}, {"tur", "tr"}, {"pol", "pl"}, {"swe", "sv"},
        {"ind", "id"}, {"vie", "vi"}, {"ces", "cs"},
    };
    const auto it = table.find(iso639_3);
    if (it == table.end()) return std::nullopt;
    return std::string(it->second);
}

LanguageDetector::LanguageDetector(DetectionOptions options)
    : options_(std::move(options)) {
    stages_.push_back({"pattern", DetectionMethod::Manual,
                       [this](std::string_view f) { return match_pattern(f); }});
    stages_.push_back({"script", DetectionMethod::Enhanced,
                       [](std::string_view f) { return match_script(f); }});
    stages_.push_back({"classifier", DetectionMethod::Auto,
                       [this](std::string_view f) { return classify(f); }});
}

LanguageResult LanguageDetector::detect(const std::string_view filename) const {
    return detect(filename, options_.method);
}

LanguageResult LanguageDetector::detect(const std::string_view filename, const DetectionMethod level) const {
    if (!options_.enabled) {
        if (options_.default_language.empty()) {
            return LanguageResult{LanguageResult::Kind::Auto, "", "default"};
        }
        return LanguageResult{LanguageResult::Kind::Default, options_.default_language, "default"};
    }

    for (const auto& stage : stages_) {
        if (level < stage.level) continue;
        if (auto result = stage.run(filename)) {
            return *result;
        }
    }

    Logger::log(LogLevel::Debug, "No language detected for " + std::string(filename) + ", deferring to engine", "detector");
    return LanguageResult{LanguageResult::Kind::Auto, "", "fallback"};
}

std::optional<LanguageResult> LanguageDetector::match_pattern(const std::string_view filename) const {
    const auto lowered = ascii_lower(filename);
    for (const auto& [pattern, language] : options_.patterns) {
        if (lowered.find(ascii_lower(pattern)) != std::string::npos) {
            Logger::log(LogLevel::Info,
                        "Language detected for " + std::string(filename) + ": " + language +
                        " (matched pattern: " + pattern + ")", "detector");
            return LanguageResult{LanguageResult::Kind::Detected, language, "pattern"};
        }
    }
    return std::nullopt;
}

std::optional<LanguageResult> LanguageDetector::match_script(const std::string_view filename) {
    const auto code_points = text::decode_utf8(filename);
    for (const auto& range : script_ranges()) {
        const bool hit = std::ranges::any_of(code_points, [&](const char32_t cp) {
            return cp >= range.first && cp <= range.last;
        });
        if (hit) {
            Logger::log(LogLevel::Info,
                        "Language detected for " + std::string(filename) + ": " + range.language +
                        " (" + range.script + " characters)", "detector");
            return LanguageResult{LanguageResult::Kind::Detected, range.language, "script"};
        }
    }
    return std::nullopt;
}

std::optional<LanguageResult> LanguageDetector::classify(const std::string_view filename) const {
    const auto phrase = clean_filename_phrase(filename);
    if (text::utf8_length(phrase) <= options_.min_phrase_length) return std::nullopt;

    const auto guess = TrigramClassifier::builtin().classify(phrase);
    if (!guess) return std::nullopt;

    if (guess->confidence < options_.min_confidence) {
        Logger::log(LogLevel::Debug,
                    "Classifier guess " + guess->code + " for '" + phrase + "' below confidence threshold",
                    "detector");
        return std::nullopt;
    }
    const auto code = map_classifier_code(guess->code);
    if (!code) {
        Logger::log(LogLevel::Debug, "Classifier code " + guess->code + " has no engine mapping", "detector");
        return std::nullopt;
    }
    Logger::log(LogLevel::Info,
                "Language detected for " + std::string(filename) + ": " + *code +
                " (classified phrase '" + phrase + "')", "detector");
    return LanguageResult{LanguageResult::Kind::Detected, *code, "classifier"};
}

} // namespace subsmith
