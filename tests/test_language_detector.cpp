#include <cassert>
#include <string>
#include "../libsubsmith/include/language_detector.hpp"
#include "../libsubsmith/include/trigram_classifier.hpp"

using namespace subsmith;

int main() {
    // language map parsing
    {
        const auto map = parse_language_map(" arabic : ar ,broken, :xx,  cours_fr:fr,time:12:00:de");
        assert(map.size() == 3);
        assert(map[0] == std::make_pair(std::string("arabic"), std::string("ar")));
        assert(map[1].first == "cours_fr" && map[1].second == "fr");
        assert(map[2].first == "time:12:00" && map[2].second == "de");
        assert(format_language_map(map) == "arabic:ar,cours_fr:fr,time:12:00:de");
        assert(parse_language_map("").empty());
    }

    assert(parse_detection_method("ENHANCED") == DetectionMethod::Enhanced);
    assert(!parse_detection_method("fast"));

    const LanguageDetector detector{DetectionOptions{}};

    // pattern map, case-insensitive, first match wins
    {
        const auto r = detector.detect("Lecture_ENGLISH_french.mp4");
        assert(r.kind == LanguageResult::Kind::Detected);
        assert(r.code == "en" && r.method == "pattern");
    }

    // pattern map outranks the script heuristic
    {
        const auto r = detector.detect("arabic محاضرة.mp4");
        assert(r.code == "ar" && r.method == "pattern");
        const LanguagePatternMap russian_first = {{"lesson", "ru"}};
        DetectionOptions opts;
        opts.patterns = russian_first;
        const auto r2 = LanguageDetector(opts).detect("lesson محاضرة.mp4");
        assert(r2.code == "ru" && r2.method == "pattern");
    }

    // script ranges
    {
        assert(detector.detect("محاضرة.mp4").code == "ar");
        assert(detector.detect("日本語の授業.mp4").code == "ja");   // kanji + hiragana
        assert(detector.detect("한국어.mp4").code == "ko");
        assert(detector.detect("中文课程.mp4").code == "zh");
        assert(detector.detect("Лекция.mp4").code == "ru");
        const auto r = detector.detect("שלום.mp4");
        assert(r.code == "he" && r.method == "script");
    }

    // manual level never looks at scripts
    {
        const auto r = detector.detect("محاضرة.mp4", DetectionMethod::Manual);
        assert(r.kind == LanguageResult::Kind::Auto);
        assert(r.param() == "auto" && r.method == "fallback");
    }

    // classifier: only at auto level and for long enough phrases
    {
        assert(clean_filename_phrase("The_weather-and 2024 the other thing-viX1.mp4") ==
               "the weather and the other thing");
        const auto r = detector.detect("the_weather_and_the_other_thing.mp4");
        assert(r.code == "en" && r.method == "classifier");
        assert(detector.detect("the_weather_and_the_other_thing.mp4", DetectionMethod::Enhanced).kind ==
               LanguageResult::Kind::Auto);
        assert(detector.detect("the fox.mp4").kind == LanguageResult::Kind::Auto);
        assert(map_classifier_code("eng") == std::string("en"));
        assert(!map_classifier_code("xyz"));
        assert(!map_classifier_code("rus"));
    }

    // every profile language is reachable from a plain ASCII filename
    {
        assert(detector.detect("wycieczka_do_krakowa_latem.mp4").code == "pl");
        assert(detector.detect("istanbul_gezisi_tatil_videosu.mp4").code == "tr");
        assert(detector.detect("yemek-tarifleri-ve-mutfak.mkv").code == "tr");
        assert(detector.detect("hur man lagar mat hemma.mp4").code == "sv");
        assert(detector.detect("vacanze_al_mare_con_la_famiglia.mp4").code == "it");
        assert(detector.detect("het weer in nederland vandaag.webm").code == "nl");
        assert(detector.detect("cara_memasak_nasi_goreng_enak.mp4").code == "id");
        assert(detector.detect("como_hacer_una_tarta_de_queso.mp4").code == "es");
    }

    // a classifier verdict below the confidence threshold falls through
    {
        DetectionOptions strict;
        strict.min_confidence = 1.0;
        const auto r = LanguageDetector(strict).detect("the_weather_and_the_other_thing.mp4");
        assert(r.kind == LanguageResult::Kind::Auto);
    }

    // detection disabled
    {
        DetectionOptions off;
        off.enabled = false;
        off.default_language = "it";
        const auto r = LanguageDetector(off).detect("english_lesson.mp4");
        assert(r.kind == LanguageResult::Kind::Default && r.param() == "it");

        off.default_language.clear();
        assert(LanguageDetector(off).detect("english_lesson.mp4").param() == "auto");
    }

    // classifier on its own
    {
        const auto guess = TrigramClassifier::builtin().classify("der die und das ist ein schöner Tag");
        assert(guess && guess->code == "deu");
        assert(guess->confidence > 0.0 && guess->confidence <= 1.0);
        assert(!TrigramClassifier::builtin().classify("1234 ..."));
        const auto grams = TrigramClassifier::ranked_trigrams("aa aa");
        assert(grams.size() == 2 && grams[0] == " aa");
    }
    return 0;
}
