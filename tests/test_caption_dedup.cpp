#include <cassert>
#include <string>
#include <vector>
#include "../libsubsmith/include/caption.hpp"
#include "../libsubsmith/include/caption_dedup.hpp"

using namespace subsmith;

static std::vector<CaptionEntry> make(const std::vector<std::string>& texts) {
    std::vector<CaptionEntry> out;
    for (std::size_t i = 0; i < texts.size(); ++i) {
        out.push_back({static_cast<std::uint32_t>(i + 1), "t" + std::to_string(i), texts[i]});
    }
    return out;
}

int main() {
    assert(dedup_key("  Thank You ") == "thank you");

    // case folding beyond Latin-1: Vietnamese, Armenian, Latin Extended-B
    assert(dedup_key("VIỆT NAM") == "việt nam");
    assert(dedup_key("ԲԱՐԵՎ") == "բարեվ");
    assert(dedup_key("ǄEMAL") == "ǆemal");
    {
        const auto kept = dedup_entries(make({"VIỆT NAM", "việt nam", "ԲԱՐԵՎ", "բարեվ"}), 1);
        assert(kept.size() == 2);
        assert(kept[0].text == "VIỆT NAM");
        assert(kept[1].text == "ԲԱՐԵՎ");
    }

    // a run of k identical entries keeps min(k, m)
    for (std::size_t m = 1; m <= 4; ++m) {
        for (std::size_t k = 1; k <= 5; ++k) {
            const auto kept = dedup_entries(make(std::vector<std::string>(k, "same")), m);
            assert(kept.size() == std::min(k, m));
            for (std::size_t i = 0; i < kept.size(); ++i) assert(kept[i].timing == "t" + std::to_string(i));
        }
    }

    // case and surrounding whitespace do not matter
    assert(dedup_entries(make({"Hello", "hello ", "HELLO"}), 1).size() == 1);

    // non-consecutive repeats are kept
    {
        const auto kept = dedup_entries(make({"a", "b", "a"}), 1);
        assert(kept.size() == 3);
    }

    // a leading empty caption is not a duplicate of "nothing yet"
    assert(dedup_entries(make({"", "x"}), 1).size() == 2);

    // SRT: ordinals untouched
    {
        const std::string in =
            "1\n00:00:00,000 --> 00:00:01,000\nThanks\n\n"
            "2\n00:00:01,000 --> 00:00:02,000\nthanks\n\n"
            "3\n00:00:02,000 --> 00:00:03,000\nThanks\n\n"
            "4\n00:00:03,000 --> 00:00:04,000\nBye\n\n";
        const auto out = parse_srt(dedup(in, 2));
        assert(out.entries.size() == 3);
        assert(out.entries[0].ordinal == 1u);
        assert(out.entries[1].ordinal == 2u);
        assert(out.entries[2].ordinal == 4u);
        assert(out.entries[2].text == "Bye");
    }

    // VTT is recognised by its header
    {
        const std::string in =
            "WEBVTT\n\n"
            "00:00:00.000 --> 00:00:01.000\nla la\n\n"
            "00:00:01.000 --> 00:00:02.000\nla la\n\n";
        assert(dedup(in, 1) == "WEBVTT\n\n00:00:00.000 --> 00:00:01.000\nla la\n\n");
    }
    return 0;
}
