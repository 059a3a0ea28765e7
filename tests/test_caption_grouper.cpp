#include <cassert>
#include <string>
#include <vector>
#include "../libsubsmith/include/caption.hpp"
#include "../libsubsmith/include/caption_grouper.hpp"

using namespace subsmith;

int main() {
    // fragments accumulate; the trailing 4-word entry is still below 5 words
    {
        const std::string in =
            "1\n00:00:00,000 --> 00:00:01,000\nH\n\n"
            "2\n00:00:01,000 --> 00:00:02,000\ne\n\n"
            "3\n00:00:02,000 --> 00:00:03,000\nllo there friend today";
        const auto out = parse_srt(group_srt(in, 5));
        assert(out.entries.size() == 1);
        assert(out.entries[0].ordinal == 1u);
        assert(out.entries[0].timing == "00:00:00,000 --> 00:00:01,000");
        assert(out.entries[0].text == "H e llo there friend today");
    }

    // an entry meeting the threshold flushes the pending group and stays standalone
    {
        const std::string in =
            "1\n00:00:00,000 --> 00:00:01,000\nH\n\n"
            "2\n00:00:01,000 --> 00:00:02,000\ne\n\n"
            "3\n00:00:02,000 --> 00:00:03,000\nllo there my good friend\n\n";
        const std::string expected =
            "1\n00:00:00,000 --> 00:00:01,000\nH e\n\n"
            "2\n00:00:02,000 --> 00:00:03,000\nllo there my good friend\n\n";
        assert(group_srt(in, 5) == expected);
    }

    // every entry below the threshold -> exactly one entry
    {
        std::vector<CaptionEntry> entries;
        for (int i = 0; i < 6; ++i) {
            entries.push_back({static_cast<std::uint32_t>(i + 1), "t" + std::to_string(i), "w" + std::to_string(i)});
        }
        const auto grouped = group_entries(entries, 7, true);
        assert(grouped.size() == 1);
        assert(grouped[0].timing == "t0");
        assert(grouped[0].text == "w0 w1 w2 w3 w4 w5");
    }

    // long entries pass through unchanged apart from renumbering
    {
        const std::vector<CaptionEntry> entries = {
            {7, "a", "one two three four five six seven"},
            {9, "b", "eight nine ten eleven twelve thirteen fourteen"},
        };
        const auto grouped = group_entries(entries, 7, true);
        assert(grouped.size() == 2);
        assert(grouped[0].ordinal == 1u && grouped[0].text == entries[0].text && grouped[0].timing == "a");
        assert(grouped[1].ordinal == 2u && grouped[1].text == entries[1].text);
    }

    // very short text is a fragment whatever the threshold
    assert(is_fragment("Hi.", 1));
    assert(!is_fragment("Hello", 1));

    // CRLF files keep CRLF
    {
        const std::string in =
            "1\r\n00:00:00,000 --> 00:00:01,000\r\nSo\r\n\r\n"
            "2\r\n00:00:01,000 --> 00:00:02,000\r\nwe go\r\n\r\n";
        assert(group_srt(in, 5) == "1\r\n00:00:00,000 --> 00:00:01,000\r\nSo we go\r\n\r\n");
    }

    // malformed blocks are skipped
    {
        const std::string in =
            "1\n00:00:00,000 --> 00:00:01,000\nfirst caption with enough words here\n\n"
            "garbage\n\n"
            "x\n00:00:01,000 --> 00:00:02,000\nno ordinal\n\n";
        const auto out = parse_srt(group_srt(in, 5));
        assert(out.entries.size() == 1);
    }

    // VTT: header kept, no ordinals
    {
        const std::string in =
            "WEBVTT\n\n"
            "00:00:00.000 --> 00:00:01.000\nHe\n\n"
            "00:00:01.000 --> 00:00:02.000\nsaid\n\n"
            "00:00:02.000 --> 00:00:03.000\nthis is a complete sentence\n\n";
        const std::string expected =
            "WEBVTT\n\n"
            "00:00:00.000 --> 00:00:01.000\nHe said\n\n"
            "00:00:02.000 --> 00:00:03.000\nthis is a complete sentence\n\n";
        assert(group_vtt(in, 5) == expected);
    }

    assert(group_srt("", 5).empty());
    return 0;
}
