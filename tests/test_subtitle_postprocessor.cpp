#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include "../libsubsmith/include/file_utils.hpp"
#include "../libsubsmith/include/subtitle_postprocessor.hpp"

using namespace subsmith;
namespace fs = std::filesystem;

static void write(const fs::path& p, const std::string& s) {
    std::ofstream out(p, std::ios::binary);
    out << s;
}

static std::string read(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

int main() {
    const fs::path dir = fs::temp_directory_path() / ("subsmith_pp_" + random_suffix());
    fs::create_directories(dir);

    assert(SubtitlePostProcessor::format_for("a.srt") == CaptionFormat::Srt);
    assert(SubtitlePostProcessor::format_for("a.VTT") == CaptionFormat::Vtt);
    assert(!SubtitlePostProcessor::format_for("a.json"));

    const SubtitlePostProcessor pp(PostProcessOptions{.min_words_per_line = 3, .deduplicate = true, .max_duplicates = 1});

    // grouping runs first, then repeated lines are dropped
    const fs::path srt = dir / "talk.srt";
    write(srt,
          "1\n00:00:00,000 --> 00:00:01,000\nthank you all\n\n"
          "2\n00:00:01,000 --> 00:00:02,000\nThank you all\n\n"
          "3\n00:00:02,000 --> 00:00:03,000\nsee\n\n"
          "4\n00:00:03,000 --> 00:00:04,000\nyou\n\n");
    assert(pp.process_file(srt));
    assert(read(srt) ==
           "1\n00:00:00,000 --> 00:00:01,000\nthank you all\n\n"
           "3\n00:00:02,000 --> 00:00:03,000\nsee you\n\n");

    // dedup disabled keeps repeats
    const SubtitlePostProcessor keep_all(PostProcessOptions{.min_words_per_line = 3, .deduplicate = false, .max_duplicates = 1});
    const std::string twice =
        "WEBVTT\n\n00:00:00.000 --> 00:00:01.000\nsame old line\n\n00:00:01.000 --> 00:00:02.000\nsame old line\n\n";
    assert(keep_all.process(twice, CaptionFormat::Vtt) == twice);

    // other artifacts are left alone
    const fs::path txt = dir / "talk.txt";
    write(txt, "plain transcript");
    assert(!pp.process_file(txt));
    assert(read(txt) == "plain transcript");

    // unreadable file
    bool threw = false;
    try {
        (void) pp.process_file(dir / "missing.srt");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    // no temp file left behind
    std::size_t files = 0;
    for (const auto& e : fs::directory_iterator(dir)) {
        (void) e;
        ++files;
    }
    assert(files == 2);

    fs::remove_all(dir);
    return 0;
}
