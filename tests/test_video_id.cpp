#include <cassert>
#include <string>
#include "../libsubsmith/include/video_id.hpp"

using namespace subsmith;

int main() {
    const auto id = extract_video_id("report-viAB12cd.mp4");
    assert(id.base_name == "report");
    assert(id.video_id && *id.video_id == "-viAB12cd");
    assert(id.extension == ".mp4");
    assert(recompose(id) == "report-viAB12cd.mp4");

    // directories are ignored, only the filename counts
    assert(extract_video_id("/data/videos/report-viAB12cd.mp4") == id);

    const auto plain = extract_video_id("holiday.mkv");
    assert(plain.base_name == "holiday");
    assert(!plain.video_id);
    assert(plain.extension == ".mkv");
    assert(recompose(plain) == "holiday.mkv");

    // the marker must end the stem
    const auto inner = extract_video_id("a-viXY-part2.mp4");
    assert(!inner.video_id);
    assert(inner.base_name == "a-viXY-part2");

    // non-alphanumeric characters stop the id
    assert(!extract_video_id("clip-vi_12.mp4").video_id);

    for (const std::string name : {"x-vi1.wav", "long name-vi9z8Y7.webm", "a.b-viQ.mov"}) {
        assert(recompose(extract_video_id(name)) == name);
    }

    // artifact renaming
    const auto renamed = id_preserving_name("/v/report-viAB12cd.mp4", "/out/report.srt");
    assert(renamed && *renamed == std::filesystem::path("/out/report-viAB12cd.srt"));
    assert(!id_preserving_name("/v/report-viAB12cd.mp4", "/out/report-viAB12cd.srt"));
    assert(!id_preserving_name("/v/report.mp4", "/out/report.srt"));
    return 0;
}
