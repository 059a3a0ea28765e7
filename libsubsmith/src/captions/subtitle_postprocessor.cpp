//
// Created by Giuseppe Francione on 07/10/26.
//

#include "../../include/subtitle_postprocessor.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>

namespace subsmith {

std::optional<CaptionFormat> SubtitlePostProcessor::format_for(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".srt") return CaptionFormat::Srt;
    if (ext == ".vtt") return CaptionFormat::Vtt;
    return std::nullopt;
}

std::string SubtitlePostProcessor::process(const std::string_view content, const CaptionFormat format) const {
    std::string grouped = format == CaptionFormat::Srt
                              ? group_srt(content, options_.min_words_per_line)
                              : group_vtt(content, options_.min_words_per_line);
    if (!options_.deduplicate) {
        return grouped;
    }
    return dedup(grouped, format, options_.max_duplicates);
}

bool SubtitlePostProcessor::process_file(const std::filesystem::path& path) const {
    const auto format = format_for(path);
    if (!format) return false;

    const auto content = read_text_file(path);
    write_text_file(path, process(content, *format));
    Logger::log(LogLevel::Info, "Post-processed subtitle file: " + path.filename().string(), "postprocess");
    return true;
}

} // namespace subsmith
