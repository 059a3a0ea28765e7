//
// Created by Giuseppe Francione on 10/10/26.
//

#include "../../include/transcriber.hpp"

namespace subsmith {

const char* extension_of(const OutputFormat format) {
    switch (format) {
        case OutputFormat::Srt:  return ".srt";
        case OutputFormat::Vtt:  return ".vtt";
        case OutputFormat::Json: return ".json";
        case OutputFormat::Txt:  return ".txt";
        case OutputFormat::Wts:  return ".wts";
        case OutputFormat::Lrc:  return ".lrc";
        case OutputFormat::Csv:  return ".csv";
    }
    return "";
}

std::optional<OutputFormat> parse_output_format(const std::string_view name) {
    for (const auto format : all_output_formats()) {
        if (name == extension_of(format) + 1) return format;
    }
    return std::nullopt;
}

const std::set<OutputFormat>& all_output_formats() {
    static const std::set<OutputFormat> formats = {
        OutputFormat::Srt, OutputFormat::Vtt, OutputFormat::Json, OutputFormat::Txt,
        OutputFormat::Wts, OutputFormat::Lrc, OutputFormat::Csv
    };
    return formats;
}

} // namespace subsmith
