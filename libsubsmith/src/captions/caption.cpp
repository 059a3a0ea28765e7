//
// Created by Giuseppe Francione on 06/10/26.
//

#include "../../include/caption.hpp"
#include "../../include/logger.hpp"
#include "../../include/text_utils.hpp"
#include <charconv>

namespace subsmith {

namespace {

std::vector<std::string_view> split_blocks(std::string_view content, const std::string_view separator) {
    std::vector<std::string_view> blocks;
    while (!content.empty()) {
        const auto pos = content.find(separator);
        const auto block = content.substr(0, pos);
        if (!block.empty()) blocks.push_back(block);
        if (pos == std::string_view::npos) break;
        content.remove_prefix(pos + separator.size());
    }
    return blocks;
}

std::vector<std::string_view> split_lines(std::string_view block) {
    std::vector<std::string_view> lines;
    while (!block.empty()) {
        const auto pos = block.find('\n');
        auto line = block.substr(0, pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (!line.empty()) lines.push_back(line);
        if (pos == std::string_view::npos) break;
        block.remove_prefix(pos + 1);
    }
    return lines;
}

std::string join_text(const std::vector<std::string_view>& lines, const std::size_t first) {
    std::string joined;
    for (std::size_t i = first; i < lines.size(); ++i) {
        if (i > first) joined.push_back(' ');
        joined.append(lines[i]);
    }
    return std::string(text::trim(joined));
}

std::string separator_for(const std::string& newline) {
    return newline + newline;
}

std::string_view strip_bom(std::string_view content) {
    if (content.starts_with("\xEF\xBB\xBF")) content.remove_prefix(3);
    return content;
}

} // namespace

std::string detect_newline(const std::string_view content) {
    return content.find("\r\n\r\n") != std::string_view::npos ? "\r\n" : "\n";
}

CaptionFormat detect_format(const std::string_view content) {
    return strip_bom(content).starts_with("WEBVTT") ? CaptionFormat::Vtt : CaptionFormat::Srt;
}

CaptionDocument parse_srt(const std::string_view content) {
    CaptionDocument doc;
    doc.format = CaptionFormat::Srt;
    doc.newline = detect_newline(content);

    for (const auto block : split_blocks(strip_bom(content), separator_for(doc.newline))) {
        const auto lines = split_lines(block);
        if (lines.size() < 2) continue;

        const auto index_line = text::trim(lines[0]);
        std::uint32_t ordinal = 0;
        const auto [ptr, ec] = std::from_chars(index_line.data(), index_line.data() + index_line.size(), ordinal);
        if (ec != std::errc{} || ptr != index_line.data() + index_line.size()) {
            Logger::log(LogLevel::Debug, "Skipping SRT block without ordinal: " + std::string(index_line), "captions");
            continue;
        }

        doc.entries.push_back(CaptionEntry{ordinal, std::string(lines[1]), join_text(lines, 2)});
    }
    return doc;
}

CaptionDocument parse_vtt(const std::string_view content) {
    CaptionDocument doc;
    doc.format = CaptionFormat::Vtt;
    doc.newline = detect_newline(content);

    const auto body = strip_bom(content);
    auto header = body.substr(0, body.find('\n'));
    if (!header.empty() && header.back() == '\r') header.remove_suffix(1);
    doc.header = std::string(header);

    const auto blocks = split_blocks(body, separator_for(doc.newline));
    for (std::size_t b = 1; b < blocks.size(); ++b) {
        const auto lines = split_lines(blocks[b]);
        if (lines.size() < 2) continue;
        doc.entries.push_back(CaptionEntry{std::nullopt, std::string(lines[0]), join_text(lines, 1)});
    }
    return doc;
}

CaptionDocument parse_captions(const std::string_view content, const CaptionFormat format) {
    return format == CaptionFormat::Vtt ? parse_vtt(content) : parse_srt(content);
}

std::string serialize(const CaptionDocument& document) {
    const auto& nl = document.newline;
    std::string out;

    if (document.format == CaptionFormat::Vtt && !document.header.empty()) {
        out += document.header;
        out += nl;
        out += nl;
    }
    for (const auto& entry : document.entries) {
        if (document.format == CaptionFormat::Srt) {
            out += std::to_string(entry.ordinal.value_or(0));
            out += nl;
        }
        out += entry.timing;
        out += nl;
        out += entry.text;
        out += nl;
        out += nl;
    }
    return out;
}

} // namespace subsmith
