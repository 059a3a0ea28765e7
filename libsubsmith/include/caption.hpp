//
// Created by Giuseppe Francione on 06/10/26.
//

/**
 * @file caption.hpp
 * @brief In-memory model of SRT and WebVTT caption files.
 *
 * Entries are parsed from a whole file, transformed by the grouper and
 * the dedup filter, and serialized back. Timing lines are carried as
 * opaque strings and never rewritten.
 */

#ifndef SUBSMITH_CAPTION_HPP
#define SUBSMITH_CAPTION_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace subsmith {

enum class CaptionFormat {
    Srt,
    Vtt
};

/**
 * @brief One timed caption.
 *
 * SRT entries carry an ordinal, VTT entries do not. Multi-line text is
 * stored joined with single spaces.
 */
struct CaptionEntry {
    std::optional<std::uint32_t> ordinal;
    std::string timing;
    std::string text;

    bool operator==(const CaptionEntry&) const = default;
};

/**
 * @brief A parsed caption file.
 */
struct CaptionDocument {
    CaptionFormat format = CaptionFormat::Srt;
    std::string header;                 ///< VTT header line ("WEBVTT ..."), empty for SRT
    std::string newline = "\n";         ///< Line ending detected in the source
    std::vector<CaptionEntry> entries;
};

/**
 * @brief Detects the line ending from the entry separator.
 * @return "\r\n" if the content contains a CRLF blank line, "\n" otherwise.
 */
std::string detect_newline(std::string_view content);

/**
 * @brief Guesses the caption format of a file's content.
 * @return Vtt when the first line starts with "WEBVTT" (a UTF-8 BOM is
 * tolerated), Srt otherwise.
 */
CaptionFormat detect_format(std::string_view content);

/**
 * @brief Parses SRT content.
 *
 * Blocks with fewer than two non-empty lines, or whose first line is not
 * an ordinal, are skipped. Text lines after the timing line are joined
 * with spaces and trimmed.
 */
CaptionDocument parse_srt(std::string_view content);

/**
 * @brief Parses WebVTT content.
 *
 * The first line is kept verbatim as the header; the rest of the first
 * block (header metadata) is dropped. Each following block is
 * "timing + text lines"; blocks with fewer than two lines are skipped.
 */
CaptionDocument parse_vtt(std::string_view content);

/// @brief Parses content in the given format.
CaptionDocument parse_captions(std::string_view content, CaptionFormat format);

/**
 * @brief Serializes a document using its newline style.
 *
 * Entries are separated by a blank line and the output ends with one.
 * SRT entries are "ordinal, timing, text"; VTT entries are "timing, text"
 * preceded by the header block. A document without entries and without
 * header serializes to an empty string.
 */
std::string serialize(const CaptionDocument& document);

} // namespace subsmith

#endif // SUBSMITH_CAPTION_HPP
