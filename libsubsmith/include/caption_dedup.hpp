//
// Created by Giuseppe Francione on 07/10/26.
//

#ifndef SUBSMITH_CAPTION_DEDUP_HPP
#define SUBSMITH_CAPTION_DEDUP_HPP

#include "caption.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace subsmith {

/// Default number of consecutive entries with the same text that are kept.
inline constexpr std::size_t kDefaultMaxDuplicates = 1;

/**
 * @brief Key used to compare caption texts: lower-cased and trimmed.
 */
std::string dedup_key(std::string_view text);

/**
 * @brief Drops consecutive repeats of the same caption text.
 *
 * A run of entries whose keys are equal keeps its first
 * @p max_duplicates entries and drops the rest. Entries separated by a
 * different text start a new run. Timings and ordinals of kept entries
 * are not modified.
 */
std::vector<CaptionEntry> dedup_entries(const std::vector<CaptionEntry>& entries,
                                        std::size_t max_duplicates);

/**
 * @brief Dedups a caption file's content in the given format.
 */
std::string dedup(std::string_view content, CaptionFormat format,
                  std::size_t max_duplicates = kDefaultMaxDuplicates);

/**
 * @brief Dedups a caption file's content, detecting the format.
 *
 * WebVTT is recognised by its header line, anything else is parsed as
 * SRT. The entry separator (CRLF or LF blank line) is detected and
 * reused for the output.
 */
std::string dedup(std::string_view content, std::size_t max_duplicates = kDefaultMaxDuplicates);

} // namespace subsmith

#endif // SUBSMITH_CAPTION_DEDUP_HPP
