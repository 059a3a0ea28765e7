//
// Created by Giuseppe Francione on 06/10/26.
//

/**
 * @file caption_grouper.hpp
 * @brief Merges fragmentary caption entries into readable lines.
 *
 * Word-level transcription emits one entry per token, often a single
 * character. The grouper accumulates consecutive short entries until an
 * entry arrives that is long enough on its own, then emits the
 * accumulated run as one entry timed at its first member.
 */

#ifndef SUBSMITH_CAPTION_GROUPER_HPP
#define SUBSMITH_CAPTION_GROUPER_HPP

#include "caption.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace subsmith {

/// Default minimum words per line when the caller does not override it.
inline constexpr std::size_t kDefaultMinWordsPerLine = 5;

/**
 * @brief Entries up to this many characters are always treated as fragments.
 */
inline constexpr std::size_t kFragmentMaxChars = 3;

/**
 * @brief Accumulator for consecutive fragment entries.
 */
class CaptionGroup {
public:
    /// @brief Adds an entry; the group's timing is the first member's.
    void append(const CaptionEntry& entry);

    [[nodiscard]] bool empty() const noexcept { return texts_.empty(); }

    /**
     * @brief Produces the merged entry and resets the group.
     * @return An entry with the first member's timing and the members'
     * texts joined by single spaces, in order.
     */
    CaptionEntry flush();

private:
    std::string timing_;
    std::vector<std::string> texts_;
};

/**
 * @return true if @p text is too short to stand alone: at most
 * kFragmentMaxChars characters, or fewer than @p min_words words.
 */
bool is_fragment(std::string_view text, std::size_t min_words);

/**
 * @brief Groups entries in order.
 *
 * Fragments are accumulated; an entry meeting the threshold first
 * flushes the pending group, then is emitted unchanged. A trailing group
 * is flushed at the end. When @p renumber is set, emitted entries get
 * ordinals 1, 2, 3, ... in emission order.
 */
std::vector<CaptionEntry> group_entries(const std::vector<CaptionEntry>& entries,
                                        std::size_t min_words,
                                        bool renumber);

/**
 * @brief Groups an SRT file's content and renumbers it from 1.
 */
std::string group_srt(std::string_view content, std::size_t min_words = kDefaultMinWordsPerLine);

/**
 * @brief Groups a WebVTT file's content; the header line is kept verbatim.
 */
std::string group_vtt(std::string_view content, std::size_t min_words = kDefaultMinWordsPerLine);

} // namespace subsmith

#endif // SUBSMITH_CAPTION_GROUPER_HPP
