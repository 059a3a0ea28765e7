//
// Created by Giuseppe Francione on 06/10/26.
//

#include "../../include/caption_grouper.hpp"
#include "../../include/logger.hpp"
#include "../../include/text_utils.hpp"

namespace subsmith {

void CaptionGroup::append(const CaptionEntry& entry) {
    if (texts_.empty()) {
        timing_ = entry.timing;
    }
    texts_.push_back(entry.text);
}

CaptionEntry CaptionGroup::flush() {
    CaptionEntry merged;
    merged.timing = std::move(timing_);
    for (std::size_t i = 0; i < texts_.size(); ++i) {
        if (i > 0) merged.text.push_back(' ');
        merged.text += texts_[i];
    }
    timing_.clear();
    texts_.clear();
    return merged;
}

bool is_fragment(const std::string_view text, const std::size_t min_words) {
    return text::utf8_length(text) <= kFragmentMaxChars || text::count_words(text) < min_words;
}

std::vector<CaptionEntry> group_entries(const std::vector<CaptionEntry>& entries,
                                        const std::size_t min_words,
                                        const bool renumber) {
    std::vector<CaptionEntry> out;
    CaptionGroup group;
    std::uint32_t next_ordinal = 1;

    auto emit = [&](CaptionEntry entry) {
        entry.ordinal = renumber ? std::optional<std::uint32_t>(next_ordinal++) : std::nullopt;
        out.push_back(std::move(entry));
    };

    for (const auto& entry : entries) {
        if (is_fragment(entry.text, min_words)) {
            group.append(entry);
            continue;
        }
        if (!group.empty()) {
            emit(group.flush());
        }
        emit(entry);
    }
    if (!group.empty()) {
        emit(group.flush());
    }
    return out;
}

std::string group_srt(const std::string_view content, const std::size_t min_words) {
    auto doc = parse_srt(content);
    const auto before = doc.entries.size();
    doc.entries = group_entries(doc.entries, min_words, true);
    Logger::log(LogLevel::Debug,
                "SRT grouped " + std::to_string(before) + " -> " + std::to_string(doc.entries.size()) + " entries",
                "grouper");
    return serialize(doc);
}

std::string group_vtt(const std::string_view content, const std::size_t min_words) {
    auto doc = parse_vtt(content);
    const auto before = doc.entries.size();
    doc.entries = group_entries(doc.entries, min_words, false);
    Logger::log(LogLevel::Debug,
                "VTT grouped " + std::to_string(before) + " -> " + std::to_string(doc.entries.size()) + " entries",
                "grouper");
    return serialize(doc);
}

} // namespace subsmith
