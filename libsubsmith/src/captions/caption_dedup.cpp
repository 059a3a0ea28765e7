//
// Created by Giuseppe Francione on 07/10/26.
//

#include "../../include/caption_dedup.hpp"
#include "../../include/logger.hpp"
#include "../../include/text_utils.hpp"
#include <optional>

namespace subsmith {

std::string dedup_key(const std::string_view text) {
    return std::string(text::trim(text::to_lower(text)));
}

std::vector<CaptionEntry> dedup_entries(const std::vector<CaptionEntry>& entries,
                                        const std::size_t max_duplicates) {
    std::vector<CaptionEntry> kept;
    kept.reserve(entries.size());

    std::optional<std::string> last_key;
    std::size_t repeats = 0;

    for (const auto& entry : entries) {
        auto key = dedup_key(entry.text);
        if (last_key && key == *last_key) {
            ++repeats;
            if (repeats > max_duplicates) {
                continue;
            }
        } else {
            last_key = std::move(key);
            repeats = 1;
        }
        kept.push_back(entry);
    }
    return kept;
}

std::string dedup(const std::string_view content, const CaptionFormat format, const std::size_t max_duplicates) {
    auto doc = parse_captions(content, format);
    const auto before = doc.entries.size();
    doc.entries = dedup_entries(doc.entries, max_duplicates);
    if (doc.entries.size() != before) {
        Logger::log(LogLevel::Debug,
                    "Dropped " + std::to_string(before - doc.entries.size()) + " repeated entries",
                    "dedup");
    }
    return serialize(doc);
}

std::string dedup(const std::string_view content, const std::size_t max_duplicates) {
    return dedup(content, detect_format(content), max_duplicates);
}

} // namespace subsmith
