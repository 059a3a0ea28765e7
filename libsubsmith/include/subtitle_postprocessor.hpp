//
// Created by Giuseppe Francione on 07/10/26.
//

#ifndef SUBSMITH_SUBTITLE_POSTPROCESSOR_HPP
#define SUBSMITH_SUBTITLE_POSTPROCESSOR_HPP

#include "caption.hpp"
#include "caption_dedup.hpp"
#include "caption_grouper.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace subsmith {

/**
 * @brief Settings of the caption post-processing pass.
 */
struct PostProcessOptions {
    std::size_t min_words_per_line = 7;
    bool deduplicate = true;
    std::size_t max_duplicates = kDefaultMaxDuplicates;
};

/**
 * @brief Rewrites caption artifacts in place: grouping, then deduplication.
 */
class SubtitlePostProcessor {
public:
    explicit SubtitlePostProcessor(PostProcessOptions options) : options_(options) {}

    /// @return The caption format handled for this extension, if any (".srt", ".vtt", any case).
    static std::optional<CaptionFormat> format_for(const std::filesystem::path& path);

    /// @brief Applies grouping and (if enabled) deduplication to content.
    [[nodiscard]] std::string process(std::string_view content, CaptionFormat format) const;

    /**
     * @brief Post-processes one file.
     * @return false if the file is not a caption format (left untouched).
     * @throws std::runtime_error if the file cannot be read or replaced.
     */
    bool process_file(const std::filesystem::path& path) const;

    [[nodiscard]] const PostProcessOptions& options() const noexcept { return options_; }

private:
    PostProcessOptions options_;
};

} // namespace subsmith

#endif // SUBSMITH_SUBTITLE_POSTPROCESSOR_HPP
