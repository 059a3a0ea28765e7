//
// Created by Giuseppe Francione on 05/10/26.
//

#ifndef SUBSMITH_TEXT_UTILS_HPP
#define SUBSMITH_TEXT_UTILS_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace subsmith::text {

    /// @brief Removes leading and trailing ASCII whitespace.
    std::string_view trim(std::string_view s);

    /**
     * @brief Counts whitespace-delimited tokens.
     *
     * Runs of whitespace count as one separator and empty tokens are
     * discarded. Scripts written without spaces between words (Chinese,
     * Japanese) count as one word per run.
     */
    std::size_t count_words(std::string_view s);

    /**
     * @brief Decodes UTF-8 into code points.
     *
     * Each ill-formed or truncated sequence decodes to one U+FFFD.
     */
    std::vector<char32_t> decode_utf8(std::string_view s);

    /// @brief Encodes one code point as UTF-8; surrogates and out-of-range values become U+FFFD.
    void append_utf8(std::string& out, char32_t cp);

    /// @return Number of code points in a UTF-8 string.
    std::size_t utf8_length(std::string_view s);

    /**
     * @brief Lower-cases a UTF-8 string with the full Unicode case mapping
     * of the root locale (ICU).
     */
    std::string to_lower(std::string_view s);

} // namespace subsmith::text

#endif // SUBSMITH_TEXT_UTILS_HPP
