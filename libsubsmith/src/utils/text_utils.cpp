//
// Created by Giuseppe Francione on 05/10/26.
//

#include "../../include/text_utils.hpp"
#include <cstdint>
#include <unicode/locid.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

namespace subsmith::text {

namespace {
constexpr char32_t kReplacement = 0xFFFD;

bool is_space(const char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}
} // namespace

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

std::size_t count_words(const std::string_view s) {
    std::size_t words = 0;
    bool in_word = false;
    for (const char c : s) {
        if (is_space(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++words;
        }
    }
    return words;
}

std::vector<char32_t> decode_utf8(const std::string_view s) {
    std::vector<char32_t> out;
    out.reserve(s.size());
    const auto* bytes = reinterpret_cast<const uint8_t*>(s.data());
    const auto length = static_cast<int32_t>(s.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 cp = 0;
        U8_NEXT(bytes, i, length, cp);
        out.push_back(cp < 0 ? kReplacement : static_cast<char32_t>(cp));
    }
    return out;
}

void append_utf8(std::string& out, const char32_t cp) {
    uint8_t buf[U8_MAX_LENGTH];
    int32_t n = 0;
    UBool failed = false;
    U8_APPEND(buf, n, U8_MAX_LENGTH, static_cast<UChar32>(cp), failed);
    if (failed) {
        n = 0;
        U8_APPEND_UNSAFE(buf, n, static_cast<UChar32>(kReplacement));
    }
    out.append(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(n));
}

std::size_t utf8_length(const std::string_view s) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(s.data());
    const auto length = static_cast<int32_t>(s.size());
    std::size_t n = 0;
    int32_t i = 0;
    while (i < length) {
        U8_FWD_1(bytes, i, length);
        ++n;
    }
    return n;
}

std::string to_lower(const std::string_view s) {
    auto unicode = icu::UnicodeString::fromUTF8(icu::StringPiece(s.data(), static_cast<int32_t>(s.size())));
    unicode.toLower(icu::Locale::getRoot());
    std::string out;
    unicode.toUTF8String(out);
    return out;
}

} // namespace subsmith::text
