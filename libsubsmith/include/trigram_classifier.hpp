//
// Created by Giuseppe Francione on 08/10/26.
//

/**
 * @file trigram_classifier.hpp
 * @brief Rank-order character trigram language guesser for short phrases.
 */

#ifndef SUBSMITH_TRIGRAM_CLASSIFIER_HPP
#define SUBSMITH_TRIGRAM_CLASSIFIER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace subsmith {

/**
 * @brief A classifier verdict.
 */
struct LanguageGuess {
    std::string code;        ///< ISO 639-3 code of the closest profile (e.g. "eng")
    double confidence = 0.0; ///< 0 (no trigram matched) .. 1 (identical ranking)
};

/**
 * @brief Trigram profile of one language: most frequent trigrams first.
 */
struct TrigramProfile {
    std::string code;
    std::vector<std::string> trigrams;
};

/**
 * @brief Out-of-place distance classifier over character trigrams.
 *
 * @details The input is lower-cased, split into words, and each word is
 * padded with one space on both sides before trigrams are counted. The
 * input trigrams, ranked by frequency, are compared with each profile:
 * a trigram found in a profile costs the difference of its two ranks, a
 * missing one costs kMaxRankDifference. The profile with the lowest
 * total wins; ties yield no guess.
 */
class TrigramClassifier {
public:
    static constexpr int kMaxRankDifference = 300;
    static constexpr std::size_t kProfileSize = 300;

    explicit TrigramClassifier(std::vector<TrigramProfile> profiles);

    /**
     * @brief Classifier over the built-in profiles.
     *
     * Latin-script languages only: eng, fra, spa, deu, ita, por, nld, tur,
     * pol, swe, ind, vie and ces. Other scripts are identified by their
     * Unicode ranges before a phrase reaches the classifier.
     */
    static const TrigramClassifier& builtin();

    /**
     * @brief Guesses the language of @p phrase.
     * @return std::nullopt if the phrase has no trigrams or two profiles tie.
     */
    [[nodiscard]] std::optional<LanguageGuess> classify(std::string_view phrase) const;

    /// @brief Profile made of the kProfileSize most frequent trigrams of @p text.
    static TrigramProfile profile_from_text(std::string code, std::string_view text,
                                            std::size_t size = kProfileSize);

    /// @brief Ranked trigrams of a phrase (exposed for tests and diagnostics).
    static std::vector<std::string> ranked_trigrams(std::string_view phrase);

private:
    std::vector<TrigramProfile> profiles_;
};

} // namespace subsmith

#endif // SUBSMITH_TRIGRAM_CLASSIFIER_HPP
