/**
 * @file TextSimilarity.hpp
 * @brief Ratcliff/Obershelp matching-block ratio over character sequences.
 */

#pragma once
#include <string>

namespace controlmapper::application {

/**
 * @class TextSimilarity
 * @brief Longest-matching-block similarity, the metric the near-duplicate cutoff was tuned on.
 *
 * Behaves like difflib.SequenceMatcher(None, a, b).ratio(): sequences are
 * compared per Unicode code point, and when @p b has 200 or more code points,
 * elements occurring in more than 1% + 1 of its positions are treated as
 * popular and cannot seed a match (they can still extend one).
 */
class TextSimilarity {
public:
    /** @brief 2*M / (len(a)+len(b)) in [0, 1]; 1.0 when both are empty. Not symmetric. */
    static double Ratio(const std::string& a, const std::string& b);

    /** @brief Decodes UTF-8 into code points. Invalid bytes map to U+DC80..U+DCFF. */
    static std::u32string DecodeUtf8(const std::string& text);
};

} // namespace controlmapper::application
