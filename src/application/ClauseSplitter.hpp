/**
 * @file ClauseSplitter.hpp
 * @brief Splits policy text into clause-sized pieces.
 */

#pragma once
#include <string>
#include <vector>

namespace controlmapper::application {

/**
 * @class ClauseSplitter
 * @brief Separator-based splitter for policy prose and numbered or bulleted lists.
 *
 * Splits at, in order of precedence at each position:
 * - whitespace after '.', '!' or '?' that is followed by an uppercase letter;
 * - a numbered item ("3.", "4.1.2 ") at the start of a line;
 * - a lettered item ("a. ") at the start of a line;
 * - two or more newlines;
 * - a bullet "•" or a dash, with trailing whitespace.
 * Pieces of 20 characters or fewer (after trimming) are discarded.
 */
class ClauseSplitter {
public:
    static std::vector<std::string> Split(const std::string& text);

    static constexpr size_t kMinClauseLength = 20; ///< Exclusive lower bound, in characters.

private:
    static size_t MatchSeparator(const std::string& text, size_t pos);
};

} // namespace controlmapper::application
