/**
 * @file ClauseSplitter.cpp
 * @brief Implementation of ClauseSplitter.
 */

#include "application/ClauseSplitter.hpp"
#include "application/TextFormat.hpp"
#include <cctype>

namespace controlmapper::application {

namespace {

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsDigit(char c) {
    return c >= '0' && c <= '9';
}

bool IsAsciiAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

size_t SkipSpaces(const std::string& text, size_t pos) {
    while (pos < text.size() && IsSpace(text[pos])) ++pos;
    return pos;
}

size_t SkipDigits(const std::string& text, size_t pos) {
    while (pos < text.size() && IsDigit(text[pos])) ++pos;
    return pos;
}

std::string Trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && IsSpace(s[b])) ++b;
    while (e > b && IsSpace(s[e - 1])) --e;
    return s.substr(b, e - b);
}

const char kBullet[] = "\xE2\x80\xA2";

} // namespace

size_t ClauseSplitter::MatchSeparator(const std::string& text, size_t pos) {
    const size_t n = text.size();
    const char prev = pos > 0 ? text[pos - 1] : '\0';

    // Sentence end: [.!?] then whitespace then an uppercase letter (not consumed).
    if (prev == '.' || prev == '!' || prev == '?') {
        const size_t end = SkipSpaces(text, pos);
        if (end > pos && end < n && text[end] >= 'A' && text[end] <= 'Z') return end - pos;
    }

    if (prev == '\n') {
        // Numbered item: digits with optional ".digits" groups, then whitespace.
        size_t j = SkipSpaces(text, pos);
        size_t k = SkipDigits(text, j);
        if (k > j) {
            while (k + 1 < n && text[k] == '.' && IsDigit(text[k + 1])) {
                k = SkipDigits(text, k + 1);
            }
            const size_t end = SkipSpaces(text, k);
            if (end > k) return end - pos;
        }

        // Lettered item: one letter, a dot, then whitespace.
        j = SkipSpaces(text, pos);
        if (j + 1 < n && IsAsciiAlpha(text[j]) && text[j + 1] == '.') {
            const size_t end = SkipSpaces(text, j + 2);
            if (end > j + 2) return end - pos;
        }
    }

    // Blank line(s).
    if (pos + 1 < n && text[pos] == '\n' && text[pos + 1] == '\n') {
        size_t end = pos;
        while (end < n && text[end] == '\n') ++end;
        return end - pos;
    }

    if (text.compare(pos, 3, kBullet) == 0) {
        return SkipSpaces(text, pos + 3) - pos;
    }

    if (text[pos] == '-') {
        return SkipSpaces(text, pos + 1) - pos;
    }

    return 0;
}

std::vector<std::string> ClauseSplitter::Split(const std::string& text) {
    std::vector<std::string> pieces;
    size_t segmentStart = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t len = MatchSeparator(text, pos);
        if (len > 0) {
            pieces.push_back(text.substr(segmentStart, pos - segmentStart));
            pos += len;
            segmentStart = pos;
        } else {
            ++pos;
        }
    }
    pieces.push_back(text.substr(segmentStart));

    std::vector<std::string> clauses;
    for (const auto& piece : pieces) {
        std::string trimmed = Trim(piece);
        if (Utf8Length(trimmed) > kMinClauseLength) clauses.push_back(std::move(trimmed));
    }
    return clauses;
}

} // namespace controlmapper::application
