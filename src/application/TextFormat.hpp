/**
 * @file TextFormat.hpp
 * @brief Number and text formatting used by user-facing explanations.
 */

#pragma once
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>

namespace controlmapper::application {

/** @brief Fixed-point rendering, e.g. FormatFixed(0.8123, 2) == "0.81". */
inline std::string FormatFixed(double value, int decimals) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(decimals) << value;
    return ss.str();
}

/** @brief Shortest round-tripping rendering with a ".0" on whole numbers ("0.6", "1.0"). */
inline std::string FormatShortest(double value) {
    char buf[40];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
        if (std::strtod(buf, nullptr) == value) break;
    }
    std::string out(buf);
    if (out.find_first_of(".eEn") == std::string::npos) out += ".0";
    return out;
}

/** @brief First @p maxChars code points of a UTF-8 string. */
inline std::string Utf8Prefix(const std::string& text, size_t maxChars) {
    size_t chars = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) {
            if (chars == maxChars) return text.substr(0, i);
            ++chars;
        }
    }
    return text;
}

/** @brief Number of code points in a UTF-8 string. */
inline size_t Utf8Length(const std::string& text) {
    size_t chars = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++chars;
    }
    return chars;
}

inline std::string ToLower(std::string text) {
    for (char& c : text) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return text;
}

} // namespace controlmapper::application
