/**
 * @file TextSimilarity.cpp
 * @brief Implementation of TextSimilarity.
 */

#include "application/TextSimilarity.hpp"
#include <tuple>
#include <unordered_map>
#include <vector>

namespace controlmapper::application {

namespace {

using B2J = std::unordered_map<char32_t, std::vector<size_t>>;

struct Block {
    size_t i;
    size_t j;
    size_t size;
};

B2J IndexB(const std::u32string& b) {
    B2J b2j;
    for (size_t j = 0; j < b.size(); ++j) {
        b2j[b[j]].push_back(j);
    }

    // Autojunk: drop popular elements from long sequences.
    const size_t n = b.size();
    if (n >= 200) {
        const size_t ntest = n / 100 + 1;
        for (auto it = b2j.begin(); it != b2j.end();) {
            if (it->second.size() > ntest) it = b2j.erase(it);
            else ++it;
        }
    }
    return b2j;
}

Block FindLongestMatch(const std::u32string& a, const std::u32string& b, const B2J& b2j,
                       size_t alo, size_t ahi, size_t blo, size_t bhi) {
    size_t besti = alo, bestj = blo, bestsize = 0;

    // j2len[j] = length of the longest match ending with a[i-1] and b[j]
    std::unordered_map<size_t, size_t> j2len;
    std::unordered_map<size_t, size_t> newj2len;
    for (size_t i = alo; i < ahi; ++i) {
        newj2len.clear();
        auto found = b2j.find(a[i]);
        if (found != b2j.end()) {
            for (size_t j : found->second) {
                if (j < blo) continue;
                if (j >= bhi) break;
                size_t k = 1;
                if (j > 0) {
                    auto prev = j2len.find(j - 1);
                    if (prev != j2len.end()) k = prev->second + 1;
                }
                newj2len[j] = k;
                if (k > bestsize) {
                    besti = i - k + 1;
                    bestj = j - k + 1;
                    bestsize = k;
                }
            }
        }
        j2len.swap(newj2len);
    }

    // Popular elements never seed a match but may extend one on either side.
    while (besti > alo && bestj > blo && a[besti - 1] == b[bestj - 1]) {
        --besti;
        --bestj;
        ++bestsize;
    }
    while (besti + bestsize < ahi && bestj + bestsize < bhi && a[besti + bestsize] == b[bestj + bestsize]) {
        ++bestsize;
    }
    return {besti, bestj, bestsize};
}

} // namespace

std::u32string TextSimilarity::DecodeUtf8(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());
    const size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        char32_t cp = 0;
        if (c < 0x80) { cp = c; }
        else if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
        else {
            out.push_back(0xDC00 + c);
            ++i;
            continue;
        }

        bool valid = i + extra < n || extra == 0;
        for (size_t k = 1; valid && k <= extra; ++k) {
            const unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) valid = false;
            else cp = (cp << 6) | (cc & 0x3F);
        }
        if (!valid) {
            out.push_back(0xDC00 + c);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

double TextSimilarity::Ratio(const std::string& aText, const std::string& bText) {
    const std::u32string a = DecodeUtf8(aText);
    const std::u32string b = DecodeUtf8(bText);
    const size_t la = a.size();
    const size_t lb = b.size();
    if (la + lb == 0) return 1.0;

    const B2J b2j = IndexB(b);

    size_t matches = 0;
    std::vector<std::tuple<size_t, size_t, size_t, size_t>> queue;
    queue.emplace_back(0, la, 0, lb);
    while (!queue.empty()) {
        auto [alo, ahi, blo, bhi] = queue.back();
        queue.pop_back();
        const Block m = FindLongestMatch(a, b, b2j, alo, ahi, blo, bhi);
        if (m.size == 0) continue;
        matches += m.size;
        if (alo < m.i && blo < m.j) {
            queue.emplace_back(alo, m.i, blo, m.j);
        }
        if (m.i + m.size < ahi && m.j + m.size < bhi) {
            queue.emplace_back(m.i + m.size, ahi, m.j + m.size, bhi);
        }
    }
    return 2.0 * static_cast<double>(matches) / static_cast<double>(la + lb);
}

} // namespace controlmapper::application
