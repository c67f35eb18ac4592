/**
 * @file CorpusRecord.hpp
 * @brief Domain entity for a single row of a reference corpus.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>

namespace controlmapper::domain {

/**
 * @struct CorpusRecord
 * @brief A control sentence, an evidence requirement or a policy clause.
 *
 * Records are immutable once parsed and are recreated wholesale when their
 * source table is reparsed. Their position in a RecordSet is the row index of
 * the matching vector in the paired vector store.
 */
struct CorpusRecord {
    std::string id;                       ///< Stable identifier (control id, requirement id, clause id).
    std::string category;                 ///< Domain / area of focus / policy id.
    std::string title;                    ///< Optional short name (control title, artifact name).
    std::string body;                     ///< Body text shown in explanations.
    std::optional<std::string> linkedId;  ///< Foreign key to a related control, if any.
};

using RecordSet = std::vector<CorpusRecord>;

/** @brief Title and body joined by a space, trimmed. Used as embedding text for requirements. */
inline std::string CombinedText(const CorpusRecord& record) {
    std::string text = record.title + " " + record.body;
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace controlmapper::domain
