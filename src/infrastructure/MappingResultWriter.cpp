/**
 * @file MappingResultWriter.cpp
 * @brief Implementation of MappingResultWriter.
 */

#include "infrastructure/MappingResultWriter.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include <iostream>

using json = nlohmann::json;

namespace controlmapper::infrastructure {

json MappingResultWriter::ToJson(const domain::MappingResult& result) {
    json explanations = json::array();
    for (const auto& m : result.matches) {
        explanations.push_back({
            {"matched_id", m.candidate.matchedId},
            {"matched_category", m.candidate.matchedCategory},
            {"matched_text", m.candidate.matchedText},
            {"similarity_score", m.candidate.score},
            {"confidence", m.confidenceLabel},
            {"is_fallback", m.isFallback},
            {"explanation", m.explanation}
        });
    }

    return {
        {"query_id", result.queryId},
        {"policy_id", result.policyId},
        {"clause_index", result.clauseIndex},
        {"clause_text", result.queryText},
        {"outcome", domain::OutcomeToString(result.outcome)},
        {"mapping_explanations", explanations}
    };
}

void MappingResultWriter::Write(const std::string& path, const std::vector<domain::MappingResult>& results) {
    json out = json::array();
    for (const auto& r : results) out.push_back(ToJson(r));
    AtomicFileWriter::Write(path, out.dump(2, ' ', false, json::error_handler_t::replace));
    std::cout << "[MappingResultWriter] Wrote " << results.size() << " mappings -> " << path << std::endl;
}

} // namespace controlmapper::infrastructure
