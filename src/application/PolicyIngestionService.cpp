/**
 * @file PolicyIngestionService.cpp
 * @brief Implementation of PolicyIngestionService.
 */

#include "application/PolicyIngestionService.hpp"
#include "application/ClauseSplitter.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/RecordTableReader.hpp"
#include <iostream>

namespace controlmapper::application {

PolicyIngestionService::PolicyIngestionService(std::shared_ptr<domain::TextExtractionService> extractor,
                                               std::string clauseTablePath)
    : m_extractor(std::move(extractor)), m_clauseTablePath(std::move(clauseTablePath)) {}

domain::ClauseList PolicyIngestionService::BuildClauses(const std::string& policyId, const std::string& text) {
    domain::ClauseList clauses;
    int index = 1;
    for (auto& piece : ClauseSplitter::Split(text)) {
        clauses.push_back({policyId, index++, std::move(piece)});
    }
    return clauses;
}

domain::ClauseList PolicyIngestionService::ingest(const std::string& policyPath) {
    std::cout << "[PolicyIngestionService] Extracting " << policyPath << std::endl;
    const auto document = m_extractor->extract(policyPath);

    const std::string policyId = infrastructure::PathUtils::FileStem(policyPath);
    auto clauses = BuildClauses(policyId, document.text);
    if (clauses.empty()) {
        std::cerr << "[PolicyIngestionService] No clauses found in " << policyPath << std::endl;
    }

    infrastructure::RecordTableReader::SaveClauses(m_clauseTablePath, clauses);
    std::cout << "[PolicyIngestionService] Wrote " << clauses.size() << " clauses -> "
              << m_clauseTablePath << std::endl;
    return clauses;
}

} // namespace controlmapper::application
