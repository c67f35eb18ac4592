/**
 * @file PolicyIngestionService.hpp
 * @brief Turns a policy document into a clause table.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/PolicyClause.hpp"
#include "domain/TextExtractionService.hpp"

namespace controlmapper::application {

/**
 * @class PolicyIngestionService
 * @brief Extract, split and persist the clauses of one policy document.
 */
class PolicyIngestionService {
public:
    PolicyIngestionService(std::shared_ptr<domain::TextExtractionService> extractor, std::string clauseTablePath);

    /**
     * @brief Ingests @p policyPath and replaces the clause table with its clauses.
     * @return Clauses numbered from 1, tagged with the policy file stem.
     * @throws domain::NotFoundError, domain::ExtractionError from extraction.
     * @throws std::runtime_error if the clause table cannot be written.
     */
    domain::ClauseList ingest(const std::string& policyPath);

    /** @brief Clause list for already extracted text. */
    static domain::ClauseList BuildClauses(const std::string& policyId, const std::string& text);

private:
    std::shared_ptr<domain::TextExtractionService> m_extractor;
    std::string m_clauseTablePath;
};

} // namespace controlmapper::application
