/**
 * @file ClauseMappingPipeline.hpp
 * @brief Batch mapping of policy clauses to controls with explanations.
 */

#pragma once
#include <memory>
#include <vector>
#include "application/CandidateRetriever.hpp"
#include "application/EmbeddingAlignmentManager.hpp"
#include "application/MergeEngine.hpp"
#include "application/SimilarityIndex.hpp"
#include "domain/CorpusRecord.hpp"
#include "domain/Match.hpp"
#include "domain/PolicyClause.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace controlmapper::application {

/**
 * @class ClauseMappingPipeline
 * @brief Load, align, index, retrieve, merge and write, for every clause of the clause table.
 */
class ClauseMappingPipeline {
public:
    ClauseMappingPipeline(std::shared_ptr<EmbeddingAlignmentManager> aligner, infrastructure::AppConfig config);

    /**
     * @brief Runs the full batch using the configured tables and stores.
     * @return One result per distinct clause, in clause order. Also written to the mapping output file.
     * @throws domain::NotFoundError, domain::SchemaError for bad tables.
     * @throws domain::EmbeddingGenerationFailed if a store cannot be regenerated.
     */
    std::vector<domain::MappingResult> run();

    /**
     * @brief Maps already aligned clauses against an index built over @p controls.
     * @throws std::invalid_argument if @p clauseVectors is not aligned with @p clauses.
     */
    std::vector<domain::MappingResult> mapClauses(const domain::ClauseList& clauses,
                                                  const domain::EmbeddingMatrix& clauseVectors,
                                                  const SimilarityIndex& index,
                                                  const domain::RecordSet& controls) const;

    /** @brief Drops clauses whose text repeats an earlier one and renumbers from 0. */
    static domain::ClauseList DeduplicateClauses(const domain::ClauseList& clauses);

    static std::string QueryId(const domain::PolicyClause& clause);

private:
    std::shared_ptr<EmbeddingAlignmentManager> m_aligner;
    infrastructure::AppConfig m_config;
    CandidateRetriever m_retriever;
    MergeEngine m_merger;
};

} // namespace controlmapper::application
