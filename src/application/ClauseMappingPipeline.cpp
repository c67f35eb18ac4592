/**
 * @file ClauseMappingPipeline.cpp
 * @brief Implementation of ClauseMappingPipeline.
 */

#include "application/ClauseMappingPipeline.hpp"
#include "infrastructure/MappingResultWriter.hpp"
#include "infrastructure/RecordTableReader.hpp"
#include "infrastructure/VectorStore.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

namespace controlmapper::application {

ClauseMappingPipeline::ClauseMappingPipeline(std::shared_ptr<EmbeddingAlignmentManager> aligner,
                                             infrastructure::AppConfig config)
    : m_aligner(std::move(aligner)),
      m_config(std::move(config)),
      m_retriever(static_cast<size_t>(std::max(0, m_config.topK))),
      m_merger(ConfidenceScorer({m_config.highConfidence, m_config.mediumConfidence}), m_config.dedupThreshold) {}

std::string ClauseMappingPipeline::QueryId(const domain::PolicyClause& clause) {
    return clause.policyId + "#" + std::to_string(clause.clauseIndex);
}

domain::ClauseList ClauseMappingPipeline::DeduplicateClauses(const domain::ClauseList& clauses) {
    domain::ClauseList unique;
    std::unordered_set<std::string> seen;
    for (const auto& clause : clauses) {
        if (!seen.insert(clause.text).second) continue;
        unique.push_back(clause);
    }
    for (size_t i = 0; i < unique.size(); ++i) {
        unique[i].clauseIndex = static_cast<int>(i);
    }
    return unique;
}

std::vector<domain::MappingResult> ClauseMappingPipeline::mapClauses(const domain::ClauseList& clauses,
                                                                      const domain::EmbeddingMatrix& clauseVectors,
                                                                      const SimilarityIndex& index,
                                                                      const domain::RecordSet& controls) const {
    if (clauseVectors.size() != clauses.size()) {
        throw std::invalid_argument("Clause vectors (" + std::to_string(clauseVectors.size()) +
                                    ") are not aligned with clauses (" + std::to_string(clauses.size()) + ")");
    }

    std::vector<domain::MappingResult> results;
    results.reserve(clauses.size());
    const size_t total = clauses.size();

    for (size_t i = 0; i < total; ++i) {
        const auto& clause = clauses[i];
        domain::EmbeddingVector query = clauseVectors[i];
        domain::NormalizeL2(query);

        domain::MappingResult result;
        result.queryId = QueryId(clause);
        result.policyId = clause.policyId;
        result.clauseIndex = clause.clauseIndex;
        result.queryText = clause.text;

        const auto candidates = m_retriever.retrieve(result.queryId, query, index, controls);
        std::cout << "[ClauseMappingPipeline] Mapping clause " << (i + 1) << "/" << total
                  << " -> Found " << candidates.size() << " candidate matches" << std::endl;

        auto merged = m_merger.merge(candidates, m_config.mappingThreshold);
        result.outcome = merged.outcome;
        result.matches = std::move(merged.matches);
        results.push_back(std::move(result));
    }
    return results;
}

std::vector<domain::MappingResult> ClauseMappingPipeline::run() {
    using infrastructure::RecordTableReader;
    using infrastructure::VectorStore;

    const auto controls = RecordTableReader::LoadControlSentences(m_config.Resolve(m_config.controlTable));
    std::vector<std::string> controlTexts;
    controlTexts.reserve(controls.size());
    for (const auto& r : controls) controlTexts.push_back(r.body);
    const auto controlVectors =
        m_aligner->ensureAligned(controlTexts, VectorStore(m_config.Resolve(m_config.controlEmbeddings)));

    const auto loaded = RecordTableReader::LoadClauses(m_config.Resolve(m_config.clauseTable));
    const auto clauses = DeduplicateClauses(loaded);
    if (clauses.size() != loaded.size()) {
        std::cout << "[ClauseMappingPipeline] Removed " << (loaded.size() - clauses.size())
                  << " duplicate clauses" << std::endl;
    }
    std::vector<std::string> clauseTexts;
    clauseTexts.reserve(clauses.size());
    for (const auto& c : clauses) clauseTexts.push_back(c.text);
    const auto clauseVectors =
        m_aligner->ensureAligned(clauseTexts, VectorStore(m_config.Resolve(m_config.clauseEmbeddings)));

    const SimilarityIndex index(controlVectors);
    std::cout << "[ClauseMappingPipeline] Index built with " << index.size() << " control records" << std::endl;

    auto results = mapClauses(clauses, clauseVectors, index, controls);
    infrastructure::MappingResultWriter::Write(m_config.Resolve(m_config.mappingOutput), results);
    std::cout << "[ClauseMappingPipeline] Mapping complete" << std::endl;
    return results;
}

} // namespace controlmapper::application
