/**
 * @file CandidateRetriever.hpp
 * @brief Turns index hits into candidate matches against a record table.
 */

#pragma once
#include <string>
#include <vector>
#include "application/SimilarityIndex.hpp"
#include "domain/CorpusRecord.hpp"
#include "domain/Match.hpp"

namespace controlmapper::application {

/**
 * @class CandidateRetriever
 * @brief Top-k retrieval with per-record-id dedup.
 *
 * The control table repeats the same control id once per sentence; only the
 * first (highest scoring) occurrence of each id is kept.
 */
class CandidateRetriever {
public:
    explicit CandidateRetriever(size_t topK = 50);

    /**
     * @brief Retrieves at most min(topK, index.size()) candidates for one query.
     * @param queryId Identifier copied into each candidate.
     * @param query Query vector, normalized by the caller.
     * @param records Table aligned with @p index (row i = record i).
     * @return Candidates in descending score order; empty for an empty corpus or topK == 0.
     */
    std::vector<domain::MatchCandidate> retrieve(const std::string& queryId,
                                                 const domain::EmbeddingVector& query,
                                                 const SimilarityIndex& index,
                                                 const domain::RecordSet& records) const;

    size_t topK() const { return m_topK; }

private:
    size_t m_topK;
};

} // namespace controlmapper::application
