/**
 * @file CandidateRetriever.cpp
 * @brief Implementation of CandidateRetriever.
 */

#include "application/CandidateRetriever.hpp"
#include <unordered_set>

namespace controlmapper::application {

CandidateRetriever::CandidateRetriever(size_t topK) : m_topK(topK) {}

std::vector<domain::MatchCandidate> CandidateRetriever::retrieve(const std::string& queryId,
                                                                 const domain::EmbeddingVector& query,
                                                                 const SimilarityIndex& index,
                                                                 const domain::RecordSet& records) const {
    std::vector<domain::MatchCandidate> candidates;
    if (m_topK == 0 || index.size() == 0) return candidates;

    std::unordered_set<std::string> seen;
    for (const auto& hit : index.search(query, m_topK)) {
        if (hit.position >= records.size()) continue;
        const auto& record = records[hit.position];
        if (!seen.insert(record.id).second) continue;

        domain::MatchCandidate candidate;
        candidate.queryId = queryId;
        candidate.matchedId = record.id;
        candidate.matchedText = record.body;
        candidate.matchedCategory = record.category;
        candidate.score = hit.score;
        candidate.recordPosition = hit.position;
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

} // namespace controlmapper::application
