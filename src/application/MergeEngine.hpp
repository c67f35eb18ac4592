/**
 * @file MergeEngine.hpp
 * @brief Threshold filtering, near-duplicate removal and fallback for candidate lists.
 */

#pragma once
#include <vector>
#include "application/ConfidenceScorer.hpp"
#include "domain/Match.hpp"

namespace controlmapper::application {

/**
 * @class MergeEngine
 * @brief Reduces a raw candidate list to an explained, non-redundant match list.
 *
 * Candidates at or above the threshold are visited in descending score order
 * (stable for equal scores). A candidate is dropped if its id was already
 * accepted or if its text is a near-duplicate (TextSimilarity ratio at or
 * above the dedup cutoff) of an accepted match. If nothing is accepted but
 * candidates exist, the best raw candidate is returned as a fallback.
 */
class MergeEngine {
public:
    explicit MergeEngine(ConfidenceScorer scorer = ConfidenceScorer(), double dedupThreshold = 0.6);

    domain::MergeResult merge(const std::vector<domain::MatchCandidate>& candidates, double threshold) const;

    double dedupThreshold() const { return m_dedupThreshold; }

private:
    bool isNearDuplicate(const domain::MatchCandidate& candidate,
                         const std::vector<domain::MergedMatch>& accepted) const;

    ConfidenceScorer m_scorer;
    double m_dedupThreshold;
};

} // namespace controlmapper::application
