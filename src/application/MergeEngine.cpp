/**
 * @file MergeEngine.cpp
 * @brief Implementation of MergeEngine.
 */

#include "application/MergeEngine.hpp"
#include "application/TextSimilarity.hpp"
#include <algorithm>
#include <unordered_set>

namespace controlmapper::application {

MergeEngine::MergeEngine(ConfidenceScorer scorer, double dedupThreshold)
    : m_scorer(scorer), m_dedupThreshold(dedupThreshold) {}

bool MergeEngine::isNearDuplicate(const domain::MatchCandidate& candidate,
                                  const std::vector<domain::MergedMatch>& accepted) const {
    for (const auto& kept : accepted) {
        if (TextSimilarity::Ratio(kept.candidate.matchedText, candidate.matchedText) >= m_dedupThreshold) {
            return true;
        }
    }
    return false;
}

domain::MergeResult MergeEngine::merge(const std::vector<domain::MatchCandidate>& candidates, double threshold) const {
    domain::MergeResult result;
    if (candidates.empty()) {
        result.outcome = domain::MatchOutcome::NoMatch;
        return result;
    }

    std::vector<domain::MatchCandidate> eligible;
    for (const auto& c : candidates) {
        if (c.score >= threshold) eligible.push_back(c);
    }
    std::stable_sort(eligible.begin(), eligible.end(), [](const auto& a, const auto& b) {
        return a.score > b.score;
    });

    std::unordered_set<std::string> acceptedIds;
    for (const auto& c : eligible) {
        if (acceptedIds.count(c.matchedId)) continue;
        if (isNearDuplicate(c, result.matches)) continue;
        acceptedIds.insert(c.matchedId);
        result.matches.push_back(m_scorer.describe(c));
    }

    if (!result.matches.empty()) {
        result.outcome = domain::MatchOutcome::NormalMatches;
        return result;
    }

    // First of the highest-scoring candidates, regardless of threshold.
    auto best = candidates.begin();
    for (auto it = candidates.begin(); it != candidates.end(); ++it) {
        if (it->score > best->score) best = it;
    }
    result.outcome = domain::MatchOutcome::FallbackMatch;
    result.matches.push_back(m_scorer.describeFallback(*best));
    return result;
}

} // namespace controlmapper::application
