/**
 * @file Match.hpp
 * @brief Domain entities produced by retrieval, merging and explanation.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace controlmapper::domain {

/**
 * @enum ConfidenceBand
 * @brief Discrete confidence derived from a similarity score.
 */
enum class ConfidenceBand {
    High,   ///< score >= high cutoff (0.65 by default).
    Medium, ///< medium cutoff <= score < high cutoff.
    Low     ///< Everything below the medium cutoff.
};

/**
 * @enum MatchOutcome
 * @brief How a query's match list was obtained.
 */
enum class MatchOutcome {
    NormalMatches, ///< At least one candidate survived threshold and dedup.
    FallbackMatch, ///< Nothing survived; best raw candidate returned with a fallback tag.
    NoMatch        ///< Retrieval produced no candidates at all.
};

/**
 * @struct MatchCandidate
 * @brief One corpus record returned by nearest-neighbor search for a query.
 */
struct MatchCandidate {
    std::string queryId;
    std::string matchedId;
    std::string matchedText;
    std::string matchedCategory;
    double score = 0.0;  ///< Cosine similarity, effectively [0, 1].
    size_t recordPosition = 0; ///< Row of the matched record in the searched RecordSet.
};

/**
 * @struct MergedMatch
 * @brief A candidate that survived threshold and dedup, with its rendered explanation.
 */
struct MergedMatch {
    MatchCandidate candidate;
    ConfidenceBand band = ConfidenceBand::Low;
    std::string confidenceLabel; ///< e.g. "High Confidence" or "Very Low (Fallback, Sim=0.31)".
    std::string explanation;
    bool isFallback = false;
};

/**
 * @struct MergeResult
 * @brief Output of the merge step for one query.
 */
struct MergeResult {
    MatchOutcome outcome = MatchOutcome::NoMatch;
    std::vector<MergedMatch> matches; ///< Descending score order.
};

/**
 * @struct MappingResult
 * @brief Mapping of one policy clause to the control corpus.
 */
struct MappingResult {
    std::string queryId;    ///< "<policyId>#<clauseIndex>".
    std::string policyId;
    int clauseIndex = 0;
    std::string queryText;
    MatchOutcome outcome = MatchOutcome::NoMatch;
    std::vector<MergedMatch> matches;
};

inline const char* OutcomeToString(MatchOutcome outcome) {
    switch (outcome) {
        case MatchOutcome::NormalMatches: return "normal";
        case MatchOutcome::FallbackMatch: return "fallback";
        case MatchOutcome::NoMatch: return "no_match";
    }
    return "no_match";
}

} // namespace controlmapper::domain
