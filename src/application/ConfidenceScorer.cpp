/**
 * @file ConfidenceScorer.cpp
 * @brief Implementation of ConfidenceScorer.
 */

#include "application/ConfidenceScorer.hpp"
#include "application/TextFormat.hpp"

namespace controlmapper::application {

ConfidenceScorer::ConfidenceScorer(ConfidenceCutoffs cutoffs) : m_cutoffs(cutoffs) {}

domain::ConfidenceBand ConfidenceScorer::classify(double score) const {
    if (score >= m_cutoffs.high) return domain::ConfidenceBand::High;
    if (score >= m_cutoffs.medium) return domain::ConfidenceBand::Medium;
    return domain::ConfidenceBand::Low;
}

std::string ConfidenceScorer::BandLabel(domain::ConfidenceBand band) {
    switch (band) {
        case domain::ConfidenceBand::High: return "High Confidence";
        case domain::ConfidenceBand::Medium: return "Medium Confidence";
        case domain::ConfidenceBand::Low: return "Low Confidence";
    }
    return "Low Confidence";
}

domain::MergedMatch ConfidenceScorer::describe(const domain::MatchCandidate& candidate) const {
    domain::MergedMatch match;
    match.candidate = candidate;
    match.band = classify(candidate.score);
    match.confidenceLabel = BandLabel(match.band);
    match.isFallback = false;
    match.explanation = "This clause likely aligns with control text that says: '" + candidate.matchedText +
                        "'. The semantic similarity score is " + FormatFixed(candidate.score, 2) +
                        ", suggesting a " + ToLower(match.confidenceLabel) + " match.";
    return match;
}

domain::MergedMatch ConfidenceScorer::describeFallback(const domain::MatchCandidate& candidate) const {
    const std::string sim = FormatFixed(candidate.score, 2);

    domain::MergedMatch match;
    match.candidate = candidate;
    match.band = classify(candidate.score);
    match.confidenceLabel = "Very Low (Fallback, Sim=" + sim + ")";
    match.isFallback = true;
    match.explanation = "No strong semantic match found, but this clause loosely relates to '" +
                        candidate.matchedText + "' with similarity " + sim + ".";
    return match;
}

} // namespace controlmapper::application
