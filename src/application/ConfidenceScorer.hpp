/**
 * @file ConfidenceScorer.hpp
 * @brief Score banding and explanation rendering for merged matches.
 */

#pragma once
#include <string>
#include "domain/Match.hpp"

namespace controlmapper::application {

/**
 * @struct ConfidenceCutoffs
 * @brief Inclusive lower bounds of the High and Medium bands.
 */
struct ConfidenceCutoffs {
    double high = 0.65;
    double medium = 0.55;
};

/**
 * @class ConfidenceScorer
 * @brief Maps similarity scores to bands and renders user-facing explanations.
 */
class ConfidenceScorer {
public:
    explicit ConfidenceScorer(ConfidenceCutoffs cutoffs = {});

    domain::ConfidenceBand classify(double score) const;

    /** @brief "High Confidence", "Medium Confidence" or "Low Confidence". */
    static std::string BandLabel(domain::ConfidenceBand band);

    /** @brief Builds a normal (non-fallback) merged match with its explanation. */
    domain::MergedMatch describe(const domain::MatchCandidate& candidate) const;

    /** @brief Builds the single fallback match used when nothing survives merging. */
    domain::MergedMatch describeFallback(const domain::MatchCandidate& candidate) const;

    const ConfidenceCutoffs& cutoffs() const { return m_cutoffs; }

private:
    ConfidenceCutoffs m_cutoffs;
};

} // namespace controlmapper::application
