/**
 * @file EvidenceValidator.cpp
 * @brief Implementation of EvidenceValidator.
 */

#include "application/EvidenceValidator.hpp"
#include "application/CandidateRetriever.hpp"
#include "application/SimilarityIndex.hpp"
#include "application/TextFormat.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace controlmapper::application {

namespace {

bool IsBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

EvidenceValidator::EvidenceValidator(std::shared_ptr<domain::EmbeddingService> embedder, size_t topK)
    : m_embedder(std::move(embedder)), m_topK(topK) {}

domain::EmbeddingVector EvidenceValidator::embedEvidence(const std::string& text) const {
    domain::EmbeddingMatrix rows;
    try {
        rows = m_embedder->embed({text});
    } catch (const domain::EmbeddingGenerationFailed&) {
        throw;
    } catch (const std::exception& e) {
        throw domain::EmbeddingGenerationFailed(e.what());
    }
    if (rows.size() != 1 || rows.front().empty()) {
        throw domain::EmbeddingGenerationFailed("Embedding service returned no vector for the evidence text");
    }
    domain::EmbeddingVector v = std::move(rows.front());
    domain::NormalizeL2(v);
    return v;
}

domain::EvidenceValidationResult EvidenceValidator::validate(const std::string& evidenceText,
                                                             const std::string& controlId,
                                                             const domain::RecordSet& requirements,
                                                             const domain::EmbeddingMatrix& requirementVectors,
                                                             double threshold) const {
    domain::EvidenceValidationResult result;
    result.threshold = threshold;

    if (IsBlank(evidenceText)) {
        result.explanation = "Evidence contains no extractable text.";
        return result;
    }
    if (requirements.size() != requirementVectors.size()) {
        throw std::invalid_argument("Requirement vectors (" + std::to_string(requirementVectors.size()) +
                                    ") are not aligned with requirements (" +
                                    std::to_string(requirements.size()) + ")");
    }

    // Scope to the control's requirements, or the whole corpus if none are linked.
    domain::RecordSet scoped;
    domain::EmbeddingMatrix scopedVectors;
    for (size_t i = 0; i < requirements.size(); ++i) {
        if (requirements[i].linkedId && *requirements[i].linkedId == controlId) {
            scoped.push_back(requirements[i]);
            scopedVectors.push_back(requirementVectors[i]);
        }
    }
    if (scoped.empty()) {
        scoped = requirements;
        scopedVectors = requirementVectors;
        result.usedCorpusFallback = true;
    }
    if (scoped.empty()) {
        result.explanation = "No requirements found for control " + controlId + ".";
        return result;
    }

    const SimilarityIndex index(scopedVectors);
    const CandidateRetriever retriever(std::min(m_topK, scoped.size()));
    const auto candidates = retriever.retrieve(controlId, embedEvidence(evidenceText), index, scoped);

    for (const auto& c : candidates) {
        const auto& record = scoped[c.recordPosition];
        domain::RequirementMatch match;
        match.requirementId = record.id;
        match.title = record.title;
        match.description = record.body;
        match.category = record.category;
        match.controlId = record.linkedId.value_or(controlId);
        match.score = c.score;
        result.matches.push_back(std::move(match));
    }

    if (result.matches.empty() || result.matches.front().score <= 0.0) {
        result.explanation = "No suitable requirement matches found for evidence. "
                             "Evidence may not satisfy requirements for control " + controlId + ".";
        return result;
    }

    const auto& best = result.matches.front();
    result.bestMatch = best;
    result.confidenceScore = best.score;
    result.isValid = best.score >= threshold;

    const std::string prefix =
        result.usedCorpusFallback ? "Note: No direct requirement link found for " + controlId + ". " : "";
    const std::string excerpt = Utf8Prefix(best.description, 200);
    const std::string score = FormatFixed(best.score, 3);

    if (result.isValid) {
        result.explanation = prefix + "Evidence successfully matches requirement '" + best.title +
                             "' with high confidence (score: " + score +
                             "). The evidence content aligns with the requirement: '" + excerpt + "...'";
    } else {
        result.explanation = prefix + "Evidence partially matches requirement '" + best.title +
                             "' but confidence is below threshold (score: " + score +
                             ", required: " + FormatShortest(threshold) +
                             "). Manual review recommended. Best match requirement: '" + excerpt + "...'";
    }
    return result;
}

} // namespace controlmapper::application
