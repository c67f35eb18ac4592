/**
 * @file EvidenceValidator.hpp
 * @brief Scores one evidence text against the requirements of a control.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/CorpusRecord.hpp"
#include "domain/EmbeddingService.hpp"
#include "domain/EvidenceValidation.hpp"

namespace controlmapper::application {

/**
 * @class EvidenceValidator
 * @brief Scoped retrieval over the requirements linked to a control id.
 *
 * Requirements linked to the control are searched with a fresh index. When
 * none is linked, the whole requirement corpus is searched instead and the
 * explanation says so. The evidence is valid when the best score reaches the
 * threshold.
 */
class EvidenceValidator {
public:
    explicit EvidenceValidator(std::shared_ptr<domain::EmbeddingService> embedder, size_t topK = 10);

    /**
     * @brief Validates @p evidenceText for @p controlId.
     * @param requirements Requirement records, row-aligned with @p requirementVectors.
     * @throws std::invalid_argument if the records and vectors are not aligned.
     * @throws domain::EmbeddingGenerationFailed if the evidence cannot be embedded.
     */
    domain::EvidenceValidationResult validate(const std::string& evidenceText,
                                              const std::string& controlId,
                                              const domain::RecordSet& requirements,
                                              const domain::EmbeddingMatrix& requirementVectors,
                                              double threshold = 0.6) const;

private:
    domain::EmbeddingVector embedEvidence(const std::string& text) const;

    std::shared_ptr<domain::EmbeddingService> m_embedder;
    size_t m_topK;
};

} // namespace controlmapper::application
