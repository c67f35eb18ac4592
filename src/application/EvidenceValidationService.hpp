/**
 * @file EvidenceValidationService.hpp
 * @brief End-to-end processing of an uploaded evidence artifact.
 */

#pragma once
#include <memory>
#include <string>
#include "application/EmbeddingAlignmentManager.hpp"
#include "application/EvidenceValidator.hpp"
#include "domain/EvidenceValidation.hpp"
#include "domain/TextExtractionService.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace controlmapper::application {

/**
 * @class EvidenceValidationService
 * @brief Extract, load requirements, align their vectors, validate.
 *
 * Failures of any step are reported in the returned result (success = false)
 * instead of being thrown, so a caller can always record what happened.
 */
class EvidenceValidationService {
public:
    EvidenceValidationService(std::shared_ptr<domain::TextExtractionService> extractor,
                              std::shared_ptr<EmbeddingAlignmentManager> aligner,
                              infrastructure::AppConfig config);

    domain::EvidenceProcessingResult processArtifact(const std::string& filePath, const std::string& controlId);

    static constexpr size_t kPreviewLength = 500;

private:
    std::shared_ptr<domain::TextExtractionService> m_extractor;
    std::shared_ptr<EmbeddingAlignmentManager> m_aligner;
    infrastructure::AppConfig m_config;
    EvidenceValidator m_validator;
};

} // namespace controlmapper::application
