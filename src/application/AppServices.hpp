/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/EmbeddingAlignmentManager.hpp"
#include "application/EvidenceValidationService.hpp"
#include "application/PolicyIngestionService.hpp"
#include "domain/EmbeddingService.hpp"
#include "domain/TextExtractionService.hpp"
#include "infrastructure/EvidenceRegistry.hpp"

namespace controlmapper::application {

struct AppServices {
    std::shared_ptr<domain::EmbeddingService> embeddingService;
    std::shared_ptr<domain::TextExtractionService> extractionService;
    std::shared_ptr<EmbeddingAlignmentManager> alignmentManager;
    std::unique_ptr<PolicyIngestionService> ingestionService;
    std::unique_ptr<EvidenceValidationService> evidenceService;
    std::unique_ptr<infrastructure::EvidenceRegistry> evidenceRegistry;
};

} // namespace controlmapper::application
