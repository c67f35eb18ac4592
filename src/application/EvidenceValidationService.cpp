/**
 * @file EvidenceValidationService.cpp
 * @brief Implementation of EvidenceValidationService.
 */

#include "application/EvidenceValidationService.hpp"
#include "application/TextFormat.hpp"
#include "infrastructure/RecordTableReader.hpp"
#include "infrastructure/VectorStore.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace controlmapper::application {

EvidenceValidationService::EvidenceValidationService(std::shared_ptr<domain::TextExtractionService> extractor,
                                                     std::shared_ptr<EmbeddingAlignmentManager> aligner,
                                                     infrastructure::AppConfig config)
    : m_extractor(std::move(extractor)),
      m_aligner(std::move(aligner)),
      m_config(std::move(config)),
      m_validator(m_aligner->embedder(), static_cast<size_t>(std::max(1, m_config.evidenceTopK))) {}

domain::EvidenceProcessingResult EvidenceValidationService::processArtifact(const std::string& filePath,
                                                                            const std::string& controlId) {
    domain::EvidenceProcessingResult result;
    result.controlId = controlId;
    result.filePath = filePath;
    result.fileName = filePath.empty() ? "Unknown" : fs::path(filePath).filename().string();
    result.validation.threshold = m_config.validationThreshold;

    auto fail = [&result](const std::string& error) {
        std::cerr << "[EvidenceValidationService] " << error << std::endl;
        result.success = false;
        result.error = error;
        return result;
    };

    try {
        auto document = m_extractor->extract(filePath);
        result.fileName = document.fileName;
        result.fileType = document.fileType;
        result.fileSize = document.fileSize;
        result.extractedText = std::move(document.text);
    } catch (const std::exception& e) {
        return fail(std::string("Extraction failed: ") + e.what());
    }

    result.extractedTextPreview = Utf8Prefix(result.extractedText, kPreviewLength);
    if (Utf8Length(result.extractedText) > kPreviewLength) result.extractedTextPreview += "...";

    domain::RecordSet requirements;
    try {
        requirements = infrastructure::RecordTableReader::LoadRequirements(
            m_config.Resolve(m_config.requirementTable), m_config.Resolve(m_config.requirementLinkTable));
    } catch (const std::exception& e) {
        return fail(std::string("Failed to load requirements: ") + e.what());
    }

    domain::EmbeddingMatrix vectors;
    try {
        std::vector<std::string> texts;
        texts.reserve(requirements.size());
        for (const auto& r : requirements) texts.push_back(domain::CombinedText(r));
        vectors = m_aligner->ensureAligned(texts,
                                           infrastructure::VectorStore(m_config.Resolve(m_config.requirementEmbeddings)));
    } catch (const std::exception& e) {
        return fail(std::string("Failed to create requirement embeddings: ") + e.what());
    }

    try {
        result.validation = m_validator.validate(result.extractedText, controlId, requirements, vectors,
                                                 m_config.validationThreshold);
    } catch (const std::exception& e) {
        return fail(std::string("Validation failed: ") + e.what());
    }

    result.success = true;
    std::cout << "[EvidenceValidationService] " << result.fileName << " vs " << controlId << ": "
              << (result.validation.isValid ? "valid" : "not valid") << " (score "
              << FormatFixed(result.validation.confidenceScore, 3) << ")" << std::endl;
    return result;
}

} // namespace controlmapper::application
