/**
 * @file EvidenceValidation.hpp
 * @brief Results of validating an evidence artifact against control requirements.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace controlmapper::domain {

/**
 * @struct RequirementMatch
 * @brief A requirement record ranked against one piece of evidence.
 */
struct RequirementMatch {
    std::string requirementId;
    std::string title;        ///< Artifact name.
    std::string description;  ///< Artifact description.
    std::string category;     ///< Area of focus.
    std::string controlId;    ///< Linked control, or the queried control when unlinked.
    double score = 0.0;
};

/**
 * @struct EvidenceValidationResult
 * @brief Outcome of one (evidence, control id) validation. Never mutated after creation.
 */
struct EvidenceValidationResult {
    bool isValid = false;
    double confidenceScore = 0.0;
    std::optional<RequirementMatch> bestMatch;
    std::string explanation;
    std::vector<RequirementMatch> matches; ///< Up to evidence_top_k, ranked.
    double threshold = 0.6;
    bool usedCorpusFallback = false;       ///< No requirement was linked to the control.
};

/**
 * @struct EvidenceProcessingResult
 * @brief Full artifact pipeline result handed to the evidence registry.
 */
struct EvidenceProcessingResult {
    bool success = false;
    std::string error;
    std::string controlId;
    std::string fileName;
    std::string filePath;
    std::string fileType;
    std::uintmax_t fileSize = 0;
    std::string extractedText;
    std::string extractedTextPreview;
    EvidenceValidationResult validation;
};

} // namespace controlmapper::domain
