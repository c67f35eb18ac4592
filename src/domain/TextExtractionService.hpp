/**
 * @file TextExtractionService.hpp
 * @brief Interface for turning document files into plain text.
 */

#pragma once
#include <string>
#include <cstdint>

namespace controlmapper::domain {

/**
 * @struct ExtractedDocument
 * @brief Plain text of a document plus file metadata.
 */
struct ExtractedDocument {
    std::string text;      ///< Whitespace-collapsed UTF-8 text.
    std::string fileType;  ///< "pdf", "image", "docx" or "text".
    std::string fileName;  ///< Basename of the file.
    std::string filePath;  ///< Path as given.
    std::uintmax_t fileSize = 0;
};

/**
 * @class TextExtractionService
 * @brief Abstract document text extractor. Output is treated as opaque input text.
 */
class TextExtractionService {
public:
    virtual ~TextExtractionService() = default;

    /**
     * @brief Extracts text from a file.
     * @throws NotFoundError if the file is missing.
     * @throws ExtractionError if the format is unsupported or extraction fails.
     */
    virtual ExtractedDocument extract(const std::string& path) = 0;
};

} // namespace controlmapper::domain
