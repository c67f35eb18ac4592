/**
 * @file ContentExtractor.hpp
 * @brief Text extraction from policy and evidence files (PDF, DOCX, images, plain text).
 */

#pragma once
#include <string>
#include "domain/TextExtractionService.hpp"

namespace controlmapper::infrastructure {

/**
 * @class ContentExtractor
 * @brief Shells out to pdftotext / ocrmypdf / tesseract / unzip and normalizes the output.
 */
class ContentExtractor : public domain::TextExtractionService {
public:
    domain::ExtractedDocument extract(const std::string& path) override;

    /** @brief Replaces invalid UTF-8 with U+FFFD, collapses whitespace runs and trims. */
    static std::string CleanText(const std::string& text);

    /** @brief Runs @p cmd through the shell; @p exitCode receives the decoded exit code, or -1. */
    static std::string RunCommand(const std::string& cmd, int* exitCode = nullptr);

private:
    static std::string ExtractPdf(const std::string& path);
    static std::string ExtractImage(const std::string& path);
    static std::string ExtractDocx(const std::string& path);
    static std::string ExtractPlain(const std::string& path);

    static bool HasTool(const std::string& tool);
    static std::string ShellQuote(const std::string& arg);
    static bool IsValidContent(const std::string& content);
};

} // namespace controlmapper::infrastructure
