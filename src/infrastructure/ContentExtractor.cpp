/**
 * @file ContentExtractor.cpp
 * @brief Implementation of ContentExtractor.
 */

#include "infrastructure/ContentExtractor.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <sys/wait.h>

namespace fs = std::filesystem;

namespace controlmapper::infrastructure {

namespace {

const std::set<std::string> kImageExtensions = {".png", ".jpg", ".jpeg", ".tiff", ".bmp", ".gif", ".webp"};

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

// Length of the well-formed UTF-8 sequence starting at text[i], or 0.
size_t ValidSequenceLength(const std::string& text, size_t i) {
    const auto byte = [&](size_t k) { return static_cast<unsigned char>(text[k]); };
    const unsigned char lead = byte(i);
    if (lead < 0x80) return 1;

    size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) lo = 0xA0;
        if (lead == 0xED) hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }
    if (i + len > text.size()) return 0;
    if (byte(i + 1) < lo || byte(i + 1) > hi) return 0;
    for (size_t k = 2; k < len; ++k) {
        if (byte(i + k) < 0x80 || byte(i + k) > 0xBF) return 0;
    }
    return len;
}

// Each byte that does not start a well-formed sequence becomes U+FFFD.
std::string ToValidUtf8(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        const size_t len = ValidSequenceLength(text, i);
        if (len == 0) {
            out += "\xEF\xBF\xBD";
            ++i;
        } else {
            out.append(text, i, len);
            i += len;
        }
    }
    return out;
}

int DecodeExitStatus(int status) {
    if (status == -1) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

} // namespace

domain::ExtractedDocument ContentExtractor::extract(const std::string& path) {
    fs::path p(path);
    if (!fs::exists(p)) {
        throw domain::NotFoundError("File not found: " + path);
    }

    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });

    domain::ExtractedDocument doc;
    doc.fileName = p.filename().string();
    doc.filePath = path;
    doc.fileSize = fs::file_size(p);

    if (ext == ".pdf") {
        doc.fileType = "pdf";
        doc.text = CleanText(ExtractPdf(path));
    } else if (kImageExtensions.count(ext)) {
        doc.fileType = "image";
        doc.text = CleanText(ExtractImage(path));
    } else if (ext == ".docx") {
        doc.fileType = "docx";
        doc.text = CleanText(ExtractDocx(path));
    } else if (ext == ".txt" || ext == ".md") {
        doc.fileType = "text";
        doc.text = CleanText(ExtractPlain(path));
    } else {
        throw domain::ExtractionError("Unsupported file type: " + ext +
                                      ". Supported: PDF, DOCX, TXT, MD, PNG, JPG, JPEG, TIFF, BMP, GIF, WEBP");
    }
    return doc;
}

std::string ContentExtractor::CleanText(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (unsigned char c : ToValidUtf8(text)) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::string ContentExtractor::ExtractPdf(const std::string& path) {
    // Tier 1: text layer
    int status = 0;
    std::string content = RunCommand("pdftotext " + ShellQuote(path) + " - 2>/dev/null", &status);
    if (status == 0 && IsValidContent(content)) {
        return content;
    }

    // Tier 2: image-only PDF, add a text layer first
    if (HasTool("ocrmypdf")) {
        std::cout << "[ContentExtractor] No text layer in " << path << ", running OCR..." << std::endl;
        auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        fs::path tempPdf = fs::temp_directory_path() / ("controlmapper_" + std::to_string(now) + "_ocr.pdf");
        int ocrStatus = 0;
        RunCommand("ocrmypdf --output-type pdf " + ShellQuote(path) + " " + ShellQuote(tempPdf.string()) + " 2>&1",
                   &ocrStatus);
        std::string ocrContent;
        if (ocrStatus == 0) {
            ocrContent = RunCommand("pdftotext " + ShellQuote(tempPdf.string()) + " - 2>/dev/null");
        }
        std::error_code ec;
        fs::remove(tempPdf, ec);
        if (IsValidContent(ocrContent)) {
            return ocrContent;
        }
    }

    if (status != 0) {
        throw domain::ExtractionError("Failed to extract text from PDF " + path +
                                      " (pdftotext exit code " + std::to_string(status) + ")");
    }
    return content;
}

std::string ContentExtractor::ExtractImage(const std::string& path) {
    if (!HasTool("tesseract")) {
        throw domain::ExtractionError("Tesseract OCR is not installed or not in PATH.");
    }
    int status = 0;
    std::string content = RunCommand("tesseract " + ShellQuote(path) + " stdout --oem 3 --psm 6 2>/dev/null", &status);
    if (status != 0) {
        throw domain::ExtractionError("Failed to extract text from image " + path +
                                      " (tesseract exit code " + std::to_string(status) + ")");
    }
    return content;
}

std::string ContentExtractor::ExtractDocx(const std::string& path) {
    int status = 0;
    std::string xml = RunCommand("unzip -p " + ShellQuote(path) + " word/document.xml 2>/dev/null", &status);
    if (status != 0 || xml.empty()) {
        throw domain::ExtractionError("Failed to read DOCX document body: " + path);
    }

    ReplaceAll(xml, "</w:p>", "\n");
    std::string text;
    text.reserve(xml.size());
    bool inTag = false;
    for (char c : xml) {
        if (c == '<') { inTag = true; continue; }
        if (c == '>') { inTag = false; continue; }
        if (!inTag) text.push_back(c);
    }
    ReplaceAll(text, "&lt;", "<");
    ReplaceAll(text, "&gt;", ">");
    ReplaceAll(text, "&quot;", "\"");
    ReplaceAll(text, "&apos;", "'");
    ReplaceAll(text, "&amp;", "&");
    return text;
}

std::string ContentExtractor::ExtractPlain(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw domain::ExtractionError("Could not open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string ContentExtractor::RunCommand(const std::string& cmd, int* exitCode) {
    std::string output;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        if (exitCode) *exitCode = -1;
        return output;
    }
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output.append(buffer);
    }
    int status = pclose(pipe);
    if (exitCode) *exitCode = DecodeExitStatus(status);
    return output;
}

bool ContentExtractor::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + tool + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

std::string ContentExtractor::ShellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') quoted += "'\\''";
        else quoted.push_back(c);
    }
    quoted += "'";
    return quoted;
}

bool ContentExtractor::IsValidContent(const std::string& content) {
    size_t nonWhitespace = 0;
    for (char c : content) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            ++nonWhitespace;
            if (nonWhitespace >= 10) return true;
        }
    }
    return false;
}

} // namespace controlmapper::infrastructure
