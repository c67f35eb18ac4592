/**
 * @file EvidenceRegistry.cpp
 * @brief Implementation of EvidenceRegistry.
 */

#include "infrastructure/EvidenceRegistry.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace controlmapper::infrastructure {

EvidenceRegistry::EvidenceRegistry(std::string registryPath, std::string storageDir)
    : m_registryPath(std::move(registryPath)), m_storageDir(std::move(storageDir)) {}

std::string EvidenceRegistry::storeArtifact(const std::string& sourcePath) const {
    fs::create_directories(m_storageDir);
    const fs::path dest = fs::path(m_storageDir) / PathUtils::TimestampedName(fs::path(sourcePath).filename().string());
    fs::copy_file(sourcePath, dest, fs::copy_options::overwrite_existing);
    return dest.string();
}

size_t EvidenceRegistry::countEntries() const {
    std::ifstream in(m_registryPath);
    size_t count = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) ++count;
    }
    return count;
}

json EvidenceRegistry::registerResult(const domain::EvidenceProcessingResult& result, bool copyFile) {
    std::string storedPath = result.filePath;
    std::string storedName = result.fileName;
    if (copyFile && result.success && fs::exists(result.filePath)) {
        try {
            storedPath = storeArtifact(result.filePath);
            storedName = fs::path(storedPath).filename().string();
        } catch (const fs::filesystem_error& e) {
            std::cerr << "[EvidenceRegistry] Could not copy artifact: " << e.what() << std::endl;
        }
    }

    const auto& v = result.validation;
    json record = {
        {"timestamp", PathUtils::IsoTimestamp()},
        {"control_id", result.controlId},
        {"file_name", result.fileName},
        {"file_name_stored", storedName},
        {"file_path", result.filePath},
        {"stored_file_path", storedPath},
        {"file_type", result.fileType},
        {"file_size", result.fileSize},
        {"is_valid", v.isValid},
        {"confidence_score", v.confidenceScore},
        {"matched_requirement_id", v.bestMatch ? v.bestMatch->requirementId : ""},
        {"matched_artifact_name", v.bestMatch ? v.bestMatch->title : ""},
        {"matched_artifact_desc", v.bestMatch ? v.bestMatch->description : ""},
        {"matched_area_focus", v.bestMatch ? v.bestMatch->category : ""},
        {"validation_explanation", v.explanation},
        {"extracted_text_preview", result.extractedTextPreview},
        {"similarity_threshold", v.threshold},
        {"success", result.success},
        {"error", result.error}
    };

    const size_t registryId = countEntries();

    if (!fs::path(m_registryPath).parent_path().empty()) {
        fs::create_directories(fs::path(m_registryPath).parent_path());
    }
    std::ofstream out(m_registryPath, std::ios::app);
    if (!out.is_open()) {
        throw std::runtime_error("Could not open evidence registry: " + m_registryPath);
    }
    out << record.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    out.flush();
    if (!out.good()) {
        throw std::runtime_error("Failed to append to evidence registry: " + m_registryPath);
    }

    record["registry_id"] = registryId;
    std::cout << "[EvidenceRegistry] Registered " << result.fileName << " for " << result.controlId
              << " (id " << registryId << ")" << std::endl;
    return record;
}

std::vector<json> EvidenceRegistry::loadAll() const {
    std::vector<json> records;
    std::ifstream in(m_registryPath);
    if (!in.is_open()) return records;

    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty()) continue;
        try {
            records.push_back(json::parse(line));
        } catch (const json::parse_error& e) {
            std::cerr << "[EvidenceRegistry] Skipping line " << lineNo << ": " << e.what() << std::endl;
        }
    }
    return records;
}

std::vector<json> EvidenceRegistry::findByControl(const std::string& controlId) const {
    std::vector<json> matches;
    for (auto& record : loadAll()) {
        if (record.value("control_id", "") == controlId) matches.push_back(std::move(record));
    }
    return matches;
}

RegistrySummary EvidenceRegistry::summarize() const {
    RegistrySummary summary;
    double confidenceSum = 0.0;
    for (const auto& record : loadAll()) {
        ++summary.total;
        if (record.value("is_valid", false)) ++summary.valid;
        confidenceSum += record.value("confidence_score", 0.0);
        ++summary.byControl[record.value("control_id", "")];
    }
    summary.invalid = summary.total - summary.valid;
    summary.uniqueControls = summary.byControl.size();
    if (summary.total > 0) summary.averageConfidence = confidenceSum / static_cast<double>(summary.total);
    return summary;
}

} // namespace controlmapper::infrastructure
