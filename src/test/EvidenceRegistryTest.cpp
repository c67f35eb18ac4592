#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include "infrastructure/EvidenceRegistry.hpp"

using namespace controlmapper;
namespace fs = std::filesystem;

static domain::EvidenceProcessingResult Result(const std::string& file, const std::string& control,
                                               bool valid, double score) {
    domain::EvidenceProcessingResult r;
    r.success = true;
    r.filePath = file;
    r.fileName = fs::path(file).filename().string();
    r.fileType = "text";
    r.controlId = control;
    r.extractedTextPreview = "preview";
    r.validation.isValid = valid;
    r.validation.confidenceScore = score;
    r.validation.explanation = "explanation";
    domain::RequirementMatch best;
    best.requirementId = "ERL-1";
    best.title = "Encryption policy";
    r.validation.bestMatch = best;
    return r;
}

int main() {
    std::cout << "[Test] Starting EvidenceRegistry Test..." << std::endl;

    const fs::path root = fs::temp_directory_path() / "controlmapper_registry_test";
    fs::remove_all(root);
    fs::create_directories(root / "uploads");
    const fs::path artifact = root / "uploads" / "policy.txt";
    {
        std::ofstream f(artifact);
        f << "key management";
    }

    infrastructure::EvidenceRegistry registry((root / "processed" / "registry.jsonl").string(),
                                              (root / "artifacts").string());
    assert(registry.loadAll().empty());
    assert(registry.summarize().total == 0);

    auto first = registry.registerResult(Result(artifact.string(), "CRY-05", true, 0.9));
    assert(first["registry_id"] == 0);
    assert(first["matched_requirement_id"] == "ERL-1");
    const auto stored = first["stored_file_path"].get<std::string>();
    assert(fs::exists(stored));
    assert(stored != artifact.string());
    assert(fs::path(stored).filename().string().size() == std::string("YYYYmmdd_HHMMSS_policy.txt").size());
    std::cout << "[PASS] Register with artifact copy" << std::endl;

    auto second = registry.registerResult(Result(artifact.string(), "CRY-05", false, 0.4), false);
    assert(second["registry_id"] == 1);
    assert(second["stored_file_path"] == artifact.string());

    auto failed = Result(artifact.string(), "IAC-15", false, 0.0);
    failed.success = false;
    failed.error = "Failed to load requirements: missing";
    failed.validation.bestMatch.reset();
    auto third = registry.registerResult(failed);
    assert(third["registry_id"] == 2);
    assert(third["stored_file_path"] == artifact.string());
    assert(third["matched_requirement_id"] == "");

    assert(registry.loadAll().size() == 3);
    assert(registry.findByControl("CRY-05").size() == 2);
    assert(registry.findByControl("NOPE").empty());

    auto summary = registry.summarize();
    assert(summary.total == 3);
    assert(summary.valid == 1 && summary.invalid == 2);
    assert(summary.uniqueControls == 2);
    assert(std::fabs(summary.averageConfidence - (0.9 + 0.4 + 0.0) / 3.0) < 1e-9);
    assert(summary.byControl["CRY-05"] == 2 && summary.byControl["IAC-15"] == 1);
    std::cout << "[PASS] Load, filter and summarize" << std::endl;

    // A damaged line is skipped on load but still occupies an id.
    {
        std::ofstream out(root / "processed" / "registry.jsonl", std::ios::app);
        out << "{not json\n\n";
    }
    auto fourth = registry.registerResult(Result(artifact.string(), "IAC-15", true, 0.7), false);
    assert(fourth["registry_id"] == 4);
    assert(registry.loadAll().size() == 4);
    std::cout << "[PASS] Ids count damaged lines" << std::endl;

    // Non-UTF-8 text is stored with replacement characters instead of failing the append.
    auto latin1 = Result(artifact.string(), "CRY-05", true, 0.8);
    latin1.fileName = "s\xE9" "curit\xE9.txt";
    latin1.extractedTextPreview = "Politique de s\xE9" "curit\xE9";
    auto fifth = registry.registerResult(latin1, false);
    assert(fifth["registry_id"] == 5);
    const auto reloaded = registry.loadAll();
    assert(reloaded.size() == 5);
    const auto preview = reloaded.back()["extracted_text_preview"].get<std::string>();
    assert(preview.rfind("Politique de s", 0) == 0);
    assert(preview.find("\xEF\xBF\xBD") != std::string::npos);
    std::cout << "[PASS] Invalid UTF-8 replaced on append" << std::endl;

    fs::remove_all(root);
    std::cout << "[Test] EvidenceRegistry Test Completed Successfully." << std::endl;
    return 0;
}
