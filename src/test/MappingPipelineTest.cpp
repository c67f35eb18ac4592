#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include "MockEmbeddingService.hpp"
#include "application/ClauseMappingPipeline.hpp"
#include "domain/Errors.hpp"

using namespace controlmapper;
using domain::MatchOutcome;
namespace fs = std::filesystem;

static void WriteFile(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream f(p);
    f << content;
}

static std::shared_ptr<MockEmbeddingService> Embedder() {
    auto embedder = std::make_shared<MockEmbeddingService>(4);
    embedder->fixed["Encrypt data at rest"] = {1.0f, 0.0f, 0.0f, 0.0f};
    embedder->fixed["Use strong encryption for stored data"] = {0.9f, 0.1f, 0.0f, 0.0f};
    embedder->fixed["Rotate credentials"] = {0.0f, 1.0f, 0.0f, 0.0f};
    embedder->fixed["Log access events"] = {0.0f, 0.0f, 1.0f, 0.0f};
    embedder->fixed["All laptops must encrypt stored data."] = {1.0f, 0.0f, 0.0f, 0.0f};
    embedder->fixed["Staff passwords are changed often."] = {0.0f, 0.4f, 0.0f, 0.9165151f};
    embedder->fixed["Visitors sign the front desk log book."] = {0.0f, 0.0f, 0.0f, 1.0f};
    return embedder;
}

static infrastructure::AppConfig SetupData(const fs::path& root) {
    infrastructure::AppConfig config;
    config.dataRoot = root.string();

    WriteFile(root / config.controlTable, R"([
        {"scf_id": "CRY-05", "domain": "Cryptography", "text": "Encrypt data at rest"},
        {"scf_id": "CRY-05", "domain": "Cryptography", "text": "Use strong encryption for stored data"},
        {"scf_id": "IAC-10", "domain": "Identification", "text": "Rotate credentials"},
        {"scf_id": "MON-01", "domain": "Monitoring", "text": "Log access events"}
    ])");
    WriteFile(root / config.clauseTable, R"([
        {"policy_id": "acme", "clause_index": 1, "clause_text": "All laptops must encrypt stored data."},
        {"policy_id": "acme", "clause_index": 2, "clause_text": "Staff passwords are changed often."},
        {"policy_id": "acme", "clause_index": 3, "clause_text": "All laptops must encrypt stored data."},
        {"policy_id": "acme", "clause_index": 4, "clause_text": "Visitors sign the front desk log book."}
    ])");
    return config;
}

static void TestEndToEnd() {
    const fs::path root = fs::temp_directory_path() / "controlmapper_pipeline_test";
    fs::remove_all(root);
    auto config = SetupData(root);

    auto embedder = Embedder();
    auto aligner = std::make_shared<application::EmbeddingAlignmentManager>(embedder, 64);
    application::ClauseMappingPipeline pipeline(aligner, config);
    auto results = pipeline.run();

    assert(results.size() == 3);
    assert(results[0].queryId == "acme#0");
    assert(results[0].outcome == MatchOutcome::NormalMatches);
    assert(results[0].matches.size() == 1);
    assert(results[0].matches[0].candidate.matchedId == "CRY-05");
    assert(results[0].matches[0].candidate.matchedText == "Encrypt data at rest");
    assert(results[0].matches[0].confidenceLabel == "High Confidence");

    assert(results[1].clauseIndex == 1);
    assert(results[1].outcome == MatchOutcome::FallbackMatch);
    assert(results[1].matches.size() == 1);
    assert(results[1].matches[0].candidate.matchedId == "IAC-10");
    assert(results[1].matches[0].confidenceLabel == "Very Low (Fallback, Sim=0.40)");

    assert(results[2].queryText == "Visitors sign the front desk log book.");
    assert(results[2].outcome == MatchOutcome::FallbackMatch);
    std::cout << "[PASS] End-to-end mapping" << std::endl;

    std::ifstream f(root / config.mappingOutput);
    auto out = nlohmann::json::parse(f);
    assert(out.is_array() && out.size() == 3);
    assert(out[0]["query_id"] == "acme#0");
    assert(out[0]["policy_id"] == "acme");
    assert(out[0]["outcome"] == "normal");
    assert(out[1]["outcome"] == "fallback");
    const auto& explanation = out[0]["mapping_explanations"][0];
    assert(explanation["matched_id"] == "CRY-05");
    assert(explanation["matched_category"] == "Cryptography");
    assert(explanation["is_fallback"] == false);
    assert(explanation["confidence"] == "High Confidence");
    assert(out[1]["mapping_explanations"][0]["is_fallback"] == true);
    std::cout << "[PASS] Mapping output file" << std::endl;

    // Stores are aligned now; a second run embeds nothing.
    const int calls = embedder->calls;
    config.mappingThreshold = 0.3;
    application::ClauseMappingPipeline lenient(aligner, config);
    auto relaxed = lenient.run();
    assert(embedder->calls == calls);
    assert(relaxed[1].outcome == MatchOutcome::NormalMatches);
    assert(relaxed[1].matches[0].band == domain::ConfidenceBand::Low);
    std::cout << "[PASS] Threshold override and store reuse" << std::endl;

    fs::remove_all(root);
}

static void TestNoMatchAndErrors() {
    application::ClauseMappingPipeline pipeline(
        std::make_shared<application::EmbeddingAlignmentManager>(Embedder(), 64), infrastructure::AppConfig{});

    domain::ClauseList clauses = {{"acme", 0, "All laptops must encrypt stored data."}};
    domain::EmbeddingMatrix vectors = {{1.0f, 0.0f, 0.0f, 0.0f}};
    const application::SimilarityIndex emptyIndex;
    auto results = pipeline.mapClauses(clauses, vectors, emptyIndex, {});
    assert(results.size() == 1);
    assert(results[0].outcome == MatchOutcome::NoMatch);
    assert(results[0].matches.empty());

    bool threw = false;
    try {
        pipeline.mapClauses(clauses, {}, emptyIndex, {});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    const fs::path root = fs::temp_directory_path() / "controlmapper_pipeline_missing";
    fs::remove_all(root);
    infrastructure::AppConfig config;
    config.dataRoot = root.string();
    application::ClauseMappingPipeline missing(
        std::make_shared<application::EmbeddingAlignmentManager>(Embedder(), 64), config);
    threw = false;
    try {
        missing.run();
    } catch (const domain::NotFoundError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] No-match and input errors" << std::endl;
}

int main() {
    std::cout << "[Test] Starting MappingPipeline Test..." << std::endl;
    TestEndToEnd();
    TestNoMatchAndErrors();
    std::cout << "[Test] MappingPipeline Test Completed Successfully." << std::endl;
    return 0;
}
