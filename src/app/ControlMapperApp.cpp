/**
 * @file ControlMapperApp.cpp
 * @brief Implementation of the ControlMapperApp class.
 */
#include "app/ControlMapperApp.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include "application/ClauseMappingPipeline.hpp"
#include "infrastructure/ContentExtractor.hpp"
#include "infrastructure/OllamaEmbeddingAdapter.hpp"
#include "infrastructure/RecordTableReader.hpp"
#include "infrastructure/VectorStore.hpp"

namespace controlmapper::app {

void ControlMapperApp::PrintUsage() {
    std::cerr << "Usage: controlmapper [--config <file>] <command>\n"
              << "Commands:\n"
              << "  embed                                      Align control and requirement vector stores\n"
              << "  ingest-policy <file>                       Split a policy document into clauses\n"
              << "  map [--threshold <x>]                      Map clauses to controls\n"
              << "  validate <file> <control-id> [--no-register]  Validate an evidence artifact\n"
              << "  registry-summary                           Print evidence registry statistics\n";
}

void ControlMapperApp::Init(const std::string& configPath) {
    auto found = infrastructure::ConfigLoader::FindConfigFile(configPath);
    if (!configPath.empty() && !std::filesystem::exists(configPath)) {
        throw std::runtime_error("Config file not found: " + configPath);
    }
    m_config = infrastructure::ConfigLoader::Load(found.value_or(""));
    if (found) {
        std::cout << "[ControlMapperApp] Using config " << *found << std::endl;
    }
}

int ControlMapperApp::Run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string configPath;
    if (args.size() >= 2 && args[0] == "--config") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
        PrintUsage();
        return 1;
    }

    const std::string command = args[0];
    args.erase(args.begin());

    try {
        Init(configPath);

        // Composition root
        m_services.embeddingService = std::make_shared<infrastructure::OllamaEmbeddingAdapter>(
            m_config.ollamaHost, m_config.ollamaPort, m_config.embeddingModel);
        m_services.extractionService = std::make_shared<infrastructure::ContentExtractor>();
        m_services.alignmentManager = std::make_shared<application::EmbeddingAlignmentManager>(
            m_services.embeddingService, static_cast<size_t>(m_config.embeddingBatchSize));
        m_services.ingestionService = std::make_unique<application::PolicyIngestionService>(
            m_services.extractionService, m_config.Resolve(m_config.clauseTable));
        m_services.evidenceService = std::make_unique<application::EvidenceValidationService>(
            m_services.extractionService, m_services.alignmentManager, m_config);
        m_services.evidenceRegistry = std::make_unique<infrastructure::EvidenceRegistry>(
            m_config.Resolve(m_config.evidenceRegistry), m_config.Resolve(m_config.evidenceStorage));

        if (command == "embed") return RunEmbed();
        if (command == "ingest-policy") return RunIngestPolicy(args);
        if (command == "map") return RunMap(args);
        if (command == "validate") return RunValidate(args);
        if (command == "registry-summary") return RunRegistrySummary();

        std::cerr << "Unknown command: " << command << std::endl;
        PrintUsage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ControlMapperApp] Error: " << e.what() << std::endl;
        return 1;
    }
}

int ControlMapperApp::RunEmbed() {
    using infrastructure::RecordTableReader;
    using infrastructure::VectorStore;

    const auto controls = RecordTableReader::LoadControlSentences(m_config.Resolve(m_config.controlTable));
    std::vector<std::string> controlTexts;
    for (const auto& r : controls) controlTexts.push_back(r.body);
    const auto controlVectors = m_services.alignmentManager->ensureAligned(
        controlTexts, VectorStore(m_config.Resolve(m_config.controlEmbeddings)));

    const auto requirements = RecordTableReader::LoadRequirements(
        m_config.Resolve(m_config.requirementTable), m_config.Resolve(m_config.requirementLinkTable));
    std::vector<std::string> requirementTexts;
    for (const auto& r : requirements) requirementTexts.push_back(domain::CombinedText(r));
    const auto requirementVectors = m_services.alignmentManager->ensureAligned(
        requirementTexts, VectorStore(m_config.Resolve(m_config.requirementEmbeddings)));

    std::cout << "Controls: " << controlVectors.size() << " vectors, requirements: "
              << requirementVectors.size() << " vectors" << std::endl;
    return 0;
}

int ControlMapperApp::RunIngestPolicy(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        PrintUsage();
        return 1;
    }
    const auto clauses = m_services.ingestionService->ingest(args[0]);
    std::cout << "Extracted " << clauses.size() << " clauses from " << args[0] << std::endl;
    return 0;
}

int ControlMapperApp::RunMap(const std::vector<std::string>& args) {
    infrastructure::AppConfig config = m_config;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--threshold" && i + 1 < args.size()) {
            config.mappingThreshold = std::stod(args[++i]);
        } else {
            PrintUsage();
            return 1;
        }
    }

    application::ClauseMappingPipeline pipeline(m_services.alignmentManager, config);
    const auto results = pipeline.run();

    // Short preview of the first mappings.
    const size_t preview = std::min<size_t>(results.size(), 3);
    for (size_t i = 0; i < preview; ++i) {
        const auto& r = results[i];
        std::cout << "\nClause " << r.queryId << ": " << r.queryText << "\n";
        for (const auto& m : r.matches) {
            std::cout << "  -> " << m.candidate.matchedId << " [" << m.confidenceLabel << "] "
                      << std::fixed << std::setprecision(2) << m.candidate.score << "\n";
        }
    }
    std::cout << "\nMapped " << results.size() << " clauses -> " << config.Resolve(config.mappingOutput) << std::endl;
    return 0;
}

int ControlMapperApp::RunValidate(const std::vector<std::string>& args) {
    if (args.size() < 2 || args.size() > 3 || (args.size() == 3 && args[2] != "--no-register")) {
        PrintUsage();
        return 1;
    }
    const bool registerResult = args.size() == 2;

    const auto result = m_services.evidenceService->processArtifact(args[0], args[1]);
    if (registerResult) {
        m_services.evidenceRegistry->registerResult(result);
    }

    std::cout << "File: " << result.fileName << "\n"
              << "Control: " << result.controlId << "\n";
    if (!result.success) {
        std::cout << "Error: " << result.error << std::endl;
        return 1;
    }
    const auto& v = result.validation;
    std::cout << "Valid: " << (v.isValid ? "yes" : "no") << "\n"
              << "Confidence: " << std::fixed << std::setprecision(3) << v.confidenceScore << "\n";
    if (v.bestMatch) {
        std::cout << "Matched requirement: " << v.bestMatch->requirementId << " (" << v.bestMatch->title << ")\n";
    }
    std::cout << "\n" << v.explanation << std::endl;
    return 0;
}

int ControlMapperApp::RunRegistrySummary() {
    const auto summary = m_services.evidenceRegistry->summarize();
    std::cout << "Total evidence:   " << summary.total << "\n"
              << "Valid:            " << summary.valid << "\n"
              << "Invalid:          " << summary.invalid << "\n"
              << "Unique controls:  " << summary.uniqueControls << "\n"
              << "Avg confidence:   " << std::fixed << std::setprecision(3) << summary.averageConfidence << "\n";
    for (const auto& [control, count] : summary.byControl) {
        std::cout << "  " << control << ": " << count << "\n";
    }
    std::cout << std::flush;
    return 0;
}

} // namespace controlmapper::app
