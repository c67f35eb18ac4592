/**
 * @file ConfigLoader.hpp
 * @brief Loading of application configuration (settings.json).
 *
 * Provides a single typed view of file locations, thresholds and the embedding
 * backend without scattering JSON parsing throughout the codebase.
 */

#pragma once

#include <string>
#include <optional>

namespace controlmapper::infrastructure {

/**
 * @struct AppConfig
 * @brief All tunables of the mapping core. Defaults match the tuned cutoffs.
 */
struct AppConfig {
    std::string dataRoot = "data";

    // Tables and vector stores, relative to dataRoot unless absolute.
    std::string controlTable = "processed/scf_sentences.json";
    std::string controlEmbeddings = "processed/embeddings/scf_embeddings.json";
    std::string requirementTable = "processed/scf_evidence_list.json";
    std::string requirementLinkTable = "processed/scf_controls.json";
    std::string requirementEmbeddings = "processed/embeddings/erl_embeddings.json";
    std::string clauseTable = "company_policies/processed/policy_clauses.json";
    std::string clauseEmbeddings = "processed/embeddings/policy_embeddings.json";
    std::string mappingOutput = "processed/explainable_mappings.json";
    std::string evidenceRegistry = "processed/evidence_registry.jsonl";
    std::string evidenceStorage = "evidence_artifacts";

    double mappingThreshold = 0.5;
    double validationThreshold = 0.6;
    double dedupThreshold = 0.6;
    double highConfidence = 0.65;
    double mediumConfidence = 0.55;
    int topK = 50;
    int evidenceTopK = 10;
    int embeddingBatchSize = 64;

    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string embeddingModel = "nomic-embed-text";

    /** @brief Resolves a configured path against dataRoot. */
    std::string Resolve(const std::string& path) const;
};

class ConfigLoader {
public:
    /**
     * @brief Finds the settings file: explicit path, ./settings.json, then the XDG config dir.
     * @return The first existing candidate, or nullopt.
     */
    static std::optional<std::string> FindConfigFile(const std::string& explicitPath = "");

    /**
     * @brief Loads configuration. Missing keys keep their defaults.
     * @param path settings.json path; empty means defaults only.
     */
    static AppConfig Load(const std::string& path);
};

} // namespace controlmapper::infrastructure
