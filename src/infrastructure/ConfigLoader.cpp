/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace controlmapper::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

} // namespace

std::string AppConfig::Resolve(const std::string& path) const {
    std::filesystem::path p(path);
    if (p.is_absolute() || dataRoot.empty()) return p.string();
    return (std::filesystem::path(dataRoot) / p).string();
}

std::optional<std::string> ConfigLoader::FindConfigFile(const std::string& explicitPath) {
    if (!explicitPath.empty()) {
        return explicitPath;
    }
    if (std::filesystem::exists("settings.json")) {
        return std::string("settings.json");
    }
    std::filesystem::path userConfig = PathUtils::GetConfigHome() / "controlmapper" / "settings.json";
    if (std::filesystem::exists(userConfig)) {
        return userConfig.string();
    }
    return std::nullopt;
}

AppConfig ConfigLoader::Load(const std::string& path) {
    AppConfig config;
    if (path.empty()) return config;

    std::filesystem::path configPath(path);
    if (!std::filesystem::exists(configPath)) {
        std::cerr << "[ConfigLoader] " << path << " not found, using defaults." << std::endl;
        return config;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        ReadKey(j, "data_root", config.dataRoot);
        ReadKey(j, "control_table", config.controlTable);
        ReadKey(j, "control_embeddings", config.controlEmbeddings);
        ReadKey(j, "requirement_table", config.requirementTable);
        ReadKey(j, "requirement_link_table", config.requirementLinkTable);
        ReadKey(j, "requirement_embeddings", config.requirementEmbeddings);
        ReadKey(j, "clause_table", config.clauseTable);
        ReadKey(j, "clause_embeddings", config.clauseEmbeddings);
        ReadKey(j, "mapping_output", config.mappingOutput);
        ReadKey(j, "evidence_registry", config.evidenceRegistry);
        ReadKey(j, "evidence_storage", config.evidenceStorage);

        ReadKey(j, "mapping_threshold", config.mappingThreshold);
        ReadKey(j, "validation_threshold", config.validationThreshold);
        ReadKey(j, "dedup_threshold", config.dedupThreshold);
        ReadKey(j, "high_confidence", config.highConfidence);
        ReadKey(j, "medium_confidence", config.mediumConfidence);
        ReadKey(j, "top_k", config.topK);
        ReadKey(j, "evidence_top_k", config.evidenceTopK);
        ReadKey(j, "embedding_batch_size", config.embeddingBatchSize);

        ReadKey(j, "ollama_host", config.ollamaHost);
        ReadKey(j, "ollama_port", config.ollamaPort);
        ReadKey(j, "embedding_model", config.embeddingModel);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what()
                  << ". Using defaults." << std::endl;
        return AppConfig{};
    }

    if (config.embeddingBatchSize <= 0) {
        std::cerr << "[ConfigLoader] embedding_batch_size must be positive, using 64." << std::endl;
        config.embeddingBatchSize = 64;
    }
    return config;
}

} // namespace controlmapper::infrastructure
