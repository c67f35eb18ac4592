/**
 * @file OllamaEmbeddingAdapter.hpp
 * @brief Adapter exposing a local Ollama server as the embedding collaborator.
 */

#pragma once
#include "domain/EmbeddingService.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <string>

namespace controlmapper::infrastructure {

/**
 * @class OllamaEmbeddingAdapter
 * @brief Implements EmbeddingService using the Ollama REST API.
 */
class OllamaEmbeddingAdapter : public domain::EmbeddingService {
public:
    /**
     * @brief Constructor for OllamaEmbeddingAdapter.
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param model Embedding model name.
     */
    OllamaEmbeddingAdapter(const std::string& host, int port, std::string model);

    /** @brief Embeds and L2-normalizes a batch. @see domain::EmbeddingService::embed */
    domain::EmbeddingMatrix embed(const std::vector<std::string>& texts) override;

    std::string getModelName() const override { return m_model; }

private:
    /** @brief Checks the server's model list; true when the list is unavailable. */
    bool isModelInstalled();

    OllamaClient m_client;
    std::string m_model; ///< Target model name.
};

} // namespace controlmapper::infrastructure
