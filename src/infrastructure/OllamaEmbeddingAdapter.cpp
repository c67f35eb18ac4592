#include "infrastructure/OllamaEmbeddingAdapter.hpp"
#include "domain/Errors.hpp"
#include <iostream>

namespace controlmapper::infrastructure {

OllamaEmbeddingAdapter::OllamaEmbeddingAdapter(const std::string& host, int port, std::string model)
    : m_client(host, port), m_model(std::move(model)) {}

domain::EmbeddingMatrix OllamaEmbeddingAdapter::embed(const std::vector<std::string>& texts) {
    if (texts.empty()) return {};

    auto response = m_client.embed(m_model, texts);
    if (!response) {
        std::string error = m_client.lastError();
        if (!isModelInstalled()) {
            error += " (model '" + m_model + "' is not installed, run: ollama pull " + m_model + ")";
        }
        throw domain::EmbeddingGenerationFailed("Ollama embedding request failed (" + m_model + "): " + error);
    }

    domain::EmbeddingMatrix vectors = std::move(*response);
    if (vectors.size() != texts.size()) {
        throw domain::EmbeddingGenerationFailed("Ollama returned " + std::to_string(vectors.size()) +
                                                " vectors for " + std::to_string(texts.size()) + " inputs.");
    }
    for (auto& v : vectors) {
        if (v.empty() || v.size() != vectors.front().size()) {
            throw domain::EmbeddingGenerationFailed("Ollama returned vectors of inconsistent dimension.");
        }
        domain::NormalizeL2(v);
    }
    return vectors;
}

bool OllamaEmbeddingAdapter::isModelInstalled() {
    const auto models = m_client.getAvailableModels();
    // An unreachable server lists nothing; the connection error already says enough.
    if (models.empty()) return true;
    for (const auto& name : models) {
        if (name == m_model || name.substr(0, name.find(':')) == m_model) return true;
    }
    std::cerr << "[OllamaEmbeddingAdapter] Model " << m_model << " not found on server" << std::endl;
    return false;
}

} // namespace controlmapper::infrastructure
