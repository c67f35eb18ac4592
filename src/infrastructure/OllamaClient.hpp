/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace controlmapper::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /**
     * @brief Sends a POST request to /api/embed with a batch of inputs.
     * @return One vector per input, or nullopt on HTTP / parse failure.
     */
    std::optional<std::vector<std::vector<float>>> embed(const std::string& model,
                                                        const std::vector<std::string>& inputs);

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

    /** @brief Last error message from a failed request. */
    const std::string& lastError() const { return m_lastError; }

private:
    std::string m_host;
    int m_port;
    std::string m_lastError;
};

} // namespace controlmapper::infrastructure
