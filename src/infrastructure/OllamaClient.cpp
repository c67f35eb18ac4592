#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace controlmapper::infrastructure {

using json = nlohmann::json;

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::optional<std::vector<std::vector<float>>> OllamaClient::embed(const std::string& model,
                                                                  const std::vector<std::string>& inputs) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(600); // 10 min, large batches on CPU

    json requestData = {
        {"model", model},
        {"input", inputs}
    };

    auto res = cli.Post("/api/embed", requestData.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("embeddings") && body["embeddings"].is_array()) {
                return body["embeddings"].get<std::vector<std::vector<float>>>();
            }
            m_lastError = "Response missing 'embeddings' field";
        } catch (const std::exception& e) {
            m_lastError = std::string("JSON Parse Error: ") + e.what();
        }
    } else if (res) {
        m_lastError = "HTTP Error " + std::to_string(res->status) + ": " + res->body;
    } else {
        m_lastError = "Connection failed: " + httplib::to_string(res.error());
    }
    std::cerr << "[OllamaClient] " << m_lastError << std::endl;
    return std::nullopt;
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(5);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("models") && body["models"].is_array()) {
                for (const auto& item : body["models"]) {
                    if (item.contains("name")) {
                        models.push_back(item["name"].get<std::string>());
                    }
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] Error parsing models: " << e.what() << std::endl;
        }
    }
    return models;
}

} // namespace controlmapper::infrastructure
