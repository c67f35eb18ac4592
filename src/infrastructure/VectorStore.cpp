/**
 * @file VectorStore.cpp
 * @brief Implementation of VectorStore.
 */

#include "infrastructure/VectorStore.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace controlmapper::infrastructure {

VectorStore::VectorStore(std::string path) : m_path(std::move(path)) {}

bool VectorStore::exists() const {
    return !m_path.empty() && fs::exists(m_path);
}

std::optional<domain::EmbeddingMatrix> VectorStore::load() const {
    if (!exists()) return std::nullopt;

    try {
        std::ifstream f(m_path);
        if (!f.is_open()) return std::nullopt;

        json j = json::parse(f);
        if (!j.contains("vectors") || !j["vectors"].is_array()) {
            std::cerr << "[VectorStore] Missing 'vectors' array in " << m_path << std::endl;
            return std::nullopt;
        }

        domain::EmbeddingMatrix vectors = j["vectors"].get<domain::EmbeddingMatrix>();
        if (!vectors.empty()) {
            const size_t dim = vectors.front().size();
            for (const auto& row : vectors) {
                if (row.size() != dim) {
                    std::cerr << "[VectorStore] Inconsistent row dimension in " << m_path << std::endl;
                    return std::nullopt;
                }
            }
        }
        return vectors;
    } catch (const std::exception& e) {
        std::cerr << "[VectorStore] Failed to read " << m_path << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

void VectorStore::save(const domain::EmbeddingMatrix& vectors, const std::string& model) const {
    json j = {
        {"model", model},
        {"dimension", vectors.empty() ? 0 : vectors.front().size()},
        {"count", vectors.size()},
        {"vectors", vectors}
    };
    AtomicFileWriter::Write(m_path, j.dump());
    std::cout << "[VectorStore] Saved " << vectors.size() << " vectors -> " << m_path << std::endl;
}

} // namespace controlmapper::infrastructure
