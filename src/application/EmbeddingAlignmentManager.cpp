/**
 * @file EmbeddingAlignmentManager.cpp
 * @brief Implementation of EmbeddingAlignmentManager.
 */

#include "application/EmbeddingAlignmentManager.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <iostream>

namespace controlmapper::application {

EmbeddingAlignmentManager::EmbeddingAlignmentManager(std::shared_ptr<domain::EmbeddingService> embedder,
                                                     size_t batchSize)
    : m_embedder(std::move(embedder)), m_batchSize(batchSize == 0 ? 64 : batchSize) {}

domain::EmbeddingMatrix EmbeddingAlignmentManager::ensureAligned(const std::vector<std::string>& texts,
                                                                 const infrastructure::VectorStore& store) {
    if (auto existing = store.load()) {
        if (existing->size() == texts.size()) {
            std::cout << "[EmbeddingAlignmentManager] Loaded " << existing->size()
                      << " vectors from " << store.path() << std::endl;
            return *existing;
        }
        std::cout << "[EmbeddingAlignmentManager] Store " << store.path() << " has " << existing->size()
                  << " rows but table has " << texts.size() << ", regenerating" << std::endl;
    } else {
        std::cout << "[EmbeddingAlignmentManager] No usable store at " << store.path()
                  << ", generating " << texts.size() << " vectors" << std::endl;
    }

    domain::EmbeddingMatrix vectors = embedAll(texts);
    store.save(vectors, m_embedder->getModelName());
    return vectors;
}

domain::EmbeddingMatrix EmbeddingAlignmentManager::embedAll(const std::vector<std::string>& texts) {
    if (!m_embedder) {
        throw domain::EmbeddingGenerationFailed("No embedding service configured");
    }

    domain::EmbeddingMatrix vectors;
    vectors.reserve(texts.size());
    size_t dimension = 0;

    for (size_t start = 0; start < texts.size(); start += m_batchSize) {
        const size_t end = std::min(start + m_batchSize, texts.size());
        std::vector<std::string> batch(texts.begin() + start, texts.begin() + end);

        domain::EmbeddingMatrix rows;
        try {
            rows = m_embedder->embed(batch);
        } catch (const domain::EmbeddingGenerationFailed&) {
            throw;
        } catch (const std::exception& e) {
            throw domain::EmbeddingGenerationFailed(e.what());
        }

        if (rows.size() != batch.size()) {
            throw domain::EmbeddingGenerationFailed("Embedding service returned " + std::to_string(rows.size()) +
                                                    " vectors for " + std::to_string(batch.size()) + " texts");
        }
        for (auto& row : rows) {
            if (dimension == 0) dimension = row.size();
            if (row.empty() || row.size() != dimension) {
                throw domain::EmbeddingGenerationFailed("Embedding service returned vectors of inconsistent dimension");
            }
            domain::NormalizeL2(row);
            vectors.push_back(std::move(row));
        }
        std::cout << "[EmbeddingAlignmentManager] Embedded " << end << "/" << texts.size() << std::endl;
    }
    return vectors;
}

} // namespace controlmapper::application
