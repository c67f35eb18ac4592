/**
 * @file EmbeddingAlignmentManager.hpp
 * @brief Keeps a vector store row-aligned with its record table.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "domain/EmbeddingService.hpp"
#include "infrastructure/VectorStore.hpp"

namespace controlmapper::application {

/**
 * @class EmbeddingAlignmentManager
 * @brief Returns vectors whose row i belongs to text i, regenerating the store when stale.
 *
 * A store whose row count equals the number of texts is trusted as is; content
 * changes that keep the count are not detected. Any other store (missing,
 * unreadable or wrong size) is regenerated from scratch and replaced wholesale.
 */
class EmbeddingAlignmentManager {
public:
    /**
     * @param embedder Embedding collaborator used for regeneration.
     * @param batchSize Texts per embed() call.
     */
    EmbeddingAlignmentManager(std::shared_ptr<domain::EmbeddingService> embedder, size_t batchSize = 64);

    /**
     * @brief Loads or regenerates the store at @p store so that it has texts.size() rows.
     * @throws domain::EmbeddingGenerationFailed if regeneration fails. The existing store is left untouched.
     * @throws std::runtime_error if the regenerated store cannot be written.
     */
    domain::EmbeddingMatrix ensureAligned(const std::vector<std::string>& texts,
                                          const infrastructure::VectorStore& store);

    /** @brief Embeds all @p texts in batches and normalizes every row. */
    domain::EmbeddingMatrix embedAll(const std::vector<std::string>& texts);

    std::shared_ptr<domain::EmbeddingService> embedder() const { return m_embedder; }

private:
    std::shared_ptr<domain::EmbeddingService> m_embedder;
    size_t m_batchSize;
};

} // namespace controlmapper::application
