/**
 * @file EmbeddingService.hpp
 * @brief Interface for the text-to-vector collaborator.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Embedding.hpp"

namespace controlmapper::domain {

/**
 * @class EmbeddingService
 * @brief Abstract black-box embedding model.
 *
 * Implementations must return one unit-normalized row per input text, in
 * input order, and be deterministic for a fixed model and input.
 */
class EmbeddingService {
public:
    virtual ~EmbeddingService() = default;

    /**
     * @brief Embeds an ordered batch of texts.
     * @param texts Texts to embed.
     * @return One vector per text, same order.
     * @throws EmbeddingGenerationFailed on backend or model failure.
     */
    virtual EmbeddingMatrix embed(const std::vector<std::string>& texts) = 0;

    /** @brief Name of the model producing the vectors (stored alongside vector files). */
    virtual std::string getModelName() const = 0;
};

} // namespace controlmapper::domain
