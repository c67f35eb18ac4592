/**
 * @file SimilarityIndex.hpp
 * @brief Exact inner-product index over unit vectors.
 */

#pragma once
#include <cstddef>
#include <vector>
#include "domain/Embedding.hpp"

namespace controlmapper::application {

/**
 * @struct IndexHit
 * @brief Position of a stored vector and its inner product with the query.
 */
struct IndexHit {
    size_t position = 0;
    float score = 0.0f;
};

/**
 * @class SimilarityIndex
 * @brief Brute-force top-k search. Inner product equals cosine because rows are normalized on insert.
 *
 * Built from an aligned matrix and immutable afterwards; safe to search from
 * several threads.
 */
class SimilarityIndex {
public:
    SimilarityIndex() = default;

    /**
     * @brief Copies and normalizes @p vectors.
     * @throws std::invalid_argument if rows have different dimensions.
     */
    explicit SimilarityIndex(const domain::EmbeddingMatrix& vectors);

    /**
     * @brief Top min(k, size()) hits, descending score, ties broken by lower position.
     * @throws std::invalid_argument if the query dimension differs from the index dimension.
     */
    std::vector<IndexHit> search(const domain::EmbeddingVector& query, size_t k) const;

    size_t size() const { return m_count; }
    size_t dimension() const { return m_dimension; }

private:
    size_t m_count = 0;
    size_t m_dimension = 0;
    std::vector<float> m_data; ///< Row-major, m_count * m_dimension.
};

} // namespace controlmapper::application
