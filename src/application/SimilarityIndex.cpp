/**
 * @file SimilarityIndex.cpp
 * @brief Implementation of SimilarityIndex.
 */

#include "application/SimilarityIndex.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace controlmapper::application {

SimilarityIndex::SimilarityIndex(const domain::EmbeddingMatrix& vectors) {
    if (vectors.empty()) return;

    m_dimension = vectors.front().size();
    m_count = vectors.size();
    m_data.reserve(m_count * m_dimension);
    for (size_t i = 0; i < vectors.size(); ++i) {
        if (vectors[i].size() != m_dimension) {
            throw std::invalid_argument("Vector " + std::to_string(i) + " has dimension " +
                                        std::to_string(vectors[i].size()) + ", expected " +
                                        std::to_string(m_dimension));
        }
        domain::EmbeddingVector row = vectors[i];
        domain::NormalizeL2(row);
        m_data.insert(m_data.end(), row.begin(), row.end());
    }
}

std::vector<IndexHit> SimilarityIndex::search(const domain::EmbeddingVector& query, size_t k) const {
    std::vector<IndexHit> hits;
    if (m_count == 0 || k == 0) return hits;
    if (query.size() != m_dimension) {
        throw std::invalid_argument("Query dimension " + std::to_string(query.size()) +
                                    " does not match index dimension " + std::to_string(m_dimension));
    }

    std::vector<float> scores(m_count);
    for (size_t row = 0; row < m_count; ++row) {
        const float* v = m_data.data() + row * m_dimension;
        float dot = 0.0f;
        for (size_t d = 0; d < m_dimension; ++d) dot += v[d] * query[d];
        scores[row] = dot;
    }

    std::vector<size_t> order(m_count);
    std::iota(order.begin(), order.end(), 0);
    const size_t limit = std::min(k, m_count);
    std::partial_sort(order.begin(), order.begin() + limit, order.end(), [&scores](size_t a, size_t b) {
        if (scores[a] != scores[b]) return scores[a] > scores[b];
        return a < b;
    });

    hits.reserve(limit);
    for (size_t i = 0; i < limit; ++i) {
        hits.push_back({order[i], scores[order[i]]});
    }
    return hits;
}

} // namespace controlmapper::application
