/**
 * @file Embedding.hpp
 * @brief Vector types shared by the embedding collaborator, stores and the index.
 */

#pragma once
#include <cmath>
#include <vector>

namespace controlmapper::domain {

/// Fixed-dimension float vector, one per record or query.
using EmbeddingVector = std::vector<float>;

/// Row-ordered vectors; row i belongs to record i of the paired RecordSet.
using EmbeddingMatrix = std::vector<EmbeddingVector>;

/** @brief Scales @p v to unit length in place. Zero vectors are left unchanged. */
inline void NormalizeL2(EmbeddingVector& v) {
    double sq = 0.0;
    for (float x : v) sq += static_cast<double>(x) * x;
    if (sq <= 0.0) return;
    const float inv = static_cast<float>(1.0 / std::sqrt(sq));
    for (float& x : v) x *= inv;
}

} // namespace controlmapper::domain
