/**
 * @file VectorStore.hpp
 * @brief File-based corpus vector store (one row per record, wholesale I/O).
 */

#pragma once
#include <string>
#include <optional>
#include "domain/Embedding.hpp"

namespace controlmapper::infrastructure {

/**
 * @class VectorStore
 * @brief Reads and writes a JSON vector matrix paired with a record table.
 *
 * Format: {"model": str, "dimension": int, "count": int, "vectors": [[...], ...]}.
 * There are no partial or append writes.
 */
class VectorStore {
public:
    explicit VectorStore(std::string path);

    /** @brief True if a store file is present on disk. */
    bool exists() const;

    /**
     * @brief Loads the whole matrix.
     * @return nullopt if the file is missing, unparsable, or has rows of mixed dimension.
     */
    std::optional<domain::EmbeddingMatrix> load() const;

    /**
     * @brief Replaces the store with @p vectors using write-then-replace.
     * @throws std::runtime_error on I/O failure (the previous store stays valid).
     */
    void save(const domain::EmbeddingMatrix& vectors, const std::string& model) const;

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

} // namespace controlmapper::infrastructure
