/**
 * @file Errors.hpp
 * @brief Fatal error conditions raised by the mapping core.
 *
 * Degraded outcomes (empty evidence, unlinked controls, no candidate above
 * threshold) are not errors and are reported through result objects instead.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace controlmapper::domain {

/** @brief A required input file or table does not exist. */
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief A loaded table lacks an expected column or is malformed. */
class SchemaError : public std::runtime_error {
public:
    explicit SchemaError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief The embedding collaborator failed or returned unusable vectors. */
class EmbeddingGenerationFailed : public std::runtime_error {
public:
    explicit EmbeddingGenerationFailed(const std::string& what) : std::runtime_error(what) {}
};

/** @brief Text could not be extracted from a document. */
class ExtractionError : public std::runtime_error {
public:
    explicit ExtractionError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace controlmapper::domain
