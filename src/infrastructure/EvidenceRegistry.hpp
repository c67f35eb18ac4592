/**
 * @file EvidenceRegistry.hpp
 * @brief Append-only log of processed evidence artifacts.
 */

#pragma once
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/EvidenceValidation.hpp"

namespace controlmapper::infrastructure {

/**
 * @struct RegistrySummary
 * @brief Aggregate counts over all registry records.
 */
struct RegistrySummary {
    size_t total = 0;
    size_t valid = 0;
    size_t invalid = 0;
    size_t uniqueControls = 0;
    double averageConfidence = 0.0;
    std::map<std::string, size_t> byControl;
};

/**
 * @class EvidenceRegistry
 * @brief JSON-lines registry with optional copies of the artifacts.
 *
 * One line per processed artifact. Records are never rewritten or removed.
 */
class EvidenceRegistry {
public:
    EvidenceRegistry(std::string registryPath, std::string storageDir);

    /**
     * @brief Appends @p result, copying the artifact into storage when requested and successful.
     * @return The stored record, including "registry_id": the number of non-empty
     *         lines (readable or not) that preceded it.
     * @throws std::runtime_error if the registry cannot be written.
     */
    nlohmann::json registerResult(const domain::EvidenceProcessingResult& result, bool copyFile = true);

    /** @brief All records in insertion order. Unparsable lines are skipped with a warning. */
    std::vector<nlohmann::json> loadAll() const;

    std::vector<nlohmann::json> findByControl(const std::string& controlId) const;

    RegistrySummary summarize() const;

private:
    std::string storeArtifact(const std::string& sourcePath) const;
    size_t countEntries() const;

    std::string m_registryPath;
    std::string m_storageDir;
};

} // namespace controlmapper::infrastructure
