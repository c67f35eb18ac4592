/**
 * @file MappingResultWriter.hpp
 * @brief Serialization of clause mapping results.
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Match.hpp"

namespace controlmapper::infrastructure {

/**
 * @class MappingResultWriter
 * @brief Writes the explainable mapping file consumed by reports and review tools.
 */
class MappingResultWriter {
public:
    static nlohmann::json ToJson(const domain::MappingResult& result);

    /** @brief Replaces @p path with a JSON array of all results. */
    static void Write(const std::string& path, const std::vector<domain::MappingResult>& results);
};

} // namespace controlmapper::infrastructure
