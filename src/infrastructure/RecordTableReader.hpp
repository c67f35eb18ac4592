/**
 * @file RecordTableReader.hpp
 * @brief Loads JSON record tables into typed domain records.
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/CorpusRecord.hpp"
#include "domain/PolicyClause.hpp"

namespace controlmapper::infrastructure {

/**
 * @class RecordTableReader
 * @brief Wholesale reader for the control, requirement and clause tables.
 *
 * Tables are JSON arrays of row objects. Numbers are read as their string
 * form and nulls as empty strings.
 */
class RecordTableReader {
public:
    /**
     * @brief Reads a table and checks that every row has @p requiredColumns.
     * @throws domain::NotFoundError if the file does not exist.
     * @throws domain::SchemaError if the file is not an array of objects or a column is missing.
     */
    static nlohmann::json LoadRows(const std::string& path, const std::vector<std::string>& requiredColumns);

    /** @brief Control sentences: scf_id, domain, text, [control_title]. */
    static domain::RecordSet LoadControlSentences(const std::string& path);

    /**
     * @brief Evidence requirements: erl_id, artifact_name, artifact_desc, [area_focus], [scf_id].
     * @param linkPath Optional control table with scf_id/erl_ref used to link requirements to controls.
     */
    static domain::RecordSet LoadRequirements(const std::string& path, const std::string& linkPath = "");

    /** @brief Policy clauses: clause_text, [policy_id], [clause_index]. */
    static domain::ClauseList LoadClauses(const std::string& path);

    /** @brief Writes a clause table in the format LoadClauses reads. */
    static void SaveClauses(const std::string& path, const domain::ClauseList& clauses);

    /** @brief String view of a cell; missing and null cells are empty. */
    static std::string CellToString(const nlohmann::json& row, const std::string& column);
};

} // namespace controlmapper::infrastructure
