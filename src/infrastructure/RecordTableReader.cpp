/**
 * @file RecordTableReader.cpp
 * @brief Implementation of RecordTableReader.
 */

#include "infrastructure/RecordTableReader.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/Errors.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <map>
#include <utility>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace controlmapper::infrastructure {

json RecordTableReader::LoadRows(const std::string& path, const std::vector<std::string>& requiredColumns) {
    if (!fs::exists(path)) {
        throw domain::NotFoundError("Table not found: " + path);
    }

    json rows;
    try {
        std::ifstream f(path);
        rows = json::parse(f);
    } catch (const json::exception& e) {
        throw domain::SchemaError("Malformed table " + path + ": " + e.what());
    }

    if (!rows.is_array()) {
        throw domain::SchemaError("Table " + path + " is not a JSON array of rows.");
    }

    for (size_t i = 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        if (!row.is_object()) {
            throw domain::SchemaError("Row " + std::to_string(i) + " of " + path + " is not an object.");
        }
        for (const auto& column : requiredColumns) {
            if (!row.contains(column)) {
                throw domain::SchemaError("Column '" + column + "' not found in " + path +
                                          " (row " + std::to_string(i) + ").");
            }
        }
    }
    return rows;
}

std::string RecordTableReader::CellToString(const json& row, const std::string& column) {
    if (!row.contains(column)) return {};
    const auto& cell = row[column];
    if (cell.is_null()) return {};
    if (cell.is_string()) return cell.get<std::string>();
    if (cell.is_number_integer()) return std::to_string(cell.get<long long>());
    if (cell.is_number_unsigned()) return std::to_string(cell.get<unsigned long long>());
    return cell.dump();
}

domain::RecordSet RecordTableReader::LoadControlSentences(const std::string& path) {
    json rows = LoadRows(path, {"scf_id", "domain", "text"});

    domain::RecordSet records;
    records.reserve(rows.size());
    for (const auto& row : rows) {
        domain::CorpusRecord record;
        record.id = CellToString(row, "scf_id");
        record.category = CellToString(row, "domain");
        record.title = CellToString(row, "control_title");
        record.body = CellToString(row, "text");
        records.push_back(std::move(record));
    }
    std::cout << "[RecordTableReader] Loaded " << records.size() << " control sentences from " << path << std::endl;
    return records;
}

domain::RecordSet RecordTableReader::LoadRequirements(const std::string& path, const std::string& linkPath) {
    json rows = LoadRows(path, {"erl_id", "artifact_name", "artifact_desc"});

    // erl_ref -> linked control ids, distinct pairs in first-seen order.
    std::map<std::string, std::vector<std::string>> links;
    bool joined = false;
    if (!linkPath.empty() && fs::exists(linkPath)) {
        json linkRows = LoadRows(linkPath, {"scf_id", "erl_ref"});
        std::set<std::pair<std::string, std::string>> seen;
        for (const auto& row : linkRows) {
            std::string erlRef = CellToString(row, "erl_ref");
            std::string scfId = CellToString(row, "scf_id");
            if (erlRef.empty()) continue;
            if (seen.insert({scfId, erlRef}).second) {
                links[erlRef].push_back(scfId);
            }
        }
        joined = true;
    }

    domain::RecordSet records;
    records.reserve(rows.size());
    for (const auto& row : rows) {
        domain::CorpusRecord base;
        base.id = CellToString(row, "erl_id");
        base.category = CellToString(row, "area_focus");
        base.title = CellToString(row, "artifact_name");
        base.body = CellToString(row, "artifact_desc");

        if (joined) {
            auto it = links.find(base.id);
            if (it == links.end()) {
                records.push_back(base);
                continue;
            }
            for (const auto& scfId : it->second) {
                domain::CorpusRecord linked = base;
                linked.linkedId = scfId;
                records.push_back(std::move(linked));
            }
        } else {
            std::string scfId = CellToString(row, "scf_id");
            if (!scfId.empty()) base.linkedId = scfId;
            records.push_back(std::move(base));
        }
    }
    std::cout << "[RecordTableReader] Loaded " << records.size() << " requirement records from " << path
              << (joined ? " (linked via " + linkPath + ")" : std::string()) << std::endl;
    return records;
}

domain::ClauseList RecordTableReader::LoadClauses(const std::string& path) {
    json rows = LoadRows(path, {"clause_text"});
    const std::string defaultPolicy = PathUtils::FileStem(path);

    domain::ClauseList clauses;
    clauses.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        domain::PolicyClause clause;
        clause.policyId = CellToString(row, "policy_id");
        if (clause.policyId.empty()) clause.policyId = defaultPolicy;
        clause.clauseIndex = static_cast<int>(i);
        if (row.contains("clause_index") && row["clause_index"].is_number_integer()) {
            clause.clauseIndex = row["clause_index"].get<int>();
        }
        clause.text = CellToString(row, "clause_text");
        clauses.push_back(std::move(clause));
    }
    return clauses;
}

void RecordTableReader::SaveClauses(const std::string& path, const domain::ClauseList& clauses) {
    json rows = json::array();
    for (const auto& clause : clauses) {
        rows.push_back({
            {"policy_id", clause.policyId},
            {"source", "company_policy"},
            {"clause_text", clause.text},
            {"clause_index", clause.clauseIndex}
        });
    }
    AtomicFileWriter::Write(path, rows.dump(2, ' ', false, json::error_handler_t::replace));
}

} // namespace controlmapper::infrastructure
