#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include "domain/Errors.hpp"
#include "infrastructure/RecordTableReader.hpp"

using namespace controlmapper;
using infrastructure::RecordTableReader;
namespace fs = std::filesystem;

static void WriteFile(const fs::path& p, const std::string& content) {
    std::ofstream f(p);
    f << content;
}

template <typename Error, typename Fn>
static bool Throws(Fn fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

int main() {
    std::cout << "[Test] Starting RecordTable Test..." << std::endl;

    const fs::path root = fs::temp_directory_path() / "controlmapper_record_table_test";
    fs::remove_all(root);
    fs::create_directories(root);

    WriteFile(root / "controls.json", R"([
        {"scf_id": "CRY-05", "domain": "Cryptography", "text": "Encrypt data at rest.", "control_title": "Encryption"},
        {"scf_id": "IAC-10", "domain": "Identification", "text": "Rotate credentials.", "control_title": null}
    ])");
    auto controls = RecordTableReader::LoadControlSentences((root / "controls.json").string());
    assert(controls.size() == 2);
    assert(controls[0].id == "CRY-05" && controls[0].category == "Cryptography");
    assert(controls[0].body == "Encrypt data at rest.");
    assert(controls[1].title.empty());
    std::cout << "[PASS] Control sentences" << std::endl;

    assert(Throws<domain::NotFoundError>([&] {
        RecordTableReader::LoadControlSentences((root / "missing.json").string());
    }));
    WriteFile(root / "no_text.json", R"([{"scf_id": "CRY-05", "domain": "Cryptography"}])");
    assert(Throws<domain::SchemaError>([&] {
        RecordTableReader::LoadControlSentences((root / "no_text.json").string());
    }));
    WriteFile(root / "broken.json", "[{\"scf_id\": ");
    assert(Throws<domain::SchemaError>([&] {
        RecordTableReader::LoadControlSentences((root / "broken.json").string());
    }));
    WriteFile(root / "object.json", R"({"scf_id": "CRY-05"})");
    assert(Throws<domain::SchemaError>([&] {
        RecordTableReader::LoadControlSentences((root / "object.json").string());
    }));
    std::cout << "[PASS] Missing and malformed tables" << std::endl;

    WriteFile(root / "requirements.json", R"([
        {"erl_id": 1, "artifact_name": "Encryption policy", "artifact_desc": "Documented key management.", "area_focus": "Crypto"},
        {"erl_id": 2, "artifact_name": "Access review log", "artifact_desc": "Quarterly review evidence."},
        {"erl_id": 3, "artifact_name": "Asset list", "artifact_desc": "Inventory export."}
    ])");
    WriteFile(root / "links.json", R"([
        {"scf_id": "CRY-05", "erl_ref": "1"},
        {"scf_id": "CRY-05", "erl_ref": "1"},
        {"scf_id": "IAC-17", "erl_ref": "2"},
        {"scf_id": "IAC-15", "erl_ref": "2"}
    ])");
    auto requirements = RecordTableReader::LoadRequirements((root / "requirements.json").string(),
                                                            (root / "links.json").string());
    assert(requirements.size() == 4);
    assert(requirements[0].id == "1" && requirements[0].linkedId == std::string("CRY-05"));
    assert(requirements[0].category == "Crypto");
    assert(domain::CombinedText(requirements[0]) == "Encryption policy Documented key management.");
    assert(requirements[1].linkedId == std::string("IAC-17"));
    assert(requirements[2].linkedId == std::string("IAC-15"));
    assert(requirements[3].id == "3" && !requirements[3].linkedId);

    // Without a link table the scf_id column is used directly.
    WriteFile(root / "inline.json", R"([
        {"erl_id": "E1", "artifact_name": "A", "artifact_desc": "B", "scf_id": "GOV-01"},
        {"erl_id": "E2", "artifact_name": "C", "artifact_desc": "D"}
    ])");
    auto inlineLinked = RecordTableReader::LoadRequirements((root / "inline.json").string(),
                                                            (root / "absent_links.json").string());
    assert(inlineLinked.size() == 2);
    assert(inlineLinked[0].linkedId == std::string("GOV-01"));
    assert(!inlineLinked[1].linkedId);
    std::cout << "[PASS] Requirement linking" << std::endl;

    WriteFile(root / "acme_policy.json", R"([
        {"clause_text": "All laptops use disk encryption."},
        {"clause_text": "Passwords rotate every ninety days.", "policy_id": "hr", "clause_index": 7}
    ])");
    auto clauses = RecordTableReader::LoadClauses((root / "acme_policy.json").string());
    assert(clauses.size() == 2);
    assert(clauses[0].policyId == "acme_policy" && clauses[0].clauseIndex == 0);
    assert(clauses[1].policyId == "hr" && clauses[1].clauseIndex == 7);

    const auto saved = (root / "out" / "clauses.json").string();
    RecordTableReader::SaveClauses(saved, clauses);
    auto reread = RecordTableReader::LoadClauses(saved);
    assert(reread.size() == 2);
    assert(reread[1].text == clauses[1].text && reread[1].clauseIndex == 7);
    std::cout << "[PASS] Clause tables" << std::endl;

    fs::remove_all(root);
    std::cout << "[Test] RecordTable Test Completed Successfully." << std::endl;
    return 0;
}
