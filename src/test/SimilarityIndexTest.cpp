#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include "application/CandidateRetriever.hpp"
#include "application/SimilarityIndex.hpp"

using namespace controlmapper;

int main() {
    std::cout << "[Test] Starting SimilarityIndex Test..." << std::endl;

    domain::EmbeddingMatrix vectors = {
        {1.0f, 0.0f, 0.0f},
        {0.0f, 2.0f, 0.0f},   // normalized on insert
        {0.0f, 0.0f, 1.0f},
        {0.0f, 1.0f, 0.0f},   // same direction as row 1
    };
    application::SimilarityIndex index(vectors);
    assert(index.size() == 4);
    assert(index.dimension() == 3);

    auto hits = index.search({0.0f, 1.0f, 0.0f}, 2);
    assert(hits.size() == 2);
    assert(hits[0].position == 1 && hits[1].position == 3); // tie goes to the lower position
    assert(std::fabs(hits[0].score - 1.0f) < 1e-6f);
    std::cout << "[PASS] Top-k with ties" << std::endl;

    hits = index.search({1.0f, 0.0f, 0.0f}, 100);
    assert(hits.size() == 4);
    for (size_t i = 1; i < hits.size(); ++i) assert(hits[i - 1].score >= hits[i].score);
    assert(index.search({1.0f, 0.0f, 0.0f}, 0).empty());
    assert(application::SimilarityIndex().search({1.0f}, 5).empty());
    std::cout << "[PASS] k capped at corpus size" << std::endl;

    bool threw = false;
    try {
        index.search({1.0f, 0.0f}, 1);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        application::SimilarityIndex bad({{1.0f, 0.0f}, {1.0f}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Dimension checks" << std::endl;

    // Control sentences repeat ids; only the best occurrence survives.
    domain::RecordSet records = {
        {"IAC-01", "Identification", "", "Authenticate users", std::nullopt},
        {"IAC-01", "Identification", "", "Authenticate users with MFA", std::nullopt},
        {"CRY-05", "Cryptography", "", "Encrypt data at rest", std::nullopt},
        {"IAC-02", "Identification", "", "Review user access", std::nullopt},
    };
    application::SimilarityIndex recordIndex({
        {0.0f, 1.0f, 0.0f},
        {0.0f, 0.9f, 0.1f},
        {1.0f, 0.0f, 0.0f},
        {0.0f, 0.5f, 0.5f},
    });
    application::CandidateRetriever retriever(50);
    auto candidates = retriever.retrieve("pol#1", {0.0f, 1.0f, 0.0f}, recordIndex, records);
    assert(candidates.size() == 3);
    assert(candidates[0].matchedId == "IAC-01");
    assert(candidates[0].matchedText == "Authenticate users");
    assert(candidates[0].queryId == "pol#1");
    assert(candidates[1].matchedId == "IAC-02");
    assert(candidates[2].matchedId == "CRY-05");
    assert(candidates[2].recordPosition == 2);

    application::CandidateRetriever narrow(1);
    assert(narrow.retrieve("q", {0.0f, 1.0f, 0.0f}, recordIndex, records).size() == 1);
    application::CandidateRetriever none(0);
    assert(none.retrieve("q", {0.0f, 1.0f, 0.0f}, recordIndex, records).empty());
    std::cout << "[PASS] Retrieval dedup by record id" << std::endl;

    std::cout << "[Test] SimilarityIndex Test Completed Successfully." << std::endl;
    return 0;
}
