#include <cassert>
#include <iostream>
#include "application/ConfidenceScorer.hpp"
#include "application/MergeEngine.hpp"

using namespace controlmapper;
using domain::ConfidenceBand;
using domain::MatchOutcome;

static domain::MatchCandidate Candidate(const std::string& id, const std::string& text, double score) {
    domain::MatchCandidate c;
    c.queryId = "q";
    c.matchedId = id;
    c.matchedText = text;
    c.matchedCategory = "Domain";
    c.score = score;
    return c;
}

static void TestConfidenceBands() {
    application::ConfidenceScorer scorer;
    assert(scorer.classify(0.65) == ConfidenceBand::High);
    assert(scorer.classify(0.649) == ConfidenceBand::Medium);
    assert(scorer.classify(0.55) == ConfidenceBand::Medium);
    assert(scorer.classify(0.5499) == ConfidenceBand::Low);
    assert(scorer.classify(0.0) == ConfidenceBand::Low);

    auto match = scorer.describe(Candidate("RTC-1", "rotate credentials", 0.8));
    assert(match.confidenceLabel == "High Confidence");
    assert(match.explanation ==
           "This clause likely aligns with control text that says: 'rotate credentials'. "
           "The semantic similarity score is 0.80, suggesting a high confidence match.");
    std::cout << "[PASS] Confidence bands and explanations" << std::endl;
}

static void TestNormalMatch() {
    application::MergeEngine engine;
    auto result = engine.merge({
        Candidate("B", "rotate credentials", 0.80),
        Candidate("C", "log access events", 0.31),
        Candidate("A", "encrypt data at rest", 0.12),
    }, 0.5);
    assert(result.outcome == MatchOutcome::NormalMatches);
    assert(result.matches.size() == 1);
    assert(result.matches[0].candidate.matchedId == "B");
    assert(result.matches[0].band == ConfidenceBand::High);
    assert(!result.matches[0].isFallback);
    std::cout << "[PASS] Single normal match" << std::endl;
}

static void TestNearDuplicateDropped() {
    application::MergeEngine engine;
    auto result = engine.merge({
        Candidate("E", "conduct quarterly access reviews", 0.68),
        Candidate("D", "perform quarterly access review", 0.72),
        Candidate("F", "encrypt data at rest", 0.60),
    }, 0.5);
    assert(result.outcome == MatchOutcome::NormalMatches);
    assert(result.matches.size() == 2);
    assert(result.matches[0].candidate.matchedId == "D");
    assert(result.matches[1].candidate.matchedId == "F");
    assert(result.matches[1].band == ConfidenceBand::Medium);
    std::cout << "[PASS] Near-duplicate dropped" << std::endl;
}

static void TestFallbackAndEmpty() {
    application::MergeEngine engine;
    auto result = engine.merge({
        Candidate("X", "maintain asset inventory", 0.22),
        Candidate("Y", "define data retention", 0.31),
        Candidate("Z", "train employees annually", 0.31),
    }, 0.5);
    assert(result.outcome == MatchOutcome::FallbackMatch);
    assert(result.matches.size() == 1);
    const auto& fb = result.matches[0];
    assert(fb.isFallback);
    assert(fb.candidate.matchedId == "Y");
    assert(fb.confidenceLabel == "Very Low (Fallback, Sim=0.31)");
    assert(fb.explanation ==
           "No strong semantic match found, but this clause loosely relates to "
           "'define data retention' with similarity 0.31.");

    auto empty = engine.merge({}, 0.5);
    assert(empty.outcome == MatchOutcome::NoMatch);
    assert(empty.matches.empty());
    std::cout << "[PASS] Fallback and no-match" << std::endl;
}

static void TestMergeProperties() {
    application::MergeEngine engine;
    std::vector<domain::MatchCandidate> candidates = {
        Candidate("A", "encrypt data at rest", 0.55),
        Candidate("A", "encrypt data at rest", 0.90),
        Candidate("B", "rotate credentials", 0.70),
        Candidate("C", "log access events", 0.70),
        Candidate("D", "maintain asset inventory", 0.49),
    };
    auto result = engine.merge(candidates, 0.5);
    assert(result.outcome == MatchOutcome::NormalMatches);
    assert(result.matches.size() == 3);
    assert(result.matches[0].candidate.matchedId == "A");
    assert(result.matches[0].candidate.score == 0.90);
    // Equal scores keep input order.
    assert(result.matches[1].candidate.matchedId == "B");
    assert(result.matches[2].candidate.matchedId == "C");
    for (const auto& m : result.matches) assert(m.candidate.score >= 0.5);

    // Re-merging the output is a no-op.
    std::vector<domain::MatchCandidate> again;
    for (const auto& m : result.matches) again.push_back(m.candidate);
    auto second = engine.merge(again, 0.5);
    assert(second.matches.size() == result.matches.size());
    for (size_t i = 0; i < second.matches.size(); ++i) {
        assert(second.matches[i].candidate.matchedId == result.matches[i].candidate.matchedId);
    }
    std::cout << "[PASS] Ordering, uniqueness and idempotence" << std::endl;
}

int main() {
    std::cout << "[Test] Starting MergeEngine Test..." << std::endl;
    TestConfidenceBands();
    TestNormalMatch();
    TestNearDuplicateDropped();
    TestFallbackAndEmpty();
    TestMergeProperties();
    std::cout << "[Test] MergeEngine Test Completed Successfully." << std::endl;
    return 0;
}
