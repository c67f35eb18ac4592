#pragma once
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include "domain/EmbeddingService.hpp"

// Deterministic embedder for tests: fixed vectors for known texts, a letter
// histogram for everything else.
class MockEmbeddingService : public controlmapper::domain::EmbeddingService {
public:
    explicit MockEmbeddingService(size_t dimension = 8) : m_dimension(dimension) {}

    controlmapper::domain::EmbeddingMatrix embed(const std::vector<std::string>& texts) override {
        ++calls;
        if (failNextCall) {
            failNextCall = false;
            throw std::runtime_error("mock backend unavailable");
        }
        controlmapper::domain::EmbeddingMatrix out;
        for (const auto& text : texts) {
            auto it = fixed.find(text);
            if (it != fixed.end()) {
                out.push_back(it->second);
                continue;
            }
            controlmapper::domain::EmbeddingVector v(m_dimension, 0.0f);
            for (unsigned char c : text) v[c % m_dimension] += 1.0f;
            controlmapper::domain::NormalizeL2(v);
            out.push_back(v);
        }
        if (dropLastRow && !out.empty()) out.pop_back();
        return out;
    }

    std::string getModelName() const override { return "mock-embed"; }

    std::map<std::string, controlmapper::domain::EmbeddingVector> fixed;
    int calls = 0;
    bool failNextCall = false;
    bool dropLastRow = false;

private:
    size_t m_dimension;
};
