#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include "MockEmbeddingService.hpp"
#include "application/EmbeddingAlignmentManager.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/VectorStore.hpp"

using namespace controlmapper;
namespace fs = std::filesystem;

static std::vector<std::string> Texts(size_t n) {
    std::vector<std::string> texts;
    for (size_t i = 0; i < n; ++i) texts.push_back("control sentence number " + std::to_string(i));
    return texts;
}

static std::string ReadAll(const fs::path& p) {
    std::ifstream f(p);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

int main() {
    std::cout << "[Test] Starting EmbeddingAlignment Test..." << std::endl;

    const fs::path root = fs::temp_directory_path() / "controlmapper_alignment_test";
    fs::remove_all(root);
    fs::create_directories(root);
    const infrastructure::VectorStore store((root / "embeddings" / "controls.json").string());

    auto embedder = std::make_shared<MockEmbeddingService>();
    application::EmbeddingAlignmentManager manager(embedder, 2);

    // Missing store: generated in batches of two.
    auto five = manager.ensureAligned(Texts(5), store);
    assert(five.size() == 5);
    assert(embedder->calls == 3);
    assert(store.exists());
    assert(store.load()->size() == 5);
    std::cout << "[PASS] Generated missing store" << std::endl;

    // Matching row count: trusted without embedding.
    auto reloaded = manager.ensureAligned(Texts(5), store);
    assert(reloaded.size() == 5);
    assert(embedder->calls == 3);
    assert(reloaded[4] == five[4]);
    std::cout << "[PASS] Aligned store reused" << std::endl;

    // 5 stored rows, 6 records: full regeneration.
    auto six = manager.ensureAligned(Texts(6), store);
    assert(six.size() == 6);
    assert(embedder->calls == 6);
    assert(store.load()->size() == 6);
    std::cout << "[PASS] Misaligned store regenerated" << std::endl;

    // Backend failure leaves the previous store untouched.
    const std::string before = ReadAll(store.path());
    embedder->failNextCall = true;
    bool threw = false;
    try {
        manager.ensureAligned(Texts(7), store);
    } catch (const domain::EmbeddingGenerationFailed&) {
        threw = true;
    }
    assert(threw);
    assert(ReadAll(store.path()) == before);

    embedder->dropLastRow = true;
    threw = false;
    try {
        manager.ensureAligned(Texts(7), store);
    } catch (const domain::EmbeddingGenerationFailed&) {
        threw = true;
    }
    assert(threw);
    assert(store.load()->size() == 6);
    embedder->dropLastRow = false;
    std::cout << "[PASS] Failed regeneration keeps old store" << std::endl;

    // Unreadable store is treated as missing.
    {
        std::ofstream corrupt(store.path(), std::ios::trunc);
        corrupt << "{ not json";
    }
    assert(!store.load().has_value());
    assert(manager.ensureAligned(Texts(6), store).size() == 6);
    assert(store.load()->size() == 6);
    std::cout << "[PASS] Corrupt store regenerated" << std::endl;

    fs::remove_all(root);
    std::cout << "[Test] EmbeddingAlignment Test Completed Successfully." << std::endl;
    return 0;
}
