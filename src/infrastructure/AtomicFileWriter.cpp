/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace controlmapper::infrastructure {

namespace fs = std::filesystem;

void AtomicFileWriter::Write(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;

    // Unique temp path: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
        fs::create_directories(finalPath.parent_path());
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to open temp file: " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw std::runtime_error("Write failed during output: " + tempPath.string());
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        std::cerr << "[AtomicFileWriter] Rename failed: " << ec.message() << std::endl;
        throw std::runtime_error("Rename failed for " + finalPath.string() + ": " + ec.message());
    }
}

} // namespace controlmapper::infrastructure
