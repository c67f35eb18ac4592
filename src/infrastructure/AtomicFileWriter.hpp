/**
 * @file AtomicFileWriter.hpp
 * @brief Synchronous write-then-replace file output.
 */

#pragma once
#include <string>

namespace controlmapper::infrastructure {

/**
 * @class AtomicFileWriter
 * @brief Writes a whole file through a temporary sibling and a rename.
 *
 * Readers see either the previous content or the complete new content. A
 * failed write leaves the previous file untouched and removes the temporary.
 */
class AtomicFileWriter {
public:
    /**
     * @brief Replaces @p filename with @p content.
     * @throws std::runtime_error if the directory, temp file or rename fails.
     */
    static void Write(const std::string& filename, const std::string& content);
};

} // namespace controlmapper::infrastructure
