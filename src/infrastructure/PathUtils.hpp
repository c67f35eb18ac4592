// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace controlmapper::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::string FileStem(const std::string& path);
    static std::string TimestampedName(const std::string& filename);
    static std::string IsoTimestamp();
};

} // namespace controlmapper::infrastructure
