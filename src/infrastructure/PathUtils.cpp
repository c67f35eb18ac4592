#include "infrastructure/PathUtils.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>

namespace controlmapper::infrastructure {

namespace fs = std::filesystem;

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

std::string PathUtils::FileStem(const std::string& path) {
    return fs::path(path).stem().string();
}

std::string PathUtils::TimestampedName(const std::string& filename) {
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = ToLocalTime(tt);
    char dateBuf[32];
    std::strftime(dateBuf, sizeof(dateBuf), "%Y%m%d_%H%M%S_", &tm);
    return std::string(dateBuf) + filename;
}

std::string PathUtils::IsoTimestamp() {
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = ToLocalTime(tt);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

} // namespace controlmapper::infrastructure
