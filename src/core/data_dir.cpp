#include "core/data_dir.hpp"

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <system_error>

#ifndef WAYPOINT_SOURCE_DIR
#define WAYPOINT_SOURCE_DIR "."
#endif

namespace fs = std::filesystem;

static bool env_flag_set(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    return std::strcmp(v, "0") != 0 && std::strcmp(v, "false") != 0;
}

LaunchMode DataDirectory::detect_launch_mode() {
    return env_flag_set("WAYPOINT_DEV") ? LaunchMode::Development : LaunchMode::Packaged;
}

std::string DataDirectory::packaged_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg && xdg[0] == '/') {
        return std::string(xdg) + "/" + kAppDirName;
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) return "";
    return std::string(home) + "/.config/" + kAppDirName;
}

std::string DataDirectory::development_dir() {
    return (fs::path(WAYPOINT_SOURCE_DIR) / ".waypoint-data").lexically_normal().string();
}

std::string DataDirectory::path_for(LaunchMode mode) {
    const char* override_dir = std::getenv("WAYPOINT_DATA_DIR");
    if (override_dir && *override_dir) {
        return override_dir;
    }
    return mode == LaunchMode::Development ? development_dir() : packaged_dir();
}

void DataDirectory::ensure_exists(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    // Another process may have created it between our check and create
    if (ec && !fs::is_directory(dir)) {
        throw DataDirectoryError("Cannot create data directory " + dir + ": " + ec.message());
    }
    if (!fs::is_directory(dir)) {
        throw DataDirectoryError("Data directory path is not a directory: " + dir);
    }
}

std::string DataDirectory::compute() {
    std::string dir = path_for(detect_launch_mode());
    if (dir.empty()) {
        throw DataDirectoryError("Cannot determine data directory (HOME is not set)");
    }
    std::error_code ec;
    fs::path abs = fs::absolute(dir, ec);
    if (!ec) dir = abs.lexically_normal().string();
    ensure_exists(dir);
    return dir;
}

const std::string& DataDirectory::resolve() {
    static std::once_flag once;
    static std::string resolved;
    // call_once re-arms if compute() throws, so a later call can retry
    std::call_once(once, [] { resolved = compute(); });
    return resolved;
}
