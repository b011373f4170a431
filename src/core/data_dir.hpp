#pragma once

#include <stdexcept>
#include <string>

/// How the running process was launched. Decides where persistent state lives.
enum class LaunchMode {
    Packaged,
    Development,
};

class DataDirectoryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Resolves the one version-independent directory holding the lock file,
/// config.yaml, logs and diagnostics. The result never depends on where the
/// running binary sits: an old and a new binary in different folders share
/// the same directory.
class DataDirectory {
public:
    /// Resolve once per process and cache. Creates the directory if needed.
    /// Throws DataDirectoryError if it cannot be created.
    static const std::string& resolve();

    /// Uncached resolution (creates the directory). Used by resolve() and tests.
    static std::string compute();

    /// Pure path computation, no filesystem access.
    static std::string path_for(LaunchMode mode);

    static LaunchMode detect_launch_mode();

    static std::string packaged_dir();
    static std::string development_dir();

    /// Idempotent, safe when several processes race to create the same path.
    static void ensure_exists(const std::string& dir);

    // Fixed names inside the directory
    static constexpr const char* kAppDirName = "waypoint";
    static constexpr const char* kLockFileName = "waypoint.lock";
    static constexpr const char* kConfigFileName = "config.yaml";
    static constexpr const char* kDiagnosticsDirName = "diagnostics";
    static constexpr const char* kLogsDirName = "logs";
};
