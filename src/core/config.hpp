#pragma once

#include <yaml-cpp/yaml.h>

#include <string>

/// Typed view over the settings the lifecycle core reads.
struct AppSettings {
    // Server
    std::string server_host = "127.0.0.1";
    int server_port = 5000;
    bool open_browser = true;

    // Lifecycle
    std::string on_conflict = "terminate";  // "terminate" or "abort"
    int graceful_timeout_ms = 5000;
    int force_timeout_ms = 2000;

    // Update
    bool update_check_enabled = true;
    std::string update_repository = "waypoint-app/waypoint";

    // Logging
    std::string log_level = "info";
};

enum class ConfigLoadStatus {
    Loaded,
    Absent,   // no file yet, defaults in effect
    Corrupt,  // unparseable, reported, defaults in effect
};

/// Section-keyed YAML document stored as <data dir>/config.yaml.
///
/// Writes are read-merge-write: save() re-reads the file and merges the
/// in-memory document on top, so keys this instance never loaded are kept.
/// Updating one section never drops keys from another.
class Config {
public:
    explicit Config(std::string path);
    ~Config();

    ConfigLoadStatus load();
    bool save();

    /// Dotted lookup, e.g. "feedback.github_token". Undefined node if missing.
    YAML::Node get(const std::string& key) const;
    std::string get_string(const std::string& key, const std::string& fallback = "") const;
    int get_int(const std::string& key, int fallback) const;
    bool get_bool(const std::string& key, bool fallback) const;

    /// Dotted assignment; creates intermediate sections.
    bool set(const std::string& key, const YAML::Node& value, bool persist = true);
    bool set(const std::string& key, const std::string& value, bool persist = true);

    /// Merge `values` into `section`, leaving other keys of the section intact.
    bool update_section(const std::string& section, const YAML::Node& values, bool persist = true);

    YAML::Node section(const std::string& name) const;

    std::string export_yaml() const;
    AppSettings settings() const;

    const std::string& path() const { return path_; }
    ConfigLoadStatus last_load_status() const { return last_status_; }

    static std::string path_in(const std::string& data_dir);
    static YAML::Node defaults();

    /// Deep merge, overlay wins. Neither argument is modified.
    static YAML::Node merge(const YAML::Node& base, const YAML::Node& overlay);

private:
    std::string path_;
    YAML::Node root_;
    ConfigLoadStatus last_status_ = ConfigLoadStatus::Absent;

    bool write_atomically(const YAML::Node& doc);
};
