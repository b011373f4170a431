#include "core/config.hpp"
#include "core/crash_reporter.hpp"
#include "core/data_dir.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

static std::vector<std::string> split_key(const std::string& key) {
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

static YAML::Node lookup(const YAML::Node& node, const std::vector<std::string>& keys, size_t i) {
    if (i == keys.size()) return node;
    if (!node.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
    const YAML::Node child = node[keys[i]];
    if (!child) return YAML::Node(YAML::NodeType::Undefined);
    return lookup(child, keys, i + 1);
}

static void assign(YAML::Node node, const std::vector<std::string>& keys, size_t i,
                   const YAML::Node& value) {
    if (i + 1 == keys.size()) {
        node[keys[i]] = YAML::Clone(value);
        return;
    }
    if (!node[keys[i]] || !node[keys[i]].IsMap()) {
        node[keys[i]] = YAML::Node(YAML::NodeType::Map);
    }
    assign(node[keys[i]], keys, i + 1, value);
}

// ── Construction ────────────────────────────────────────────

Config::Config(std::string path) : path_(std::move(path)), root_(defaults()) {}

Config::~Config() = default;

std::string Config::path_in(const std::string& data_dir) {
    return data_dir + "/" + DataDirectory::kConfigFileName;
}

YAML::Node Config::defaults() {
    YAML::Node root(YAML::NodeType::Map);

    root["server"]["host"] = "127.0.0.1";
    root["server"]["port"] = 5000;
    root["server"]["open_browser"] = true;

    root["lifecycle"]["on_conflict"] = "terminate";
    root["lifecycle"]["graceful_timeout_ms"] = 5000;
    root["lifecycle"]["force_timeout_ms"] = 2000;

    root["update"]["check_enabled"] = true;
    root["update"]["repository"] = "waypoint-app/waypoint";

    root["logging"]["level"] = "info";

    root["feedback"] = YAML::Node(YAML::NodeType::Map);
    root["github"] = YAML::Node(YAML::NodeType::Map);
    root["jira"]["base_url"] = "";

    return root;
}

YAML::Node Config::merge(const YAML::Node& base, const YAML::Node& overlay) {
    if (!overlay.IsDefined() || overlay.IsNull()) {
        return YAML::Clone(base);
    }
    if (!base.IsMap() || !overlay.IsMap()) {
        return YAML::Clone(overlay);
    }

    YAML::Node result = YAML::Clone(base);
    for (const auto& kv : overlay) {
        const std::string key = kv.first.as<std::string>();
        const YAML::Node existing = base[key];
        if (existing && existing.IsMap() && kv.second.IsMap()) {
            result[key] = merge(existing, kv.second);
        } else {
            result[key] = YAML::Clone(kv.second);
        }
    }
    return result;
}

// ── Load / save ─────────────────────────────────────────────

ConfigLoadStatus Config::load() {
    if (path_.empty() || !fs::exists(path_)) {
        root_ = defaults();
        last_status_ = ConfigLoadStatus::Absent;
        return last_status_;
    }

    try {
        YAML::Node disk = YAML::LoadFile(path_);
        if (disk.IsDefined() && !disk.IsNull() && !disk.IsMap()) {
            throw YAML::Exception(YAML::Mark::null_mark(), "top level of config is not a mapping");
        }
        root_ = merge(defaults(), disk);
        last_status_ = ConfigLoadStatus::Loaded;
    } catch (const std::exception& e) {
        CrashReporter::report("Config file " + path_ + " is corrupt, using defaults", e);
        root_ = defaults();
        last_status_ = ConfigLoadStatus::Corrupt;
    }
    return last_status_;
}

bool Config::save() {
    if (path_.empty()) return false;

    YAML::Node on_disk(YAML::NodeType::Map);
    if (fs::exists(path_)) {
        try {
            YAML::Node disk = YAML::LoadFile(path_);
            if (disk.IsMap()) on_disk = disk;
        } catch (const std::exception& e) {
            // Keep the unreadable original next to the new file
            std::error_code ec;
            fs::copy_file(path_, path_ + ".corrupt", fs::copy_options::overwrite_existing, ec);
            LOG_WARN("Replacing unreadable config {} (copy kept as .corrupt): {}", path_, e.what());
        }
    }

    try {
        YAML::Node merged = merge(on_disk, root_);
        if (!write_atomically(merged)) return false;
        root_ = merged;
        return true;
    } catch (const std::exception& e) {
        CrashReporter::report("Saving config " + path_, e);
        return false;
    }
}

bool Config::write_atomically(const YAML::Node& doc) {
    fs::path target(path_);
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);

    YAML::Emitter out;
    out << doc;
    if (!out.good()) {
        LOG_ERROR("Cannot serialize config: {}", out.GetLastError());
        return false;
    }

    std::string tmp = path_ + ".tmp." + std::to_string(::getpid());
    {
        std::ofstream fout(tmp, std::ios::trunc);
        if (!fout.is_open()) {
            LOG_ERROR("Cannot open {} for writing", tmp);
            return false;
        }
        fout << out.c_str() << "\n";
        fout.flush();
        if (!fout) {
            fout.close();
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        LOG_ERROR("Cannot replace {}: {}", path_, ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

// ── Access ──────────────────────────────────────────────────

YAML::Node Config::get(const std::string& key) const {
    auto keys = split_key(key);
    if (keys.empty()) return YAML::Node(YAML::NodeType::Undefined);
    return lookup(root_, keys, 0);
}

std::string Config::get_string(const std::string& key, const std::string& fallback) const {
    try {
        YAML::Node n = get(key);
        if (!n || !n.IsScalar()) return fallback;
        return n.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

int Config::get_int(const std::string& key, int fallback) const {
    try {
        YAML::Node n = get(key);
        if (!n || !n.IsScalar()) return fallback;
        return n.as<int>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

bool Config::get_bool(const std::string& key, bool fallback) const {
    try {
        YAML::Node n = get(key);
        if (!n || !n.IsScalar()) return fallback;
        return n.as<bool>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

bool Config::set(const std::string& key, const YAML::Node& value, bool persist) {
    auto keys = split_key(key);
    if (keys.empty()) return false;
    assign(root_, keys, 0, value);
    return persist ? save() : true;
}

bool Config::set(const std::string& key, const std::string& value, bool persist) {
    return set(key, YAML::Node(value), persist);
}

bool Config::update_section(const std::string& section, const YAML::Node& values, bool persist) {
    if (section.empty() || !values.IsMap()) return false;
    YAML::Node current = root_[section];
    root_[section] = merge(current && current.IsMap() ? current : YAML::Node(YAML::NodeType::Map),
                           values);
    return persist ? save() : true;
}

YAML::Node Config::section(const std::string& name) const {
    const YAML::Node n = root_[name];
    if (!n || !n.IsMap()) return YAML::Node(YAML::NodeType::Map);
    return YAML::Clone(n);
}

std::string Config::export_yaml() const {
    YAML::Emitter out;
    out << root_;
    return out.c_str();
}

AppSettings Config::settings() const {
    AppSettings s;
    s.server_host = get_string("server.host", s.server_host);
    s.server_port = get_int("server.port", s.server_port);
    s.open_browser = get_bool("server.open_browser", s.open_browser);
    s.on_conflict = get_string("lifecycle.on_conflict", s.on_conflict);
    s.graceful_timeout_ms = get_int("lifecycle.graceful_timeout_ms", s.graceful_timeout_ms);
    s.force_timeout_ms = get_int("lifecycle.force_timeout_ms", s.force_timeout_ms);
    s.update_check_enabled = get_bool("update.check_enabled", s.update_check_enabled);
    s.update_repository = get_string("update.repository", s.update_repository);
    s.log_level = get_string("logging.level", s.log_level);
    return s;
}
