#include "core/update_checker.hpp"
#include "core/logger.hpp"

#ifndef WAYPOINT_VERSION
#define WAYPOINT_VERSION "0.0.0"
#endif

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <sys/utsname.h>

#include <regex>

using json = nlohmann::json;

UpdateChecker::UpdateChecker(const std::string& repo) : repo_(repo) {}

std::string UpdateChecker::current_version() {
    return WAYPOINT_VERSION;
}

std::tuple<int, int, int> UpdateChecker::parse_version(const std::string& ver) {
    std::regex re(R"(v?(\d+)\.(\d+)\.(\d+))");
    std::smatch match;
    if (std::regex_search(ver, match, re) && match.size() >= 4) {
        try {
            return {std::stoi(match[1].str()),
                    std::stoi(match[2].str()),
                    std::stoi(match[3].str())};
        } catch (const std::exception&) {
            // out of range, treated as unparseable
        }
    }
    return {0, 0, 0};
}

bool UpdateChecker::is_newer(const std::string& candidate, const std::string& current) {
    return parse_version(candidate) > parse_version(current);
}

std::string UpdateChecker::detect_arch_tag() {
    struct utsname uts;
    if (uname(&uts) == 0) {
        std::string machine(uts.machine);
        if (machine == "x86_64" || machine == "amd64") return "x86_64";
        if (machine == "aarch64" || machine == "arm64") return "aarch64";
        return machine;
    }
    return "x86_64";
}

UpdateInfo UpdateChecker::check_for_update(bool use_cache) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (use_cache && has_cache_ &&
        std::chrono::steady_clock::now() - cache_time_ < kCacheDuration) {
        return cache_;
    }

    UpdateInfo info = fetch();
    // Transient network errors are not cached so the next poll retries
    if (info.error.empty()) {
        cache_ = info;
        cache_time_ = std::chrono::steady_clock::now();
        has_cache_ = true;
    }
    return info;
}

UpdateInfo UpdateChecker::fetch() const {
    UpdateInfo info;
    info.current_version = current_version();

    try {
        httplib::SSLClient cli("api.github.com", 443);
        cli.set_connection_timeout(10, 0);
        cli.set_read_timeout(10, 0);

        httplib::Headers headers = {
            {"User-Agent", "waypoint/" + current_version()},
            {"Accept", "application/vnd.github.v3+json"},
        };

        std::string path = "/repos/" + repo_ + "/releases/latest";
        auto res = cli.Get(path.c_str(), headers);

        if (!res) {
            info.error = "Cannot reach GitHub: " + httplib::to_string(res.error());
            return info;
        }
        if (res->status == 404) {
            // No releases yet is a valid answer
            return info;
        }
        if (res->status != 200) {
            info.error = "GitHub API returned status " + std::to_string(res->status);
            return info;
        }

        auto j = json::parse(res->body);
        info.latest_version = j.value("tag_name", "");
        if (j.contains("body") && j["body"].is_string()) {
            info.release_notes = j["body"].get<std::string>();
        }
        info.available = is_newer(info.latest_version, info.current_version);
        if (!info.available) return info;

        std::string arch = detect_arch_tag();
        if (j.contains("assets") && j["assets"].is_array()) {
            for (const auto& asset : j["assets"]) {
                std::string name = asset.value("name", "");
                if (name.find("linux") == std::string::npos) continue;
                if (name.find(arch) == std::string::npos) continue;
                if (name.find(".sha256") != std::string::npos) continue;

                info.asset_name = name;
                info.download_url = asset.value("browser_download_url", "");
                break;
            }
        }
        if (info.download_url.empty()) {
            info.asset_name = "Release Page";
            info.download_url = j.value("html_url", "");
        }
    } catch (const std::exception& e) {
        LOG_WARN("Update check failed: {}", e.what());
        info.available = false;
        info.error = e.what();
    }

    return info;
}
