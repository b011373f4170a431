#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <tuple>

struct UpdateInfo {
    bool available = false;
    std::string current_version;
    std::string latest_version;
    std::string download_url;     // asset for this platform, or the release page
    std::string asset_name;
    std::string release_notes;
    std::string error;            // set when the check itself failed
};

/// Asks GitHub whether a newer release exists. Downloading is someone else's job.
class UpdateChecker {
public:
    explicit UpdateChecker(const std::string& repo = "waypoint-app/waypoint");

    /// Never throws. Cached for kCacheDuration unless use_cache is false.
    UpdateInfo check_for_update(bool use_cache = true);

    /// Compiled-in version
    static std::string current_version();

    /// "vX.Y.Z" or "X.Y.Z"; (0,0,0) if unparseable.
    static std::tuple<int, int, int> parse_version(const std::string& ver);
    static bool is_newer(const std::string& candidate, const std::string& current);

    static std::string detect_arch_tag();

    static constexpr std::chrono::minutes kCacheDuration{60};

private:
    std::string repo_;
    std::mutex mutex_;
    UpdateInfo cache_;
    std::chrono::steady_clock::time_point cache_time_{};
    bool has_cache_ = false;

    UpdateInfo fetch() const;
};
