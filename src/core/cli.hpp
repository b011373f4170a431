#pragma once

#include <string>
#include <vector>

/// Flags accepted by `waypoint serve` (and by `waypoint` with no subcommand).
struct ServeOptions {
    int port = -1;              // -1 = from config
    std::string on_conflict;    // empty = from config
    bool verbose = false;
    bool no_browser = false;

    /// Re-serialized for the relaunched process.
    std::vector<std::string> to_args() const;
};

class CLI {
public:
    /// Returned when the caller should start serving.
    static constexpr int kServe = -1;

    /// Parse argv and dispatch to subcommand.
    /// Returns an exit code, or kServe with `serve` filled in.
    static int run(int argc, char* argv[], ServeOptions* serve = nullptr);

    static int parse_serve_options(int argc, char* argv[], int first, ServeOptions& out);

    /// Install `artifact` over `target` while holding the instance lock.
    /// Refuses when a live instance owns the lock in `data_dir`.
    static int apply_local(const std::string& data_dir, const std::string& artifact,
                           const std::string& target);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_status();
    static int cmd_update(int argc, char* argv[]);

    static int update_check();
    static int update_apply(const std::string& artifact);

    /// Base URL of the running instance according to config.
    static std::string control_host();
    static int control_port();
};
