#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/data_dir.hpp"
#include "core/update_checker.hpp"
#include "lifecycle/instance_lock.hpp"
#include "lifecycle/process_probe.hpp"
#include "lifecycle/update_applier.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <cstring>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::vector<std::string> ServeOptions::to_args() const {
    std::vector<std::string> args = {"serve"};
    if (port > 0) {
        args.push_back("--port");
        args.push_back(std::to_string(port));
    }
    if (!on_conflict.empty()) {
        args.push_back("--on-conflict");
        args.push_back(on_conflict);
    }
    if (verbose) args.push_back("--verbose");
    if (no_browser) args.push_back("--no-browser");
    return args;
}

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[], ServeOptions* serve) {
    ServeOptions scratch;
    ServeOptions& opts = serve ? *serve : scratch;

    if (argc < 2) return kServe;

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "status") == 0) {
        return cmd_status();
    }
    if (std::strcmp(cmd, "update") == 0) {
        return cmd_update(argc, argv);
    }
    if (std::strcmp(cmd, "serve") == 0) {
        return parse_serve_options(argc, argv, 2, opts);
    }
    if (cmd[0] == '-') {
        // Bare flags imply serve
        return parse_serve_options(argc, argv, 1, opts);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'waypoint help' for usage.\n";
    return 1;
}

int CLI::parse_serve_options(int argc, char* argv[], int first, ServeOptions& out) {
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--port" && i + 1 < argc) {
            try {
                out.port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                out.port = 0;
            }
            if (out.port <= 0 || out.port > 65535) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--on-conflict" && i + 1 < argc) {
            out.on_conflict = argv[++i];
            if (out.on_conflict != "terminate" && out.on_conflict != "abort") {
                std::cerr << "Invalid --on-conflict value: " << out.on_conflict
                          << " (expected terminate or abort)\n";
                return 1;
            }
        } else if (arg == "--verbose") {
            out.verbose = true;
        } else if (arg == "--no-browser") {
            out.no_browser = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }
    return kServe;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "waypoint - local web UI for GitHub/Jira sync\n"
        "\n"
        "Usage:\n"
        "  waypoint                          Start (same as 'serve')\n"
        "  waypoint serve [options]          Start the local server\n"
        "      --port <n>                    Listen port (default from config, 5000)\n"
        "      --on-conflict terminate|abort What to do if another instance runs\n"
        "      --no-browser                  Do not open the browser\n"
        "      --verbose                     Debug logging\n"
        "  waypoint status                   Show running instance and lock state\n"
        "  waypoint update check             Check GitHub for a newer release\n"
        "  waypoint update apply <file>      Install a downloaded executable\n"
        "  waypoint version                  Show version\n"
        "  waypoint help                     Show this help\n"
        "\n"
        "Data directory: $WAYPOINT_DATA_DIR, else ~/.config/waypoint\n"
        "(WAYPOINT_DEV=1 keeps data inside the source tree).\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "waypoint " << UpdateChecker::current_version() << "\n";
    return 0;
}

// ── helpers ─────────────────────────────────────────────────

std::string CLI::control_host() {
    try {
        Config config(Config::path_in(DataDirectory::resolve()));
        config.load();
        return config.settings().server_host;
    } catch (const std::exception&) {
        return AppSettings{}.server_host;
    }
}

int CLI::control_port() {
    try {
        Config config(Config::path_in(DataDirectory::resolve()));
        config.load();
        return config.settings().server_port;
    } catch (const std::exception&) {
        return AppSettings{}.server_port;
    }
}

// ── status ──────────────────────────────────────────────────

int CLI::cmd_status() {
    std::string data_dir;
    try {
        data_dir = DataDirectory::resolve();
    } catch (const DataDirectoryError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    std::cout << "Data:     " << data_dir << "\n";

    ProcessProbe probe;
    InstanceLock lock(data_dir, probe);
    auto rec = lock.read();
    if (!rec) {
        std::cout << "Lock:     none\n";
    } else {
        bool live = probe.is_live_instance(rec->pid, lock.identity()) ||
                    (!rec->executable.empty() && probe.is_live_instance(rec->pid, rec->executable));
        std::cout << "Lock:     pid " << rec->pid << (live ? " (running)" : " (stale)") << "\n";
        if (!rec->executable.empty()) {
            std::cout << "Binary:   " << rec->executable << "\n";
        }
    }

    httplib::Client cli(control_host(), control_port());
    cli.set_connection_timeout(2, 0);
    cli.set_read_timeout(2, 0);
    auto res = cli.Get("/api/status");
    if (!res || res->status != 200) {
        std::cout << "Server:   not responding\n";
        return 0;
    }
    try {
        auto j = json::parse(res->body);
        std::cout << "Server:   " << j.value("state", "?") << " (v" << j.value("version", "?") << ")\n";
        std::string err = j.value("last_error", "");
        if (!err.empty()) {
            std::cout << "Error:    " << err << "\n";
        }
    } catch (const json::exception&) {
        std::cout << "Server:   unexpected response\n";
    }
    return 0;
}

// ── update ──────────────────────────────────────────────────

int CLI::update_check() {
    UpdateChecker checker;
    UpdateInfo info = checker.check_for_update(false);
    if (!info.error.empty()) {
        std::cerr << "Update check failed: " << info.error << "\n";
        return 1;
    }
    std::cout << "waypoint: " << info.current_version;
    if (info.available) {
        std::cout << " -> " << info.latest_version << " (update available)\n";
        std::cout << "Download: " << info.download_url << "\n";
    } else {
        std::cout << " (up to date)\n";
    }
    return 0;
}

int CLI::update_apply(const std::string& artifact_arg) {
    std::error_code ec;
    std::string artifact = fs::absolute(artifact_arg, ec).string();
    if (ec || !fs::is_regular_file(artifact)) {
        std::cerr << "Not a file: " << artifact_arg << "\n";
        return 1;
    }

    // Prefer the running instance so it can restart itself
    httplib::Client cli(control_host(), control_port());
    cli.set_connection_timeout(2, 0);
    cli.set_read_timeout(10, 0);
    json body = {{"artifact", artifact}};
    auto res = cli.Post("/api/apply-update", body.dump(), "application/json");
    if (res) {
        try {
            auto j = json::parse(res->body);
            if (res->status == 202) {
                std::cout << j.value("message", "Update accepted") << "\n";
                return 0;
            }
            std::cerr << "Update rejected: " << j.value("error", "unknown error") << "\n";
        } catch (const json::exception&) {
            std::cerr << "Update rejected (HTTP " << res->status << ")\n";
        }
        return 1;
    }

    std::string target = ProcessProbe::self_executable();
    if (target.empty()) {
        std::cerr << "Cannot determine path of current binary\n";
        return 1;
    }
    std::string data_dir;
    try {
        data_dir = DataDirectory::resolve();
    } catch (const DataDirectoryError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return apply_local(data_dir, artifact, target);
}

int CLI::apply_local(const std::string& data_dir, const std::string& artifact,
                     const std::string& target) {
    // An instance on another port is still live; its lock keeps us out
    ProcessProbe probe;
    InstanceLock lock(data_dir, probe);
    AcquireResult acquired = lock.try_acquire();
    if (acquired.status == AcquireStatus::Conflict) {
        std::cerr << "waypoint is running (pid " << acquired.owner.pid
                  << ") but its control server did not answer; stop it and retry\n";
        return 1;
    }
    if (!acquired.acquired()) {
        std::cerr << "Cannot take instance lock: " << acquired.error << "\n";
        return 1;
    }
    ScopedInstanceLock held(lock);

    UpdateApplier applier;
    ApplyResult result = applier.apply(artifact, target);
    std::cout << result.message << "\n";
    return result.committed() ? 0 : 1;
}

int CLI::cmd_update(int argc, char* argv[]) {
    std::string sub = argc >= 3 ? argv[2] : "check";

    if (sub == "check") {
        return update_check();
    }
    if (sub == "apply") {
        if (argc < 4) {
            std::cerr << "Usage: waypoint update apply <file>\n";
            return 1;
        }
        return update_apply(argv[3]);
    }

    std::cerr << "Unknown update command: " << sub << "\n";
    std::cerr << "Usage: waypoint update [check|apply <file>]\n";
    return 1;
}
