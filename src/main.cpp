#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/crash_reporter.hpp"
#include "core/data_dir.hpp"
#include "core/logger.hpp"
#include "core/update_checker.hpp"
#include "lifecycle/orchestrator.hpp"
#include "lifecycle/process_launcher.hpp"
#include "server/control_server.hpp"

#include <chrono>
#include <filesystem>
#include <signal.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

static Orchestrator* g_orchestrator = nullptr;

static void signal_handler(int /*sig*/) {
    if (g_orchestrator) {
        g_orchestrator->request_stop();
    }
}

static void open_browser_when_serving(const Orchestrator& orch, ProcessLauncher& launcher,
                                      const std::string& url) {
    for (int i = 0; i < 150; ++i) {
        LifecycleState st = orch.state();
        if (st == LifecycleState::Serving) break;
        if (st == LifecycleState::Terminated) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (orch.state() != LifecycleState::Serving) return;

    for (const char* opener : {"/usr/bin/xdg-open", "/usr/local/bin/xdg-open"}) {
        if (fs::exists(opener)) {
            LaunchResult r = launcher.spawn_detached(opener, {url});
            if (!r.ok()) LOG_WARN("Cannot open browser: {}", r.error);
            return;
        }
    }
    LOG_INFO("Open {} in your browser", url);
}

static int run_app(ServeOptions opts) {
    logging::initialize_early();

    std::string data_dir;
    try {
        data_dir = DataDirectory::resolve();
    } catch (const DataDirectoryError& e) {
        CrashReporter::report("Resolving data directory", e);
        return Orchestrator::kExitError;
    }

    CrashReporter::configure(data_dir);
    CrashReporter::install_fatal_signal_handlers();

    Config config(Config::path_in(data_dir));
    config.load();
    AppSettings settings = config.settings();

    if (opts.port > 0) settings.server_port = opts.port;
    if (!opts.on_conflict.empty()) settings.on_conflict = opts.on_conflict;

    logging::LogConfig log_cfg;
    log_cfg.level = opts.verbose ? logging::LogLevel::Debug : logging::string_to_level(settings.log_level);
    log_cfg.file_path = data_dir + "/" + DataDirectory::kLogsDirName + "/waypoint.log";
    // A packaged launch may have no terminal attached
    log_cfg.console_output = isatty(STDERR_FILENO) != 0;
    logging::initialize(log_cfg);

    LOG_INFO("waypoint {} starting (pid {}, data {})", UpdateChecker::current_version(), getpid(), data_dir);

    TerminationPolicy policy;
    policy.graceful_timeout = std::chrono::milliseconds(settings.graceful_timeout_ms);
    policy.force_timeout = std::chrono::milliseconds(settings.force_timeout_ms);

    ProcessProbe probe(policy);
    UpdateApplier applier;
    ProcessLauncher launcher;

    OrchestratorOptions orch_opts;
    orch_opts.data_dir = data_dir;
    orch_opts.conflict_policy = settings.on_conflict == "abort" ? ConflictPolicy::Abort
                                                                 : ConflictPolicy::TerminatePrevious;
    ServeOptions relaunch_opts = opts;
    relaunch_opts.no_browser = true;
    orch_opts.relaunch_args = relaunch_opts.to_args();

    Orchestrator orchestrator(orch_opts, probe, applier, launcher);
    UpdateChecker checker(settings.update_repository);
    ControlServer server(orchestrator, settings.server_host, settings.server_port,
                         settings.update_check_enabled ? &checker : nullptr);

    g_orchestrator = &orchestrator;

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);

    std::thread browser;
    if (settings.open_browser && !opts.no_browser) {
        std::string url = "http://" + settings.server_host + ":" + std::to_string(settings.server_port);
        browser = std::thread(open_browser_when_serving, std::cref(orchestrator), std::ref(launcher), url);
    }

    int code = orchestrator.run(server);

    if (browser.joinable()) browser.join();
    g_orchestrator = nullptr;

    LOG_INFO("waypoint exiting with code {}", code);
    logging::shutdown();
    return code;
}

int main(int argc, char* argv[]) {
    ServeOptions opts;
    int cli_result = CLI::run(argc, argv, &opts);

    if (cli_result != CLI::kServe) {
        // handled by CLI (help, version, status, update, or error)
        return cli_result;
    }

    try {
        return run_app(opts);
    } catch (const std::exception& e) {
        CrashReporter::report("Unhandled exception in main", e);
        return Orchestrator::kExitError;
    }
}
