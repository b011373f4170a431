#pragma once

#include "lifecycle/instance_lock.hpp"
#include "lifecycle/process_launcher.hpp"
#include "lifecycle/process_probe.hpp"
#include "lifecycle/update_applier.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

enum class LifecycleState {
    Starting,
    LockConflict,
    Locked,
    Serving,
    UpdateRequested,
    ShuttingDown,
    Terminated,
};

enum class ConflictPolicy {
    TerminatePrevious,  // graceful, then forced, then retry acquisition once
    Abort,
};

/// The local HTTP server as seen by the orchestrator.
class LifecycleServer {
public:
    virtual ~LifecycleServer() = default;

    /// Start serving in the background. False if the server could not start.
    virtual bool start() = 0;
    virtual void stop() = 0;
};

struct OrchestratorOptions {
    std::string data_dir;
    ConflictPolicy conflict_policy = ConflictPolicy::TerminatePrevious;
    std::string executable;                 // update target and relaunch binary; empty = self
    std::vector<std::string> relaunch_args; // argv[1..] for the relaunched process
    std::chrono::milliseconds poll_interval{200};
};

struct StartupResult {
    AcquireStatus status = AcquireStatus::Error;
    LockRecord owner;  // previous holder when a conflict was seen
    bool terminated_previous = false;
    std::string message;

    bool ok() const { return status == AcquireStatus::Acquired; }
};

struct LifecycleStatus {
    LifecycleState state = LifecycleState::Starting;
    pid_t pid = 0;
    std::string version;
    std::string data_dir;
    std::string executable;
    std::string last_error;
    bool relaunch_pending = false;
};

/// Drives startup, update and shutdown.
///
/// Only the thread inside run() changes state after startup; HTTP handlers
/// and signal handlers just post requests. Slow work (applying an update,
/// stopping the server, relaunching) therefore never occupies a request
/// worker.
class Orchestrator {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitError = 1;
    static constexpr int kExitConflict = 2;

    Orchestrator(OrchestratorOptions options, ProcessProbe& probe, UpdateApplier& applier,
                 ProcessLauncher& launcher);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Starting → Locked, possibly through LockConflict.
    StartupResult start();

    /// Full lifecycle: start(), serve until stopped or updated, shut down,
    /// relaunch if needed. A failed relaunch re-takes the lock and serves
    /// again with last_error set. Returns the process exit code.
    int run(LifecycleServer& server);

    /// Serving → UpdateRequested. Rejected unless currently Serving.
    bool request_update(const std::string& artifact, std::string& error);

    /// Abandon a requested update if it has not reached the backup rename.
    void cancel_update();

    /// Serving → ShuttingDown with relaunch of the same executable.
    bool request_restart(std::string& error);

    /// Async-signal-safe stop request.
    void request_stop() noexcept;

    LifecycleState state() const;
    LifecycleStatus status() const;

    static const char* state_name(LifecycleState state);

private:
    OrchestratorOptions options_;
    ProcessProbe& probe_;
    UpdateApplier& applier_;
    ProcessLauncher& launcher_;
    InstanceLock lock_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    LifecycleState state_ = LifecycleState::Starting;
    std::string pending_artifact_;
    bool restart_requested_ = false;
    bool relaunch_ = false;
    std::string last_error_;

    std::atomic<bool> stop_flag_{false};
    std::atomic<bool> cancel_flag_{false};

    void set_state(LifecycleState next);
    bool resolve_conflict(const LockRecord& owner, StartupResult& result);
    void serve_loop();
    void handle_update(const std::string& artifact);
    void shut_down(LifecycleServer& server, ScopedInstanceLock& scoped);
    bool relaunch();
    bool resume_serving(LifecycleServer& server, ScopedInstanceLock& scoped);
};
