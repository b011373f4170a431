#include "lifecycle/orchestrator.hpp"
#include "core/crash_reporter.hpp"
#include "core/logger.hpp"
#include "core/update_checker.hpp"

#include <unistd.h>

Orchestrator::Orchestrator(OrchestratorOptions options, ProcessProbe& probe,
                           UpdateApplier& applier, ProcessLauncher& launcher)
    : options_(std::move(options)),
      probe_(probe),
      applier_(applier),
      launcher_(launcher),
      lock_(options_.data_dir, probe_) {
    if (options_.executable.empty()) {
        options_.executable = ProcessProbe::self_executable();
    }
}

Orchestrator::~Orchestrator() = default;

const char* Orchestrator::state_name(LifecycleState state) {
    switch (state) {
    case LifecycleState::Starting:
        return "starting";
    case LifecycleState::LockConflict:
        return "lock_conflict";
    case LifecycleState::Locked:
        return "locked";
    case LifecycleState::Serving:
        return "serving";
    case LifecycleState::UpdateRequested:
        return "update_requested";
    case LifecycleState::ShuttingDown:
        return "shutting_down";
    case LifecycleState::Terminated:
        return "terminated";
    }
    return "unknown";
}

void Orchestrator::set_state(LifecycleState next) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == next) return;
        LOG_DEBUG("Lifecycle: {} -> {}", state_name(state_), state_name(next));
        state_ = next;
    }
    cv_.notify_all();
}

LifecycleState Orchestrator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

LifecycleStatus Orchestrator::status() const {
    LifecycleStatus s;
    s.pid = ::getpid();
    s.version = UpdateChecker::current_version();
    s.data_dir = options_.data_dir;
    s.executable = options_.executable;

    std::lock_guard<std::mutex> lock(mutex_);
    s.state = state_;
    s.last_error = last_error_;
    s.relaunch_pending = relaunch_;
    return s;
}

// ── Startup ─────────────────────────────────────────────────

bool Orchestrator::resolve_conflict(const LockRecord& owner, StartupResult& result) {
    if (options_.conflict_policy == ConflictPolicy::Abort) {
        result.message = "Another instance is already running (pid " +
                         std::to_string(owner.pid) + ")";
        return false;
    }

    LOG_INFO("Asking previous instance (pid {}) to exit", owner.pid);
    if (probe_.request_graceful_shutdown(owner.pid) == ShutdownOutcome::TimedOut) {
        LOG_WARN("Previous instance did not exit in time, forcing");
        TerminateResult forced = probe_.force_terminate(owner.pid);
        if (!forced.success) {
            result.message = "Cannot stop previous instance (pid " + std::to_string(owner.pid) +
                             "): " + forced.reason;
            CrashReporter::report("Process termination timeout", result.message);
            return false;
        }
    }
    result.terminated_previous = true;
    return true;
}

StartupResult Orchestrator::start() {
    StartupResult result;
    set_state(LifecycleState::Starting);

    try {
        AcquireResult acquired = lock_.try_acquire();

        if (acquired.status == AcquireStatus::Conflict) {
            set_state(LifecycleState::LockConflict);
            result.owner = acquired.owner;

            if (!resolve_conflict(acquired.owner, result)) {
                result.status = AcquireStatus::Conflict;
                set_state(LifecycleState::Terminated);
                return result;
            }

            // One retry only; a second conflict aborts startup
            acquired = lock_.try_acquire();
            if (acquired.status == AcquireStatus::Conflict) {
                result.status = AcquireStatus::Conflict;
                result.owner = acquired.owner;
                result.message = "Instance lock still held by pid " +
                                 std::to_string(acquired.owner.pid) + " after termination";
                set_state(LifecycleState::Terminated);
                return result;
            }
        }

        if (acquired.status == AcquireStatus::Error) {
            result.status = AcquireStatus::Error;
            result.message = acquired.error;
            set_state(LifecycleState::Terminated);
            return result;
        }

        result.status = AcquireStatus::Acquired;
        result.message = acquired.recovered_stale ? "Acquired lock (stale lock recovered)"
                                                  : "Acquired lock";
        set_state(LifecycleState::Locked);
        return result;
    } catch (const std::exception& e) {
        CrashReporter::report("Startup", e);
        result.status = AcquireStatus::Error;
        result.message = e.what();
        set_state(LifecycleState::Terminated);
        return result;
    }
}

// ── Requests ────────────────────────────────────────────────

bool Orchestrator::request_update(const std::string& artifact, std::string& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == LifecycleState::UpdateRequested) {
            error = "An update is already in progress";
            return false;
        }
        if (state_ != LifecycleState::Serving || restart_requested_) {
            error = std::string("Cannot update while ") + state_name(state_);
            return false;
        }
        if (artifact.empty()) {
            error = "No update artifact given";
            return false;
        }
        pending_artifact_ = artifact;
        cancel_flag_.store(false);
        LOG_INFO("Update requested with artifact {}", artifact);
        state_ = LifecycleState::UpdateRequested;
    }
    cv_.notify_all();
    return true;
}

void Orchestrator::cancel_update() {
    cancel_flag_.store(true);
}

bool Orchestrator::request_restart(std::string& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != LifecycleState::Serving) {
            error = std::string("Cannot restart while ") + state_name(state_);
            return false;
        }
        restart_requested_ = true;
    }
    cv_.notify_all();
    return true;
}

void Orchestrator::request_stop() noexcept {
    // Polled by serve_loop; notifying a condition variable is not signal-safe
    stop_flag_.store(true);
}

// ── Serving ─────────────────────────────────────────────────

void Orchestrator::handle_update(const std::string& artifact) {
    std::string failure;
    bool cancelled = false;
    try {
        ApplyResult applied = applier_.apply(artifact, options_.executable, &cancel_flag_);
        if (applied.committed()) {
            std::lock_guard<std::mutex> lock(mutex_);
            cancel_flag_.store(false);
            last_error_.clear();
            relaunch_ = true;
            return;
        }
        cancelled = applied.outcome == ApplyOutcome::Cancelled;
        failure = applied.message;
    } catch (const std::exception& e) {
        CrashReporter::report("Applying update", e);
        failure = std::string("Update failed: ") + e.what();
    }

    if (cancelled) {
        LOG_INFO("{}", failure);
    } else {
        CrashReporter::report("Update rolled back, still serving current version", failure);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_flag_.store(false);
        last_error_ = failure;
        state_ = LifecycleState::Serving;
    }
    cv_.notify_all();
}

void Orchestrator::serve_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_flag_.load()) {
        if (state_ == LifecycleState::UpdateRequested) {
            std::string artifact;
            artifact.swap(pending_artifact_);
            lock.unlock();
            handle_update(artifact);
            lock.lock();
            if (relaunch_) return;
            continue;
        }
        if (restart_requested_) {
            restart_requested_ = false;
            relaunch_ = true;
            return;
        }
        cv_.wait_for(lock, options_.poll_interval);
    }
}

void Orchestrator::shut_down(LifecycleServer& server, ScopedInstanceLock& scoped) {
    set_state(LifecycleState::ShuttingDown);
    try {
        server.stop();
    } catch (const std::exception& e) {
        CrashReporter::report("Stopping server", e);
    }
    scoped.release();
}

bool Orchestrator::relaunch() {
    LOG_INFO("Relaunching {}", options_.executable);
    LaunchResult launched = launcher_.spawn_detached(options_.executable, options_.relaunch_args);
    if (!launched.ok()) {
        CrashReporter::report("Relaunch after shutdown", launched.error);
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = launched.error;
        return false;
    }
    return true;
}

int Orchestrator::run(LifecycleServer& server) {
    StartupResult startup = start();
    if (!startup.ok()) {
        LOG_ERROR("Startup aborted: {}", startup.message);
        return startup.status == AcquireStatus::Conflict ? kExitConflict : kExitError;
    }
    LOG_INFO("{}", startup.message);

    ScopedInstanceLock scoped(lock_);

    bool started = false;
    try {
        started = server.start();
    } catch (const std::exception& e) {
        CrashReporter::report("Starting server", e);
    }
    if (!started) {
        CrashReporter::report("Starting server", "server failed to start");
        scoped.release();
        set_state(LifecycleState::Terminated);
        return kExitError;
    }

    int code = kExitOk;
    while (true) {
        set_state(LifecycleState::Serving);
        serve_loop();

        shut_down(server, scoped);

        bool do_relaunch = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            do_relaunch = relaunch_;
        }
        if (!do_relaunch || relaunch()) break;

        // Nobody replaced us; the code already in memory keeps serving
        if (!resume_serving(server, scoped)) {
            code = kExitError;
            break;
        }
    }

    set_state(LifecycleState::Terminated);
    return code;
}

bool Orchestrator::resume_serving(LifecycleServer& server, ScopedInstanceLock& scoped) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        relaunch_ = false;
        restart_requested_ = false;
    }

    AcquireResult acquired = lock_.try_acquire();
    if (!acquired.acquired()) {
        std::string reason = acquired.status == AcquireStatus::Conflict
                                 ? "lock taken by pid " + std::to_string(acquired.owner.pid)
                                 : acquired.error;
        CrashReporter::report("Resuming after failed relaunch", reason);
        return false;
    }
    scoped = ScopedInstanceLock(lock_);

    bool started = false;
    try {
        started = server.start();
    } catch (const std::exception& e) {
        CrashReporter::report("Restarting server", e);
    }
    if (!started) {
        CrashReporter::report("Resuming after failed relaunch", "server failed to start");
        scoped.release();
        return false;
    }
    LOG_WARN("Relaunch failed, still serving from pid {}", ::getpid());
    return true;
}
