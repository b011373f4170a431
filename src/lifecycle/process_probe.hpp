#pragma once

#include <chrono>
#include <string>
#include <sys/types.h>

/// Bounded waits used by the graceful-then-forced escalation.
struct TerminationPolicy {
    std::chrono::milliseconds graceful_timeout{5000};
    std::chrono::milliseconds force_timeout{2000};
    std::chrono::milliseconds poll_interval{100};
};

enum class ShutdownOutcome {
    Acknowledged,  // process disappeared within the timeout
    TimedOut,
};

struct TerminateResult {
    bool success = false;
    std::string reason;
};

/// Inspects and terminates other processes.
///
/// A pid on its own proves nothing: pids get recycled, so a process only
/// counts as a live instance when it exists AND runs our executable.
class ProcessProbe {
public:
    explicit ProcessProbe(TerminationPolicy policy = {});
    virtual ~ProcessProbe();

    /// True if `pid` exists, is not a zombie, and its executable matches
    /// `identity` (full path or file name).
    virtual bool is_live_instance(pid_t pid, const std::string& identity) const;

    /// SIGTERM, then wait up to the graceful timeout for the pid to go away.
    virtual ShutdownOutcome request_graceful_shutdown(pid_t pid) const;

    /// SIGKILL, then wait up to the force timeout. A single attempt.
    virtual TerminateResult force_terminate(pid_t pid) const;

    /// Exists in the process table and is not a zombie.
    static bool process_exists(pid_t pid);

    /// Executable path of `pid` from /proc, empty if unavailable.
    static std::string executable_of(pid_t pid);

    /// Short command name from /proc/<pid>/comm (truncated to 15 chars by the kernel).
    static std::string command_name_of(pid_t pid);

    /// Canonical path of the running binary.
    static std::string self_executable();

    /// Compare two executable paths, ignoring " (deleted)" and the update backup suffix.
    static bool same_executable(const std::string& actual, const std::string& identity);

    /// Match a /proc comm value against the file name of `identity`. The
    /// name must be equal, or equal to its 15-character truncation.
    static bool same_command_name(const std::string& comm, const std::string& identity);

    const TerminationPolicy& policy() const { return policy_; }

private:
    TerminationPolicy policy_;

    bool wait_for_exit(pid_t pid, std::chrono::milliseconds timeout) const;
};
