#include "lifecycle/process_probe.hpp"
#include "lifecycle/update_applier.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

static constexpr std::size_t kCommLength = 15;

static std::string strip_suffix(std::string s, const std::string& suffix) {
    if (s.size() >= suffix.size() &&
        s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0) {
        s.erase(s.size() - suffix.size());
    }
    return s;
}

static std::string normalize_exe(const std::string& path) {
    std::string p = strip_suffix(path, " (deleted)");
    p = strip_suffix(p, UpdateApplier::kBackupSuffix);
    return p;
}

static char process_state(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat.is_open()) return '\0';
    std::string line;
    std::getline(stat, line);
    // Format: pid (comm) state ...; comm may contain spaces and parens
    auto close = line.rfind(')');
    if (close == std::string::npos || close + 2 >= line.size()) return '\0';
    return line[close + 2];
}

ProcessProbe::ProcessProbe(TerminationPolicy policy) : policy_(policy) {}

ProcessProbe::~ProcessProbe() = default;

// ── Inspection ──────────────────────────────────────────────

bool ProcessProbe::process_exists(pid_t pid) {
    if (pid <= 0) return false;
    if (kill(pid, 0) != 0 && errno != EPERM) {
        return false;
    }
    char state = process_state(pid);
    // Zombies and dead tasks still answer kill(0) but are not running
    return state != 'Z' && state != 'X';
}

std::string ProcessProbe::executable_of(pid_t pid) {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/" + std::to_string(pid) + "/exe", ec);
    if (ec) return "";
    return exe.string();
}

std::string ProcessProbe::command_name_of(pid_t pid) {
    std::ifstream comm("/proc/" + std::to_string(pid) + "/comm");
    if (!comm.is_open()) return "";
    std::string name;
    std::getline(comm, name);
    return name;
}

std::string ProcessProbe::self_executable() {
    std::error_code ec;
    fs::path exe = fs::canonical("/proc/self/exe", ec);
    if (ec) return "";
    return exe.string();
}

bool ProcessProbe::same_executable(const std::string& actual, const std::string& identity) {
    if (actual.empty() || identity.empty()) return false;

    std::string a = normalize_exe(actual);
    std::string b = normalize_exe(identity);
    if (a == b) return true;

    return fs::path(a).filename() == fs::path(b).filename();
}

bool ProcessProbe::same_command_name(const std::string& comm, const std::string& identity) {
    if (comm.empty()) return false;
    std::string want = fs::path(normalize_exe(identity)).filename().string();
    if (want.empty()) return false;
    // The kernel truncates comm to 15 characters
    if (want.size() >= kCommLength) return comm == want.substr(0, kCommLength);
    return comm == want;
}

bool ProcessProbe::is_live_instance(pid_t pid, const std::string& identity) const {
    if (!process_exists(pid)) return false;

    std::string exe = executable_of(pid);
    if (!exe.empty()) {
        return same_executable(exe, identity);
    }

    // /proc/<pid>/exe is unreadable for other users' processes; fall back to comm
    return same_command_name(command_name_of(pid), identity);
}

// ── Termination ─────────────────────────────────────────────

bool ProcessProbe::wait_for_exit(pid_t pid, std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!process_exists(pid)) return true;
        std::this_thread::sleep_for(policy_.poll_interval);
    }
    return !process_exists(pid);
}

ShutdownOutcome ProcessProbe::request_graceful_shutdown(pid_t pid) const {
    if (!process_exists(pid)) return ShutdownOutcome::Acknowledged;

    if (kill(pid, SIGTERM) != 0) {
        if (errno == ESRCH) return ShutdownOutcome::Acknowledged;
        LOG_WARN("SIGTERM to pid {} failed: {}", pid, std::strerror(errno));
        return ShutdownOutcome::TimedOut;
    }

    LOG_INFO("Requested graceful shutdown of pid {}", pid);
    if (wait_for_exit(pid, policy_.graceful_timeout)) {
        return ShutdownOutcome::Acknowledged;
    }
    LOG_WARN("pid {} still running after {} ms", pid, policy_.graceful_timeout.count());
    return ShutdownOutcome::TimedOut;
}

TerminateResult ProcessProbe::force_terminate(pid_t pid) const {
    TerminateResult result;
    if (!process_exists(pid)) {
        result.success = true;
        return result;
    }

    if (kill(pid, SIGKILL) != 0) {
        if (errno == ESRCH) {
            result.success = true;
            return result;
        }
        result.reason = std::string("SIGKILL failed: ") + std::strerror(errno);
        return result;
    }

    if (!wait_for_exit(pid, policy_.force_timeout)) {
        result.reason = "process " + std::to_string(pid) + " survived SIGKILL";
        return result;
    }

    LOG_INFO("Force-terminated pid {}", pid);
    result.success = true;
    return result;
}
