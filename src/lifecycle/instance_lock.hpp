#pragma once

#include "lifecycle/process_probe.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>

/// Contents of <data dir>/waypoint.lock.
struct LockRecord {
    pid_t pid = 0;
    std::int64_t created = 0;  // unix seconds
    std::string executable;    // may be empty

    std::string serialize() const;

    /// Accepts "key=value" lines, or a bare pid on the first line.
    static std::optional<LockRecord> parse(const std::string& text);
};

enum class AcquireStatus {
    Acquired,
    Conflict,  // a live instance owns the lock; see AcquireResult::owner
    Error,     // filesystem failure, nothing acquired
};

struct AcquireResult {
    AcquireStatus status = AcquireStatus::Error;
    LockRecord owner;            // our record on success, the holder's on conflict
    bool recovered_stale = false;
    std::string error;

    bool acquired() const { return status == AcquireStatus::Acquired; }
};

/// Cooperative single-instance lock backed by a record file.
///
/// Exclusivity comes from the liveness of the recorded owner, not from the
/// file existing: a crashed owner leaves a stale record that the next
/// process replaces. The read-decide-write step is serialised between
/// processes by a short flock on a guard file, so two starters racing over
/// the same stale record cannot both win.
class InstanceLock {
public:
    InstanceLock(std::string data_dir, const ProcessProbe& probe);
    InstanceLock(std::string data_dir, const ProcessProbe& probe, std::string identity, pid_t self);

    AcquireResult try_acquire();

    /// Delete the record if we own it. Returns false if it belongs to
    /// someone else (left untouched) or could not be removed.
    bool release();

    std::optional<LockRecord> read() const;

    std::string lock_path() const;
    const std::string& identity() const { return identity_; }
    pid_t self_pid() const { return self_; }

    static constexpr int kGuardWaitMs = 3000;

private:
    std::string dir_;
    const ProcessProbe& probe_;
    std::string identity_;
    pid_t self_;

    bool owner_is_live(const LockRecord& record) const;
    enum class WriteStatus {
        Written,
        LostRace,  // another process created or replaced the record first
        Failed,
    };

    WriteStatus write_record(bool replace_existing, std::string& error);
};

/// Holds an acquired InstanceLock and releases it on every exit path.
class ScopedInstanceLock {
public:
    ScopedInstanceLock() = default;
    explicit ScopedInstanceLock(InstanceLock& lock);
    ~ScopedInstanceLock();

    ScopedInstanceLock(const ScopedInstanceLock&) = delete;
    ScopedInstanceLock& operator=(const ScopedInstanceLock&) = delete;
    ScopedInstanceLock(ScopedInstanceLock&& other) noexcept;
    ScopedInstanceLock& operator=(ScopedInstanceLock&& other) noexcept;

    /// Idempotent.
    void release() noexcept;

    bool held() const { return lock_ != nullptr; }

private:
    InstanceLock* lock_ = nullptr;
};
