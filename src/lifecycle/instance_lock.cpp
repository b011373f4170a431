#include "lifecycle/instance_lock.hpp"
#include "core/crash_reporter.hpp"
#include "core/data_dir.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/file.h>
#include <thread>
#include <unistd.h>

// ── LockRecord ──────────────────────────────────────────────

std::string LockRecord::serialize() const {
    std::ostringstream out;
    out << "pid=" << pid << "\n";
    out << "created=" << created << "\n";
    if (!executable.empty()) {
        out << "exe=" << executable << "\n";
    }
    return out.str();
}

static bool parse_pid(const std::string& s, pid_t& out) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    try {
        long v = std::stol(s);
        if (v <= 0) return false;
        out = static_cast<pid_t>(v);
        return static_cast<long>(out) == v;
    } catch (const std::exception&) {
        return false;
    }
}

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::optional<LockRecord> LockRecord::parse(const std::string& text) {
    LockRecord rec;
    bool have_pid = false;
    bool first = true;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            // Older lock files hold only the pid
            if (first && parse_pid(line, rec.pid)) have_pid = true;
            first = false;
            continue;
        }
        first = false;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key == "pid") {
            have_pid = parse_pid(value, rec.pid);
        } else if (key == "created") {
            try {
                rec.created = std::stoll(value);
            } catch (const std::exception&) {
                rec.created = 0;
            }
        } else if (key == "exe") {
            rec.executable = value;
        }
    }

    if (!have_pid) return std::nullopt;
    return rec;
}

// ── Guard ───────────────────────────────────────────────────

namespace {

/// flock on a sidecar file, held for the duration of one acquisition.
class GuardFile {
public:
    explicit GuardFile(const std::string& path) {
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) return;

        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(InstanceLock::kGuardWaitMs);
        while (true) {
            if (flock(fd_, LOCK_EX | LOCK_NB) == 0) {
                locked_ = true;
                return;
            }
            if (errno != EWOULDBLOCK && errno != EINTR) {
                // Filesystem without flock support: fall back to link/rename only
                unsupported_ = true;
                return;
            }
            if (std::chrono::steady_clock::now() >= deadline) return;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    ~GuardFile() {
        if (fd_ >= 0) {
            if (locked_) flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }

    GuardFile(const GuardFile&) = delete;
    GuardFile& operator=(const GuardFile&) = delete;

    bool timed_out() const { return fd_ >= 0 && !locked_ && !unsupported_; }

private:
    int fd_ = -1;
    bool locked_ = false;
    bool unsupported_ = false;
};

}  // namespace

// ── InstanceLock ────────────────────────────────────────────

InstanceLock::InstanceLock(std::string data_dir, const ProcessProbe& probe)
    : InstanceLock(std::move(data_dir), probe, ProcessProbe::self_executable(), ::getpid()) {}

InstanceLock::InstanceLock(std::string data_dir, const ProcessProbe& probe, std::string identity,
                           pid_t self)
    : dir_(std::move(data_dir)), probe_(probe), identity_(std::move(identity)), self_(self) {}

std::string InstanceLock::lock_path() const {
    return dir_ + "/" + DataDirectory::kLockFileName;
}

std::optional<LockRecord> InstanceLock::read() const {
    std::ifstream in(lock_path());
    if (!in.is_open()) return std::nullopt;
    std::stringstream ss;
    ss << in.rdbuf();
    return LockRecord::parse(ss.str());
}

bool InstanceLock::owner_is_live(const LockRecord& record) const {
    if (probe_.is_live_instance(record.pid, identity_)) return true;
    // The owner may run a differently named copy of the app; trust the
    // recorded path only if the pid is still running exactly that binary.
    return !record.executable.empty() && probe_.is_live_instance(record.pid, record.executable);
}

InstanceLock::WriteStatus InstanceLock::write_record(bool replace_existing, std::string& error) {
    LockRecord rec;
    rec.pid = self_;
    rec.created = static_cast<std::int64_t>(std::time(nullptr));
    rec.executable = identity_;

    std::string path = lock_path();
    std::string tmp = path + ".tmp." + std::to_string(self_);

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = "Cannot create " + tmp + ": " + std::strerror(errno);
        return WriteStatus::Failed;
    }
    std::string text = rec.serialize();
    ssize_t written = ::write(fd, text.data(), text.size());
    bool ok = written == static_cast<ssize_t>(text.size()) && ::fsync(fd) == 0;
    ::close(fd);
    if (!ok) {
        error = "Cannot write " + tmp;
        ::unlink(tmp.c_str());
        return WriteStatus::Failed;
    }

    int rc;
    if (replace_existing) {
        rc = ::rename(tmp.c_str(), path.c_str());
    } else {
        // link() fails with EEXIST if someone created the lock meanwhile
        rc = ::link(tmp.c_str(), path.c_str());
    }
    int saved_errno = errno;
    ::unlink(tmp.c_str());

    if (rc != 0) {
        if (saved_errno == EEXIST) {
            error = "lock created concurrently";
            return WriteStatus::LostRace;
        }
        error = "Cannot install " + path + ": " + std::strerror(saved_errno);
        return WriteStatus::Failed;
    }

    // Verify-after-write: the record on disk must be ours
    auto check = read();
    if (!check || check->pid != self_) {
        error = "lock taken over concurrently";
        return WriteStatus::LostRace;
    }
    return WriteStatus::Written;
}

AcquireResult InstanceLock::try_acquire() {
    AcquireResult result;

    try {
        GuardFile guard(lock_path() + ".guard");
        if (guard.timed_out()) {
            result.status = AcquireStatus::Error;
            result.error = "Timed out waiting for the lock guard";
            return result;
        }

        // Two passes: a concurrent create between our read and write sends us round once more
        for (int attempt = 0; attempt < 2; ++attempt) {
            bool file_present = ::access(lock_path().c_str(), F_OK) == 0;
            auto existing = read();
            bool replace = file_present;

            if (existing) {
                if (existing->pid == self_) {
                    LOG_DEBUG("Lock already held by this process");
                } else if (owner_is_live(*existing)) {
                    result.status = AcquireStatus::Conflict;
                    result.owner = *existing;
                    LOG_INFO("Instance lock held by live pid {} ({})", existing->pid,
                             existing->executable.empty() ? "unknown exe" : existing->executable);
                    return result;
                } else {
                    LOG_INFO("Recovering stale lock left by pid {}", existing->pid);
                    result.recovered_stale = true;
                }
            } else if (file_present) {
                LOG_WARN("Lock file {} is unreadable, treating as stale", lock_path());
                result.recovered_stale = true;
            }

            std::string error;
            WriteStatus written = write_record(replace, error);
            if (written == WriteStatus::Written) {
                result.status = AcquireStatus::Acquired;
                result.owner = read().value_or(LockRecord{});
                return result;
            }

            if (written == WriteStatus::LostRace) {
                LOG_DEBUG("Lock write lost a race: {}", error);
                result.recovered_stale = false;
                continue;
            }

            result.status = AcquireStatus::Error;
            result.error = error;
            CrashReporter::report("Acquiring instance lock", error);
            return result;
        }

        // Lost the race twice; whoever holds it now is the owner
        auto holder = read();
        result.status = AcquireStatus::Conflict;
        if (holder) result.owner = *holder;
        return result;
    } catch (const std::exception& e) {
        CrashReporter::report("Acquiring instance lock", e);
        result.status = AcquireStatus::Error;
        result.error = e.what();
        return result;
    }
}

bool InstanceLock::release() {
    auto rec = read();
    if (!rec) {
        // Nothing to release, or an unreadable record we do not own
        return ::access(lock_path().c_str(), F_OK) != 0;
    }
    if (rec->pid != self_) {
        LOG_WARN("Not releasing lock owned by pid {}", rec->pid);
        return false;
    }
    if (::unlink(lock_path().c_str()) != 0 && errno != ENOENT) {
        CrashReporter::report("Releasing instance lock",
                              std::string("unlink failed: ") + std::strerror(errno));
        return false;
    }
    LOG_DEBUG("Instance lock released");
    return true;
}

// ── ScopedInstanceLock ──────────────────────────────────────

ScopedInstanceLock::ScopedInstanceLock(InstanceLock& lock) : lock_(&lock) {}

ScopedInstanceLock::~ScopedInstanceLock() {
    release();
}

ScopedInstanceLock::ScopedInstanceLock(ScopedInstanceLock&& other) noexcept : lock_(other.lock_) {
    other.lock_ = nullptr;
}

ScopedInstanceLock& ScopedInstanceLock::operator=(ScopedInstanceLock&& other) noexcept {
    if (this == &other) return *this;
    release();
    lock_ = other.lock_;
    other.lock_ = nullptr;
    return *this;
}

void ScopedInstanceLock::release() noexcept {
    if (!lock_) return;
    InstanceLock* lock = lock_;
    lock_ = nullptr;
    try {
        lock->release();
    } catch (const std::exception& e) {
        CrashReporter::report("Releasing instance lock", e);
    }
}
