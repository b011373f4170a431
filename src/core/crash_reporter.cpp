#include "core/crash_reporter.hpp"
#include "core/data_dir.hpp"
#include "core/logger.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <cxxabi.h>
#include <execinfo.h>
#include <fcntl.h>
#include <mutex>
#include <sstream>
#include <sys/stat.h>
#include <typeinfo>
#include <unistd.h>

namespace {

constexpr int kMaxFrames = 64;

std::mutex g_mutex;
std::string g_diagnostics_dir;
std::string g_log_path;
std::atomic<int> g_signal_fd{-1};
std::atomic<unsigned> g_dropped{0};

// A report raised while reporting on the same thread is dropped
thread_local bool t_in_report = false;

struct ReentryGuard {
    bool entered = false;
    ReentryGuard() {
        if (!t_in_report) {
            t_in_report = true;
            entered = true;
        }
    }
    ~ReentryGuard() {
        if (entered) t_in_report = false;
    }
};

std::string demangle(const char* name) {
    int status = 0;
    char* out = abi::__cxa_demangle(name, nullptr, nullptr, &status);
    if (status == 0 && out) {
        std::string result(out);
        std::free(out);
        return result;
    }
    return name;
}

std::string timestamp_now(const char* fmt) {
    std::time_t now = std::time(nullptr);
    struct tm tm_buf;
    localtime_r(&now, &tm_buf);
    char buf[64];
    if (std::strftime(buf, sizeof(buf), fmt, &tm_buf) == 0) return "unknown-time";
    return buf;
}

}  // namespace

// ── Configuration ───────────────────────────────────────────

void CrashReporter::configure(const std::string& data_dir) noexcept {
    try {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_diagnostics_dir = data_dir + "/" + DataDirectory::kDiagnosticsDirName;
        g_log_path = g_diagnostics_dir + "/waypoint-" + timestamp_now("%Y%m%d-%H%M%S") + "-" +
                     std::to_string(::getpid()) + ".log";

        ::mkdir(g_diagnostics_dir.c_str(), 0755);

        int old_fd = g_signal_fd.exchange(-1);
        if (old_fd >= 0) ::close(old_fd);
        // Opened lazily by the OS on first write would need malloc in the
        // signal handler, so keep one descriptor ready.
        int fd = ::open(g_log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        g_signal_fd.store(fd);
    } catch (...) {
        g_dropped.fetch_add(1);
    }
}

void CrashReporter::reset() noexcept {
    try {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_diagnostics_dir.clear();
        g_log_path.clear();
    } catch (...) {
        // lock failure; the fd below is still closed
    }
    int fd = g_signal_fd.exchange(-1);
    if (fd >= 0) ::close(fd);
    g_dropped.store(0);
}

std::string CrashReporter::log_path() noexcept {
    try {
        std::lock_guard<std::mutex> lock(g_mutex);
        return g_log_path;
    } catch (...) {
        return std::string();
    }
}

unsigned CrashReporter::dropped_count() noexcept {
    return g_dropped.load();
}

// ── Formatting ──────────────────────────────────────────────

std::string CrashReporter::format(const std::string& context,
                                  const std::string& error_type,
                                  const std::string& message,
                                  bool with_backtrace) {
    std::ostringstream out;
    out << "==== " << timestamp_now("%Y-%m-%d %H:%M:%S") << " pid=" << ::getpid() << " ====\n";
    out << "context: " << context << "\n";
    if (!error_type.empty()) {
        out << "type:    " << error_type << "\n";
    }
    out << "message: " << message << "\n";

    if (with_backtrace) {
        void* frames[kMaxFrames];
        int count = ::backtrace(frames, kMaxFrames);
        char** symbols = ::backtrace_symbols(frames, count);
        out << "backtrace:\n";
        if (symbols) {
            // Skip format() and write_report() themselves
            for (int i = 2; i < count; ++i) {
                out << "  #" << (i - 2) << " " << symbols[i] << "\n";
            }
            std::free(symbols);
        } else {
            out << "  (unavailable)\n";
        }
    }
    out << "\n";
    return out.str();
}

// ── Reporting ───────────────────────────────────────────────

bool CrashReporter::append_to_file(const std::string& path, const std::string& text) noexcept {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) return false;

    const char* data = text.data();
    size_t remaining = text.size();
    bool ok = true;
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            ok = false;
            break;
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
    ::close(fd);
    return ok;
}

void CrashReporter::write_report(const std::string& context,
                                 const std::string& error_type,
                                 const std::string& message) noexcept {
    ReentryGuard guard;
    if (!guard.entered) {
        g_dropped.fetch_add(1);
        return;
    }

    try {
        LOG_ERROR("{}: {}", context, message);
    } catch (...) {
        // logger unusable, the file below is still attempted
    }

    try {
        std::string text = format(context, error_type, message, true);

        std::lock_guard<std::mutex> lock(g_mutex);
        if (g_log_path.empty()) return;
        ::mkdir(g_diagnostics_dir.c_str(), 0755);
        if (!append_to_file(g_log_path, text)) {
            g_dropped.fetch_add(1);
        }
    } catch (...) {
        g_dropped.fetch_add(1);
    }
}

void CrashReporter::report(const std::string& context, const std::exception& error) noexcept {
    try {
        write_report(context, demangle(typeid(error).name()), error.what());
    } catch (...) {
        g_dropped.fetch_add(1);
    }
}

void CrashReporter::report(const std::string& context, std::exception_ptr error) noexcept {
    if (!error) {
        report(context, std::string("(no exception)"));
        return;
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        report(context, e);
    } catch (...) {
        write_report(context, "unknown", "non-standard exception");
    }
}

void CrashReporter::report(const std::string& context, const std::string& message) noexcept {
    write_report(context, "", message);
}

void CrashReporter::report_current(const std::string& context) noexcept {
    report(context, std::current_exception());
}

// ── Fatal signals ───────────────────────────────────────────

void CrashReporter::fatal_signal_handler(int sig) {
    // Async-signal-safe calls only
    int fd = g_signal_fd.load();
    if (fd >= 0) {
        static const char header[] = "==== fatal signal ";
        ssize_t ignored = ::write(fd, header, sizeof(header) - 1);
        char num[8];
        int len = 0;
        int s = sig;
        do {
            num[len++] = static_cast<char>('0' + s % 10);
            s /= 10;
        } while (s > 0 && len < 7);
        for (int i = len - 1; i >= 0; --i) {
            ignored = ::write(fd, &num[i], 1);
        }
        ignored = ::write(fd, " ====\n", 6);
        (void)ignored;

        void* frames[kMaxFrames];
        int count = ::backtrace(frames, kMaxFrames);
        ::backtrace_symbols_fd(frames, count, fd);
    }

    std::signal(sig, SIG_DFL);
    std::raise(sig);
}

void CrashReporter::install_fatal_signal_handlers() noexcept {
    // backtrace() loads libgcc lazily; do it now rather than inside the handler
    void* warmup[1];
    ::backtrace(warmup, 1);

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = &CrashReporter::fatal_signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESETHAND;

    for (int sig : {SIGSEGV, SIGBUS, SIGFPE, SIGILL, SIGABRT}) {
        sigaction(sig, &sa, nullptr);
    }
}
