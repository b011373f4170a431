#include "lifecycle/process_launcher.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Pipe messages; the intermediate child and the grandchild write independently
struct LaunchMessage {
    int kind;   // kPidMessage or kErrnoMessage
    int value;
};

constexpr int kPidMessage = 1;
constexpr int kErrnoMessage = 2;

}  // namespace

static bool read_exact(int fd, void* buf, size_t len) {
    auto* p = static_cast<char*>(buf);
    size_t got = 0;
    while (got < len) {
        ssize_t n = ::read(fd, p + got, len - got);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        got += static_cast<size_t>(n);
    }
    return true;
}

static void write_all(int fd, const void* buf, size_t len) {
    const auto* p = static_cast<const char*>(buf);
    while (len > 0) {
        ssize_t n = ::write(fd, p, len);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        p += n;
        len -= static_cast<size_t>(n);
    }
}

LaunchResult ProcessLauncher::spawn_detached(const std::string& binary_path,
                                             const std::vector<std::string>& args) {
    LaunchResult result;

    // Build argv before forking; no allocation after fork
    std::vector<const char*> argv;
    argv.push_back(binary_path.c_str());
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    pid_t child = fork();
    if (child < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        ::close(fds[0]);
        ::close(fds[1]);
        return result;
    }

    if (child == 0) {
        ::close(fds[0]);
        setsid();

        pid_t grandchild = fork();
        if (grandchild < 0) {
            _exit(1);
        }
        if (grandchild == 0) {
            int devnull = ::open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
                if (devnull > STDERR_FILENO) ::close(devnull);
            }
            execv(binary_path.c_str(), const_cast<char* const*>(argv.data()));

            LaunchMessage failed{kErrnoMessage, errno};
            write_all(fds[1], &failed, sizeof(failed));
            _exit(127);
        }

        LaunchMessage started{kPidMessage, static_cast<int>(grandchild)};
        write_all(fds[1], &started, sizeof(started));
        _exit(0);
    }

    ::close(fds[1]);

    int status = 0;
    while (waitpid(child, &status, 0) < 0 && errno == EINTR) {
    }

    // EOF after the pid message means exec succeeded and closed the pipe
    pid_t launched = -1;
    int exec_errno = 0;
    LaunchMessage msg;
    while (read_exact(fds[0], &msg, sizeof(msg))) {
        if (msg.kind == kPidMessage) {
            launched = static_cast<pid_t>(msg.value);
        } else if (msg.kind == kErrnoMessage) {
            exec_errno = msg.value;
        }
    }
    ::close(fds[0]);

    if (exec_errno != 0) {
        result.error = "exec " + binary_path + " failed: " + std::strerror(exec_errno);
        return result;
    }
    if (launched <= 0) {
        result.error = "launcher process failed";
        return result;
    }

    LOG_INFO("Launched {} as pid {}", binary_path, launched);
    result.pid = launched;
    return result;
}
