#pragma once

#include <string>
#include <sys/types.h>
#include <vector>

struct LaunchResult {
    pid_t pid = -1;
    std::string error;

    bool ok() const { return pid > 0; }
};

/// Starts processes that outlive the caller.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    /// Double-fork + setsid + exec. The new process is reparented to init
    /// and keeps running after we exit. Exec failures are reported back
    /// through a close-on-exec pipe instead of being lost in the child.
    virtual LaunchResult spawn_detached(const std::string& binary_path,
                                        const std::vector<std::string>& args);
};
