#include <gtest/gtest.h>
#include "lifecycle/process_launcher.hpp"
#include "lifecycle/process_probe.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

TEST(ProcessLauncherTest, LaunchesDetachedProcess) {
    ProcessLauncher launcher;
    LaunchResult r = launcher.spawn_detached("/bin/sleep", {"30"});
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_TRUE(ProcessProbe::process_exists(r.pid));
    // Not our child: the intermediate process already exited
    EXPECT_EQ(waitpid(r.pid, nullptr, WNOHANG), -1);

    kill(r.pid, SIGKILL);
}

TEST(ProcessLauncherTest, PassesArguments) {
    std::string marker = fs::temp_directory_path() / ("waypoint-test-launch-" + std::to_string(getpid()));
    fs::remove(marker);

    ProcessLauncher launcher;
    LaunchResult r = launcher.spawn_detached("/usr/bin/touch", {marker});
    ASSERT_TRUE(r.ok()) << r.error;

    for (int i = 0; i < 100 && !fs::exists(marker); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_TRUE(fs::exists(marker));
    fs::remove(marker);
}

TEST(ProcessLauncherTest, MissingBinaryReportsExecError) {
    ProcessLauncher launcher;
    LaunchResult r = launcher.spawn_detached("/nonexistent/binary", {});
    EXPECT_FALSE(r.ok());
    EXPECT_NE(r.error.find("exec"), std::string::npos);
}
