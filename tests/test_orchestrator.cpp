#include <gtest/gtest.h>
#include "lifecycle/orchestrator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

class FakeServer : public LifecycleServer {
public:
    bool start_ok = true;
    std::atomic<int> starts{0};
    std::atomic<int> stops{0};

    bool start() override {
        ++starts;
        return start_ok;
    }
    void stop() override { ++stops; }
};

class FakeLauncher : public ProcessLauncher {
public:
    bool fail = false;
    std::mutex mutex;
    std::vector<std::string> binaries;
    std::vector<std::vector<std::string>> args;

    LaunchResult spawn_detached(const std::string& binary_path,
                                const std::vector<std::string>& a) override {
        std::lock_guard<std::mutex> lock(mutex);
        binaries.push_back(binary_path);
        args.push_back(a);
        LaunchResult r;
        if (fail) {
            r.error = "exec failed: injected";
        } else {
            r.pid = 424242;
        }
        return r;
    }

    size_t launches() {
        std::lock_guard<std::mutex> lock(mutex);
        return binaries.size();
    }
};

/// Blocks inside step 1 until released, so tests can act mid-update.
class GatedApplier : public UpdateApplier {
public:
    std::mutex mutex;
    std::condition_variable cv;
    bool entered = false;
    bool released = false;

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            released = true;
        }
        cv.notify_all();
    }

    bool wait_entered() {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(5), [this] { return entered; });
    }

protected:
    std::error_code remove_file(const std::string& path) override {
        {
            std::unique_lock<std::mutex> lock(mutex);
            if (!entered) {
                entered = true;
                cv.notify_all();
                cv.wait_for(lock, std::chrono::seconds(5), [this] { return released; });
            }
        }
        return UpdateApplier::remove_file(path);
    }
};

pid_t spawn_sibling(bool ignore_sigterm) {
    int fds[2];
    if (pipe(fds) != 0) return -1;
    pid_t pid = fork();
    if (pid == 0) {
        close(fds[0]);
        if (ignore_sigterm) signal(SIGTERM, SIG_IGN);
        char ready = 'r';
        ssize_t ignored = write(fds[1], &ready, 1);
        (void)ignored;
        close(fds[1]);
        while (true) pause();
    }
    close(fds[1]);
    char buf;
    ssize_t n = read(fds[0], &buf, 1);
    close(fds[0]);
    return n == 1 ? pid : -1;
}

TerminationPolicy fast_policy() {
    TerminationPolicy p;
    p.graceful_timeout = std::chrono::milliseconds(300);
    p.force_timeout = std::chrono::milliseconds(1000);
    p.poll_interval = std::chrono::milliseconds(20);
    return p;
}

}  // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string target;
    std::string artifact;
    ProcessProbe probe{fast_policy()};
    UpdateApplier applier;
    FakeLauncher launcher;
    FakeServer server;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("waypoint-test-orch-" + std::to_string(getpid()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir + "/data");
        fs::create_directories(test_dir + "/install");

        target = test_dir + "/install/waypoint";
        artifact = test_dir + "/waypoint-download";
        std::ofstream(target) << "OLD";
        std::ofstream(artifact) << "NEW";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    OrchestratorOptions options(ConflictPolicy policy = ConflictPolicy::TerminatePrevious) {
        OrchestratorOptions o;
        o.data_dir = test_dir + "/data";
        o.conflict_policy = policy;
        o.executable = target;
        o.relaunch_args = {"serve", "--no-browser"};
        o.poll_interval = std::chrono::milliseconds(20);
        return o;
    }

    std::string lock_path() const { return test_dir + "/data/waypoint.lock"; }

    static std::string read(const std::string& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static bool wait_for_state(const Orchestrator& orch, LifecycleState want) {
        for (int i = 0; i < 250; ++i) {
            if (orch.state() == want) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return false;
    }

    void write_lock_for(pid_t pid) {
        std::ofstream(lock_path()) << "pid=" << pid << "\ncreated=1\nexe="
                                   << ProcessProbe::self_executable() << "\n";
    }
};

// ── Startup ─────────────────────────────────────────────────

TEST_F(OrchestratorTest, StateNames) {
    EXPECT_STREQ(Orchestrator::state_name(LifecycleState::Serving), "serving");
    EXPECT_STREQ(Orchestrator::state_name(LifecycleState::UpdateRequested), "update_requested");
    EXPECT_STREQ(Orchestrator::state_name(LifecycleState::Terminated), "terminated");
}

TEST_F(OrchestratorTest, StartAcquiresLock) {
    Orchestrator orch(options(), probe, applier, launcher);
    StartupResult r = orch.start();
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_FALSE(r.terminated_previous);
    EXPECT_EQ(orch.state(), LifecycleState::Locked);
    EXPECT_NE(read(lock_path()).find("pid=" + std::to_string(getpid())), std::string::npos);
}

TEST_F(OrchestratorTest, StaleLockRecovered) {
    pid_t gone = fork();
    if (gone == 0) _exit(0);
    waitpid(gone, nullptr, 0);
    write_lock_for(gone);

    Orchestrator orch(options(ConflictPolicy::Abort), probe, applier, launcher);
    StartupResult r = orch.start();
    EXPECT_TRUE(r.ok()) << r.message;
    EXPECT_FALSE(r.terminated_previous);
}

TEST_F(OrchestratorTest, AbortPolicyLeavesLiveOwnerAlone) {
    pid_t sibling = spawn_sibling(false);
    ASSERT_GT(sibling, 0);
    write_lock_for(sibling);

    Orchestrator orch(options(ConflictPolicy::Abort), probe, applier, launcher);
    int code = orch.run(server);
    EXPECT_EQ(code, Orchestrator::kExitConflict);
    EXPECT_EQ(orch.state(), LifecycleState::Terminated);
    EXPECT_EQ(server.starts.load(), 0);
    EXPECT_TRUE(ProcessProbe::process_exists(sibling));
    // Lock still belongs to the sibling
    EXPECT_NE(read(lock_path()).find("pid=" + std::to_string(sibling)), std::string::npos);

    kill(sibling, SIGKILL);
    waitpid(sibling, nullptr, 0);
}

TEST_F(OrchestratorTest, TerminatePreviousGracefully) {
    pid_t sibling = spawn_sibling(false);
    ASSERT_GT(sibling, 0);
    write_lock_for(sibling);

    Orchestrator orch(options(), probe, applier, launcher);
    StartupResult r = orch.start();
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_TRUE(r.terminated_previous);
    EXPECT_EQ(r.owner.pid, sibling);
    EXPECT_FALSE(ProcessProbe::process_exists(sibling));
    waitpid(sibling, nullptr, 0);
}

TEST_F(OrchestratorTest, TerminatePreviousEscalatesToKill) {
    pid_t stubborn = spawn_sibling(true);
    ASSERT_GT(stubborn, 0);
    write_lock_for(stubborn);

    Orchestrator orch(options(), probe, applier, launcher);
    StartupResult r = orch.start();
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_TRUE(r.terminated_previous);
    EXPECT_FALSE(ProcessProbe::process_exists(stubborn));
    waitpid(stubborn, nullptr, 0);
}

// ── Serving ─────────────────────────────────────────────────

TEST_F(OrchestratorTest, StopReleasesLockWithoutRelaunch) {
    Orchestrator orch(options(), probe, applier, launcher);
    int code = -1;
    std::thread runner([&] { code = orch.run(server); });

    ASSERT_TRUE(wait_for_state(orch, LifecycleState::Serving));
    EXPECT_TRUE(fs::exists(lock_path()));
    orch.request_stop();
    runner.join();

    EXPECT_EQ(code, Orchestrator::kExitOk);
    EXPECT_EQ(orch.state(), LifecycleState::Terminated);
    EXPECT_EQ(server.stops.load(), 1);
    EXPECT_FALSE(fs::exists(lock_path()));
    EXPECT_EQ(launcher.launches(), 0u);
}

TEST_F(OrchestratorTest, ServerStartFailureReleasesLock) {
    server.start_ok = false;
    Orchestrator orch(options(), probe, applier, launcher);
    EXPECT_EQ(orch.run(server), Orchestrator::kExitError);
    EXPECT_FALSE(fs::exists(lock_path()));
    EXPECT_EQ(orch.state(), LifecycleState::Terminated);
}

TEST_F(OrchestratorTest, UpdateRejectedUnlessServing) {
    Orchestrator orch(options(), probe, applier, launcher);
    std::string error;
    EXPECT_FALSE(orch.request_update(artifact, error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(orch.request_restart(error));
}

TEST_F(OrchestratorTest, CommittedUpdateRelaunches) {
    Orchestrator orch(options(), probe, applier, launcher);
    int code = -1;
    std::thread runner([&] { code = orch.run(server); });
    ASSERT_TRUE(wait_for_state(orch, LifecycleState::Serving));

    std::string error;
    ASSERT_TRUE(orch.request_update(artifact, error)) << error;
    runner.join();

    EXPECT_EQ(code, Orchestrator::kExitOk);
    EXPECT_EQ(read(target), "NEW");
    EXPECT_FALSE(fs::exists(artifact));
    EXPECT_FALSE(fs::exists(lock_path()));
    EXPECT_EQ(server.stops.load(), 1);

    ASSERT_EQ(launcher.launches(), 1u);
    EXPECT_EQ(launcher.binaries[0], target);
    EXPECT_EQ(launcher.args[0], (std::vector<std::string>{"serve", "--no-browser"}));
}

TEST_F(OrchestratorTest, FailedUpdateKeepsServing) {
    Orchestrator orch(options(), probe, applier, launcher);
    std::thread runner([&] { orch.run(server); });
    ASSERT_TRUE(wait_for_state(orch, LifecycleState::Serving));

    std::string error;
    ASSERT_TRUE(orch.request_update(test_dir + "/missing-download", error)) << error;

    // Back to serving with the failure recorded
    for (int i = 0; i < 250 && orch.status().last_error.empty(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_EQ(orch.state(), LifecycleState::Serving);
    EXPECT_FALSE(orch.status().last_error.empty());
    EXPECT_EQ(read(target), "OLD");
    EXPECT_TRUE(fs::exists(lock_path()));

    orch.request_stop();
    runner.join();
    EXPECT_EQ(launcher.launches(), 0u);
}

TEST_F(OrchestratorTest, ConcurrentUpdateRejected) {
    GatedApplier gated;
    // A leftover backup makes step 1 call remove_file
    std::ofstream(target + ".old") << "ANCIENT";

    Orchestrator orch(options(), probe, gated, launcher);
    std::thread runner([&] { orch.run(server); });
    ASSERT_TRUE(wait_for_state(orch, LifecycleState::Serving));

    std::string error;
    ASSERT_TRUE(orch.request_update(artifact, error)) << error;
    ASSERT_TRUE(gated.wait_entered());

    EXPECT_EQ(orch.state(), LifecycleState::UpdateRequested);
    EXPECT_FALSE(orch.request_update(artifact, error));
    EXPECT_NE(error.find("already in progress"), std::string::npos);

    gated.release();
    runner.join();
    EXPECT_EQ(read(target), "NEW");
}

TEST_F(OrchestratorTest, CancelBeforeBackupKeepsCurrentVersion) {
    GatedApplier gated;
    std::ofstream(target + ".old") << "ANCIENT";

    Orchestrator orch(options(), probe, gated, launcher);
    std::thread runner([&] { orch.run(server); });
    ASSERT_TRUE(wait_for_state(orch, LifecycleState::Serving));

    std::string error;
    ASSERT_TRUE(orch.request_update(artifact, error)) << error;
    ASSERT_TRUE(gated.wait_entered());
    orch.cancel_update();
    gated.release();

    ASSERT_TRUE(wait_for_state(orch, LifecycleState::Serving));
    EXPECT_EQ(read(target), "OLD");

    orch.request_stop();
    runner.join();
    EXPECT_EQ(launcher.launches(), 0u);
}

TEST_F(OrchestratorTest, RestartRelaunchesSameExecutable) {
    Orchestrator orch(options(), probe, applier, launcher);
    int code = -1;
    std::thread runner([&] { code = orch.run(server); });
    ASSERT_TRUE(wait_for_state(orch, LifecycleState::Serving));

    std::string error;
    ASSERT_TRUE(orch.request_restart(error)) << error;
    runner.join();

    EXPECT_EQ(code, Orchestrator::kExitOk);
    ASSERT_EQ(launcher.launches(), 1u);
    EXPECT_EQ(launcher.binaries[0], target);
    EXPECT_EQ(read(target), "OLD");
}

TEST_F(OrchestratorTest, RelaunchFailureResumesServing) {
    launcher.fail = true;
    Orchestrator orch(options(), probe, applier, launcher);
    std::atomic<int> code{-1};
    std::thread runner([&] { code = orch.run(server); });
    ASSERT_TRUE(wait_for_state(orch, LifecycleState::Serving));

    std::string error;
    ASSERT_TRUE(orch.request_restart(error));

    // The server comes back up under a re-taken lock
    for (int i = 0; i < 250 && server.starts.load() < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ASSERT_EQ(server.starts.load(), 2);
    ASSERT_TRUE(wait_for_state(orch, LifecycleState::Serving));
    EXPECT_EQ(code.load(), -1);
    EXPECT_FALSE(orch.status().last_error.empty());
    EXPECT_FALSE(orch.status().relaunch_pending);

    auto rec = LockRecord::parse(read(lock_path()));
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->pid, getpid());

    // Still accepts requests afterwards
    EXPECT_TRUE(orch.request_restart(error)) << error;
    for (int i = 0; i < 250 && server.starts.load() < 3; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_EQ(server.starts.load(), 3);

    orch.request_stop();
    runner.join();
    EXPECT_EQ(code.load(), Orchestrator::kExitOk);
    EXPECT_FALSE(fs::exists(lock_path()));
}

TEST_F(OrchestratorTest, RelaunchFailureAfterUpdateKeepsNewBinaryAndServes) {
    launcher.fail = true;
    Orchestrator orch(options(), probe, applier, launcher);
    std::atomic<int> code{-1};
    std::thread runner([&] { code = orch.run(server); });
    ASSERT_TRUE(wait_for_state(orch, LifecycleState::Serving));

    std::string error;
    ASSERT_TRUE(orch.request_update(artifact, error)) << error;
    for (int i = 0; i < 250 && server.starts.load() < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ASSERT_EQ(server.starts.load(), 2);
    ASSERT_TRUE(wait_for_state(orch, LifecycleState::Serving));

    // The installed binary is the new one; the next start picks it up
    EXPECT_EQ(read(target), "NEW");
    EXPECT_TRUE(fs::exists(lock_path()));

    orch.request_stop();
    runner.join();
    EXPECT_EQ(code.load(), Orchestrator::kExitOk);
}

TEST_F(OrchestratorTest, StatusReportsIdentity) {
    Orchestrator orch(options(), probe, applier, launcher);
    LifecycleStatus st = orch.status();
    EXPECT_EQ(st.pid, getpid());
    EXPECT_EQ(st.executable, target);
    EXPECT_EQ(st.data_dir, test_dir + "/data");
    EXPECT_FALSE(st.version.empty());
}
