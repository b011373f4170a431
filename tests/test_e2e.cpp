#include <gtest/gtest.h>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

// End-to-end tests against the real waypoint binary.
// Looks next to the test executable; set WAYPOINT_BIN to override.

class E2E : public ::testing::Test {
protected:
    static std::string binary_;
    std::string tmp_dir_;
    std::string data_dir_;
    int port_ = 0;
    std::vector<pid_t> children_;
    std::vector<pid_t> detached_;

    static std::string find_waypoint() {
        if (auto* p = std::getenv("WAYPOINT_BIN")) {
            if (fs::exists(p)) return p;
        }
        std::error_code ec;
        fs::path self = fs::read_symlink("/proc/self/exe", ec);
        if (!ec) {
            fs::path candidate = self.parent_path() / "waypoint";
            if (fs::exists(candidate)) return candidate.string();
        }
        return "";
    }

    static void SetUpTestSuite() {
        binary_ = find_waypoint();
    }

    void SetUp() override {
        if (binary_.empty()) {
            GTEST_SKIP() << "waypoint binary not found, skipping E2E tests";
        }
        tmp_dir_ = "/tmp/waypoint-e2e-" + std::to_string(getpid());
        fs::remove_all(tmp_dir_);
        data_dir_ = tmp_dir_ + "/data";
        fs::create_directories(data_dir_);
        port_ = 20000 + getpid() % 20000;
    }

    void TearDown() override {
        for (pid_t pid : children_) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
        }
        for (pid_t pid : detached_) {
            kill(pid, SIGKILL);
        }
        if (!tmp_dir_.empty()) fs::remove_all(tmp_dir_);
    }

    pid_t launch(const std::string& binary, std::vector<std::string> args) {
        std::vector<std::string> full = {binary, "serve", "--port", std::to_string(port_), "--no-browser"};
        full.insert(full.end(), args.begin(), args.end());
        std::vector<char*> argv;
        for (auto& a : full) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);

        pid_t pid = fork();
        if (pid == 0) {
            setenv("WAYPOINT_DATA_DIR", data_dir_.c_str(), 1);
            unsetenv("WAYPOINT_DEV");
            int devnull = open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
            }
            execv(binary.c_str(), argv.data());
            _exit(127);
        }
        children_.push_back(pid);
        return pid;
    }

    /// Exit code, or -1 if still running after the timeout.
    int wait_exit(pid_t pid, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            int status = 0;
            pid_t r = waitpid(pid, &status, WNOHANG);
            if (r == pid) {
                children_.erase(std::remove(children_.begin(), children_.end(), pid), children_.end());
                if (WIFEXITED(status)) return WEXITSTATUS(status);
                return 128 + WTERMSIG(status);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        return -1;
    }

    /// pid reported by the instance currently serving, or -1.
    pid_t serving_pid(std::chrono::milliseconds timeout = std::chrono::milliseconds(8000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            httplib::Client cli("127.0.0.1", port_);
            cli.set_connection_timeout(0, 200000);
            auto res = cli.Get("/api/status");
            if (res && res->status == 200) {
                auto j = json::parse(res->body);
                if (j.value("state", "") == "serving") return j.value("pid", -1);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        return -1;
    }
};

std::string E2E::binary_;

TEST_F(E2E, SecondInstanceWithAbortPolicyExitsWithConflict) {
    pid_t a = launch(binary_, {});
    ASSERT_EQ(serving_pid(), a);

    pid_t b = launch(binary_, {"--on-conflict", "abort"});
    EXPECT_EQ(wait_exit(b, std::chrono::milliseconds(8000)), 2);

    // A is unaffected
    EXPECT_EQ(serving_pid(), a);
}

TEST_F(E2E, NewInstanceTakesOverFromRunningOne) {
    pid_t a = launch(binary_, {});
    ASSERT_EQ(serving_pid(), a);

    pid_t c = launch(binary_, {"--on-conflict", "terminate"});
    EXPECT_EQ(wait_exit(a, std::chrono::milliseconds(10000)), 0);
    EXPECT_EQ(serving_pid(), c);

    std::ifstream lock(data_dir_ + "/waypoint.lock");
    std::string line;
    std::getline(lock, line);
    EXPECT_EQ(line, "pid=" + std::to_string(c));
}

TEST_F(E2E, CrashedInstanceLeavesRecoverableLock) {
    pid_t a = launch(binary_, {});
    ASSERT_EQ(serving_pid(), a);
    kill(a, SIGKILL);
    wait_exit(a, std::chrono::milliseconds(2000));
    EXPECT_TRUE(fs::exists(data_dir_ + "/waypoint.lock"));

    pid_t d = launch(binary_, {"--on-conflict", "abort"});
    EXPECT_EQ(serving_pid(), d);
}

TEST_F(E2E, SigtermReleasesLock) {
    pid_t a = launch(binary_, {});
    ASSERT_EQ(serving_pid(), a);

    kill(a, SIGTERM);
    EXPECT_EQ(wait_exit(a, std::chrono::milliseconds(5000)), 0);
    EXPECT_FALSE(fs::exists(data_dir_ + "/waypoint.lock"));
}

TEST_F(E2E, AppliedUpdateRelaunchesAndKeepsSettings) {
    std::string install = tmp_dir_ + "/install/waypoint";
    std::string download = tmp_dir_ + "/waypoint-download";
    fs::create_directories(fs::path(install).parent_path());
    fs::copy_file(binary_, install);
    fs::copy_file(binary_, download);

    std::ofstream(data_dir_ + "/config.yaml") << "github:\n  api_token: ghp_keep_me\n";

    pid_t a = launch(install, {});
    ASSERT_EQ(serving_pid(), a);

    httplib::Client cli("127.0.0.1", port_);
    json body = {{"artifact", download}};
    auto res = cli.Post("/api/apply-update", body.dump(), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);

    EXPECT_EQ(wait_exit(a, std::chrono::milliseconds(10000)), 0);
    pid_t relaunched = serving_pid(std::chrono::milliseconds(10000));
    ASSERT_GT(relaunched, 0);
    EXPECT_NE(relaunched, a);
    detached_.push_back(relaunched);

    EXPECT_FALSE(fs::exists(download));
    EXPECT_FALSE(fs::exists(install + ".old"));

    std::ifstream cfg(data_dir_ + "/config.yaml");
    std::stringstream ss;
    ss << cfg.rdbuf();
    EXPECT_NE(ss.str().find("ghp_keep_me"), std::string::npos);
}
