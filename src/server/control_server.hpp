#pragma once

#include "lifecycle/orchestrator.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
struct Request;
struct Response;
}  // namespace httplib

class UpdateChecker;

/// Loopback HTTP control surface: version, status, apply-update, restart.
/// Route handlers only post requests to the orchestrator and return.
class ControlServer : public LifecycleServer {
public:
    /// port 0 binds an ephemeral port; see port() after start().
    ControlServer(Orchestrator& orchestrator, std::string host, int port,
                  UpdateChecker* checker = nullptr);
    ~ControlServer() override;

    bool start() override;
    void stop() override;

    int port() const { return bound_port_.load(); }
    bool running() const;

private:
    Orchestrator& orchestrator_;
    UpdateChecker* checker_;
    std::string host_;
    int requested_port_;
    std::atomic<int> bound_port_{-1};
    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;

    void register_routes();
    bool accept_post(const httplib::Request& req, httplib::Response& res) const;
};
