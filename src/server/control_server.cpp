#include "server/control_server.hpp"
#include "core/crash_reporter.hpp"
#include "core/logger.hpp"
#include "core/update_checker.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static void send_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

// A page on another site can reach loopback from the user's browser; it can
// send text/plain without a preflight, and it always sends its Origin.
bool ControlServer::accept_post(const httplib::Request& req, httplib::Response& res) const {
    if (req.has_header("Origin")) {
        std::string origin = req.get_header_value("Origin");
        std::string port = ":" + std::to_string(bound_port_.load());
        bool own = origin == "http://" + host_ + port ||
                   origin == "http://127.0.0.1" + port ||
                   origin == "http://localhost" + port;
        if (!own) {
            LOG_WARN("Rejected {} from foreign origin {}", req.path, origin);
            send_json(res, 403, {{"success", false}, {"error", "Forbidden origin"}});
            return false;
        }
    }
    std::string type = req.get_header_value("Content-Type");
    if (type.compare(0, 16, "application/json") != 0) {
        send_json(res, 415, {{"success", false}, {"error", "Expected application/json"}});
        return false;
    }
    return true;
}

ControlServer::ControlServer(Orchestrator& orchestrator, std::string host, int port,
                             UpdateChecker* checker)
    : orchestrator_(orchestrator),
      checker_(checker),
      host_(std::move(host)),
      requested_port_(port),
      server_(std::make_unique<httplib::Server>()) {
    register_routes();
}

ControlServer::~ControlServer() {
    stop();
}

void ControlServer::register_routes() {
    server_->set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            CrashReporter::report("HTTP " + req.method + " " + req.path, ep);
            send_json(res, 500, {{"success", false}, {"error", "Internal error"}});
        });

    server_->Get("/api/version", [](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, {{"version", UpdateChecker::current_version()}});
    });

    server_->Get("/api/status", [this](const httplib::Request&, httplib::Response& res) {
        LifecycleStatus st = orchestrator_.status();
        send_json(res, 200,
                  {{"state", Orchestrator::state_name(st.state)},
                   {"pid", st.pid},
                   {"version", st.version},
                   {"data_dir", st.data_dir},
                   {"executable", st.executable},
                   {"last_error", st.last_error},
                   {"relaunch_pending", st.relaunch_pending}});
    });

    server_->Post("/api/apply-update", [this](const httplib::Request& req, httplib::Response& res) {
        if (!accept_post(req, res)) return;
        std::string artifact;
        try {
            auto body = json::parse(req.body);
            artifact = body.value("artifact", "");
        } catch (const json::exception& e) {
            send_json(res, 400, {{"success", false}, {"error", std::string("Bad request: ") + e.what()}});
            return;
        }
        if (artifact.empty()) {
            send_json(res, 400, {{"success", false}, {"error", "Missing 'artifact'"}});
            return;
        }

        std::string error;
        if (!orchestrator_.request_update(artifact, error)) {
            send_json(res, 409, {{"success", false}, {"error", error}});
            return;
        }
        send_json(res, 202,
                  {{"success", true}, {"message", "Update accepted. Application will restart..."}});
    });

    server_->Post("/api/restart", [this](const httplib::Request& req, httplib::Response& res) {
        if (!accept_post(req, res)) return;
        std::string error;
        if (!orchestrator_.request_restart(error)) {
            send_json(res, 409, {{"success", false}, {"error", error}});
            return;
        }
        send_json(res, 202, {{"success", true}, {"message", "Restarting..."}});
    });

    server_->Get("/api/update-check", [this](const httplib::Request& req, httplib::Response& res) {
        if (!checker_) {
            send_json(res, 503, {{"available", false}, {"error", "Update checks disabled"}});
            return;
        }
        bool use_cache = req.get_param_value("refresh") != "1";
        UpdateInfo info = checker_->check_for_update(use_cache);
        json body = {{"available", info.available},
                     {"current_version", info.current_version},
                     {"latest_version", info.latest_version},
                     {"download_url", info.download_url},
                     {"asset_name", info.asset_name},
                     {"release_notes", info.release_notes}};
        if (!info.error.empty()) body["error"] = info.error;
        send_json(res, 200, body);
    });
}

bool ControlServer::start() {
    if (thread_.joinable()) return true;

    // An httplib::Server is not reused once stopped
    if (bound_port_.load() >= 0) {
        server_ = std::make_unique<httplib::Server>();
        register_routes();
    }

    int port = requested_port_;
    if (port == 0) {
        port = server_->bind_to_any_port(host_);
        if (port <= 0) {
            LOG_ERROR("Cannot bind control server on {}", host_);
            return false;
        }
    } else if (!server_->bind_to_port(host_, port)) {
        LOG_ERROR("Cannot bind control server on {}:{}", host_, port);
        return false;
    }
    bound_port_.store(port);

    thread_ = std::thread([this] {
        try {
            server_->listen_after_bind();
        } catch (const std::exception& e) {
            CrashReporter::report("Control server loop", e);
        }
    });

    server_->wait_until_ready();
    LOG_INFO("Serving on http://{}:{}", host_, port);
    return true;
}

void ControlServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool ControlServer::running() const {
    return server_ && server_->is_running();
}
