#include "daemon/daemon.hpp"
#include "daemon/options.hpp"
#include "daemon/status_json.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <chrono>

namespace fs = std::filesystem;
using json = nlohmann::json;

Daemon::Daemon(Config& config, Logger logger)
    : config_(config),
      logger_(std::move(logger)),
      sampler_(sampler_options(config.data()), logger_),
      controller_(controller_options(config),
                  [this] { return launcher_.build_command(config_.data()); },
                  sampler_, logger_),
      snapshots_(make_snapshots(config, logger_)),
      supervisor_(controller_, sampler_, *snapshots_, supervisor_options(config.data()), logger_) {
    controller_.readiness_probe = make_readiness_probe(config.data().server);
}

Daemon::~Daemon() {
    request_stop();
    supervisor_.stop();
    cleanup_socket();
}

std::unique_ptr<SnapshotProvider> Daemon::make_snapshots(const Config& config, Logger logger) {
    const auto& b = config.data().backup;
    if (b.snapshot_command.empty()) {
        return std::make_unique<NullSnapshot>();
    }
    return std::make_unique<CommandSnapshot>(b.snapshot_command, controller_options(config).server_dir,
                                             std::chrono::seconds(b.snapshot_timeout), std::move(logger));
}

std::string Daemon::socket_path() const {
    return daemon_socket_path(config_);
}

void Daemon::cleanup_socket() {
    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
        unlink(socket_path().c_str());
    }
}

bool Daemon::start_ipc_server() {
    std::string path = socket_path();
    if (path.empty()) return false;

    // Refuse to steal the socket of a daemon that still answers
    if (fs::exists(path)) {
        int probe = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (probe >= 0) {
            struct sockaddr_un addr;
            std::memset(&addr, 0, sizeof(addr));
            addr.sun_family = AF_UNIX;
            std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
            bool alive = connect(probe, (struct sockaddr*)&addr, sizeof(addr)) == 0;
            close(probe);
            if (alive) {
                logger_->error("Another daemon is already listening on {}", path);
                return false;
            }
        }
        unlink(path.c_str());
    }

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        logger_->error("Cannot create {}: {}", fs::path(path).parent_path().string(), ec.message());
        return false;
    }

    socket_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (socket_fd_ < 0) return false;

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(socket_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        logger_->error("Cannot bind {}: {}", path, std::strerror(errno));
        close(socket_fd_);
        socket_fd_ = -1;
        return false;
    }

    // Restrict permissions to owner only
    chmod(path.c_str(), 0600);

    if (listen(socket_fd_, 5) < 0) {
        close(socket_fd_);
        socket_fd_ = -1;
        unlink(path.c_str());
        return false;
    }

    logger_->info("Listening on {}", path);
    return true;
}

void Daemon::ipc_loop() {
    struct pollfd pfd;
    pfd.fd = socket_fd_;
    pfd.events = POLLIN;

    while (!stop_flag_.load()) {
        int ret = poll(&pfd, 1, 500); // 500ms timeout
        if (ret <= 0) continue;

        if (pfd.revents & POLLIN) {
            int client_fd = accept4(socket_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (client_fd < 0) continue;

            // A silent client must not wedge the loop
            struct timeval tv;
            tv.tv_sec = 5;
            tv.tv_usec = 0;
            setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

            // Read a single JSON line
            std::string buffer;
            char c;
            while (read(client_fd, &c, 1) == 1) {
                if (c == '\n') break;
                buffer += c;
                if (buffer.size() > 65536) break; // prevent abuse
            }

            if (!buffer.empty()) {
                std::string response = handle_command(buffer);
                response += "\n";
                ssize_t total = 0;
                while (total < (ssize_t)response.size()) {
                    ssize_t n = send(client_fd, response.data() + total,
                                     response.size() - total, MSG_NOSIGNAL);
                    if (n <= 0) break;
                    total += n;
                }
            }

            close(client_fd);
        }
    }
}

std::string Daemon::handle_command(const std::string& json_line) {
    try {
        auto req = json::parse(json_line);
        std::string cmd = req.value("cmd", "");
        logger_->debug("IPC command: {}", cmd);

        if (cmd == "status") {
            json data = status_to_json(controller_.status());
            data["watchdog"] = watchdog_to_json(supervisor_.status());
            return json({{"ok", true}, {"data", data}}).dump();
        }

        if (cmd == "debug") {
            return json({{"ok", true}, {"data", debug_to_json(controller_.debug_info())}}).dump();
        }

        if (cmd == "health") {
            controller_.is_running();
            auto alerts = sampler_.alerts();
            json alert_list = json::array();
            for (const auto& a : alerts) alert_list.push_back(alert_to_json(a));

            json data;
            data["report"] = health_report_to_json(supervisor_.health_report());
            data["resources"] = health_summary_to_json(sampler_.health(alerts));
            data["alerts"] = alert_list;
            data["trends"] = trend_to_json(sampler_.trend_analysis(std::chrono::minutes(30)));
            data["memory_prediction"] = prediction_to_json(sampler_.memory_prediction(30));
            return json({{"ok", true}, {"data", data}}).dump();
        }

        if (cmd == "start") {
            auto result = supervisor_.start_server();
            if (result.ok) {
                return json({{"ok", true}, {"data", {{"pid", result.pid}}}}).dump();
            }
            return json({{"ok", false}, {"error", result.error}, {"kind", to_string(result.kind)}}).dump();
        }

        if (cmd == "stop") {
            bool force = req.value("force", false);
            int timeout = req.value("timeout", config_.data().server.stop_timeout);
            auto result = supervisor_.stop_server(force, std::chrono::seconds(timeout));
            if (result.ok) {
                return json({{"ok", true}, {"data", {{"forced", result.forced}}}}).dump();
            }
            return json({{"ok", false}, {"error", result.error}}).dump();
        }

        if (cmd == "restart") {
            std::string reason = req.value("reason", "manual");
            if (supervisor_.force_restart(reason)) {
                return json({{"ok", true}}).dump();
            }
            return json({{"ok", false}, {"error", "Restart failed, see daemon log"}}).dump();
        }

        if (cmd == "command") {
            std::string text = req.value("text", "");
            CommandResult result = controller_.send_command(text);
            if (result == CommandResult::Sent) {
                return json({{"ok", true}}).dump();
            }
            return json({{"ok", false}, {"error", to_string(result)}}).dump();
        }

        if (cmd == "console") {
            int lines = req.value("lines", 50);
            if (lines < 0) lines = 0;
            json data = controller_.console_tail(static_cast<size_t>(lines));
            return json({{"ok", true}, {"data", data}}).dump();
        }

        if (cmd == "fix") {
            json data = controller_.fix_common_issues();
            return json({{"ok", true}, {"data", data}}).dump();
        }

        return json({{"ok", false}, {"error", "Unknown command: " + cmd}}).dump();

    } catch (const std::exception& e) {
        return json({{"ok", false}, {"error", std::string("Parse error: ") + e.what()}}).dump();
    }
}

void Daemon::request_stop() {
    stop_flag_.store(true);
}

int Daemon::run() {
    // 1. Start IPC server
    if (!start_ipc_server()) {
        return 1;
    }

    // 2. Start or adopt the server
    if (controller_.is_running()) {
        logger_->info("Server already running (PID {})", controller_.pid().value_or(-1));
    } else if (config_.data().server.autostart) {
        auto result = supervisor_.start_server();
        if (!result.ok) {
            logger_->error("Initial start failed: {}", result.error);
        }
    }

    // 3. Monitoring loop
    supervisor_.start();

    // 4. IPC main loop
    ipc_loop();

    // 5. Cleanup
    supervisor_.stop();
    auto stopped = controller_.stop(false, std::chrono::seconds(config_.data().server.stop_timeout));
    if (!stopped.ok) {
        logger_->error("Server did not stop cleanly: {}", stopped.error);
    }
    cleanup_socket();

    return 0;
}
