#pragma once

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

class DaemonClient {
public:
    explicit DaemonClient(std::string socket_path);

    /// Check if the daemon is running (socket exists and responds)
    bool is_daemon_running();

    /// Combined server and watchdog status; empty json on failure
    nlohmann::json status(std::string& err);
    nlohmann::json debug_info(std::string& err);
    nlohmann::json health(std::string& err);

    bool start_server(std::string& err);
    bool stop_server(bool force, int timeout_seconds, std::string& err);
    bool restart_server(const std::string& reason, std::string& err);

    /// err carries the failure kind, e.g. "not_attached"
    bool send_console_command(const std::string& text, std::string& err);

    std::vector<std::string> console(int lines, std::string& err);
    std::vector<std::string> fix(std::string& err);

    /// Send a JSON command and receive response
    /// Returns empty json on connection failure
    nlohmann::json send_command(const nlohmann::json& cmd);

private:
    std::string socket_path_;

    /// data of a successful response, empty json otherwise
    nlohmann::json request(const nlohmann::json& cmd, std::string& err);
};
