#include "daemon/ipc_client.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cstring>

using json = nlohmann::json;

DaemonClient::DaemonClient(std::string socket_path) : socket_path_(std::move(socket_path)) {}

json DaemonClient::send_command(const json& cmd) {
    if (socket_path_.empty() || access(socket_path_.c_str(), F_OK) != 0) return json();

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return json();

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        return json();
    }

    // Set read timeout; start and stop may wait for the server
    struct timeval tv;
    tv.tv_sec = 180;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    // Send command
    std::string msg = cmd.dump() + "\n";
    ssize_t total = 0;
    while (total < (ssize_t)msg.size()) {
        ssize_t n = send(fd, msg.data() + total, msg.size() - total, MSG_NOSIGNAL);
        if (n <= 0) {
            close(fd);
            return json();
        }
        total += n;
    }

    // Read response
    std::string buffer;
    char buf[4096];
    bool done = false;
    while (!done) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n <= 0) break;
        for (ssize_t i = 0; i < n; ++i) {
            if (buf[i] == '\n') {
                done = true;
                break;
            }
            buffer += buf[i];
        }
        if (buffer.size() > (1 << 22)) break;
    }

    close(fd);

    if (buffer.empty()) return json();

    try {
        return json::parse(buffer);
    } catch (const json::exception&) {
        return json();
    }
}

json DaemonClient::request(const json& cmd, std::string& err) {
    auto resp = send_command(cmd);
    if (resp.empty()) {
        err = "Cannot connect to daemon";
        return json();
    }
    if (!resp.value("ok", false)) {
        err = resp.value("error", "Unknown error");
        return json();
    }
    if (resp.contains("data")) return resp["data"];
    return json::object();
}

bool DaemonClient::is_daemon_running() {
    auto resp = send_command({{"cmd", "debug"}});
    return !resp.empty() && resp.value("ok", false);
}

json DaemonClient::status(std::string& err) {
    return request({{"cmd", "status"}}, err);
}

json DaemonClient::debug_info(std::string& err) {
    return request({{"cmd", "debug"}}, err);
}

json DaemonClient::health(std::string& err) {
    return request({{"cmd", "health"}}, err);
}

bool DaemonClient::start_server(std::string& err) {
    return !request({{"cmd", "start"}}, err).is_null();
}

bool DaemonClient::stop_server(bool force, int timeout_seconds, std::string& err) {
    json cmd = {{"cmd", "stop"}, {"force", force}};
    if (timeout_seconds >= 0) cmd["timeout"] = timeout_seconds;
    return !request(cmd, err).is_null();
}

bool DaemonClient::restart_server(const std::string& reason, std::string& err) {
    return !request({{"cmd", "restart"}, {"reason", reason}}, err).is_null();
}

bool DaemonClient::send_console_command(const std::string& text, std::string& err) {
    return !request({{"cmd", "command"}, {"text", text}}, err).is_null();
}

std::vector<std::string> DaemonClient::console(int lines, std::string& err) {
    std::vector<std::string> out;
    auto data = request({{"cmd", "console"}, {"lines", lines}}, err);
    if (data.is_array()) {
        for (const auto& l : data) out.push_back(l.get<std::string>());
    }
    return out;
}

std::vector<std::string> DaemonClient::fix(std::string& err) {
    std::vector<std::string> out;
    auto data = request({{"cmd", "fix"}}, err);
    if (data.is_array()) {
        for (const auto& l : data) out.push_back(l.get<std::string>());
    }
    return out;
}
