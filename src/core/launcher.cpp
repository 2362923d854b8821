#include "core/launcher.hpp"

#include <arpa/inet.h>
#include <cctype>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

std::vector<std::string> split_args(const std::string& text) {
    std::vector<std::string> args;
    std::string current;
    bool in_word = false;
    char quote = 0;

    for (char c : text) {
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else {
                current += c;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
            in_word = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) {
                args.push_back(current);
                current.clear();
                in_word = false;
            }
        } else {
            current += c;
            in_word = true;
        }
    }
    if (in_word) args.push_back(current);
    return args;
}

std::vector<std::string> JavaLauncher::build_command(const AppConfig& config) const {
    const auto& s = config.server;
    std::vector<std::string> argv;
    argv.push_back(s.java_binary);
    argv.push_back("-Xms" + s.memory_min);
    argv.push_back("-Xmx" + s.memory_max);
    for (auto& arg : split_args(s.java_args)) {
        argv.push_back(std::move(arg));
    }
    argv.push_back("-jar");
    argv.push_back(s.jar_name);
    argv.push_back("nogui");
    return argv;
}

bool port_listening(int port) {
    if (port <= 0 || port > 65535) return false;

    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    bool ok = connect(fd, (struct sockaddr*)&addr, sizeof(addr)) == 0;
    close(fd);
    return ok;
}

std::function<bool(pid_t)> make_readiness_probe(const ServerConfig& server) {
    if (server.readiness != "port") return nullptr;
    int port = server.port;
    return [port](pid_t) { return port_listening(port); };
}
