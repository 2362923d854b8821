#pragma once

#include "core/config.hpp"

#include <functional>
#include <string>
#include <vector>
#include <sys/types.h>

/// Builds the argv used to launch the managed server
class Launcher {
public:
    virtual ~Launcher() = default;
    virtual std::vector<std::string> build_command(const AppConfig& config) const = 0;
};

/// java -Xms.. -Xmx.. <java_args> -jar <jar_name> nogui
class JavaLauncher : public Launcher {
public:
    std::vector<std::string> build_command(const AppConfig& config) const override;
};

/// Split a shell-like argument string; single and double quotes group words
std::vector<std::string> split_args(const std::string& text);

/// True when something accepts TCP connections on 127.0.0.1:port
bool port_listening(int port);

/// Readiness probe for the configured mode; null means plain liveness
std::function<bool(pid_t)> make_readiness_probe(const ServerConfig& server);
