#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config(std::string path) : path_(std::move(path)) {
    if (path_.empty()) path_ = config_path();
}

Config::~Config() = default;

std::string Config::config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/craft-cpp";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/craft-cpp";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::server_dir() const {
    return expand_home(config_.server.dir);
}

// Size in megabytes for "<n>G" / "<n>M", nullopt when malformed
static std::optional<double> memory_mb(const std::string& value) {
    if (value.size() < 2) return std::nullopt;
    char unit = value.back();
    std::string number = value.substr(0, value.size() - 1);
    size_t used = 0;
    double n = 0.0;
    try {
        n = std::stod(number, &used);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (used != number.size()) return std::nullopt;
    if (unit == 'G' || unit == 'g') return n * 1024.0;
    if (unit == 'M' || unit == 'm') return n;
    return std::nullopt;
}

bool Config::valid_memory(const std::string& value) {
    auto mb = memory_mb(value);
    if (!mb) return false;
    char unit = value.back();
    if (unit == 'G' || unit == 'g') {
        return *mb >= 0.1 * 1024.0 && *mb <= 64.0 * 1024.0;
    }
    return *mb >= 100.0 && *mb <= 65536.0;
}

bool Config::load() {
    if (path_.empty() || !fs::exists(path_)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(path_);

        // Server section
        if (auto s = root["server"]) {
            auto& c = config_.server;
            c.dir = s["dir"].as<std::string>(c.dir);
            c.jar_name = s["jar_name"].as<std::string>(c.jar_name);
            c.java_binary = s["java_binary"].as<std::string>(c.java_binary);
            c.memory_min = s["memory_min"].as<std::string>(c.memory_min);
            c.memory_max = s["memory_max"].as<std::string>(c.memory_max);
            c.java_args = s["java_args"].as<std::string>(c.java_args);
            c.port = s["port"].as<int>(c.port);
            c.stop_command = s["stop_command"].as<std::string>(c.stop_command);
            c.stop_timeout = s["stop_timeout"].as<int>(c.stop_timeout);
            c.startup_timeout = s["startup_timeout"].as<int>(c.startup_timeout);
            c.startup_grace = s["startup_grace"].as<int>(c.startup_grace);
            c.readiness = s["readiness"].as<std::string>(c.readiness);
            c.state_name = s["state_name"].as<std::string>(c.state_name);
            c.autostart = s["autostart"].as<bool>(c.autostart);
        }

        // Watchdog section
        if (auto w = root["watchdog"]) {
            auto& c = config_.watchdog;
            c.enabled = w["enabled"].as<bool>(c.enabled);
            c.interval = w["interval"].as<int>(c.interval);
            c.restart_on_crash = w["restart_on_crash"].as<bool>(c.restart_on_crash);
            c.max_restarts = w["max_restarts"].as<int>(c.max_restarts);
            c.restart_cooldown = w["restart_cooldown"].as<int>(c.restart_cooldown);
            c.max_consecutive_errors = w["max_consecutive_errors"].as<int>(c.max_consecutive_errors);
            c.error_backoff = w["error_backoff"].as<int>(c.error_backoff);
        }

        // Backup section
        if (auto b = root["backup"]) {
            auto& c = config_.backup;
            c.on_restart = b["on_restart"].as<bool>(c.on_restart);
            c.snapshot_command = b["snapshot_command"].as<std::string>(c.snapshot_command);
            c.snapshot_timeout = b["snapshot_timeout"].as<int>(c.snapshot_timeout);
        }

        // Stats section
        if (auto st = root["stats"]) {
            auto& c = config_.stats;
            c.history_size = st["history_size"].as<int>(c.history_size);
            c.memory_percent = st["memory_percent"].as<double>(c.memory_percent);
            c.cpu_percent = st["cpu_percent"].as<double>(c.cpu_percent);
            c.thread_count = st["thread_count"].as<int>(c.thread_count);
            c.connection_spike_multiplier =
                st["connection_spike_multiplier"].as<double>(c.connection_spike_multiplier);
            c.file_descriptor_limit = st["file_descriptor_limit"].as<int>(c.file_descriptor_limit);
        }

        // Logging section
        if (auto l = root["logging"]) {
            auto& c = config_.logging;
            c.level = l["level"].as<std::string>(c.level);
            c.file = l["file"].as<std::string>(c.file);
            c.console_history = l["console_history"].as<int>(c.console_history);
        }

        return true;
    } catch (const YAML::Exception&) {
        // Parse failed, use defaults
        return false;
    }
}

std::vector<std::string> Config::validate() {
    const AppConfig defaults;
    std::vector<std::string> repaired;

    auto clamp_int = [&](const char* key, int& value, int lo, int hi, int fallback) {
        if (value < lo || value > hi) {
            value = fallback;
            repaired.push_back(key);
        }
    };

    auto& s = config_.server;
    clamp_int("server.stop_timeout", s.stop_timeout, 5, 120, defaults.server.stop_timeout);
    clamp_int("server.startup_timeout", s.startup_timeout, 10, 600, defaults.server.startup_timeout);
    clamp_int("server.startup_grace", s.startup_grace, 1, 60, defaults.server.startup_grace);
    clamp_int("server.port", s.port, 1, 65535, defaults.server.port);
    if (!valid_memory(s.memory_min)) {
        s.memory_min = defaults.server.memory_min;
        repaired.push_back("server.memory_min");
    }
    if (!valid_memory(s.memory_max)) {
        s.memory_max = defaults.server.memory_max;
        repaired.push_back("server.memory_max");
    }
    if (*memory_mb(s.memory_min) > *memory_mb(s.memory_max)) {
        s.memory_min = s.memory_max;
        repaired.push_back("server.memory_min");
    }
    if (s.readiness != "port" && s.readiness != "liveness") {
        s.readiness = defaults.server.readiness;
        repaired.push_back("server.readiness");
    }
    if (s.state_name.empty() || s.state_name.find('/') != std::string::npos) {
        s.state_name = defaults.server.state_name;
        repaired.push_back("server.state_name");
    }
    if (s.jar_name.empty()) {
        s.jar_name = defaults.server.jar_name;
        repaired.push_back("server.jar_name");
    }

    auto& w = config_.watchdog;
    clamp_int("watchdog.interval", w.interval, 5, 300, defaults.watchdog.interval);
    clamp_int("watchdog.max_restarts", w.max_restarts, 1, 20, defaults.watchdog.max_restarts);
    clamp_int("watchdog.restart_cooldown", w.restart_cooldown, 60, 3600, defaults.watchdog.restart_cooldown);
    clamp_int("watchdog.max_consecutive_errors", w.max_consecutive_errors, 1, 100,
              defaults.watchdog.max_consecutive_errors);
    clamp_int("watchdog.error_backoff", w.error_backoff, 1, 600, defaults.watchdog.error_backoff);

    clamp_int("backup.snapshot_timeout", config_.backup.snapshot_timeout, 1, 86400,
              defaults.backup.snapshot_timeout);

    auto& st = config_.stats;
    clamp_int("stats.history_size", st.history_size, 10, 1000, defaults.stats.history_size);
    clamp_int("stats.thread_count", st.thread_count, 1, 100000, defaults.stats.thread_count);
    clamp_int("stats.file_descriptor_limit", st.file_descriptor_limit, 1, 1000000,
              defaults.stats.file_descriptor_limit);
    if (st.memory_percent <= 0.0 || st.memory_percent > 100.0) {
        st.memory_percent = defaults.stats.memory_percent;
        repaired.push_back("stats.memory_percent");
    }
    if (st.cpu_percent <= 0.0) {
        st.cpu_percent = defaults.stats.cpu_percent;
        repaired.push_back("stats.cpu_percent");
    }
    if (st.connection_spike_multiplier <= 1.0) {
        st.connection_spike_multiplier = defaults.stats.connection_spike_multiplier;
        repaired.push_back("stats.connection_spike_multiplier");
    }

    clamp_int("logging.console_history", config_.logging.console_history, 100, 10000,
              defaults.logging.console_history);

    return repaired;
}

bool Config::save() {
    if (path_.empty()) return false;

    try {
        fs::path parent = fs::path(path_).parent_path();
        if (!parent.empty()) fs::create_directories(parent);

        YAML::Emitter out;
        out << YAML::BeginMap;

        const auto& s = config_.server;
        out << YAML::Key << "server" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "dir" << YAML::Value << s.dir;
        out << YAML::Key << "jar_name" << YAML::Value << s.jar_name;
        out << YAML::Key << "java_binary" << YAML::Value << s.java_binary;
        out << YAML::Key << "memory_min" << YAML::Value << s.memory_min;
        out << YAML::Key << "memory_max" << YAML::Value << s.memory_max;
        out << YAML::Key << "java_args" << YAML::Value << s.java_args;
        out << YAML::Key << "port" << YAML::Value << s.port;
        out << YAML::Key << "stop_command" << YAML::Value << s.stop_command;
        out << YAML::Key << "stop_timeout" << YAML::Value << s.stop_timeout;
        out << YAML::Key << "startup_timeout" << YAML::Value << s.startup_timeout;
        out << YAML::Key << "startup_grace" << YAML::Value << s.startup_grace;
        out << YAML::Key << "readiness" << YAML::Value << s.readiness;
        out << YAML::Key << "state_name" << YAML::Value << s.state_name;
        out << YAML::Key << "autostart" << YAML::Value << s.autostart;
        out << YAML::EndMap;

        const auto& w = config_.watchdog;
        out << YAML::Key << "watchdog" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << w.enabled;
        out << YAML::Key << "interval" << YAML::Value << w.interval;
        out << YAML::Key << "restart_on_crash" << YAML::Value << w.restart_on_crash;
        out << YAML::Key << "max_restarts" << YAML::Value << w.max_restarts;
        out << YAML::Key << "restart_cooldown" << YAML::Value << w.restart_cooldown;
        out << YAML::Key << "max_consecutive_errors" << YAML::Value << w.max_consecutive_errors;
        out << YAML::Key << "error_backoff" << YAML::Value << w.error_backoff;
        out << YAML::EndMap;

        const auto& b = config_.backup;
        out << YAML::Key << "backup" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "on_restart" << YAML::Value << b.on_restart;
        out << YAML::Key << "snapshot_command" << YAML::Value << b.snapshot_command;
        out << YAML::Key << "snapshot_timeout" << YAML::Value << b.snapshot_timeout;
        out << YAML::EndMap;

        const auto& st = config_.stats;
        out << YAML::Key << "stats" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "history_size" << YAML::Value << st.history_size;
        out << YAML::Key << "memory_percent" << YAML::Value << st.memory_percent;
        out << YAML::Key << "cpu_percent" << YAML::Value << st.cpu_percent;
        out << YAML::Key << "thread_count" << YAML::Value << st.thread_count;
        out << YAML::Key << "connection_spike_multiplier" << YAML::Value << st.connection_spike_multiplier;
        out << YAML::Key << "file_descriptor_limit" << YAML::Value << st.file_descriptor_limit;
        out << YAML::EndMap;

        const auto& l = config_.logging;
        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << l.level;
        out << YAML::Key << "file" << YAML::Value << l.file;
        out << YAML::Key << "console_history" << YAML::Value << l.console_history;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path_);
        if (!fout.is_open()) return false;
        fout << out.c_str();
        return fout.good();
    } catch (const std::exception&) {
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
