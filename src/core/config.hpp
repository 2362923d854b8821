#pragma once

#include <string>
#include <vector>

struct ServerConfig {
    std::string dir = "~/minecraft";
    std::string jar_name = "server.jar";
    std::string java_binary = "java";
    std::string memory_min = "2G";
    std::string memory_max = "4G";
    std::string java_args =
        "-XX:+UseG1GC -XX:+ParallelRefProcEnabled -XX:MaxGCPauseMillis=200 "
        "-XX:+UnlockExperimentalVMOptions -XX:+DisableExplicitGC -XX:+AlwaysPreTouch";
    int port = 25565;
    std::string stop_command = "stop";
    int stop_timeout = 10;        // seconds
    int startup_timeout = 120;    // seconds
    int startup_grace = 5;        // seconds of sustained liveness
    std::string readiness = "port";  // "port" or "liveness"
    std::string state_name = "craft";
    bool autostart = true;        // daemon starts the server on boot
};

struct WatchdogConfig {
    bool enabled = true;
    int interval = 30;            // seconds between checks
    bool restart_on_crash = true;
    int max_restarts = 5;
    int restart_cooldown = 300;   // seconds
    int max_consecutive_errors = 5;
    int error_backoff = 10;       // seconds
};

struct BackupConfig {
    bool on_restart = true;
    std::string snapshot_command;  // run through /bin/sh; empty disables
    int snapshot_timeout = 600;    // seconds
};

struct StatsConfig {
    int history_size = 100;
    double memory_percent = 80.0;
    double cpu_percent = 75.0;
    int thread_count = 200;
    double connection_spike_multiplier = 2.0;
    int file_descriptor_limit = 1000;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    int console_history = 1000;   // lines of child output kept in memory
};

struct AppConfig {
    ServerConfig server;
    WatchdogConfig watchdog;
    BackupConfig backup;
    StatsConfig stats;
    LoggingConfig logging;
};

class Config {
public:
    /// Empty path means config_path()
    explicit Config(std::string path = "");
    ~Config();

    /// False when the file is missing or unparsable; defaults are kept
    bool load();
    bool save();

    /// Reset out-of-range values to defaults, returns the repaired keys
    std::vector<std::string> validate();

    AppConfig& data();
    const AppConfig& data() const;

    const std::string& path() const { return path_; }

    /// server.dir with ~ expanded
    std::string server_dir() const;

    static std::string config_dir();
    static std::string config_path();
    static std::string expand_home(const std::string& path);

    /// "<n>G" within 0.1..64 or "<n>M" within 100..65536
    static bool valid_memory(const std::string& value);

private:
    std::string path_;
    AppConfig config_;
};
