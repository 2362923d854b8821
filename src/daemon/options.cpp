#include "daemon/options.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static std::string absolute_dir(const std::string& dir) {
    std::error_code ec;
    fs::path p = fs::weakly_canonical(fs::absolute(dir, ec), ec);
    if (ec) return dir;
    std::string out = p.string();
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

ControllerOptions controller_options(const Config& config) {
    const auto& s = config.data().server;
    ControllerOptions o;
    o.server_dir = absolute_dir(config.server_dir());
    o.artifact_name = s.jar_name;
    o.require_jar_flag = ends_with(s.jar_name, ".jar");
    o.state_name = s.state_name;
    o.stop_command = s.stop_command;
    o.startup_timeout = std::chrono::seconds(s.startup_timeout);
    o.startup_grace = std::chrono::seconds(s.startup_grace);
    o.console_history = static_cast<size_t>(std::max(1, config.data().logging.console_history));
    return o;
}

SamplerOptions sampler_options(const AppConfig& config) {
    SamplerOptions o;
    o.history_size = static_cast<size_t>(std::max(1, config.stats.history_size));
    o.collection_interval = std::chrono::seconds(config.watchdog.interval);
    o.thresholds.memory_percent = config.stats.memory_percent;
    o.thresholds.cpu_percent = config.stats.cpu_percent;
    o.thresholds.thread_count = config.stats.thread_count;
    o.thresholds.connection_spike_multiplier = config.stats.connection_spike_multiplier;
    o.thresholds.file_descriptor_limit = config.stats.file_descriptor_limit;
    return o;
}

SupervisorOptions supervisor_options(const AppConfig& config) {
    const auto& w = config.watchdog;
    SupervisorOptions o;
    o.enabled = w.enabled;
    o.interval = std::chrono::seconds(w.interval);
    o.restart_on_crash = w.restart_on_crash;
    o.max_restarts = w.max_restarts;
    o.cooldown = std::chrono::seconds(w.restart_cooldown);
    o.max_consecutive_errors = w.max_consecutive_errors;
    o.error_backoff = std::chrono::seconds(w.error_backoff);
    o.snapshot_on_restart = config.backup.on_restart;
    o.stop_timeout = std::chrono::seconds(config.server.stop_timeout);
    return o;
}

std::string daemon_socket_path(const Config& config) {
    return absolute_dir(config.server_dir()) + "/" + config.data().server.state_name + ".sock";
}
