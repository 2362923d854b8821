#include "daemon/status_json.hpp"

#include <ctime>

using json = nlohmann::json;

std::string iso_time(WallClock::time_point t) {
    std::time_t tt = WallClock::to_time_t(t);
    std::tm tm{};
    localtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

json summary_to_json(const SampleSummary& s) {
    return {
        {"memory_mb", s.memory_mb},
        {"memory_percent", s.memory_percent},
        {"cpu_percent", s.cpu_percent},
        {"threads", s.threads},
        {"connections", s.connections},
        {"open_files", s.open_files},
        {"sample_count", s.sample_count}
    };
}

json debug_to_json(const DebugInfo& d) {
    json j;
    j["saved_pid"] = d.saved_pid ? json(*d.saved_pid) : json(nullptr);
    j["pid_file_exists"] = d.pid_file_exists;
    j["pid_exists"] = d.pid_exists;
    j["process_running"] = d.process_running;
    j["process_name"] = d.process_name;
    j["process_cwd"] = d.process_cwd;
    j["handle_kind"] = to_string(d.handle_kind);
    j["direct_alive"] = d.direct_alive;
    j["has_stdin"] = d.has_stdin;
    j["can_send_commands"] = d.can_send_commands;
    j["last_exit_code"] = d.last_exit_code ? json(*d.last_exit_code) : json(nullptr);
    j["candidate_pids"] = d.candidate_pids;
    j["lock_file_exists"] = d.lock_file_exists;
    j["lock_holder_pid"] = d.lock_holder_pid ? json(*d.lock_holder_pid) : json(nullptr);
    return j;
}

json status_to_json(const ServerStatus& s) {
    json j;
    j["running"] = s.running;
    j["can_send_commands"] = s.can_send_commands;
    j["adopted"] = s.adopted;
    j["pid"] = s.pid ? json(*s.pid) : json(nullptr);
    j["uptime_seconds"] = s.uptime_seconds;
    j["memory_usage_mb"] = s.memory_usage_mb;
    j["memory_percent"] = s.memory_percent;
    j["cpu_percent"] = s.cpu_percent;
    j["threads"] = s.threads;
    j["open_files"] = s.open_files;
    j["connections"] = s.connections;
    j["averages"] = summary_to_json(s.averages);
    j["peaks"] = summary_to_json(s.peaks);
    j["debug_info"] = debug_to_json(s.debug);
    return j;
}

json alert_to_json(const HealthAlert& a) {
    return {
        {"kind", a.kind},
        {"severity", to_string(a.severity)},
        {"message", a.message},
        {"value", a.value},
        {"threshold", a.threshold},
        {"timestamp", iso_time(a.timestamp)}
    };
}

json health_summary_to_json(const HealthSummary& h) {
    return {
        {"score", h.score},
        {"rating", h.rating},
        {"recommendations", h.recommendations}
    };
}

static json trend_json(const Trend& t) {
    return {
        {"direction", to_string(t.direction)},
        {"change", t.change},
        {"percent_change", t.percent_change},
        {"start", t.start_value},
        {"end", t.end_value}
    };
}

json trend_to_json(const TrendReport& t) {
    json j;
    j["sufficient_data"] = t.sufficient_data;
    j["sample_count"] = t.sample_count;
    if (t.sufficient_data) {
        j["memory"] = trend_json(t.memory);
        j["cpu"] = trend_json(t.cpu);
        j["threads"] = trend_json(t.threads);
        j["timespan_minutes"] = t.timespan_minutes;
    }
    return j;
}

json prediction_to_json(const MemoryPrediction& p) {
    json j;
    j["available"] = p.available;
    if (!p.available) {
        j["reason"] = p.reason;
        return j;
    }
    j["current_percent"] = p.current_percent;
    j["predicted_percent"] = p.predicted_percent;
    j["minutes_ahead"] = p.minutes_ahead;
    j["trend"] = to_string(p.direction);
    j["confidence"] = p.confidence;
    return j;
}

json watchdog_to_json(const WatchdogStatus& w) {
    json history = json::array();
    for (const auto& r : w.history) {
        history.push_back({
            {"timestamp", iso_time(r.timestamp)},
            {"restart_number", r.restart_number},
            {"reason", r.reason}
        });
    }
    json alerts = json::array();
    for (const auto& a : w.last_alerts) alerts.push_back(alert_to_json(a));

    json j;
    j["running"] = w.running;
    j["state"] = to_string(w.state);
    j["on_hold"] = w.on_hold;
    j["restart_count"] = w.restart_count;
    j["max_restarts"] = w.max_restarts;
    j["restart_cooldown"] = w.cooldown_seconds;
    j["last_restart"] = w.last_restart ? json(iso_time(*w.last_restart)) : json(nullptr);
    j["budget_exhausted"] = w.budget_exhausted;
    j["budget_remaining_seconds"] = w.budget_remaining_seconds;
    j["restart_history"] = history;
    j["checks_performed"] = w.checks_performed;
    j["restarts_attempted"] = w.restarts_attempted;
    j["restarts_successful"] = w.restarts_successful;
    j["restart_success_rate"] = w.restart_success_rate;
    j["consecutive_errors"] = w.consecutive_errors;
    j["last_alerts"] = alerts;
    j["uptime_seconds"] = w.uptime_seconds;
    return j;
}

json health_report_to_json(const HealthReport& r) {
    return {
        {"health_score", r.score},
        {"health_status", r.rating},
        {"issues", r.issues},
        {"recommendations", r.recommendations},
        {"monitoring_enabled", r.monitoring_enabled},
        {"restart_success_rate", r.restart_success_rate},
        {"uptime_seconds", r.uptime_seconds}
    };
}
