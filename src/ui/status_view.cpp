#include "ui/status_view.hpp"

#include <ftxui/screen/screen.hpp>
#include <nlohmann/json.hpp>
#include <iomanip>
#include <sstream>

using namespace ftxui;
using json = nlohmann::json;

namespace {

Element row(const std::string& label, const std::string& value, Color value_color = Color::Default) {
    return hbox({
        text(label) | dim | size(WIDTH, EQUAL, 24),
        text(value) | color(value_color),
    });
}

Element section(const std::string& title, Elements rows) {
    return window(text(" " + title + " ") | bold, vbox(std::move(rows)));
}

std::string yes_no(bool v) {
    return v ? "yes" : "no";
}

std::string pid_text(const json& v) {
    return v.is_number() ? std::to_string(v.get<int>()) : "-";
}

Color severity_color(const std::string& severity) {
    if (severity == "critical") return Color::Red;
    if (severity == "warning") return Color::Yellow;
    return Color::Cyan;
}

Color rating_color(const std::string& rating) {
    if (rating == "excellent" || rating == "good") return Color::Green;
    if (rating == "fair") return Color::Yellow;
    return Color::Red;
}

Elements summary_rows(const json& s) {
    return {
        row("  Memory", StatusView::format_mb(s.value("memory_mb", 0.0)) + " (" +
                            StatusView::format_percent(s.value("memory_percent", 0.0)) + ")"),
        row("  CPU", StatusView::format_percent(s.value("cpu_percent", 0.0))),
        row("  Threads", std::to_string(static_cast<int>(s.value("threads", 0.0)))),
        row("  Samples", std::to_string(s.value("sample_count", 0))),
    };
}

}  // namespace

std::string StatusView::format_duration(double seconds) {
    long total = static_cast<long>(seconds);
    if (total < 0) total = 0;
    long days = total / 86400;
    long hours = (total % 86400) / 3600;
    long minutes = (total % 3600) / 60;
    long secs = total % 60;

    std::ostringstream oss;
    if (days > 0) oss << days << "d ";
    if (days > 0 || hours > 0) oss << hours << "h ";
    if (days > 0 || hours > 0 || minutes > 0) oss << minutes << "m ";
    oss << secs << "s";
    return oss.str();
}

std::string StatusView::format_percent(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << "%";
    return oss.str();
}

std::string StatusView::format_mb(double mb) {
    std::ostringstream oss;
    if (mb >= 1024.0) {
        oss << std::fixed << std::setprecision(2) << mb / 1024.0 << " GB";
    } else {
        oss << std::fixed << std::setprecision(1) << mb << " MB";
    }
    return oss.str();
}

Element StatusView::status(const json& s) {
    bool running = s.value("running", false);
    Elements server;
    server.push_back(row("State", running ? "running" : "stopped",
                         running ? Color::Green : Color::Red));
    if (running) {
        server.push_back(row("PID", pid_text(s.value("pid", json()))));
        server.push_back(row("Uptime", format_duration(s.value("uptime_seconds", 0.0))));
        if (s.value("adopted", false)) {
            server.push_back(row("Handle", "adopted (console not attached)", Color::Yellow));
        } else {
            server.push_back(row("Handle", s.value("can_send_commands", false) ? "direct" : "no console"));
        }
        server.push_back(row("Memory", format_mb(s.value("memory_usage_mb", 0.0)) + " (" +
                                           format_percent(s.value("memory_percent", 0.0)) + ")"));
        server.push_back(row("CPU", format_percent(s.value("cpu_percent", 0.0))));
        server.push_back(row("Threads", std::to_string(s.value("threads", 0))));
        server.push_back(row("Open files", std::to_string(s.value("open_files", 0))));
        server.push_back(row("Connections", std::to_string(s.value("connections", 0))));
    }

    Elements blocks;
    blocks.push_back(section("Server", std::move(server)));

    if (running && s.contains("averages")) {
        Elements stats;
        stats.push_back(text("Averages (5 min)") | bold);
        for (auto& r : summary_rows(s["averages"])) stats.push_back(r);
        stats.push_back(text("Peaks (1 h)") | bold);
        for (auto& r : summary_rows(s["peaks"])) stats.push_back(r);
        blocks.push_back(section("Resources", std::move(stats)));
    }

    if (s.contains("watchdog")) {
        const json& w = s["watchdog"];
        Elements wd;
        std::string state = w.value("state", "idle");
        wd.push_back(row("Monitoring", w.value("running", false) ? "active (" + state + ")" : state,
                         state == "disabled" ? Color::Red : Color::Default));
        if (w.value("on_hold", false)) {
            wd.push_back(row("Auto-restart", "held by operator stop", Color::Yellow));
        }
        wd.push_back(row("Restarts", std::to_string(w.value("restart_count", 0)) + "/" +
                                         std::to_string(w.value("max_restarts", 0))));
        if (w.value("budget_exhausted", false)) {
            wd.push_back(row("Budget", "exhausted, " +
                                           std::to_string(w.value("budget_remaining_seconds", 0)) +
                                           "s cooldown left", Color::Red));
        }
        wd.push_back(row("Checks", std::to_string(w.value("checks_performed", 0))));
        wd.push_back(row("Success rate", format_percent(w.value("restart_success_rate", 100.0))));
        if (w.contains("restart_history") && !w["restart_history"].empty()) {
            wd.push_back(text("Recent restarts") | bold);
            for (const auto& r : w["restart_history"]) {
                wd.push_back(text("  #" + std::to_string(r.value("restart_number", 0)) + "  " +
                                  r.value("timestamp", "") + "  " + r.value("reason", "")));
            }
        }
        blocks.push_back(section("Watchdog", std::move(wd)));
    }

    return vbox(std::move(blocks));
}

Element StatusView::debug(const json& d) {
    Elements rows;
    rows.push_back(row("PID file", d.value("pid_file_exists", false)
                                       ? "present (" + pid_text(d.value("saved_pid", json())) + ")"
                                       : "absent"));
    rows.push_back(row("PID exists", yes_no(d.value("pid_exists", false))));
    rows.push_back(row("Process running", yes_no(d.value("process_running", false))));
    if (!d.value("process_name", "").empty()) {
        rows.push_back(row("Process name", d.value("process_name", "")));
    }
    if (!d.value("process_cwd", "").empty()) {
        rows.push_back(row("Process cwd", d.value("process_cwd", "")));
    }
    rows.push_back(row("Handle", d.value("handle_kind", "none")));
    rows.push_back(row("Direct alive", yes_no(d.value("direct_alive", false))));
    rows.push_back(row("Has stdin", yes_no(d.value("has_stdin", false))));
    rows.push_back(row("Can send commands", yes_no(d.value("can_send_commands", false))));
    if (d.contains("last_exit_code") && d["last_exit_code"].is_number()) {
        rows.push_back(row("Last exit code", std::to_string(d["last_exit_code"].get<int>())));
    }

    std::string candidates;
    if (d.contains("candidate_pids")) {
        for (const auto& p : d["candidate_pids"]) {
            if (!candidates.empty()) candidates += ", ";
            candidates += std::to_string(p.get<int>());
        }
    }
    rows.push_back(row("Candidates", candidates.empty() ? "none" : candidates));
    rows.push_back(row("Lock file", d.value("lock_file_exists", false)
                                        ? "present (holder " + pid_text(d.value("lock_holder_pid", json())) + ")"
                                        : "absent"));
    return section("Debug", std::move(rows));
}

Element StatusView::health(const json& h) {
    Elements blocks;

    if (h.contains("report")) {
        const json& r = h["report"];
        std::string rating = r.value("health_status", "critical");
        Elements rows;
        rows.push_back(row("Score", std::to_string(r.value("health_score", 0)) + "/100 (" + rating + ")",
                           rating_color(rating)));
        for (const auto& issue : r.value("issues", json::array())) {
            rows.push_back(text("  ! " + issue.get<std::string>()) | color(Color::Yellow));
        }
        for (const auto& rec : r.value("recommendations", json::array())) {
            rows.push_back(text("  - " + rec.get<std::string>()));
        }
        blocks.push_back(section("Server health", std::move(rows)));
    }

    if (h.contains("resources")) {
        const json& r = h["resources"];
        std::string rating = r.value("rating", "critical");
        Elements rows;
        rows.push_back(row("Score", std::to_string(r.value("score", 0)) + "/100 (" + rating + ")",
                           rating_color(rating)));
        for (const auto& a : h.value("alerts", json::array())) {
            std::string sev = a.value("severity", "info");
            rows.push_back(text("  [" + sev + "] " + a.value("message", "")) | color(severity_color(sev)));
        }
        for (const auto& rec : r.value("recommendations", json::array())) {
            rows.push_back(text("  - " + rec.get<std::string>()));
        }
        blocks.push_back(section("Resources", std::move(rows)));
    }

    Elements trend_rows;
    if (h.contains("trends") && h["trends"].value("sufficient_data", false)) {
        const json& t = h["trends"];
        for (const char* key : {"memory", "cpu", "threads"}) {
            const json& m = t[key];
            trend_rows.push_back(row(std::string("Trend ") + key,
                                     m.value("direction", "stable") + " (" +
                                         format_percent(m.value("percent_change", 0.0)) + ")"));
        }
    }
    if (h.contains("memory_prediction")) {
        const json& p = h["memory_prediction"];
        if (p.value("available", false)) {
            trend_rows.push_back(row("Memory in " + std::to_string(p.value("minutes_ahead", 30)) + " min",
                                     format_percent(p.value("predicted_percent", 0.0)) + " (" +
                                         p.value("confidence", "low") + " confidence)"));
        } else {
            trend_rows.push_back(row("Memory prediction", p.value("reason", "unavailable")));
        }
    }
    if (!trend_rows.empty()) {
        blocks.push_back(section("Trends", std::move(trend_rows)));
    }

    return vbox(std::move(blocks));
}

std::string StatusView::to_text(const Element& element, int width) {
    Element doc = element;
    auto screen = Screen::Create(Dimension::Fixed(width), Dimension::Fit(doc));
    Render(screen, doc);
    return screen.ToString();
}
