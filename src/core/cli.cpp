#include "core/cli.hpp"
#include "core/config.hpp"
#include "daemon/ipc_client.hpp"
#include "daemon/options.hpp"
#include "daemon/process_controller.hpp"
#include "daemon/resource_sampler.hpp"
#include "daemon/status_json.hpp"
#include "ui/status_view.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

using json = nlohmann::json;

namespace {

Config load_config() {
    Config config;
    config.load();
    config.validate();
    return config;
}

/// Read-only controller for when no daemon is around; never starts anything
struct LocalView {
    Config config;
    ResourceSampler sampler;
    ProcessController controller;

    LocalView()
        : config(load_config()),
          sampler(sampler_options(config.data())),
          controller(controller_options(config),
                     [] { return std::vector<std::string>(); },
                     sampler) {}
};

bool has_flag(int argc, char* argv[], const char* flag) {
    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], flag) == 0) return true;
    }
    return false;
}

}  // namespace

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help();
        return 1;
    }

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "daemon") == 0 || std::strcmp(cmd, "--daemon") == 0) {
        return -2;  // special: caller handles daemon mode
    }
    if (std::strcmp(cmd, "status") == 0) return cmd_status(argc, argv);
    if (std::strcmp(cmd, "debug") == 0) return cmd_debug();
    if (std::strcmp(cmd, "health") == 0) return cmd_health();
    if (std::strcmp(cmd, "fix") == 0) return cmd_fix();
    if (std::strcmp(cmd, "start") == 0) return cmd_start();
    if (std::strcmp(cmd, "stop") == 0) return cmd_stop(argc, argv);
    if (std::strcmp(cmd, "restart") == 0) return cmd_restart(argc, argv);
    if (std::strcmp(cmd, "command") == 0) return cmd_command(argc, argv);
    if (std::strcmp(cmd, "console") == 0) return cmd_console(argc, argv);

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'craft-cpp help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "craft-cpp - supervisor for a Java game server\n"
        "\n"
        "Usage:\n"
        "  craft-cpp daemon              Run the supervisor daemon (foreground)\n"
        "  craft-cpp status [--json]     Server and watchdog status\n"
        "  craft-cpp health              Health score, alerts and trends\n"
        "  craft-cpp debug               PID file, lock and adoption details\n"
        "  craft-cpp fix                 Repair stale PID and lock files\n"
        "  craft-cpp start               Start the server\n"
        "  craft-cpp stop [--force]      Stop the server (holds auto-restart)\n"
        "  craft-cpp restart [reason]    Restart the server\n"
        "  craft-cpp command <text...>   Send a line to the server console\n"
        "  craft-cpp console [lines]     Show recent server output (default 50)\n"
        "  craft-cpp version             Show version\n"
        "  craft-cpp help                Show this help\n"
        "\n"
        "Configuration: " << Config::config_path() << "\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "craft-cpp " << APP_VERSION << "\n";
    return 0;
}

void CLI::print_daemon_hint() {
    std::cerr << "Daemon is not running. Start it with 'craft-cpp daemon'.\n";
}

// ── status / debug / health ─────────────────────────────────

int CLI::cmd_status(int argc, char* argv[]) {
    bool as_json = has_flag(argc, argv, "--json");
    Config config = load_config();
    DaemonClient dc(daemon_socket_path(config));

    json data;
    std::string err;
    if (dc.is_daemon_running()) {
        data = dc.status(err);
        if (data.is_null()) {
            std::cerr << "Error: " << err << "\n";
            return 1;
        }
    } else {
        LocalView local;
        data = status_to_json(local.controller.status());
    }

    if (as_json) {
        std::cout << data.dump(2) << "\n";
        return 0;
    }

    if (!data.contains("watchdog")) {
        std::cout << "Daemon:  stopped\n";
    }
    std::cout << StatusView::to_text(StatusView::status(data)) << "\n";
    return 0;
}

int CLI::cmd_debug() {
    Config config = load_config();
    DaemonClient dc(daemon_socket_path(config));

    json data;
    std::string err;
    if (dc.is_daemon_running()) {
        data = dc.debug_info(err);
        if (data.is_null()) {
            std::cerr << "Error: " << err << "\n";
            return 1;
        }
    } else {
        LocalView local;
        data = debug_to_json(local.controller.debug_info());
    }

    std::cout << StatusView::to_text(StatusView::debug(data)) << "\n";
    return 0;
}

int CLI::cmd_health() {
    Config config = load_config();
    DaemonClient dc(daemon_socket_path(config));
    if (!dc.is_daemon_running()) {
        print_daemon_hint();
        return 1;
    }

    std::string err;
    json data = dc.health(err);
    if (data.is_null()) {
        std::cerr << "Error: " << err << "\n";
        return 1;
    }
    std::cout << StatusView::to_text(StatusView::health(data)) << "\n";
    return 0;
}

// ── fix ─────────────────────────────────────────────────────

int CLI::cmd_fix() {
    Config config = load_config();
    DaemonClient dc(daemon_socket_path(config));

    std::vector<std::string> fixes;
    if (dc.is_daemon_running()) {
        std::string err;
        fixes = dc.fix(err);
        if (!err.empty()) {
            std::cerr << "Error: " << err << "\n";
            return 1;
        }
    } else {
        LocalView local;
        fixes = local.controller.fix_common_issues();
    }

    if (fixes.empty()) {
        std::cout << "Nothing to fix.\n";
    }
    for (const auto& f : fixes) {
        std::cout << "  " << f << "\n";
    }
    return 0;
}

// ── lifecycle ───────────────────────────────────────────────

int CLI::cmd_start() {
    Config config = load_config();
    DaemonClient dc(daemon_socket_path(config));
    if (!dc.is_daemon_running()) {
        print_daemon_hint();
        return 1;
    }

    std::cout << "Starting server...\n";
    std::string err;
    if (!dc.start_server(err)) {
        std::cerr << "Start failed: " << err << "\n";
        return 1;
    }
    std::cout << "Server started.\n";
    return 0;
}

int CLI::cmd_stop(int argc, char* argv[]) {
    bool force = has_flag(argc, argv, "--force");
    Config config = load_config();
    DaemonClient dc(daemon_socket_path(config));
    if (!dc.is_daemon_running()) {
        print_daemon_hint();
        return 1;
    }

    std::cout << (force ? "Force stopping server...\n" : "Stopping server...\n");
    std::string err;
    if (!dc.stop_server(force, -1, err)) {
        std::cerr << "Stop failed: " << err << "\n";
        return 1;
    }
    std::cout << "Server stopped. Auto-restart is held until the next start.\n";
    return 0;
}

int CLI::cmd_restart(int argc, char* argv[]) {
    std::string reason = argc >= 3 ? argv[2] : "manual";
    Config config = load_config();
    DaemonClient dc(daemon_socket_path(config));
    if (!dc.is_daemon_running()) {
        print_daemon_hint();
        return 1;
    }

    std::cout << "Restarting server...\n";
    std::string err;
    if (!dc.restart_server(reason, err)) {
        std::cerr << "Restart failed: " << err << "\n";
        return 1;
    }
    std::cout << "Server restarted.\n";
    return 0;
}

// ── console ─────────────────────────────────────────────────

int CLI::cmd_command(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: craft-cpp command <text...>\n";
        return 1;
    }

    std::string text;
    for (int i = 2; i < argc; ++i) {
        if (!text.empty()) text += ' ';
        text += argv[i];
    }

    Config config = load_config();
    DaemonClient dc(daemon_socket_path(config));
    if (!dc.is_daemon_running()) {
        print_daemon_hint();
        return 1;
    }

    std::string err;
    if (!dc.send_console_command(text, err)) {
        if (err == "not_attached") {
            std::cerr << "The server was adopted from a previous run; its console is not attached.\n"
                         "Restart it through the daemon to regain console access.\n";
        } else {
            std::cerr << "Command failed: " << err << "\n";
        }
        return 1;
    }
    return 0;
}

int CLI::cmd_console(int argc, char* argv[]) {
    int lines = 50;
    if (argc >= 3) {
        char* end = nullptr;
        long n = std::strtol(argv[2], &end, 10);
        if (end == argv[2] || *end != '\0' || n <= 0) {
            std::cerr << "Usage: craft-cpp console [lines]\n";
            return 1;
        }
        lines = static_cast<int>(n);
    }

    Config config = load_config();
    DaemonClient dc(daemon_socket_path(config));
    if (!dc.is_daemon_running()) {
        print_daemon_hint();
        return 1;
    }

    std::string err;
    auto output = dc.console(lines, err);
    if (!err.empty()) {
        std::cerr << "Error: " << err << "\n";
        return 1;
    }
    for (const auto& l : output) {
        std::cout << l << "\n";
    }
    return 0;
}
