#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "daemon/daemon.hpp"

#include <signal.h>

static Daemon* g_daemon = nullptr;

static void signal_handler(int /*sig*/) {
    if (g_daemon) {
        g_daemon->request_stop();
    }
}

static int run_daemon() {
    Config config;
    bool loaded = config.load();
    auto repaired = config.validate();

    const auto& log_cfg = config.data().logging;
    Logger logger = make_logger("craft", log_cfg.level, Config::expand_home(log_cfg.file));

    if (!loaded) {
        logger->warn("No usable config at {}, using defaults", config.path());
    }
    for (const auto& key : repaired) {
        logger->warn("Config value {} out of range, reset to default", key);
    }

    // A client that hangs up mid-response must not kill the daemon
    signal(SIGPIPE, SIG_IGN);

    Daemon daemon(config, logger);
    g_daemon = &daemon;

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    logger->info("Supervising {} in {}", config.data().server.jar_name, config.server_dir());
    int ret = daemon.run();
    g_daemon = nullptr;
    logger->info("Daemon exited");
    logger->flush();
    return ret;
}

int main(int argc, char* argv[]) {
    int cli_result = CLI::run(argc, argv);

    if (cli_result == -2) {
        return run_daemon();
    }
    return cli_result;
}
