#pragma once

#include <string>

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or -2 for the daemon subcommand (caller runs it).
    static int run(int argc, char* argv[]);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_status(int argc, char* argv[]);
    static int cmd_debug();
    static int cmd_health();
    static int cmd_fix();
    static int cmd_start();
    static int cmd_stop(int argc, char* argv[]);
    static int cmd_restart(int argc, char* argv[]);
    static int cmd_command(int argc, char* argv[]);
    static int cmd_console(int argc, char* argv[]);

    static void print_daemon_hint();
};
