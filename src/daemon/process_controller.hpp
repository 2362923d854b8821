#pragma once

#include "core/logger.hpp"
#include "daemon/pid_registry.hpp"
#include "daemon/process_lock.hpp"
#include "daemon/resource_sampler.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>
#include <sys/types.h>

struct ControllerOptions {
    std::string server_dir;                  // absolute, ~ already expanded
    std::string artifact_name = "server.jar";
    bool require_jar_flag = true;            // adoption also needs "-jar" on the command line
    std::string state_name = "craft";        // <server_dir>/<state_name>.pid / .lock
    std::string stop_command = "stop";
    std::chrono::milliseconds startup_timeout{120000};
    std::chrono::milliseconds startup_grace{5000};
    std::chrono::milliseconds term_grace{5000};
    std::chrono::milliseconds kill_grace{5000};
    std::chrono::milliseconds poll_interval{100};
    size_t console_history = 1000;
};

enum class StartError {
    None,
    AlreadyRunning,
    LockUnavailable,
    SpawnFailed,
    StartupTimeout,
    ExitedDuringStartup
};

struct StartResult {
    bool ok = false;
    std::string error;
    StartError kind = StartError::None;
    pid_t pid = -1;
};

struct StopResult {
    bool ok = false;
    std::string error;
    bool forced = false;    // SIGKILL was needed
};

enum class CommandResult { Sent, Empty, NotRunning, NotAttached, BrokenPipe, IoError };

struct TreeKillFailure {
    pid_t pid = -1;
    std::string error;
};

struct TreeKillResult {
    std::vector<pid_t> killed;
    std::vector<TreeKillFailure> failed;
    bool success = true;
    bool escalated = false;     // SIGKILL was sent to at least one process
};

enum class HandleKind { None, Direct, Adopted };

const char* to_string(StartError e);
const char* to_string(CommandResult r);
const char* to_string(HandleKind k);

/// Spawned by this controller; owns the write end of the child's stdin
struct DirectHandle {
    pid_t pid = -1;
    int stdin_fd = -1;
    bool exited = false;
};

/// Found in the process table; no way to write to its input
struct AdoptedHandle {
    pid_t pid = -1;
};

using ProcessHandle = std::variant<std::monostate, DirectHandle, AdoptedHandle>;

/// Registry, handle and adoption internals for troubleshooting
struct DebugInfo {
    std::optional<pid_t> saved_pid;
    bool pid_file_exists = false;
    bool pid_exists = false;
    bool process_running = false;
    std::string process_name;
    std::string process_cwd;
    HandleKind handle_kind = HandleKind::None;
    bool direct_alive = false;
    bool has_stdin = false;
    bool can_send_commands = false;
    std::optional<int> last_exit_code;
    std::vector<pid_t> candidate_pids;
    bool lock_file_exists = false;
    std::optional<pid_t> lock_holder_pid;
};

struct ServerStatus {
    bool running = false;
    bool can_send_commands = false;
    bool adopted = false;
    std::optional<pid_t> pid;
    double uptime_seconds = 0.0;
    double memory_usage_mb = 0.0;
    double memory_percent = 0.0;
    double cpu_percent = 0.0;
    int threads = 0;
    int open_files = 0;
    int connections = 0;
    SampleSummary averages;     // last 5 minutes
    SampleSummary peaks;        // last hour
    DebugInfo debug;
};

/// Lifecycle operations the supervisor drives
class ServerControl {
public:
    virtual ~ServerControl() = default;
    virtual bool is_running() = 0;
    virtual StartResult start() = 0;
    virtual StopResult stop(bool force, std::chrono::milliseconds timeout) = 0;
};

class ProcessController : public ServerControl {
public:
    using CommandBuilder = std::function<std::vector<std::string>()>;

    ProcessController(ControllerOptions options, CommandBuilder builder,
                      ResourceSampler& sampler, Logger logger = null_logger());
    ~ProcessController() override;

    ProcessController(const ProcessController&) = delete;
    ProcessController& operator=(const ProcessController&) = delete;

    /// Registry PID if alive, else our own child, else an adoptable process
    bool is_running() override;

    /// Spawn the server and wait until it is ready; all-or-nothing
    StartResult start() override;

    /// Graceful stop via the stop command or SIGTERM, escalating to SIGKILL.
    /// force with a zero timeout kills immediately.
    StopResult stop(bool force, std::chrono::milliseconds timeout) override;

    bool send_signal(int sig);

    /// Write one line to the server console
    CommandResult send_command(const std::string& text);

    /// SIGTERM pid and its descendants, SIGKILL whatever survives timeout
    TreeKillResult terminate_tree(pid_t pid, std::chrono::milliseconds timeout);

    ServerStatus status();
    DebugInfo debug_info();

    /// Repair stale state; returns one line per fix applied
    std::vector<std::string> fix_common_issues();

    /// Last n lines the server printed
    std::vector<std::string> console_tail(size_t n) const;

    std::optional<pid_t> pid();
    bool can_send_commands();
    HandleKind handle_kind();

    /// Processes matching the artifact name and server directory
    std::vector<pid_t> find_candidates() const;

    /// Polled during start; null means sustained liveness for startup_grace
    std::function<bool(pid_t)> readiness_probe;

private:
    ControllerOptions options_;
    CommandBuilder builder_;
    ResourceSampler& sampler_;
    Logger logger_;
    PidRegistry registry_;
    ProcessLock lock_;

    mutable std::recursive_mutex lifecycle_mutex_;
    ProcessHandle handle_;
    std::optional<int> last_exit_code_;

    // Child stdout/stderr drain
    std::thread reader_;
    std::atomic<bool> reader_stop_{false};
    mutable std::mutex console_mutex_;
    std::deque<std::string> console_;

    std::optional<pid_t> resolve();
    void track(pid_t pid);
    void untrack();
    void reap_direct();
    bool direct_alive();
    std::optional<pid_t> handle_pid() const;
    void drop_handle();
    void adopt(pid_t pid);

    bool wait_ready(pid_t pid, StartResult& result);
    void cleanup_failed_start(pid_t pid);
    bool wait_gone(pid_t pid, std::chrono::milliseconds timeout);
    void finish_stop();

    CommandResult write_line(const std::string& text);
    void read_output(int fd);
    void push_console_line(std::string line);

    DebugInfo debug_info_locked();
};
