#include "daemon/process_controller.hpp"
#include "daemon/proc_table.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

const char* to_string(StartError e) {
    switch (e) {
        case StartError::None: return "none";
        case StartError::AlreadyRunning: return "already_running";
        case StartError::LockUnavailable: return "lock_unavailable";
        case StartError::SpawnFailed: return "spawn_failed";
        case StartError::StartupTimeout: return "startup_timeout";
        case StartError::ExitedDuringStartup: return "exited_during_startup";
    }
    return "unknown";
}

const char* to_string(CommandResult r) {
    switch (r) {
        case CommandResult::Sent: return "sent";
        case CommandResult::Empty: return "empty";
        case CommandResult::NotRunning: return "not_running";
        case CommandResult::NotAttached: return "not_attached";
        case CommandResult::BrokenPipe: return "broken_pipe";
        case CommandResult::IoError: return "io_error";
    }
    return "unknown";
}

const char* to_string(HandleKind k) {
    switch (k) {
        case HandleKind::Direct: return "direct";
        case HandleKind::Adopted: return "adopted";
        default: return "none";
    }
}

ProcessController::ProcessController(ControllerOptions options, CommandBuilder builder,
                                     ResourceSampler& sampler, Logger logger)
    : options_(std::move(options)),
      builder_(std::move(builder)),
      sampler_(sampler),
      logger_(std::move(logger)),
      registry_(options_.server_dir, options_.state_name, logger_),
      lock_(options_.server_dir, options_.state_name, logger_) {}

ProcessController::~ProcessController() {
    std::lock_guard<std::recursive_mutex> lock(lifecycle_mutex_);
    drop_handle();
}

// ── Handle bookkeeping ──────────────────────────────────────

std::optional<pid_t> ProcessController::handle_pid() const {
    if (auto* d = std::get_if<DirectHandle>(&handle_)) return d->pid;
    if (auto* a = std::get_if<AdoptedHandle>(&handle_)) return a->pid;
    return std::nullopt;
}

void ProcessController::reap_direct() {
    auto* d = std::get_if<DirectHandle>(&handle_);
    if (!d || d->exited) return;

    int status = 0;
    pid_t r = waitpid(d->pid, &status, WNOHANG);
    if (r == d->pid) {
        d->exited = true;
        if (WIFEXITED(status)) {
            last_exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            last_exit_code_ = 128 + WTERMSIG(status);
        }
        logger_->info("Server process {} exited (code {})", d->pid, last_exit_code_.value_or(-1));
    } else if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing left to wait for
        d->exited = true;
    }
}

bool ProcessController::direct_alive() {
    reap_direct();
    auto* d = std::get_if<DirectHandle>(&handle_);
    return d && !d->exited && ProcTable::is_alive(d->pid);
}

void ProcessController::drop_handle() {
    if (auto* d = std::get_if<DirectHandle>(&handle_)) {
        if (d->stdin_fd >= 0) {
            close(d->stdin_fd);
            d->stdin_fd = -1;
        }
        if (!d->exited) {
            // Reap if it is already gone so no zombie stays behind
            int status = 0;
            waitpid(d->pid, &status, WNOHANG);
        }
    }
    reader_stop_.store(true);
    if (reader_.joinable()) {
        reader_.join();
    }
    handle_ = std::monostate{};
}

void ProcessController::track(pid_t pid) {
    if (sampler_.attached_pid() != pid) {
        sampler_.attach(pid);
    }
}

void ProcessController::untrack() {
    if (sampler_.attached_pid() > 0) {
        sampler_.detach();
    }
}

void ProcessController::adopt(pid_t pid) {
    drop_handle();
    handle_ = AdoptedHandle{pid};
    registry_.save(pid);
    logger_->warn("Adopted running server process {} (not started by this controller, "
                  "console commands unavailable)", pid);
    track(pid);
}

std::vector<pid_t> ProcessController::find_candidates() const {
    std::vector<pid_t> found;
    if (options_.artifact_name.empty()) return found;

    pid_t self = getpid();
    for (pid_t pid : ProcTable::list_pids()) {
        if (pid == self) continue;

        auto argv = ProcTable::cmdline(pid);
        if (argv.empty()) continue;

        std::string joined;
        for (const auto& a : argv) {
            if (!joined.empty()) joined += ' ';
            joined += a;
        }
        if (joined.find(options_.artifact_name) == std::string::npos) continue;
        if (options_.require_jar_flag && joined.find("-jar") == std::string::npos) continue;

        std::string cwd = ProcTable::cwd(pid);
        if (cwd.empty() || cwd.find(options_.server_dir) == std::string::npos) continue;

        if (!ProcTable::is_alive(pid)) continue;
        found.push_back(pid);
    }
    return found;
}

std::optional<pid_t> ProcessController::resolve() {
    reap_direct();

    // 1. Persisted record
    auto saved = registry_.load();
    if (saved && ProcTable::is_alive(*saved)) {
        auto current = handle_pid();
        if (current != saved) {
            if (direct_alive()) {
                // Our own child is authoritative; the record is out of date
                auto* d = std::get_if<DirectHandle>(&handle_);
                registry_.save(d->pid);
                track(d->pid);
                return d->pid;
            }
            drop_handle();
            handle_ = AdoptedHandle{*saved};
            logger_->info("Tracking server process {} from PID file (not started by this controller)",
                          *saved);
        }
        track(*saved);
        return saved;
    }
    if (saved) {
        logger_->info("Removing stale PID file (process {} is gone)", *saved);
        registry_.clear();
    }

    // 2. Our own child
    if (direct_alive()) {
        pid_t pid = std::get<DirectHandle>(handle_).pid;
        if (saved != pid) registry_.save(pid);
        track(pid);
        return pid;
    }

    if (auto* a = std::get_if<AdoptedHandle>(&handle_)) {
        logger_->info("Adopted server process {} is gone", a->pid);
    }
    if (!std::holds_alternative<std::monostate>(handle_)) {
        drop_handle();
    }

    // 3. Scan the process table
    auto candidates = find_candidates();
    if (!candidates.empty()) {
        if (candidates.size() > 1) {
            logger_->warn("{} processes match {} in {}, adopting the first",
                          candidates.size(), options_.artifact_name, options_.server_dir);
        }
        adopt(candidates.front());
        return candidates.front();
    }

    untrack();
    return std::nullopt;
}

bool ProcessController::is_running() {
    std::lock_guard<std::recursive_mutex> lock(lifecycle_mutex_);
    return resolve().has_value();
}

std::optional<pid_t> ProcessController::pid() {
    std::lock_guard<std::recursive_mutex> lock(lifecycle_mutex_);
    return resolve();
}

bool ProcessController::can_send_commands() {
    std::lock_guard<std::recursive_mutex> lock(lifecycle_mutex_);
    resolve();
    auto* d = std::get_if<DirectHandle>(&handle_);
    return d && d->stdin_fd >= 0 && !d->exited;
}

HandleKind ProcessController::handle_kind() {
    std::lock_guard<std::recursive_mutex> lock(lifecycle_mutex_);
    if (std::holds_alternative<DirectHandle>(handle_)) return HandleKind::Direct;
    if (std::holds_alternative<AdoptedHandle>(handle_)) return HandleKind::Adopted;
    return HandleKind::None;
}

// ── Start ───────────────────────────────────────────────────

StartResult ProcessController::start() {
    std::lock_guard<std::recursive_mutex> lock(lifecycle_mutex_);
    StartResult result;

    if (auto running = resolve()) {
        result.kind = StartError::AlreadyRunning;
        result.error = "Server is already running (PID " + std::to_string(*running) + ")";
        result.pid = *running;
        return result;
    }

    if (!lock_.acquire()) {
        result.kind = StartError::LockUnavailable;
        result.error = "Another instance is managing " + options_.server_dir;
        return result;
    }

    std::vector<std::string> argv = builder_ ? builder_() : std::vector<std::string>{};
    if (argv.empty()) {
        lock_.release();
        result.kind = StartError::SpawnFailed;
        result.error = "Launcher produced an empty command";
        return result;
    }

    int stdin_pair[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, stdin_pair) != 0) {
        lock_.release();
        result.kind = StartError::SpawnFailed;
        result.error = std::string("socketpair failed: ") + std::strerror(errno);
        return result;
    }
    int out_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        close(stdin_pair[0]);
        close(stdin_pair[1]);
        lock_.release();
        result.kind = StartError::SpawnFailed;
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    std::vector<const char*> cargv;
    for (const auto& a : argv) cargv.push_back(a.c_str());
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(stdin_pair[0]);
        close(stdin_pair[1]);
        close(out_pipe[0]);
        close(out_pipe[1]);
        lock_.release();
        result.kind = StartError::SpawnFailed;
        result.error = std::string("fork failed: ") + std::strerror(err);
        return result;
    }

    if (pid == 0) {
        // Child: own process group, console on stdin/stdout/stderr
        setpgid(0, 0);
        if (!options_.server_dir.empty() && chdir(options_.server_dir.c_str()) != 0) {
            _exit(127);
        }
        dup2(stdin_pair[1], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        execvp(cargv[0], const_cast<char* const*>(cargv.data()));
        _exit(127);
    }

    setpgid(pid, pid);
    close(stdin_pair[1]);
    close(out_pipe[1]);

    {
        std::lock_guard<std::mutex> console_lock(console_mutex_);
        console_.clear();
    }
    last_exit_code_.reset();
    handle_ = DirectHandle{pid, stdin_pair[0], false};
    reader_stop_.store(false);
    reader_ = std::thread(&ProcessController::read_output, this, out_pipe[0]);

    logger_->info("Started server process {}: {}", pid, argv.front());
    if (!registry_.save(pid)) {
        logger_->warn("Could not record PID {} right after spawn", pid);
    }

    if (!wait_ready(pid, result)) {
        cleanup_failed_start(pid);
        return result;
    }

    track(pid);
    result.ok = true;
    result.pid = pid;
    logger_->info("Server process {} is ready", pid);
    return result;
}

bool ProcessController::wait_ready(pid_t pid, StartResult& result) {
    auto begin = std::chrono::steady_clock::now();
    auto deadline = begin + options_.startup_timeout;

    while (true) {
        if (!direct_alive()) {
            result.kind = StartError::ExitedDuringStartup;
            result.error = "Server exited during startup";
            if (last_exit_code_) {
                result.error += " (exit code " + std::to_string(*last_exit_code_) + ")";
            }
            return false;
        }

        auto now = std::chrono::steady_clock::now();
        if (readiness_probe) {
            if (readiness_probe(pid)) return true;
        } else if (now - begin >= options_.startup_grace) {
            return true;
        }

        if (now >= deadline) {
            result.kind = StartError::StartupTimeout;
            result.error = "Server did not become ready within " +
                           std::to_string(options_.startup_timeout.count() / 1000) + "s";
            return false;
        }
        std::this_thread::sleep_for(options_.poll_interval);
    }
}

void ProcessController::cleanup_failed_start(pid_t pid) {
    logger_->error("Server failed to start, cleaning up PID {}", pid);
    if (direct_alive()) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        wait_gone(pid, options_.kill_grace);
    }
    reap_direct();
    registry_.clear();
    lock_.release();
    untrack();
    drop_handle();
}

// ── Stop ────────────────────────────────────────────────────

bool ProcessController::wait_gone(pid_t pid, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        reap_direct();
        if (!ProcTable::is_alive(pid)) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(options_.poll_interval);
    }
}

void ProcessController::finish_stop() {
    reap_direct();
    registry_.clear();
    lock_.release();
    untrack();
    drop_handle();
}

StopResult ProcessController::stop(bool force, std::chrono::milliseconds timeout) {
    std::lock_guard<std::recursive_mutex> lock(lifecycle_mutex_);
    StopResult result;

    auto running = resolve();
    if (!running) {
        result.ok = true;
        return result;
    }
    pid_t pid = *running;

    if (!force) {
        auto* d = std::get_if<DirectHandle>(&handle_);
        if (d && d->stdin_fd >= 0) {
            logger_->info("Sending '{}' to server process {}", options_.stop_command, pid);
            CommandResult sent = write_line(options_.stop_command);
            if (sent == CommandResult::Sent) {
                auto deadline = std::chrono::steady_clock::now() + timeout;
                while (std::chrono::steady_clock::now() < deadline && resolve() == pid) {
                    std::this_thread::sleep_for(options_.poll_interval);
                }
                if (resolve() != pid) {
                    finish_stop();
                    result.ok = true;
                    logger_->info("Server stopped gracefully");
                    return result;
                }
                logger_->warn("Server did not stop within {}ms, forcing", timeout.count());
            } else {
                logger_->warn("Could not send stop command ({}), terminating", to_string(sent));
            }
            force = true;
            result.forced = true;
            timeout = options_.term_grace;
        } else {
            logger_->info("Server process {} has no console attached, sending SIGTERM", pid);
        }
    }

    if (force && timeout.count() == 0) {
        logger_->warn("Killing server process {} immediately", pid);
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        result.forced = true;
        wait_gone(pid, options_.kill_grace);
    } else {
        auto grace = force ? std::min(timeout, options_.term_grace) : timeout;
        TreeKillResult tree = terminate_tree(pid, grace);
        if (tree.escalated) result.forced = true;
        for (const auto& f : tree.failed) {
            logger_->warn("Could not kill process {}: {}", f.pid, f.error);
        }
    }

    reap_direct();
    if (ProcTable::is_alive(pid)) {
        result.error = "Server process " + std::to_string(pid) + " did not exit";
        logger_->error("{}", result.error);
        return result;
    }

    finish_stop();
    result.ok = true;
    logger_->info("Server process {} stopped{}", pid, result.forced ? " (forced)" : "");
    return result;
}

bool ProcessController::send_signal(int sig) {
    std::lock_guard<std::recursive_mutex> lock(lifecycle_mutex_);
    auto pid = resolve();
    if (!pid) return false;
    if (kill(*pid, sig) != 0) {
        logger_->warn("Signal {} to {} failed: {}", sig, *pid, std::strerror(errno));
        return false;
    }
    return true;
}

TreeKillResult ProcessController::terminate_tree(pid_t pid, std::chrono::milliseconds timeout) {
    std::lock_guard<std::recursive_mutex> lock(lifecycle_mutex_);
    TreeKillResult result;
    if (pid <= 0 || !ProcTable::exists(pid)) return result;

    // Children first, then the root
    std::vector<pid_t> targets = ProcTable::descendants(pid);
    targets.push_back(pid);

    for (pid_t p : targets) {
        if (kill(p, SIGTERM) != 0 && errno != ESRCH) {
            logger_->debug("SIGTERM to {} failed: {}", p, std::strerror(errno));
        }
    }

    auto all_gone = [&]() {
        reap_direct();
        for (pid_t p : targets) {
            if (ProcTable::is_alive(p)) return false;
        }
        return true;
    };

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!all_gone() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(options_.poll_interval);
    }

    std::vector<pid_t> survivors;
    for (pid_t p : targets) {
        if (!ProcTable::is_alive(p)) {
            result.killed.push_back(p);
            continue;
        }
        if (kill(p, SIGKILL) != 0 && errno != ESRCH) {
            result.failed.push_back({p, std::strerror(errno)});
            continue;
        }
        logger_->warn("Process {} ignored SIGTERM, sent SIGKILL", p);
        result.escalated = true;
        survivors.push_back(p);
    }

    auto kill_deadline = std::chrono::steady_clock::now() + options_.kill_grace;
    while (true) {
        reap_direct();
        bool pending = false;
        for (pid_t p : survivors) {
            if (ProcTable::is_alive(p)) pending = true;
        }
        if (!pending || std::chrono::steady_clock::now() >= kill_deadline) break;
        std::this_thread::sleep_for(options_.poll_interval);
    }
    for (pid_t p : survivors) {
        if (ProcTable::is_alive(p)) {
            result.failed.push_back({p, "Process survived SIGKILL"});
        } else {
            result.killed.push_back(p);
        }
    }

    result.success = result.failed.empty();
    return result;
}

// ── Console ─────────────────────────────────────────────────

CommandResult ProcessController::write_line(const std::string& text) {
    auto* d = std::get_if<DirectHandle>(&handle_);
    if (!d || d->stdin_fd < 0) return CommandResult::NotAttached;

    std::string line = text + "\n";
    size_t off = 0;
    while (off < line.size()) {
        ssize_t n = send(d->stdin_fd, line.data() + off, line.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EPIPE || errno == ECONNRESET) {
                logger_->warn("Server console closed while writing (process likely crashed)");
                return CommandResult::BrokenPipe;
            }
            logger_->error("Writing to server console failed: {}", std::strerror(errno));
            return CommandResult::IoError;
        }
        off += static_cast<size_t>(n);
    }
    return CommandResult::Sent;
}

CommandResult ProcessController::send_command(const std::string& text) {
    bool blank = std::all_of(text.begin(), text.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (blank) return CommandResult::Empty;

    std::lock_guard<std::recursive_mutex> lock(lifecycle_mutex_);
    if (!resolve()) return CommandResult::NotRunning;
    if (!std::holds_alternative<DirectHandle>(handle_)) {
        logger_->warn("Cannot send '{}': server was adopted, its console is not attached", text);
        return CommandResult::NotAttached;
    }
    CommandResult r = write_line(text);
    if (r == CommandResult::Sent) {
        logger_->debug("Sent console command: {}", text);
    }
    return r;
}

void ProcessController::read_output(int fd) {
    std::string partial;
    char buf[4096];

    while (!reader_stop_.load()) {
        struct pollfd pfd{fd, POLLIN, 0};
        int r = poll(&pfd, 1, 200);
        if (r < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (r == 0) continue;

        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (n == 0) break;

        partial.append(buf, static_cast<size_t>(n));
        size_t pos;
        while ((pos = partial.find('\n')) != std::string::npos) {
            std::string line = partial.substr(0, pos);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            push_console_line(std::move(line));
            partial.erase(0, pos + 1);
        }
    }
    if (!partial.empty()) push_console_line(std::move(partial));
    close(fd);
}

void ProcessController::push_console_line(std::string line) {
    logger_->trace("[server] {}", line);
    std::lock_guard<std::mutex> lock(console_mutex_);
    console_.push_back(std::move(line));
    while (console_.size() > options_.console_history) {
        console_.pop_front();
    }
}

std::vector<std::string> ProcessController::console_tail(size_t n) const {
    std::lock_guard<std::mutex> lock(console_mutex_);
    size_t count = std::min(n, console_.size());
    return std::vector<std::string>(console_.end() - static_cast<std::ptrdiff_t>(count), console_.end());
}

// ── Status and diagnostics ──────────────────────────────────

DebugInfo ProcessController::debug_info_locked() {
    DebugInfo info;
    reap_direct();

    info.pid_file_exists = registry_.exists();
    info.saved_pid = registry_.load();
    if (info.saved_pid) {
        pid_t p = *info.saved_pid;
        info.pid_exists = ProcTable::exists(p);
        info.process_running = ProcTable::is_alive(p);
        if (auto st = ProcTable::read_stat(p)) info.process_name = st->comm;
        info.process_cwd = ProcTable::cwd(p);
    }

    if (auto* d = std::get_if<DirectHandle>(&handle_)) {
        info.handle_kind = HandleKind::Direct;
        info.direct_alive = !d->exited && ProcTable::is_alive(d->pid);
        info.has_stdin = d->stdin_fd >= 0;
        info.can_send_commands = info.has_stdin && !d->exited;
    } else if (std::holds_alternative<AdoptedHandle>(handle_)) {
        info.handle_kind = HandleKind::Adopted;
    }
    info.last_exit_code = last_exit_code_;
    info.candidate_pids = find_candidates();
    info.lock_file_exists = lock_.file_exists();
    info.lock_holder_pid = lock_.holder_pid();
    return info;
}

DebugInfo ProcessController::debug_info() {
    std::lock_guard<std::recursive_mutex> lock(lifecycle_mutex_);
    return debug_info_locked();
}

ServerStatus ProcessController::status() {
    std::lock_guard<std::recursive_mutex> lock(lifecycle_mutex_);
    ServerStatus st;

    auto running = resolve();
    st.debug = debug_info_locked();
    if (!running) return st;

    st.running = true;
    st.pid = *running;
    st.adopted = st.debug.handle_kind == HandleKind::Adopted;
    st.can_send_commands = st.debug.can_send_commands;

    auto started = sampler_.process_start();
    if (!started) started = ProcTable::start_time(*running);
    if (started) {
        st.uptime_seconds = std::max(
            0.0, std::chrono::duration<double>(WallClock::now() - *started).count());
    }

    auto cur = sampler_.current();
    if (!cur) cur = sampler_.sample();
    if (cur) {
        st.memory_usage_mb = cur->memory_mb;
        st.memory_percent = cur->memory_percent;
        st.cpu_percent = cur->cpu_percent;
        st.threads = cur->threads;
        st.open_files = cur->open_files;
        st.connections = cur->connections;
    }
    st.averages = sampler_.averages(std::chrono::minutes(5));
    st.peaks = sampler_.peaks(std::chrono::hours(1));
    return st;
}

std::vector<std::string> ProcessController::fix_common_issues() {
    std::lock_guard<std::recursive_mutex> lock(lifecycle_mutex_);
    std::vector<std::string> fixes;

    reap_direct();
    if (auto* d = std::get_if<DirectHandle>(&handle_)) {
        if (d->exited || !ProcTable::is_alive(d->pid)) {
            fixes.push_back("Dropped handle of exited process " + std::to_string(d->pid));
            drop_handle();
        }
    }

    if (registry_.exists()) {
        auto saved = registry_.load();
        if (!saved) {
            fixes.push_back("Cleared corrupt PID file");
        } else if (!ProcTable::is_alive(*saved)) {
            registry_.clear();
            fixes.push_back("Cleared stale PID file (process " + std::to_string(*saved) + " is gone)");
        }
    }

    bool tracked = false;
    if (auto saved = registry_.load()) tracked = ProcTable::is_alive(*saved);
    if (!tracked) tracked = direct_alive();
    if (!tracked) {
        auto candidates = find_candidates();
        if (!candidates.empty()) {
            adopt(candidates.front());
            fixes.push_back("Adopted orphaned server process " + std::to_string(candidates.front()));
            tracked = true;
        }
    }

    if (!tracked && lock_.file_exists() && !lock_.held()) {
        lock_.release();
        if (!lock_.file_exists()) {
            fixes.push_back("Removed stale lock file");
        }
    }

    for (const auto& f : fixes) logger_->info("Fix: {}", f);
    return fixes;
}
