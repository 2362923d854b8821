#include "core/snapshot.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

extern char** environ;

CommandSnapshot::CommandSnapshot(std::string command, std::string work_dir,
                                 std::chrono::seconds timeout, Logger logger)
    : command_(std::move(command)),
      work_dir_(std::move(work_dir)),
      timeout_(timeout),
      logger_(std::move(logger)) {}

bool CommandSnapshot::create_snapshot(const std::string& label) {
    if (command_.empty()) {
        logger_->debug("No snapshot command configured, skipping '{}' snapshot", label);
        return true;
    }

    logger_->info("Creating '{}' snapshot", label);

    // The child may only make async-signal-safe calls, so the
    // environment is assembled here
    const std::string label_var = "SNAPSHOT_LABEL=" + label;
    std::vector<char*> envp;
    for (char** e = environ; e && *e; ++e) {
        if (std::strncmp(*e, "SNAPSHOT_LABEL=", 15) != 0) envp.push_back(*e);
    }
    envp.push_back(const_cast<char*>(label_var.c_str()));
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        logger_->error("Snapshot fork failed: {}", std::strerror(errno));
        return false;
    }

    if (pid == 0) {
        setpgid(0, 0);
        if (!work_dir_.empty() && chdir(work_dir_.c_str()) != 0) {
            _exit(126);
        }
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }
        execle("/bin/sh", "sh", "-c", command_.c_str(), static_cast<char*>(nullptr), envp.data());
        _exit(127);
    }

    setpgid(pid, pid);
    auto deadline = std::chrono::steady_clock::now() + timeout_;
    int status = 0;
    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0 && errno != EINTR) {
            logger_->error("Snapshot wait failed: {}", std::strerror(errno));
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            logger_->error("Snapshot '{}' timed out after {}s, killing it", label, timeout_.count());
            kill(-pid, SIGKILL);
            waitpid(pid, &status, 0);
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        logger_->info("Snapshot '{}' created", label);
        return true;
    }
    int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    logger_->warn("Snapshot '{}' failed (exit code {})", label, code);
    return false;
}
