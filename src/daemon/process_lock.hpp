#pragma once

#include "core/logger.hpp"

#include <optional>
#include <string>
#include <sys/types.h>

/// Advisory exclusive lock on <dir>/<name>.lock. One holder per directory,
/// across processes and across ProcessLock objects in the same process.
class ProcessLock {
public:
    ProcessLock(const std::string& dir, const std::string& name, Logger logger = null_logger());
    ~ProcessLock();

    ProcessLock(const ProcessLock&) = delete;
    ProcessLock& operator=(const ProcessLock&) = delete;

    /// Non-blocking. Returns false at once if another holder exists.
    /// On success the file holds our PID and stays open until release().
    bool acquire();

    /// Idempotent; safe when never acquired
    void release();

    bool held() const { return fd_ >= 0; }

    /// PID written in the lock file, if any (diagnostic only)
    std::optional<pid_t> holder_pid() const;

    bool file_exists() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    Logger logger_;
    int fd_ = -1;

    /// Remove the lock file if its recorded PID no longer exists
    void reclaim_stale();
};
