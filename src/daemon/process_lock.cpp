#include "daemon/process_lock.hpp"
#include "daemon/pid_registry.hpp"
#include "daemon/proc_table.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

ProcessLock::ProcessLock(const std::string& dir, const std::string& name, Logger logger)
    : path_(dir + "/" + name + ".lock"), logger_(std::move(logger)) {
    reclaim_stale();
}

ProcessLock::~ProcessLock() {
    if (held()) {
        release();
    }
}

void ProcessLock::reclaim_stale() {
    if (!file_exists()) return;

    auto pid = holder_pid();
    if (pid && ProcTable::exists(*pid)) return;

    // A file someone still holds is never stale, whatever its body says
    int probe = open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (probe < 0) return;
    if (flock(probe, LOCK_EX | LOCK_NB) != 0) {
        close(probe);
        return;
    }

    int rc = unlink(path_.c_str());
    int err = errno;
    close(probe);

    if (rc == 0) {
        if (pid) {
            logger_->info("Removed stale lock file {} (holder {} is gone)", path_, *pid);
        } else {
            logger_->info("Removed unreadable lock file {}", path_);
        }
    } else if (err != ENOENT) {
        logger_->warn("Could not remove stale lock file {}: {}", path_, std::strerror(err));
    }
}

bool ProcessLock::acquire() {
    if (held()) return true;

    int fd = -1;
    for (int attempt = 0; attempt < 3 && fd < 0; ++attempt) {
        int candidate = open(path_.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0644);
        if (candidate < 0) {
            logger_->error("Cannot open lock file {}: {}", path_, std::strerror(errno));
            return false;
        }

        if (flock(candidate, LOCK_EX | LOCK_NB) != 0) {
            if (errno != EWOULDBLOCK) {
                logger_->error("flock({}) failed: {}", path_, std::strerror(errno));
            }
            close(candidate);
            return false;
        }

        // The file may have been reclaimed between open and flock
        struct stat held_st, path_st;
        if (fstat(candidate, &held_st) == 0 && stat(path_.c_str(), &path_st) == 0 &&
            held_st.st_ino == path_st.st_ino && held_st.st_dev == path_st.st_dev) {
            fd = candidate;
        } else {
            close(candidate);
        }
    }
    if (fd < 0) {
        logger_->error("Lock file {} keeps disappearing", path_);
        return false;
    }

    // Truncate only once we own it so a live holder's PID is never wiped
    std::string pid = std::to_string(getpid());
    if (ftruncate(fd, 0) != 0 ||
        write(fd, pid.data(), pid.size()) != static_cast<ssize_t>(pid.size())) {
        logger_->warn("Could not record PID in lock file {}: {}", path_, std::strerror(errno));
    }
    fsync(fd);

    fd_ = fd;
    logger_->debug("Acquired lock {}", path_);
    return true;
}

void ProcessLock::release() {
    if (fd_ >= 0) {
        // Unlink while still locked: a waiter that then wins the old inode
        // sees it detached from the path and retries on a fresh file
        if (unlink(path_.c_str()) != 0 && errno != ENOENT) {
            logger_->warn("Could not remove lock file {}: {}", path_, std::strerror(errno));
        }
        flock(fd_, LOCK_UN);
        close(fd_);
        fd_ = -1;
        logger_->debug("Released lock {}", path_);
        return;
    }

    // Not ours: only clean up a file nobody holds
    reclaim_stale();
}

std::optional<pid_t> ProcessLock::holder_pid() const {
    std::ifstream in(path_);
    if (!in) return std::nullopt;
    std::string text;
    std::getline(in, text);
    return PidRegistry::parse_pid(text);
}

bool ProcessLock::file_exists() const {
    return access(path_.c_str(), F_OK) == 0;
}
