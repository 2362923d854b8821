#pragma once

#include "core/logger.hpp"

#include <optional>
#include <string>
#include <sys/types.h>

/// Persisted PID of the managed process: <dir>/<name>.pid, plain decimal text
class PidRegistry {
public:
    /// Upper bound of Linux pid_max
    static constexpr pid_t kMaxPid = 4194304;

    PidRegistry(const std::string& dir, const std::string& name, Logger logger = null_logger());

    /// Refuses (and writes nothing) unless pid names an existing process
    bool save(pid_t pid);

    /// Malformed or out-of-range content clears the file and returns nullopt
    std::optional<pid_t> load();

    /// Removing an absent file counts as success
    bool clear();

    bool exists() const;

    const std::string& path() const { return path_; }

    /// Strict decimal parse within 1..kMaxPid, surrounding whitespace allowed
    static std::optional<pid_t> parse_pid(const std::string& text);

private:
    std::string path_;
    Logger logger_;
};
