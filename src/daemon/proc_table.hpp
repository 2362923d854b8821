#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

/// Fields of /proc/<pid>/stat used by the controller and sampler
struct ProcStat {
    pid_t pid = -1;
    std::string comm;
    char state = '?';
    pid_t ppid = 0;
    uint64_t utime = 0;        // clock ticks
    uint64_t stime = 0;        // clock ticks
    long num_threads = 0;
    uint64_t start_ticks = 0;  // ticks after boot
    int64_t rss_pages = 0;
};

/// Read-only view of the OS process table (Linux /proc)
class ProcTable {
public:
    /// True if a process with this PID exists (zombies included)
    static bool exists(pid_t pid);

    /// True if the process exists and is not a zombie
    static bool is_alive(pid_t pid);

    static std::optional<ProcStat> read_stat(pid_t pid);

    /// argv of the process; empty for kernel threads or on access denied
    static std::vector<std::string> cmdline(pid_t pid);

    /// argv joined with single spaces
    static std::string cmdline_string(pid_t pid);

    /// Working directory, empty if unreadable
    static std::string cwd(pid_t pid);

    static std::vector<pid_t> list_pids();

    /// All descendants of pid, children before grandchildren
    static std::vector<pid_t> descendants(pid_t pid);

    /// Number of open regular files, or -1 if the fd table is unreadable
    static int count_open_files(pid_t pid);

    /// Number of inet sockets (tcp/udp, v4/v6), or -1 if unreadable
    static int count_connections(pid_t pid);

    /// MemTotal from /proc/meminfo in kB (0 if unreadable)
    static uint64_t total_memory_kb();

    /// Wall-clock start time of the process
    static std::optional<std::chrono::system_clock::time_point> start_time(pid_t pid);

    static long clock_ticks();
    static long page_size();

private:
    static std::optional<std::string> read_file(const std::string& path);
    static bool is_number(const std::string& s);
    static uint64_t boot_time();
};
