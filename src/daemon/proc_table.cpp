#include "daemon/proc_table.hpp"

#include <cerrno>
#include <cctype>
#include <cstring>
#include <dirent.h>
#include <fstream>
#include <iterator>
#include <signal.h>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>
#include <unordered_set>

std::optional<std::string> ProcTable::read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    // /proc files vanish between open and read when the process exits
    if (in.bad()) return std::nullopt;
    return s;
}

bool ProcTable::is_number(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool ProcTable::exists(pid_t pid) {
    if (pid <= 0) return false;
    if (kill(pid, 0) == 0) return true;
    // EPERM: exists but owned by someone else
    return errno == EPERM;
}

bool ProcTable::is_alive(pid_t pid) {
    if (!exists(pid)) return false;
    auto st = read_stat(pid);
    if (!st) {
        // Signal check succeeded but /proc is unreadable (hidepid); trust the signal
        return exists(pid);
    }
    return st->state != 'Z' && st->state != 'X';
}

std::optional<ProcStat> ProcTable::read_stat(pid_t pid) {
    auto txt = read_file("/proc/" + std::to_string(pid) + "/stat");
    if (!txt) return std::nullopt;

    // comm may contain spaces and parentheses; it ends at the last ')'
    auto lp = txt->find('(');
    auto rp = txt->rfind(')');
    if (lp == std::string::npos || rp == std::string::npos || rp < lp || rp + 2 > txt->size()) {
        return std::nullopt;
    }

    ProcStat st;
    st.pid = pid;
    st.comm = txt->substr(lp + 1, rp - lp - 1);

    std::istringstream ss(txt->substr(rp + 2));
    std::string skip;
    ss >> st.state >> st.ppid;
    // pgrp session tty_nr tpgid flags minflt cminflt majflt cmajflt
    for (int i = 0; i < 9; ++i) ss >> skip;
    ss >> st.utime >> st.stime;
    // cutime cstime priority nice
    for (int i = 0; i < 4; ++i) ss >> skip;
    ss >> st.num_threads;
    ss >> skip;  // itrealvalue
    ss >> st.start_ticks;
    ss >> skip;  // vsize
    ss >> st.rss_pages;
    if (ss.fail()) return std::nullopt;
    return st;
}

std::vector<std::string> ProcTable::cmdline(pid_t pid) {
    std::vector<std::string> args;
    auto txt = read_file("/proc/" + std::to_string(pid) + "/cmdline");
    if (!txt) return args;

    std::string cur;
    for (char c : *txt) {
        if (c == '\0') {
            args.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) args.push_back(cur);
    return args;
}

std::string ProcTable::cmdline_string(pid_t pid) {
    std::string out;
    for (const auto& a : cmdline(pid)) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

std::string ProcTable::cwd(pid_t pid) {
    char buf[4096];
    std::string link = "/proc/" + std::to_string(pid) + "/cwd";
    ssize_t n = readlink(link.c_str(), buf, sizeof(buf) - 1);
    if (n <= 0) return "";
    buf[n] = '\0';
    return std::string(buf);
}

std::vector<pid_t> ProcTable::list_pids() {
    std::vector<pid_t> out;
    DIR* d = opendir("/proc");
    if (!d) return out;
    while (auto* ent = readdir(d)) {
        if (is_number(ent->d_name)) {
            out.push_back(static_cast<pid_t>(std::stol(ent->d_name)));
        }
    }
    closedir(d);
    return out;
}

std::vector<pid_t> ProcTable::descendants(pid_t pid) {
    std::vector<std::pair<pid_t, pid_t>> links;  // (pid, ppid)
    for (pid_t p : list_pids()) {
        auto st = read_stat(p);
        if (st) links.emplace_back(p, st->ppid);
    }

    std::vector<pid_t> out;
    std::vector<pid_t> frontier = {pid};
    while (!frontier.empty()) {
        std::vector<pid_t> next;
        for (pid_t parent : frontier) {
            for (const auto& [child, ppid] : links) {
                if (ppid == parent) {
                    out.push_back(child);
                    next.push_back(child);
                }
            }
        }
        frontier = std::move(next);
    }
    return out;
}

int ProcTable::count_open_files(pid_t pid) {
    std::string dir = "/proc/" + std::to_string(pid) + "/fd";
    DIR* d = opendir(dir.c_str());
    if (!d) return -1;

    int count = 0;
    char buf[4096];
    while (auto* ent = readdir(d)) {
        if (!is_number(ent->d_name)) continue;
        std::string link = dir + "/" + ent->d_name;
        ssize_t n = readlink(link.c_str(), buf, sizeof(buf) - 1);
        if (n <= 0) continue;
        buf[n] = '\0';
        if (buf[0] != '/' || std::strncmp(buf, "/dev/", 5) == 0) continue;
        struct stat sb;
        if (stat(link.c_str(), &sb) == 0 && S_ISREG(sb.st_mode)) ++count;
    }
    closedir(d);
    return count;
}

int ProcTable::count_connections(pid_t pid) {
    std::string dir = "/proc/" + std::to_string(pid) + "/fd";
    DIR* d = opendir(dir.c_str());
    if (!d) return -1;

    std::unordered_set<std::string> sockets;
    char buf[256];
    while (auto* ent = readdir(d)) {
        if (!is_number(ent->d_name)) continue;
        std::string link = dir + "/" + ent->d_name;
        ssize_t n = readlink(link.c_str(), buf, sizeof(buf) - 1);
        if (n <= 0) continue;
        buf[n] = '\0';
        // "socket:[12345]"
        if (std::strncmp(buf, "socket:[", 8) == 0) {
            std::string inode(buf + 8);
            if (!inode.empty() && inode.back() == ']') inode.pop_back();
            sockets.insert(inode);
        }
    }
    closedir(d);
    if (sockets.empty()) return 0;

    int count = 0;
    const char* tables[] = {"tcp", "tcp6", "udp", "udp6"};
    for (const char* table : tables) {
        auto txt = read_file("/proc/" + std::to_string(pid) + "/net/" + table);
        if (!txt) continue;
        std::istringstream ss(*txt);
        std::string line;
        std::getline(ss, line);  // header
        while (std::getline(ss, line)) {
            std::istringstream ls(line);
            std::string field;
            // sl local rem st tx:rx tr:when retrnsmt uid timeout inode
            for (int i = 0; i < 10 && (ls >> field); ++i) {}
            if (sockets.count(field)) ++count;
        }
    }
    return count;
}

uint64_t ProcTable::total_memory_kb() {
    auto txt = read_file("/proc/meminfo");
    if (!txt) return 0;
    std::istringstream ss(*txt);
    std::string line;
    while (std::getline(ss, line)) {
        if (line.rfind("MemTotal:", 0) == 0) {
            std::istringstream ls(line.substr(9));
            uint64_t kb = 0;
            ls >> kb;
            return kb;
        }
    }
    return 0;
}

uint64_t ProcTable::boot_time() {
    auto txt = read_file("/proc/stat");
    if (!txt) return 0;
    std::istringstream ss(*txt);
    std::string line;
    while (std::getline(ss, line)) {
        if (line.rfind("btime ", 0) == 0) {
            return std::stoull(line.substr(6));
        }
    }
    return 0;
}

std::optional<std::chrono::system_clock::time_point> ProcTable::start_time(pid_t pid) {
    auto st = read_stat(pid);
    uint64_t btime = boot_time();
    if (!st || btime == 0) return std::nullopt;
    auto since_boot = std::chrono::milliseconds(st->start_ticks * 1000 / clock_ticks());
    return std::chrono::system_clock::from_time_t(static_cast<time_t>(btime)) + since_boot;
}

long ProcTable::clock_ticks() {
    static const long ticks = [] {
        long t = sysconf(_SC_CLK_TCK);
        return t > 0 ? t : 100;
    }();
    return ticks;
}

long ProcTable::page_size() {
    static const long size = [] {
        long s = sysconf(_SC_PAGESIZE);
        return s > 0 ? s : 4096;
    }();
    return size;
}
