#include "daemon/pid_registry.hpp"
#include "daemon/proc_table.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace fs = std::filesystem;

PidRegistry::PidRegistry(const std::string& dir, const std::string& name, Logger logger)
    : path_(dir + "/" + name + ".pid"), logger_(std::move(logger)) {}

std::optional<pid_t> PidRegistry::parse_pid(const std::string& text) {
    size_t begin = 0, end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    if (begin == end || end - begin > 7) return std::nullopt;

    long value = 0;
    for (size_t i = begin; i < end; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
        value = value * 10 + (text[i] - '0');
    }
    if (value <= 0 || value > kMaxPid) return std::nullopt;
    return static_cast<pid_t>(value);
}

bool PidRegistry::save(pid_t pid) {
    if (pid <= 0 || pid > kMaxPid) {
        logger_->error("Refusing to save invalid PID {}", pid);
        return false;
    }
    if (!ProcTable::exists(pid)) {
        logger_->error("Refusing to save PID {}: no such process", pid);
        return false;
    }

    // Write then rename so readers never see a torn record
    std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            logger_->error("Cannot write PID file {}", tmp);
            return false;
        }
        out << pid;
        if (!out.good()) {
            logger_->error("Failed writing PID file {}", tmp);
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        logger_->error("Cannot move PID file into place: {}", std::strerror(errno));
        unlink(tmp.c_str());
        return false;
    }
    return true;
}

std::optional<pid_t> PidRegistry::load() {
    std::ifstream in(path_);
    if (!in.is_open()) return std::nullopt;

    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();

    auto pid = parse_pid(text);
    if (!pid) {
        logger_->warn("PID file {} is corrupt, clearing it", path_);
        clear();
        return std::nullopt;
    }
    return pid;
}

bool PidRegistry::clear() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        logger_->error("Failed to clear PID file {}: {}", path_, ec.message());
        return false;
    }
    return true;
}

bool PidRegistry::exists() const {
    return access(path_.c_str(), F_OK) == 0;
}
