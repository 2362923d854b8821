#pragma once

#include "core/logger.hpp"

#include <chrono>
#include <string>

/// Takes a backup of the server's data before a restart
class SnapshotProvider {
public:
    virtual ~SnapshotProvider() = default;
    /// Best effort; false on any failure
    virtual bool create_snapshot(const std::string& label) = 0;
};

/// Does nothing and reports success
class NullSnapshot : public SnapshotProvider {
public:
    bool create_snapshot(const std::string&) override { return true; }
};

/// Runs a configured command through /bin/sh in the server directory.
/// The label is passed as $SNAPSHOT_LABEL. A command that outlives the
/// timeout is killed together with its process group.
class CommandSnapshot : public SnapshotProvider {
public:
    CommandSnapshot(std::string command, std::string work_dir,
                    std::chrono::seconds timeout, Logger logger = null_logger());

    bool create_snapshot(const std::string& label) override;

private:
    std::string command_;
    std::string work_dir_;
    std::chrono::seconds timeout_;
    Logger logger_;
};
