#pragma once

#include "core/config.hpp"
#include "core/launcher.hpp"
#include "core/logger.hpp"
#include "core/snapshot.hpp"
#include "daemon/process_controller.hpp"
#include "daemon/resource_sampler.hpp"
#include "daemon/supervisor.hpp"

#include <atomic>
#include <memory>
#include <string>

class Daemon {
public:
    explicit Daemon(Config& config, Logger logger = null_logger());
    ~Daemon();

    /// Main loop, blocks until stop is requested
    int run();

    /// Request graceful stop (called from signal handler)
    void request_stop();

    std::string socket_path() const;

private:
    Config& config_;
    Logger logger_;
    JavaLauncher launcher_;
    ResourceSampler sampler_;
    ProcessController controller_;
    std::unique_ptr<SnapshotProvider> snapshots_;
    Supervisor supervisor_;
    std::atomic<bool> stop_flag_{false};
    int socket_fd_ = -1;

    // IPC
    bool start_ipc_server();
    void ipc_loop();
    std::string handle_command(const std::string& json_line);
    void cleanup_socket();

    static std::unique_ptr<SnapshotProvider> make_snapshots(const Config& config, Logger logger);
};
