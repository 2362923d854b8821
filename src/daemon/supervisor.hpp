#pragma once

#include "core/logger.hpp"
#include "core/snapshot.hpp"
#include "daemon/process_controller.hpp"
#include "daemon/resource_sampler.hpp"
#include "daemon/restart_policy.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct SupervisorOptions {
    bool enabled = true;
    std::chrono::milliseconds interval{30000};
    bool restart_on_crash = true;
    int max_restarts = 5;
    std::chrono::seconds cooldown{300};
    int max_consecutive_errors = 5;
    std::chrono::milliseconds error_backoff{10000};
    std::chrono::milliseconds max_budget_wait{60000};   // longest sleep while the budget is exhausted
    bool snapshot_on_restart = true;
    std::chrono::milliseconds stop_timeout{10000};      // graceful stop before a manual restart
    std::chrono::milliseconds join_timeout{5000};
};

enum class SupervisorState { Idle, Monitoring, DownDetected, Restarting, Disabled };

const char* to_string(SupervisorState s);

struct RestartRecord {
    WallClock::time_point timestamp;
    int restart_number = 0;
    std::string reason;
};

struct WatchdogStatus {
    bool running = false;
    SupervisorState state = SupervisorState::Idle;
    bool on_hold = false;
    int restart_count = 0;
    int max_restarts = 0;
    int cooldown_seconds = 0;
    std::optional<WallClock::time_point> last_restart;
    bool budget_exhausted = false;
    int budget_remaining_seconds = 0;
    std::vector<RestartRecord> history;     // most recent last, at most 10
    uint64_t checks_performed = 0;
    uint64_t restarts_attempted = 0;
    uint64_t restarts_successful = 0;
    double restart_success_rate = 100.0;
    int consecutive_errors = 0;
    std::vector<HealthAlert> last_alerts;
    double uptime_seconds = 0.0;            // of the monitoring loop
};

struct HealthReport {
    int score = 0;
    std::string rating;
    std::vector<std::string> issues;
    std::vector<std::string> recommendations;
    bool monitoring_enabled = false;
    double restart_success_rate = 100.0;
    double uptime_seconds = 0.0;
};

/// Background monitoring loop with a bounded crash-restart budget
class Supervisor {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr size_t kHistoryLimit = 20;
    static constexpr size_t kHistoryShown = 10;

    Supervisor(ServerControl& control, ResourceSampler& sampler, SnapshotProvider& snapshots,
               SupervisorOptions options, Logger logger = null_logger(), Clock clock = nullptr);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /// Launch the monitoring thread; false if disabled or already running
    bool start();

    /// Cancel the loop and wait up to join_timeout for it to exit.
    /// A loop busy in a start or stop keeps running until that call returns;
    /// the destructor waits for it.
    void stop();

    bool running() const;
    SupervisorState state() const;

    /// One monitoring pass; returns how long to sleep before the next
    std::chrono::milliseconds tick();

    /// Operator restart: snapshot, graceful stop, start. Not counted against the budget.
    bool force_restart(const std::string& reason);

    /// Operator stop; the loop will not restart the server until start_server()
    StopResult stop_server(bool force, std::chrono::milliseconds timeout);

    /// Clears the operator hold and starts the server
    StartResult start_server();

    bool on_hold() const;

    WatchdogStatus status() const;
    HealthReport health_report();

private:
    ServerControl& control_;
    ResourceSampler& sampler_;
    SnapshotProvider& snapshots_;
    SupervisorOptions options_;
    Logger logger_;
    Clock clock_;

    // Guards everything below except the thread plumbing
    mutable std::mutex mutex_;
    RestartPolicy policy_;
    SupervisorState state_ = SupervisorState::Idle;
    std::deque<RestartRecord> history_;
    std::optional<WallClock::time_point> last_restart_wall_;
    uint64_t checks_performed_ = 0;
    uint64_t restarts_attempted_ = 0;
    uint64_t restarts_successful_ = 0;
    int consecutive_errors_ = 0;
    std::vector<HealthAlert> last_alerts_;
    std::optional<std::chrono::steady_clock::time_point> started_at_;
    bool hold_ = false;

    // Serializes start/stop/restart of the server
    std::mutex transition_mutex_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> cancel_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::future<void> finished_;

    void loop(std::promise<void> done);
    std::chrono::milliseconds handle_down();
    void check_health();
    void take_snapshot(const std::string& label);
    void set_state(SupervisorState s);
    void append_history(int number, const std::string& reason);
};
