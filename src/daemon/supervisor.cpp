#include "daemon/supervisor.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <system_error>

const char* to_string(SupervisorState s) {
    switch (s) {
        case SupervisorState::Idle: return "idle";
        case SupervisorState::Monitoring: return "monitoring";
        case SupervisorState::DownDetected: return "down_detected";
        case SupervisorState::Restarting: return "restarting";
        case SupervisorState::Disabled: return "disabled";
    }
    return "unknown";
}

static std::string percent(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << "%";
    return oss.str();
}

Supervisor::Supervisor(ServerControl& control, ResourceSampler& sampler, SnapshotProvider& snapshots,
                       SupervisorOptions options, Logger logger, Clock clock)
    : control_(control),
      sampler_(sampler),
      snapshots_(snapshots),
      options_(std::move(options)),
      logger_(std::move(logger)),
      clock_(std::move(clock)),
      policy_(options_.max_restarts, options_.cooldown) {
    if (!clock_) clock_ = [] { return std::chrono::steady_clock::now(); };
}

Supervisor::~Supervisor() {
    stop();
    // The loop may still be inside a bounded controller wait
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool Supervisor::start() {
    if (!options_.enabled) {
        logger_->warn("Watchdog is disabled in config");
        return false;
    }
    if (running_.load()) {
        logger_->warn("Watchdog is already running");
        return false;
    }
    if (thread_.joinable()) {
        // Left over from a loop that exited on its own
        thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        started_at_ = clock_();
        consecutive_errors_ = 0;
        state_ = SupervisorState::Monitoring;
    }
    cancel_.store(false);

    std::promise<void> done;
    finished_ = done.get_future();
    try {
        running_.store(true);
        thread_ = std::thread(&Supervisor::loop, this, std::move(done));
    } catch (const std::system_error& e) {
        running_.store(false);
        set_state(SupervisorState::Idle);
        logger_->error("Cannot start watchdog thread: {}", e.what());
        return false;
    }

    logger_->info("Watchdog started (checking every {}s)",
                  std::chrono::duration_cast<std::chrono::seconds>(options_.interval).count());
    return true;
}

void Supervisor::stop() {
    if (!thread_.joinable()) return;

    cancel_.store(true);
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        wait_cv_.notify_all();
    }

    if (finished_.valid() &&
        finished_.wait_for(options_.join_timeout) == std::future_status::ready) {
        thread_.join();
        running_.store(false);
    } else {
        // Still joinable: start() or the destructor joins it once the current pass returns
        logger_->warn("Watchdog thread did not exit within {}ms, it will stop after the current check",
                      options_.join_timeout.count());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SupervisorState::Disabled) state_ = SupervisorState::Idle;
    if (started_at_) {
        auto ran = std::chrono::duration_cast<std::chrono::seconds>(clock_() - *started_at_);
        logger_->info("Watchdog stopped (ran for {}s)", ran.count());
    }
}

bool Supervisor::running() const {
    return running_.load();
}

SupervisorState Supervisor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void Supervisor::set_state(SupervisorState s) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = s;
}

bool Supervisor::on_hold() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hold_;
}

void Supervisor::loop(std::promise<void> done) {
    logger_->debug("Monitoring loop running");

    while (!cancel_.load()) {
        std::chrono::milliseconds next = options_.interval;
        try {
            next = tick();
            std::lock_guard<std::mutex> lock(mutex_);
            consecutive_errors_ = 0;
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++consecutive_errors_;
            logger_->error("Watchdog error ({}/{}): {}", consecutive_errors_,
                           options_.max_consecutive_errors, e.what());
            if (consecutive_errors_ >= options_.max_consecutive_errors) {
                state_ = SupervisorState::Disabled;
                logger_->critical("Watchdog disabled after {} consecutive errors; "
                                  "restart the daemon to resume monitoring", consecutive_errors_);
                break;
            }
            next = options_.error_backoff;
        }

        if (cancel_.load()) break;
        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, next, [this] { return cancel_.load(); });
    }

    running_.store(false);
    done.set_value();
}

std::chrono::milliseconds Supervisor::tick() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++checks_performed_;
    }

    if (control_.is_running()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = SupervisorState::Monitoring;
            int before = policy_.restart_count();
            if (policy_.note_uptime(clock_())) {
                logger_->info("Server stable, reset restart count (was {})", before);
            }
        }
        check_health();
        return options_.interval;
    }

    set_state(SupervisorState::DownDetected);

    if (on_hold()) {
        logger_->debug("Server is down after an operator stop, not restarting");
        return options_.interval;
    }
    if (!options_.restart_on_crash) {
        logger_->warn("Server is down but auto-restart is disabled");
        return options_.interval;
    }
    return handle_down();
}

std::chrono::milliseconds Supervisor::handle_down() {
    std::lock_guard<std::mutex> transition(transition_mutex_);

    // An operator may have acted while we waited for the transition lock
    if (on_hold()) return options_.interval;
    if (control_.is_running()) {
        set_state(SupervisorState::Monitoring);
        return options_.interval;
    }

    RestartPolicy::Verdict verdict;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        verdict = policy_.evaluate(clock_());
    }

    if (verdict.decision == RestartPolicy::Decision::BudgetExhausted) {
        logger_->error("Too many restarts ({}/{}), waiting {}s before trying again",
                       verdict.attempt, options_.max_restarts, verdict.remaining.count());
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(verdict.remaining);
        return std::min(wait, options_.max_budget_wait);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SupervisorState::Restarting;
        ++restarts_attempted_;
    }
    logger_->warn("Server down! Attempting restart #{}/{}", verdict.attempt, options_.max_restarts);

    take_snapshot("pre_restart");

    StartResult result = control_.start();
    if (result.ok) {
        std::lock_guard<std::mutex> lock(mutex_);
        policy_.record_restart(clock_());
        last_restart_wall_ = WallClock::now();
        ++restarts_successful_;
        state_ = SupervisorState::Monitoring;
        history_.push_back({WallClock::now(), policy_.restart_count(), "server_down"});
        while (history_.size() > kHistoryLimit) history_.pop_front();
        logger_->info("Server restarted successfully (attempt #{})", policy_.restart_count());
    } else {
        set_state(SupervisorState::DownDetected);
        logger_->error("Failed to restart server: {}", result.error);
    }
    return options_.interval;
}

void Supervisor::check_health() {
    if (!sampler_.sample()) return;

    std::vector<HealthAlert> alerts = sampler_.alerts();
    for (const auto& a : alerts) {
        switch (a.severity) {
            case AlertSeverity::Critical: logger_->error("{}", a.message); break;
            case AlertSeverity::Warning: logger_->warn("{}", a.message); break;
            case AlertSeverity::Info: logger_->info("{}", a.message); break;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    last_alerts_ = std::move(alerts);
}

void Supervisor::take_snapshot(const std::string& label) {
    if (!options_.snapshot_on_restart) return;
    try {
        if (!snapshots_.create_snapshot(label)) {
            logger_->warn("Snapshot '{}' failed, continuing with restart", label);
        }
    } catch (const std::exception& e) {
        logger_->error("Snapshot '{}' failed: {}", label, e.what());
    }
}

void Supervisor::append_history(int number, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back({WallClock::now(), number, reason});
    while (history_.size() > kHistoryLimit) history_.pop_front();
}

bool Supervisor::force_restart(const std::string& reason) {
    std::lock_guard<std::mutex> transition(transition_mutex_);
    logger_->info("Force restart requested (reason: {})", reason);

    if (control_.is_running()) {
        take_snapshot("manual_restart");
        StopResult stopped = control_.stop(false, options_.stop_timeout);
        if (!stopped.ok) {
            logger_->error("Force restart failed, could not stop server: {}", stopped.error);
            return false;
        }
    } else {
        logger_->warn("Server is not running, starting it");
    }

    StartResult started = control_.start();
    if (!started.ok) {
        logger_->error("Force restart failed: {}", started.error);
        return false;
    }

    int number;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hold_ = false;
        number = policy_.restart_count() + 1;
    }
    append_history(number, reason);
    logger_->info("Force restart completed");
    return true;
}

StopResult Supervisor::stop_server(bool force, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> transition(transition_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hold_ = true;
    }
    return control_.stop(force, timeout);
}

StartResult Supervisor::start_server() {
    std::lock_guard<std::mutex> transition(transition_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hold_ = false;
    }
    return control_.start();
}

WatchdogStatus Supervisor::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    WatchdogStatus st;
    auto now = clock_();

    st.running = running_.load();
    st.state = state_;
    st.on_hold = hold_;
    st.restart_count = policy_.restart_count();
    st.max_restarts = policy_.max_restarts();
    st.cooldown_seconds = static_cast<int>(policy_.cooldown().count());
    st.last_restart = last_restart_wall_;
    st.budget_exhausted = policy_.exhausted(now);
    if (st.budget_exhausted && policy_.last_restart()) {
        st.budget_remaining_seconds = static_cast<int>(
            std::chrono::ceil<std::chrono::seconds>(policy_.cooldown() - (now - *policy_.last_restart()))
                .count());
    }

    size_t shown = std::min(history_.size(), kHistoryShown);
    st.history.assign(history_.end() - static_cast<std::ptrdiff_t>(shown), history_.end());

    st.checks_performed = checks_performed_;
    st.restarts_attempted = restarts_attempted_;
    st.restarts_successful = restarts_successful_;
    if (restarts_attempted_ > 0) {
        st.restart_success_rate =
            static_cast<double>(restarts_successful_) / static_cast<double>(restarts_attempted_) * 100.0;
    }
    st.consecutive_errors = consecutive_errors_;
    st.last_alerts = last_alerts_;
    if (started_at_ && st.running) {
        st.uptime_seconds = std::chrono::duration<double>(now - *started_at_).count();
    }
    return st;
}

HealthReport Supervisor::health_report() {
    WatchdogStatus st = status();
    HealthReport report;
    report.monitoring_enabled = st.running;
    report.restart_success_rate = st.restart_success_rate;
    report.uptime_seconds = st.uptime_seconds;

    int score = 100;
    if (st.restart_count > 3) {
        score -= 20;
        report.issues.push_back("High restart count: " + std::to_string(st.restart_count));
    }

    bool high_memory = false;
    bool high_cpu = false;
    if (!control_.is_running()) {
        score -= 30;
        report.issues.push_back("Server is not running");
    } else if (auto cur = sampler_.current()) {
        if (cur->memory_percent > 90.0) {
            score -= 15;
            high_memory = true;
            report.issues.push_back("High memory usage: " + percent(cur->memory_percent));
        } else if (cur->memory_percent > 80.0) {
            score -= 5;
            report.issues.push_back("Elevated memory usage: " + percent(cur->memory_percent));
        }
        if (cur->cpu_percent > 85.0) {
            score -= 10;
            high_cpu = true;
            report.issues.push_back("High CPU usage: " + percent(cur->cpu_percent));
        }
    }
    if (st.state == SupervisorState::Disabled) {
        report.issues.push_back("Monitoring disabled after repeated errors");
    }

    report.score = std::max(0, score);
    report.rating = health_rating(report.score);

    auto& rec = report.recommendations;
    if (report.score < 50) {
        rec.push_back("Consider reviewing server configuration");
        rec.push_back("Check server logs for errors");
    }
    if (high_memory) {
        rec.push_back("Increase server memory allocation");
        rec.push_back("Check for memory leaks");
    }
    if (high_cpu) {
        rec.push_back("Optimize server performance settings");
        rec.push_back("Consider upgrading hardware");
    }
    if (st.restart_count > 3) {
        rec.push_back("Investigate cause of frequent crashes");
        rec.push_back("Review recent server changes");
    }
    if (rec.empty()) {
        rec.push_back("Server health is good");
        rec.push_back("Continue regular monitoring");
    }
    return report;
}
