#pragma once

#include <chrono>
#include <optional>

/// Crash-restart budget: at most max_restarts attempts per uncooled window
class RestartPolicy {
public:
    using Clock = std::chrono::steady_clock;

    enum class Decision { Restart, BudgetExhausted };

    struct Verdict {
        Decision decision = Decision::Restart;
        int attempt = 0;                          // 1-based number of the attempt being allowed
        std::chrono::seconds remaining{0};        // wait left when exhausted
    };

    RestartPolicy(int max_restarts, std::chrono::seconds cooldown);

    /// Decide whether a restart may happen now. Resets the count once a
    /// full cooldown has passed since the last restart.
    Verdict evaluate(Clock::time_point now);

    void record_restart(Clock::time_point now);

    /// Sustained-uptime amnesty; true when a nonzero count was reset
    bool note_uptime(Clock::time_point now);

    int restart_count() const { return count_; }
    int max_restarts() const { return max_restarts_; }
    std::chrono::seconds cooldown() const { return cooldown_; }
    std::optional<Clock::time_point> last_restart() const { return last_restart_; }

    /// Count has reached the limit and the cooldown is still running
    bool exhausted(Clock::time_point now) const;

private:
    int max_restarts_;
    std::chrono::seconds cooldown_;
    int count_ = 0;
    std::optional<Clock::time_point> last_restart_;

    bool cooled(Clock::time_point now) const;
};
