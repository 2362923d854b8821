#include "daemon/restart_policy.hpp"

#include <algorithm>

RestartPolicy::RestartPolicy(int max_restarts, std::chrono::seconds cooldown)
    : max_restarts_(std::max(1, max_restarts)), cooldown_(cooldown) {}

bool RestartPolicy::cooled(Clock::time_point now) const {
    return !last_restart_ || now - *last_restart_ >= cooldown_;
}

bool RestartPolicy::exhausted(Clock::time_point now) const {
    return count_ >= max_restarts_ && !cooled(now);
}

RestartPolicy::Verdict RestartPolicy::evaluate(Clock::time_point now) {
    Verdict v;
    if (count_ >= max_restarts_) {
        if (!cooled(now)) {
            v.decision = Decision::BudgetExhausted;
            v.attempt = count_;
            v.remaining = std::chrono::ceil<std::chrono::seconds>(cooldown_ - (now - *last_restart_));
            if (v.remaining.count() < 1) v.remaining = std::chrono::seconds(1);
            return v;
        }
        count_ = 0;
    }
    v.decision = Decision::Restart;
    v.attempt = count_ + 1;
    return v;
}

void RestartPolicy::record_restart(Clock::time_point now) {
    ++count_;
    last_restart_ = now;
}

bool RestartPolicy::note_uptime(Clock::time_point now) {
    if (count_ > 0 && last_restart_ && now - *last_restart_ > cooldown_) {
        count_ = 0;
        return true;
    }
    return false;
}
