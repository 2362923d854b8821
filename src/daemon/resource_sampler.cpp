#include "daemon/resource_sampler.hpp"
#include "daemon/proc_table.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <thread>

// ── /proc reader ────────────────────────────────────────────

bool ProcMetricsReader::alive(pid_t pid) {
    return ProcTable::is_alive(pid);
}

std::optional<ProcessMetrics> ProcMetricsReader::read(pid_t pid) {
    auto st = ProcTable::read_stat(pid);
    if (!st || st->state == 'Z' || st->state == 'X') return std::nullopt;

    ProcessMetrics m;
    double rss_bytes = static_cast<double>(st->rss_pages) * ProcTable::page_size();
    m.rss_mb = rss_bytes / (1024.0 * 1024.0);
    uint64_t total_kb = ProcTable::total_memory_kb();
    if (total_kb > 0) {
        m.memory_percent = rss_bytes / (static_cast<double>(total_kb) * 1024.0) * 100.0;
    }
    m.cpu_seconds = static_cast<double>(st->utime + st->stime) / ProcTable::clock_ticks();
    m.threads = static_cast<int>(st->num_threads);
    m.open_files = std::max(0, ProcTable::count_open_files(pid));
    m.connections = std::max(0, ProcTable::count_connections(pid));
    return m;
}

std::optional<WallClock::time_point> ProcMetricsReader::start_time(pid_t pid) {
    return ProcTable::start_time(pid);
}

// ── helpers ─────────────────────────────────────────────────

const char* to_string(TrendDirection d) {
    switch (d) {
        case TrendDirection::Increasing: return "increasing";
        case TrendDirection::Decreasing: return "decreasing";
        default: return "stable";
    }
}

const char* to_string(AlertSeverity s) {
    switch (s) {
        case AlertSeverity::Critical: return "critical";
        case AlertSeverity::Warning: return "warning";
        default: return "info";
    }
}

std::string health_rating(int score) {
    if (score >= 90) return "excellent";
    if (score >= 75) return "good";
    if (score >= 50) return "fair";
    if (score >= 25) return "poor";
    return "critical";
}

static std::string format_value(const char* label, double value, const char* unit = "%") {
    std::ostringstream oss;
    oss << label << ": " << std::fixed << std::setprecision(1) << value << unit;
    return oss.str();
}

// ── ResourceSampler ─────────────────────────────────────────

ResourceSampler::ResourceSampler(SamplerOptions options, Logger logger,
                                 std::unique_ptr<MetricsReader> reader, Clock clock)
    : options_(std::move(options)),
      logger_(std::move(logger)),
      reader_(std::move(reader)),
      clock_(std::move(clock)) {
    options_.history_size = std::clamp<size_t>(options_.history_size, 1, kMaxHistory);
    if (!reader_) reader_ = std::make_unique<ProcMetricsReader>();
    if (!clock_) clock_ = [] { return WallClock::now(); };
}

bool ResourceSampler::attach(pid_t pid) {
    if (pid <= 0 || !reader_->alive(pid)) {
        logger_->warn("Cannot monitor process {}: not running or not accessible", pid);
        return false;
    }
    auto started = reader_->start_time(pid);

    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked();
    pid_ = pid;
    process_start_ = started;
    ++generation_;
    logger_->debug("Sampler attached to PID {}", pid);
    return true;
}

void ResourceSampler::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ > 0) {
        logger_->debug("Sampler detached from PID {}", pid_);
    }
    reset_locked();
    pid_ = -1;
    ++generation_;
}

pid_t ResourceSampler::attached_pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

void ResourceSampler::reset_locked() {
    history_.clear();
    alert_history_.clear();
    peaks_ = PeakTracker{};
    last_cpu_seconds_.reset();
    last_cpu_read_.reset();
    last_sample_at_.reset();
    process_start_.reset();
}

std::optional<SampleRecord> ResourceSampler::sample() {
    pid_t pid;
    uint64_t generation;
    bool accurate;
    std::optional<double> base_cpu;
    std::optional<std::chrono::steady_clock::time_point> base_at;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pid_ <= 0) return std::nullopt;
        pid = pid_;
        generation = generation_;
        base_cpu = last_cpu_seconds_;
        base_at = last_cpu_read_;
        // The incremental read is only meaningful against a fresh baseline
        accurate = !base_cpu || !base_at || !last_sample_at_ ||
                   clock_() - *last_sample_at_ > options_.collection_interval;
    }

    auto vanished = [&]() -> std::optional<SampleRecord> {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation == generation_) {
            logger_->warn("Monitored process {} is gone or not accessible", pid);
            reset_locked();
            pid_ = -1;
            ++generation_;
        }
        return std::nullopt;
    };

    auto metrics = reader_->read(pid);
    if (!metrics) return vanished();
    auto read_at = std::chrono::steady_clock::now();

    double cpu_percent = 0.0;
    if (accurate) {
        double first_cpu = metrics->cpu_seconds;
        if (options_.cpu_sample_interval.count() > 0) {
            std::this_thread::sleep_for(options_.cpu_sample_interval);
        }
        metrics = reader_->read(pid);
        if (!metrics) return vanished();
        auto second_at = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(second_at - read_at).count();
        if (elapsed > 0.0) {
            cpu_percent = (metrics->cpu_seconds - first_cpu) / elapsed * 100.0;
        }
        read_at = second_at;
    } else {
        double elapsed = std::chrono::duration<double>(read_at - *base_at).count();
        if (elapsed > 0.0) {
            cpu_percent = (metrics->cpu_seconds - *base_cpu) / elapsed * 100.0;
        }
    }

    SampleRecord rec;
    rec.timestamp = clock_();
    rec.memory_mb = metrics->rss_mb;
    rec.memory_percent = metrics->memory_percent;
    rec.cpu_percent = std::max(0.0, cpu_percent);
    rec.threads = metrics->threads;
    rec.open_files = metrics->open_files;
    rec.connections = metrics->connections;

    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_) {
        // Detached or re-attached while we were reading
        return std::nullopt;
    }
    last_cpu_seconds_ = metrics->cpu_seconds;
    last_cpu_read_ = read_at;
    record_locked(rec);
    return rec;
}

void ResourceSampler::record(const SampleRecord& sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_locked(sample);
}

void ResourceSampler::record_locked(const SampleRecord& sample) {
    history_.push_back(sample);
    while (history_.size() > options_.history_size) {
        history_.pop_front();
    }
    peaks_.memory_mb = std::max(peaks_.memory_mb, sample.memory_mb);
    peaks_.cpu_percent = std::max(peaks_.cpu_percent, sample.cpu_percent);
    peaks_.threads = std::max(peaks_.threads, sample.threads);
    last_sample_at_ = sample.timestamp;
}

std::optional<SampleRecord> ResourceSampler::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (history_.empty()) return std::nullopt;
    return history_.back();
}

std::vector<SampleRecord> ResourceSampler::window_locked(std::chrono::seconds window) const {
    auto cutoff = clock_() - window;
    std::vector<SampleRecord> out;
    for (const auto& s : history_) {
        if (s.timestamp > cutoff) out.push_back(s);
    }
    return out;
}

SampleSummary ResourceSampler::averages_locked(std::chrono::seconds window) const {
    SampleSummary sum;
    if (history_.empty()) return sum;

    auto samples = window_locked(window);
    if (samples.empty()) samples.push_back(history_.back());

    for (const auto& s : samples) {
        sum.memory_mb += s.memory_mb;
        sum.memory_percent += s.memory_percent;
        sum.cpu_percent += s.cpu_percent;
        sum.threads += s.threads;
        sum.connections += s.connections;
        sum.open_files += s.open_files;
    }
    double n = static_cast<double>(samples.size());
    sum.memory_mb /= n;
    sum.memory_percent /= n;
    sum.cpu_percent /= n;
    sum.threads /= n;
    sum.connections /= n;
    sum.open_files /= n;
    sum.sample_count = samples.size();
    return sum;
}

SampleSummary ResourceSampler::averages(std::chrono::seconds window) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return averages_locked(window);
}

SampleSummary ResourceSampler::peaks(std::chrono::seconds window) const {
    std::lock_guard<std::mutex> lock(mutex_);
    SampleSummary peak;
    if (history_.empty()) return peak;

    auto samples = window_locked(window);
    if (samples.empty()) samples.push_back(history_.back());

    for (const auto& s : samples) {
        peak.memory_mb = std::max(peak.memory_mb, s.memory_mb);
        peak.memory_percent = std::max(peak.memory_percent, s.memory_percent);
        peak.cpu_percent = std::max(peak.cpu_percent, s.cpu_percent);
        peak.threads = std::max(peak.threads, static_cast<double>(s.threads));
        peak.connections = std::max(peak.connections, static_cast<double>(s.connections));
        peak.open_files = std::max(peak.open_files, static_cast<double>(s.open_files));
    }
    peak.sample_count = samples.size();
    return peak;
}

std::vector<SampleRecord> ResourceSampler::history(std::chrono::seconds window) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return window_locked(window);
}

std::vector<SampleRecord> ResourceSampler::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<SampleRecord>(history_.begin(), history_.end());
}

PeakTracker ResourceSampler::peak_tracker() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peaks_;
}

Trend ResourceSampler::compute_trend(const std::vector<double>& values) {
    Trend t;
    if (values.size() < 2) return t;

    t.start_value = values.front();
    t.end_value = values.back();
    t.change = t.end_value - t.start_value;
    t.percent_change = t.start_value > 0.0 ? t.change / t.start_value * 100.0 : 0.0;

    if (std::fabs(t.percent_change) < 5.0) {
        t.direction = TrendDirection::Stable;
    } else if (t.percent_change > 0.0) {
        t.direction = TrendDirection::Increasing;
    } else {
        t.direction = TrendDirection::Decreasing;
    }
    return t;
}

TrendReport ResourceSampler::trend_analysis(std::chrono::seconds window) const {
    std::vector<SampleRecord> samples = history(window);
    TrendReport report;
    report.sample_count = samples.size();
    if (samples.size() < 2) return report;

    std::vector<double> mem, cpu, threads;
    for (const auto& s : samples) {
        mem.push_back(s.memory_percent);
        cpu.push_back(s.cpu_percent);
        threads.push_back(s.threads);
    }
    report.sufficient_data = true;
    report.memory = compute_trend(mem);
    report.cpu = compute_trend(cpu);
    report.threads = compute_trend(threads);
    report.timespan_minutes =
        std::chrono::duration<double>(samples.back().timestamp - samples.front().timestamp).count() / 60.0;
    return report;
}

MemoryPrediction ResourceSampler::memory_prediction(int minutes_ahead) const {
    std::vector<SampleRecord> samples = history(std::chrono::minutes(60));
    MemoryPrediction p;
    p.minutes_ahead = minutes_ahead;
    if (samples.size() < 5) {
        p.reason = "Insufficient historical data";
        return p;
    }

    std::vector<double> mem;
    for (const auto& s : samples) mem.push_back(s.memory_percent);
    Trend trend = compute_trend(mem);

    p.available = true;
    p.current_percent = mem.back();
    p.direction = trend.direction;
    if (trend.direction == TrendDirection::Stable) {
        p.predicted_percent = p.current_percent;
    } else {
        // Per-sample rate, not per-minute; good enough for a heuristic
        double rate = trend.change / static_cast<double>(samples.size());
        p.predicted_percent = p.current_percent + rate * minutes_ahead;
    }
    p.predicted_percent = std::clamp(p.predicted_percent, 0.0, 100.0);
    p.confidence = samples.size() < 10 ? "low" : "medium";
    return p;
}

std::vector<HealthAlert> ResourceSampler::alerts() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<HealthAlert> out;
    if (pid_ <= 0 || history_.empty()) return out;

    const SampleRecord& cur = history_.back();
    const AlertThresholds& th = options_.thresholds;
    auto now = clock_();

    auto add = [&](const char* kind, AlertSeverity sev, std::string msg, double value, double threshold) {
        out.push_back(HealthAlert{kind, sev, std::move(msg), value, threshold, now});
    };

    if (cur.memory_percent > 95.0) {
        add("memory_critical", AlertSeverity::Critical,
            format_value("Critical memory usage", cur.memory_percent), cur.memory_percent, 95.0);
    } else if (cur.memory_percent > th.memory_percent) {
        add("memory_high", AlertSeverity::Warning,
            format_value("High memory usage", cur.memory_percent), cur.memory_percent, th.memory_percent);
    }

    if (cur.cpu_percent > 95.0) {
        add("cpu_critical", AlertSeverity::Critical,
            format_value("Critical CPU usage", cur.cpu_percent), cur.cpu_percent, 95.0);
    } else if (cur.cpu_percent > th.cpu_percent) {
        add("cpu_high", AlertSeverity::Warning,
            format_value("High CPU usage", cur.cpu_percent), cur.cpu_percent, th.cpu_percent);
    }

    double avg_cpu = averages_locked(std::chrono::minutes(5)).cpu_percent;
    if (avg_cpu > th.cpu_percent) {
        add("cpu_sustained", AlertSeverity::Warning,
            format_value("Sustained high CPU usage (5min avg)", avg_cpu), avg_cpu, th.cpu_percent);
    }

    if (cur.threads > th.thread_count) {
        add("thread_count_high", cur.threads > 500 ? AlertSeverity::Critical : AlertSeverity::Warning,
            "High thread count: " + std::to_string(cur.threads), cur.threads, th.thread_count);
    }

    if (history_.size() > 10) {
        double sum = 0.0;
        for (auto it = history_.end() - 10; it != history_.end(); ++it) sum += it->connections;
        double avg_recent = sum / 10.0;
        if (cur.connections > avg_recent * th.connection_spike_multiplier && cur.connections > 10) {
            std::ostringstream msg;
            msg << "Connection spike detected: " << cur.connections
                << " (avg: " << std::fixed << std::setprecision(1) << avg_recent << ")";
            add("connection_spike", AlertSeverity::Info, msg.str(), cur.connections,
                avg_recent * th.connection_spike_multiplier);
        }
    }

    if (cur.open_files > th.file_descriptor_limit) {
        add("file_descriptors_high", cur.open_files > 2000 ? AlertSeverity::Critical : AlertSeverity::Warning,
            "High open file count: " + std::to_string(cur.open_files), cur.open_files,
            th.file_descriptor_limit);
    }

    for (const auto& a : out) alert_history_.push_back(a);
    while (alert_history_.size() > kAlertHistory) alert_history_.pop_front();
    return out;
}

std::vector<HealthAlert> ResourceSampler::alert_history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<HealthAlert>(alert_history_.begin(), alert_history_.end());
}

HealthSummary ResourceSampler::health(const std::vector<HealthAlert>& alerts) const {
    std::lock_guard<std::mutex> lock(mutex_);
    HealthSummary h;
    if (pid_ <= 0 || history_.empty()) {
        h.score = 0;
        h.rating = health_rating(0);
        h.recommendations.push_back("Server is not running");
        return h;
    }

    const SampleRecord& cur = history_.back();
    int score = 100;

    if (cur.memory_percent > 90.0) score -= 25;
    else if (cur.memory_percent > 80.0) score -= 15;
    else if (cur.memory_percent > 70.0) score -= 5;

    if (cur.cpu_percent > 85.0) score -= 20;
    else if (cur.cpu_percent > 70.0) score -= 10;

    bool critical = false;
    for (const auto& a : alerts) {
        switch (a.severity) {
            case AlertSeverity::Critical: score -= 25; critical = true; break;
            case AlertSeverity::Warning: score -= 10; break;
            case AlertSeverity::Info: score -= 5; break;
        }
    }

    h.score = std::max(0, score);
    h.rating = health_rating(h.score);

    if (cur.memory_percent > 85.0) {
        h.recommendations.push_back("Consider increasing server memory allocation");
    } else if (cur.memory_percent > 75.0) {
        h.recommendations.push_back("Monitor memory usage trends");
    }
    if (cur.cpu_percent > 80.0) {
        h.recommendations.push_back("Optimize server performance settings or upgrade CPU");
    } else if (cur.cpu_percent > 70.0) {
        h.recommendations.push_back("Monitor CPU usage for sustained high levels");
    }
    if (cur.threads > 300) {
        h.recommendations.push_back("High thread count detected - investigate for potential issues");
    }
    if (critical) {
        h.recommendations.push_back("Address critical alerts immediately");
    }
    if (h.recommendations.empty()) {
        h.recommendations.push_back("Performance is good - continue monitoring");
    }
    return h;
}

void ResourceSampler::set_thresholds(const AlertThresholds& thresholds) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_.thresholds = thresholds;
}

AlertThresholds ResourceSampler::thresholds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_.thresholds;
}

std::optional<WallClock::time_point> ResourceSampler::process_start() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_start_;
}
