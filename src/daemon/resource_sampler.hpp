#pragma once

#include "core/logger.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

using WallClock = std::chrono::system_clock;

struct SampleRecord {
    WallClock::time_point timestamp;
    double memory_mb = 0.0;        // resident set
    double memory_percent = 0.0;   // of system RAM
    double cpu_percent = 0.0;      // may exceed 100 on multi-core
    int threads = 0;
    int open_files = 0;
    int connections = 0;
};

/// Raw reading of one process
struct ProcessMetrics {
    double rss_mb = 0.0;
    double memory_percent = 0.0;
    double cpu_seconds = 0.0;      // user + system, cumulative
    int threads = 0;
    int open_files = 0;
    int connections = 0;
};

/// Source of per-process metrics; the default reads /proc
class MetricsReader {
public:
    virtual ~MetricsReader() = default;
    virtual bool alive(pid_t pid) = 0;
    /// nullopt when the process is gone or not accessible
    virtual std::optional<ProcessMetrics> read(pid_t pid) = 0;
    virtual std::optional<WallClock::time_point> start_time(pid_t) { return std::nullopt; }
};

class ProcMetricsReader : public MetricsReader {
public:
    bool alive(pid_t pid) override;
    std::optional<ProcessMetrics> read(pid_t pid) override;
    std::optional<WallClock::time_point> start_time(pid_t pid) override;
};

/// Averages or maxima over a window of history
struct SampleSummary {
    double memory_mb = 0.0;
    double memory_percent = 0.0;
    double cpu_percent = 0.0;
    double threads = 0.0;
    double connections = 0.0;
    double open_files = 0.0;
    size_t sample_count = 0;
};

/// Running maxima since attach
struct PeakTracker {
    double memory_mb = 0.0;
    double cpu_percent = 0.0;
    int threads = 0;
};

enum class TrendDirection { Stable, Increasing, Decreasing };

struct Trend {
    TrendDirection direction = TrendDirection::Stable;
    double change = 0.0;
    double percent_change = 0.0;
    double start_value = 0.0;
    double end_value = 0.0;
};

struct TrendReport {
    bool sufficient_data = false;
    Trend memory;
    Trend cpu;
    Trend threads;
    double timespan_minutes = 0.0;
    size_t sample_count = 0;
};

struct MemoryPrediction {
    bool available = false;
    std::string reason;
    double current_percent = 0.0;
    double predicted_percent = 0.0;
    TrendDirection direction = TrendDirection::Stable;
    std::string confidence;
    int minutes_ahead = 0;
};

enum class AlertSeverity { Info, Warning, Critical };

struct HealthAlert {
    std::string kind;              // "memory_high", "cpu_sustained", ...
    AlertSeverity severity = AlertSeverity::Info;
    std::string message;
    double value = 0.0;
    double threshold = 0.0;
    WallClock::time_point timestamp;
};

struct HealthSummary {
    int score = 0;                 // 0..100
    std::string rating;            // excellent/good/fair/poor/critical
    std::vector<std::string> recommendations;
};

struct AlertThresholds {
    double memory_percent = 80.0;
    double cpu_percent = 75.0;
    int thread_count = 200;
    double connection_spike_multiplier = 2.0;
    int file_descriptor_limit = 1000;
};

struct SamplerOptions {
    size_t history_size = 100;
    std::chrono::milliseconds collection_interval{5000};
    std::chrono::milliseconds cpu_sample_interval{1000};
    AlertThresholds thresholds;
};

const char* to_string(TrendDirection d);
const char* to_string(AlertSeverity s);

/// Rating band for a 0..100 score
std::string health_rating(int score);

class ResourceSampler {
public:
    using Clock = std::function<WallClock::time_point()>;

    static constexpr size_t kMaxHistory = 1000;
    static constexpr size_t kAlertHistory = 100;

    explicit ResourceSampler(SamplerOptions options = {},
                             Logger logger = null_logger(),
                             std::unique_ptr<MetricsReader> reader = nullptr,
                             Clock clock = nullptr);

    /// Start tracking pid; resets history and peaks. False if pid is not alive.
    bool attach(pid_t pid);

    /// Forget the tracked process and all collected data
    void detach();

    /// Tracked PID, -1 when detached
    pid_t attached_pid() const;

    /// Take one sample of the tracked process; nullopt (and detach) if it vanished
    std::optional<SampleRecord> sample();

    /// Insert a sample into history and peaks as if it had been collected
    void record(const SampleRecord& sample);

    /// Most recent sample, if any
    std::optional<SampleRecord> current() const;

    SampleSummary averages(std::chrono::seconds window) const;
    SampleSummary peaks(std::chrono::seconds window) const;
    std::vector<SampleRecord> history(std::chrono::seconds window) const;
    std::vector<SampleRecord> history() const;
    PeakTracker peak_tracker() const;

    TrendReport trend_analysis(std::chrono::seconds window) const;
    MemoryPrediction memory_prediction(int minutes_ahead = 30) const;

    /// Threshold check of the latest sample and the 5-minute averages
    std::vector<HealthAlert> alerts();
    std::vector<HealthAlert> alert_history() const;

    /// Score and rating for the latest sample plus the given alerts
    HealthSummary health(const std::vector<HealthAlert>& alerts) const;

    void set_thresholds(const AlertThresholds& thresholds);
    AlertThresholds thresholds() const;

    /// Wall-clock start of the tracked process, if known
    std::optional<WallClock::time_point> process_start() const;

private:
    SamplerOptions options_;
    Logger logger_;
    std::unique_ptr<MetricsReader> reader_;
    Clock clock_;

    mutable std::mutex mutex_;
    pid_t pid_ = -1;
    uint64_t generation_ = 0;      // bumped on attach/detach
    std::optional<WallClock::time_point> process_start_;
    std::deque<SampleRecord> history_;
    std::deque<HealthAlert> alert_history_;
    PeakTracker peaks_;

    // CPU baseline for incremental reads
    std::optional<double> last_cpu_seconds_;
    std::optional<std::chrono::steady_clock::time_point> last_cpu_read_;
    std::optional<WallClock::time_point> last_sample_at_;

    void record_locked(const SampleRecord& sample);
    void reset_locked();
    std::vector<SampleRecord> window_locked(std::chrono::seconds window) const;
    SampleSummary averages_locked(std::chrono::seconds window) const;

    static Trend compute_trend(const std::vector<double>& values);
};
