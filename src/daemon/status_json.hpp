#pragma once

#include "daemon/process_controller.hpp"
#include "daemon/resource_sampler.hpp"
#include "daemon/supervisor.hpp"

#include <nlohmann/json.hpp>

/// JSON shapes shared by the daemon responses and `status --json`

std::string iso_time(WallClock::time_point t);

nlohmann::json summary_to_json(const SampleSummary& s);
nlohmann::json debug_to_json(const DebugInfo& d);
nlohmann::json status_to_json(const ServerStatus& s);
nlohmann::json alert_to_json(const HealthAlert& a);
nlohmann::json health_summary_to_json(const HealthSummary& h);
nlohmann::json trend_to_json(const TrendReport& t);
nlohmann::json prediction_to_json(const MemoryPrediction& p);
nlohmann::json watchdog_to_json(const WatchdogStatus& w);
nlohmann::json health_report_to_json(const HealthReport& r);
