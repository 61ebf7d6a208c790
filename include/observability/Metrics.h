/***
 * Name: pyinfer::obs::Metrics
 * Purpose: Collect per-stage timings, counters and gauges for an analysis session.
 * Inputs:
 *   - Calls to start/stop timers for named stages (e.g. "analyze").
 *   - Counter increments and gauge updates from the registry and the scheduler.
 * Outputs:
 *   - Human-readable text and JSON summaries.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. Stores a map from stage names to
 *   microseconds. All state is guarded by one mutex because the mutation API may be driven
 *   from several threads. Formatting is performed on demand.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pyinfer::obs {

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);

  void incCounter(const std::string& key, uint64_t delta = 1);
  void setGauge(const std::string& key, uint64_t value);
  // Keep the largest value ever reported for `key`.
  void raiseGauge(const std::string& key, uint64_t value);

  uint64_t counter(const std::string& key) const;
  uint64_t gauge(const std::string& key) const;

  std::string summaryText() const;
  std::string summaryJson() const;

  std::vector<std::string> hints() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::unordered_map<std::string, uint64_t> counters_{};
  std::unordered_map<std::string, uint64_t> gauges_{};
};

} // namespace pyinfer::obs
