/***
 * Name: pyinfer::obs::Metrics (impl)
 * Purpose: Implement timing, counters and formatting.
 */
#include "observability/Metrics.h"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <map>
#include <sstream>
#include <string>
#include <unordered_map>

namespace pyinfer::obs {

namespace {
constexpr double kUsPerMs = 1000.0;
constexpr int kIndent4 = 4;
constexpr uint64_t kDeepQueue = 10000U;
} // namespace

static void appendDurations(std::ostringstream& oss,
                            const std::map<std::string, uint64_t>& durations) {
  oss << "  \"durations_ms\": {";
  bool first = true;
  for (const auto& [key, val] : durations) {
    if (!first) { oss << ","; }
    first = false;
    const double millis = static_cast<double>(val) / kUsPerMs;
    oss << "\n    \"" << key << "\": " << std::fixed << std::setprecision(3) << millis;
  }
  oss << "\n  }";
}

static void appendKeyValueObject(std::ostringstream& oss,
                                 const std::unordered_map<std::string, uint64_t>& values,
                                 int indent) {
  // Sorted so that the JSON is stable across runs.
  const std::map<std::string, uint64_t> sorted(values.begin(), values.end());
  const std::string pad(indent, ' ');
  bool first = true;
  for (const auto& [key, val] : sorted) {
    if (!first) { oss << ","; }
    first = false;
    oss << "\n" << pad << "\"" << key << "\": " << val;
  }
}

void Metrics::start(const std::string& name) {
  const std::lock_guard<std::mutex> lock(mutex_);
  active_[name] = Clock::now();
}

void Metrics::stop(const std::string& name) {
  const std::lock_guard<std::mutex> lock(mutex_);
  auto iter = active_.find(name);
  if (iter == active_.end()) { return; }
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - iter->second).count();
  durations_us_[name] += static_cast<uint64_t>(microseconds);
  active_.erase(iter);
}

void Metrics::incCounter(const std::string& key, uint64_t delta) {
  const std::lock_guard<std::mutex> lock(mutex_);
  counters_[key] += delta;
}

void Metrics::setGauge(const std::string& key, uint64_t value) {
  const std::lock_guard<std::mutex> lock(mutex_);
  gauges_[key] = value;
}

void Metrics::raiseGauge(const std::string& key, uint64_t value) {
  const std::lock_guard<std::mutex> lock(mutex_);
  auto& slot = gauges_[key];
  slot = std::max(slot, value);
}

uint64_t Metrics::counter(const std::string& key) const {
  const std::lock_guard<std::mutex> lock(mutex_);
  const auto it = counters_.find(key);
  return it == counters_.end() ? 0U : it->second;
}

uint64_t Metrics::gauge(const std::string& key) const {
  const std::lock_guard<std::mutex> lock(mutex_);
  const auto it = gauges_.find(key);
  return it == gauges_.end() ? 0U : it->second;
}

std::string Metrics::summaryText() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  for (const auto& [key, val] : durations_us_) {
    const double millis = static_cast<double>(val) / kUsPerMs;
    oss << "  " << key << ": " << std::fixed << std::setprecision(3) << millis << " ms\n";
  }
  const std::map<std::string, uint64_t> counters(counters_.begin(), counters_.end());
  for (const auto& [key, val] : counters) {
    oss << "  " << key << ": " << val << "\n";
  }
  return oss.str();
}

std::string Metrics::summaryJson() const {
  const auto hs = hints();
  const std::lock_guard<std::mutex> lock(mutex_);
  std::ostringstream oss;
  oss << "{\n";
  appendDurations(oss, durations_us_);
  if (!counters_.empty()) {
    oss << ",\n  \"counters\": {";
    appendKeyValueObject(oss, counters_, kIndent4);
    oss << "\n  }";
  }
  if (!gauges_.empty()) {
    oss << ",\n  \"gauges\": {";
    appendKeyValueObject(oss, gauges_, kIndent4);
    oss << "\n  }";
  }
  if (!hs.empty()) {
    oss << ",\n  \"hints\": [";
    for (size_t i = 0; i < hs.size(); ++i) {
      if (i != 0) oss << ", ";
      oss << "\"" << hs[i] << "\"";
    }
    oss << "]";
  }
  oss << "\n}\n";
  return oss.str();
}

std::vector<std::string> Metrics::hints() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  auto itCancel = counters_.find("analysis_cancelled");
  if (itCancel != counters_.end() && itCancel->second > 0) { out.emplace_back("analysis_incomplete"); }
  auto itHost = counters_.find("host_contract_breaches");
  if (itHost != counters_.end() && itHost->second > 0) { out.emplace_back("host_contract_breaches"); }
  auto itDepth = gauges_.find("queue_depth_max");
  if (itDepth != gauges_.end() && itDepth->second > kDeepQueue) { out.emplace_back("deep_queue"); }
  return out;
}

} // namespace pyinfer::obs
