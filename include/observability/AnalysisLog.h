/***
 * Name: pyinfer::obs::AnalysisLog
 * Purpose: Category-gated event log for module registration, unit scheduling and specializations.
 * Inputs:
 *   - A caller-provided sink stream; without a sink the log is silent.
 *   - Events tagged with a LogCategory.
 * Outputs:
 *   - One line per event: "pyinfer[<category>]: <message>".
 * Theory of Operation:
 *   Mirrors the compiler's per-stage log switches: each category is enabled independently
 *   and writes are serialized with a mutex so concurrent registrations do not interleave.
 */
#pragma once

#include <array>
#include <mutex>
#include <ostream>
#include <string>

#include "config/Options.h"

namespace pyinfer::obs {

enum class LogCategory { Modules, Units, Specializations, Host };

const char* to_string(LogCategory category);

class AnalysisLog {
 public:
  AnalysisLog() = default;
  explicit AnalysisLog(const config::LogOptions& opts);

  void setSink(std::ostream* sink);
  void enable(LogCategory category, bool on);
  bool enabled(LogCategory category) const;

  void write(LogCategory category, const std::string& message);

 private:
  mutable std::mutex mutex_;
  std::ostream* sink_{nullptr};
  std::array<bool, 4> enabled_{false, false, false, true};
};

} // namespace pyinfer::obs
