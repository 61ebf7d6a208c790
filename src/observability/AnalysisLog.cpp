/***
 * Name: pyinfer::obs::AnalysisLog (impl)
 */
#include "observability/AnalysisLog.h"

#include <cstddef>

namespace pyinfer::obs {

const char* to_string(const LogCategory category) {
  switch (category) {
    case LogCategory::Modules: return "modules";
    case LogCategory::Units: return "units";
    case LogCategory::Specializations: return "specializations";
    case LogCategory::Host: return "host";
    default: return "unknown";
  }
}

AnalysisLog::AnalysisLog(const config::LogOptions& opts)
    : enabled_{opts.modules, opts.units, opts.specializations, opts.host} {}

void AnalysisLog::setSink(std::ostream* sink) {
  const std::lock_guard<std::mutex> lock(mutex_);
  sink_ = sink;
}

void AnalysisLog::enable(LogCategory category, bool on) {
  const std::lock_guard<std::mutex> lock(mutex_);
  enabled_[static_cast<std::size_t>(category)] = on;
}

bool AnalysisLog::enabled(LogCategory category) const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return sink_ != nullptr && enabled_[static_cast<std::size_t>(category)];
}

void AnalysisLog::write(LogCategory category, const std::string& message) {
  const std::lock_guard<std::mutex> lock(mutex_);
  if (sink_ == nullptr || !enabled_[static_cast<std::size_t>(category)]) {
    return;
  }
  *sink_ << "pyinfer[" << to_string(category) << "]: " << message << "\n";
}

} // namespace pyinfer::obs
