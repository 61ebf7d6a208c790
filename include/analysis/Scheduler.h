/***
 * Name: pyinfer::analysis::Scheduler
 * Purpose: Drive the work queue to a fixed point.
 * Inputs: The session work queue, a cancellation token, an optional progress callback.
 * Outputs: Number of units processed; metrics and unit log events.
 * Theory of Operation:
 *   Pops from the front and analyzes one unit at a time until the queue is empty.
 *   Cancellation is checked between units only; on cancellation the remaining queue is
 *   discarded and everything computed so far stays valid. The progress callback receives
 *   the queue depth every `interval` units and once more when the run ends.
 */
#pragma once

#include <cstddef>
#include <functional>

#include "analysis/Cancellation.h"

namespace pyinfer::obs {
    class AnalysisLog;
    class Metrics;
}

namespace pyinfer::analysis {

    class WorkQueue;

    using ProgressReporter = std::function<void(std::size_t queueDepth)>;

    class Scheduler {
    public:
        Scheduler(WorkQueue& queue, obs::Metrics& metrics, obs::AnalysisLog& log)
            : queue_(queue), metrics_(metrics), log_(log) {}

        void setReporting(ProgressReporter report, std::size_t interval);
        std::size_t analyze(const CancellationToken& cancel);

    private:
        WorkQueue& queue_;
        obs::Metrics& metrics_;
        obs::AnalysisLog& log_;
        ProgressReporter report_{};
        std::size_t interval_{1};
    };

} // namespace pyinfer::analysis
