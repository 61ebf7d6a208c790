/***
 * Name: Scheduler (definitions)
 */
#include "analysis/Scheduler.h"

#include <memory>
#include <string>

#include "analysis/AnalysisUnit.h"
#include "analysis/WorkQueue.h"
#include "ast/Node.h"
#include "ast/NodeKind.h"
#include "observability/AnalysisLog.h"
#include "observability/Metrics.h"

namespace pyinfer::analysis {

    /*** Name: Scheduler::setReporting */
    void Scheduler::setReporting(ProgressReporter report, std::size_t interval) {
        report_ = std::move(report);
        interval_ = interval == 0 ? 1 : interval;
    }

    /*** Name: Scheduler::analyze */
    std::size_t Scheduler::analyze(const CancellationToken& cancel) {
        metrics_.start("analyze");
        std::size_t processed = 0;
        while (true) {
            if (cancel.isCancellationRequested()) {
                const std::size_t discarded = queue_.clear();
                metrics_.incCounter("analysis_cancelled");
                log_.write(obs::LogCategory::Units, "cancelled, discarded " + std::to_string(discarded) + " units");
                break;
            }
            const std::shared_ptr<AnalysisUnit> unit = queue_.popFront();
            if (unit == nullptr) { break; }
            if (unit->isRetired()) { continue; }
            if (log_.enabled(obs::LogCategory::Units)) {
                log_.write(obs::LogCategory::Units, std::string("analyze ") + ast::to_string(unit->node().kind) +
                                                        " at " + std::to_string(unit->node().line) + ":" +
                                                        std::to_string(unit->node().col));
            }
            unit->analyze();
            ++processed;
            metrics_.incCounter("units_processed");
            if (report_ && processed % interval_ == 0) { report_(queue_.size()); }
        }
        metrics_.stop("analyze");
        if (report_) { report_(queue_.size()); }
        return processed;
    }

} // namespace pyinfer::analysis
