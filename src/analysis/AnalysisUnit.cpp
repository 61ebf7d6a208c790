/***
 * Name: AnalysisUnit (definitions)
 */
#include "analysis/AnalysisUnit.h"

#include "analysis/AnalysisSession.h"
#include "analysis/StatementWalker.h"
#include "ast/Node.h"

namespace pyinfer::analysis {

    /*** Name: AnalysisUnit::enqueue */
    void AnalysisUnit::enqueue(bool front) {
        if (retired_) { return; }
        WorkQueue& queue = session_.queue();
        const bool added = front ? queue.pushFront(*this) : queue.pushBack(*this);
        if (!added) { return; }
        session_.metrics().incCounter("units_enqueued");
        session_.metrics().raiseGauge("queue_depth_max", queue.size());
    }

    /*** Name: AnalysisUnit::analyze */
    void AnalysisUnit::analyze() {
        if (retired_) { return; }
        StatementWalker walker(*this);
        walker.walkUnitBody();
    }

    /*** Name: AnalysisUnit::locationOf */
    EncodedLocation AnalysisUnit::locationOf(const ast::Node& node) const { return {entry_, node.line, node.col}; }

} // namespace pyinfer::analysis
