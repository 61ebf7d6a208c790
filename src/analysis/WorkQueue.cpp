/***
 * Name: WorkQueue (definitions)
 */
#include "analysis/WorkQueue.h"

#include <algorithm>

#include "analysis/AnalysisUnit.h"

namespace pyinfer::analysis {

    WorkQueue::Key WorkQueue::keyOf(const AnalysisUnit& unit) { return {&unit.scope(), &unit.node()}; }

    /*** Name: WorkQueue::pushBack */
    bool WorkQueue::pushBack(AnalysisUnit& unit) {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (!queued_.insert(keyOf(unit)).second) { return false; }
        units_.push_back(unit.shared_from_this());
        return true;
    }

    /*** Name: WorkQueue::pushFront */
    bool WorkQueue::pushFront(AnalysisUnit& unit) {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (!queued_.insert(keyOf(unit)).second) { return false; }
        units_.push_front(unit.shared_from_this());
        return true;
    }

    /*** Name: WorkQueue::popFront */
    std::shared_ptr<AnalysisUnit> WorkQueue::popFront() {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (units_.empty()) { return nullptr; }
        std::shared_ptr<AnalysisUnit> unit = units_.front();
        units_.pop_front();
        queued_.erase(keyOf(*unit));
        return unit;
    }

    /*** Name: WorkQueue::contains */
    bool WorkQueue::contains(const AnalysisUnit& unit) const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return queued_.count(keyOf(unit)) != 0;
    }

    /*** Name: WorkQueue::size */
    std::size_t WorkQueue::size() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return units_.size();
    }

    /*** Name: WorkQueue::clear */
    std::size_t WorkQueue::clear() {
        const std::lock_guard<std::mutex> lock(mutex_);
        const std::size_t discarded = units_.size();
        units_.clear();
        queued_.clear();
        return discarded;
    }

    /*** Name: WorkQueue::discardRetired */
    std::size_t WorkQueue::discardRetired() {
        const std::lock_guard<std::mutex> lock(mutex_);
        const auto retired = [this](const std::shared_ptr<AnalysisUnit>& unit) {
            if (!unit->isRetired()) { return false; }
            queued_.erase(keyOf(*unit));
            return true;
        };
        const std::size_t before = units_.size();
        units_.erase(std::remove_if(units_.begin(), units_.end(), retired), units_.end());
        return before - units_.size();
    }

} // namespace pyinfer::analysis
