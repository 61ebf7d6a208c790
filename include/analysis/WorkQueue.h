/***
 * Name: pyinfer::analysis::WorkQueue
 * Purpose: Double-ended queue of analysis units with deduplication on (scope, node).
 * Theory of Operation:
 *   Urgent work (newly discovered definitions) is pushed to the front, routine propagation
 *   to the back. A unit whose (scope, node) pair is already queued is not added again,
 *   whichever unit object carries the pair. The queue holds its units shared, so a unit
 *   retired while queued stays valid until it is popped or discarded.
 */
#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <utility>

namespace pyinfer::ast {
    struct Node;
}

namespace pyinfer::analysis {

    class AnalysisUnit;
    class Scope;

    class WorkQueue {
    public:
        // Return false when the unit's (scope, node) pair was already queued.
        bool pushBack(AnalysisUnit& unit);
        bool pushFront(AnalysisUnit& unit);
        // nullptr when empty.
        std::shared_ptr<AnalysisUnit> popFront();

        bool contains(const AnalysisUnit& unit) const;
        std::size_t size() const;
        bool empty() const { return size() == 0; }
        // Returns the number of discarded units.
        std::size_t clear();
        // Drop retired units so their (scope, node) pairs can be queued by new units.
        std::size_t discardRetired();

    private:
        using Key = std::pair<const Scope*, const ast::Node*>;
        static Key keyOf(const AnalysisUnit& unit);

        mutable std::mutex mutex_;
        std::deque<std::shared_ptr<AnalysisUnit>> units_{};
        std::set<Key> queued_{};
    };

} // namespace pyinfer::analysis
