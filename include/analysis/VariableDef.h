/***
 * Name: pyinfer::analysis::VariableDef
 * Purpose: Per-name record of every value ever assigned, with navigation locations and readers.
 * Theory of Operation:
 *   The accumulated set only grows during a pass. When an addTypes call changes it, every
 *   dependent unit (a unit that read the variable) is re-enqueued so the change propagates;
 *   this is the edge relation of the fixed-point iteration. Cleared only by re-analysis of
 *   the whole owning module. Readers are held shared and retired readers are dropped on
 *   the next notification, or when the reader list has doubled since the last sweep.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <unordered_set>
#include <vector>

#include "analysis/NamespaceSet.h"

namespace pyinfer::analysis {

    class AnalysisUnit;
    class ProjectEntry;

    struct EncodedLocation {
        const ProjectEntry* entry{nullptr};
        int line{0};
        int col{0};
        bool operator==(const EncodedLocation& other) const {
            return entry == other.entry && line == other.line && col == other.col;
        }
    };

    class VariableDef {
    public:
        // cap == 0 leaves the accumulated set uncapped.
        explicit VariableDef(std::size_t cap = 0) : cap_(cap) {}

        const NamespaceSet& types() const { return types_; }

        // Returns true when the accumulated set changed; dependents are re-enqueued then.
        bool addTypes(const NamespaceSet& values);
        void addDependency(AnalysisUnit& unit);
        const std::vector<std::shared_ptr<AnalysisUnit>>& dependents() const { return dependents_; }
        // Re-enqueue every live dependent without changing the value.
        void notifyDependents();

        void addAssignment(const EncodedLocation& location);
        void addReference(const EncodedLocation& location);
        const std::vector<EncodedLocation>& assignments() const { return assignments_; }
        const std::vector<EncodedLocation>& references() const { return references_; }

    private:
        void dropRetiredDependents();

        std::size_t cap_;
        NamespaceSet types_{};
        std::vector<std::shared_ptr<AnalysisUnit>> dependents_{};
        std::unordered_set<const AnalysisUnit*> dependentSet_{};
        std::size_t sweepAt_{8};
        std::vector<EncodedLocation> assignments_{};
        std::vector<EncodedLocation> references_{};
    };

} // namespace pyinfer::analysis
