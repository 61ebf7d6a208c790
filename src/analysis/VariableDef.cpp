/***
 * Name: VariableDef (definitions)
 */
#include "analysis/VariableDef.h"

#include <algorithm>

#include "analysis/AnalysisUnit.h"

namespace pyinfer::analysis {

    /*** Name: VariableDef::addTypes */
    bool VariableDef::addTypes(const NamespaceSet& values) {
        NamespaceSet merged = types_.unionWith(values, cap_);
        if (merged == types_) { return false; }
        types_ = std::move(merged);
        notifyDependents();
        return true;
    }

    /*** Name: VariableDef::addDependency */
    void VariableDef::addDependency(AnalysisUnit& unit) {
        if (unit.isRetired() || !dependentSet_.insert(&unit).second) { return; }
        dependents_.push_back(unit.shared_from_this());
        if (dependents_.size() >= sweepAt_) { dropRetiredDependents(); }
    }

    /*** Name: VariableDef::notifyDependents */
    void VariableDef::notifyDependents() {
        dropRetiredDependents();
        // enqueue never reaches back into this variable, so the list is stable here.
        for (const std::shared_ptr<AnalysisUnit>& unit : dependents_) { unit->enqueue(); }
    }

    void VariableDef::dropRetiredDependents() {
        const auto retired = [this](const std::shared_ptr<AnalysisUnit>& unit) {
            if (!unit->isRetired()) { return false; }
            dependentSet_.erase(unit.get());
            return true;
        };
        dependents_.erase(std::remove_if(dependents_.begin(), dependents_.end(), retired), dependents_.end());
        sweepAt_ = std::max<std::size_t>(8, dependents_.size() * 2);
    }

    /*** Name: VariableDef::addAssignment */
    void VariableDef::addAssignment(const EncodedLocation& location) {
        if (std::find(assignments_.begin(), assignments_.end(), location) == assignments_.end()) {
            assignments_.push_back(location);
        }
    }

    /*** Name: VariableDef::addReference */
    void VariableDef::addReference(const EncodedLocation& location) {
        if (std::find(references_.begin(), references_.end(), location) == references_.end()) {
            references_.push_back(location);
        }
    }

} // namespace pyinfer::analysis
