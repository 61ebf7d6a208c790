/***
 * Name: ModuleLike (definitions)
 * Purpose: Per-module specialization table.
 */
#include "analysis/ModuleLike.h"

#include <utility>

namespace pyinfer::analysis {

    /*** Name: ModuleLike::specialize */
    void ModuleLike::specialize(const std::string& qualifiedName, CallOverride fn, bool analyze) {
        {
            const std::lock_guard<std::mutex> lock(specializationMutex_);
            specializations_[qualifiedName] = SpecializationEntry{std::move(fn), analyze};
        }
        specializationsChanged();
    }

    /*** Name: ModuleLike::specialization */
    std::optional<SpecializationEntry> ModuleLike::specialization(const std::string& qualifiedName) const {
        const std::lock_guard<std::mutex> lock(specializationMutex_);
        const auto it = specializations_.find(qualifiedName);
        if (it == specializations_.end()) { return std::nullopt; }
        return it->second;
    }

    /*** Name: ModuleLike::specializationCount */
    std::size_t ModuleLike::specializationCount() const {
        const std::lock_guard<std::mutex> lock(specializationMutex_);
        return specializations_.size();
    }

} // namespace pyinfer::analysis
