/***
 * Name: pyinfer::analysis::ModuleLike
 * Purpose: Capability shared by project modules, builtin modules and module aggregates:
 *   child-package navigation, member presence and the per-module specialization table.
 * Theory of Operation:
 *   The specialization table maps a qualified function name ("f" or "Class.method") to
 *   its override. Installing a name that is already present replaces the entry, so
 *   replaying the same registration never duplicates its effect.
 */
#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "analysis/CallOverride.h"

namespace pyinfer::host {
    class ModuleContext;
}

namespace pyinfer::analysis {

    class Namespace;

    // Resolved: the member has inferred values. Speculative: assigned in source but no values
    // confirmed by analysis yet. Absent: no such member.
    enum class MemberPresence { Absent, Speculative, Resolved };

    class ModuleLike {
    public:
        virtual ~ModuleLike() = default;

        virtual std::string moduleName() const = 0;
        // nullptr when there is no such child module.
        virtual Namespace* childPackage(const host::ModuleContext* ctx, const std::string& name) = 0;
        virtual std::map<std::string, Namespace*> childPackages(const host::ModuleContext* ctx) = 0;
        virtual MemberPresence memberPresence(const host::ModuleContext* ctx, const std::string& name) = 0;

        void specialize(const std::string& qualifiedName, CallOverride fn, bool analyze);
        std::optional<SpecializationEntry> specialization(const std::string& qualifiedName) const;
        std::size_t specializationCount() const;

    protected:
        virtual void specializationsChanged() {}

    private:
        mutable std::mutex specializationMutex_;
        std::map<std::string, SpecializationEntry> specializations_{};
    };

} // namespace pyinfer::analysis
