/***
 * Name: pyinfer::analysis::SpecializationRegistry
 * Purpose: Install call overrides on modules, now or when the target module appears.
 * Inputs: (module name, function name, override, analyze flag) registrations.
 * Outputs: Entries in per-module specialization tables; a replay log for late binding.
 * Theory of Operation:
 *   A registration is installed on the module bound to the exact name if there is one,
 *   otherwise on the module bound to the prefix before the last dot, under the qualified
 *   name "<suffix>.<function>" (so "decimal.Decimal" + "__new__" targets "Decimal.__new__"
 *   in module "decimal"). Every registration is also appended to a replay log keyed by the
 *   module it was installed on (the exact name when nothing was loaded). Adding a module
 *   replays the entries logged under its name and under its direct dotted children; reload
 *   replays the whole log. Installation replaces by qualified name, so replays never
 *   duplicate an override.
 */
#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "analysis/CallOverride.h"

namespace pyinfer::analysis {

    class AnalysisSession;

    struct SpecializationInfo {
        std::string moduleName;
        std::string name;
        CallOverride fn;
        bool analyze{true};
    };

    class SpecializationRegistry {
    public:
        explicit SpecializationRegistry(AnalysisSession& session) : session_(session) {}

        // Returns true when the override was installed on a loaded module.
        bool specialize(const std::string& moduleName, const std::string& name, CallOverride fn, bool analyze,
                        bool save = true);

        void applyDelayed(const std::string& moduleName);
        void replayAll();

        // Registrations logged under `key`.
        std::size_t loggedCount(const std::string& key) const;

    private:
        std::vector<SpecializationInfo> entriesFor(const std::string& moduleName) const;
        void save(const std::string& key, SpecializationInfo info);

        AnalysisSession& session_;
        mutable std::mutex mutex_;
        std::map<std::string, std::vector<SpecializationInfo>> log_{};
    };

} // namespace pyinfer::analysis
