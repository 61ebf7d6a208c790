/***
 * Name: pyinfer::analysis::ModuleTable
 * Purpose: Concurrent name -> module reference index.
 * Inputs: Module names from the host interpreter and from project registrations.
 * Outputs: Shared references; builtin modules are imported lazily on first lookup.
 * Theory of Operation:
 *   One mutex guards the map; loading a builtin module happens outside it so the host
 *   import never runs under the table lock. Entries are held through shared pointers so a
 *   reader keeps a consistent cell even while the entry is replaced or removed.
 */
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "analysis/ModuleReference.h"

namespace pyinfer::host {
    class Interpreter;
}

namespace pyinfer::analysis {

    class AnalysisSession;

    class ModuleTable {
    public:
        ModuleTable(AnalysisSession& session, host::Interpreter& interpreter);

        // Reset the builtin part of the index to `names`; project modules keep their references.
        void reinit(const std::vector<std::string>& names);

        // Looks up `name`, importing a known-but-unloaded builtin module. nullptr for unknown names.
        std::shared_ptr<ModuleReference> tryGetValue(const std::string& name);
        // Looks up `name` without loading anything.
        std::shared_ptr<ModuleReference> peek(const std::string& name) const;

        // Binds `name`, invalidating the reference it replaces.
        void set(const std::string& name, std::shared_ptr<ModuleReference> ref);
        // Removes `name` only while it is still bound to `expected`.
        bool tryRemove(const std::string& name, const ModuleReference* expected);

        // Sorted by name.
        std::vector<std::pair<std::string, std::shared_ptr<ModuleReference>>> snapshot() const;
        std::size_t size() const;

    private:
        AnalysisSession& session_;
        host::Interpreter& interpreter_;
        mutable std::mutex mutex_;
        std::map<std::string, std::shared_ptr<ModuleReference>> modules_{};
    };

} // namespace pyinfer::analysis
