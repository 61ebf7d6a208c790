/***
 * Name: pyinfer::analysis::ModuleReference
 * Purpose: Registry cell holding zero or one module value, with a validity flag.
 * Theory of Operation:
 *   A reference starts "not loaded" when a module name is first seen (e.g. from the host's
 *   module list) and becomes "loaded" once the module is imported or registered. Loaded
 *   with no value is "known empty". Removing or superseding a module invalidates its
 *   reference so holders can tell a stale cell from a live one.
 */
#pragma once

#include <mutex>
#include <string>

#include "analysis/ModuleLike.h"
#include "analysis/Namespace.h"

namespace pyinfer::analysis {

    class ModuleReference {
    public:
        // Not loaded.
        ModuleReference() = default;
        // Loaded; a null module makes the reference known-empty.
        explicit ModuleReference(Namespace* module) : module_(module), loaded_(true) {}

        bool isLoaded() const;
        bool hasModule() const;
        Namespace* module() const;
        // nullptr unless a module value is present.
        ModuleLike* moduleLike() const;
        void setModule(Namespace* module);

        bool isValid() const;
        void invalidate();

        MemberType memberType() const;
        MemberPresence containsMember(const host::ModuleContext* ctx, const std::string& name) const;

    private:
        mutable std::mutex mutex_;
        Namespace* module_{nullptr};
        bool loaded_{false};
        bool valid_{true};
    };

} // namespace pyinfer::analysis
