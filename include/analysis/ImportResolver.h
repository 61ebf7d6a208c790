/***
 * Name: pyinfer::analysis::ImportResolver
 * Purpose: Resolve dotted import paths against the host type system.
 * Inputs: Dotted names ("a.b.c"), host members and module values.
 * Outputs: A module-like value, or nullptr when the path does not resolve.
 * Theory of Operation:
 *   Intermediate results take one of three shapes: a module value (descend by child
 *   package), a host module (descend by member lookup, classify once segments run out) or
 *   an ambiguity aggregate (resolve every alternative: none -> nullptr, one -> that value,
 *   several -> their aggregate). A name with an empty leading segment is a relative import
 *   and never resolves against builtins.
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pyinfer::host {
    class HostModule;
    class HostMultipleMembers;
    class HostObject;
}

namespace pyinfer::analysis {

    class AnalysisSession;
    class Namespace;

    class ImportResolver {
    public:
        explicit ImportResolver(AnalysisSession& session) : session_(session) {}

        // `bottom`: return the last path element instead of the top-level module.
        Namespace* importBuiltinModule(const std::string& name, bool bottom = true) const;

        Namespace* importFromMember(const host::HostObject* member, const std::vector<std::string>& names,
                                    std::size_t index) const;
        Namespace* importFromHostModule(const host::HostModule* module, const std::vector<std::string>& names,
                                        std::size_t index) const;
        Namespace* importFromModule(Namespace* module, const std::vector<std::string>& names,
                                    std::size_t index) const;
        Namespace* importFromMultipleMembers(const host::HostMultipleMembers* members,
                                             const std::vector<std::string>& names, std::size_t index) const;

    private:
        AnalysisSession& session_;
    };

} // namespace pyinfer::analysis
