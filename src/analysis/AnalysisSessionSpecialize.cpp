/***
 * Name: AnalysisSession (specialization surface)
 * Purpose: Public registration forms for call overrides.
 * Theory of Operation:
 *   Every form reduces to a CallOverride handed to the specialization registry, which
 *   installs it now or when the target module appears.
 */
#include "analysis/AnalysisSession.h"

#include "pyinfer/exceptions/invalid_argument_error.h"

namespace pyinfer::analysis {

    void AnalysisSession::specializeFunction(const std::string& moduleName, const std::string& name, CallOverride fn,
                                             bool analyze) {
        specializations_.specialize(moduleName, name, std::move(fn), analyze);
    }

    /*** Name: AnalysisSession::specializeFunction (return type shorthand) */
    void AnalysisSession::specializeFunction(const std::string& moduleName, const std::string& name,
                                             const std::string& returnType) {
        const auto dot = returnType.rfind('.');
        if (dot == std::string::npos) {
            throw exceptions::InvalidArgumentError("expected module.typename for return type, got '" + returnType + "'");
        }
        std::string typeModule = returnType.substr(0, dot);
        std::string typeName = returnType.substr(dot + 1);

        specializeFunction(
            moduleName, name,
            [this, typeModule, typeName](const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>&,
                                         const std::vector<std::string>&) -> std::optional<NamespaceSet> {
                auto ref = modules_.tryGetValue(typeModule);
                if (!ref || !ref->hasModule()) { return std::nullopt; }
                NamespaceSet result;
                for (Namespace* value : ref->module()->getMember(node, unit, typeName)) {
                    const NamespaceSet instances = value->instanceSet();
                    result = result.unionWith(instances.empty() ? value->selfSet() : instances);
                }
                return result;
            });
    }

    void AnalysisSession::specializeFunctionValues(const std::string& moduleName, const std::string& name,
                                                   ValuesCallback fn) {
        specializeFunction(moduleName, name,
                           [fn = std::move(fn)](const ast::Node& node, AnalysisUnit&, const std::vector<NamespaceSet>& args,
                                                const std::vector<std::string>& argNames) -> std::optional<NamespaceSet> {
                               auto values = fn(node, CallInfo{args, argNames});
                               if (!values) { return std::nullopt; }
                               return NamespaceSet::of(std::move(*values));
                           });
    }

    void AnalysisSession::specializeFunctionAction(const std::string& moduleName, const std::string& name,
                                                   CallAction fn) {
        specializeFunction(moduleName, name,
                           [fn = std::move(fn)](const ast::Node& node, AnalysisUnit&, const std::vector<NamespaceSet>&,
                                                const std::vector<std::string>&) -> std::optional<NamespaceSet> {
                               fn(node);
                               return std::nullopt;
                           });
    }

} // namespace pyinfer::analysis
