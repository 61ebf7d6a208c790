/***
 * Name: BuiltinFunctionInfo, BuiltinMethodInfo, BuiltinPropertyInfo (definitions)
 * Purpose: Host callables return instances of their declared return types.
 */
#include "analysis/values/BuiltinValues.h"

#include "analysis/AnalysisSession.h"

namespace pyinfer::analysis {

    namespace {
        NamespaceSet instancesOf(AnalysisSession& session, const host::HostFunction* function) {
            NamespaceSet out;
            if (function == nullptr) { return out; }
            for (const host::HostType* type : function->returnTypes()) {
                if (BuiltinClassInfo* cls = session.builtinType(type)) { out = out.unionWith(cls->instanceSet()); }
            }
            return out;
        }
    } // namespace

    std::string BuiltinFunctionInfo::description() const { return "built-in function " + function_.name(); }

    /*** Name: BuiltinFunctionInfo::call */
    NamespaceSet BuiltinFunctionInfo::call(const ast::Node&, AnalysisUnit&, const std::vector<NamespaceSet>&,
                                           const std::vector<std::string>&) {
        return instancesOf(session_, &function_);
    }

    std::string BuiltinMethodInfo::name() const {
        const host::HostFunction* function = method_.function();
        return function != nullptr ? function->name() : "method";
    }

    /*** Name: BuiltinMethodInfo::call */
    NamespaceSet BuiltinMethodInfo::call(const ast::Node&, AnalysisUnit&, const std::vector<NamespaceSet>&,
                                         const std::vector<std::string>&) {
        return instancesOf(session_, method_.function());
    }

    /*** Name: BuiltinPropertyInfo::propertyValue */
    NamespaceSet BuiltinPropertyInfo::propertyValue() {
        BuiltinClassInfo* cls = session_.builtinType(property_.type());
        return cls != nullptr ? cls->instanceSet() : NamespaceSet{};
    }

} // namespace pyinfer::analysis
