/***
 * Name: BuiltinInstanceInfo (definitions)
 */
#include "analysis/values/BuiltinValues.h"

#include "analysis/AnalysisSession.h"

namespace pyinfer::analysis {

    namespace {
        bool isText(const BuiltinClassInfo& cls) {
            const host::BuiltinTypeId id = cls.type().typeId();
            return id == host::BuiltinTypeId::Str || id == host::BuiltinTypeId::Unicode ||
                   id == host::BuiltinTypeId::Bytes;
        }
    } // namespace

    /*** Name: BuiltinInstanceInfo::getMember */
    NamespaceSet BuiltinInstanceInfo::getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) {
        NamespaceSet out;
        for (Namespace* value : class_.getMember(node, unit, name)) {
            if (value->kind() == NamespaceKind::BuiltinProperty) {
                out = out.unionWith(static_cast<BuiltinPropertyInfo*>(value)->propertyValue());
            } else {
                out = out.add(value);
            }
        }
        return out;
    }

    /*** Name: BuiltinInstanceInfo::call */
    NamespaceSet BuiltinInstanceInfo::call(const ast::Node& node, AnalysisUnit& unit,
                                           const std::vector<NamespaceSet>& args,
                                           const std::vector<std::string>& argNames) {
        return analysis::call(getMember(node, unit, "__call__"), node, unit, args, argNames);
    }

    /*** Name: BuiltinInstanceInfo::getEnumeratorTypes */
    NamespaceSet BuiltinInstanceInfo::getEnumeratorTypes(const ast::Node& node, AnalysisUnit& unit) {
        NamespaceSet out = Namespace::getEnumeratorTypes(node, unit);
        if (!out.empty() || !isText(class_)) { return out; }
        if (class_.type().typeId() == host::BuiltinTypeId::Bytes &&
            session_.languageVersion() == config::LanguageVersion::V3) {
            return session_.knownInstance(host::BuiltinTypeId::Int);
        }
        return class_.instanceSet();
    }

    /*** Name: BuiltinInstanceInfo::getIndex */
    NamespaceSet BuiltinInstanceInfo::getIndex(const ast::Node& node, AnalysisUnit& unit, const NamespaceSet& index) {
        NamespaceSet out = Namespace::getIndex(node, unit, index);
        if (out.empty() && isText(class_)) { return class_.instanceSet(); }
        return out;
    }

} // namespace pyinfer::analysis
