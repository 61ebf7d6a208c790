/***
 * Name: Namespace (definitions)
 * Purpose: Default operations of an opaque value and the set-level helpers.
 */
#include "analysis/Namespace.h"

#include "analysis/AnalysisSession.h"
#include "analysis/AnalysisUnit.h"

namespace pyinfer::analysis {

    const char* to_string(const NamespaceKind kind) {
        switch (kind) {
            case NamespaceKind::BuiltinClass: return "BuiltinClass";
            case NamespaceKind::BuiltinInstance: return "BuiltinInstance";
            case NamespaceKind::BuiltinFunction: return "BuiltinFunction";
            case NamespaceKind::BuiltinMethod: return "BuiltinMethod";
            case NamespaceKind::BuiltinProperty: return "BuiltinProperty";
            case NamespaceKind::BuiltinModule: return "BuiltinModule";
            case NamespaceKind::Constant: return "Constant";
            case NamespaceKind::Reflected: return "Reflected";
            case NamespaceKind::MultipleMembers: return "MultipleMembers";
            case NamespaceKind::Module: return "Module";
            case NamespaceKind::Class: return "Class";
            case NamespaceKind::Instance: return "Instance";
            case NamespaceKind::Function: return "Function";
            case NamespaceKind::BoundMethod: return "BoundMethod";
            case NamespaceKind::Sequence: return "Sequence";
            case NamespaceKind::Iterator: return "Iterator";
            case NamespaceKind::Super: return "Super";
            case NamespaceKind::Specialized: return "Specialized";
            default: return "Unknown";
        }
    }

    const char* to_string(const MemberType type) {
        switch (type) {
            case MemberType::Class: return "class";
            case MemberType::Instance: return "instance";
            case MemberType::Function: return "function";
            case MemberType::Method: return "method";
            case MemberType::Property: return "property";
            case MemberType::Module: return "module";
            case MemberType::Constant: return "constant";
            case MemberType::Multiple: return "multiple";
            case MemberType::Unknown:
            default: return "unknown";
        }
    }

    /*** Name: memberTypeOf */
    MemberType memberTypeOf(const NamespaceSet& values) {
        bool first = true;
        MemberType out = MemberType::Unknown;
        for (const Namespace* value : values) {
            if (first) {
                out = value->memberType();
                first = false;
            } else if (out != value->memberType()) {
                return MemberType::Multiple;
            }
        }
        return out;
    }

    /*** Name: Namespace::getMember */
    NamespaceSet Namespace::getMember(const ast::Node&, AnalysisUnit&, const std::string&) { return {}; }

    /*** Name: Namespace::setMember */
    void Namespace::setMember(const ast::Node&, AnalysisUnit&, const std::string&, const NamespaceSet&) {}

    /*** Name: Namespace::call */
    NamespaceSet Namespace::call(const ast::Node&, AnalysisUnit&, const std::vector<NamespaceSet>&,
                                 const std::vector<std::string>&) {
        return {};
    }

    /*** Name: Namespace::getIterator */
    NamespaceSet Namespace::getIterator(const ast::Node& node, AnalysisUnit& unit) {
        return analysis::call(getMember(node, unit, "__iter__"), node, unit, {}, {});
    }

    /*** Name: Namespace::getEnumeratorTypes */
    NamespaceSet Namespace::getEnumeratorTypes(const ast::Node& node, AnalysisUnit& unit) {
        const std::string next = unit.session().nextMethodName();
        NamespaceSet out;
        for (Namespace* iterator : getIterator(node, unit)) {
            if (iterator->kind() == NamespaceKind::Iterator) {
                out = out.unionWith(iterator->getEnumeratorTypes(node, unit));
            } else {
                out = out.unionWith(analysis::call(iterator->getMember(node, unit, next), node, unit, {}, {}));
            }
        }
        return out;
    }

    /*** Name: Namespace::getIndex */
    NamespaceSet Namespace::getIndex(const ast::Node& node, AnalysisUnit& unit, const NamespaceSet& index) {
        return analysis::call(getMember(node, unit, "__getitem__"), node, unit, {index}, {std::string()});
    }

    /*** Name: Namespace::setIndex */
    void Namespace::setIndex(const ast::Node&, AnalysisUnit&, const NamespaceSet&, const NamespaceSet&) {}

    /*** Name: Namespace::constantValueAsString */
    std::optional<std::string> Namespace::constantValueAsString() const {
        const host::ConstantValue* value = constantValue();
        if (value == nullptr) { return std::nullopt; }
        return host::constantAsString(*value);
    }

    NamespaceSet getMember(const NamespaceSet& values, const ast::Node& node, AnalysisUnit& unit,
                           const std::string& name) {
        NamespaceSet out;
        for (Namespace* value : values) { out = out.unionWith(value->getMember(node, unit, name)); }
        return out;
    }

    NamespaceSet call(const NamespaceSet& values, const ast::Node& node, AnalysisUnit& unit,
                      const std::vector<NamespaceSet>& args, const std::vector<std::string>& argNames) {
        NamespaceSet out;
        for (Namespace* value : values) { out = out.unionWith(value->call(node, unit, args, argNames)); }
        return out;
    }

    NamespaceSet getEnumeratorTypes(const NamespaceSet& values, const ast::Node& node, AnalysisUnit& unit) {
        NamespaceSet out;
        for (Namespace* value : values) { out = out.unionWith(value->getEnumeratorTypes(node, unit)); }
        return out;
    }

} // namespace pyinfer::analysis
