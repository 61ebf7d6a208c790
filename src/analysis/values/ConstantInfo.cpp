/***
 * Name: ConstantInfo (definitions)
 * Purpose: A constant behaves like an instance of its type for every operation.
 */
#include "analysis/values/BuiltinValues.h"

#include "analysis/AnalysisSession.h"

namespace pyinfer::analysis {

    std::string ConstantInfo::name() const { return type_ != nullptr ? type_->name() : "constant"; }

    std::string ConstantInfo::description() const {
        if (value_) { return host::describeConstant(*value_); }
        return name();
    }

    NamespaceSet ConstantInfo::getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) {
        if (type_ == nullptr) { return {}; }
        return type_->instance().getMember(node, unit, name);
    }

    NamespaceSet ConstantInfo::call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                                    const std::vector<std::string>& argNames) {
        if (type_ == nullptr) { return {}; }
        return type_->instance().call(node, unit, args, argNames);
    }

    NamespaceSet ConstantInfo::getIterator(const ast::Node& node, AnalysisUnit& unit) {
        if (type_ == nullptr) { return {}; }
        return type_->instance().getIterator(node, unit);
    }

    NamespaceSet ConstantInfo::getEnumeratorTypes(const ast::Node& node, AnalysisUnit& unit) {
        if (type_ == nullptr) { return {}; }
        return type_->instance().getEnumeratorTypes(node, unit);
    }

    NamespaceSet ConstantInfo::getIndex(const ast::Node& node, AnalysisUnit& unit, const NamespaceSet& index) {
        if (type_ == nullptr) { return {}; }
        return type_->instance().getIndex(node, unit, index);
    }

} // namespace pyinfer::analysis
