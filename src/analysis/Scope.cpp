/***
 * Name: Scope (definitions)
 */
#include "analysis/Scope.h"

namespace pyinfer::analysis {

    /*** Name: Scope::moduleScope */
    Scope& Scope::moduleScope() {
        Scope* scope = this;
        while (scope->outer_ != nullptr) { scope = scope->outer_; }
        return *scope;
    }

    /*** Name: Scope::findVariable */
    VariableDef* Scope::findVariable(const std::string& name) const {
        const auto it = variables_.find(name);
        return it == variables_.end() ? nullptr : it->second.get();
    }

    /*** Name: Scope::createVariable */
    VariableDef& Scope::createVariable(const std::string& name) {
        auto& slot = variables_[name];
        if (!slot) { slot = std::make_unique<VariableDef>(variableCap_); }
        return *slot;
    }

    /*** Name: Scope::getOrMakeNodeValue */
    NamespaceSet Scope::getOrMakeNodeValue(const ast::Node& node, const std::function<NamespaceSet()>& factory) {
        const auto it = nodeValues_.find(&node);
        if (it != nodeValues_.end()) { return it->second; }
        // Placeholder first: a factory that re-enters for the same node sees the empty set.
        nodeValues_.emplace(&node, NamespaceSet{});
        NamespaceSet value = factory();
        nodeValues_[&node] = value;
        return value;
    }

} // namespace pyinfer::analysis
