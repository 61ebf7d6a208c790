/***
 * Name: pyinfer::analysis::Scope
 * Purpose: Variables of one module, class or function body, plus per-node memoized values.
 * Theory of Operation:
 *   Scopes nest through `outer`. Variables are owned by the scope and have stable addresses.
 *   Values created for a specific AST node (list literals, nested definitions, `range()`
 *   results) are memoized per node so that re-evaluating the node yields the same abstract
 *   value and the fixed point is reachable.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>

#include "analysis/NamespaceSet.h"
#include "analysis/VariableDef.h"

namespace pyinfer::ast {
    struct Node;
}

namespace pyinfer::analysis {

    class Namespace;

    enum class ScopeKind { Module, Class, Function };

    class Scope {
    public:
        Scope(ScopeKind kind, Scope* outer, Namespace* owner, std::size_t variableCap)
            : kind_(kind), outer_(outer), owner_(owner), variableCap_(variableCap) {}

        ScopeKind kind() const { return kind_; }
        Scope* outer() const { return outer_; }
        // The ModuleInfo, ClassInfo or FunctionInfo this scope belongs to.
        Namespace* owner() const { return owner_; }
        Scope& moduleScope();

        VariableDef* findVariable(const std::string& name) const;
        VariableDef& createVariable(const std::string& name);
        const std::map<std::string, std::unique_ptr<VariableDef>>& variables() const { return variables_; }

        NamespaceSet getOrMakeNodeValue(const ast::Node& node, const std::function<NamespaceSet()>& factory);

        // Drops variables; node values survive so definitions keep their identity.
        void clear() { variables_.clear(); }
        void clearNodeValues() { nodeValues_.clear(); }

    private:
        ScopeKind kind_;
        Scope* outer_;
        Namespace* owner_;
        std::size_t variableCap_;
        std::map<std::string, std::unique_ptr<VariableDef>> variables_{};
        std::unordered_map<const ast::Node*, NamespaceSet> nodeValues_{};
    };

} // namespace pyinfer::analysis
