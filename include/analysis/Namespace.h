/***
 * Name: pyinfer::analysis::Namespace
 * Purpose: One abstract value: a class, instance, function, module, constant or aggregate.
 * Inputs: Call-site AST nodes and the analysis unit performing the evaluation.
 * Outputs: Value sets for member access, calls, iteration and indexing.
 * Theory of Operation:
 *   Every Namespace is created through AnalysisSession::make, which assigns a unique,
 *   monotonically increasing id and keeps the object alive for the session lifetime.
 *   The id orders NamespaceSet members; identity is the pointer. The default operations
 *   model an opaque value: every lookup yields the empty set.
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "analysis/NamespaceSet.h"
#include "host/ConstantValue.h"

namespace pyinfer::ast {
    struct Node;
}

namespace pyinfer::analysis {

    class AnalysisSession;
    class AnalysisUnit;
    class ModuleLike;

    enum class NamespaceKind {
        BuiltinClass,
        BuiltinInstance,
        BuiltinFunction,
        BuiltinMethod,
        BuiltinProperty,
        BuiltinModule,
        Constant,
        Reflected,
        MultipleMembers,
        Module,
        Class,
        Instance,
        Function,
        BoundMethod,
        Sequence,
        Iterator,
        Super,
        Specialized
    };

    const char* to_string(NamespaceKind kind);

    // Completion category reported to consumers.
    enum class MemberType { Unknown, Class, Instance, Function, Method, Property, Module, Constant, Multiple };

    const char* to_string(MemberType type);

    // Unknown for an empty set, Multiple when the members disagree.
    MemberType memberTypeOf(const NamespaceSet& values);

    class Namespace {
    public:
        virtual ~Namespace() = default;
        Namespace(const Namespace&) = delete;
        Namespace& operator=(const Namespace&) = delete;

        NamespaceKind kind() const { return kind_; }
        std::uint64_t id() const { return id_; }
        const NamespaceSet& selfSet() const { return self_; }

        virtual std::string name() const = 0;
        virtual std::string description() const { return name(); }
        virtual MemberType memberType() const { return MemberType::Unknown; }

        virtual NamespaceSet getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name);
        virtual void setMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name,
                               const NamespaceSet& value);
        virtual NamespaceSet call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                                  const std::vector<std::string>& argNames);
        // Iterator objects produced by `iter(value)`.
        virtual NamespaceSet getIterator(const ast::Node& node, AnalysisUnit& unit);
        // Element values produced by iterating over the value.
        virtual NamespaceSet getEnumeratorTypes(const ast::Node& node, AnalysisUnit& unit);
        virtual NamespaceSet getIndex(const ast::Node& node, AnalysisUnit& unit, const NamespaceSet& index);
        virtual void setIndex(const ast::Node& node, AnalysisUnit& unit, const NamespaceSet& index,
                              const NamespaceSet& value);

        // Values produced by instantiating a class; empty for non-classes.
        virtual NamespaceSet instanceSet() { return {}; }
        // Members visible without an analysis unit (completion queries); no dependencies recorded.
        virtual std::map<std::string, NamespaceSet> allMembers() { return {}; }

        virtual const host::ConstantValue* constantValue() const { return nullptr; }
        std::optional<std::string> constantValueAsString() const;

        virtual ModuleLike* asModule() { return nullptr; }

    protected:
        explicit Namespace(NamespaceKind kind) : kind_(kind) {}

    private:
        friend class AnalysisSession;
        void attach(std::uint64_t id) {
            id_ = id;
            self_ = NamespaceSet(this);
        }

        NamespaceKind kind_;
        std::uint64_t id_{0};
        NamespaceSet self_{};
    };

    /*** Set-level helpers: apply an operation to every member and union the results. */
    NamespaceSet getMember(const NamespaceSet& values, const ast::Node& node, AnalysisUnit& unit,
                           const std::string& name);
    NamespaceSet call(const NamespaceSet& values, const ast::Node& node, AnalysisUnit& unit,
                      const std::vector<NamespaceSet>& args, const std::vector<std::string>& argNames);
    NamespaceSet getEnumeratorTypes(const NamespaceSet& values, const ast::Node& node, AnalysisUnit& unit);

} // namespace pyinfer::analysis
