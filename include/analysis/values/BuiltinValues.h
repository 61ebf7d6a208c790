/***
 * Name: pyinfer::analysis (builtin values)
 * Purpose: Abstract values that wrap objects of the host type system.
 * Inputs: Host types, functions, method descriptors, properties, modules, constants.
 * Outputs: Namespaces whose member lookups and calls are answered by the host.
 * Theory of Operation:
 *   One wrapper exists per host object (memoized by AnalysisSession::valueOf). Calls on
 *   builtin functions produce instances of their declared return types. Member lookups
 *   consult the specialization table of the declaring module first, so that a registered
 *   override for "module.function" or "module.Type.method" replaces the host behavior.
 *   list, tuple and object get dedicated class wrappers; every other type is generic.
 */
#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "analysis/ModuleLike.h"
#include "analysis/Namespace.h"
#include "host/HostObject.h"

namespace pyinfer::analysis {

    class BuiltinInstanceInfo;

    class BuiltinClassInfo : public Namespace {
    public:
        BuiltinClassInfo(AnalysisSession& session, const host::HostType& type);

        const host::HostType& type() const { return type_; }
        BuiltinInstanceInfo& instance();

        std::string name() const override;
        std::string description() const override;
        MemberType memberType() const override { return MemberType::Class; }
        NamespaceSet getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) override;
        NamespaceSet call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                          const std::vector<std::string>& argNames) override;
        NamespaceSet instanceSet() override;
        std::map<std::string, NamespaceSet> allMembers() override;

    protected:
        AnalysisSession& session() const { return session_; }

    private:
        AnalysisSession& session_;
        const host::HostType& type_;
        std::mutex mutex_;
        BuiltinInstanceInfo* instance_{nullptr};
        std::map<std::string, Namespace*> specialized_{};
    };

    // list(...) produces an element-tracking sequence per call site.
    class ListBuiltinClassInfo final : public BuiltinClassInfo {
    public:
        using BuiltinClassInfo::BuiltinClassInfo;
        NamespaceSet call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                          const std::vector<std::string>& argNames) override;
    };

    class TupleBuiltinClassInfo final : public BuiltinClassInfo {
    public:
        using BuiltinClassInfo::BuiltinClassInfo;
        NamespaceSet call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                          const std::vector<std::string>& argNames) override;
    };

    // object.__new__(cls) produces an instance of each class passed as `cls`.
    class ObjectBuiltinClassInfo final : public BuiltinClassInfo {
    public:
        using BuiltinClassInfo::BuiltinClassInfo;
        NamespaceSet getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) override;

    private:
        Namespace* new_{nullptr};
    };

    class BuiltinInstanceInfo final : public Namespace {
    public:
        BuiltinInstanceInfo(AnalysisSession& session, BuiltinClassInfo& cls)
            : Namespace(NamespaceKind::BuiltinInstance), session_(session), class_(cls) {}

        BuiltinClassInfo& classInfo() const { return class_; }

        std::string name() const override { return class_.name(); }
        MemberType memberType() const override { return MemberType::Instance; }
        NamespaceSet getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) override;
        NamespaceSet call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                          const std::vector<std::string>& argNames) override;
        // Strings iterate and index to strings when the host types no `__iter__`/`__getitem__` result.
        NamespaceSet getEnumeratorTypes(const ast::Node& node, AnalysisUnit& unit) override;
        NamespaceSet getIndex(const ast::Node& node, AnalysisUnit& unit, const NamespaceSet& index) override;
        std::map<std::string, NamespaceSet> allMembers() override { return class_.allMembers(); }

    private:
        AnalysisSession& session_;
        BuiltinClassInfo& class_;
    };

    // A constant of a builtin type; the value is unknown for named host constants.
    class ConstantInfo final : public Namespace {
    public:
        ConstantInfo(AnalysisSession& session, BuiltinClassInfo* type, std::optional<host::ConstantValue> value)
            : Namespace(NamespaceKind::Constant), session_(session), type_(type), value_(std::move(value)) {}

        BuiltinClassInfo* typeInfo() const { return type_; }

        std::string name() const override;
        std::string description() const override;
        MemberType memberType() const override { return MemberType::Constant; }
        NamespaceSet getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) override;
        NamespaceSet call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                          const std::vector<std::string>& argNames) override;
        NamespaceSet getIterator(const ast::Node& node, AnalysisUnit& unit) override;
        NamespaceSet getEnumeratorTypes(const ast::Node& node, AnalysisUnit& unit) override;
        NamespaceSet getIndex(const ast::Node& node, AnalysisUnit& unit, const NamespaceSet& index) override;
        const host::ConstantValue* constantValue() const override { return value_ ? &*value_ : nullptr; }

    private:
        AnalysisSession& session_;
        BuiltinClassInfo* type_;
        std::optional<host::ConstantValue> value_;
    };

    class BuiltinFunctionInfo final : public Namespace {
    public:
        BuiltinFunctionInfo(AnalysisSession& session, const host::HostFunction& function)
            : Namespace(NamespaceKind::BuiltinFunction), session_(session), function_(function) {}

        const host::HostFunction& function() const { return function_; }

        std::string name() const override { return function_.name(); }
        std::string description() const override;
        MemberType memberType() const override { return MemberType::Function; }
        NamespaceSet call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                          const std::vector<std::string>& argNames) override;

    private:
        AnalysisSession& session_;
        const host::HostFunction& function_;
    };

    class BuiltinMethodInfo final : public Namespace {
    public:
        BuiltinMethodInfo(AnalysisSession& session, const host::HostMethodDescriptor& method)
            : Namespace(NamespaceKind::BuiltinMethod), session_(session), method_(method) {}

        std::string name() const override;
        MemberType memberType() const override { return MemberType::Method; }
        NamespaceSet call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                          const std::vector<std::string>& argNames) override;

    private:
        AnalysisSession& session_;
        const host::HostMethodDescriptor& method_;
    };

    class BuiltinPropertyInfo final : public Namespace {
    public:
        BuiltinPropertyInfo(AnalysisSession& session, const host::HostProperty& property)
            : Namespace(NamespaceKind::BuiltinProperty), session_(session), property_(property) {}

        std::string name() const override { return "property"; }
        MemberType memberType() const override { return MemberType::Property; }
        // Instances of the property's declared type.
        NamespaceSet propertyValue();

    private:
        AnalysisSession& session_;
        const host::HostProperty& property_;
    };

    class BuiltinModule final : public Namespace, public ModuleLike {
    public:
        BuiltinModule(AnalysisSession& session, const host::HostModule& module)
            : Namespace(NamespaceKind::BuiltinModule), session_(session), module_(module) {}

        const host::HostModule& hostModule() const { return module_; }

        std::string name() const override { return module_.name(); }
        std::string description() const override { return "built-in module " + module_.name(); }
        MemberType memberType() const override { return MemberType::Module; }
        NamespaceSet getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) override;
        std::map<std::string, NamespaceSet> allMembers() override;
        ModuleLike* asModule() override { return this; }

        std::string moduleName() const override { return module_.name(); }
        Namespace* childPackage(const host::ModuleContext* ctx, const std::string& name) override;
        std::map<std::string, Namespace*> childPackages(const host::ModuleContext* ctx) override;
        MemberPresence memberPresence(const host::ModuleContext* ctx, const std::string& name) override;

        // Member value with any installed specialization applied; empty when absent.
        NamespaceSet memberValue(const std::string& name);

    private:
        const host::ModuleContext* context(const host::ModuleContext* ctx) const;

        AnalysisSession& session_;
        const host::HostModule& module_;
        std::mutex mutex_;
        std::map<std::string, Namespace*> specialized_{};
    };

    // Generic reflectable container (anything with named members the host cannot type further).
    class ReflectedNamespace final : public Namespace {
    public:
        ReflectedNamespace(AnalysisSession& session, const host::HostMemberContainer& container)
            : Namespace(NamespaceKind::Reflected), session_(session), container_(container) {}

        std::string name() const override { return "<reflected>"; }
        NamespaceSet getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) override;
        std::map<std::string, NamespaceSet> allMembers() override;

    private:
        AnalysisSession& session_;
        const host::HostMemberContainer& container_;
    };

} // namespace pyinfer::analysis
