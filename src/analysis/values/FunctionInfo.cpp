/***
 * Name: FunctionInfo, BoundMethodInfo (definitions)
 * Purpose: User functions: call-site argument binding and accumulated return values.
 * Theory of Operation:
 *   Each call joins the argument values into the parameter variables. When that changes a
 *   parameter the body is queued for re-analysis; the caller is recorded as a dependent
 *   of the return value, so it re-runs when the body later returns something new.
 */
#include "analysis/values/FunctionInfo.h"

#include "analysis/AnalysisSession.h"
#include "analysis/AnalysisUnit.h"
#include "analysis/ProjectEntry.h"
#include "analysis/values/SequenceInfo.h"
#include "analysis/values/SpecializedCallable.h"
#include "ast/FunctionDef.h"
#include "ast/Param.h"

namespace pyinfer::analysis {

    FunctionInfo::FunctionInfo(AnalysisSession& session, ProjectEntry* entry, const ast::FunctionDef& def,
                               Scope& outer)
        : Namespace(NamespaceKind::Function), session_(session), entry_(entry), def_(&def), name_(def.name),
          scope_(ScopeKind::Function, &outer, this, session.limits().maxVariableTypes),
          returnValue_(session.limits().maxReturnTypes) {
        // Parameters are bound by the definition itself, so lookups never escape to outer scopes.
        const EncodedLocation where{entry, def.line, def.col};
        for (const ast::Param& param : def.params) {
            params_.push_back(Parameter{param.name, param.isVarArg, param.isKwVarArg});
            scope_.createVariable(param.name).addAssignment(where);
        }
        if (entry_ != nullptr) { entry_->trackDefinition(*this); }
    }

    std::size_t FunctionInfo::parameterCount() const { return params_.size(); }

    VariableDef* FunctionInfo::parameter(std::size_t index) {
        if (index >= params_.size()) { return nullptr; }
        return scope_.findVariable(params_[index].name);
    }

    AnalysisUnit* FunctionInfo::unit() {
        if (def_ == nullptr) { return nullptr; }
        if (!unit_) { unit_ = session_.makeUnit(entry_, scope_, *def_).shared_from_this(); }
        return unit_.get();
    }

    void FunctionInfo::detach() {
        def_ = nullptr;
        unit_.reset();
    }

    bool FunctionInfo::isMethod() const { return scope_.outer() != nullptr && scope_.outer()->kind() == ScopeKind::Class; }

    Namespace& FunctionInfo::specialized(const ModuleLike& table, const std::string& qualifiedName) {
        if (specialized_ == nullptr) {
            specialized_ = session_.make<SpecializedCallable>(session_, this, table, qualifiedName);
        }
        return *specialized_;
    }

    std::string FunctionInfo::name() const { return name_; }

    std::string FunctionInfo::description() const {
        std::string out = "def " + name_ + "(";
        for (std::size_t i = 0; i < params_.size(); ++i) {
            if (i != 0) { out += ", "; }
            const Parameter& param = params_[i];
            out += param.isVarArg ? "*" : (param.isKwVarArg ? "**" : "");
            out += param.name;
        }
        return out + ")";
    }

    NamespaceSet FunctionInfo::getMember(const ast::Node&, AnalysisUnit&, const std::string& name) {
        if (name == "__name__") { return session_.constant(host::ConstantValue{name_}); }
        return {};
    }

    SequenceInfo& FunctionInfo::varArgs() {
        if (varArgs_ == nullptr) {
            varArgs_ = session_.make<SequenceInfo>(session_, session_.knownType(host::BuiltinTypeId::Tuple),
                                                   session_.limits().maxVariableTypes);
        }
        return *varArgs_;
    }

    /*** Name: FunctionInfo::bindArguments */
    bool FunctionInfo::bindArguments(const std::vector<NamespaceSet>& args, const std::vector<std::string>& argNames) {
        std::vector<std::size_t> positional;
        const Parameter* varArg = nullptr;
        const Parameter* kwArg = nullptr;
        for (std::size_t i = 0; i < params_.size(); ++i) {
            const Parameter& param = params_[i];
            if (param.isVarArg) {
                varArg = &param;
            } else if (param.isKwVarArg) {
                kwArg = &param;
            } else {
                positional.push_back(i);
            }
        }

        bool changed = false;
        if (varArg != nullptr) { changed |= scope_.createVariable(varArg->name).addTypes(varArgs().selfSet()); }
        if (kwArg != nullptr) {
            changed |= scope_.createVariable(kwArg->name).addTypes(session_.knownInstance(host::BuiltinTypeId::Dict));
        }

        std::size_t next = 0;
        for (std::size_t k = 0; k < args.size(); ++k) {
            const std::string& keyword = k < argNames.size() ? argNames[k] : std::string();
            if (keyword.empty()) {
                if (next < positional.size()) {
                    changed |= parameter(positional[next++])->addTypes(args[k]);
                } else if (varArg != nullptr) {
                    changed |= varArgs().addElementTypes(args[k]);
                }
                continue;
            }
            VariableDef* target = nullptr;
            for (std::size_t index : positional) {
                if (params_[index].name == keyword) { target = parameter(index); }
            }
            if (target != nullptr) { changed |= target->addTypes(args[k]); }
        }
        return changed;
    }

    /*** Name: FunctionInfo::call */
    NamespaceSet FunctionInfo::call(const ast::Node&, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                                    const std::vector<std::string>& argNames) {
        if (bindArguments(args, argNames)) {
            if (AnalysisUnit* body = this->unit()) { body->enqueue(); }
        }
        returnValue_.addDependency(unit);
        return returnValue_.types();
    }

    bool bindsToInstance(const Namespace& value) {
        if (value.kind() == NamespaceKind::Function) { return true; }
        if (value.kind() != NamespaceKind::Specialized) { return false; }
        const Namespace* original = static_cast<const SpecializedCallable&>(value).original();
        return original != nullptr && original->kind() == NamespaceKind::Function;
    }

    /*** Name: BoundMethodInfo::call */
    NamespaceSet BoundMethodInfo::call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                                       const std::vector<std::string>& argNames) {
        std::vector<NamespaceSet> boundArgs;
        boundArgs.reserve(args.size() + 1);
        boundArgs.push_back(self_.selfSet());
        boundArgs.insert(boundArgs.end(), args.begin(), args.end());
        std::vector<std::string> boundNames;
        boundNames.reserve(args.size() + 1);
        boundNames.emplace_back();
        boundNames.insert(boundNames.end(), argNames.begin(), argNames.end());
        boundNames.resize(boundArgs.size());
        return function_.call(node, unit, boundArgs, boundNames);
    }

} // namespace pyinfer::analysis
