/***
 * Name: BuiltinClassInfo (definitions)
 * Purpose: Builtin types and their list, tuple and object refinements.
 * Theory of Operation:
 *   Member lookup goes to the host type. When the declaring module holds a specialization
 *   for "Type.member" the host member is wrapped once and the wrapper is reused, so a
 *   specialization installed later is still observed through the same value.
 */
#include "analysis/values/BuiltinValues.h"

#include "analysis/AnalysisSession.h"
#include "analysis/AnalysisUnit.h"
#include "analysis/Scope.h"
#include "analysis/values/SequenceInfo.h"
#include "analysis/values/SpecializedCallable.h"

namespace pyinfer::analysis {

    BuiltinClassInfo::BuiltinClassInfo(AnalysisSession& session, const host::HostType& type)
        : Namespace(NamespaceKind::BuiltinClass), session_(session), type_(type) {}

    /*** Name: BuiltinClassInfo::instance */
    BuiltinInstanceInfo& BuiltinClassInfo::instance() {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (instance_ == nullptr) { instance_ = session_.make<BuiltinInstanceInfo>(session_, *this); }
        return *instance_;
    }

    std::string BuiltinClassInfo::name() const { return type_.name(); }

    std::string BuiltinClassInfo::description() const { return "type " + type_.name(); }

    /*** Name: BuiltinClassInfo::getMember */
    NamespaceSet BuiltinClassInfo::getMember(const ast::Node&, AnalysisUnit&, const std::string& name) {
        const host::HostObject* member = type_.member(session_.defaultContext(), name);
        if (member == nullptr) { return {}; }
        Namespace* value = session_.valueOf(member);
        ModuleLike* table = session_.loadedModule(type_.declaringModule());
        if (table != nullptr) {
            const std::string qualified = type_.name() + "." + name;
            if (table->specialization(qualified)) {
                const std::lock_guard<std::mutex> lock(mutex_);
                Namespace*& slot = specialized_[name];
                if (slot == nullptr) { slot = session_.make<SpecializedCallable>(session_, value, *table, qualified); }
                return slot->selfSet();
            }
        }
        return NamespaceSet(value);
    }

    /*** Name: BuiltinClassInfo::call */
    NamespaceSet BuiltinClassInfo::call(const ast::Node&, AnalysisUnit&, const std::vector<NamespaceSet>&,
                                        const std::vector<std::string>&) {
        return instanceSet();
    }

    NamespaceSet BuiltinClassInfo::instanceSet() { return instance().selfSet(); }

    std::map<std::string, NamespaceSet> BuiltinClassInfo::allMembers() {
        return session_.allMembers(type_, session_.defaultContext());
    }

    namespace {
        // One sequence per call site: repeated evaluation of the same call yields the same value.
        NamespaceSet sequenceForCall(AnalysisSession& session, BuiltinClassInfo* type, const ast::Node& node,
                                     AnalysisUnit& unit, const std::vector<NamespaceSet>& args) {
            NamespaceSet result = unit.scope().getOrMakeNodeValue(node, [&] {
                return session.make<SequenceInfo>(session, type, session.limits().maxVariableTypes)->selfSet();
            });
            if (!args.empty()) {
                const NamespaceSet elements = analysis::getEnumeratorTypes(args.front(), node, unit);
                for (SequenceInfo* sequence : result.ofType<SequenceInfo>()) { sequence->addElementTypes(elements); }
            }
            return result;
        }
    } // namespace

    /*** Name: ListBuiltinClassInfo::call */
    NamespaceSet ListBuiltinClassInfo::call(const ast::Node& node, AnalysisUnit& unit,
                                            const std::vector<NamespaceSet>& args, const std::vector<std::string>&) {
        return sequenceForCall(session(), this, node, unit, args);
    }

    /*** Name: TupleBuiltinClassInfo::call */
    NamespaceSet TupleBuiltinClassInfo::call(const ast::Node& node, AnalysisUnit& unit,
                                             const std::vector<NamespaceSet>& args, const std::vector<std::string>&) {
        return sequenceForCall(session(), this, node, unit, args);
    }

    /*** Name: ObjectBuiltinClassInfo::getMember */
    NamespaceSet ObjectBuiltinClassInfo::getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) {
        if (name != "__new__") { return BuiltinClassInfo::getMember(node, unit, name); }
        if (new_ == nullptr) {
            Namespace* original = session().aggregate(BuiltinClassInfo::getMember(node, unit, name).items());
            CallOverride fn = [](const ast::Node&, AnalysisUnit&, const std::vector<NamespaceSet>& args,
                                 const std::vector<std::string>&) -> std::optional<NamespaceSet> {
                if (args.empty()) { return std::nullopt; }
                NamespaceSet out;
                for (Namespace* cls : args.front()) { out = out.unionWith(cls->instanceSet()); }
                return out;
            };
            new_ = session().make<SpecializedCallable>(session(), original, "object.__new__",
                                                       SpecializationEntry{std::move(fn), false});
        }
        return new_->selfSet();
    }

} // namespace pyinfer::analysis
