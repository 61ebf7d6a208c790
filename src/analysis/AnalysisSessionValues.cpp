/***
 * Name: AnalysisSession (value universe)
 * Purpose: Map host objects and constants to their one abstract value each.
 * Theory of Operation:
 *   Host objects are keyed by identity in the item cache; constants by value; aggregates
 *   by the ids of their members; bound methods by (function, self). A factory runs at
 *   most once per key. Objects the host cannot classify are typed through the host's
 *   declared type or, failing that, reported as a host contract breach.
 */
#include "analysis/AnalysisSession.h"

#include <algorithm>

#include "analysis/values/BuiltinValues.h"
#include "analysis/values/FunctionInfo.h"
#include "analysis/values/MultipleMemberInfo.h"
#include "pyinfer/exceptions/host_contract_error.h"

namespace pyinfer::analysis {

    std::size_t AnalysisSession::NamespacePairHash::operator()(
        const std::pair<const Namespace*, const Namespace*>& key) const {
        const std::size_t first = std::hash<const Namespace*>{}(key.first);
        const std::size_t second = std::hash<const Namespace*>{}(key.second);
        return first ^ (second + 0x9e3779b97f4a7c15ULL + (first << 6) + (first >> 2));
    }

    template <typename Factory>
    Namespace* AnalysisSession::cachedValue(const host::HostObject* key, Factory&& factory) {
        return itemCache_.getCached(key, [&]() -> Namespace* {
            metrics_.incCounter("cache_misses");
            return factory();
        });
    }

    /*** Name: AnalysisSession::valueOf */
    Namespace* AnalysisSession::valueOf(const host::HostObject* obj) {
        if (obj == nullptr) { return noneConstant(); }
        switch (host::classify(obj)) {
            case host::HostObjectKind::Type:
                return builtinType(static_cast<const host::HostType*>(obj));
            case host::HostObjectKind::Function: {
                const auto& function = static_cast<const host::HostFunction&>(*obj);
                return cachedValue(obj, [&] { return make<BuiltinFunctionInfo>(*this, function); });
            }
            case host::HostObjectKind::MethodDescriptor: {
                const auto& method = static_cast<const host::HostMethodDescriptor&>(*obj);
                return cachedValue(obj, [&] { return make<BuiltinMethodInfo>(*this, method); });
            }
            case host::HostObjectKind::Property: {
                const auto& property = static_cast<const host::HostProperty&>(*obj);
                return cachedValue(obj, [&] { return make<BuiltinPropertyInfo>(*this, property); });
            }
            case host::HostObjectKind::Module:
                return builtinModule(static_cast<const host::HostModule&>(*obj));
            case host::HostObjectKind::Constant: {
                const auto& constant = static_cast<const host::HostConstant&>(*obj);
                return cachedValue(obj, [&] {
                    return make<ConstantInfo>(*this, builtinType(constant.type()), std::nullopt);
                });
            }
            case host::HostObjectKind::Primitive: {
                const NamespaceSet values = constant(static_cast<const host::HostPrimitive&>(*obj).value());
                return values.empty() ? nullptr : *values.begin();
            }
            case host::HostObjectKind::MemberContainer: {
                const auto& container = static_cast<const host::HostMemberContainer&>(*obj);
                return cachedValue(obj, [&] { return make<ReflectedNamespace>(*this, container); });
            }
            case host::HostObjectKind::MultipleMembers: {
                std::vector<Namespace*> members;
                for (const host::HostObject* member : static_cast<const host::HostMultipleMembers&>(*obj).members()) {
                    members.push_back(valueOf(member));
                }
                return aggregate(std::move(members));
            }
            case host::HostObjectKind::Unknown:
                break;
        }
        return unknownObject(obj);
    }

    /*** Name: AnalysisSession::unknownObject */
    Namespace* AnalysisSession::unknownObject(const host::HostObject* obj) {
        if (const host::HostType* declared = interpreter_.declaredTypeOf(obj)) {
            if (BuiltinClassInfo* type = builtinType(declared)) { return &type->instance(); }
        }
        metrics_.incCounter("host_contract_breaches");
        const std::string message =
            std::string("unclassifiable host object (declared kind ") + host::to_string(obj->kind()) + ")";
        if (options_.strictHostContracts) { throw exceptions::HostContractError(message); }
        log_.write(obs::LogCategory::Host, message);
        BuiltinClassInfo* object = knownType(host::BuiltinTypeId::Object);
        return object != nullptr ? &object->instance() : nullptr;
    }

    NamespaceSet AnalysisSession::valuesOf(const std::vector<const host::HostObject*>& objects) {
        std::vector<Namespace*> values;
        values.reserve(objects.size());
        for (const host::HostObject* obj : objects) { values.push_back(valueOf(obj)); }
        return NamespaceSet::of(std::move(values));
    }

    /*** Name: AnalysisSession::builtinType */
    BuiltinClassInfo* AnalysisSession::builtinType(const host::HostType* type) {
        if (type == nullptr) { return nullptr; }
        Namespace* value = cachedValue(type, [&]() -> Namespace* {
            switch (type->typeId()) {
                case host::BuiltinTypeId::List: return make<ListBuiltinClassInfo>(*this, *type);
                case host::BuiltinTypeId::Tuple: return make<TupleBuiltinClassInfo>(*this, *type);
                case host::BuiltinTypeId::Object: return make<ObjectBuiltinClassInfo>(*this, *type);
                default: return make<BuiltinClassInfo>(*this, *type);
            }
        });
        return static_cast<BuiltinClassInfo*>(value);
    }

    BuiltinModule* AnalysisSession::builtinModule(const host::HostModule& module) {
        return static_cast<BuiltinModule*>(cachedValue(&module, [&] { return make<BuiltinModule>(*this, module); }));
    }

    BuiltinClassInfo* AnalysisSession::knownType(host::BuiltinTypeId id) {
        return builtinType(interpreter_.builtinType(id));
    }

    NamespaceSet AnalysisSession::knownInstance(host::BuiltinTypeId id) {
        BuiltinClassInfo* type = knownType(id);
        return type != nullptr ? type->instanceSet() : NamespaceSet{};
    }

    /*** Name: AnalysisSession::constant */
    NamespaceSet AnalysisSession::constant(const host::ConstantValue& value) {
        Namespace* info = constantCache_.getCached(value, [&]() -> Namespace* {
            metrics_.incCounter("cache_misses");
            BuiltinClassInfo* type =
                knownType(host::typeIdOf(value, options_.languageVersion == config::LanguageVersion::V3));
            return make<ConstantInfo>(*this, type, value);
        });
        return NamespaceSet(info);
    }

    Namespace* AnalysisSession::noneConstant() {
        const NamespaceSet none = constant(host::ConstantValue{});
        return none.empty() ? nullptr : *none.begin();
    }

    /*** Name: AnalysisSession::aggregate */
    Namespace* AnalysisSession::aggregate(std::vector<Namespace*> members) {
        members.erase(std::remove(members.begin(), members.end(), nullptr), members.end());
        std::sort(members.begin(), members.end(),
                  [](const Namespace* a, const Namespace* b) { return a->id() < b->id(); });
        members.erase(std::unique(members.begin(), members.end()), members.end());
        if (members.empty()) { return nullptr; }
        if (members.size() == 1) { return members.front(); }

        std::string key;
        for (const Namespace* member : members) { key += std::to_string(member->id()) + ","; }
        return aggregateCache_.getCached(key, [&] { return make<MultipleMemberInfo>(*this, members); });
    }

    Namespace* AnalysisSession::boundMethod(Namespace& function, Namespace& self) {
        return boundCache_.getCached({&function, &self},
                                     [&] { return make<BoundMethodInfo>(*this, function, self); });
    }

    BuiltinClassInfo* AnalysisSession::makeGenericType(const host::HostType* type,
                                                       const std::vector<const host::HostType*>& indexTypes) {
        if (type == nullptr) { return nullptr; }
        return builtinType(interpreter_.makeGenericType(type, indexTypes));
    }

    std::map<std::string, NamespaceSet> AnalysisSession::allMembers(const host::HostMemberContainer& container,
                                                                    const host::ModuleContext* ctx) {
        std::map<std::string, NamespaceSet> out;
        for (const std::string& name : container.memberNames(ctx)) {
            if (const host::HostObject* member = container.member(ctx, name)) {
                out[name] = NamespaceSet(valueOf(member));
            }
        }
        return out;
    }

    /*** Name: AnalysisSession::loadedModule */
    ModuleLike* AnalysisSession::loadedModule(const std::string& moduleName) const {
        auto ref = modules_.peek(moduleName);
        if (!ref || !ref->isLoaded() || !ref->isValid()) { return nullptr; }
        return ref->moduleLike();
    }

    Namespace* AnalysisSession::builtinsModule() {
        auto ref = modules_.tryGetValue(builtinName_);
        return ref && ref->hasModule() ? ref->module() : nullptr;
    }

} // namespace pyinfer::analysis
