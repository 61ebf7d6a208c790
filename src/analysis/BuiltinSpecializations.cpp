/***
 * Name: installBuiltinSpecializations (definitions)
 * Purpose: The standard override set every session installs at construction and reload.
 * Theory of Operation:
 *   Overrides on the builtin module model functions whose result depends on their
 *   arguments in a way host signatures cannot express (range, min, getattr, iter, super).
 *   Library overrides short-circuit functions whose generic analysis explodes (copy,
 *   pprint, pickle) or whose constructors need no analysis. Registrations for modules
 *   that are not loaded yet are replayed when the module appears.
 */
#include "analysis/BuiltinSpecializations.h"

#include <filesystem>

#include "analysis/AnalysisSession.h"
#include "analysis/Scope.h"
#include "analysis/values/BuiltinValues.h"
#include "analysis/values/ClassInfo.h"
#include "analysis/values/FunctionInfo.h"
#include "analysis/values/SequenceInfo.h"
#include "analysis/values/SuperInfo.h"

namespace pyinfer::analysis {

    namespace {

        using Args = std::vector<NamespaceSet>;
        using Names = std::vector<std::string>;
        using Result = std::optional<NamespaceSet>;

        Result nop(const ast::Node&, AnalysisUnit&, const Args&, const Names&) { return NamespaceSet{}; }

        Result copyFunction(const ast::Node&, AnalysisUnit&, const Args& args, const Names&) {
            if (args.empty()) { return NamespaceSet{}; }
            return args.front();
        }

        Result unionOfInputs(const ast::Node&, AnalysisUnit& unit, const Args& args, const Names&) {
            return NamespaceSet::unionAll(args, unit.session().limits().maxVariableTypes);
        }

        CallOverride returnsInstanceOf(host::BuiltinTypeId id) {
            return [id](const ast::Node&, AnalysisUnit& unit, const Args&, const Names&) -> Result {
                return unit.session().knownInstance(id);
            };
        }

        /*** Name: range: one list of ints per call site */
        Result range(const ast::Node& node, AnalysisUnit& unit, const Args&, const Names&) {
            AnalysisSession& session = unit.session();
            return unit.scope().getOrMakeNodeValue(node, [&] {
                auto* list = session.make<SequenceInfo>(session, session.knownType(host::BuiltinTypeId::List),
                                                        session.limits().maxVariableTypes);
                list->addElementTypes(session.knownInstance(host::BuiltinTypeId::Int));
                return list->selfSet();
            });
        }

        /*** Name: getattr(obj, name[, default]) */
        Result specialGetattr(const ast::Node& node, AnalysisUnit& unit, const Args& args, const Names&) {
            NamespaceSet result;
            if (args.size() < 2) { return result; }
            if (args.size() >= 3) { result = args[2]; }
            for (Namespace* value : args[0]) {
                for (Namespace* name : args[1]) {
                    if (auto text = name->constantValueAsString()) {
                        result = result.unionWith(value->getMember(node, unit, *text));
                    }
                }
            }
            return result;
        }

        /*** Name: next(iterator[, default]) */
        Result specialNext(const ast::Node& node, AnalysisUnit& unit, const Args& args, const Names& argNames) {
            if (args.empty()) { return NamespaceSet{}; }
            const Args rest(args.begin() + 1, args.end());
            const Names restNames(argNames.empty() ? argNames.end() : argNames.begin() + 1, argNames.end());
            const NamespaceSet method = analysis::getMember(args[0], node, unit, unit.session().nextMethodName());
            return analysis::call(method, node, unit, rest, restNames);
        }

        /*** Name: iter(iterable) / iter(callable, sentinel) */
        Result specialIter(const ast::Node& node, AnalysisUnit& unit, const Args& args, const Names&) {
            if (args.size() == 1) {
                NamespaceSet result;
                for (Namespace* value : args[0]) { result = result.unionWith(value->getIterator(node, unit)); }
                return result;
            }
            if (args.size() != 2) { return NamespaceSet{}; }

            AnalysisSession& session = unit.session();
            const NamespaceSet iterator = unit.scope().getOrMakeNodeValue(node, [&] {
                return session
                    .make<IteratorInfo>(session, session.knownType(host::BuiltinTypeId::CallableIterator), nullptr,
                                        session.limits().maxVariableTypes)
                    ->selfSet();
            });
            // The sentinel never comes out of the iterator.
            const NamespaceSet produced = analysis::call(args[0], node, unit, {}, {});
            for (IteratorInfo* info : iterator.ofType<IteratorInfo>()) { info->addTypes(produced); }
            return iterator;
        }

        /*** Name: super() / super(cls[, obj]) */
        Result specialSuper(const ast::Node& node, AnalysisUnit& unit, const Args& args, const Names&) {
            if (args.size() > 2) { return NamespaceSet{}; }
            AnalysisSession& session = unit.session();

            NamespaceSet classes;
            NamespaceSet instances;
            if (args.empty()) {
                if (session.languageVersion() != config::LanguageVersion::V3) { return NamespaceSet{}; }
                // Nearest method scope directly inside a class scope.
                for (Scope* scope = &unit.scope(); scope != nullptr; scope = scope->outer()) {
                    if (scope->kind() != ScopeKind::Function || scope->outer() == nullptr ||
                        scope->outer()->kind() != ScopeKind::Class) {
                        continue;
                    }
                    auto* cls = dynamic_cast<ClassInfo*>(scope->outer()->owner());
                    auto* function = dynamic_cast<FunctionInfo*>(scope->owner());
                    if (cls == nullptr || function == nullptr) { break; }
                    classes = cls->selfSet();
                    if (function->parameterCount() > 0) { instances = cls->instanceSet(); }
                    break;
                }
            } else {
                classes = args[0];
                if (args.size() > 1) { instances = args[1]; }
            }
            if (classes.ofType<ClassInfo>().empty()) { return NamespaceSet{}; }

            return unit.scope().getOrMakeNodeValue(node, [&] {
                NamespaceSet result;
                for (ClassInfo* cls : classes.ofType<ClassInfo>()) {
                    result = result.add(session.make<SuperInfo>(session, *cls, instances));
                }
                return result;
            });
        }

        /*** Name: LoadComponent(self, path): bind a resource's named objects onto self */
        Result loadComponent(const ast::Node& node, AnalysisUnit& unit, const Args& args, const Names&) {
            if (args.size() != 2 || unit.entry() == nullptr) { return std::nullopt; }
            AnalysisSession& session = unit.session();
            const NamespaceSet& self = args[0];

            for (Namespace* arg : args[1]) {
                const auto relative = arg->constantValueAsString();
                if (!relative) { continue; }
                const std::string path =
                    (std::filesystem::path(unit.entry()->filePath()).parent_path() / *relative).string();
                ResourceProjectEntry* resource = session.resourceByPath(path);
                if (resource == nullptr) { continue; }

                resource->addDependency(*unit.entry());
                for (const auto& [name, type] : resource->namedObjects()) {
                    BuiltinClassInfo* cls = session.builtinType(type);
                    if (cls == nullptr) { continue; }
                    for (Namespace* target : self) { target->setMember(node, unit, name, cls->instanceSet()); }
                }
                return self;
            }
            return std::nullopt;
        }

    } // namespace

    /*** Name: installBuiltinSpecializations */
    void installBuiltinSpecializations(AnalysisSession& session) {
        const std::string& builtins = session.builtinModuleName();
        const CallOverride returnsString = returnsInstanceOf(
            session.languageVersion() == config::LanguageVersion::V3 ? host::BuiltinTypeId::Unicode
                                                                     : host::BuiltinTypeId::Str);
        const CallOverride returnsBytes = returnsInstanceOf(host::BuiltinTypeId::Bytes);

        session.specializeFunction(builtins, "range", range, false);
        session.specializeFunction(builtins, "min", unionOfInputs);
        session.specializeFunction(builtins, "max", unionOfInputs);
        session.specializeFunction(builtins, "getattr", specialGetattr, false);
        session.specializeFunction(builtins, "next", specialNext, false);
        session.specializeFunction(builtins, "iter", specialIter, false);
        session.specializeFunction(builtins, "super", specialSuper, false);

        session.specializeFunction("copy", "deepcopy", copyFunction, false);
        session.specializeFunction("copy", "copy", copyFunction, false);
        session.specializeFunction("pickle", "dumps", returnsBytes, false);
        session.specializeFunction("UserDict.UserDict", "update", nop, false);
        session.specializeFunction("pprint", "pprint", nop, false);
        session.specializeFunction("pprint", "pformat", returnsString, false);
        session.specializeFunction("pprint", "saferepr", returnsString, false);
        session.specializeFunction("pprint", "_safe_repr", returnsString, false);
        session.specializeFunction("pprint", "_format", returnsString, false);
        session.specializeFunction("pprint.PrettyPrinter", "_format", returnsString, false);
        session.specializeFunction("decimal.Decimal", "__new__", nop, false);
        session.specializeFunction("StringIO.StringIO", "write", nop, false);
        session.specializeFunction("threading.Thread", "__init__", nop, false);
        session.specializeFunction("subprocess.Popen", "__init__", nop, false);
        session.specializeFunction("Tkinter.Toplevel", "__init__", nop, false);
        session.specializeFunction("weakref.WeakValueDictionary", "update", nop, false);
        session.specializeFunction("os._Environ", "get", returnsString, false);
        session.specializeFunction("os._Environ", "update", nop, false);
        session.specializeFunction("ntpath", "expandvars", returnsString, false);
        session.specializeFunction("idlelib.EditorWindow.EditorWindow", "__init__", nop, false);

        session.specializeFunction(session.options().resourceLoaderModule, "LoadComponent", loadComponent);
    }

} // namespace pyinfer::analysis
