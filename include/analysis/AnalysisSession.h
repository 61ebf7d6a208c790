/***
 * Name: pyinfer::analysis::AnalysisSession
 * Purpose: Explicit context object owning every table of one analysis: the Namespace arena,
 *   the value caches, the module registry, the specialization registry and the work queue.
 * Inputs:
 *   - A host interpreter (enumerates and imports builtin modules, types and constants).
 *   - AnalyzerOptions (language version, limits, host strictness, logging).
 *   - Module registrations and their trees from the caller.
 * Outputs:
 *   - Inferred value sets in each module's variables; module and member queries.
 * Theory of Operation:
 *   The mutation API (add/remove modules and resources, directories, specializations) is
 *   safe for concurrent callers; each collection has its own mutex. Analysis itself is
 *   single-threaded: analyzeQueuedEntries runs the scheduler to a fixed point on the
 *   calling thread. Sessions share nothing, so several can coexist in one process.
 *   Retired units are released from the session's unit list as soon as they retire; they
 *   are destroyed once no variable, watcher or queue still holds them.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "analysis/AnalysisUnit.h"
#include "analysis/CallOverride.h"
#include "analysis/Cancellation.h"
#include "analysis/ImportResolver.h"
#include "analysis/MemberResult.h"
#include "analysis/ModuleTable.h"
#include "analysis/Namespace.h"
#include "analysis/NamespaceSet.h"
#include "analysis/ProjectEntry.h"
#include "analysis/Scheduler.h"
#include "analysis/SpecializationRegistry.h"
#include "analysis/ValueCache.h"
#include "analysis/WorkQueue.h"
#include "config/Options.h"
#include "host/BuiltinTypeId.h"
#include "host/ConstantValue.h"
#include "host/HostObject.h"
#include "host/Interpreter.h"
#include "observability/AnalysisLog.h"
#include "observability/Metrics.h"

namespace pyinfer::analysis {

    class BuiltinClassInfo;
    class BuiltinModule;
    class ModuleInfo;

    // Arguments of a call as seen by value-returning override callbacks.
    struct CallInfo {
        const std::vector<NamespaceSet>& args;
        const std::vector<std::string>& argNames;
    };

    // nullopt: no opinion. Otherwise the values the call produces.
    using ValuesCallback = std::function<std::optional<std::vector<Namespace*>>(const ast::Node&, const CallInfo&)>;
    using CallAction = std::function<void(const ast::Node&)>;

    class AnalysisSession {
    public:
        explicit AnalysisSession(host::Interpreter& interpreter, config::AnalyzerOptions options = {});
        ~AnalysisSession();
        AnalysisSession(const AnalysisSession&) = delete;
        AnalysisSession& operator=(const AnalysisSession&) = delete;

        /*** Module registry */
        ProjectEntry* addModule(const std::string& moduleName, const std::string& filePath,
                                std::shared_ptr<AnalysisCookie> cookie = nullptr);
        void removeModule(ProjectEntry* entry);
        ResourceProjectEntry* addResourceFile(const std::string& filePath,
                                              std::shared_ptr<AnalysisCookie> cookie = nullptr);
        void removeResourceFile(ResourceProjectEntry* entry);
        ResourceProjectEntry* resourceByPath(const std::string& filePath) const;
        ModuleInfo* moduleByPath(const std::string& filePath) const;
        std::shared_ptr<ModuleReference> tryGetModule(const std::string& name);
        void reloadModules();

        /*** Analysis directories */
        void addAnalysisDirectory(const std::string& dir);
        void removeAnalysisDirectory(const std::string& dir);
        std::vector<std::string> analysisDirectories() const;
        // Listeners run synchronously on the mutating thread and must not mutate the directory set.
        void onAnalysisDirectoriesChanged(std::function<void()> listener);

        /*** Queries */
        std::vector<MemberResult> getModules(bool topLevelOnly = false);
        std::vector<MemberResult> getModule(const std::string& name);
        std::vector<MemberResult> getModuleMembers(const host::ModuleContext* ctx,
                                                   const std::vector<std::string>& names,
                                                   bool includeMembers = false);
        std::vector<ExportedMemberInfo> findNameInAllModules(const std::string& name);

        /*** Specializations */
        void specializeFunction(const std::string& moduleName, const std::string& name, CallOverride fn,
                                bool analyze = true);
        // Calls return an instance of `returnType` ("module.Type"); throws InvalidArgumentError without a dot.
        void specializeFunction(const std::string& moduleName, const std::string& name,
                                const std::string& returnType);
        void specializeFunctionValues(const std::string& moduleName, const std::string& name, ValuesCallback fn);
        void specializeFunctionAction(const std::string& moduleName, const std::string& name, CallAction fn);

        /*** Scheduling */
        void setQueueReporting(ProgressReporter report, std::size_t interval = 1);
        // Returns the number of units processed.
        std::size_t analyzeQueuedEntries(const CancellationToken& cancel = {});
        // Re-run `unit` when a module called `moduleName` is added.
        void watchModuleName(const std::string& moduleName, AnalysisUnit& unit);

        /*** Value universe */
        Namespace* valueOf(const host::HostObject* obj);
        NamespaceSet valuesOf(const std::vector<const host::HostObject*>& objects);
        BuiltinClassInfo* builtinType(const host::HostType* type);
        BuiltinModule* builtinModule(const host::HostModule& module);
        BuiltinClassInfo* knownType(host::BuiltinTypeId id);
        NamespaceSet knownInstance(host::BuiltinTypeId id);
        NamespaceSet constant(const host::ConstantValue& value);
        Namespace* noneConstant();
        // Canonical aggregate: nullptr for no members, the member itself for one.
        Namespace* aggregate(std::vector<Namespace*> members);
        Namespace* boundMethod(Namespace& function, Namespace& self);
        BuiltinClassInfo* makeGenericType(const host::HostType* type,
                                          const std::vector<const host::HostType*>& indexTypes);
        std::map<std::string, NamespaceSet> allMembers(const host::HostMemberContainer& container,
                                                       const host::ModuleContext* ctx);
        // The specialization table of the loaded module `moduleName`, if any; never loads.
        ModuleLike* loadedModule(const std::string& moduleName) const;
        // The builtin module ("builtins" / "__builtin__"), loaded on demand.
        Namespace* builtinsModule();

        template <typename T, typename... Args>
        T* make(Args&&... args) {
            auto value = std::make_unique<T>(std::forward<Args>(args)...);
            T* raw = value.get();
            const std::lock_guard<std::mutex> lock(arenaMutex_);
            static_cast<Namespace*>(raw)->attach(++nextId_);
            arena_.push_back(std::move(value));
            return raw;
        }
        AnalysisUnit& makeUnit(ProjectEntry* entry, Scope& scope, const ast::Node& node);
        // Drop retired units from the unit list, the module watchers and the queue.
        // Returns the number removed from the unit list.
        std::size_t releaseRetiredUnits();
        std::size_t unitCount() const;

        /*** Accessors */
        host::Interpreter& interpreter() const { return interpreter_; }
        const config::AnalyzerOptions& options() const { return options_; }
        const config::AnalysisLimits& limits() const { return options_.limits; }
        config::LanguageVersion languageVersion() const { return options_.languageVersion; }
        const std::string& builtinModuleName() const { return builtinName_; }
        // "__next__" on 3.x, "next" on 2.x.
        const char* nextMethodName() const;
        const host::ModuleContext* defaultContext() const { return defaultContext_.get(); }
        ModuleTable& modules() { return modules_; }
        const ImportResolver& importer() const { return importer_; }
        SpecializationRegistry& specializations() { return specializations_; }
        WorkQueue& queue() { return queue_; }
        obs::Metrics& metrics() { return metrics_; }
        obs::AnalysisLog& log() { return log_; }

    private:
        struct NamespacePairHash {
            std::size_t operator()(const std::pair<const Namespace*, const Namespace*>& key) const;
        };

        void loadKnownTypes();
        Namespace* unknownObject(const host::HostObject* obj);
        template <typename Factory>
        Namespace* cachedValue(const host::HostObject* key, Factory&& factory);

        host::Interpreter& interpreter_;
        config::AnalyzerOptions options_;
        std::string builtinName_;
        obs::Metrics metrics_{};
        obs::AnalysisLog log_;

        std::mutex arenaMutex_;
        std::uint64_t nextId_{0};
        std::vector<std::unique_ptr<Namespace>> arena_{};
        mutable std::mutex unitsMutex_;
        std::vector<std::shared_ptr<AnalysisUnit>> units_{};

        ValueCache<const host::HostObject*, Namespace> itemCache_{};
        ValueCache<host::ConstantValue, Namespace, host::ConstantValueHash> constantCache_{};
        ValueCache<std::string, Namespace> aggregateCache_{};
        ValueCache<std::pair<const Namespace*, const Namespace*>, Namespace, NamespacePairHash> boundCache_{};

        ModuleTable modules_;
        ImportResolver importer_;
        SpecializationRegistry specializations_;
        WorkQueue queue_{};
        Scheduler scheduler_;
        std::mutex analysisMutex_;
        std::unique_ptr<host::ModuleContext> defaultContext_{};

        mutable std::mutex entriesMutex_;
        std::unordered_map<std::string, ModuleInfo*> modulesByPath_{};
        std::vector<std::unique_ptr<ProjectEntry>> entries_{};
        std::unordered_map<std::string, std::unique_ptr<ResourceProjectEntry>> resourcesByPath_{};
        std::vector<std::unique_ptr<ResourceProjectEntry>> retiredResources_{};

        mutable std::mutex directoriesMutex_;
        std::set<std::string> analysisDirs_{};
        std::vector<std::function<void()>> directoryListeners_{};

        std::mutex watchersMutex_;
        std::map<std::string, std::vector<std::shared_ptr<AnalysisUnit>>> watchers_{};
    };

} // namespace pyinfer::analysis
