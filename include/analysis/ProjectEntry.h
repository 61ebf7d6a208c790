/***
 * Name: pyinfer::analysis::ProjectEntry / ResourceProjectEntry
 * Purpose: One registered source module (with its tree and module value), and one non-code
 *   resource file that modules can depend on.
 * Theory of Operation:
 *   A project entry keeps its identity across reloads and tree updates. Replacing the tree
 *   retires every unit created for the old tree and detaches the functions and classes
 *   built from it, after which the old tree is released. Tree updates belong to the
 *   analysis thread and must not overlap analyzeQueuedEntries. A resource entry re-queues
 *   its dependents whenever its declared objects change or it is removed.
 */
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "analysis/Cancellation.h"

namespace pyinfer::ast {
    struct Module;
}

namespace pyinfer::host {
    class HostType;
}

namespace pyinfer::analysis {

    class AnalysisSession;
    class AnalysisUnit;
    class ClassInfo;
    class FunctionInfo;
    class ModuleInfo;

    // Opaque caller-supplied identity token.
    class AnalysisCookie {
    public:
        virtual ~AnalysisCookie() = default;
    };

    class ProjectEntry {
    public:
        ProjectEntry(AnalysisSession& session, std::string moduleName, std::string filePath,
                     std::shared_ptr<AnalysisCookie> cookie);
        ProjectEntry(const ProjectEntry&) = delete;
        ProjectEntry& operator=(const ProjectEntry&) = delete;

        const std::string& moduleName() const { return moduleName_; }
        const std::string& filePath() const { return filePath_; }
        const std::shared_ptr<AnalysisCookie>& cookie() const { return cookie_; }
        // True for "__init__.py" entries: relative imports resolve against the module itself.
        bool isPackage() const;

        ModuleInfo& module() const { return *module_; }
        const ast::Module* tree() const;
        void updateTree(std::shared_ptr<const ast::Module> tree);

        // Clear the module's inference state and queue its body.
        void enqueueForAnalysis();
        void analyze(const CancellationToken& cancel);
        std::uint64_t analysisVersion() const;

        void trackUnit(AnalysisUnit& unit);
        // Functions and classes built from the current tree; detached when it goes away.
        void trackDefinition(FunctionInfo& function);
        void trackDefinition(ClassInfo& cls);
        void removedFromProject();
        bool isRemoved() const;

    private:
        void retireUnits(bool detachDefinitions);

        AnalysisSession& session_;
        std::string moduleName_;
        std::string filePath_;
        std::shared_ptr<AnalysisCookie> cookie_;
        ModuleInfo* module_;
        mutable std::mutex mutex_;
        std::shared_ptr<const ast::Module> tree_{};
        AnalysisUnit* unit_{nullptr};
        std::vector<AnalysisUnit*> units_{};
        std::vector<FunctionInfo*> functions_{};
        std::vector<ClassInfo*> classes_{};
        bool removed_{false};
        std::uint64_t analysisVersion_{0};
    };

    class ResourceProjectEntry {
    public:
        ResourceProjectEntry(std::string filePath, std::shared_ptr<AnalysisCookie> cookie)
            : filePath_(std::move(filePath)), cookie_(std::move(cookie)) {}

        const std::string& filePath() const { return filePath_; }
        const std::shared_ptr<AnalysisCookie>& cookie() const { return cookie_; }

        // Named objects declared by the resource and the host type of each.
        std::map<std::string, const host::HostType*> namedObjects() const;
        void setNamedObjects(std::map<std::string, const host::HostType*> objects);

        void addDependency(ProjectEntry& entry);
        std::vector<ProjectEntry*> dependents() const;

        void removedFromProject();
        bool isRemoved() const;

    private:
        void requeueDependents(const std::vector<ProjectEntry*>& dependents) const;

        std::string filePath_;
        std::shared_ptr<AnalysisCookie> cookie_;
        mutable std::mutex mutex_;
        std::map<std::string, const host::HostType*> namedObjects_{};
        std::vector<ProjectEntry*> dependents_{};
        bool removed_{false};
    };

} // namespace pyinfer::analysis
