/***
 * Name: ProjectEntry, ResourceProjectEntry (definitions)
 * Purpose: Per-file analysis state: module value, AST, units and re-analysis triggers.
 * Theory of Operation:
 *   Units are tracked so that replacing the tree or removing the entry can retire them;
 *   retired units never run again and the session lets go of them at once. Functions and
 *   classes are tracked so they can drop their nodes before the tree that holds them is
 *   released.
 */
#include "analysis/ProjectEntry.h"

#include <algorithm>
#include <filesystem>

#include "analysis/AnalysisSession.h"
#include "analysis/AnalysisUnit.h"
#include "analysis/values/ClassInfo.h"
#include "analysis/values/FunctionInfo.h"
#include "analysis/values/ModuleInfo.h"
#include "ast/Module.h"

namespace pyinfer::analysis {

    ProjectEntry::ProjectEntry(AnalysisSession& session, std::string moduleName, std::string filePath,
                               std::shared_ptr<AnalysisCookie> cookie)
        : session_(session), moduleName_(std::move(moduleName)), filePath_(std::move(filePath)),
          cookie_(std::move(cookie)), module_(session.make<ModuleInfo>(session, *this, moduleName_)) {}

    bool ProjectEntry::isPackage() const {
        return std::filesystem::path(filePath_).filename() == "__init__.py";
    }

    const ast::Module* ProjectEntry::tree() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return tree_.get();
    }

    /*** Name: ProjectEntry::updateTree */
    void ProjectEntry::updateTree(std::shared_ptr<const ast::Module> tree) {
        const ast::Module* root = tree.get();
        std::shared_ptr<const ast::Module> replaced;
        {
            const std::lock_guard<std::mutex> lock(mutex_);
            replaced = std::move(tree_);
            tree_ = std::move(tree);
            unit_ = nullptr;
        }
        retireUnits(true);
        module_->scope().clearNodeValues();
        // Nothing points into the replaced tree any more.
        replaced.reset();
        if (root == nullptr) { return; }
        AnalysisUnit& unit = session_.makeUnit(this, module_->scope(), *root);
        const std::lock_guard<std::mutex> lock(mutex_);
        unit_ = &unit;
    }

    /*** Name: ProjectEntry::enqueueForAnalysis */
    void ProjectEntry::enqueueForAnalysis() {
        AnalysisUnit* unit = nullptr;
        {
            const std::lock_guard<std::mutex> lock(mutex_);
            if (removed_ || unit_ == nullptr) { return; }
            unit = unit_;
            ++analysisVersion_;
        }
        module_->clear();
        unit->enqueue();
    }

    /*** Name: ProjectEntry::analyze */
    void ProjectEntry::analyze(const CancellationToken& cancel) {
        enqueueForAnalysis();
        session_.analyzeQueuedEntries(cancel);
    }

    std::uint64_t ProjectEntry::analysisVersion() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return analysisVersion_;
    }

    void ProjectEntry::trackUnit(AnalysisUnit& unit) {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (removed_) {
            unit.retire();
            return;
        }
        units_.push_back(&unit);
    }

    void ProjectEntry::trackDefinition(FunctionInfo& function) {
        const std::lock_guard<std::mutex> lock(mutex_);
        functions_.push_back(&function);
    }

    void ProjectEntry::trackDefinition(ClassInfo& cls) {
        const std::lock_guard<std::mutex> lock(mutex_);
        classes_.push_back(&cls);
    }

    /*** Name: ProjectEntry::removedFromProject */
    void ProjectEntry::removedFromProject() {
        {
            const std::lock_guard<std::mutex> lock(mutex_);
            if (removed_) { return; }
            removed_ = true;
            unit_ = nullptr;
        }
        retireUnits(false);
    }

    bool ProjectEntry::isRemoved() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return removed_;
    }

    /*** Name: ProjectEntry::retireUnits */
    void ProjectEntry::retireUnits(bool detachDefinitions) {
        std::vector<AnalysisUnit*> units;
        std::vector<FunctionInfo*> functions;
        std::vector<ClassInfo*> classes;
        {
            const std::lock_guard<std::mutex> lock(mutex_);
            units.swap(units_);
            functions.swap(functions_);
            classes.swap(classes_);
        }
        for (AnalysisUnit* unit : units) { unit->retire(); }
        if (detachDefinitions) {
            for (FunctionInfo* function : functions) { function->detach(); }
            for (ClassInfo* cls : classes) { cls->detach(); }
        }
        session_.releaseRetiredUnits();
    }

    std::map<std::string, const host::HostType*> ResourceProjectEntry::namedObjects() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return namedObjects_;
    }

    /*** Name: ResourceProjectEntry::setNamedObjects */
    void ResourceProjectEntry::setNamedObjects(std::map<std::string, const host::HostType*> objects) {
        std::vector<ProjectEntry*> dependents;
        {
            const std::lock_guard<std::mutex> lock(mutex_);
            namedObjects_ = std::move(objects);
            dependents = dependents_;
        }
        requeueDependents(dependents);
    }

    void ResourceProjectEntry::addDependency(ProjectEntry& entry) {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (std::find(dependents_.begin(), dependents_.end(), &entry) == dependents_.end()) {
            dependents_.push_back(&entry);
        }
    }

    std::vector<ProjectEntry*> ResourceProjectEntry::dependents() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return dependents_;
    }

    /*** Name: ResourceProjectEntry::removedFromProject */
    void ResourceProjectEntry::removedFromProject() {
        std::vector<ProjectEntry*> dependents;
        {
            const std::lock_guard<std::mutex> lock(mutex_);
            if (removed_) { return; }
            removed_ = true;
            dependents.swap(dependents_);
        }
        requeueDependents(dependents);
    }

    bool ResourceProjectEntry::isRemoved() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return removed_;
    }

    void ResourceProjectEntry::requeueDependents(const std::vector<ProjectEntry*>& dependents) const {
        for (ProjectEntry* entry : dependents) {
            if (!entry->isRemoved()) { entry->enqueueForAnalysis(); }
        }
    }

} // namespace pyinfer::analysis
