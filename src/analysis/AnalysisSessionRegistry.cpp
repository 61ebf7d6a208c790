/***
 * Name: AnalysisSession (module and resource registry)
 * Purpose: Register and remove project modules and resource files.
 * Theory of Operation:
 *   Entries are never destroyed before the session: removal detaches an entry from both
 *   indexes, invalidates its module reference and retires its units, but the object stays
 *   alive so raw pointers held by dependents remain safe to test with isRemoved().
 */
#include "analysis/AnalysisSession.h"

#include "analysis/values/ModuleInfo.h"
#include "pyinfer/exceptions/invalid_argument_error.h"

namespace pyinfer::analysis {

    /*** Name: AnalysisSession::addModule */
    ProjectEntry* AnalysisSession::addModule(const std::string& moduleName, const std::string& filePath,
                                             std::shared_ptr<AnalysisCookie> cookie) {
        auto owned = std::make_unique<ProjectEntry>(*this, moduleName, filePath, std::move(cookie));
        ProjectEntry* entry = owned.get();
        {
            const std::lock_guard<std::mutex> lock(entriesMutex_);
            entries_.push_back(std::move(owned));
            if (!filePath.empty()) { modulesByPath_[filePath] = &entry->module(); }
        }
        if (!moduleName.empty()) {
            modules_.set(moduleName, std::make_shared<ModuleReference>(&entry->module()));
            specializations_.applyDelayed(moduleName);

            std::vector<std::shared_ptr<AnalysisUnit>> watchers;
            {
                const std::lock_guard<std::mutex> lock(watchersMutex_);
                const auto it = watchers_.find(moduleName);
                if (it != watchers_.end()) {
                    watchers.swap(it->second);
                    watchers_.erase(it);
                }
            }
            for (const std::shared_ptr<AnalysisUnit>& unit : watchers) { unit->enqueue(); }
        }
        metrics_.incCounter("modules_added");
        log_.write(obs::LogCategory::Modules, "added " + (moduleName.empty() ? filePath : moduleName));
        return entry;
    }

    /*** Name: AnalysisSession::removeModule */
    void AnalysisSession::removeModule(ProjectEntry* entry) {
        if (entry == nullptr) { throw exceptions::InvalidArgumentError("removeModule: entry is null"); }
        if (entry->isRemoved()) { return; }

        {
            const std::lock_guard<std::mutex> lock(entriesMutex_);
            const auto it = modulesByPath_.find(entry->filePath());
            if (it != modulesByPath_.end() && it->second == &entry->module()) { modulesByPath_.erase(it); }
        }
        if (!entry->moduleName().empty()) {
            auto ref = modules_.peek(entry->moduleName());
            if (ref && ref->module() == &entry->module()) {
                modules_.tryRemove(entry->moduleName(), ref.get());
                ref->invalidate();
            }
        }
        entry->removedFromProject();
        entry->module().clear();
        metrics_.incCounter("modules_removed");
        log_.write(obs::LogCategory::Modules, "removed " + entry->moduleName());
    }

    /*** Name: AnalysisSession::addResourceFile */
    ResourceProjectEntry* AnalysisSession::addResourceFile(const std::string& filePath,
                                                           std::shared_ptr<AnalysisCookie> cookie) {
        const std::lock_guard<std::mutex> lock(entriesMutex_);
        auto& slot = resourcesByPath_[filePath];
        if (!slot) { slot = std::make_unique<ResourceProjectEntry>(filePath, std::move(cookie)); }
        return slot.get();
    }

    /*** Name: AnalysisSession::removeResourceFile */
    void AnalysisSession::removeResourceFile(ResourceProjectEntry* entry) {
        if (entry == nullptr) { throw exceptions::InvalidArgumentError("removeResourceFile: entry is null"); }
        {
            const std::lock_guard<std::mutex> lock(entriesMutex_);
            const auto it = resourcesByPath_.find(entry->filePath());
            if (it != resourcesByPath_.end() && it->second.get() == entry) {
                retiredResources_.push_back(std::move(it->second));
                resourcesByPath_.erase(it);
            }
        }
        entry->removedFromProject();
    }

    ResourceProjectEntry* AnalysisSession::resourceByPath(const std::string& filePath) const {
        const std::lock_guard<std::mutex> lock(entriesMutex_);
        const auto it = resourcesByPath_.find(filePath);
        return it == resourcesByPath_.end() ? nullptr : it->second.get();
    }

    ModuleInfo* AnalysisSession::moduleByPath(const std::string& filePath) const {
        const std::lock_guard<std::mutex> lock(entriesMutex_);
        const auto it = modulesByPath_.find(filePath);
        return it == modulesByPath_.end() ? nullptr : it->second;
    }

    std::shared_ptr<ModuleReference> AnalysisSession::tryGetModule(const std::string& name) {
        return modules_.tryGetValue(name);
    }

} // namespace pyinfer::analysis
