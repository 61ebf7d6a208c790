/***
 * Name: AnalysisSession (lifecycle and scheduling)
 * Purpose: Construct the session tables, reload builtins, and drive queued analysis.
 * Theory of Operation:
 *   Construction seeds the module table with every module the host can import (unloaded),
 *   installs the builtin specializations and lets the host register its own. Reload repeats
 *   that sequence while keeping project entries, then re-queues every project module.
 */
#include "analysis/AnalysisSession.h"

#include <algorithm>
#include <iterator>

#include "analysis/BuiltinSpecializations.h"
#include "analysis/values/ModuleInfo.h"

namespace pyinfer::analysis {

    AnalysisSession::AnalysisSession(host::Interpreter& interpreter, config::AnalyzerOptions options)
        : interpreter_(interpreter), options_(std::move(options)), builtinName_(config::builtinModuleNameFor(options_)),
          log_(options_.log), modules_(*this, interpreter), importer_(*this), specializations_(*this),
          scheduler_(queue_, metrics_, log_) {
        defaultContext_ = interpreter_.createModuleContext();
        modules_.reinit(interpreter_.moduleNames());
        loadKnownTypes();
        interpreter_.initialize(*this);
    }

    AnalysisSession::~AnalysisSession() = default;

    const char* AnalysisSession::nextMethodName() const {
        return options_.languageVersion == config::LanguageVersion::V3 ? "__next__" : "next";
    }

    /*** Name: AnalysisSession::makeUnit */
    AnalysisUnit& AnalysisSession::makeUnit(ProjectEntry* entry, Scope& scope, const ast::Node& node) {
        AnalysisUnit* unit = nullptr;
        {
            const std::lock_guard<std::mutex> lock(unitsMutex_);
            units_.push_back(std::make_shared<AnalysisUnit>(*this, entry, scope, node));
            unit = units_.back().get();
        }
        if (entry != nullptr) { entry->trackUnit(*unit); }
        return *unit;
    }

    /*** Name: AnalysisSession::releaseRetiredUnits */
    std::size_t AnalysisSession::releaseRetiredUnits() {
        const auto retired = [](const std::shared_ptr<AnalysisUnit>& unit) { return unit->isRetired(); };
        std::size_t released = 0;
        {
            const std::lock_guard<std::mutex> lock(unitsMutex_);
            const std::size_t before = units_.size();
            units_.erase(std::remove_if(units_.begin(), units_.end(), retired), units_.end());
            released = before - units_.size();
        }
        {
            const std::lock_guard<std::mutex> lock(watchersMutex_);
            for (auto it = watchers_.begin(); it != watchers_.end();) {
                auto& units = it->second;
                units.erase(std::remove_if(units.begin(), units.end(), retired), units.end());
                it = units.empty() ? watchers_.erase(it) : std::next(it);
            }
        }
        queue_.discardRetired();
        if (released != 0) { metrics_.incCounter("units_released", released); }
        return released;
    }

    std::size_t AnalysisSession::unitCount() const {
        const std::lock_guard<std::mutex> lock(unitsMutex_);
        return units_.size();
    }

    void AnalysisSession::loadKnownTypes() {
        installBuiltinSpecializations(*this);
        specializations_.replayAll();
    }

    /*** Name: AnalysisSession::reloadModules */
    void AnalysisSession::reloadModules() {
        modules_.reinit(interpreter_.moduleNames());
        itemCache_.clear();
        constantCache_.clear();
        aggregateCache_.clear();
        boundCache_.clear();
        defaultContext_ = interpreter_.createModuleContext();
        loadKnownTypes();
        interpreter_.initialize(*this);

        std::vector<ProjectEntry*> entries;
        {
            const std::lock_guard<std::mutex> lock(entriesMutex_);
            for (const auto& entry : entries_) {
                if (!entry->isRemoved()) { entries.push_back(entry.get()); }
            }
        }
        for (ProjectEntry* entry : entries) {
            entry->module().clear();
            entry->enqueueForAnalysis();
        }
        metrics_.incCounter("reloads");
        log_.write(obs::LogCategory::Modules, "reloaded " + std::to_string(modules_.size()) + " module names");
    }

    void AnalysisSession::setQueueReporting(ProgressReporter report, std::size_t interval) {
        scheduler_.setReporting(std::move(report), interval);
    }

    /*** Name: AnalysisSession::analyzeQueuedEntries */
    std::size_t AnalysisSession::analyzeQueuedEntries(const CancellationToken& cancel) {
        const std::lock_guard<std::mutex> lock(analysisMutex_);
        return scheduler_.analyze(cancel);
    }

    void AnalysisSession::watchModuleName(const std::string& moduleName, AnalysisUnit& unit) {
        const std::lock_guard<std::mutex> lock(watchersMutex_);
        auto& units = watchers_[moduleName];
        const auto same = [&unit](const std::shared_ptr<AnalysisUnit>& watcher) { return watcher.get() == &unit; };
        if (std::find_if(units.begin(), units.end(), same) == units.end()) { units.push_back(unit.shared_from_this()); }
    }

    /*** Name: AnalysisSession::addAnalysisDirectory */
    void AnalysisSession::addAnalysisDirectory(const std::string& dir) {
        std::vector<std::function<void()>> listeners;
        {
            const std::lock_guard<std::mutex> lock(directoriesMutex_);
            if (!analysisDirs_.insert(dir).second) { return; }
            listeners = directoryListeners_;
        }
        for (const auto& listener : listeners) { listener(); }
    }

    void AnalysisSession::removeAnalysisDirectory(const std::string& dir) {
        std::vector<std::function<void()>> listeners;
        {
            const std::lock_guard<std::mutex> lock(directoriesMutex_);
            if (analysisDirs_.erase(dir) == 0) { return; }
            listeners = directoryListeners_;
        }
        for (const auto& listener : listeners) { listener(); }
    }

    std::vector<std::string> AnalysisSession::analysisDirectories() const {
        const std::lock_guard<std::mutex> lock(directoriesMutex_);
        return {analysisDirs_.begin(), analysisDirs_.end()};
    }

    void AnalysisSession::onAnalysisDirectoriesChanged(std::function<void()> listener) {
        const std::lock_guard<std::mutex> lock(directoriesMutex_);
        directoryListeners_.push_back(std::move(listener));
    }

} // namespace pyinfer::analysis
