/***
 * Name: SpecializationRegistry (definitions)
 * Purpose: Install call overrides on loaded modules and keep a replay log for the rest.
 * Theory of Operation:
 *   Every registration is logged under the module name it was registered for; an entry
 *   for the same (module, name) replaces the earlier one, so replaying never duplicates.
 *   A target like ("decimal.Decimal", "__new__") whose module is not a loaded module is
 *   installed on its parent ("decimal") as "Decimal.__new__". When a module appears its
 *   own log entries and those of its direct dotted children are replayed.
 */
#include "analysis/SpecializationRegistry.h"

#include "analysis/AnalysisSession.h"

namespace pyinfer::analysis {

    /*** Name: SpecializationRegistry::specialize */
    bool SpecializationRegistry::specialize(const std::string& moduleName, const std::string& name, CallOverride fn,
                                            bool analyze, bool save) {
        if (save) { this->save(moduleName, SpecializationInfo{moduleName, name, fn, analyze}); }

        std::string qualified = name;
        ModuleLike* target = session_.loadedModule(moduleName);
        if (target == nullptr) {
            const auto dot = moduleName.rfind('.');
            if (dot != std::string::npos) {
                target = session_.loadedModule(moduleName.substr(0, dot));
                qualified = moduleName.substr(dot + 1) + "." + name;
            }
        }
        if (target == nullptr) {
            session_.log().write(obs::LogCategory::Specializations, "deferred " + moduleName + "." + name);
            return false;
        }
        target->specialize(qualified, std::move(fn), analyze);
        session_.metrics().incCounter("specializations_applied");
        session_.log().write(obs::LogCategory::Specializations,
                             "applied " + qualified + " on " + target->moduleName());
        return true;
    }

    /*** Name: SpecializationRegistry::applyDelayed */
    void SpecializationRegistry::applyDelayed(const std::string& moduleName) {
        for (SpecializationInfo& info : entriesFor(moduleName)) {
            specialize(info.moduleName, info.name, std::move(info.fn), info.analyze, false);
        }
    }

    /*** Name: SpecializationRegistry::replayAll */
    void SpecializationRegistry::replayAll() {
        std::vector<SpecializationInfo> all;
        {
            const std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [key, entries] : log_) { all.insert(all.end(), entries.begin(), entries.end()); }
        }
        for (SpecializationInfo& info : all) {
            specialize(info.moduleName, info.name, std::move(info.fn), info.analyze, false);
        }
    }

    std::size_t SpecializationRegistry::loggedCount(const std::string& key) const {
        const std::lock_guard<std::mutex> lock(mutex_);
        const auto it = log_.find(key);
        return it == log_.end() ? 0 : it->second.size();
    }

    std::vector<SpecializationInfo> SpecializationRegistry::entriesFor(const std::string& moduleName) const {
        const std::lock_guard<std::mutex> lock(mutex_);
        std::vector<SpecializationInfo> out;
        const std::string prefix = moduleName + ".";
        for (const auto& [key, entries] : log_) {
            const bool own = key == moduleName;
            const bool child = key.compare(0, prefix.size(), prefix) == 0 &&
                               key.find('.', prefix.size()) == std::string::npos;
            if (own || child) { out.insert(out.end(), entries.begin(), entries.end()); }
        }
        return out;
    }

    void SpecializationRegistry::save(const std::string& key, SpecializationInfo info) {
        const std::lock_guard<std::mutex> lock(mutex_);
        std::vector<SpecializationInfo>& entries = log_[key];
        for (SpecializationInfo& existing : entries) {
            if (existing.name == info.name) {
                existing = std::move(info);
                return;
            }
        }
        entries.push_back(std::move(info));
    }

} // namespace pyinfer::analysis
