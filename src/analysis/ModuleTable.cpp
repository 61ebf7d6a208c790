/***
 * Name: ModuleTable (definitions)
 * Purpose: Name index of every module the session knows, loaded or not.
 * Theory of Operation:
 *   Builtin names start as unloaded references. The first lookup imports the host module
 *   outside the table lock and then replays the specializations queued for that name.
 */
#include "analysis/ModuleTable.h"

#include "analysis/AnalysisSession.h"
#include "analysis/values/BuiltinValues.h"
#include "host/Interpreter.h"

namespace pyinfer::analysis {

    ModuleTable::ModuleTable(AnalysisSession& session, host::Interpreter& interpreter)
        : session_(session), interpreter_(interpreter) {}

    /*** Name: ModuleTable::reinit */
    void ModuleTable::reinit(const std::vector<std::string>& names) {
        const std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, std::shared_ptr<ModuleReference>> next;
        for (const auto& [name, ref] : modules_) {
            Namespace* module = ref->module();
            if (module != nullptr && module->kind() == NamespaceKind::Module) {
                next.emplace(name, ref);
            } else {
                ref->invalidate();
            }
        }
        for (const std::string& name : names) { next.emplace(name, std::make_shared<ModuleReference>()); }
        modules_.swap(next);
    }

    /*** Name: ModuleTable::tryGetValue */
    std::shared_ptr<ModuleReference> ModuleTable::tryGetValue(const std::string& name) {
        std::shared_ptr<ModuleReference> ref = peek(name);
        if (!ref || ref->isLoaded()) { return ref; }

        const host::HostModule* module = interpreter_.importModule(name);
        ref->setModule(module != nullptr ? session_.builtinModule(*module) : nullptr);
        if (module != nullptr) {
            session_.log().write(obs::LogCategory::Modules, "loaded builtin module " + name);
            session_.specializations().applyDelayed(name);
        }
        return ref;
    }

    std::shared_ptr<ModuleReference> ModuleTable::peek(const std::string& name) const {
        const std::lock_guard<std::mutex> lock(mutex_);
        const auto it = modules_.find(name);
        return it == modules_.end() ? nullptr : it->second;
    }

    /*** Name: ModuleTable::set */
    void ModuleTable::set(const std::string& name, std::shared_ptr<ModuleReference> ref) {
        const std::lock_guard<std::mutex> lock(mutex_);
        std::shared_ptr<ModuleReference>& slot = modules_[name];
        if (slot && slot != ref) { slot->invalidate(); }
        slot = std::move(ref);
    }

    /*** Name: ModuleTable::tryRemove */
    bool ModuleTable::tryRemove(const std::string& name, const ModuleReference* expected) {
        const std::lock_guard<std::mutex> lock(mutex_);
        const auto it = modules_.find(name);
        if (it == modules_.end() || it->second.get() != expected) { return false; }
        modules_.erase(it);
        return true;
    }

    std::vector<std::pair<std::string, std::shared_ptr<ModuleReference>>> ModuleTable::snapshot() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return {modules_.begin(), modules_.end()};
    }

    std::size_t ModuleTable::size() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return modules_.size();
    }

} // namespace pyinfer::analysis
