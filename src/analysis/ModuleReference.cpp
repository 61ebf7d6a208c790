/***
 * Name: ModuleReference (definitions)
 */
#include "analysis/ModuleReference.h"

namespace pyinfer::analysis {

    bool ModuleReference::isLoaded() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return loaded_;
    }

    bool ModuleReference::hasModule() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return loaded_ && module_ != nullptr;
    }

    Namespace* ModuleReference::module() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return module_;
    }

    ModuleLike* ModuleReference::moduleLike() const {
        Namespace* value = module();
        return value != nullptr ? value->asModule() : nullptr;
    }

    /*** Name: ModuleReference::setModule */
    void ModuleReference::setModule(Namespace* module) {
        const std::lock_guard<std::mutex> lock(mutex_);
        module_ = module;
        loaded_ = true;
    }

    bool ModuleReference::isValid() const {
        const std::lock_guard<std::mutex> lock(mutex_);
        return valid_;
    }

    void ModuleReference::invalidate() {
        const std::lock_guard<std::mutex> lock(mutex_);
        valid_ = false;
    }

    MemberType ModuleReference::memberType() const {
        Namespace* value = module();
        return value != nullptr ? value->memberType() : MemberType::Module;
    }

    /*** Name: ModuleReference::containsMember */
    MemberPresence ModuleReference::containsMember(const host::ModuleContext* ctx, const std::string& name) const {
        ModuleLike* module = moduleLike();
        return module != nullptr ? module->memberPresence(ctx, name) : MemberPresence::Absent;
    }

} // namespace pyinfer::analysis
