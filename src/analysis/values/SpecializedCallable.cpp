/***
 * Name: SpecializedCallable (definitions)
 * Purpose: Dispatch a call to an installed override before (or instead of) generic inference.
 * Theory of Operation:
 *   The override is looked up on every call, so a table entry replaced by a later
 *   registration takes effect without rebuilding the wrapper. A missing entry makes the
 *   wrapper transparent. With analyze set the original still runs (its argument bindings
 *   are recorded); its result is used only when the override has no opinion.
 */
#include "analysis/values/SpecializedCallable.h"

#include "analysis/AnalysisSession.h"
#include "analysis/ModuleLike.h"

namespace pyinfer::analysis {

    std::string SpecializedCallable::name() const {
        if (original_ != nullptr) { return original_->name(); }
        const auto dot = qualifiedName_.rfind('.');
        return dot == std::string::npos ? qualifiedName_ : qualifiedName_.substr(dot + 1);
    }

    MemberType SpecializedCallable::memberType() const {
        return original_ != nullptr ? original_->memberType() : MemberType::Function;
    }

    NamespaceSet SpecializedCallable::getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) {
        return original_ != nullptr ? original_->getMember(node, unit, name) : NamespaceSet{};
    }

    std::map<std::string, NamespaceSet> SpecializedCallable::allMembers() {
        return original_ != nullptr ? original_->allMembers() : std::map<std::string, NamespaceSet>{};
    }

    std::optional<SpecializationEntry> SpecializedCallable::currentEntry() const {
        if (fixed_) { return fixed_; }
        if (table_ != nullptr) { return table_->specialization(qualifiedName_); }
        return std::nullopt;
    }

    /*** Name: SpecializedCallable::call */
    NamespaceSet SpecializedCallable::call(const ast::Node& node, AnalysisUnit& unit,
                                           const std::vector<NamespaceSet>& args,
                                           const std::vector<std::string>& argNames) {
        const std::optional<SpecializationEntry> entry = currentEntry();
        if (!entry || !entry->fn) {
            return original_ != nullptr ? original_->call(node, unit, args, argNames) : NamespaceSet{};
        }
        session_.metrics().incCounter("specialized_calls");
        const std::optional<NamespaceSet> result = entry->fn(node, unit, args, argNames);
        if (entry->analyze && original_ != nullptr) {
            NamespaceSet generic = original_->call(node, unit, args, argNames);
            if (!result) { return generic; }
        }
        return result ? *result : NamespaceSet{};
    }

} // namespace pyinfer::analysis
