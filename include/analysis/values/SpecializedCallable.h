/***
 * Name: pyinfer::analysis::SpecializedCallable
 * Purpose: Function value whose calls are answered by a registered override.
 * Theory of Operation:
 *   A table-bound wrapper looks its override up in the owning module's specialization table
 *   on every call, so replacing the entry (reload, re-registration) takes effect without
 *   re-creating the wrapper. A fixed wrapper carries its own entry. With `analyze` set the
 *   original function is also called so its body keeps being analyzed, and its result is
 *   used when the override has no opinion. Without it the body is never executed.
 */
#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "analysis/CallOverride.h"
#include "analysis/Namespace.h"

namespace pyinfer::analysis {

    class SpecializedCallable final : public Namespace {
    public:
        SpecializedCallable(AnalysisSession& session, Namespace* original, const ModuleLike& table,
                            std::string qualifiedName)
            : Namespace(NamespaceKind::Specialized), session_(session), original_(original), table_(&table),
              qualifiedName_(std::move(qualifiedName)) {}

        SpecializedCallable(AnalysisSession& session, Namespace* original, std::string qualifiedName,
                            SpecializationEntry entry)
            : Namespace(NamespaceKind::Specialized), session_(session), original_(original),
              qualifiedName_(std::move(qualifiedName)), fixed_(std::move(entry)) {}

        Namespace* original() const { return original_; }
        const std::string& qualifiedName() const { return qualifiedName_; }

        std::string name() const override;
        MemberType memberType() const override;
        NamespaceSet getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) override;
        NamespaceSet call(const ast::Node& node, AnalysisUnit& unit, const std::vector<NamespaceSet>& args,
                          const std::vector<std::string>& argNames) override;
        std::map<std::string, NamespaceSet> allMembers() override;

    private:
        std::optional<SpecializationEntry> currentEntry() const;

        AnalysisSession& session_;
        Namespace* original_;
        const ModuleLike* table_{nullptr};
        std::string qualifiedName_;
        std::optional<SpecializationEntry> fixed_{};
    };

} // namespace pyinfer::analysis
