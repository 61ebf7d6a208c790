/***
 * Name: pyinfer::analysis::SuperInfo
 * Purpose: Result of `super(...)`: member lookups skip the class itself and search its bases.
 */
#pragma once

#include <string>
#include <utility>

#include "analysis/Namespace.h"

namespace pyinfer::analysis {

    class ClassInfo;

    class SuperInfo final : public Namespace {
    public:
        SuperInfo(AnalysisSession& session, ClassInfo& cls, NamespaceSet instances)
            : Namespace(NamespaceKind::Super), session_(session), class_(cls), instances_(std::move(instances)) {}

        ClassInfo& classInfo() const { return class_; }

        std::string name() const override { return "super"; }
        MemberType memberType() const override { return MemberType::Instance; }
        NamespaceSet getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) override;

    private:
        AnalysisSession& session_;
        ClassInfo& class_;
        NamespaceSet instances_;
    };

} // namespace pyinfer::analysis
