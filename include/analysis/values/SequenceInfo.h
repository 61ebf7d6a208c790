/***
 * Name: pyinfer::analysis::SequenceInfo / IteratorInfo
 * Purpose: Lists and tuples with element tracking, and iterators over tracked elements.
 * Theory of Operation:
 *   A sequence is created per creating node (literal or list()/tuple() call) and keeps one
 *   VariableDef of element values. Indexing and iteration read it with a dependency; item
 *   assignment and `append`/`extend`/`insert` grow it. An iterator either shares the
 *   elements of its sequence or owns its own (iter(callable, sentinel)).
 */
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "analysis/Namespace.h"
#include "analysis/VariableDef.h"

namespace pyinfer::analysis {

    class BuiltinClassInfo;
    class IteratorInfo;

    class SequenceInfo final : public Namespace {
    public:
        SequenceInfo(AnalysisSession& session, BuiltinClassInfo* type, std::size_t elementCap)
            : Namespace(NamespaceKind::Sequence), session_(session), type_(type), elements_(elementCap) {}

        BuiltinClassInfo* typeInfo() const { return type_; }
        VariableDef& elements() { return elements_; }
        bool addElementTypes(const NamespaceSet& values) { return elements_.addTypes(values); }

        std::string name() const override;
        MemberType memberType() const override { return MemberType::Instance; }
        NamespaceSet getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) override;
        NamespaceSet getIterator(const ast::Node& node, AnalysisUnit& unit) override;
        NamespaceSet getEnumeratorTypes(const ast::Node& node, AnalysisUnit& unit) override;
        NamespaceSet getIndex(const ast::Node& node, AnalysisUnit& unit, const NamespaceSet& index) override;
        void setIndex(const ast::Node& node, AnalysisUnit& unit, const NamespaceSet& index,
                      const NamespaceSet& value) override;
        std::map<std::string, NamespaceSet> allMembers() override;

    private:
        AnalysisSession& session_;
        BuiltinClassInfo* type_;
        VariableDef elements_;
        IteratorInfo* iterator_{nullptr};
        std::map<std::string, Namespace*> mutators_{};
    };

    class IteratorInfo final : public Namespace {
    public:
        // `shared` null: the iterator owns its element record.
        IteratorInfo(AnalysisSession& session, BuiltinClassInfo* type, VariableDef* shared, std::size_t cap);

        VariableDef& elements() { return *elements_; }
        bool addTypes(const NamespaceSet& values) { return elements_->addTypes(values); }

        std::string name() const override;
        MemberType memberType() const override { return MemberType::Instance; }
        NamespaceSet getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) override;
        NamespaceSet getIterator(const ast::Node& node, AnalysisUnit& unit) override;
        NamespaceSet getEnumeratorTypes(const ast::Node& node, AnalysisUnit& unit) override;

    private:
        AnalysisSession& session_;
        BuiltinClassInfo* type_;
        std::unique_ptr<VariableDef> owned_{};
        VariableDef* elements_;
        Namespace* next_{nullptr};
    };

} // namespace pyinfer::analysis
