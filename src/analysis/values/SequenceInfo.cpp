/***
 * Name: SequenceInfo, IteratorInfo (definitions)
 * Purpose: Lists and tuples that track the union of their element values.
 * Theory of Operation:
 *   Elements are a VariableDef, so readers of an element (iteration, indexing) are
 *   re-enqueued when a later append or slice assignment adds a new value. Iterators over a
 *   sequence share the sequence's element record.
 */
#include "analysis/values/SequenceInfo.h"

#include "analysis/AnalysisSession.h"
#include "analysis/AnalysisUnit.h"
#include "analysis/values/BuiltinValues.h"
#include "analysis/values/SpecializedCallable.h"

namespace pyinfer::analysis {

    std::string SequenceInfo::name() const { return type_ != nullptr ? type_->name() : "sequence"; }

    /*** Name: SequenceInfo::getMember */
    NamespaceSet SequenceInfo::getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) {
        NamespaceSet generic = type_ != nullptr ? type_->instance().getMember(node, unit, name) : NamespaceSet{};
        const bool isList = type_ != nullptr && type_->type().typeId() == host::BuiltinTypeId::List;
        if (!isList || (name != "append" && name != "insert" && name != "extend")) { return generic; }

        Namespace*& slot = mutators_[name];
        if (slot == nullptr) {
            const bool extend = name == "extend";
            CallOverride fn = [this, extend](const ast::Node& callNode, AnalysisUnit& callUnit,
                                             const std::vector<NamespaceSet>& args,
                                             const std::vector<std::string>&) -> std::optional<NamespaceSet> {
                if (!args.empty()) {
                    // append(x) and insert(i, x) add the last argument; extend(xs) adds the elements of xs.
                    addElementTypes(extend ? analysis::getEnumeratorTypes(args.back(), callNode, callUnit)
                                           : args.back());
                }
                return session_.noneConstant()->selfSet();
            };
            slot = session_.make<SpecializedCallable>(session_, session_.aggregate(generic.items()),
                                                      name, SpecializationEntry{std::move(fn), false});
        }
        return slot->selfSet();
    }

    NamespaceSet SequenceInfo::getIterator(const ast::Node&, AnalysisUnit&) {
        if (iterator_ == nullptr) {
            iterator_ = session_.make<IteratorInfo>(session_, session_.knownType(host::BuiltinTypeId::ListIterator),
                                                    &elements_, 0);
        }
        return iterator_->selfSet();
    }

    NamespaceSet SequenceInfo::getEnumeratorTypes(const ast::Node&, AnalysisUnit& unit) {
        elements_.addDependency(unit);
        return elements_.types();
    }

    NamespaceSet SequenceInfo::getIndex(const ast::Node&, AnalysisUnit& unit, const NamespaceSet&) {
        elements_.addDependency(unit);
        return elements_.types();
    }

    void SequenceInfo::setIndex(const ast::Node&, AnalysisUnit&, const NamespaceSet&, const NamespaceSet& value) {
        elements_.addTypes(value);
    }

    std::map<std::string, NamespaceSet> SequenceInfo::allMembers() {
        return type_ != nullptr ? type_->allMembers() : std::map<std::string, NamespaceSet>{};
    }

    IteratorInfo::IteratorInfo(AnalysisSession& session, BuiltinClassInfo* type, VariableDef* shared, std::size_t cap)
        : Namespace(NamespaceKind::Iterator), session_(session), type_(type),
          owned_(shared == nullptr ? std::make_unique<VariableDef>(cap) : nullptr),
          elements_(shared != nullptr ? shared : owned_.get()) {}

    std::string IteratorInfo::name() const { return type_ != nullptr ? type_->name() : "iterator"; }

    /*** Name: IteratorInfo::getMember */
    NamespaceSet IteratorInfo::getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) {
        NamespaceSet generic = type_ != nullptr ? type_->instance().getMember(node, unit, name) : NamespaceSet{};
        if (name != session_.nextMethodName()) { return generic; }
        if (next_ == nullptr) {
            CallOverride fn = [this](const ast::Node&, AnalysisUnit& callUnit, const std::vector<NamespaceSet>&,
                                     const std::vector<std::string>&) -> std::optional<NamespaceSet> {
                elements_->addDependency(callUnit);
                return elements_->types();
            };
            next_ = session_.make<SpecializedCallable>(session_, session_.aggregate(generic.items()), name,
                                                       SpecializationEntry{std::move(fn), false});
        }
        return next_->selfSet();
    }

    NamespaceSet IteratorInfo::getIterator(const ast::Node&, AnalysisUnit&) { return selfSet(); }

    NamespaceSet IteratorInfo::getEnumeratorTypes(const ast::Node&, AnalysisUnit& unit) {
        elements_->addDependency(unit);
        return elements_->types();
    }

} // namespace pyinfer::analysis
