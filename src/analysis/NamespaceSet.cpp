/***
 * Name: NamespaceSet (definitions)
 * Purpose: Sorted-merge union and identity equality over arena ids.
 */
#include "analysis/NamespaceSet.h"

#include <algorithm>
#include <iterator>

#include "analysis/Namespace.h"

namespace pyinfer::analysis {

    namespace {
        bool byId(const Namespace* lhs, const Namespace* rhs) { return lhs->id() < rhs->id(); }

        const std::vector<Namespace*>& emptyItems() {
            static const std::vector<Namespace*> kEmpty{};
            return kEmpty;
        }
    } // namespace

    /*** Name: NamespaceSet::NamespaceSet(Namespace*) */
    NamespaceSet::NamespaceSet(Namespace* value) {
        if (value != nullptr) { items_ = std::make_shared<const std::vector<Namespace*>>(std::vector<Namespace*>{value}); }
    }

    /*** Name: NamespaceSet::top */
    NamespaceSet NamespaceSet::top() {
        NamespaceSet out;
        out.top_ = true;
        return out;
    }

    /*** Name: NamespaceSet::of */
    NamespaceSet NamespaceSet::of(std::vector<Namespace*> values) {
        values.erase(std::remove(values.begin(), values.end(), nullptr), values.end());
        if (values.empty()) { return {}; }
        std::sort(values.begin(), values.end(), byId);
        values.erase(std::unique(values.begin(), values.end()), values.end());
        return NamespaceSet(std::make_shared<const std::vector<Namespace*>>(std::move(values)));
    }

    /*** Name: NamespaceSet::items */
    const std::vector<Namespace*>& NamespaceSet::items() const { return items_ ? *items_ : emptyItems(); }

    /*** Name: NamespaceSet::contains */
    bool NamespaceSet::contains(const Namespace* value) const {
        if (value == nullptr || !items_) { return false; }
        return std::binary_search(items_->begin(), items_->end(), const_cast<Namespace*>(value), byId);
    }

    /*** Name: NamespaceSet::unionWith */
    NamespaceSet NamespaceSet::unionWith(const NamespaceSet& other, std::size_t cap) const {
        if (top_ || other.top_) { return top(); }
        NamespaceSet result;
        if (other.empty() || items_ == other.items_) {
            result = *this;
        } else if (empty()) {
            result = other;
        } else {
            std::vector<Namespace*> merged;
            merged.reserve(size() + other.size());
            std::set_union(items_->begin(), items_->end(), other.items_->begin(), other.items_->end(),
                           std::back_inserter(merged), byId);
            if (merged.size() == size()) {
                result = *this;
            } else if (merged.size() == other.size()) {
                result = other;
            } else {
                result = NamespaceSet(std::make_shared<const std::vector<Namespace*>>(std::move(merged)));
            }
        }
        if (cap != 0 && result.size() > cap) { return top(); }
        return result;
    }

    /*** Name: NamespaceSet::add */
    NamespaceSet NamespaceSet::add(Namespace* value, std::size_t cap) const { return unionWith(NamespaceSet(value), cap); }

    /*** Name: NamespaceSet::unionAll */
    NamespaceSet NamespaceSet::unionAll(const std::vector<NamespaceSet>& sets, std::size_t cap) {
        NamespaceSet out;
        for (const auto& set : sets) {
            out = out.unionWith(set, cap);
            if (out.isTop()) { break; }
        }
        return out;
    }

    /*** Name: NamespaceSet::operator== */
    bool NamespaceSet::operator==(const NamespaceSet& other) const {
        if (top_ != other.top_) { return false; }
        if (items_ == other.items_) { return true; }
        return items() == other.items();
    }

} // namespace pyinfer::analysis
