/***
 * Name: pyinfer::analysis::NamespaceSet
 * Purpose: Immutable, deduplicated set of abstract values observed at one program point.
 * Inputs: Namespace pointers owned by the session arena.
 * Outputs: Union algebra (idempotent, commutative, associative) with an optional cardinality cap.
 * Theory of Operation:
 *   Members are kept sorted by the arena id of each Namespace, so equality and union are
 *   linear merges and independent of insertion order. The member vector is shared between
 *   copies and never mutated. A union that would exceed its cap yields the distinguished
 *   top set; top absorbs every later union and enumerates no members.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace pyinfer::analysis {

    class Namespace;

    class NamespaceSet {
    public:
        using const_iterator = std::vector<Namespace*>::const_iterator;

        NamespaceSet() = default;
        // Singleton set; a null value yields the empty set.
        explicit NamespaceSet(Namespace* value);

        static NamespaceSet top();
        static NamespaceSet of(std::vector<Namespace*> values);

        bool isTop() const { return top_; }
        bool empty() const { return size() == 0; }
        std::size_t size() const { return items_ ? items_->size() : 0; }
        bool contains(const Namespace* value) const;

        const std::vector<Namespace*>& items() const;
        const_iterator begin() const { return items().begin(); }
        const_iterator end() const { return items().end(); }

        // cap == 0 leaves the result uncapped.
        NamespaceSet unionWith(const NamespaceSet& other, std::size_t cap = 0) const;
        NamespaceSet add(Namespace* value, std::size_t cap = 0) const;
        static NamespaceSet unionAll(const std::vector<NamespaceSet>& sets, std::size_t cap = 0);

        template <typename T>
        std::vector<T*> ofType() const {
            std::vector<T*> out;
            for (Namespace* value : items()) {
                if (auto* typed = dynamic_cast<T*>(value)) { out.push_back(typed); }
            }
            return out;
        }

        bool operator==(const NamespaceSet& other) const;
        bool operator!=(const NamespaceSet& other) const { return !(*this == other); }

    private:
        explicit NamespaceSet(std::shared_ptr<const std::vector<Namespace*>> items) : items_(std::move(items)) {}

        std::shared_ptr<const std::vector<Namespace*>> items_{};
        bool top_{false};
    };

} // namespace pyinfer::analysis
