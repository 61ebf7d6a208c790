/***
 * Name: pyinfer::analysis::ValueCache
 * Purpose: Single-flight, cycle-safe memoization from a key to one session-owned value.
 * Inputs: Keys (host object identity, constant values, node pairs) and factories.
 * Outputs: The one value created for each key.
 * Theory of Operation:
 *   getCached stores a null placeholder before running the factory and runs the factory
 *   without holding the lock. A re-entrant lookup of the same key during construction
 *   therefore observes the placeholder instead of recursing; callers must tolerate a null
 *   result for self-referential graphs. A factory that throws leaves no entry behind.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace pyinfer::analysis {

    template <typename Key, typename Value, typename Hash = std::hash<Key>>
    class ValueCache {
    public:
        template <typename Factory>
        Value* getCached(const Key& key, Factory&& factory) {
            {
                const std::lock_guard<std::mutex> lock(mutex_);
                auto it = entries_.find(key);
                if (it != entries_.end()) { return it->second; }
                entries_.emplace(key, nullptr);
                ++misses_;
            }
            Value* value = nullptr;
            try {
                value = factory();
            } catch (...) {
                const std::lock_guard<std::mutex> lock(mutex_);
                entries_.erase(key);
                throw;
            }
            const std::lock_guard<std::mutex> lock(mutex_);
            entries_[key] = value;
            return value;
        }

        bool contains(const Key& key) const {
            const std::lock_guard<std::mutex> lock(mutex_);
            return entries_.count(key) != 0;
        }

        std::size_t size() const {
            const std::lock_guard<std::mutex> lock(mutex_);
            return entries_.size();
        }

        std::size_t misses() const {
            const std::lock_guard<std::mutex> lock(mutex_);
            return misses_;
        }

        void clear() {
            const std::lock_guard<std::mutex> lock(mutex_);
            entries_.clear();
        }

    private:
        mutable std::mutex mutex_;
        std::unordered_map<Key, Value*, Hash> entries_{};
        std::size_t misses_{0};
    };

} // namespace pyinfer::analysis
