#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace kbase::core {

/**
 * @brief Eviction policy for BoundedCache
 */
enum class EvictionPolicy {
    FIFO, ///< Oldest insertion evicted first
    LRU   ///< Least recently read or written evicted first
};

constexpr const char* evictionPolicyName(EvictionPolicy policy) {
    switch (policy) {
        case EvictionPolicy::FIFO:
            return "fifo";
        case EvictionPolicy::LRU:
            return "lru";
    }
    return "fifo";
}

inline std::optional<EvictionPolicy> parseEvictionPolicy(std::string_view name) {
    if (name == "fifo" || name == "oldest")
        return EvictionPolicy::FIFO;
    if (name == "lru")
        return EvictionPolicy::LRU;
    return std::nullopt;
}

struct CacheStats {
    size_t hits = 0;
    size_t misses = 0;
    size_t insertions = 0;
    size_t evictions = 0;
};

/**
 * @brief Thread-safe, capacity-bounded key/value cache.
 *
 * Entries are write-once: inserting a key that is already present keeps the
 * existing value. Once the entry count exceeds capacity the victim chosen by
 * the eviction policy is dropped. A capacity of zero disables caching.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>> class BoundedCache {
public:
    explicit BoundedCache(size_t capacity, EvictionPolicy policy = EvictionPolicy::FIFO)
        : capacity_(capacity), policy_(policy) {}

    BoundedCache(const BoundedCache&) = delete;
    BoundedCache& operator=(const BoundedCache&) = delete;

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            ++stats_.misses;
            return std::nullopt;
        }
        ++stats_.hits;
        if (policy_ == EvictionPolicy::LRU) {
            order_.splice(order_.end(), order_, it->second);
        }
        return it->second->second;
    }

    /// Returns false when the key was already cached (value left untouched).
    bool put(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (capacity_ == 0) {
            return false;
        }
        auto it = index_.find(key);
        if (it != index_.end()) {
            if (policy_ == EvictionPolicy::LRU) {
                order_.splice(order_.end(), order_, it->second);
            }
            return false;
        }
        order_.emplace_back(key, std::move(value));
        index_.emplace(key, std::prev(order_.end()));
        ++stats_.insertions;

        while (order_.size() > capacity_) {
            index_.erase(order_.front().first);
            order_.pop_front();
            ++stats_.evictions;
        }
        return true;
    }

    bool contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.find(key) != index_.end();
    }

    bool erase(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        order_.erase(it->second);
        index_.erase(it);
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        order_.clear();
        index_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return order_.size();
    }

    size_t capacity() const { return capacity_; }
    EvictionPolicy policy() const { return policy_; }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    using Entry = std::pair<Key, Value>;

    const size_t capacity_;
    const EvictionPolicy policy_;

    mutable std::mutex mutex_;
    std::list<Entry> order_; // front = next victim
    std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index_;
    CacheStats stats_;
};

} // namespace kbase::core
