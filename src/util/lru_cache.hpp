#ifndef PHISCAN_UTIL_LRU_CACHE_HPP
#define PHISCAN_UTIL_LRU_CACHE_HPP

#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

/**
 * @file lru_cache.hpp
 * @brief A bounded, mutex-guarded least-recently-used cache.
 *
 * Lifecycle: owned by the component that creates it (the fuzzy dictionary
 * matcher owns one per instance); it lives exactly as long as that owner and
 * is emptied with clear(). There is no process-wide cache.
 *
 * Concurrent put() calls for the same key are serialized; the last write wins.
 */

namespace phiscan {
namespace util {

template<typename Key, typename Value>
class LruCache
{
public:
    /**
     * @param capacity Maximum number of entries. Zero disables caching.
     */
    explicit LruCache(std::size_t capacity)
        : capacity_(capacity)
    {
    }

    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;

    /**
     * @brief Look up a key, marking it most recently used on a hit.
     */
    std::optional<Value> get(const Key &key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        entries_.splice(entries_.begin(), entries_, it->second);
        return it->second->second;
    }

    /**
     * @brief Insert or overwrite a key, evicting the least recently used entry
     *        when over capacity.
     */
    void put(const Key &key, Value value)
    {
        if (capacity_ == 0) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }

        entries_.emplace_front(key, std::move(value));
        index_[key] = entries_.begin();

        if (entries_.size() > capacity_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
        }
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        index_.clear();
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    std::size_t capacity() const { return capacity_; }

private:
    using EntryList = std::list<std::pair<Key, Value>>;

    const std::size_t capacity_;
    EntryList entries_;                                              ///< Most recent first
    std::unordered_map<Key, typename EntryList::iterator> index_;
    mutable std::mutex mutex_;
};

} // namespace util
} // namespace phiscan

#endif // PHISCAN_UTIL_LRU_CACHE_HPP
