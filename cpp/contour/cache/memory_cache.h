#ifndef CONTOUR_CACHE_MEMORY_CACHE_H
#define CONTOUR_CACHE_MEMORY_CACHE_H

#include "contour/cache/cache_key.h"
#include "contour/core/types.h"

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace contour::cache {

struct CacheStats {
    std::size_t entries{0};
    std::size_t bytes{0};
    std::size_t maxBytes{0};
};

// Byte-budgeted LRU of parsed documents. Every operation runs under one
// mutex; values are shared immutable documents, so readers keep theirs alive
// after eviction.
class MemoryCache {
public:
    using Value = std::shared_ptr<const ParsedDocument>;

    explicit MemoryCache(std::size_t maxBytes);

    MemoryCache(const MemoryCache&) = delete;
    MemoryCache& operator=(const MemoryCache&) = delete;

    // Marks the entry most recently used. Null on a miss.
    Value get(const CacheKey& key);

    // Inserts or replaces, then evicts from the cold end while over budget.
    // An entry larger than the whole budget evicts itself.
    void put(const CacheKey& key, Value value, std::size_t approxBytes);

    bool contains(const CacheKey& key) const;
    void clear();
    CacheStats stats() const;

    std::size_t maxBytes() const noexcept { return maxBytes_; }

private:
    struct Entry {
        CacheKey key;
        Value value;
        std::size_t bytes;
    };
    using EntryList = std::list<Entry>;

    void evictLocked();

    mutable std::mutex mutex_;
    const std::size_t maxBytes_;
    std::size_t totalBytes_{0};
    EntryList order_; // front = most recently used
    std::unordered_map<CacheKey, EntryList::iterator, CacheKeyHash> index_;
};

} // namespace contour::cache

#endif // CONTOUR_CACHE_MEMORY_CACHE_H
