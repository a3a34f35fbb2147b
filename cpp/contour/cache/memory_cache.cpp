#include "contour/cache/memory_cache.h"

#include <algorithm>
#include <utility>

namespace contour::cache {

MemoryCache::MemoryCache(std::size_t maxBytes)
    : maxBytes_(std::max<std::size_t>(1, maxBytes)) {}

MemoryCache::Value MemoryCache::get(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    order_.splice(order_.begin(), order_, it->second);
    return it->second->value;
}

void MemoryCache::put(const CacheKey& key, Value value, std::size_t approxBytes) {
    const std::size_t size = std::max<std::size_t>(1, approxBytes);
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(key);
    if (it != index_.end()) {
        totalBytes_ -= it->second->bytes;
        order_.erase(it->second);
        index_.erase(it);
    }

    order_.push_front(Entry{key, std::move(value), size});
    index_.emplace(key, order_.begin());
    totalBytes_ += size;
    evictLocked();
}

void MemoryCache::evictLocked() {
    while (totalBytes_ > maxBytes_ && !order_.empty()) {
        const Entry& victim = order_.back();
        totalBytes_ -= victim.bytes;
        index_.erase(victim.key);
        order_.pop_back();
    }
}

bool MemoryCache::contains(const CacheKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.find(key) != index_.end();
}

void MemoryCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    index_.clear();
    order_.clear();
    totalBytes_ = 0;
}

CacheStats MemoryCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats s;
    s.entries = order_.size();
    s.bytes = totalBytes_;
    s.maxBytes = maxBytes_;
    return s;
}

} // namespace contour::cache
