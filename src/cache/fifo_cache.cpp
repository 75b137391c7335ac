/// @file src/cache/fifo_cache.cpp
/// @brief FifoResultCache: insertion-ordered list plus hash index.

#include "efe/cache.hpp"

#include <algorithm>
#include <iterator>

namespace efe::cache {

FifoResultCache::FifoResultCache(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {
    index_.reserve(capacity_ + 1);
}

std::optional<CalculationResult> FifoResultCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return it->second->second;
}

void FifoResultCache::put(const std::string& key, CalculationResult result) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = std::move(result);
        return;
    }

    entries_.emplace_back(key, std::move(result));
    index_.emplace(key, std::prev(entries_.end()));

    if (entries_.size() > capacity_) {
        index_.erase(entries_.front().first);
        entries_.pop_front();
        ++evictions_;
    }
}

bool FifoResultCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.find(key) != index_.end();
}

std::size_t FifoResultCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void FifoResultCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
    hits_      = 0;
    misses_    = 0;
    evictions_ = 0;
}

CacheStats FifoResultCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CacheStats{
        .entries   = entries_.size(),
        .capacity  = capacity_,
        .hits      = hits_,
        .misses    = misses_,
        .evictions = evictions_,
    };
}

} // namespace efe::cache
