#pragma once

/// @file include/efe/cache.hpp
/// @brief Memoization Cache: bounded key → result store with FIFO eviction.
///
/// # Module: Memoization Cache
///
/// ## Responsibility
/// Remember computed results so that an identical request is answered without
/// re-running its solver. The store is bounded; when an insert pushes it over
/// capacity the earliest-inserted entry is dropped, regardless of how recently
/// it was read (FIFO, not LRU).
///
/// ## Guarantees
/// - `size() <= capacity()` after every operation
/// - At most one eviction per insert
/// - Overwriting an existing key keeps its original insertion position
/// - Thread-safe: every operation takes the cache mutex
///
/// ## NOT Responsible For
/// - Expiry (entries have no TTL)
/// - Persistence across restarts

#include "efe/request.hpp"
#include "efe/result.hpp"

#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace efe::cache {

/// Occupancy and traffic counters since construction (or the last `clear`).
struct CacheStats {
    std::size_t   entries   = 0;
    std::size_t   capacity  = 0;
    std::uint64_t hits      = 0;
    std::uint64_t misses    = 0;
    std::uint64_t evictions = 0;
};

/// Abstract result store injected into the dispatcher.
class ResultCache {
public:
    virtual ~ResultCache() = default;

    /// Cached result for `key`, counting a hit or a miss.
    virtual std::optional<CalculationResult> get(const std::string& key) = 0;

    /// Insert or overwrite `key`.
    virtual void put(const std::string& key, CalculationResult result) = 0;

    /// True if `key` is present. Does not touch the hit/miss counters.
    virtual bool contains(const std::string& key) const = 0;

    virtual std::size_t size() const = 0;
    virtual std::size_t capacity() const = 0;
    virtual void clear() = 0;
    virtual CacheStats stats() const = 0;
};

/// FIFO-evicting ResultCache.
///
/// # Example
/// ```cpp
/// efe::cache::FifoResultCache cache(2);
/// cache.put("a", ra);
/// cache.put("b", rb);
/// (void)cache.get("a");     // reads do not reorder
/// cache.put("c", rc);       // evicts "a"
/// ```
class FifoResultCache final : public ResultCache {
public:
    /// A capacity of 0 is raised to 1.
    explicit FifoResultCache(std::size_t capacity = constants::MAX_CACHE_ENTRIES);

    std::optional<CalculationResult> get(const std::string& key) override;
    void put(const std::string& key, CalculationResult result) override;
    bool contains(const std::string& key) const override;

    std::size_t size() const override;
    std::size_t capacity() const override { return capacity_; }
    void clear() override;
    CacheStats stats() const override;

private:
    using Entry = std::pair<std::string, CalculationResult>;

    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::list<Entry>   entries_;   ///< Front = oldest insertion
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;

    std::uint64_t hits_      = 0;
    std::uint64_t misses_    = 0;
    std::uint64_t evictions_ = 0;
};

/// Deterministic key `<type>:[v1,v2,...]` built from the parameter set in its
/// declared field order. Doubles use shortest round-trip formatting.
[[nodiscard]] std::string make_cache_key(const CalculationParams& params);

} // namespace efe::cache
