/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CACHE_HANDLE_HPP
#define CACHE_HANDLE_HPP

#include "spatial/RegionBounds.hpp"
#include "spatial/SpatialKey.hpp"
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace Lattice {

/**
 * @brief Diagnostics snapshot for one registered cache or index
 *
 * Purely informational; nothing reads it to make decisions.
 */
struct CacheStats {
    std::string name;
    size_t size{0};
    size_t capacity{0};          // 0 = unbounded
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t overflowClears{0};  // Whole-cache clears caused by capacity
    uint64_t evictions{0};       // Single entries dropped by LRU
    uint64_t invalidations{0};   // Entries dropped by explicit invalidation

    // Spatial index only
    uint64_t queries{0};
    uint64_t rebuckets{0};       // Moves that crossed a cell boundary

    double hitRate() const {
        const uint64_t total = hits + misses;
        return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
    }
};

inline std::ostream& operator<<(std::ostream& os, const CacheStats& s) {
    os << s.name << ": size=" << s.size << " capacity=";
    if (s.capacity == 0) {
        os << "unbounded";
    } else {
        os << s.capacity;
    }
    os << " hits=" << s.hits << " misses=" << s.misses
       << " overflowClears=" << s.overflowClears
       << " evictions=" << s.evictions
       << " invalidations=" << s.invalidations;
    if (s.queries != 0 || s.rebuckets != 0) {
        os << " queries=" << s.queries << " rebuckets=" << s.rebuckets;
    }
    return os;
}

/**
 * @brief Type-erased view of a cache or spatial index
 *
 * CacheRegistry only sees caches through this interface, so caches with
 * different key and value types can be cleared and inspected uniformly.
 */
class CacheHandle {
public:
    virtual ~CacheHandle() = default;

    virtual const std::string& getName() const = 0;

    // Drops every entry
    virtual void clear() = 0;

    /**
     * @brief Drops the entry stored under a packed key
     *
     * Keys from a space this handle does not store are ignored, so one key
     * can be broadcast to caches of every kind.
     * @return true if something was removed
     */
    virtual bool invalidateKey(KeySpace space, SpatialKey key) = 0;

    /**
     * @brief Drops every entry located inside a block-space region
     * @return number of entries removed
     */
    virtual size_t invalidateRegion(const RegionBounds& region) = 0;

    virtual size_t size() const = 0;
    virtual CacheStats getStats() const = 0;
};

} // namespace Lattice

#endif // CACHE_HANDLE_HPP
