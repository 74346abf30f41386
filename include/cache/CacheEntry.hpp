/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CACHE_ENTRY_HPP
#define CACHE_ENTRY_HPP

#include "core/TickClock.hpp"
#include <cstdint>
#include <utility>

namespace Lattice {

/**
 * @brief One cached value plus the bookkeeping its staleness policy reads
 *
 * Entries are replaced whole, never patched in place.
 */
template <typename V> struct CacheEntry {
    V value;
    Tick createdAt{0};
    uint64_t version{0}; // Invalidation epoch when the value was computed

    CacheEntry(V v, Tick created, uint64_t ver)
        : value(std::move(v)), createdAt(created), version(ver) {}
};

} // namespace Lattice

#endif // CACHE_ENTRY_HPP
