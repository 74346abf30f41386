/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CACHE_REGISTRY_HPP
#define CACHE_REGISTRY_HPP

#include "cache/CacheHandle.hpp"
#include "managers/InvalidationBus.hpp"
#include "spatial/RegionBounds.hpp"
#include "spatial/SpatialKey.hpp"
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace Lattice {

/**
 * @brief Directory of every live cache, for bulk operations
 *
 * Used on world unload (clearAll), dimension or border changes, region
 * teardown and debug stats. The registry does not own its caches: a cache
 * must be unregistered before it is destroyed.
 *
 * Bulk operations snapshot the handle list and run without the registry
 * lock held, so a cache may be registered from inside a clear.
 */
class CacheRegistry {
public:
    CacheRegistry() = default;
    ~CacheRegistry();

    CacheRegistry(const CacheRegistry&) = delete;
    CacheRegistry& operator=(const CacheRegistry&) = delete;

    /**
     * @return false if cache is null or its name is already registered
     */
    bool registerCache(CacheHandle* cache);
    bool unregisterCache(const std::string& name);

    CacheHandle* find(const std::string& name) const;
    size_t size() const;

    void clearAll();

    /**
     * @brief Drops every entry inside region from every cache
     * @return total entries removed
     */
    size_t invalidateRegion(const RegionBounds& region);

    /**
     * @brief Drops `key` from every cache that stores keys of `space` and
     *        holds it; caches of other key spaces are left alone
     * @return number of caches that had the key
     */
    size_t invalidate(KeySpace space, SpatialKey key);

    // Per-cache stats in registration order
    std::vector<CacheStats> stats() const;
    void logStats() const;

    /**
     * @brief Wires the world-level events every cache cares about
     *
     * ChunkUnloaded drops the chunk's column from every cache; a world
     * border change clears everything. Per-cache bindings (block changes,
     * entity removal) are attached with the helpers in CacheBindings.hpp.
     * Call unbindFromBus() before the bus is destroyed if the registry
     * outlives it.
     */
    void bindToBus(InvalidationBus& bus);
    void unbindFromBus();

private:
    std::vector<CacheHandle*> snapshot() const;

    mutable std::mutex m_mutex;
    std::vector<CacheHandle*> m_caches;

    InvalidationBus* m_bus{nullptr};
    std::vector<InvalidationBus::HandlerToken> m_busTokens;
};

} // namespace Lattice

#endif // CACHE_REGISTRY_HPP
