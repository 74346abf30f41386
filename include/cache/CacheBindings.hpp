/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CACHE_BINDINGS_HPP
#define CACHE_BINDINGS_HPP

/**
 * @file CacheBindings.hpp
 * @brief Subscribes individual caches to the world events that stale them
 *
 * Each helper returns the bus tokens it registered. The cache must outlive
 * the subscription: unsubscribe the tokens before destroying the cache.
 */

#include "cache/SpatialCache.hpp"
#include "managers/InvalidationBus.hpp"
#include "spatial/RegionBounds.hpp"
#include "spatial/SpatialIndex.hpp"
#include "spatial/SpatialKey.hpp"
#include <type_traits>
#include <vector>

namespace Lattice {

using BindingTokens = std::vector<InvalidationBus::HandlerToken>;

/**
 * @brief BlockChanged drops the cache entry covering the changed block
 *
 * Block-keyed caches drop the block itself; chunk and section keyed caches
 * drop the chunk or section that contains it. Opaque keys cannot be mapped
 * from a position, so those caches fall back to region invalidation.
 */
template <typename K, typename V, typename Traits>
BindingTokens bindBlockInvalidation(InvalidationBus& bus, SpatialCache<K, V, Traits>& cache) {
    return {bus.subscribe(InvalidationEventKind::BlockChanged,
        [&cache](const InvalidationEvent& event) {
            const auto* changed = event.getIf<InvalidationEvent::BlockChanged>();
            if (changed == nullptr) {
                return;
            }
            if constexpr (std::is_same_v<K, BlockPos>) {
                cache.invalidate(changed->pos);
            } else if constexpr (std::is_same_v<K, ChunkPos>) {
                cache.invalidate(SpatialKeys::chunkOfBlock(changed->pos));
            } else if constexpr (std::is_same_v<K, SectionPos>) {
                cache.invalidate(SpatialKeys::sectionOfBlock(changed->pos));
            } else {
                cache.invalidateRegion(RegionBounds::forBlock(changed->pos));
            }
        })};
}

/**
 * @brief BlockChanged drops every entry within `radius` blocks of the change
 *
 * For values derived from a neighbourhood (light levels, path costs), where
 * one block change stales its neighbours too.
 */
inline BindingTokens bindBlockNeighbourhoodInvalidation(InvalidationBus& bus, CacheHandle& cache,
                                                        int32_t radius) {
    return {bus.subscribe(InvalidationEventKind::BlockChanged,
        [&cache, radius](const InvalidationEvent& event) {
            if (const auto* changed = event.getIf<InvalidationEvent::BlockChanged>()) {
                cache.invalidateRegion(RegionBounds::around(changed->pos, radius));
            }
        })};
}

/**
 * @brief Chunk load and unload drop the chunk's column from the cache
 *
 * Unload removes entries that would otherwise pin unloaded terrain; load
 * removes answers computed while the chunk was missing.
 */
inline BindingTokens bindChunkInvalidation(InvalidationBus& bus, CacheHandle& cache) {
    BindingTokens tokens;
    tokens.push_back(bus.subscribe(InvalidationEventKind::ChunkUnloaded,
        [&cache](const InvalidationEvent& event) {
            if (const auto* unloaded = event.getIf<InvalidationEvent::ChunkUnloaded>()) {
                cache.invalidateRegion(RegionBounds::forChunk(unloaded->chunk));
            }
        }));
    tokens.push_back(bus.subscribe(InvalidationEventKind::ChunkLoaded,
        [&cache](const InvalidationEvent& event) {
            if (const auto* loaded = event.getIf<InvalidationEvent::ChunkLoaded>()) {
                cache.invalidateRegion(RegionBounds::forChunk(loaded->chunk));
            }
        }));
    return tokens;
}

// EntityRemoved removes the entity from the index
inline BindingTokens bindEntityRemoval(InvalidationBus& bus, SpatialIndex& index) {
    return {bus.subscribe(InvalidationEventKind::EntityRemoved,
        [&index](const InvalidationEvent& event) {
            if (const auto* removed = event.getIf<InvalidationEvent::EntityRemoved>()) {
                index.removeById(removed->id);
            }
        })};
}

inline void unbindAll(InvalidationBus& bus, BindingTokens& tokens) {
    for (const auto& token : tokens) {
        bus.unsubscribe(token);
    }
    tokens.clear();
}

} // namespace Lattice

#endif // CACHE_BINDINGS_HPP
