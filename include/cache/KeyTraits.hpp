/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef KEY_TRAITS_HPP
#define KEY_TRAITS_HPP

#include "spatial/RegionBounds.hpp"
#include "spatial/SpatialKey.hpp"

namespace Lattice {

/**
 * @brief Maps a cache key type onto its packed SpatialKey
 *
 * Each specialization provides:
 * - SPACE            the KeySpace its packed keys belong to
 * - toKey(K)         packs the key
 * - fromKey(key)     recovers K from a stored key
 * - inRegion(key, r) whether the stored key lies inside block region r
 */
template <typename K> struct KeyTraits;

template <> struct KeyTraits<BlockPos> {
    static constexpr KeySpace SPACE = KeySpace::Block;
    static SpatialKey toKey(const BlockPos& p) { return SpatialKeys::packBlock(p); }
    static BlockPos fromKey(SpatialKey key) { return SpatialKeys::unpackBlock(key); }
    static bool inRegion(SpatialKey key, const RegionBounds& region) {
        return region.contains(fromKey(key));
    }
};

template <> struct KeyTraits<ChunkPos> {
    static constexpr KeySpace SPACE = KeySpace::Chunk;
    static SpatialKey toKey(const ChunkPos& p) { return SpatialKeys::packChunk(p); }
    static ChunkPos fromKey(SpatialKey key) { return SpatialKeys::unpackChunk(key); }
    static bool inRegion(SpatialKey key, const RegionBounds& region) {
        return region.intersects(RegionBounds::forChunk(fromKey(key)));
    }
};

template <> struct KeyTraits<SectionPos> {
    static constexpr KeySpace SPACE = KeySpace::Section;
    static SpatialKey toKey(const SectionPos& p) { return SpatialKeys::packSection(p); }
    static SectionPos fromKey(SpatialKey key) { return SpatialKeys::unpackSection(key); }
    static bool inRegion(SpatialKey key, const RegionBounds& region) {
        return region.intersects(RegionBounds::forSection(fromKey(key)));
    }
};

// Content-derived keys (hashes of recipe inputs, tag sets). They have no
// position, so region invalidation never touches them.
template <> struct KeyTraits<SpatialKey> {
    static constexpr KeySpace SPACE = KeySpace::Content;
    static SpatialKey toKey(SpatialKey key) { return key; }
    static SpatialKey fromKey(SpatialKey key) { return key; }
    static bool inRegion(SpatialKey, const RegionBounds&) { return false; }
};

} // namespace Lattice

#endif // KEY_TRAITS_HPP
