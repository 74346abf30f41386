/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REGION_BOUNDS_HPP
#define REGION_BOUNDS_HPP

#include "spatial/SpatialKey.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <ostream>

namespace Lattice {

/**
 * @brief Inclusive axis-aligned box in block coordinates
 *
 * Used for bulk invalidation (a chunk unloading drops every cached block,
 * section and chunk entry inside its column).
 */
struct RegionBounds {
    int32_t minX{0};
    int32_t minY{0};
    int32_t minZ{0};
    int32_t maxX{0};
    int32_t maxY{0};
    int32_t maxZ{0};

    bool contains(const BlockPos& p) const {
        return p.x >= minX && p.x <= maxX &&
               p.y >= minY && p.y <= maxY &&
               p.z >= minZ && p.z <= maxZ;
    }

    bool intersects(const RegionBounds& other) const {
        return minX <= other.maxX && maxX >= other.minX &&
               minY <= other.maxY && maxY >= other.minY &&
               minZ <= other.maxZ && maxZ >= other.minZ;
    }

    bool operator==(const RegionBounds&) const = default;

    static RegionBounds fromCorners(const BlockPos& a, const BlockPos& b) {
        return RegionBounds{std::min(a.x, b.x), std::min(a.y, b.y), std::min(a.z, b.z),
                            std::max(a.x, b.x), std::max(a.y, b.y), std::max(a.z, b.z)};
    }

    // Full-height column covered by a chunk
    static RegionBounds forChunk(const ChunkPos& chunk) {
        const int64_t x0 = static_cast<int64_t>(chunk.x) * SpatialKeys::CHUNK_SIZE;
        const int64_t z0 = static_cast<int64_t>(chunk.z) * SpatialKeys::CHUNK_SIZE;
        return RegionBounds{clamp32(x0),
                            std::numeric_limits<int32_t>::min(),
                            clamp32(z0),
                            clamp32(x0 + SpatialKeys::CHUNK_SIZE - 1),
                            std::numeric_limits<int32_t>::max(),
                            clamp32(z0 + SpatialKeys::CHUNK_SIZE - 1)};
    }

    static RegionBounds forSection(const SectionPos& section) {
        const int64_t x0 = static_cast<int64_t>(section.x) * SpatialKeys::CHUNK_SIZE;
        const int64_t y0 = static_cast<int64_t>(section.y) * SpatialKeys::CHUNK_SIZE;
        const int64_t z0 = static_cast<int64_t>(section.z) * SpatialKeys::CHUNK_SIZE;
        return RegionBounds{clamp32(x0), clamp32(y0), clamp32(z0),
                            clamp32(x0 + SpatialKeys::CHUNK_SIZE - 1),
                            clamp32(y0 + SpatialKeys::CHUNK_SIZE - 1),
                            clamp32(z0 + SpatialKeys::CHUNK_SIZE - 1)};
    }

    static RegionBounds forBlock(const BlockPos& p) {
        return RegionBounds{p.x, p.y, p.z, p.x, p.y, p.z};
    }

    // Cube of blocks within `radius` of a centre block (Chebyshev distance)
    static RegionBounds around(const BlockPos& centre, int32_t radius) {
        return RegionBounds{
            clamp32(static_cast<int64_t>(centre.x) - radius),
            clamp32(static_cast<int64_t>(centre.y) - radius),
            clamp32(static_cast<int64_t>(centre.z) - radius),
            clamp32(static_cast<int64_t>(centre.x) + radius),
            clamp32(static_cast<int64_t>(centre.y) + radius),
            clamp32(static_cast<int64_t>(centre.z) + radius)};
    }

private:
    static int32_t clamp32(int64_t v) {
        return static_cast<int32_t>(std::clamp<int64_t>(
            v, std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max()));
    }
};

inline std::ostream& operator<<(std::ostream& os, const RegionBounds& r) {
    return os << "Region[(" << r.minX << ", " << r.minY << ", " << r.minZ << ") .. ("
              << r.maxX << ", " << r.maxY << ", " << r.maxZ << ")]";
}

} // namespace Lattice

#endif // REGION_BOUNDS_HPP
