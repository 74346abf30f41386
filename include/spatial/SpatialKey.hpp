/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_KEY_HPP
#define SPATIAL_KEY_HPP

/**
 * @file SpatialKey.hpp
 * @brief Packing of block, chunk and section coordinates into 64-bit keys
 *
 * Layouts (most significant bit first):
 * - Block:   X (26 bits, signed) | Z (26 bits, signed) | Y (12 bits, unsigned)
 * - Chunk:   X (32 bits, signed) | Z (32 bits, signed)
 * - Section: X (24 bits, signed) | Z (24 bits, signed) | Y (16 bits, signed)
 *
 * Every layout is injective inside its domain. Coordinates outside the
 * domain are masked and wrap around, the same way a voxel world wraps at
 * its border. Callers that need to reject them check isBlockInDomain().
 */

#include "utils/Vector3D.hpp"
#include <cmath>
#include <cstdint>
#include <ostream>

namespace Lattice {

using SpatialKey = uint64_t;

// Handle of an indexed object (entity, tile entity). Assigned by the owner,
// never derived from object identity.
using ObjectID = uint64_t;

/**
 * @brief Which layout a packed SpatialKey was built with
 *
 * Block, chunk and section keys, content hashes and object ids all share
 * the uint64_t range (packBlock(0, 5, 0) == packChunk(0, 5) == 5), so a raw
 * key only means something together with its space.
 */
enum class KeySpace : uint8_t { Block, Chunk, Section, Content, Object };

inline std::ostream& operator<<(std::ostream& os, KeySpace space) {
    switch (space) {
        case KeySpace::Block: return os << "Block";
        case KeySpace::Chunk: return os << "Chunk";
        case KeySpace::Section: return os << "Section";
        case KeySpace::Content: return os << "Content";
        case KeySpace::Object: return os << "Object";
        default: return os << "Unknown";
    }
}

struct BlockPos {
    int32_t x{0};
    int32_t y{0};
    int32_t z{0};

    bool operator==(const BlockPos&) const = default;
};

struct ChunkPos {
    int32_t x{0};
    int32_t z{0};

    bool operator==(const ChunkPos&) const = default;
};

struct SectionPos {
    int32_t x{0};
    int32_t y{0};
    int32_t z{0};

    bool operator==(const SectionPos&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const BlockPos& p) {
    return os << "Block(" << p.x << ", " << p.y << ", " << p.z << ")";
}
inline std::ostream& operator<<(std::ostream& os, const ChunkPos& p) {
    return os << "Chunk(" << p.x << ", " << p.z << ")";
}
inline std::ostream& operator<<(std::ostream& os, const SectionPos& p) {
    return os << "Section(" << p.x << ", " << p.y << ", " << p.z << ")";
}

namespace SpatialKeys {

// Block layout
constexpr int BLOCK_XZ_BITS = 26;
constexpr int BLOCK_Y_BITS = 12;
constexpr int BLOCK_X_SHIFT = BLOCK_XZ_BITS + BLOCK_Y_BITS; // 38
constexpr int BLOCK_Z_SHIFT = BLOCK_Y_BITS;                 // 12
constexpr uint64_t BLOCK_XZ_MASK = (uint64_t{1} << BLOCK_XZ_BITS) - 1;
constexpr uint64_t BLOCK_Y_MASK = (uint64_t{1} << BLOCK_Y_BITS) - 1;

constexpr int32_t BLOCK_XZ_MIN = -(int32_t{1} << (BLOCK_XZ_BITS - 1)); // -33,554,432
constexpr int32_t BLOCK_XZ_MAX = (int32_t{1} << (BLOCK_XZ_BITS - 1)) - 1;
constexpr int32_t BLOCK_Y_MIN = 0;
constexpr int32_t BLOCK_Y_MAX = static_cast<int32_t>(BLOCK_Y_MASK); // 4095

// Section layout
constexpr int SECTION_XZ_BITS = 24;
constexpr int SECTION_Y_BITS = 16;
constexpr int SECTION_X_SHIFT = SECTION_XZ_BITS + SECTION_Y_BITS; // 40
constexpr int SECTION_Z_SHIFT = SECTION_Y_BITS;                   // 16
constexpr uint64_t SECTION_XZ_MASK = (uint64_t{1} << SECTION_XZ_BITS) - 1;
constexpr uint64_t SECTION_Y_MASK = (uint64_t{1} << SECTION_Y_BITS) - 1;

// Chunks and sections are 16 blocks wide
constexpr int CHUNK_SHIFT = 4;
constexpr int32_t CHUNK_SIZE = int32_t{1} << CHUNK_SHIFT;

// Restores a signed value from its low `bits` bits
constexpr int32_t signExtend(uint64_t value, int bits) {
    const uint64_t signBit = uint64_t{1} << (bits - 1);
    const uint64_t masked = value & ((uint64_t{1} << bits) - 1);
    return static_cast<int32_t>(static_cast<int64_t>(masked ^ signBit) -
                                static_cast<int64_t>(signBit));
}

constexpr uint64_t bits(int32_t value, uint64_t mask) {
    return static_cast<uint64_t>(static_cast<uint32_t>(value)) & mask;
}

constexpr SpatialKey packBlock(int32_t x, int32_t y, int32_t z) {
    return (bits(x, BLOCK_XZ_MASK) << BLOCK_X_SHIFT) |
           (bits(z, BLOCK_XZ_MASK) << BLOCK_Z_SHIFT) |
           bits(y, BLOCK_Y_MASK);
}

constexpr SpatialKey packBlock(const BlockPos& pos) {
    return packBlock(pos.x, pos.y, pos.z);
}

constexpr BlockPos unpackBlock(SpatialKey key) {
    return BlockPos{
        signExtend(key >> BLOCK_X_SHIFT, BLOCK_XZ_BITS),
        static_cast<int32_t>(key & BLOCK_Y_MASK),
        signExtend(key >> BLOCK_Z_SHIFT, BLOCK_XZ_BITS)};
}

constexpr bool isBlockInDomain(int32_t x, int32_t y, int32_t z) {
    return x >= BLOCK_XZ_MIN && x <= BLOCK_XZ_MAX &&
           z >= BLOCK_XZ_MIN && z <= BLOCK_XZ_MAX &&
           y >= BLOCK_Y_MIN && y <= BLOCK_Y_MAX;
}

constexpr bool isBlockInDomain(const BlockPos& pos) {
    return isBlockInDomain(pos.x, pos.y, pos.z);
}

constexpr SpatialKey packChunk(int32_t cx, int32_t cz) {
    return (static_cast<uint64_t>(static_cast<uint32_t>(cx)) << 32) |
           static_cast<uint64_t>(static_cast<uint32_t>(cz));
}

constexpr SpatialKey packChunk(const ChunkPos& pos) {
    return packChunk(pos.x, pos.z);
}

constexpr ChunkPos unpackChunk(SpatialKey key) {
    return ChunkPos{static_cast<int32_t>(static_cast<uint32_t>(key >> 32)),
                    static_cast<int32_t>(static_cast<uint32_t>(key))};
}

constexpr SpatialKey packSection(int32_t sx, int32_t sy, int32_t sz) {
    return (bits(sx, SECTION_XZ_MASK) << SECTION_X_SHIFT) |
           (bits(sz, SECTION_XZ_MASK) << SECTION_Z_SHIFT) |
           bits(sy, SECTION_Y_MASK);
}

constexpr SpatialKey packSection(const SectionPos& pos) {
    return packSection(pos.x, pos.y, pos.z);
}

constexpr SectionPos unpackSection(SpatialKey key) {
    return SectionPos{
        signExtend(key >> SECTION_X_SHIFT, SECTION_XZ_BITS),
        signExtend(key, SECTION_Y_BITS),
        signExtend(key >> SECTION_Z_SHIFT, SECTION_XZ_BITS)};
}

constexpr ChunkPos chunkOfBlock(const BlockPos& pos) {
    return ChunkPos{pos.x >> CHUNK_SHIFT, pos.z >> CHUNK_SHIFT};
}

constexpr SectionPos sectionOfBlock(const BlockPos& pos) {
    return SectionPos{pos.x >> CHUNK_SHIFT, pos.y >> CHUNK_SHIFT,
                      pos.z >> CHUNK_SHIFT};
}

// Grid cell containing a world position, for cells of `cellSize` units
inline SectionPos cellCoordOf(const Vector3D& pos, float cellSize) {
    return SectionPos{static_cast<int32_t>(std::floor(pos.getX() / cellSize)),
                      static_cast<int32_t>(std::floor(pos.getY() / cellSize)),
                      static_cast<int32_t>(std::floor(pos.getZ() / cellSize))};
}

inline SpatialKey cellOf(const Vector3D& pos, float cellSize) {
    return packSection(cellCoordOf(pos, cellSize));
}

} // namespace SpatialKeys

/**
 * @brief Hash for packed keys in unordered containers
 *
 * Packed keys keep Y in the low bits, so an identity hash would put a whole
 * column of blocks into neighbouring buckets. This mixes all 64 bits first.
 */
struct SpatialKeyHash {
    size_t operator()(SpatialKey key) const noexcept {
        key ^= key >> 33;
        key *= 0xff51afd7ed558ccdULL;
        key ^= key >> 33;
        key *= 0xc4ceb9fe1a85ec53ULL;
        key ^= key >> 33;
        return static_cast<size_t>(key);
    }
};

} // namespace Lattice

#endif // SPATIAL_KEY_HPP
