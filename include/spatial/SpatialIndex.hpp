/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_INDEX_HPP
#define SPATIAL_INDEX_HPP

#include "cache/CacheHandle.hpp"
#include "spatial/RegionBounds.hpp"
#include "spatial/SpatialKey.hpp"
#include "utils/Vector3D.hpp"
#include <boost/container/small_vector.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Lattice {

class SettingsManager;

/**
 * @brief Uniform 3D grid over moving objects for radius and window queries
 *
 * Design:
 * - Cells are cubes of getCellSize() world units, keyed by packed section keys
 * - Every object lives in exactly one bucket, the cell of its last known position
 * - move() only touches buckets when the object crosses a cell boundary;
 *   most per-tick moves just update the stored position
 * - Queries visit the candidate cells around the query volume and filter by
 *   exact squared distance. Only a query volume spanning more cells than
 *   there are objects walks the object table instead.
 *
 * The index never discovers removals on its own. Owners call remove() (or
 * removeById()) when an object despawns; chunk unloads arrive through
 * invalidateRegion().
 *
 * Thread safety: queries take a shared lock, mutations an exclusive one.
 */
class SpatialIndex : public CacheHandle {
public:
    static constexpr float DEFAULT_CELL_SIZE = 16.0f;

    /**
     * @param name Diagnostic name, also the registry key
     * @param cellSize Edge length of a grid cell in world units
     * @throws std::invalid_argument if cellSize is not positive
     */
    explicit SpatialIndex(std::string name, float cellSize = DEFAULT_CELL_SIZE);

    /**
     * @brief Cell size from settings category "spatial_index", key "cell_size"
     * @return fallback when the setting is missing or not positive
     */
    static float cellSizeFromSettings(const SettingsManager& settings,
                                      float fallback = DEFAULT_CELL_SIZE);

    SpatialIndex(const SpatialIndex&) = delete;
    SpatialIndex& operator=(const SpatialIndex&) = delete;

    // Core operations
    void insert(ObjectID id, const Vector3D& pos);
    void remove(ObjectID id, const Vector3D& pos);
    bool removeById(ObjectID id);
    void move(ObjectID id, const Vector3D& oldPos, const Vector3D& newPos);

    // Queries (result order is unspecified)
    std::vector<ObjectID> queryRadius(const Vector3D& center, float radius) const;
    void queryRadius(const Vector3D& center, float radius, std::vector<ObjectID>& out) const;
    std::vector<ObjectID> queryBox(const Vector3D& min, const Vector3D& max) const;
    std::vector<ObjectID> queryCell(const Vector3D& pos) const;

    /**
     * @brief Closest object within maxDistance of pos
     * @return The object id, or nullopt if nothing is in range. Ties go to
     *         the lower id so results are reproducible.
     */
    std::optional<ObjectID> findNearest(const Vector3D& pos, float maxDistance) const;

    bool contains(ObjectID id) const;
    std::optional<Vector3D> getPosition(ObjectID id) const;

    // Statistics
    size_t getObjectCount() const;
    size_t getCellCount() const;
    float getAverageObjectsPerCell() const;
    float getCellSize() const { return m_cellSize; }
    SpatialKey cellOf(const Vector3D& pos) const;

    // CacheHandle
    const std::string& getName() const override { return m_name; }
    void clear() override;
    bool invalidateKey(KeySpace space, SpatialKey key) override; // KeySpace::Object only
    size_t invalidateRegion(const RegionBounds& region) override;
    size_t size() const override { return getObjectCount(); }
    CacheStats getStats() const override;

private:
    using Bucket = boost::container::small_vector<ObjectID, 8>;

    struct ObjectLocation {
        SpatialKey cell;
        Vector3D position;
    };

    // Must hold the exclusive lock
    void addToCellLocked(SpatialKey cell, ObjectID id);
    void removeFromCellLocked(SpatialKey cell, ObjectID id);

    template <typename Fn>
    void forEachCandidateLocked(const Vector3D& min, const Vector3D& max, Fn&& fn) const;

    const std::string m_name;
    const float m_cellSize;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<SpatialKey, Bucket, SpatialKeyHash> m_cells;
    std::unordered_map<ObjectID, ObjectLocation> m_objects;

    mutable std::atomic<uint64_t> m_queries{0};
    std::atomic<uint64_t> m_rebuckets{0};
    std::atomic<uint64_t> m_invalidations{0};
};

} // namespace Lattice

#endif // SPATIAL_INDEX_HPP
