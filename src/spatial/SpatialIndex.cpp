/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "spatial/SpatialIndex.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm> // std::find, std::min, std::max
#include <cmath>     // std::floor
#include <limits>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace Lattice {

SpatialIndex::SpatialIndex(std::string name, float cellSize)
    : m_name(std::move(name)), m_cellSize(cellSize) {
    if (!(cellSize > 0.0f)) {
        throw std::invalid_argument("SpatialIndex '" + m_name + "': cell size must be positive");
    }
}

float SpatialIndex::cellSizeFromSettings(const SettingsManager& settings, float fallback) {
    const float configured = settings.get<float>("spatial_index", "cell_size", fallback);
    if (!(configured > 0.0f)) {
        SETTINGS_WARNING("spatial_index.cell_size must be positive, using " + std::to_string(fallback));
        return fallback;
    }
    return configured;
}

SpatialKey SpatialIndex::cellOf(const Vector3D& pos) const {
    return SpatialKeys::cellOf(pos, m_cellSize);
}

void SpatialIndex::insert(ObjectID id, const Vector3D& pos) {
    const SpatialKey cell = cellOf(pos);
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    auto it = m_objects.find(id);
    if (it != m_objects.end()) {
        if (it->second.cell != cell) {
            // Re-inserting somewhere else would leave a second bucket entry
            SPATIAL_INDEX_WARN("Object " + std::to_string(id) + " inserted twice into '" +
                               m_name + "' at different cells; moving it instead");
            removeFromCellLocked(it->second.cell, id);
            addToCellLocked(cell, id);
            it->second.cell = cell;
        }
        it->second.position = pos;
        return;
    }

    addToCellLocked(cell, id);
    m_objects.emplace(id, ObjectLocation{cell, pos});
}

void SpatialIndex::remove(ObjectID id, const Vector3D& pos) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_objects.find(id);
    if (it == m_objects.end()) {
        return; // Already gone
    }
    if (it->second.cell != cellOf(pos)) {
        SPATIAL_INDEX_DEBUG("Object " + std::to_string(id) + " removed from '" + m_name +
                            "' with a position outside its tracked cell");
    }
    removeFromCellLocked(it->second.cell, id);
    m_objects.erase(it);
}

bool SpatialIndex::removeById(ObjectID id) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_objects.find(id);
    if (it == m_objects.end()) {
        return false;
    }
    removeFromCellLocked(it->second.cell, id);
    m_objects.erase(it);
    return true;
}

void SpatialIndex::move(ObjectID id, const Vector3D& oldPos, const Vector3D& newPos) {
    const SpatialKey newCell = cellOf(newPos);
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    auto it = m_objects.find(id);
    if (it == m_objects.end()) {
        addToCellLocked(newCell, id);
        m_objects.emplace(id, ObjectLocation{newCell, newPos});
        return;
    }

    // The tracked cell is authoritative; oldPos only matters to callers
    // that never inserted the object
    (void)oldPos;
    if (it->second.cell != newCell) {
        removeFromCellLocked(it->second.cell, id);
        addToCellLocked(newCell, id);
        it->second.cell = newCell;
        m_rebuckets.fetch_add(1, std::memory_order_relaxed);
    }
    it->second.position = newPos;
}

std::vector<ObjectID> SpatialIndex::queryRadius(const Vector3D& center, float radius) const {
    std::vector<ObjectID> out;
    queryRadius(center, radius, out);
    return out;
}

void SpatialIndex::queryRadius(const Vector3D& center, float radius,
                               std::vector<ObjectID>& out) const {
    out.clear();
    m_queries.fetch_add(1, std::memory_order_relaxed);
    if (!(radius >= 0.0f)) {
        return;
    }

    const float radiusSq = radius * radius;
    const Vector3D extent(radius, radius, radius);

    std::shared_lock<std::shared_mutex> lock(m_mutex);
    forEachCandidateLocked(center - extent, center + extent,
        [&](ObjectID id, const Vector3D& pos) {
            if (Vector3D::distanceSquared(pos, center) <= radiusSq) {
                out.push_back(id);
            }
        });
}

std::vector<ObjectID> SpatialIndex::queryBox(const Vector3D& min, const Vector3D& max) const {
    const Vector3D lo(std::min(min.getX(), max.getX()), std::min(min.getY(), max.getY()),
                      std::min(min.getZ(), max.getZ()));
    const Vector3D hi(std::max(min.getX(), max.getX()), std::max(min.getY(), max.getY()),
                      std::max(min.getZ(), max.getZ()));

    std::vector<ObjectID> out;
    m_queries.fetch_add(1, std::memory_order_relaxed);

    std::shared_lock<std::shared_mutex> lock(m_mutex);
    forEachCandidateLocked(lo, hi, [&](ObjectID id, const Vector3D& pos) {
        if (pos.getX() >= lo.getX() && pos.getX() <= hi.getX() &&
            pos.getY() >= lo.getY() && pos.getY() <= hi.getY() &&
            pos.getZ() >= lo.getZ() && pos.getZ() <= hi.getZ()) {
            out.push_back(id);
        }
    });
    return out;
}

std::vector<ObjectID> SpatialIndex::queryCell(const Vector3D& pos) const {
    m_queries.fetch_add(1, std::memory_order_relaxed);
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_cells.find(cellOf(pos));
    if (it == m_cells.end()) {
        return {};
    }
    return std::vector<ObjectID>(it->second.begin(), it->second.end());
}

std::optional<ObjectID> SpatialIndex::findNearest(const Vector3D& pos, float maxDistance) const {
    if (!(maxDistance >= 0.0f)) {
        return std::nullopt;
    }
    m_queries.fetch_add(1, std::memory_order_relaxed);

    const float maxSq = maxDistance * maxDistance;
    const Vector3D extent(maxDistance, maxDistance, maxDistance);

    std::optional<ObjectID> nearest;
    float nearestSq = std::numeric_limits<float>::max();

    std::shared_lock<std::shared_mutex> lock(m_mutex);
    forEachCandidateLocked(pos - extent, pos + extent,
        [&](ObjectID id, const Vector3D& objectPos) {
            const float distSq = Vector3D::distanceSquared(objectPos, pos);
            if (distSq > maxSq) {
                return;
            }
            if (!nearest || distSq < nearestSq || (distSq == nearestSq && id < *nearest)) {
                nearest = id;
                nearestSq = distSq;
            }
        });
    return nearest;
}

bool SpatialIndex::contains(ObjectID id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_objects.find(id) != m_objects.end();
}

std::optional<Vector3D> SpatialIndex::getPosition(ObjectID id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_objects.find(id);
    if (it == m_objects.end()) {
        return std::nullopt;
    }
    return it->second.position;
}

size_t SpatialIndex::getObjectCount() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_objects.size();
}

size_t SpatialIndex::getCellCount() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_cells.size();
}

float SpatialIndex::getAverageObjectsPerCell() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (m_cells.empty()) {
        return 0.0f;
    }
    return static_cast<float>(m_objects.size()) / static_cast<float>(m_cells.size());
}

void SpatialIndex::clear() {
    std::unordered_map<SpatialKey, Bucket, SpatialKeyHash> droppedCells;
    std::unordered_map<ObjectID, ObjectLocation> droppedObjects;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        droppedCells.swap(m_cells);
        droppedObjects.swap(m_objects);
    }
    SPATIAL_INDEX_DEBUG("Cleared '" + m_name + "' (" + std::to_string(droppedObjects.size()) +
                        " objects)");
}

bool SpatialIndex::invalidateKey(KeySpace space, SpatialKey key) {
    if (space != KeySpace::Object) {
        return false;
    }
    const bool removed = removeById(static_cast<ObjectID>(key));
    if (removed) {
        m_invalidations.fetch_add(1, std::memory_order_relaxed);
    }
    return removed;
}

size_t SpatialIndex::invalidateRegion(const RegionBounds& region) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    size_t removed = 0;
    for (auto it = m_objects.begin(); it != m_objects.end();) {
        const Vector3D& p = it->second.position;
        const BlockPos block{static_cast<int32_t>(std::floor(p.getX())),
                             static_cast<int32_t>(std::floor(p.getY())),
                             static_cast<int32_t>(std::floor(p.getZ()))};
        if (region.contains(block)) {
            removeFromCellLocked(it->second.cell, it->first);
            it = m_objects.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        m_invalidations.fetch_add(removed, std::memory_order_relaxed);
    }
    return removed;
}

CacheStats SpatialIndex::getStats() const {
    CacheStats stats;
    stats.name = m_name;
    stats.size = getObjectCount();
    stats.capacity = 0;
    stats.queries = m_queries.load(std::memory_order_relaxed);
    stats.rebuckets = m_rebuckets.load(std::memory_order_relaxed);
    stats.invalidations = m_invalidations.load(std::memory_order_relaxed);
    return stats;
}

void SpatialIndex::addToCellLocked(SpatialKey cell, ObjectID id) {
    auto& bucket = m_cells[cell];
    if (std::find(bucket.begin(), bucket.end(), id) == bucket.end()) {
        bucket.push_back(id);
    }
}

void SpatialIndex::removeFromCellLocked(SpatialKey cell, ObjectID id) {
    auto cit = m_cells.find(cell);
    if (cit == m_cells.end()) {
        return;
    }
    auto& bucket = cit->second;
    auto pos = std::find(bucket.begin(), bucket.end(), id);
    if (pos != bucket.end()) {
        // Order inside a bucket carries no meaning, so swap-and-pop
        *pos = bucket.back();
        bucket.pop_back();
    }
    if (bucket.empty()) {
        m_cells.erase(cit);
    }
}

template <typename Fn>
void SpatialIndex::forEachCandidateLocked(const Vector3D& min, const Vector3D& max, Fn&& fn) const {
    const SectionPos lo = SpatialKeys::cellCoordOf(min, m_cellSize);
    const SectionPos hi = SpatialKeys::cellCoordOf(max, m_cellSize);

    const int64_t spanX = static_cast<int64_t>(hi.x) - lo.x + 1;
    const int64_t spanY = static_cast<int64_t>(hi.y) - lo.y + 1;
    const int64_t spanZ = static_cast<int64_t>(hi.z) - lo.z + 1;
    const double candidateCells = static_cast<double>(spanX) * spanY * spanZ;

    // Query volume larger than the population: walking objects is cheaper
    if (candidateCells > static_cast<double>(m_objects.size())) {
        for (const auto& [id, location] : m_objects) {
            fn(id, location.position);
        }
        return;
    }

    for (int32_t y = lo.y; y <= hi.y; ++y) {
        for (int32_t z = lo.z; z <= hi.z; ++z) {
            for (int32_t x = lo.x; x <= hi.x; ++x) {
                auto it = m_cells.find(SpatialKeys::packSection(x, y, z));
                if (it == m_cells.end()) {
                    continue;
                }
                for (ObjectID id : it->second) {
                    fn(id, m_objects.at(id).position);
                }
            }
        }
    }
}

} // namespace Lattice
