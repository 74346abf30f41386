/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_CACHE_HPP
#define SPATIAL_CACHE_HPP

/**
 * @file SpatialCache.hpp
 * @brief Bounded, staleness-aware cache keyed by packed spatial keys
 *
 * One instance per subsystem (block properties, biome lookups, light,
 * structure bounds, ...). Reads vastly outnumber writes:
 * - Hits run under a shared lock (LRU caches take the exclusive lock to
 *   reorder their recency list)
 * - compute() always runs outside any lock; two threads missing on the
 *   same key may both compute, and the last store wins
 * - Capacity overflow clears the whole map by swapping it out, and the old
 *   entries are destroyed after the lock is released
 * - A value computed while its own key (or the whole cache) was
 *   invalidated is returned to its caller but not stored, so an
 *   invalidation is never undone by a racing miss. Invalidating other keys
 *   does not discard it.
 */

#include "cache/CacheConfig.hpp"
#include "cache/CacheEntry.hpp"
#include "cache/CacheHandle.hpp"
#include "cache/KeyTraits.hpp"
#include "cache/StalenessPolicy.hpp"
#include "core/Logger.hpp"
#include "core/TickClock.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <list>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace Lattice {

template <typename K, typename V, typename Traits = KeyTraits<K>>
class SpatialCache : public CacheHandle {
public:
    using KeyType = K;
    using ValueType = V;

    /**
     * @param name Diagnostic name, also the registry key
     * @param capacity Soft bound on entries (ignored by EvictionStrategy::NONE)
     * @param policy Staleness rule applied on every read
     * @param eviction Overflow behaviour
     * @param clock Tick source for TTL policies; may be null for other policies
     */
    SpatialCache(std::string name, size_t capacity,
                 StalenessPolicy policy = StalenessPolicy::never(),
                 EvictionStrategy eviction = EvictionStrategy::CLEAR_ALL,
                 const TickClock* clock = nullptr)
        : m_name(std::move(name)),
          m_capacity(capacity),
          m_policy(policy),
          m_eviction(eviction),
          m_clock(clock) {
        if (m_policy.needsClock() && m_clock == nullptr) {
            CACHE_WARN("Cache '" + m_name + "' uses a TTL policy without a tick clock; entries will never expire");
        }
        if (m_capacity == 0 && m_eviction != EvictionStrategy::NONE) {
            CACHE_WARN("Cache '" + m_name + "' has zero capacity; nothing will be retained");
        }
    }

    /**
     * @brief Builds a cache from its settings-file configuration
     * @param versionSource Counter for VERSION_GATED configs (bus epoch)
     */
    SpatialCache(std::string name, const CacheConfig& config,
                 const TickClock* clock,
                 const std::atomic<uint64_t>* versionSource)
        : SpatialCache(std::move(name), config.capacity,
                       config.makePolicy(versionSource), config.eviction,
                       clock) {}

    SpatialCache(const SpatialCache&) = delete;
    SpatialCache& operator=(const SpatialCache&) = delete;

    /**
     * @brief Returns the cached value for `key`, computing and storing it on
     *        a miss or when the entry is stale
     * @param compute Cheap, non-blocking producer of the authoritative value
     */
    template <typename Fn> V getOrCompute(const K& key, Fn&& compute) {
        const SpatialKey packed = Traits::toKey(key);
        const Tick now = currentTick();

        if (std::optional<V> hit = lookup(packed, now)) {
            return std::move(*hit);
        }

        // Capture version and invalidation counters before computing so
        // that a mutation racing with compute() leaves the result stale
        const uint64_t version = m_policy.currentVersion();
        PendingCompute pending(*this);

        V value = std::forward<Fn>(compute)();
        pending.store(packed, value, now, version);
        return value;
    }

    /**
     * @brief Reads without computing
     * @return The fresh cached value, or nullopt on a miss or stale entry
     */
    std::optional<V> get(const K& key) {
        return lookup(Traits::toKey(key), currentTick());
    }

    // Inserts or replaces the value for `key`
    void put(const K& key, V value) {
        const SpatialKey packed = Traits::toKey(key);
        const Tick now = currentTick();
        const uint64_t version = m_policy.currentVersion();

        Map dropped;
        std::list<SpatialKey> droppedOrder;
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        insertLocked(packed, std::move(value), now, version, dropped, droppedOrder);
        lock.unlock();
    }

    // True if a fresh entry exists; does not count as a hit or miss
    bool contains(const K& key) const {
        const Tick now = currentTick();
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(Traits::toKey(key));
        return it != m_entries.end() && !m_policy.isStale(it->second.entry, now);
    }

    /**
     * @brief Removes the entry for `key`; no-op if absent
     * @return true if an entry was removed
     */
    bool invalidate(const K& key) { return invalidateKey(Traits::SPACE, Traits::toKey(key)); }

    bool invalidateKey(KeySpace space, SpatialKey key) override {
        if (space != Traits::SPACE) {
            return false;
        }

        std::unique_lock<std::shared_mutex> lock(m_mutex);
        recordKeyInvalidationLocked(key);
        auto it = m_entries.find(key);
        if (it == m_entries.end()) {
            return false;
        }
        eraseLocked(it);
        m_invalidations.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    size_t invalidateRegion(const RegionBounds& region) override {
        return invalidateMatching([&region](SpatialKey key, const V&) {
            return Traits::inRegion(key, region);
        });
    }

    /**
     * @brief Removes every entry for which pred(key, value) returns true
     * @return number of entries removed
     */
    template <typename Pred> size_t invalidateIf(Pred&& pred) {
        return invalidateMatching([&pred](SpatialKey key, const V& value) {
            return pred(Traits::fromKey(key), value);
        });
    }

    void clear() override {
        Map dropped;
        std::list<SpatialKey> droppedOrder;
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            bumpGeneration();
            dropped.swap(m_entries);
            droppedOrder.swap(m_lruOrder);
        }
        // Entries are destroyed here, outside the lock
    }

    size_t size() const override {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_entries.size();
    }

    const std::string& getName() const override { return m_name; }
    size_t getCapacity() const { return m_capacity; }
    EvictionStrategy getEvictionStrategy() const { return m_eviction; }
    const StalenessPolicy& getPolicy() const { return m_policy; }

    CacheStats getStats() const override {
        CacheStats stats;
        stats.name = m_name;
        stats.size = size();
        stats.capacity = m_eviction == EvictionStrategy::NONE ? 0 : m_capacity;
        stats.hits = m_hits.load(std::memory_order_relaxed);
        stats.misses = m_misses.load(std::memory_order_relaxed);
        stats.overflowClears = m_overflowClears.load(std::memory_order_relaxed);
        stats.evictions = m_evictions.load(std::memory_order_relaxed);
        stats.invalidations = m_invalidations.load(std::memory_order_relaxed);
        return stats;
    }

    void resetStats() {
        m_hits.store(0, std::memory_order_relaxed);
        m_misses.store(0, std::memory_order_relaxed);
        m_overflowClears.store(0, std::memory_order_relaxed);
        m_evictions.store(0, std::memory_order_relaxed);
        m_invalidations.store(0, std::memory_order_relaxed);
    }

private:
    using LruIterator = typename std::list<SpatialKey>::iterator;

    struct Slot {
        CacheEntry<V> entry;
        LruIterator lruPos; // Only meaningful for EvictionStrategy::LRU
    };

    using Map = std::unordered_map<SpatialKey, Slot, SpatialKeyHash>;

    Tick currentTick() const { return m_clock ? m_clock->now() : 0; }

    // Must hold the exclusive lock
    void bumpGeneration() { m_generation.fetch_add(1, std::memory_order_acq_rel); }

    std::optional<V> lookup(SpatialKey key, Tick now) {
        if (m_eviction == EvictionStrategy::LRU) {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            auto it = m_entries.find(key);
            if (it != m_entries.end() && !m_policy.isStale(it->second.entry, now)) {
                m_lruOrder.splice(m_lruOrder.begin(), m_lruOrder, it->second.lruPos);
                m_hits.fetch_add(1, std::memory_order_relaxed);
                return it->second.entry.value;
            }
        } else {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            auto it = m_entries.find(key);
            if (it != m_entries.end() && !m_policy.isStale(it->second.entry, now)) {
                m_hits.fetch_add(1, std::memory_order_relaxed);
                return it->second.entry.value;
            }
        }
        m_misses.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    /**
     * One miss between lookup and store. Single-key invalidations that land
     * while any compute is pending leave a tombstone (key -> key epoch);
     * the tombstones are dropped once no compute is pending.
     */
    class PendingCompute {
    public:
        explicit PendingCompute(SpatialCache& cache) : m_cache(cache) {
            m_cache.m_pendingComputes.fetch_add(1, std::memory_order_seq_cst);
            m_generation = m_cache.m_generation.load(std::memory_order_seq_cst);
            m_keyEpoch = m_cache.m_keyEpoch.load(std::memory_order_seq_cst);
        }

        // compute() threw: still release the pending slot
        ~PendingCompute() {
            if (!m_finished) {
                std::unique_lock<std::shared_mutex> lock(m_cache.m_mutex);
                m_cache.finishComputeLocked();
            }
        }

        PendingCompute(const PendingCompute&) = delete;
        PendingCompute& operator=(const PendingCompute&) = delete;

        void store(SpatialKey key, const V& value, Tick now, uint64_t version) {
            Map dropped;
            std::list<SpatialKey> droppedOrder;
            std::unique_lock<std::shared_mutex> lock(m_cache.m_mutex);
            const bool stale = m_cache.invalidatedSinceLocked(key, m_generation, m_keyEpoch);
            m_cache.finishComputeLocked();
            m_finished = true;
            if (!stale) {
                m_cache.insertLocked(key, value, now, version, dropped, droppedOrder);
            }
            lock.unlock();
            // dropped entries are destroyed here, outside the lock
        }

    private:
        SpatialCache& m_cache;
        uint64_t m_generation{0};
        uint64_t m_keyEpoch{0};
        bool m_finished{false};
    };

    // Must hold the exclusive lock
    void recordKeyInvalidationLocked(SpatialKey key) {
        if (m_pendingComputes.load(std::memory_order_seq_cst) == 0) {
            return; // No compute can have read the old state
        }
        if (m_tombstones.size() >= MAX_TOMBSTONES) {
            // Too many to track one by one: discard every pending compute
            m_tombstones.clear();
            bumpGeneration();
            return;
        }
        m_tombstones[key] = m_keyEpoch.fetch_add(1, std::memory_order_seq_cst) + 1;
    }

    // Must hold the exclusive lock
    bool invalidatedSinceLocked(SpatialKey key, uint64_t generation, uint64_t keyEpoch) const {
        if (m_generation.load(std::memory_order_acquire) != generation) {
            return true;
        }
        auto it = m_tombstones.find(key);
        return it != m_tombstones.end() && it->second > keyEpoch;
    }

    // Must hold the exclusive lock
    void finishComputeLocked() {
        if (m_pendingComputes.fetch_sub(1, std::memory_order_seq_cst) == 1) {
            m_tombstones.clear();
        }
    }

    // Must hold the exclusive lock. Overflowed entries are swapped into
    // `dropped` so the caller can destroy them after unlocking.
    void insertLocked(SpatialKey key, V value, Tick now, uint64_t version,
                      Map& dropped, std::list<SpatialKey>& droppedOrder) {
        auto it = m_entries.find(key);
        if (it != m_entries.end()) {
            it->second.entry = CacheEntry<V>(std::move(value), now, version);
            if (m_eviction == EvictionStrategy::LRU) {
                m_lruOrder.splice(m_lruOrder.begin(), m_lruOrder, it->second.lruPos);
            }
            return;
        }

        if (m_eviction != EvictionStrategy::NONE && m_entries.size() >= m_capacity) {
            if (m_eviction == EvictionStrategy::CLEAR_ALL) {
                CACHE_DEBUG("Cache '" + m_name + "' reached capacity " +
                            std::to_string(m_capacity) + ", clearing");
                dropped.swap(m_entries);
                droppedOrder.swap(m_lruOrder);
                m_overflowClears.fetch_add(1, std::memory_order_relaxed);
            } else {
                evictLeastRecentLocked();
            }
        }

        if (m_capacity == 0 && m_eviction != EvictionStrategy::NONE) {
            return;
        }

        LruIterator pos{};
        if (m_eviction == EvictionStrategy::LRU) {
            m_lruOrder.push_front(key);
            pos = m_lruOrder.begin();
        }
        m_entries.emplace(key, Slot{CacheEntry<V>(std::move(value), now, version), pos});
    }

    void evictLeastRecentLocked() {
        if (m_lruOrder.empty()) {
            return;
        }
        const SpatialKey victim = m_lruOrder.back();
        m_lruOrder.pop_back();
        m_entries.erase(victim);
        m_evictions.fetch_add(1, std::memory_order_relaxed);
    }

    void eraseLocked(typename Map::iterator it) {
        if (m_eviction == EvictionStrategy::LRU) {
            m_lruOrder.erase(it->second.lruPos);
        }
        m_entries.erase(it);
    }

    template <typename Pred> size_t invalidateMatching(Pred&& pred) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        bumpGeneration();
        size_t removed = 0;
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (pred(it->first, it->second.entry.value)) {
                auto next = std::next(it);
                eraseLocked(it);
                it = next;
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

    const std::string m_name;
    const size_t m_capacity;
    const StalenessPolicy m_policy;
    const EvictionStrategy m_eviction;
    const TickClock* m_clock;

    mutable std::shared_mutex m_mutex;
    Map m_entries;
    std::list<SpatialKey> m_lruOrder; // Front = most recently used

    // Bumped by clear() and bulk invalidation; single keys use tombstones
    static constexpr size_t MAX_TOMBSTONES = 1024;
    std::atomic<uint64_t> m_generation{0};
    std::atomic<uint64_t> m_keyEpoch{0};
    std::atomic<uint32_t> m_pendingComputes{0};
    std::unordered_map<SpatialKey, uint64_t, SpatialKeyHash> m_tombstones;

    std::atomic<uint64_t> m_hits{0};
    std::atomic<uint64_t> m_misses{0};
    std::atomic<uint64_t> m_overflowClears{0};
    std::atomic<uint64_t> m_evictions{0};
    std::atomic<uint64_t> m_invalidations{0};
};

} // namespace Lattice

#endif // SPATIAL_CACHE_HPP
