/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CACHE_CONFIG_HPP
#define CACHE_CONFIG_HPP

#include "cache/StalenessPolicy.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace Lattice {

class SettingsManager;

/**
 * @brief What a cache does when an insert would exceed its capacity
 *
 * CLEAR_ALL drops everything in O(1) and accepts a short cold period.
 * LRU drops only the least recently used entry, for caches whose compute
 * step is expensive. NONE never evicts (capacity is ignored).
 */
enum class EvictionStrategy : uint8_t { CLEAR_ALL = 0, LRU = 1, NONE = 2 };

inline std::ostream& operator<<(std::ostream& os, EvictionStrategy strategy) {
    switch (strategy) {
        case EvictionStrategy::CLEAR_ALL: return os << "CLEAR_ALL";
        case EvictionStrategy::LRU: return os << "LRU";
        case EvictionStrategy::NONE: return os << "NONE";
        default: return os << "UNKNOWN";
    }
}

std::optional<EvictionStrategy> parseEvictionStrategy(std::string_view text);
std::optional<StalenessKind> parseStalenessKind(std::string_view text);

/**
 * @brief Tunables for one cache, usually read from the settings file
 *
 * Settings layout (category = cache name):
 *   "block_properties": {
 *     "capacity": 65536,
 *     "eviction": "clear_all",   // clear_all | lru | none
 *     "staleness": "version",    // never | ttl | version
 *     "ttl_ticks": 20
 *   }
 */
struct CacheConfig {
    size_t capacity{4096};
    EvictionStrategy eviction{EvictionStrategy::CLEAR_ALL};
    StalenessKind staleness{StalenessKind::NEVER};
    uint32_t ttlTicks{20};

    /**
     * @brief Builds the staleness policy this config describes
     * @param versionSource Counter watched by VERSION_GATED policies
     *        (normally the invalidation bus epoch). Ignored otherwise.
     */
    StalenessPolicy makePolicy(const std::atomic<uint64_t>* versionSource) const;

    /**
     * @brief Reads the config for `cacheName`, keeping `defaults` for
     *        anything missing or malformed
     */
    static CacheConfig fromSettings(const SettingsManager& settings,
                                    const std::string& cacheName,
                                    const CacheConfig& defaults);
};

} // namespace Lattice

#endif // CACHE_CONFIG_HPP
