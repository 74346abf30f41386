/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef STALENESS_POLICY_HPP
#define STALENESS_POLICY_HPP

#include "cache/CacheEntry.hpp"
#include "core/TickClock.hpp"
#include <atomic>
#include <cstdint>
#include <ostream>
#include <string>
#include <variant>

namespace Lattice {

enum class StalenessKind : uint8_t { NEVER = 0, TIME_TO_LIVE = 1, VERSION_GATED = 2 };

inline std::ostream& operator<<(std::ostream& os, StalenessKind kind) {
    switch (kind) {
        case StalenessKind::NEVER: return os << "NEVER";
        case StalenessKind::TIME_TO_LIVE: return os << "TIME_TO_LIVE";
        case StalenessKind::VERSION_GATED: return os << "VERSION_GATED";
        default: return os << "UNKNOWN";
    }
}

/**
 * @brief Decides whether a cached entry still reflects authoritative state
 *
 * - TimeToLive: stale once more than `ticks` ticks have passed since the
 *   entry was computed. Suits caches that tolerate a short lag (paths).
 * - VersionGated: stale as soon as the watched mutation counter moves past
 *   the version recorded in the entry. Suits values derived from world
 *   state (light, block properties).
 * - Never: only explicit invalidation removes the entry (recipe-style
 *   lookups gated by change events).
 *
 * Policies are small values; the watched counter of a VersionGated policy
 * must outlive every cache that holds the policy.
 */
class StalenessPolicy {
public:
    struct TimeToLive { uint32_t ticks{0}; };
    struct VersionGated { const std::atomic<uint64_t>* currentVersion{nullptr}; };
    struct Never {};

    StalenessPolicy() : m_variant(Never{}) {}

    static StalenessPolicy timeToLive(uint32_t ticks) {
        return StalenessPolicy(TimeToLive{ticks});
    }
    static StalenessPolicy versionGated(const std::atomic<uint64_t>& counter) {
        return StalenessPolicy(VersionGated{&counter});
    }
    static StalenessPolicy never() { return StalenessPolicy(Never{}); }

    StalenessKind getKind() const;

    /**
     * @brief Version a fresh entry should record
     * @return Watched counter value for VersionGated, 0 otherwise
     */
    uint64_t currentVersion() const;

    bool isStale(Tick createdAt, uint64_t version, Tick now) const;

    template <typename V> bool isStale(const CacheEntry<V>& entry, Tick now) const {
        return isStale(entry.createdAt, entry.version, now);
    }

    // Whether isStale() reads the tick clock at all
    bool needsClock() const { return getKind() == StalenessKind::TIME_TO_LIVE; }

    std::string describe() const;

private:
    using Variant = std::variant<Never, TimeToLive, VersionGated>;

    explicit StalenessPolicy(Variant v) : m_variant(v) {}

    Variant m_variant;
};

} // namespace Lattice

#endif // STALENESS_POLICY_HPP
