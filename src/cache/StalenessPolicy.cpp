/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "cache/StalenessPolicy.hpp"
#include <type_traits>

namespace Lattice {

StalenessKind StalenessPolicy::getKind() const {
    return std::visit([](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, TimeToLive>) {
            return StalenessKind::TIME_TO_LIVE;
        } else if constexpr (std::is_same_v<T, VersionGated>) {
            return StalenessKind::VERSION_GATED;
        } else {
            return StalenessKind::NEVER;
        }
    }, m_variant);
}

uint64_t StalenessPolicy::currentVersion() const {
    if (const auto* gate = std::get_if<VersionGated>(&m_variant)) {
        if (gate->currentVersion) {
            return gate->currentVersion->load(std::memory_order_acquire);
        }
    }
    return 0;
}

bool StalenessPolicy::isStale(Tick createdAt, uint64_t version, Tick now) const {
    return std::visit([&](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, TimeToLive>) {
            // A clock that reads earlier than the entry (reset world) counts as fresh
            return now > createdAt && (now - createdAt) > p.ticks;
        } else if constexpr (std::is_same_v<T, VersionGated>) {
            if (!p.currentVersion) {
                return false;
            }
            return version != p.currentVersion->load(std::memory_order_acquire);
        } else {
            return false;
        }
    }, m_variant);
}

std::string StalenessPolicy::describe() const {
    return std::visit([](const auto& p) -> std::string {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, TimeToLive>) {
            return "ttl(" + std::to_string(p.ticks) + " ticks)";
        } else if constexpr (std::is_same_v<T, VersionGated>) {
            return "version-gated";
        } else {
            return "never";
        }
    }, m_variant);
}

} // namespace Lattice
