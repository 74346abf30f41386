/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "cache/CacheConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <cctype>

namespace Lattice {

namespace {

std::string toLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

} // namespace

std::optional<EvictionStrategy> parseEvictionStrategy(std::string_view text) {
    const std::string name = toLower(text);
    if (name == "clear_all" || name == "clear") {
        return EvictionStrategy::CLEAR_ALL;
    }
    if (name == "lru") {
        return EvictionStrategy::LRU;
    }
    if (name == "none") {
        return EvictionStrategy::NONE;
    }
    return std::nullopt;
}

std::optional<StalenessKind> parseStalenessKind(std::string_view text) {
    const std::string name = toLower(text);
    if (name == "never") {
        return StalenessKind::NEVER;
    }
    if (name == "ttl" || name == "time_to_live") {
        return StalenessKind::TIME_TO_LIVE;
    }
    if (name == "version" || name == "version_gated") {
        return StalenessKind::VERSION_GATED;
    }
    return std::nullopt;
}

StalenessPolicy CacheConfig::makePolicy(const std::atomic<uint64_t>* versionSource) const {
    switch (staleness) {
        case StalenessKind::TIME_TO_LIVE:
            return StalenessPolicy::timeToLive(ttlTicks);
        case StalenessKind::VERSION_GATED:
            if (versionSource == nullptr) {
                CACHE_WARN("Version-gated cache config without a version source; falling back to NEVER");
                return StalenessPolicy::never();
            }
            return StalenessPolicy::versionGated(*versionSource);
        case StalenessKind::NEVER:
        default:
            return StalenessPolicy::never();
    }
}

CacheConfig CacheConfig::fromSettings(const SettingsManager& settings,
                                      const std::string& cacheName,
                                      const CacheConfig& defaults) {
    CacheConfig config = defaults;

    // Defaults are never narrowed to int: a size_t or uint32_t default above
    // INT_MAX would wrap
    if (settings.has(cacheName, "capacity")) {
        const int capacity = settings.get<int>(cacheName, "capacity", -1);
        if (capacity >= 0) {
            config.capacity = static_cast<size_t>(capacity);
        } else {
            SETTINGS_WARNING("Invalid or negative capacity for cache '" + cacheName + "', keeping " +
                             std::to_string(defaults.capacity));
        }
    }

    if (settings.has(cacheName, "eviction")) {
        const std::string text = settings.get<std::string>(cacheName, "eviction", "");
        if (auto strategy = parseEvictionStrategy(text)) {
            config.eviction = *strategy;
        } else {
            SETTINGS_WARNING("Unknown eviction strategy '" + text + "' for cache '" + cacheName + "'");
        }
    }

    if (settings.has(cacheName, "staleness")) {
        const std::string text = settings.get<std::string>(cacheName, "staleness", "");
        if (auto kind = parseStalenessKind(text)) {
            config.staleness = *kind;
        } else {
            SETTINGS_WARNING("Unknown staleness policy '" + text + "' for cache '" + cacheName + "'");
        }
    }

    if (settings.has(cacheName, "ttl_ticks")) {
        const int ttl = settings.get<int>(cacheName, "ttl_ticks", -1);
        if (ttl >= 0) {
            config.ttlTicks = static_cast<uint32_t>(ttl);
        } else {
            SETTINGS_WARNING("Invalid or negative ttl_ticks for cache '" + cacheName + "', keeping " +
                             std::to_string(defaults.ttlTicks));
        }
    }

    return config;
}

} // namespace Lattice
