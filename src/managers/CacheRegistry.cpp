/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/CacheRegistry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <sstream>

namespace Lattice {

CacheRegistry::~CacheRegistry() {
    unbindFromBus();
}

bool CacheRegistry::registerCache(CacheHandle* cache) {
    if (cache == nullptr) {
        REGISTRY_WARN("Ignoring null cache registration");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string& name = cache->getName();
    auto it = std::find_if(m_caches.begin(), m_caches.end(),
                           [&name](const CacheHandle* c) { return c->getName() == name; });
    if (it != m_caches.end()) {
        REGISTRY_WARN("Cache '" + name + "' is already registered");
        return false;
    }

    m_caches.push_back(cache);
    REGISTRY_DEBUG("Registered cache '" + name + "'");
    return true;
}

bool CacheRegistry::unregisterCache(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_caches.begin(), m_caches.end(),
                           [&name](const CacheHandle* c) { return c->getName() == name; });
    if (it == m_caches.end()) {
        return false;
    }
    m_caches.erase(it);
    REGISTRY_DEBUG("Unregistered cache '" + name + "'");
    return true;
}

CacheHandle* CacheRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_caches.begin(), m_caches.end(),
                           [&name](const CacheHandle* c) { return c->getName() == name; });
    return it == m_caches.end() ? nullptr : *it;
}

size_t CacheRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_caches.size();
}

std::vector<CacheHandle*> CacheRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_caches;
}

void CacheRegistry::clearAll() {
    const auto caches = snapshot();
    for (CacheHandle* cache : caches) {
        cache->clear();
    }
    REGISTRY_INFO("Cleared " + std::to_string(caches.size()) + " caches");
}

size_t CacheRegistry::invalidateRegion(const RegionBounds& region) {
    size_t removed = 0;
    for (CacheHandle* cache : snapshot()) {
        removed += cache->invalidateRegion(region);
    }
    return removed;
}

size_t CacheRegistry::invalidate(KeySpace space, SpatialKey key) {
    size_t hits = 0;
    for (CacheHandle* cache : snapshot()) {
        if (cache->invalidateKey(space, key)) {
            ++hits;
        }
    }
    return hits;
}

std::vector<CacheStats> CacheRegistry::stats() const {
    const auto caches = snapshot();
    std::vector<CacheStats> result;
    result.reserve(caches.size());
    for (const CacheHandle* cache : caches) {
        result.push_back(cache->getStats());
    }
    return result;
}

void CacheRegistry::logStats() const {
    const auto all = stats();
    REGISTRY_INFO("Cache statistics (" + std::to_string(all.size()) + " caches):");
    for (const auto& s : all) {
        std::ostringstream oss;
        oss << s;
        REGISTRY_INFO("  " + oss.str());
    }
}

void CacheRegistry::bindToBus(InvalidationBus& bus) {
    unbindFromBus();

    m_bus = &bus;
    m_busTokens.push_back(bus.subscribe(InvalidationEventKind::ChunkUnloaded,
        [this](const InvalidationEvent& event) {
            if (const auto* unloaded = event.getIf<InvalidationEvent::ChunkUnloaded>()) {
                invalidateRegion(RegionBounds::forChunk(unloaded->chunk));
            }
        }));
    m_busTokens.push_back(bus.subscribe(InvalidationEventKind::WorldBorderChanged,
        [this](const InvalidationEvent&) { clearAll(); }));
}

void CacheRegistry::unbindFromBus() {
    if (m_bus == nullptr) {
        return;
    }
    for (const auto& token : m_busTokens) {
        m_bus->unsubscribe(token);
    }
    m_busTokens.clear();
    m_bus = nullptr;
}

} // namespace Lattice
