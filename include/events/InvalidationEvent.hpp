/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef INVALIDATION_EVENT_HPP
#define INVALIDATION_EVENT_HPP

#include "spatial/SpatialKey.hpp"
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <variant>

namespace Lattice {

/**
 * @brief Kinds of world mutation the invalidation bus routes
 *
 * Values index the bus handler table directly; COUNT must stay last.
 */
enum class InvalidationEventKind : uint8_t {
    BlockChanged = 0,
    ChunkUnloaded = 1,
    ChunkLoaded = 2,
    EntityRemoved = 3,
    WorldBorderChanged = 4,
    COUNT = 5
};

constexpr size_t INVALIDATION_EVENT_KIND_COUNT =
    static_cast<size_t>(InvalidationEventKind::COUNT);

inline const char* toString(InvalidationEventKind kind) {
    switch (kind) {
        case InvalidationEventKind::BlockChanged: return "BlockChanged";
        case InvalidationEventKind::ChunkUnloaded: return "ChunkUnloaded";
        case InvalidationEventKind::ChunkLoaded: return "ChunkLoaded";
        case InvalidationEventKind::EntityRemoved: return "EntityRemoved";
        case InvalidationEventKind::WorldBorderChanged: return "WorldBorderChanged";
        default: return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, InvalidationEventKind kind) {
    return os << toString(kind);
}

/**
 * @brief A single world mutation, published synchronously at the point it
 *        happens
 */
class InvalidationEvent {
public:
    struct BlockChanged { BlockPos pos; };
    struct ChunkUnloaded { ChunkPos chunk; };
    struct ChunkLoaded { ChunkPos chunk; };
    struct EntityRemoved { ObjectID id; };
    struct WorldBorderChanged {};

    // Alternative order matches InvalidationEventKind
    using Payload = std::variant<BlockChanged, ChunkUnloaded, ChunkLoaded,
                                 EntityRemoved, WorldBorderChanged>;

    static InvalidationEvent blockChanged(const BlockPos& pos) {
        return InvalidationEvent(BlockChanged{pos});
    }
    static InvalidationEvent chunkUnloaded(const ChunkPos& chunk) {
        return InvalidationEvent(ChunkUnloaded{chunk});
    }
    static InvalidationEvent chunkLoaded(const ChunkPos& chunk) {
        return InvalidationEvent(ChunkLoaded{chunk});
    }
    static InvalidationEvent entityRemoved(ObjectID id) {
        return InvalidationEvent(EntityRemoved{id});
    }
    static InvalidationEvent worldBorderChanged() {
        return InvalidationEvent(WorldBorderChanged{});
    }

    InvalidationEventKind getKind() const {
        return static_cast<InvalidationEventKind>(m_payload.index());
    }

    // Payload of the given type, or nullptr for an event of another kind
    template <typename T> const T* getIf() const { return std::get_if<T>(&m_payload); }

    const Payload& getPayload() const { return m_payload; }

private:
    explicit InvalidationEvent(Payload payload) : m_payload(payload) {}

    Payload m_payload;
};

inline std::ostream& operator<<(std::ostream& os, const InvalidationEvent& event) {
    os << event.getKind();
    if (const auto* block = event.getIf<InvalidationEvent::BlockChanged>()) {
        os << "{" << block->pos << "}";
    } else if (const auto* unloaded = event.getIf<InvalidationEvent::ChunkUnloaded>()) {
        os << "{" << unloaded->chunk << "}";
    } else if (const auto* loaded = event.getIf<InvalidationEvent::ChunkLoaded>()) {
        os << "{" << loaded->chunk << "}";
    } else if (const auto* removed = event.getIf<InvalidationEvent::EntityRemoved>()) {
        os << "{" << removed->id << "}";
    }
    return os;
}

} // namespace Lattice

#endif // INVALIDATION_EVENT_HPP
