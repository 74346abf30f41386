/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef INVALIDATION_BUS_HPP
#define INVALIDATION_BUS_HPP

#include "events/InvalidationEvent.hpp"
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <vector>

namespace Lattice {

enum class InvalidationResult : uint8_t { SUCCESS, RECURSIVE_INVALIDATION };

// Stream operator for InvalidationResult to support test output
inline std::ostream& operator<<(std::ostream& os, const InvalidationResult& result) {
    switch (result) {
        case InvalidationResult::SUCCESS: return os << "SUCCESS";
        case InvalidationResult::RECURSIVE_INVALIDATION: return os << "RECURSIVE_INVALIDATION";
        default: return os << "UNKNOWN";
    }
}

using InvalidationHandler = std::function<void(const InvalidationEvent&)>;

/**
 * @brief Synchronous fan-out of world mutations to cache invalidators
 *
 * publish() runs every handler registered for the event's kind, in
 * registration order, on the calling thread, before it returns. There is no
 * queue: once publish() returns, every subscribed cache has dropped what the
 * mutation made stale.
 *
 * Recursion guard:
 * A handler may publish other kinds (a chunk unload publishing entity
 * removals, for instance). Re-publishing a kind that is already being
 * dispatched on the same thread more than getMaxRecursionDepth() levels deep
 * is a wiring bug: the nested publish is rejected and returns
 * RECURSIVE_INVALIDATION, and so does every enclosing publish on that bus.
 *
 * The epoch counter moves once per dispatched publish, before handlers run.
 * VersionGated caches watch it through epochCounter().
 *
 * Handlers may subscribe or unsubscribe from inside a dispatch; the change
 * applies to the next publish.
 */
class InvalidationBus {
public:
    struct HandlerToken {
        InvalidationEventKind kind{InvalidationEventKind::COUNT};
        uint64_t id{0};

        bool isValid() const { return id != 0; }
    };

    struct Stats {
        std::array<uint64_t, INVALIDATION_EVENT_KIND_COUNT> published{};
        uint64_t rejectedRecursive{0};
        uint64_t handlerFailures{0};

        uint64_t totalPublished() const {
            uint64_t total = 0;
            for (uint64_t count : published) {
                total += count;
            }
            return total;
        }
    };

    explicit InvalidationBus(uint32_t maxRecursionDepth = 1);

    InvalidationBus(const InvalidationBus&) = delete;
    InvalidationBus& operator=(const InvalidationBus&) = delete;

    /**
     * @brief Registers a handler for one event kind
     * @return Token for unsubscribe(); invalid if kind is COUNT or the handler is empty
     */
    HandlerToken subscribe(InvalidationEventKind kind, InvalidationHandler handler);

    // @return true if the token named a live handler
    bool unsubscribe(const HandlerToken& token);

    size_t getHandlerCount(InvalidationEventKind kind) const;
    void clearAllHandlers();

    /**
     * @brief Dispatches the event to every handler of its kind
     * @return SUCCESS, or RECURSIVE_INVALIDATION if this publish (or one
     *         nested inside it) broke the recursion limit
     */
    [[nodiscard]] InvalidationResult publish(const InvalidationEvent& event);

    uint64_t getEpoch() const { return m_epoch.load(std::memory_order_acquire); }
    const std::atomic<uint64_t>& epochCounter() const { return m_epoch; }

    uint32_t getMaxRecursionDepth() const { return m_maxRecursionDepth.load(std::memory_order_relaxed); }
    void setMaxRecursionDepth(uint32_t depth) { m_maxRecursionDepth.store(depth, std::memory_order_relaxed); }

    Stats getStats() const;
    void resetStats();

private:
    struct HandlerEntry {
        uint64_t id;
        InvalidationHandler handler;
    };
    using HandlerList = std::vector<HandlerEntry>;

    // Copy-on-write: publish() dispatches from a snapshot taken under the
    // mutex, so handlers can (un)subscribe without deadlocking
    std::shared_ptr<const HandlerList> snapshot(InvalidationEventKind kind) const;

    mutable std::mutex m_handlersMutex;
    std::array<std::shared_ptr<const HandlerList>, INVALIDATION_EVENT_KIND_COUNT> m_handlers;
    uint64_t m_nextHandlerId{1};

    std::atomic<uint64_t> m_epoch{0};
    std::atomic<uint32_t> m_maxRecursionDepth;

    std::array<std::atomic<uint64_t>, INVALIDATION_EVENT_KIND_COUNT> m_published{};
    std::atomic<uint64_t> m_rejectedRecursive{0};
    std::atomic<uint64_t> m_handlerFailures{0};
};

} // namespace Lattice

#endif // INVALIDATION_BUS_HPP
