/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/InvalidationBus.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <exception>
#include <sstream>
#include <string>

namespace Lattice {

namespace {

struct PublishFrame {
    const InvalidationBus* bus;
    InvalidationEventKind kind;
    bool recursionRejected;
};

// Publishes in flight on this thread, outermost first
thread_local std::vector<PublishFrame> t_publishStack;

// Pops the frame pushed by publish() even if a handler throws a
// non-std exception through it
class FrameGuard {
public:
    FrameGuard(const InvalidationBus* bus, InvalidationEventKind kind) {
        t_publishStack.push_back(PublishFrame{bus, kind, false});
        m_index = t_publishStack.size() - 1;
    }
    ~FrameGuard() { t_publishStack.pop_back(); }

    FrameGuard(const FrameGuard&) = delete;
    FrameGuard& operator=(const FrameGuard&) = delete;

    bool rejected() const { return t_publishStack[m_index].recursionRejected; }

private:
    size_t m_index{0};
};

std::string describe(const InvalidationEvent& event) {
    std::ostringstream oss;
    oss << event;
    return oss.str();
}

} // namespace

InvalidationBus::InvalidationBus(uint32_t maxRecursionDepth)
    : m_maxRecursionDepth(maxRecursionDepth) {
    for (auto& list : m_handlers) {
        list = std::make_shared<const HandlerList>();
    }
}

InvalidationBus::HandlerToken InvalidationBus::subscribe(InvalidationEventKind kind,
                                                         InvalidationHandler handler) {
    const size_t idx = static_cast<size_t>(kind);
    if (idx >= INVALIDATION_EVENT_KIND_COUNT || !handler) {
        INVALIDATION_WARN("Ignoring subscription with an invalid kind or empty handler");
        return HandlerToken{};
    }

    std::lock_guard<std::mutex> lock(m_handlersMutex);
    auto updated = std::make_shared<HandlerList>(*m_handlers[idx]);
    const uint64_t id = m_nextHandlerId++;
    updated->push_back(HandlerEntry{id, std::move(handler)});
    m_handlers[idx] = std::move(updated);

    INVALIDATION_DEBUG(std::string("Subscribed handler ") + std::to_string(id) + " to " + toString(kind));
    return HandlerToken{kind, id};
}

bool InvalidationBus::unsubscribe(const HandlerToken& token) {
    const size_t idx = static_cast<size_t>(token.kind);
    if (!token.isValid() || idx >= INVALIDATION_EVENT_KIND_COUNT) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_handlersMutex);
    const HandlerList& current = *m_handlers[idx];
    auto it = std::find_if(current.begin(), current.end(),
                           [&token](const HandlerEntry& entry) { return entry.id == token.id; });
    if (it == current.end()) {
        return false;
    }

    auto updated = std::make_shared<HandlerList>();
    updated->reserve(current.size() - 1);
    for (const auto& entry : current) {
        if (entry.id != token.id) {
            updated->push_back(entry);
        }
    }
    m_handlers[idx] = std::move(updated);
    return true;
}

size_t InvalidationBus::getHandlerCount(InvalidationEventKind kind) const {
    const size_t idx = static_cast<size_t>(kind);
    if (idx >= INVALIDATION_EVENT_KIND_COUNT) {
        return 0;
    }
    return snapshot(kind)->size();
}

void InvalidationBus::clearAllHandlers() {
    std::lock_guard<std::mutex> lock(m_handlersMutex);
    for (auto& list : m_handlers) {
        list = std::make_shared<const HandlerList>();
    }
}

std::shared_ptr<const InvalidationBus::HandlerList>
InvalidationBus::snapshot(InvalidationEventKind kind) const {
    std::lock_guard<std::mutex> lock(m_handlersMutex);
    return m_handlers[static_cast<size_t>(kind)];
}

InvalidationResult InvalidationBus::publish(const InvalidationEvent& event) {
    const InvalidationEventKind kind = event.getKind();

    // Same-kind publishes already in flight on this thread
    uint32_t depth = 0;
    for (const auto& frame : t_publishStack) {
        if (frame.bus == this && frame.kind == kind) {
            ++depth;
        }
    }

    if (depth > 0 && depth >= getMaxRecursionDepth()) {
        for (auto& frame : t_publishStack) {
            if (frame.bus == this) {
                frame.recursionRejected = true;
            }
        }
        m_rejectedRecursive.fetch_add(1, std::memory_order_relaxed);
        INVALIDATION_ERROR("Recursive invalidation rejected: " + describe(event) +
                           " published from inside its own handler (depth " +
                           std::to_string(depth) + ")");
        return InvalidationResult::RECURSIVE_INVALIDATION;
    }

    FrameGuard frame(this, kind);
    m_epoch.fetch_add(1, std::memory_order_acq_rel);
    m_published[static_cast<size_t>(kind)].fetch_add(1, std::memory_order_relaxed);

    const auto handlers = snapshot(kind);
    for (const auto& entry : *handlers) {
        try {
            entry.handler(event);
        } catch (const std::exception& e) {
            m_handlerFailures.fetch_add(1, std::memory_order_relaxed);
            INVALIDATION_ERROR("Handler " + std::to_string(entry.id) + " threw while handling " +
                               describe(event) + ": " + e.what());
        }
    }

    return frame.rejected() ? InvalidationResult::RECURSIVE_INVALIDATION
                            : InvalidationResult::SUCCESS;
}

InvalidationBus::Stats InvalidationBus::getStats() const {
    Stats stats;
    for (size_t i = 0; i < INVALIDATION_EVENT_KIND_COUNT; ++i) {
        stats.published[i] = m_published[i].load(std::memory_order_relaxed);
    }
    stats.rejectedRecursive = m_rejectedRecursive.load(std::memory_order_relaxed);
    stats.handlerFailures = m_handlerFailures.load(std::memory_order_relaxed);
    return stats;
}

void InvalidationBus::resetStats() {
    for (auto& counter : m_published) {
        counter.store(0, std::memory_order_relaxed);
    }
    m_rejectedRecursive.store(0, std::memory_order_relaxed);
    m_handlerFailures.store(0, std::memory_order_relaxed);
}

} // namespace Lattice
