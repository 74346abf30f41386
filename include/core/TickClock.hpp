/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TICK_CLOCK_HPP
#define TICK_CLOCK_HPP

#include <atomic>
#include <cstdint>

namespace Lattice {

using Tick = uint64_t;

/**
 * TickClock is the monotonically increasing simulation tick counter that
 * time-to-live staleness is measured against.
 *
 * The authoritative loop advances it once per tick. Worker threads only read
 * it, so the counter is atomic and never goes backwards.
 */
class TickClock {
public:
    explicit TickClock(Tick start = 0) : m_tick(start) {}

    TickClock(const TickClock&) = delete;
    TickClock& operator=(const TickClock&) = delete;

    /**
     * Advances the clock by one tick.
     * @return the new tick value
     */
    Tick advance();

    /**
     * Advances the clock by several ticks at once (catch-up after a stall).
     * @param ticks number of ticks to add
     * @return the new tick value
     */
    Tick advanceBy(Tick ticks);

    Tick now() const { return m_tick.load(std::memory_order_acquire); }

private:
    std::atomic<Tick> m_tick;
};

} // namespace Lattice

#endif // TICK_CLOCK_HPP
