/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TickClock.hpp"

namespace Lattice {

Tick TickClock::advance() {
    return m_tick.fetch_add(1, std::memory_order_acq_rel) + 1;
}

Tick TickClock::advanceBy(Tick ticks) {
    return m_tick.fetch_add(ticks, std::memory_order_acq_rel) + ticks;
}

} // namespace Lattice
