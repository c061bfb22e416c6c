/**
 * Copyright (C) 2025, Bruce MacKinnon KC1FSZ
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

#include <cstdint>

#include "kc1fsz-tools/Runnable.h"

struct pollfd;

namespace kc1fsz {
    namespace vrelay {

/**
 * A task that lives on an EventLoop. Everything is called from the loop's
 * thread.
 */
class Runnable2 : public Runnable {
public:

    virtual ~Runnable2() { }

    /**
     * Fills up the poll list with any file descriptors that need to be
     * monitored for asynchronous activity.
     *
     * @returns The number of pollfds consumed, or -1 if there is not
     * enough capacity.
     */
    virtual int getPolls(pollfd* fds, unsigned fdsCapacity) { return 0; }

    virtual void run() { run2(); }

    /**
     * Called after every poll. The loop calls it again (a bounded
     * number of times) while any task reports pending work, since one
     * task's output is often another task's input.
     *
     * @returns true if work might still be pending
     */
    virtual bool run2() { return false; }

    /**
     * Called for every 20ms tick of the clock. None are skipped, though a
     * tick may come slightly late.
     *
     * @param tickTimeMs The official start of the tick.
     */
    virtual void audioRateTick(uint32_t tickTimeMs) { }

    virtual void oneSecTick() { }

    virtual void tenSecTick() { }
};

    }
}
