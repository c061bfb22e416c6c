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
#include <poll.h>

#include <algorithm>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"
#include "kc1fsz-tools/StdPollTimer.h"

#include "Runnable2.h"
#include "EventLoop.h"

namespace kc1fsz {
    namespace vrelay {

bool EventLoop::runTasks(Runnable2** tasks, unsigned taskCount) {
    for (unsigned pass = 0; pass < MAX_PASSES; pass++) {
        bool pending = false;
        for (unsigned i = 0; i < taskCount; i++)
            if (tasks[i]->run2())
                pending = true;
        if (!pending)
            return false;
    }
    return true;
}

void EventLoop::run(Log& log, Clock& clock,
    Runnable2** tasks, unsigned taskCount,
    std::function<bool(Log& log, Clock& clock)> cb, bool trace) {

    StdPollTimer timer20ms(clock, 20000);
    StdPollTimer timer1s(clock, 1000000);
    StdPollTimer timer10s(clock, 10000000);

    timer20ms.reset();
    timer1s.reset();
    timer10s.reset();

    unsigned long slowestLoopUs = 0;
    unsigned long totalPollUs = 0;
    unsigned long totalWorkUs = 0;
    unsigned long loopCount = 0;
    unsigned long maxLateUs = 0;
    bool pending = false;

    while (true) {

        uint64_t pollStartUs = clock.timeUs();

        // Gather the FDs that we care about
        unsigned fdsSize = 0;
        pollfd fds[MAX_FDS];

        for (unsigned i = 0; i < taskCount; i++) {
            int used = tasks[i]->getPolls(fds + fdsSize, MAX_FDS - fdsSize);
            if (used < 0) {
                log.error("Not enough poll fds");
                break;
            }
            fdsSize += used;
        }

        // Sleep no further than the end of the current 20ms interval
        // so that the audio tick is serviced promptly. Don't sleep at
        // all if a task still has work from the last cycle.
        uint32_t sleepMs = timer20ms.usLeftInInterval() / 1000;
        sleepMs = std::max(sleepMs, (uint32_t)2);
        if (pending)
            sleepMs = 0;

        int rc = poll(fds, fdsSize, sleepMs);
        if (rc < 0) {
            log.error("Poll error");
        }

        uint64_t pollEndUs = clock.timeUs();
        totalPollUs += (unsigned long)(pollEndUs - pollStartUs);

        unsigned long workStartUs = clock.timeUs();

        // This timer has highest priority since the audio tick
        // rate is time-critical
        if (timer20ms.poll()) {
            if (timer20ms.getLateUs() > maxLateUs)
                maxLateUs = timer20ms.getLateUs();
            uint32_t tickMs = clock.time();
            for (unsigned i = 0; i < taskCount; i++)
                tasks[i]->audioRateTick(tickMs);
        }

        pending = runTasks(tasks, taskCount);

        if (timer1s.poll()) {
            for (unsigned i = 0; i < taskCount; i++)
                tasks[i]->oneSecTick();
        }

        bool showStats = false;

        if (timer10s.poll()) {
            for (unsigned i = 0; i < taskCount; i++)
                tasks[i]->tenSecTick();
            showStats = true;
        }

        if (cb) {
            if (cb(log, clock) == false)
                break;
        }

        unsigned long workTimeUs = clock.timeUs() - workStartUs;
        totalWorkUs += workTimeUs;
        if (workTimeUs > slowestLoopUs)
            slowestLoopUs = workTimeUs;

        loopCount++;

        if (trace && showStats) {
            log.info("AvgPoll: %6lu, AvgWork: %6lu, MaxWork: %6lu, MaxLate: %6lu",
                totalPollUs / loopCount,
                totalWorkUs / loopCount,
                slowestLoopUs,
                maxLateUs);
            totalPollUs = 0;
            totalWorkUs = 0;
            maxLateUs = 0;
            slowestLoopUs = 0;
            loopCount = 0;
        }
    }
}

    }
}
