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

#include "kc1fsz-tools/fixedsortedlist.h"

namespace kc1fsz {
    namespace vrelay {

/**
 * Adaptive playout buffer that works on opaque payload pointers.
 *
 * This follows the classic "jitterbuf" design used by IAX2 and Asterisk:
 * a history of observed delays (arrival time minus sender timestamp) is
 * kept and the playout delay target is computed as:
 *
 *    target = jitter + min + targetExtra
 *
 * where min is the smallest observed delay and jitter is the spread
 * between min and a high percentile of the delay history. The buffer
 * grows towards the target by asking the caller to interpolate and
 * shrinks by dropping frames.
 *
 * All times are in milliseconds on a caller-defined timeline. Payload
 * ownership stays with the caller: a payload handed to put() is returned
 * through get()/getAll() or through a DROP result from put().
 *
 * This class is not thread-safe.
 */
class AdaptiveJitterBuffer {
public:

    enum class FrameType { CONTROL, VOICE, SILENCE };

    enum class Code {
        // A frame was delivered
        OK,
        // Nothing in the buffer
        EMPTY,
        // Nothing to play at this time
        NOFRAME,
        // The caller should synthesize the missing audio
        INTERP,
        // A frame must be discarded by the caller
        DROP,
        // The frame went to the head of the queue so the next
        // playout time may have changed
        SCHED
    };

    struct Config {
        // Hard limit on the buffer span (ms), 0 for no limit
        int32_t maxJitterbuf = 0;
        // Delay discontinuity (ms) that triggers a resync, -1 to disable
        int32_t resyncThreshold = 1000;
        // Number of consecutive interpolations before we treat the
        // stream as silent, 0 for no limit
        int32_t maxContigInterp = 0;
        // Extra delay (ms) added to the target
        int32_t targetExtra = 40;
    };

    struct Frame {
        void* data = 0;
        int32_t ts = 0;
        int32_t ms = 0;
        FrameType type = FrameType::VOICE;
    };

    struct Stats {
        unsigned framesIn = 0;
        unsigned framesOut = 0;
        unsigned framesLate = 0;
        unsigned framesLost = 0;
        unsigned framesDropped = 0;
        unsigned resyncs = 0;
    };

    static const unsigned MAX_BUFFER_SIZE = 128;

    AdaptiveJitterBuffer();

    void setConfig(const Config& config);

    /**
     * Forgets all frames and history. Any payloads still in the buffer
     * are NOT released, so drain with getAll() first.
     */
    void reset();

    /**
     * @param now Current time on the caller's timeline.
     * @returns OK, SCHED or DROP. On DROP the buffer did not take the
     * payload.
     */
    Code put(void* data, FrameType type, int32_t ms, int32_t ts, int32_t now);

    /**
     * @param interpl The length of an interpolated frame (ms).
     * @returns OK or DROP (out is populated), or EMPTY, NOFRAME, INTERP
     * (out.ms is the length to interpolate).
     */
    Code get(Frame& out, int32_t now, int32_t interpl);

    /**
     * Takes the head frame regardless of timing.
     * @returns OK or EMPTY.
     */
    Code getAll(Frame& out);

    /**
     * @returns true (and the time at which get() should next be called)
     * when at least one frame is queued.
     */
    bool next(int32_t& when);

    bool empty() const { return _frames.empty(); }
    unsigned size() const { return _frames.size(); }
    int32_t getTarget() const { return _target; }
    int32_t getCurrent() const { return _current; }
    const Stats& getStats() const { return _stats; }

private:

    static const unsigned HISTORY_SIZE = 500;
    static const unsigned HISTORY_MAXBUF_SIZE = 20;
    static const unsigned HISTORY_DROP_PCT = 3;
    // Minimum spacing between growth adjustments
    static const int32_t ADJUST_DELAY = 40;

    Code _get(Frame& out, int32_t now, int32_t interpl);
    bool _historyPut(int32_t ts, int32_t now, FrameType type);
    void _historyCalcMaxBuf();
    void _historyGet();
    bool _queueGet(Frame& out, int32_t ts);
    int32_t _queueNext() const;
    int32_t _queueLast() const;

    Config _config;
    Stats _stats;

    Frame _slotSpace[MAX_BUFFER_SIZE];
    unsigned _ptrSpace[MAX_BUFFER_SIZE];
    fixedsortedlist<Frame> _frames;
    int32_t _newestTs = 0;

    int32_t _history[HISTORY_SIZE];
    unsigned _histPtr = 0;
    int32_t _histMaxBuf[HISTORY_MAXBUF_SIZE];
    int32_t _histMinBuf[HISTORY_MAXBUF_SIZE];
    bool _histMaxBufValid = false;

    int32_t _jitter = 0;
    int32_t _min = 0;
    int32_t _target = 0;
    int32_t _current = 0;
    int32_t _next = 0;
    int32_t _lastVoiceMs = 0;
    int32_t _lastAdjustment = 0;
    int32_t _lastDelay = 0;
    int32_t _resyncOffset = 0;
    unsigned _cntDelayDiscont = 0;
    int32_t _cntContigInterp = 0;
    bool _inSilence = true;
};

    }
}
