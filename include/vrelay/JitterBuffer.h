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
#include <memory>

#include "kc1fsz-tools/Clock.h"

#include "vrelay/AdaptiveJitterBuffer.h"

namespace kc1fsz {
    namespace vrelay {

/**
 * A typed wrapper around the AdaptiveJitterBuffer that owns its payloads.
 *
 * Timestamps passed to put() are relative milliseconds on the sender's
 * timeline (i.e. since the first packet of the participant). The local
 * reference time is captured from the clock when the buffer is created,
 * so all arrival times are measured from that point.
 *
 * Any payloads still buffered when this object is destroyed are drained
 * and destroyed.
 */
template <class T> class JitterBuffer {
public:

    typedef AdaptiveJitterBuffer::FrameType FrameType;

    enum class Result {
        OK,
        EMPTY,
        NOFRAME,
        INTERPOLATE,
        DROP,
        SCHEDULED
    };

    struct Frame {
        std::unique_ptr<T> payload;
        FrameType type = FrameType::VOICE;
        int32_t ms = 0;
        int32_t ts = 0;
    };

    JitterBuffer(Clock& clock, const AdaptiveJitterBuffer::Config& config)
    :   _clock(clock),
        _refMs(clock.time()) {
        _jb.setConfig(config);
    }

    JitterBuffer(const JitterBuffer&) = delete;
    JitterBuffer& operator=(const JitterBuffer&) = delete;

    ~JitterBuffer() {
        Frame frame;
        while (getUnconditionally(frame) == Result::OK)
            frame.payload.reset();
    }

    /**
     * Takes ownership of the payload unless DROP is returned, in which case
     * the payload is left with the caller.
     *
     * @returns OK, DROP, or SCHEDULED if the new frame went to the front of
     * the buffer and the next due time should be re-queried.
     */
    Result put(std::unique_ptr<T>& payload, FrameType type, int32_t ms, int32_t ts) {
        AdaptiveJitterBuffer::Code rc = _jb.put(payload.get(), type, ms, ts, _now());
        if (rc == AdaptiveJitterBuffer::Code::DROP)
            return Result::DROP;
        payload.release();
        if (rc == AdaptiveJitterBuffer::Code::SCHED)
            return Result::SCHEDULED;
        return Result::OK;
    }

    /**
     * Pulls the frame that should be played now, if any. A frame is
     * returned for OK and for DROP (the caller just discards it).
     */
    Result get(Frame& out, int32_t expectedMs) {
        AdaptiveJitterBuffer::Frame frame;
        AdaptiveJitterBuffer::Code rc = _jb.get(frame, _now(), expectedMs);
        switch (rc) {
        case AdaptiveJitterBuffer::Code::OK:
            _take(frame, out);
            return Result::OK;
        case AdaptiveJitterBuffer::Code::DROP:
            _take(frame, out);
            return Result::DROP;
        case AdaptiveJitterBuffer::Code::INTERP:
            out.payload.reset();
            out.ms = frame.ms;
            return Result::INTERPOLATE;
        case AdaptiveJitterBuffer::Code::NOFRAME:
            return Result::NOFRAME;
        case AdaptiveJitterBuffer::Code::SCHED:
            return Result::SCHEDULED;
        default:
            return Result::EMPTY;
        }
    }

    /**
     * Pulls the oldest frame regardless of its due time.
     */
    Result getUnconditionally(Frame& out) {
        AdaptiveJitterBuffer::Frame frame;
        if (_jb.getAll(frame) != AdaptiveJitterBuffer::Code::OK)
            return Result::EMPTY;
        _take(frame, out);
        return Result::OK;
    }

    /**
     * @param due Set to the absolute clock time (ms) at which get() should
     * be called next.
     * @returns false if nothing is buffered.
     */
    bool nextFrame(uint32_t& due) {
        int32_t when;
        if (!_jb.next(when))
            return false;
        due = _refMs + (uint32_t)when;
        return true;
    }

    bool empty() const { return _jb.empty(); }

    unsigned size() const { return _jb.size(); }

    const AdaptiveJitterBuffer::Stats& getStats() const { return _jb.getStats(); }

private:

    int32_t _now() const {
        return (int32_t)(_clock.time() - _refMs);
    }

    static void _take(AdaptiveJitterBuffer::Frame& frame, Frame& out) {
        out.payload.reset(static_cast<T*>(frame.data));
        out.type = frame.type;
        out.ms = frame.ms;
        out.ts = frame.ts;
    }

    Clock& _clock;
    const uint32_t _refMs;
    AdaptiveJitterBuffer _jb;
};

    }
}
