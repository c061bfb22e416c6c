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
#include <cstdlib>
#include <algorithm>
#include <functional>

#include "vrelay/AdaptiveJitterBuffer.h"

using namespace std;

namespace kc1fsz {
    namespace vrelay {

AdaptiveJitterBuffer::AdaptiveJitterBuffer()
:   _frames(_slotSpace, _ptrSpace, MAX_BUFFER_SIZE,
        // Frames are kept in timestamp order. Equal timestamps keep their
        // arrival order.
        [](const Frame& a, const Frame& b) {
            if (a.ts < b.ts)
                return -1;
            else if (a.ts > b.ts)
                return 1;
            else
                return 0;
        }) {
    reset();
}

void AdaptiveJitterBuffer::setConfig(const Config& config) {
    _config = config;
    if (_config.targetExtra < 0)
        _config.targetExtra = 40;
    _current = _config.targetExtra;
    _target = _config.targetExtra;
}

void AdaptiveJitterBuffer::reset() {
    _frames.clear();
    _newestTs = 0;
    _stats = Stats();
    _histPtr = 0;
    _histMaxBufValid = false;
    for (unsigned i = 0; i < HISTORY_SIZE; i++)
        _history[i] = 0;
    _jitter = 0;
    _min = 0;
    _current = _config.targetExtra;
    _target = _config.targetExtra;
    _next = 0;
    _lastVoiceMs = 0;
    _lastAdjustment = 0;
    _lastDelay = 0;
    _resyncOffset = 0;
    _cntDelayDiscont = 0;
    _cntContigInterp = 0;
    // We start out in silence so that the first voice frame sets the
    // playout timeline.
    _inSilence = true;
}

bool AdaptiveJitterBuffer::_historyPut(int32_t ts, int32_t now, FrameType type) {

    int32_t delay = now - (ts - _resyncOffset);
    int32_t threshold = 2 * _jitter + _config.resyncThreshold;

    // Special/negative times are not recorded
    if (ts <= 0)
        return true;

    if (_config.resyncThreshold != -1) {
        if (std::abs(delay - _lastDelay) > threshold) {
            _cntDelayDiscont++;
            // Resync on several consecutive discontinuities, or right
            // away for control frames
            if (_cntDelayDiscont > 3 || type == FrameType::CONTROL) {
                _cntDelayDiscont = 0;
                _histPtr = 0;
                _histMaxBufValid = false;
                _resyncOffset = ts - now;
                // After a resync the frame is right on time
                _lastDelay = delay = 0;
                _stats.resyncs++;
            } else {
                _stats.framesDropped++;
                return false;
            }
        } else {
            _lastDelay = delay;
            _cntDelayDiscont = 0;
        }
    }

    _history[(_histPtr++) % HISTORY_SIZE] = delay;
    _histMaxBufValid = false;
    return true;
}

void AdaptiveJitterBuffer::_historyCalcMaxBuf() {

    unsigned count = std::min(_histPtr, HISTORY_SIZE);
    unsigned n = std::min(count, HISTORY_MAXBUF_SIZE);

    // The largest delays, descending
    int32_t work[HISTORY_SIZE];
    std::copy(_history, _history + count, work);
    std::partial_sort(work, work + n, work + count, std::greater<int32_t>());
    for (unsigned i = 0; i < n; i++)
        _histMaxBuf[i] = work[i];

    // The smallest delays, ascending
    std::copy(_history, _history + count, work);
    std::partial_sort(work, work + n, work + count);
    for (unsigned i = 0; i < n; i++)
        _histMinBuf[i] = work[i];

    _histMaxBufValid = true;
}

void AdaptiveJitterBuffer::_historyGet() {

    unsigned count = std::min(_histPtr, HISTORY_SIZE);
    if (count == 0) {
        _min = 0;
        _jitter = 0;
        return;
    }

    if (!_histMaxBufValid)
        _historyCalcMaxBuf();

    // Ignore the worst few percent of the delays
    unsigned idx = (count * HISTORY_DROP_PCT) / 100;
    idx = std::min(idx, std::min(count, HISTORY_MAXBUF_SIZE) - 1);

    _min = _histMinBuf[0];
    _jitter = _histMaxBuf[idx] - _min;
}

bool AdaptiveJitterBuffer::_queueGet(Frame& out, int32_t ts) {
    if (_frames.empty())
        return false;
    const Frame& head = _frames.first();
    if (head.ts <= ts) {
        out = head;
        _frames.pop();
        _stats.framesOut++;
        return true;
    }
    return false;
}

int32_t AdaptiveJitterBuffer::_queueNext() const {
    return _frames.empty() ? 0 : _frames.first().ts;
}

int32_t AdaptiveJitterBuffer::_queueLast() const {
    return _frames.empty() ? 0 : _newestTs;
}

AdaptiveJitterBuffer::Code AdaptiveJitterBuffer::put(void* data, FrameType type,
    int32_t ms, int32_t ts, int32_t now) {

    _stats.framesIn++;

    if (type == FrameType::VOICE) {
        if (!_historyPut(ts, now, type))
            return Code::DROP;
    }

    // Enforce the maximum span of the buffer
    if (!_frames.empty() && _config.maxJitterbuf > 0) {
        if (_newestTs - _frames.first().ts >= _config.maxJitterbuf) {
            _stats.framesDropped++;
            return Code::DROP;
        }
    }

    if (!_frames.hasCapacity()) {
        _stats.framesDropped++;
        return Code::DROP;
    }

    Frame frame;
    frame.data = data;
    frame.type = type;
    frame.ms = ms;
    frame.ts = ts - _resyncOffset;

    bool head = _frames.empty() || frame.ts < _frames.first().ts;
    if (_frames.empty() || frame.ts > _newestTs)
        _newestTs = frame.ts;
    _frames.insert(frame);

    return head ? Code::SCHED : Code::OK;
}

AdaptiveJitterBuffer::Code AdaptiveJitterBuffer::_get(Frame& out, int32_t now,
    int32_t interpl) {

    _historyGet();

    _target = _jitter + _min + _config.targetExtra;
    // Apply the hard clamp
    if (_config.maxJitterbuf > 0 && (_target - _min) > _config.maxJitterbuf)
        _target = _min + _config.maxJitterbuf;

    int32_t diff = _target - _current;

    if (!_inSilence) {

        // Grow if we haven't grown recently, or if we need to grow by
        // more than what is buffered
        if (diff > 0 &&
            ((_lastAdjustment + ADJUST_DELAY) < now ||
             diff > (_queueLast() - _queueNext()))) {
            _current += interpl;
            _next += interpl;
            _lastAdjustment = now;
            return Code::INTERP;
        }

        Frame frame;
        bool haveFrame = _queueGet(frame, _next - _current);

        // Non-voice frames are simply passed along
        if (haveFrame && frame.type != FrameType::VOICE) {
            if (frame.type == FrameType::SILENCE) {
                _inSilence = true;
                _cntContigInterp = 0;
            }
            out = frame;
            return Code::OK;
        }

        // Voice frame is later than expected. It is still playable if 
        // it overlaps the last voice frame's worth of time before _next.
        if (haveFrame && frame.ts + _current < _next) {
            int32_t window = _lastVoiceMs > 0 ? _lastVoiceMs : interpl;
            if (frame.ts + _current > _next - window) {
                // Either we interpolated past this frame in the last get()
                // or the frame came a little early. Play it and re-align.
                out = frame;
                _next = frame.ts + _current + frame.ms;
                _cntContigInterp = 0;
                return Code::OK;
            } else {
                out = frame;
                _stats.framesLate++;
                if (_stats.framesLost > 0)
                    _stats.framesLost--;
                return Code::DROP;
            }
        }

        // Track frame sizes to support variable-length frames
        if (haveFrame && frame.ms > 0)
            _lastVoiceMs = frame.ms;

        // Shrink at one frame per 500ms, or faster when there is nothing
        // to drop
        if (diff < -_config.targetExtra &&
            ((!haveFrame && _lastAdjustment + 80 < now) ||
             (_lastAdjustment + 500 < now))) {
            _lastAdjustment = now;
            _cntContigInterp = 0;
            if (haveFrame) {
                out = frame;
                _current -= frame.ms;
                _stats.framesDropped++;
                return Code::DROP;
            } else {
                _current -= _lastVoiceMs;
                _stats.framesLost++;
                return Code::NOFRAME;
            }
        }

        // Lost frame
        if (!haveFrame) {
            _stats.framesLost++;
            _next += interpl;
            _cntContigInterp++;
            if (_config.maxContigInterp > 0 &&
                _cntContigInterp > _config.maxContigInterp) {
                // Too many interpolations in a row, treat this as silence
                _inSilence = true;
                return Code::NOFRAME;
            }
            return Code::INTERP;
        }

        // Normal case
        out = frame;
        _next += frame.ms;
        _cntContigInterp = 0;
        return Code::OK;
    }
    else {

        // Shrink during silence
        if (diff < -_config.targetExtra && _lastAdjustment + 10 <= now) {
            _current -= interpl;
            _lastAdjustment = now;
        }

        Frame frame;
        bool haveFrame = _queueGet(frame, now - _current);
        if (!haveFrame)
            return Code::NOFRAME;

        if (frame.type != FrameType::VOICE) {
            out = frame;
            return Code::OK;
        }

        // The first voice frame after silence sets up the timeline
        _current = _target;
        _inSilence = false;
        _next = frame.ts + _current + frame.ms;
        _lastVoiceMs = frame.ms;
        out = frame;
        return Code::OK;
    }
}

AdaptiveJitterBuffer::Code AdaptiveJitterBuffer::get(Frame& out, int32_t now,
    int32_t interpl) {
    if (_frames.empty() && _inSilence)
        return Code::EMPTY;
    Code rc = _get(out, now, interpl);
    if (rc == Code::INTERP) {
        out.data = 0;
        out.ms = _lastVoiceMs > 0 ? _lastVoiceMs : interpl;
    }
    return rc;
}

AdaptiveJitterBuffer::Code AdaptiveJitterBuffer::getAll(Frame& out) {
    if (_frames.empty())
        return Code::EMPTY;
    out = _frames.first();
    _frames.pop();
    _stats.framesOut++;
    return Code::OK;
}

bool AdaptiveJitterBuffer::next(int32_t& when) {
    if (_frames.empty())
        return false;
    if (_inSilence) {
        _historyGet();
        // Shrinking during silence happens in small steps
        if (_target - _current < -_config.targetExtra)
            when = _lastAdjustment + 10;
        else
            when = _queueNext() + _target;
    } else {
        when = _next;
    }
    return true;
}

    }
}
