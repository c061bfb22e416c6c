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
#include <algorithm>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"

#include "RtpUtil.h"
#include "RtpReceiver.h"

using namespace std;

namespace kc1fsz {
    namespace vrelay {

RtpReceiver::RtpReceiver(Log& log, Clock& clock)
:   _log(log),
    _clock(clock) {
    _jbConfig.maxJitterbuf = 100;
    _jbConfig.resyncThreshold = 1000;
    _jbConfig.maxContigInterp = 0;
    _jbConfig.targetExtra = 40;
}

Result RtpReceiver::mapUserId(uint64_t user, uint32_t ssrc) {
    if (_participants.find(ssrc) != _participants.end())
        return makeOk();

    std::unique_ptr<Participant> p(new Participant());
    p->decoder.reset(new VoiceDecoder());
    if (!p->decoder->isValid())
        return makeInternalError("Could not create opus decoder");
    _participants[ssrc] = std::move(p);

    // Since we have a user we update the user -> ssrc mapping as well
    _userToSsrc[user] = ssrc;

    return makeOk();
}

void RtpReceiver::unmapUserId(uint64_t user) {
    auto it = _userToSsrc.find(user);
    if (it == _userToSsrc.end())
        return;
    uint32_t ssrc = it->second;
    _userToSsrc.erase(it);
    _participants.erase(ssrc);
    if (_knownValid && _knownSsrc == ssrc)
        _knownValid = false;
}

bool RtpReceiver::isMapped(uint32_t ssrc) const {
    return _participants.find(ssrc) != _participants.end();
}

void RtpReceiver::handlePacket(const VoicePacket& packet) {

    if (packet.kind != VoicePacket::Kind::RTP)
        return;

    unsigned start;
    if (!skipOverExtensions(packet.buffer.data(), packet.dataStart, packet.dataEnd, start)) {
        _log.info("Not enough of packet left after skipping over extensions, ssrc %u",
            packet.ssrc);
        return;
    }

    auto it = _participants.find(packet.ssrc);
    if (it == _participants.end()) {
        _log.info("Received RTP packet from unknown sender, ssrc %u", packet.ssrc);
        return;
    }
    Participant& p = *(it->second);

    int16_t stereo[2 * NUM_SAMPLES];
    int samples = p.decoder->decode(packet.buffer.data() + start, packet.dataEnd - start, 
        stereo, NUM_SAMPLES);
    if (samples < 0) {
        _log.error("Could not decode voice data (%d), ssrc %u", samples, packet.ssrc);
        return;
    }

    // Down-mix to mono, rounding up
    vector<int16_t> mono(samples);
    for (int i = 0; i < samples; i++) {
        int32_t sum = (int32_t)stereo[2 * i] + (int32_t)stereo[2 * i + 1];
        mono[i] = (int16_t)((sum + 1) >> 1);
    }

    putDecoded(packet.ssrc, packet.timestamp, std::move(mono));
}

bool RtpReceiver::putDecoded(uint32_t ssrc, uint32_t rtpTs, vector<int16_t> samples) {

    auto it = _participants.find(ssrc);
    if (it == _participants.end())
        return false;
    Participant& p = *(it->second);

    const int32_t ms = (1000 * (int64_t)samples.size()) / SAMPLE_RATE;
    p.lastVoiceMs = ms;

    if (!p.jitterBuf)
        p.jitterBuf.reset(new Buffer(_clock, _jbConfig));
    if (!p.haveBaseTs) {
        p.baseTs = rtpTs;
        p.haveBaseTs = true;
    }

    // RTP timestamps are in samples, the buffer works in milliseconds
    const int32_t relTs = (1000 * (int64_t)(int32_t)(rtpTs - p.baseTs)) / SAMPLE_RATE;

    std::unique_ptr<vector<int16_t>> payload(new vector<int16_t>(std::move(samples)));
    Buffer::Result rc = p.jitterBuf->put(payload, Buffer::FrameType::VOICE, ms, relTs);

    if (rc == Buffer::Result::SCHEDULED) {
        // The expected time for the next frame has changed
        uint32_t due;
        if (!p.jitterBuf->nextFrame(due))
            return true;
        if (_knownValid) {
            if (_knownSsrc == ssrc) {
                _knownDue = due;
            } else if ((int32_t)(due - _knownDue) < 0) {
                _knownDue = due;
                _knownSsrc = ssrc;
            }
        }
    }
    return true;
}

bool RtpReceiver::_nextFrameTime(uint32_t& due, uint32_t& ssrc) {
    if (_knownValid) {
        due = _knownDue;
        ssrc = _knownSsrc;
        return true;
    }
    bool found = false;
    for (auto& [pSsrc, p] : _participants) {
        if (!p->jitterBuf)
            continue;
        uint32_t pDue;
        if (!p->jitterBuf->nextFrame(pDue))
            continue;
        if (!found || (int32_t)(pDue - due) < 0) {
            due = pDue;
            ssrc = pSsrc;
            found = true;
        }
    }
    if (found) {
        _knownValid = true;
        _knownDue = due;
        _knownSsrc = ssrc;
    }
    return found;
}

RtpReceiver::FetchResult RtpReceiver::fetchPacket(MediaFrame& frame, uint32_t& checkBackMs) {

    uint32_t due, ssrc;
    if (!_nextFrameTime(due, ssrc))
        return FetchResult::NONE_QUEUED;

    if ((int32_t)(due - _clock.time()) > 0) {
        checkBackMs = due;
        return FetchResult::CHECK_BACK_LATER;
    }

    // The buffers move forward below so the cached time is stale
    _knownValid = false;

    vector<vector<int16_t>> frames;
    for (auto& [pSsrc, p] : _participants) {
        if (!p->jitterBuf)
            continue;
        while (true) {
            Buffer::Frame f;
            Buffer::Result rc = p->jitterBuf->get(f, p->lastVoiceMs);
            if (rc == Buffer::Result::OK) {
                if (f.payload)
                    frames.push_back(std::move(*f.payload));
                break;
            } 
            // Late frames are discarded and we try again
            else if (rc == Buffer::Result::DROP) {
                continue;
            } 
            else {
                break;
            }
        }
    }

    if (frames.empty())
        return FetchResult::NONE_QUEUED;

    frame.format = AudioFormat::SLIN48;
    mix(frames, frame.samples);
    frame.ms = (1000 * frame.samples.size()) / SAMPLE_RATE;
    return FetchResult::PACKET_AVAILABLE;
}

void RtpReceiver::mix(const vector<vector<int16_t>>& frames, vector<int16_t>& out) {
    out.clear();
    if (frames.empty())
        return;
    size_t len = frames[0].size();
    for (const auto& f : frames)
        len = std::min(len, f.size());
    out.assign(len, 0);
    for (const auto& f : frames) {
        for (size_t i = 0; i < len; i++) {
            int32_t s = (int32_t)out[i] + (int32_t)f[i];
            out[i] = (int16_t)std::max((int32_t)-32768, std::min((int32_t)32767, s));
        }
    }
}

    }
}
