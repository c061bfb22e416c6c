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

#include <cstdint>
#include <cstring>

#include <sodium.h>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"

#include "RtpUtil.h"
#include "QueueThread.h"
#include "CallWorker.h"

using namespace std;

namespace kc1fsz {
    namespace vrelay {

static const unsigned MAX_REQUESTS_PER_RUN = 16;

// ----- CallHandle ------------------------------------------------------------

CallHandle::CallHandle(CallRequestSender sender)
:   _sender(sender),
    _timestamp(randombytes_random()),
    _writeFailures(0) {
}

static bool parseId(const char* start, const char* end, uint64_t& id) {
    if (start == end)
        return false;
    uint64_t v = 0;
    for (const char* p = start; p != end; p++) {
        if (*p < '0' || *p > '9')
            return false;
        uint64_t digit = *p - '0';
        if (v > (UINT64_MAX - digit) / 10)
            return false;
        v = v * 10 + digit;
    }
    id = v;
    return true;
}

bool CallHandle::parseDestination(const char* dest, uint64_t& guildId, uint64_t& channelId) {
    if (dest == 0)
        return false;
    const char* slash = strchr(dest, '/');
    if (slash == 0 || strchr(slash + 1, '/') != 0)
        return false;
    uint64_t g, c;
    if (!parseId(dest, slash, g) || !parseId(slash + 1, slash + 1 + strlen(slash + 1), c))
        return false;
    guildId = g;
    channelId = c;
    return true;
}

Result CallHandle::_request(CallRequest req) {
    Result res;
    RequestError err = _sender.requestBlocking(std::move(req), res);
    if (err != RequestError::NONE)
        return makeInternalError(requestErrorName(err));
    return res;
}

Result CallHandle::startJoining() {
    CallRequest req;
    req.type = CallRequest::Type::JOIN_CHANNEL;
    return _request(std::move(req));
}

Result CallHandle::hangup() {
    CallRequest req;
    req.type = CallRequest::Type::HANG_UP;
    return _request(std::move(req));
}

Result CallHandle::fixup(TelephonyChannel& channel) {
    CallRequest req;
    req.type = CallRequest::Type::FIX_UP;
    req.channel = ChannelRef(&channel);
    return _request(std::move(req));
}

Result CallHandle::writeFrame(const MediaFrame& frame) {
    uint8_t buf[MAX_OPUS_PAYLOAD_SIZE];
    int len = _encoder.encode(frame.samples.data(), frame.samples.size(), buf, sizeof(buf));
    uint32_t ts = _timestamp;
    _timestamp += NUM_SAMPLES;
    if (len < 0)
        return makeError(ErrorCode::ENCODE_ERROR);
    CallRequest req;
    req.type = CallRequest::Type::WRITE_FRAME;
    req.packet.payload.assign(buf, buf + len);
    req.packet.timestamp = ts;
    return _request(std::move(req));
}

// ----- CallWorker ------------------------------------------------------------

CallWorker::CallWorker(Log& log, Clock& clock, QueueThread& queue, Session& session,
    GatewaySocketFactory& factory, ChannelRef channel, uint64_t guildId, 
    uint64_t channelId, SessionEventQueue::Receiver&& sessionEvents,
    CallRequestReceiver&& requests)
:   _log(log),
    _clock(clock),
    _queue(queue),
    _session(session),
    _factory(factory),
    _channel(std::move(channel)),
    _guildId(guildId),
    _channelId(channelId),
    _requests(std::move(requests)),
    _receiver(log, clock) {
    Prepare p;
    p.sessionEvents = std::move(sessionEvents);
    _state = std::move(p);
}

CallWorker::~CallWorker() {
    if (!_finished)
        _log.info("Dropping unfinished call to channel %llu", (unsigned long long)_channelId);
}

CallWorker::State CallWorker::getState() const {
    if (std::holds_alternative<Prepare>(_state))
        return State::PREPARE;
    else if (std::holds_alternative<VoiceStarted>(_state))
        return State::VOICE_STARTED;
    else
        return State::SHUTTING_DOWN;
}

VoiceTaskHandle* CallWorker::_voice() {
    if (VoiceStarted* s = std::get_if<VoiceStarted>(&_state))
        return s->voice.get();
    if (ShuttingDown* s = std::get_if<ShuttingDown>(&_state))
        return s->voice.get();
    return 0;
}

int CallWorker::getPolls(pollfd* fds, unsigned fdsCapacity) {

    if (_finished)
        return 0;

    unsigned used = 0;

    if (_requests.getFd() >= 0) {
        if (used == fdsCapacity)
            return -1;
        fds[used].fd = _requests.getFd();
        fds[used].events = POLLIN;
        fds[used].revents = 0;
        used++;
    }

    VoiceTaskHandle* voice = _voice();
    if (voice) {
        int rc = voice->getTask().getPolls(fds + used, fdsCapacity - used);
        if (rc < 0)
            return -1;
        used += rc;
    }

    return used;
}

bool CallWorker::run2() {

    if (_finished)
        return false;

    bool pending = false;

    VoiceTaskHandle* voice = _voice();
    if (voice && voice->getTask().run2())
        pending = true;

    CallRequest req;
    Reply<Result> reply;
    for (unsigned i = 0; !_finished && _requests.tryReceive(req, reply); i++) {
        _handleRequest(req, reply);
        if (i == MAX_REQUESTS_PER_RUN) {
            pending = true;
            break;
        }
    }

    // Nobody is left to hang up, so this counts as a local hangup
    if (!std::holds_alternative<ShuttingDown>(_state) && _requests.isClosed()) {
        _log.info("Call handle went away");
        _shutDown(true);
    }

    // Handling an event may change the state, so check every time around
    VoiceEvent ev;
    while (std::holds_alternative<VoiceStarted>(_state) &&
        std::get<VoiceStarted>(_state).voice->getEvents().tryReceive(ev)) {
        _handleVoiceEvent(ev);
    }
    if (std::holds_alternative<VoiceStarted>(_state) &&
        std::get<VoiceStarted>(_state).voice->getEvents().isClosed()) {
        _log.info("Voice task ended");
        _shutDown(false);
    }

    if (ShuttingDown* s = std::get_if<ShuttingDown>(&_state)) {
        if (s->voice) {
            // Give it a chance to wind down in the same pass
            if (!s->voice->isFinished())
                s->voice->getTask().run2();
            if (s->voice->isFinished())
                s->voice.reset();
        }
        if (!s->voice)
            _finish(*s);
    }

    return pending && !_finished;
}

void CallWorker::audioRateTick(uint32_t) {
    if (std::holds_alternative<VoiceStarted>(_state))
        _drainMixer();
}

void CallWorker::_handleRequest(CallRequest& req, Reply<Result>& reply) {

    switch (req.type) {

    case CallRequest::Type::JOIN_CHANNEL: {
        Prepare* p = std::get_if<Prepare>(&_state);
        if (!p) {
            reply.send(makeInternalError("Tried to call same channel twice"));
            return;
        }
        VoiceStarted vs;
        vs.voice = std::make_unique<VoiceTaskHandle>(_log, _clock, _session, _factory,
            std::move(p->sessionEvents), _guildId, _channelId);
        _state = std::move(vs);
        Result r = _queue.requestControl(_channel, ControlType::RINGING);
        if (!r.isOk()) {
            char msg[128];
            _log.error("Unable to indicate ringing: %s", r.describe(msg, sizeof(msg)));
        }
        reply.send(makeOk());
        return;
    }

    case CallRequest::Type::HANG_UP: {
        if (!std::holds_alternative<ShuttingDown>(_state))
            _shutDown(true);
        ShuttingDown& s = std::get<ShuttingDown>(_state);
        s.hungUpLocally = true;
        if (!s.reply.isValid())
            s.reply = std::move(reply);
        else
            reply.send(makeOk());
        return;
    }

    case CallRequest::Type::WRITE_FRAME: {
        VoiceStarted* vs = std::get_if<VoiceStarted>(&_state);
        if (!vs) {
            reply.send(makeInternalError("Call not connected yet"));
            return;
        }
        // The answer comes back later on this same thread
        auto pendingReply = std::make_shared<Reply<Result>>(std::move(reply));
        vs->voice->write(std::move(req.packet), 
            [pendingReply](RequestError err, Result& res) {
                if (err != RequestError::NONE)
                    pendingReply->send(makeInternalError(requestErrorName(err)));
                else
                    pendingReply->send(std::move(res));
            }
        );
        return;
    }

    case CallRequest::Type::FIX_UP:
        _channel = std::move(req.channel);
        reply.send(makeOk());
        return;
    }
}

void CallWorker::_handleVoiceEvent(VoiceEvent& ev) {

    switch (ev.type) {

    case VoiceEvent::Type::PACKET:
        _receiver.handlePacket(ev.packet);
        _drainMixer();
        break;

    case VoiceEvent::Type::USER_JOINED:
    case VoiceEvent::Type::SPEAKING: {
        Result r = _receiver.mapUserId(ev.userId, ev.ssrc);
        if (!r.isOk()) {
            char msg[128];
            _log.error("Unable to map user %llu: %s", (unsigned long long)ev.userId,
                r.describe(msg, sizeof(msg)));
        }
        break;
    }

    case VoiceEvent::Type::USER_LEFT:
        _receiver.unmapUserId(ev.userId);
        break;

    case VoiceEvent::Type::FULLY_CONNECTED: {
        Result r = _queue.requestControl(_channel, ControlType::ANSWER);
        if (!r.isOk()) {
            char msg[128];
            _log.error("Call stopping due to fatal error: %s", r.describe(msg, sizeof(msg)));
            _shutDown(false);
        }
        break;
    }

    case VoiceEvent::Type::CLOSED:
        _log.info("Voice connection closed");
        _shutDown(false);
        break;
    }
}

void CallWorker::_drainMixer() {
    MediaFrame frame;
    uint32_t checkBackMs;
    while (_receiver.fetchPacket(frame, checkBackMs) == RtpReceiver::FetchResult::PACKET_AVAILABLE) {
        Result r = _queue.requestFrame(_channel, frame);
        if (!r.isOk()) {
            char msg[128];
            _log.error("Call stopping due to fatal error: %s", r.describe(msg, sizeof(msg)));
            _shutDown(false);
            return;
        }
    }
}

void CallWorker::_shutDown(bool hungUpLocally) {
    if (ShuttingDown* s = std::get_if<ShuttingDown>(&_state)) {
        s->hungUpLocally = s->hungUpLocally || hungUpLocally;
        return;
    }
    std::unique_ptr<VoiceTaskHandle> voice;
    if (VoiceStarted* vs = std::get_if<VoiceStarted>(&_state))
        voice = std::move(vs->voice);
    if (voice && !voice->isFinished())
        voice->requestClose();
    ShuttingDown s;
    s.hungUpLocally = hungUpLocally;
    s.voice = std::move(voice);
    _state = std::move(s);
}

void CallWorker::_finish(ShuttingDown& s) {
    _finished = true;
    if (s.reply.isValid())
        s.reply.send(makeOk());
    if (!s.hungUpLocally) {
        Result r = _queue.requestHangup(_channel);
        if (!r.isOk()) {
            char msg[128];
            _log.error("Unable to hang up channel: %s", r.describe(msg, sizeof(msg)));
        }
    }
    // Anything that comes in from now on fails right away
    _requests = CallRequestReceiver();
    _channel.reset();
    _log.info("Call to channel %llu finished", (unsigned long long)_channelId);
}

    }
}
