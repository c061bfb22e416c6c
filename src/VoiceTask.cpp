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

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"

#include "VoiceCrypto.h"
#include "VoiceTask.h"

using namespace std;

namespace kc1fsz {
    namespace vrelay {

// Limits the work done in one pass so other tasks get a turn
static const unsigned MAX_ITEMS_PER_RUN = 16;

VoiceTask::VoiceTask(Log& log, Clock& clock, Session& session, GatewaySocketFactory& factory,
    SessionEventQueue::Receiver&& sessionEvents, VoiceTaskReceiver&& requests,
    VoiceEventQueue::Sender&& events, uint64_t guildId, uint64_t channelId)
:   _log(log),
    _clock(clock),
    _session(session),
    _factory(factory),
    _sessionEvents(std::move(sessionEvents)),
    _requests(std::move(requests)),
    _events(std::move(events)),
    _guildId(guildId),
    _channelId(channelId) {
}

VoiceTask::~VoiceTask() {
    if (!_finished)
        _finish();
}

void VoiceTask::start() {
    if (_session.sendJoin(_guildId, _channelId) != 0) {
        _log.error("Could not request to join channel %llu", (unsigned long long)_channelId);
        VoiceEvent ev;
        ev.type = VoiceEvent::Type::CLOSED;
        _events.send(std::move(ev));
        _finished = true;
        _events = VoiceEventQueue::Sender();
        _requests = VoiceTaskReceiver();
    }
}

VoiceGateway* VoiceTask::_gateway() {
    if (WaitingForReady* w = std::get_if<WaitingForReady>(&_state))
        return w->gateway.get();
    if (Discovering* d = std::get_if<Discovering>(&_state))
        return d->gateway.get();
    if (Connected* c = std::get_if<Connected>(&_state))
        return c->gateway.get();
    return 0;
}

int VoiceTask::getPolls(pollfd* fds, unsigned fdsCapacity) {

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

    VoiceGateway* gw = _gateway();
    if (gw) {
        int rc = gw->getPolls(fds + used, fdsCapacity - used);
        if (rc < 0)
            return -1;
        used += rc;
    }

    // The discovery answer is always wanted. Inbound media is only 
    // watched while the owner has room for it.
    int voiceFd = -1;
    if (Discovering* d = std::get_if<Discovering>(&_state))
        voiceFd = d->voice->getFd();
    else if (Connected* c = std::get_if<Connected>(&_state)) {
        if (_events.hasCapacity())
            voiceFd = c->voice->getFd();
    }
    if (voiceFd >= 0) {
        if (used == fdsCapacity)
            return -1;
        fds[used].fd = voiceFd;
        fds[used].events = POLLIN;
        fds[used].revents = 0;
        used++;
    }

    return used;
}

bool VoiceTask::run2() {

    if (_finished)
        return false;

    bool pending = false;

    VoiceTaskRequest req;
    Reply<Result> reply;
    for (unsigned i = 0; !_closeRequested && _requests.tryReceive(req, reply); i++) {
        _handleRequest(req, reply);
        if (i == MAX_ITEMS_PER_RUN) {
            pending = true;
            break;
        }
    }
    if (_requests.isClosed())
        _closeRequested = true;

    SessionEvent sev;
    while (!_closeRequested && _sessionEvents.tryReceive(sev))
        _handleSessionEvent(sev);
    if (_sessionEvents.isClosed()) {
        _log.info("Session event stream ended");
        _closeRequested = true;
    }

    // The gateway object survives the state transitions so this stays valid
    VoiceGateway* gw = _gateway();
    if (gw) {
        GatewayEvent gev;
        for (unsigned i = 0; !_closeRequested && gw->nextEvent(gev); i++) {
            if (_handleGatewayEvent(gev) < 0) {
                _log.error("Voice connection stopping due to error");
                _closeRequested = true;
            }
            if (i == MAX_ITEMS_PER_RUN) {
                pending = true;
                break;
            }
        }
    }

    if (!_closeRequested && std::holds_alternative<Discovering>(_state)) {
        if (_serviceDiscovery() < 0) {
            _log.error("Voice connection stopping due to discovery failure");
            _closeRequested = true;
        }
    }

    if (!_closeRequested && std::holds_alternative<Connected>(_state)) {
        if (_receiveMedia())
            pending = true;
    }

    if (_events.isClosed())
        _closeRequested = true;

    if (_closeRequested) {
        _finish();
        return false;
    }

    return pending;
}

void VoiceTask::_handleRequest(VoiceTaskRequest& req, Reply<Result>& reply) {
    if (req.type == VoiceTaskRequest::Type::WRITE) {
        Connected* c = std::get_if<Connected>(&_state);
        if (!c || !c->hasSession) {
            reply.send(makeInternalError("Voice not set up yet."));
            return;
        }
        int rc = c->voice->sendVoice(req.packet.timestamp, req.packet.payload.data(),
            req.packet.payload.size());
        if (rc < 0)
            reply.send(makeInternalError("Could not send voice packet"));
        else
            reply.send(makeOk());
    }
    else {
        reply.send(makeOk());
        _closeRequested = true;
    }
}

void VoiceTask::_handleSessionEvent(const SessionEvent& ev) {

    WaitingForEvents* w = std::get_if<WaitingForEvents>(&_state);
    if (!w)
        return;
    ConnectInfo& info = w->info;

    if (ev.type == SessionEvent::Type::VOICE_STATE_UPDATE) {
        // Other members of the server come through here too
        if (ev.userId != _session.getBotUser())
            return;
        info.hasGuildId = ev.hasGuildId;
        info.guildId = ev.guildId;
        info.hasChannelId = ev.hasChannelId;
        info.channelId = ev.channelId;
        info.hasSessionId = true;
        info.sessionId = ev.sessionId;
    }
    else if (ev.type == SessionEvent::Type::VOICE_SERVER_UPDATE) {
        info.hasGuildId = ev.hasGuildId;
        info.guildId = ev.guildId;
        info.hasToken = true;
        info.token = ev.token;
        info.hasEndpoint = ev.hasEndpoint;
        info.endpoint = ev.endpoint;
    }

    if (!info.isComplete())
        return;

    ConnectInfo ready = info;
    auto gateway = std::make_unique<VoiceGateway>(_log, _clock, _factory);
    // A failure here shows up as a CLOSED event from the gateway
    if (gateway->start(ready.endpoint) == 0) {
        if (gateway->sendIdentify(ready.guildId, _session.getBotUser(), ready.sessionId,
            ready.token) < 0)
            _log.error("Could not identify to voice gateway");
    }
    WaitingForReady next;
    next.gateway = std::move(gateway);
    _state = std::move(next);
}

int VoiceTask::_handleGatewayEvent(const GatewayEvent& ev) {

    switch (ev.type) {

    case GatewayEvent::Type::READY: {
        WaitingForReady* w = std::get_if<WaitingForReady>(&_state);
        if (!w) {
            _log.info("Ignoring extra ready");
            return 0;
        }
        EncryptionMode mode;
        if (!selectEncryptionMode(ev.modes, mode)) {
            _log.error("Did not find an encryption mode");
            return -1;
        }
        auto voice = std::make_unique<VoiceDataChannel>(_log);
        if (voice->open(ev.ip.c_str(), ev.port, ev.ssrc) < 0)
            return -1;
        Discovering d;
        d.gateway = std::move(w->gateway);
        d.voice = std::move(voice);
        d.mode = mode;
        d.deadlineMs = _clock.time() + DISCOVERY_TIMEOUT_MS;
        d.nextRetryMs = _clock.time() + DISCOVERY_RETRY_MS;
        _state = std::move(d);
        return 0;
    }

    case GatewayEvent::Type::SESSION_DESCRIPTION: {
        Connected* c = std::get_if<Connected>(&_state);
        if (!c) {
            _log.info("Ignoring session description before ready");
            return 0;
        }
        EncryptionMode mode;
        if (!parseEncryptionMode(ev.mode.c_str(), mode)) {
            _log.error("Unknown encryption mode %s", ev.mode.c_str());
            return -1;
        }
        if (!c->voice->setKey(mode, ev.secretKey.data(), ev.secretKey.size()))
            return -1;
        // Only announce on the first session description
        if (!c->hasSession) {
            if (c->gateway->sendSpeaking(VoiceGateway::SPEAKING_MICROPHONE, 0,
                c->voice->getSsrc()) < 0)
                return -1;
        }
        c->hasSession = true;
        VoiceEvent n;
        n.type = VoiceEvent::Type::FULLY_CONNECTED;
        _emit(std::move(n));
        return 0;
    }

    case GatewayEvent::Type::SPEAKING: {
        if (ev.delay != 0)
            _log.info("Speaking with delay %u, ssrc %u", ev.delay, ev.ssrc);
        if (ev.hasUserId) {
            VoiceEvent n;
            n.type = VoiceEvent::Type::SPEAKING;
            n.userId = ev.userId;
            n.ssrc = ev.ssrc;
            _emit(std::move(n));
        }
        return 0;
    }

    case GatewayEvent::Type::CLIENT_CONNECT: {
        VoiceEvent n;
        n.type = VoiceEvent::Type::USER_JOINED;
        n.userId = ev.userId;
        n.ssrc = ev.ssrc;
        _emit(std::move(n));
        return 0;
    }

    case GatewayEvent::Type::CLIENT_DISCONNECT: {
        if (ev.userId == _session.getBotUser()) {
            _log.info("Disconnected from voice channel");
            _closeRequested = true;
        }
        VoiceEvent n;
        n.type = VoiceEvent::Type::USER_LEFT;
        n.userId = ev.userId;
        _emit(std::move(n));
        return 0;
    }

    case GatewayEvent::Type::CLOSED:
        _log.info("Voice gateway closed");
        _closeRequested = true;
        return 0;

    case GatewayEvent::Type::UNEXPECTED:
        _log.error("Unexpected message from voice gateway (op %d)", ev.op);
        return -1;

    default:
        return 0;
    }
}

int VoiceTask::_serviceDiscovery() {

    Discovering& d = std::get<Discovering>(_state);

    int rc = d.voice->pollDiscovery();
    if (rc < 0)
        return -1;

    if (rc == 0) {
        if ((int32_t)(_clock.time() - d.deadlineMs) >= 0) {
            _log.error("Timed out waiting for discovery response");
            return -1;
        }
        // UDP gives no guarantee so the request is repeated
        if ((int32_t)(_clock.time() - d.nextRetryMs) >= 0) {
            _log.info("Repeating discovery request");
            if (d.voice->sendDiscoveryRequest() < 0)
                return -1;
            d.nextRetryMs = _clock.time() + DISCOVERY_RETRY_MS;
        }
        return 0;
    }

    if (d.gateway->sendSelectProtocol(d.voice->getPublicAddr(), d.voice->getPublicPort(),
        d.mode) < 0)
        return -1;
    Connected c;
    c.gateway = std::move(d.gateway);
    c.voice = std::move(d.voice);
    _state = std::move(c);
    return 0;
}

bool VoiceTask::_receiveMedia() {
    Connected& c = std::get<Connected>(_state);
    for (unsigned i = 0; i < MAX_ITEMS_PER_RUN; i++) {
        // Nothing is read from the socket unless there is room for it
        VoiceEventQueue::Permit permit;
        if (!_events.reserve(permit))
            return false;
        VoiceEvent ev;
        ev.type = VoiceEvent::Type::PACKET;
        int rc = c.voice->receivePacket(ev.packet);
        if (rc == 0)
            return false;
        // Bad packets were already logged and are simply dropped
        if (rc > 0)
            permit.send(std::move(ev));
    }
    return true;
}

void VoiceTask::_emit(VoiceEvent&& ev) {
    if (!_events.send(std::move(ev)))
        _closeRequested = true;
}

void VoiceTask::_finish() {
    _finished = true;
    VoiceGateway* gw = _gateway();
    if (gw)
        gw->close();
    if (Discovering* d = std::get_if<Discovering>(&_state))
        d->voice->close();
    else if (Connected* c = std::get_if<Connected>(&_state))
        c->voice->close();
    _state = WaitingForEvents();
    _session.sendLeave(_guildId);
    // Lets the owner see the end of the notifications and fails any 
    // requests that arrive from now on
    _events = VoiceEventQueue::Sender();
    _requests = VoiceTaskReceiver();
    _log.info("Voice task for channel %llu finished", (unsigned long long)_channelId);
}

// ----- VoiceTaskHandle -------------------------------------------------------

VoiceTaskHandle::VoiceTaskHandle(Log& log, Clock& clock, Session& session,
    GatewaySocketFactory& factory, SessionEventQueue::Receiver&& sessionEvents,
    uint64_t guildId, uint64_t channelId) {
    auto requests = makeRequestChannel<VoiceTaskRequest, Result>();
    auto events = VoiceEventQueue::create(VoiceTask::EVENT_CAPACITY);
    _sender = std::move(requests.first);
    _events = std::move(events.second);
    _task = std::make_unique<VoiceTask>(log, clock, session, factory,
        std::move(sessionEvents), std::move(requests.second), std::move(events.first),
        guildId, channelId);
    _task->start();
}

void VoiceTaskHandle::write(OutgoingVoicePacket packet, VoiceTaskSender::Callback cb) {
    VoiceTaskRequest req;
    req.type = VoiceTaskRequest::Type::WRITE;
    req.packet = std::move(packet);
    _sender.request(std::move(req), cb);
}

void VoiceTaskHandle::requestClose() {
    VoiceTaskRequest req;
    req.type = VoiceTaskRequest::Type::CLOSE;
    // Completion is tracked through isFinished()
    _sender.request(std::move(req), nullptr);
}

    }
}
