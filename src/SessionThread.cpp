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

#include "CallWorker.h"
#include "EventLoop.h"
#include "QueueThread.h"
#include "ThreadUtil.h"
#include "SessionThread.h"

using namespace std;

namespace kc1fsz {
    namespace vrelay {

// ----- SessionWorker ---------------------------------------------------------

SessionWorker::SessionWorker(Log& log, Clock& clock, QueueThread& queue, Session& session,
    GatewaySocketFactory& factory, SessionRequestReceiver&& requests)
:   _log(log),
    _clock(clock),
    _queue(queue),
    _session(session),
    _factory(factory),
    _requests(std::move(requests)) {
}

SessionWorker::~SessionWorker() {
    if (!_calls.empty())
        _log.info("Dropping %u calls", (unsigned)_calls.size());
}

Result SessionWorker::prepareCall(ChannelRef channel, uint64_t guildId, uint64_t channelId,
    std::unique_ptr<CallHandle>& call) {

    SessionEventQueue::Receiver events;
    if (!_session.exclusiveServerEvents(guildId, events)) {
        _log.info("Already in a channel on server %llu", (unsigned long long)guildId);
        return makeError(ErrorCode::ALREADY_IN_CHANNEL_ON_SERVER);
    }

    auto requests = makeRequestChannel<CallRequest, Result>();
    auto handle = std::make_unique<CallHandle>(requests.first);
    // The server claim is released along with the receiver
    if (!handle->isValid())
        return makeInternalError("Could not create audio encoder");

    _calls.push_back(std::make_unique<CallWorker>(_log, _clock, _queue, _session, _factory,
        std::move(channel), guildId, channelId, std::move(events), 
        std::move(requests.second)));
    call = std::move(handle);
    _log.info("Prepared call to %llu/%llu", (unsigned long long)guildId, 
        (unsigned long long)channelId);
    return makeOk();
}

int SessionWorker::getPolls(pollfd* fds, unsigned fdsCapacity) {

    unsigned used = 0;

    if (_requests.getFd() >= 0) {
        if (used == fdsCapacity)
            return -1;
        fds[used].fd = _requests.getFd();
        fds[used].events = POLLIN;
        fds[used].revents = 0;
        used++;
    }

    for (auto& c : _calls) {
        int rc = c->getPolls(fds + used, fdsCapacity - used);
        if (rc < 0)
            return -1;
        used += rc;
    }

    return used;
}

bool SessionWorker::run2() {

    bool pending = false;

    SessionRequest req;
    Reply<SessionResponse> reply;
    while (!_stopped && _requests.tryReceive(req, reply)) {
        SessionResponse res;
        if (req.type == SessionRequest::Type::PREPARE_CALL) {
            res.result = prepareCall(std::move(req.channel), req.guildId, req.channelId, 
                res.call);
        }
        else if (req.type == SessionRequest::Type::STOP) {
            _log.info("Stop requested");
            _stopped = true;
        }
        else {
            res.result = makeInternalError("Session is already set up");
        }
        reply.send(std::move(res));
        // Don't hold onto the channel reference
        req = SessionRequest();
    }

    if (_requests.isClosed())
        _stopped = true;

    for (auto& c : _calls)
        if (c->run2())
            pending = true;

    _calls.erase(std::remove_if(_calls.begin(), _calls.end(),
        [](const std::unique_ptr<CallWorker>& c) { return c->isFinished(); }),
        _calls.end());

    return pending;
}

void SessionWorker::audioRateTick(uint32_t tickTimeMs) {
    for (auto& c : _calls)
        c->audioRateTick(tickTimeMs);
}

// ----- SessionThread ---------------------------------------------------------

SessionThread::SessionThread(Log& log, Clock& clock, QueueThread& queue, 
    GatewaySocketFactory& gatewayFactory, SessionTransportFactory& transportFactory,
    CredentialCheck check, bool trace)
:   _log(log),
    _clock(clock),
    _queue(queue),
    _gatewayFactory(gatewayFactory),
    _transportFactory(transportFactory),
    _check(check),
    _trace(trace) {
}

SessionThread::~SessionThread() {
    stop();
}

Result SessionThread::start(const std::string& token) {

    if (_thread.joinable())
        return makeInternalError("Session is already started");

    auto ch = makeRequestChannel<SessionRequest, SessionResponse>();
    _sender = std::move(ch.first);
    _thread = std::thread(_loop, this, std::move(ch.second));

    SessionRequest req;
    req.type = SessionRequest::Type::SETUP;
    req.token = token;
    SessionResponse res;
    RequestError err = _sender.requestBlocking(std::move(req), res);
    if (err != RequestError::NONE) {
        stop();
        return makeInternalError(requestErrorName(err));
    }
    if (!res.result.isOk())
        stop();
    return res.result;
}

Result SessionThread::prepareCall(TelephonyChannel& channel, uint64_t guildId, 
    uint64_t channelId, std::unique_ptr<CallHandle>& call) {
    SessionRequest req;
    req.type = SessionRequest::Type::PREPARE_CALL;
    req.channel = ChannelRef(&channel);
    req.guildId = guildId;
    req.channelId = channelId;
    SessionResponse res;
    RequestError err = _sender.requestBlocking(std::move(req), res);
    if (err != RequestError::NONE)
        return makeInternalError(requestErrorName(err));
    if (res.result.isOk())
        call = std::move(res.call);
    return res.result;
}

void SessionThread::stop() {
    if (!_thread.joinable())
        return;
    SessionRequest req;
    req.type = SessionRequest::Type::STOP;
    SessionResponse res;
    // Fails harmlessly if the thread has already gone away
    RequestError err = _sender.requestBlocking(std::move(req), res);
    if (err != RequestError::NONE)
        _log.info("Worker thread was already stopped");
    _sender = SessionRequestSender();
    _thread.join();
}

void SessionThread::_loop(SessionThread* self, SessionRequestReceiver requests) {

    setThreadName("vrelay_worker");
    Log& log = self->_log;
    log.info("Start worker thread");

    // The setup is handled before anything else runs
    SessionRequest req;
    Reply<SessionResponse> reply;
    while (!requests.tryReceive(req, reply)) {
        if (requests.isClosed())
            return;
        pollfd fd;
        fd.fd = requests.getFd();
        fd.events = POLLIN;
        fd.revents = 0;
        poll(&fd, 1, 500);
    }

    SessionResponse res;
    if (req.type != SessionRequest::Type::SETUP) {
        if (req.type != SessionRequest::Type::STOP)
            res.result = makeInternalError("Session is not set up");
        reply.send(std::move(res));
        return;
    }

    uint64_t botUser = 0;
    res.result = self->_check(req.token, botUser);
    if (!res.result.isOk()) {
        reply.send(std::move(res));
        return;
    }

    std::unique_ptr<SessionTransport> transport = self->_transportFactory.open(req.token);
    if (!transport) {
        log.error("Could not connect to the gateway");
        res.result = makeInternalError("Could not connect to the gateway");
        reply.send(std::move(res));
        return;
    }

    Session session(log, *transport, botUser);
    // Call workers are destroyed before the session they use
    SessionWorker worker(log, self->_clock, self->_queue, session, self->_gatewayFactory,
        std::move(requests));
    reply.send(std::move(res));

    Runnable2* tasks[] = { &session, &worker };
    EventLoop::run(log, self->_clock, tasks, 2, 
        [&worker](Log&, Clock&) { return !worker.isStopped(); }, self->_trace);

    session.cancel();
    log.info("End worker thread");
}

    }
}
