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
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "vrelay/RequestChannel.h"

#include "Error.h"
#include "Runnable2.h"
#include "Session.h"
#include "Telephony.h"

namespace kc1fsz {

class Log;
class Clock;

    namespace vrelay {

class CallHandle;
class CallWorker;
class GatewaySocketFactory;
class QueueThread;

struct SessionRequest {
    enum class Type { SETUP, PREPARE_CALL, STOP };
    Type type = Type::STOP;
    // SETUP
    std::string token;
    // PREPARE_CALL
    ChannelRef channel;
    uint64_t guildId = 0;
    uint64_t channelId = 0;
};

struct SessionResponse {
    Result result;
    // PREPARE_CALL
    std::unique_ptr<CallHandle> call;
};

typedef RequestSender<SessionRequest, SessionResponse> SessionRequestSender;
typedef RequestReceiver<SessionRequest, SessionResponse> SessionRequestReceiver;

/**
 * Services the session requests on the worker event loop and owns every
 * call worker until it finishes.
 */
class SessionWorker : public Runnable2 {
public:

    SessionWorker(Log& log, Clock& clock, QueueThread& queue, Session& session,
        GatewaySocketFactory& factory, SessionRequestReceiver&& requests);
    ~SessionWorker();

    SessionWorker(const SessionWorker&) = delete;
    SessionWorker& operator=(const SessionWorker&) = delete;

    /**
     * Creates the call worker for a channel.
     *
     * @returns ALREADY_IN_CHANNEL_ON_SERVER if another call holds the 
     * server.
     */
    Result prepareCall(ChannelRef channel, uint64_t guildId, uint64_t channelId,
        std::unique_ptr<CallHandle>& call);

    bool isStopped() const { return _stopped; }

    unsigned getCallCount() const { return _calls.size(); }

    // ----- Runnable2 ---------------------------------------------------

    int getPolls(pollfd* fds, unsigned fdsCapacity) override;
    bool run2() override;
    void audioRateTick(uint32_t tickTimeMs) override;

private:

    Log& _log;
    Clock& _clock;
    QueueThread& _queue;
    Session& _session;
    GatewaySocketFactory& _factory;
    SessionRequestReceiver _requests;
    std::vector<std::unique_ptr<CallWorker>> _calls;
    bool _stopped = false;
};

/**
 * The dedicated thread that runs the session and all calls. The telephony
 * side talks to it through blocking requests.
 */
class SessionThread {
public:

    /**
     * Validates a token and provides the user id of the bot.
     */
    typedef std::function<Result(const std::string& token, uint64_t& botUser)> CredentialCheck;

    SessionThread(Log& log, Clock& clock, QueueThread& queue, 
        GatewaySocketFactory& gatewayFactory, SessionTransportFactory& transportFactory,
        CredentialCheck check, bool trace = false);
    ~SessionThread();

    SessionThread(const SessionThread&) = delete;
    SessionThread& operator=(const SessionThread&) = delete;

    /**
     * Launches the thread and logs in. Blocks until the credentials have
     * been checked.
     */
    Result start(const std::string& token);

    /**
     * Blocking.
     */
    Result prepareCall(TelephonyChannel& channel, uint64_t guildId, uint64_t channelId,
        std::unique_ptr<CallHandle>& call);

    /**
     * Stops the thread. Any calls that are still up are dropped.
     */
    void stop();

    bool isRunning() const { return _thread.joinable(); }

private:

    static void _loop(SessionThread* self, SessionRequestReceiver requests);

    Log& _log;
    Clock& _clock;
    QueueThread& _queue;
    GatewaySocketFactory& _gatewayFactory;
    SessionTransportFactory& _transportFactory;
    CredentialCheck _check;
    const bool _trace;
    SessionRequestSender _sender;
    std::thread _thread;
};

    }
}
