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
#include <string>
#include <variant>
#include <vector>

#include "vrelay/NotificationQueue.h"
#include "vrelay/RequestChannel.h"

#include "Error.h"
#include "Runnable2.h"
#include "Session.h"
#include "VoiceDataChannel.h"
#include "VoiceGateway.h"

namespace kc1fsz {

class Log;
class Clock;

    namespace vrelay {

/**
 * One encoded frame on its way to the voice server.
 */
struct OutgoingVoicePacket {
    std::vector<uint8_t> payload;
    // RTP timestamp (48kHz units)
    uint32_t timestamp = 0;
};

struct VoiceTaskRequest {
    enum class Type { WRITE, CLOSE };
    Type type = Type::CLOSE;
    OutgoingVoicePacket packet;
};

/**
 * Notifications produced by a voice task for its owner.
 */
struct VoiceEvent {

    enum class Type { PACKET, USER_JOINED, SPEAKING, USER_LEFT, FULLY_CONNECTED, CLOSED };

    Type type = Type::CLOSED;
    VoicePacket packet;
    uint64_t userId = 0;
    uint32_t ssrc = 0;
};

typedef NotificationQueue<VoiceEvent> VoiceEventQueue;
typedef RequestSender<VoiceTaskRequest, Result> VoiceTaskSender;
typedef RequestReceiver<VoiceTaskRequest, Result> VoiceTaskReceiver;

/**
 * Runs the voice connection for one call: waits for the session and 
 * server information from the main gateway, then drives the voice 
 * gateway and the UDP media channel.
 *
 * Lives on the worker event loop. Once finished it does nothing more
 * and its owner can destroy it.
 */
class VoiceTask : public Runnable2 {
public:

    static const unsigned EVENT_CAPACITY = 32;
    // IP discovery is abandoned if no answer arrives in this time
    static const uint32_t DISCOVERY_TIMEOUT_MS = 5000;
    static const uint32_t DISCOVERY_RETRY_MS = 1000;

    VoiceTask(Log& log, Clock& clock, Session& session, GatewaySocketFactory& factory,
        SessionEventQueue::Receiver&& sessionEvents, VoiceTaskReceiver&& requests,
        VoiceEventQueue::Sender&& events, uint64_t guildId, uint64_t channelId);
    ~VoiceTask();

    VoiceTask(const VoiceTask&) = delete;
    VoiceTask& operator=(const VoiceTask&) = delete;

    /**
     * Announces the join to the main gateway. If that fails a CLOSED
     * event is emitted and the task finishes immediately.
     */
    void start();

    bool isFinished() const { return _finished; }

    bool isConnected() const { return std::holds_alternative<Connected>(_state); }

    bool isDiscovering() const { return std::holds_alternative<Discovering>(_state); }

    // ----- Runnable2 ---------------------------------------------------

    int getPolls(pollfd* fds, unsigned fdsCapacity) override;
    bool run2() override;

private:

    struct ConnectInfo {
        bool hasGuildId = false;
        bool hasChannelId = false;
        bool hasSessionId = false;
        bool hasToken = false;
        bool hasEndpoint = false;
        uint64_t guildId = 0;
        uint64_t channelId = 0;
        std::string sessionId;
        std::string token;
        std::string endpoint;
        bool isComplete() const {
            return hasGuildId && hasChannelId && hasSessionId && hasToken && hasEndpoint;
        }
    };

    struct WaitingForEvents {
        ConnectInfo info;
    };

    struct WaitingForReady {
        std::unique_ptr<VoiceGateway> gateway;
    };

    // Waiting for the voice server to tell us our public address
    struct Discovering {
        std::unique_ptr<VoiceGateway> gateway;
        std::unique_ptr<VoiceDataChannel> voice;
        EncryptionMode mode = EncryptionMode::NORMAL;
        uint32_t deadlineMs = 0;
        uint32_t nextRetryMs = 0;
    };

    struct Connected {
        std::unique_ptr<VoiceGateway> gateway;
        std::unique_ptr<VoiceDataChannel> voice;
        bool hasSession = false;
    };

    void _handleRequest(VoiceTaskRequest& req, Reply<Result>& reply);
    void _handleSessionEvent(const SessionEvent& ev);
    // Returns negative on a fatal error
    int _handleGatewayEvent(const GatewayEvent& ev);
    // Returns negative on a fatal error
    int _serviceDiscovery();
    bool _receiveMedia();
    void _emit(VoiceEvent&& ev);
    void _finish();

    VoiceGateway* _gateway();

    Log& _log;
    Clock& _clock;
    Session& _session;
    GatewaySocketFactory& _factory;
    SessionEventQueue::Receiver _sessionEvents;
    VoiceTaskReceiver _requests;
    VoiceEventQueue::Sender _events;
    const uint64_t _guildId;
    const uint64_t _channelId;

    std::variant<WaitingForEvents, WaitingForReady, Discovering, Connected> _state;
    bool _closeRequested = false;
    bool _finished = false;
};

/**
 * The owner's side of a running voice task: the task itself, the 
 * request channel into it and its notifications.
 */
class VoiceTaskHandle {
public:

    VoiceTaskHandle(Log& log, Clock& clock, Session& session, GatewaySocketFactory& factory,
        SessionEventQueue::Receiver&& sessionEvents, uint64_t guildId, uint64_t channelId);

    VoiceTaskHandle(const VoiceTaskHandle&) = delete;
    VoiceTaskHandle& operator=(const VoiceTaskHandle&) = delete;

    VoiceTask& getTask() { return *_task; }

    VoiceEventQueue::Receiver& getEvents() { return _events; }

    /**
     * Non-blocking. The callback fires on the event loop thread once 
     * the task has dealt with the packet.
     */
    void write(OutgoingVoicePacket packet, VoiceTaskSender::Callback cb);

    /**
     * Asks the task to leave the channel. Non-blocking; the task is done
     * when isFinished() becomes true.
     */
    void requestClose();

    bool isFinished() const { return _task->isFinished(); }

private:

    VoiceTaskSender _sender;
    VoiceEventQueue::Receiver _events;
    std::unique_ptr<VoiceTask> _task;
};

    }
}
