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
#include <variant>

#include "vrelay/RequestChannel.h"

#include "Error.h"
#include "OpusCodec.h"
#include "Runnable2.h"
#include "RtpReceiver.h"
#include "Session.h"
#include "Telephony.h"
#include "VoiceTask.h"

namespace kc1fsz {

class Log;
class Clock;

    namespace vrelay {

class QueueThread;

struct CallRequest {
    enum class Type { JOIN_CHANNEL, HANG_UP, WRITE_FRAME, FIX_UP };
    Type type = Type::HANG_UP;
    // WRITE_FRAME
    OutgoingVoicePacket packet;
    // FIX_UP
    ChannelRef channel;
};

typedef RequestSender<CallRequest, Result> CallRequestSender;
typedef RequestReceiver<CallRequest, Result> CallRequestReceiver;

/**
 * The telephony side's grip on a call. Every operation is a blocking 
 * request to the call's worker, so these must never be called from the
 * worker event loop.
 *
 * Owned by the channel (as its tech data).
 */
class CallHandle {
public:

    CallHandle(CallRequestSender sender);

    CallHandle(const CallHandle&) = delete;
    CallHandle& operator=(const CallHandle&) = delete;

    /**
     * Parses "<guild>/<channel>" where both parts are unsigned decimal 
     * 64-bit numbers.
     */
    static bool parseDestination(const char* dest, uint64_t& guildId, uint64_t& channelId);

    bool isValid() const { return _encoder.isValid(); }

    Result startJoining();

    Result hangup();

    /**
     * Points the worker at the channel that now holds this call.
     */
    Result fixup(TelephonyChannel& channel);

    /**
     * Encodes one block of 48kHz mono audio and sends it to the voice 
     * channel.
     */
    Result writeFrame(const MediaFrame& frame);

    uint32_t getTimestamp() const { return _timestamp; }

    /**
     * Tracks a run of failed writes.
     *
     * @returns The length of the run including this failure.
     */
    unsigned noteWriteFailure() { return ++_writeFailures; }

    void noteWriteSuccess() { _writeFailures = 0; }

private:

    Result _request(CallRequest req);

    CallRequestSender _sender;
    VoiceEncoder _encoder;
    uint32_t _timestamp;
    unsigned _writeFailures;
};

/**
 * Owns everything about one call on the worker event loop: the voice task,
 * the inbound mixer and the telephony channel reference.
 */
class CallWorker : public Runnable2 {
public:

    enum class State { PREPARE, VOICE_STARTED, SHUTTING_DOWN };

    CallWorker(Log& log, Clock& clock, QueueThread& queue, Session& session,
        GatewaySocketFactory& factory, ChannelRef channel, uint64_t guildId, 
        uint64_t channelId, SessionEventQueue::Receiver&& sessionEvents,
        CallRequestReceiver&& requests);
    ~CallWorker();

    CallWorker(const CallWorker&) = delete;
    CallWorker& operator=(const CallWorker&) = delete;

    State getState() const;

    bool isFinished() const { return _finished; }

    uint64_t getGuildId() const { return _guildId; }

    TelephonyChannel* getChannel() const { return _channel.get(); }

    // ----- Runnable2 ---------------------------------------------------

    int getPolls(pollfd* fds, unsigned fdsCapacity) override;
    bool run2() override;
    void audioRateTick(uint32_t tickTimeMs) override;

private:

    struct Prepare {
        SessionEventQueue::Receiver sessionEvents;
    };

    struct VoiceStarted {
        std::unique_ptr<VoiceTaskHandle> voice;
    };

    struct ShuttingDown {
        bool hungUpLocally = false;
        // The voice task that is still on its way out
        std::unique_ptr<VoiceTaskHandle> voice;
        // Answered once the voice task has finished
        Reply<Result> reply;
    };

    VoiceTaskHandle* _voice();
    void _handleRequest(CallRequest& req, Reply<Result>& reply);
    void _handleVoiceEvent(VoiceEvent& ev);
    void _shutDown(bool hungUpLocally);
    void _drainMixer();
    void _finish(ShuttingDown& s);

    Log& _log;
    Clock& _clock;
    QueueThread& _queue;
    Session& _session;
    GatewaySocketFactory& _factory;
    ChannelRef _channel;
    const uint64_t _guildId;
    const uint64_t _channelId;
    CallRequestReceiver _requests;
    RtpReceiver _receiver;
    std::variant<Prepare, VoiceStarted, ShuttingDown> _state;
    bool _finished = false;
};

    }
}
