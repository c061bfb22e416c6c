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

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "vrelay/NotificationQueue.h"

#include "Runnable2.h"

namespace kc1fsz {

class Log;

    namespace vrelay {

/**
 * A voice-related event from the main (text) gateway of the voice-chat
 * service.
 */
struct SessionEvent {

    enum class Type { OTHER, VOICE_STATE_UPDATE, VOICE_SERVER_UPDATE };

    Type type = Type::OTHER;

    bool hasGuildId = false;
    uint64_t guildId = 0;

    // VOICE_STATE_UPDATE
    uint64_t userId = 0;
    bool hasChannelId = false;
    uint64_t channelId = 0;
    std::string sessionId;

    // VOICE_SERVER_UPDATE
    std::string token;
    bool hasEndpoint = false;
    std::string endpoint;
};

typedef NotificationQueue<SessionEvent> SessionEventQueue;

/**
 * The shard connection to the main gateway. Implementations must not
 * block.
 */
class SessionTransport {
public:

    virtual ~SessionTransport() { }

    virtual int getPolls(pollfd* fds, unsigned fdsCapacity) = 0;

    /**
     * @returns true if an event was produced.
     */
    virtual bool nextEvent(SessionEvent& ev) = 0;

    /**
     * Queues a gateway command (a complete JSON message).
     * @returns 0 on success.
     */
    virtual int send(const std::string& text) = 0;
};

class SessionTransportFactory {
public:

    virtual ~SessionTransportFactory() { }

    /**
     * @returns The connecting transport, or null on failure.
     */
    virtual std::unique_ptr<SessionTransport> open(const std::string& token) = 0;
};

/**
 * The logged-in session. Forwards voice events from the main gateway to
 * whichever call currently owns the server (guild) they are about.
 */
class Session : public Runnable2 {
public:

    static const unsigned ROUTE_CAPACITY = 32;

    Session(Log& log, SessionTransport& transport, uint64_t botUser);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    uint64_t getBotUser() const { return _botUser; }

    SessionTransport& getTransport() { return _transport; }

    /**
     * Claims the events of one server. A previous claim only counts if
     * its receiver is still alive.
     *
     * @returns false (and leaves receiver untouched) if another live
     * listener already holds the server.
     */
    bool exclusiveServerEvents(uint64_t guildId, SessionEventQueue::Receiver& receiver);

    /**
     * @returns true if a live listener holds the server.
     */
    bool isClaimed(uint64_t guildId);

    /**
     * Tells the gateway that the bot is joining a voice channel.
     * @returns 0 on success.
     */
    int sendJoin(uint64_t guildId, uint64_t channelId);

    /**
     * Tells the gateway that the bot is leaving voice on the server.
     * @returns 0 on success.
     */
    int sendLeave(uint64_t guildId);

    /**
     * Stops forwarding. Safe to call from any thread.
     */
    void cancel() { _cancelled.store(true); }

    bool isCancelled() const { return _cancelled.load(); }

    static std::string makeVoiceStateUpdate(uint64_t guildId, bool join,
        uint64_t channelId);

    // ----- Runnable2 ---------------------------------------------------

    int getPolls(pollfd* fds, unsigned fdsCapacity) override;
    bool run2() override;

private:

    void _route(SessionEvent& ev);

    Log& _log;
    SessionTransport& _transport;
    const uint64_t _botUser;
    std::atomic<bool> _cancelled;
    std::map<uint64_t, SessionEventQueue::Sender> _routes;
};

    }
}
