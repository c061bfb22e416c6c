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
#include <vector>

#include "VoiceCrypto.h"

struct pollfd;

namespace kc1fsz {

class Log;
class Clock;

    namespace vrelay {

/**
 * A text websocket. Implementations must not block.
 */
class GatewaySocket {
public:

    virtual ~GatewaySocket() { }

    /**
     * @returns The number of pollfds used, or -1 if there was not enough
     * room.
     */
    virtual int getPolls(pollfd* fds, unsigned fdsCapacity) = 0;

    /**
     * @returns 0 on success, -1 if the socket is broken.
     */
    virtual int sendText(const std::string& text) = 0;

    /**
     * @returns 1 if a text frame was received, 0 if nothing is waiting, 
     * -1 if the socket has closed.
     */
    virtual int receiveText(std::string& text) = 0;

    virtual void close() = 0;
};

class GatewaySocketFactory {
public:

    virtual ~GatewaySocketFactory() { }

    /**
     * @param url A wss:// URL.
     * @returns The connecting socket, or null on immediate failure.
     */
    virtual std::unique_ptr<GatewaySocket> open(const std::string& url) = 0;
};

/**
 * A message from the voice gateway, or a change in the state of the
 * gateway connection.
 */
struct GatewayEvent {

    enum class Type {
        NONE,
        READY,
        SESSION_DESCRIPTION,
        SPEAKING,
        CLIENT_CONNECT,
        CLIENT_DISCONNECT,
        // Only seen inside of the gateway
        HELLO,
        HEARTBEAT_ACK,
        // A message that could not be understood
        UNKNOWN,
        // The server sent something it should never send
        UNEXPECTED,
        CLOSED
    };

    Type type = Type::NONE;

    // READY, SPEAKING and CLIENT_CONNECT (the audio ssrc)
    uint32_t ssrc = 0;
    // READY
    std::string ip;
    uint16_t port = 0;
    std::vector<std::string> modes;
    // SESSION_DESCRIPTION
    std::string mode;
    std::vector<uint8_t> secretKey;
    // SPEAKING, CLIENT_CONNECT and CLIENT_DISCONNECT
    bool hasUserId = false;
    uint64_t userId = 0;
    // SPEAKING
    uint32_t speaking = 0;
    uint32_t delay = 0;
    // HELLO
    uint32_t heartbeatIntervalMs = 0;
    // UNEXPECTED
    int op = -1;
};

/**
 * Client side of the voice gateway JSON protocol.
 *
 * Heartbeats are sent on the interval requested by the server's hello. 
 * Everything is driven from nextEvent() which must be called regularly
 * by the owning task.
 */
class VoiceGateway {
public:

    enum Opcode {
        OP_IDENTIFY = 0,
        OP_SELECT_PROTOCOL = 1,
        OP_READY = 2,
        OP_HEARTBEAT = 3,
        OP_SESSION_DESCRIPTION = 4,
        OP_SPEAKING = 5,
        OP_HEARTBEAT_ACK = 6,
        OP_RESUME = 7,
        OP_HELLO = 8,
        OP_RESUMED = 9,
        OP_CLIENT_CONNECT = 12,
        OP_CLIENT_DISCONNECT = 13
    };

    static const uint32_t SPEAKING_MICROPHONE = 1;

    VoiceGateway(Log& log, Clock& clock, GatewaySocketFactory& factory);
    ~VoiceGateway();

    VoiceGateway(const VoiceGateway&) = delete;
    VoiceGateway& operator=(const VoiceGateway&) = delete;

    /**
     * Opens wss://<endpoint>/?v=4.
     */
    int start(const std::string& endpoint);

    int sendIdentify(uint64_t serverId, uint64_t userId, const std::string& sessionId,
        const std::string& token);

    int sendSelectProtocol(const char* addr, uint16_t port, EncryptionMode mode);

    int sendSpeaking(uint32_t speaking, uint32_t delay, uint32_t ssrc);

    void close();

    bool isClosed() const { return _closed; }

    int getPolls(pollfd* fds, unsigned fdsCapacity);

    /**
     * Services the heartbeat and reads at most one message.
     *
     * @returns true if an event was produced for the caller. Hello, 
     * heartbeat acknowledgements and unparsable messages are consumed
     * internally. A CLOSED event is produced once.
     */
    bool nextEvent(GatewayEvent& ev);

    /**
     * Converts a text message from the server into an event.
     */
    static void parseMessage(const std::string& text, GatewayEvent& ev);

    static std::string makeIdentify(uint64_t serverId, uint64_t userId, 
        const std::string& sessionId, const std::string& token);
    static std::string makeSelectProtocol(const char* addr, uint16_t port, 
        EncryptionMode mode);
    static std::string makeSpeaking(uint32_t speaking, uint32_t delay, uint32_t ssrc);
    static std::string makeHeartbeat(uint64_t nonce);

private:

    int _send(const std::string& text);

    Log& _log;
    Clock& _clock;
    GatewaySocketFactory& _factory;
    std::unique_ptr<GatewaySocket> _socket;
    bool _closed = false;
    bool _closeReported = false;
    uint32_t _heartbeatIntervalMs;
    uint32_t _nextHeartbeatMs = 0;
};

    }
}
