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
#include <cstring>
#include <stdexcept>

#include <sodium.h>
#include <nlohmann/json.hpp>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"

#include "VoiceGateway.h"

using namespace std;
using json = nlohmann::json;

namespace kc1fsz {
    namespace vrelay {

// Effectively never, until the server says hello
static const uint32_t INITIAL_HEARTBEAT_MS = 36000000;

/**
 * Snowflake ids may be sent as strings or as numbers.
 */
static uint64_t getId(const json& j) {
    if (j.is_string())
        return std::stoull(j.get<std::string>());
    return j.get<uint64_t>();
}

VoiceGateway::VoiceGateway(Log& log, Clock& clock, GatewaySocketFactory& factory)
:   _log(log),
    _clock(clock),
    _factory(factory),
    _heartbeatIntervalMs(INITIAL_HEARTBEAT_MS) {
}

VoiceGateway::~VoiceGateway() {
    close();
}

int VoiceGateway::start(const std::string& endpoint) {
    string url = "wss://" + endpoint + "/?v=4";
    _log.info("Connecting to voice gateway at %s", url.c_str());
    _socket = _factory.open(url);
    if (!_socket) {
        _log.error("Could not connect to voice gateway");
        _closed = true;
        return -1;
    }
    _closed = false;
    _closeReported = false;
    _heartbeatIntervalMs = INITIAL_HEARTBEAT_MS;
    _nextHeartbeatMs = _clock.time() + _heartbeatIntervalMs;
    return 0;
}

void VoiceGateway::close() {
    if (_socket) {
        _socket->close();
        _socket.reset();
    }
    _closed = true;
}

int VoiceGateway::getPolls(pollfd* fds, unsigned fdsCapacity) {
    if (!_socket)
        return 0;
    return _socket->getPolls(fds, fdsCapacity);
}

int VoiceGateway::_send(const std::string& text) {
    if (!_socket || _closed)
        return -1;
    if (_socket->sendText(text) < 0) {
        _log.error("Voice gateway send failed");
        _closed = true;
        return -1;
    }
    return 0;
}

string VoiceGateway::makeIdentify(uint64_t serverId, uint64_t userId, 
    const std::string& sessionId, const std::string& token) {
    json o;
    o["op"] = OP_IDENTIFY;
    o["d"]["server_id"] = std::to_string(serverId);
    o["d"]["user_id"] = std::to_string(userId);
    o["d"]["session_id"] = sessionId;
    o["d"]["token"] = token;
    return o.dump();
}

string VoiceGateway::makeSelectProtocol(const char* addr, uint16_t port, 
    EncryptionMode mode) {
    json o;
    o["op"] = OP_SELECT_PROTOCOL;
    o["d"]["protocol"] = "udp";
    o["d"]["data"]["address"] = addr;
    o["d"]["data"]["port"] = port;
    o["d"]["data"]["mode"] = encryptionModeName(mode);
    return o.dump();
}

string VoiceGateway::makeSpeaking(uint32_t speaking, uint32_t delay, uint32_t ssrc) {
    json o;
    o["op"] = OP_SPEAKING;
    o["d"]["speaking"] = speaking;
    o["d"]["delay"] = delay;
    o["d"]["ssrc"] = ssrc;
    return o.dump();
}

string VoiceGateway::makeHeartbeat(uint64_t nonce) {
    json o;
    o["op"] = OP_HEARTBEAT;
    o["d"] = nonce;
    return o.dump();
}

int VoiceGateway::sendIdentify(uint64_t serverId, uint64_t userId, 
    const std::string& sessionId, const std::string& token) {
    return _send(makeIdentify(serverId, userId, sessionId, token));
}

int VoiceGateway::sendSelectProtocol(const char* addr, uint16_t port, EncryptionMode mode) {
    return _send(makeSelectProtocol(addr, port, mode));
}

int VoiceGateway::sendSpeaking(uint32_t speaking, uint32_t delay, uint32_t ssrc) {
    return _send(makeSpeaking(speaking, delay, ssrc));
}

void VoiceGateway::parseMessage(const std::string& text, GatewayEvent& ev) {

    ev = GatewayEvent();
    ev.type = GatewayEvent::Type::UNKNOWN;

    try {
        json o = json::parse(text);
        int op = o.at("op").get<int>();

        if (op == OP_READY) {
            const json& d = o.at("d");
            ev.ssrc = d.at("ssrc").get<uint32_t>();
            ev.ip = d.at("ip").get<std::string>();
            ev.port = d.at("port").get<uint16_t>();
            for (const auto& m : d.at("modes"))
                ev.modes.push_back(m.get<std::string>());
            ev.type = GatewayEvent::Type::READY;
        }
        else if (op == OP_SESSION_DESCRIPTION) {
            const json& d = o.at("d");
            ev.mode = d.at("mode").get<std::string>();
            for (const auto& b : d.at("secret_key"))
                ev.secretKey.push_back(b.get<uint8_t>());
            ev.type = GatewayEvent::Type::SESSION_DESCRIPTION;
        }
        else if (op == OP_SPEAKING) {
            const json& d = o.at("d");
            ev.ssrc = d.at("ssrc").get<uint32_t>();
            ev.speaking = d.at("speaking").get<uint32_t>();
            if (d.contains("delay") && !d.at("delay").is_null())
                ev.delay = d.at("delay").get<uint32_t>();
            if (d.contains("user_id") && !d.at("user_id").is_null()) {
                ev.userId = getId(d.at("user_id"));
                ev.hasUserId = true;
            }
            ev.type = GatewayEvent::Type::SPEAKING;
        }
        else if (op == OP_CLIENT_CONNECT) {
            const json& d = o.at("d");
            ev.userId = getId(d.at("user_id"));
            ev.hasUserId = true;
            ev.ssrc = d.at("audio_ssrc").get<uint32_t>();
            ev.type = GatewayEvent::Type::CLIENT_CONNECT;
        }
        else if (op == OP_CLIENT_DISCONNECT) {
            const json& d = o.at("d");
            ev.userId = getId(d.at("user_id"));
            ev.hasUserId = true;
            ev.type = GatewayEvent::Type::CLIENT_DISCONNECT;
        }
        else if (op == OP_HELLO) {
            const json& d = o.at("d");
            ev.heartbeatIntervalMs = static_cast<uint32_t>(d.at("heartbeat_interval").get<double>());
            ev.type = GatewayEvent::Type::HELLO;
        }
        else if (op == OP_HEARTBEAT_ACK) {
            ev.type = GatewayEvent::Type::HEARTBEAT_ACK;
        }
        else if (op == OP_IDENTIFY || op == OP_SELECT_PROTOCOL || op == OP_HEARTBEAT ||
                 op == OP_RESUME || op == OP_RESUMED) {
            ev.op = op;
            ev.type = GatewayEvent::Type::UNEXPECTED;
        }
    } 
    catch (const json::exception&) {
        ev = GatewayEvent();
        ev.type = GatewayEvent::Type::UNKNOWN;
    }
    catch (const std::logic_error&) {
        // Bad numeric id
        ev = GatewayEvent();
        ev.type = GatewayEvent::Type::UNKNOWN;
    }
}

bool VoiceGateway::nextEvent(GatewayEvent& ev) {

    if (_closed) {
        if (_closeReported)
            return false;
        _closeReported = true;
        ev = GatewayEvent();
        ev.type = GatewayEvent::Type::CLOSED;
        return true;
    }

    // Heartbeat
    if ((int32_t)(_clock.time() - _nextHeartbeatMs) >= 0) {
        uint64_t nonce;
        randombytes_buf(&nonce, sizeof(nonce));
        _send(makeHeartbeat(nonce));
        _nextHeartbeatMs = _clock.time() + _heartbeatIntervalMs;
        // A failed send is reported on the next call
        if (_closed)
            return nextEvent(ev);
    }

    while (true) {
        string text;
        int rc = _socket->receiveText(text);
        if (rc == 0)
            return false;
        if (rc < 0) {
            _log.info("Voice gateway closed");
            _closed = true;
            return nextEvent(ev);
        }

        parseMessage(text, ev);

        if (ev.type == GatewayEvent::Type::HELLO) {
            if (ev.heartbeatIntervalMs > 0)
                _heartbeatIntervalMs = ev.heartbeatIntervalMs;
            _nextHeartbeatMs = _clock.time() + _heartbeatIntervalMs;
            _log.info("Voice gateway heartbeat interval %u ms", _heartbeatIntervalMs);
        }
        else if (ev.type == GatewayEvent::Type::HEARTBEAT_ACK) {
        }
        else if (ev.type == GatewayEvent::Type::UNKNOWN) {
            _log.info("Unknown message on voice gateway");
        }
        else {
            return true;
        }
    }
}

    }
}
