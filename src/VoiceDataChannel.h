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
#include <vector>

#include "VoiceCrypto.h"
#include "RtpUtil.h"

namespace kc1fsz {

class Log;

    namespace vrelay {

/**
 * A datagram received from the voice server after decryption.
 */
struct VoicePacket {

    enum class Kind { RTP, RTCP };

    Kind kind = Kind::RTP;
    uint16_t sequence = 0;
    uint32_t timestamp = 0;
    uint32_t ssrc = 0;
    // For RTP the decrypted payload is buffer[dataStart, dataEnd). For
    // RTCP the whole buffer is the decrypted packet with the tag and
    // any nonce suffix removed.
    std::vector<uint8_t> buffer;
    unsigned dataStart = 0;
    unsigned dataEnd = 0;
};

/**
 * The UDP media socket to the voice server.
 *
 * Nothing can be sent or received until setKey() has been called with
 * the secret from the session description.
 */
class VoiceDataChannel {
public:

    static const unsigned DISCOVERY_PACKET_LEN = 74;
    static const unsigned DISCOVERY_ADDR_LEN = 64;

    VoiceDataChannel(Log& log);
    ~VoiceDataChannel();

    VoiceDataChannel(const VoiceDataChannel&) = delete;
    VoiceDataChannel& operator=(const VoiceDataChannel&) = delete;

    /**
     * Opens a non-blocking socket to the voice server and sends the first
     * IP discovery request. The answer is collected by pollDiscovery()
     * once the socket becomes readable.
     *
     * @returns 0 on success, negative on failure.
     */
    int open(const char* addr, uint16_t port, uint32_t ssrc);

    /**
     * Sends the discovery request again. Used when the first one seems
     * to have been lost.
     */
    int sendDiscoveryRequest();

    /**
     * Reads the discovery response without blocking. Once it returns 1
     * the public address/port are available.
     *
     * @returns 1 when discovery is complete, 0 if nothing has arrived
     * yet, or negative if the socket failed or the response was illegal.
     */
    int pollDiscovery();

    bool isDiscovered() const { return _discovered; }

    void close();

    /**
     * @returns The (non-blocking) socket, or -1 if not connected.
     */
    int getFd() const { return _fd; }

    const char* getPublicAddr() const { return _publicAddr; }
    uint16_t getPublicPort() const { return _publicPort; }
    uint32_t getSsrc() const { return _ssrc; }
    bool hasKey() const { return static_cast<bool>(_encrypt); }

    /**
     * Installs fresh encryption and decryption state, replacing anything
     * that was there before.
     *
     * @returns false if the key is the wrong length.
     */
    bool setKey(EncryptionMode mode, const uint8_t* key, unsigned keyLen);

    /**
     * Frames, encrypts and sends one opus payload.
     *
     * @returns The number of bytes put on the wire, or negative on failure.
     */
    int sendVoice(uint32_t timestamp, const uint8_t* payload, unsigned payloadLen);

    /**
     * Reads one datagram without blocking.
     *
     * @returns 1 if a packet was produced, 0 if nothing was waiting, or
     * negative if a datagram was read but could not be used. A failure
     * does not affect later packets.
     */
    int receivePacket(VoicePacket& packet);

    /**
     * Builds the 74-byte discovery request.
     */
    static void makeDiscoveryRequest(uint32_t ssrc, uint8_t* buf);

    /**
     * @returns 0 on success, negative if the response is unusable.
     */
    static int parseDiscoveryResponse(const uint8_t* buf, unsigned len, 
        char* addr, unsigned addrLen, uint16_t& port);

    /**
     * Builds the response that a server would send. Used for testing.
     */
    static void makeDiscoveryResponse(uint32_t ssrc, const char* addr, uint16_t port, 
        uint8_t* buf);

private:

    int _decodePacket(uint8_t* buf, unsigned len, VoicePacket& packet);

    Log& _log;
    int _fd = -1;
    uint32_t _ssrc = 0;
    uint16_t _seq = 0;
    char _publicAddr[DISCOVERY_ADDR_LEN];
    uint16_t _publicPort = 0;
    bool _discovered = false;
    std::unique_ptr<VoiceEncryption> _encrypt;
    std::unique_ptr<VoiceDecryption> _decrypt;
    uint8_t _sendBuf[VOICE_PACKET_MAX];
};

    }
}
