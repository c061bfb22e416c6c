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
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

#include <cstring>

#include <sodium.h>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Common.h"
#include "kc1fsz-tools/NetUtils.h"
#include "kc1fsz-tools/raiiholder.h"

#include "VoiceDataChannel.h"

using namespace std;

namespace kc1fsz {
    namespace vrelay {

static const uint16_t DISCOVERY_REQUEST = 1;
static const uint16_t DISCOVERY_RESPONSE = 2;
// Length of everything after the type and length fields
static const uint16_t DISCOVERY_BODY_LEN = 70;

void VoiceDataChannel::makeDiscoveryRequest(uint32_t ssrc, uint8_t* buf) {
    memset(buf, 0, DISCOVERY_PACKET_LEN);
    pack_uint16_be(DISCOVERY_REQUEST, buf);
    pack_uint16_be(DISCOVERY_BODY_LEN, buf + 2);
    pack_uint32_be(ssrc, buf + 4);
}

void VoiceDataChannel::makeDiscoveryResponse(uint32_t ssrc, const char* addr, 
    uint16_t port, uint8_t* buf) {
    memset(buf, 0, DISCOVERY_PACKET_LEN);
    pack_uint16_be(DISCOVERY_RESPONSE, buf);
    pack_uint16_be(DISCOVERY_BODY_LEN, buf + 2);
    pack_uint32_be(ssrc, buf + 4);
    strcpyLimited(reinterpret_cast<char*>(buf) + 8, addr, DISCOVERY_ADDR_LEN);
    pack_uint16_be(port, buf + 8 + DISCOVERY_ADDR_LEN);
}

int VoiceDataChannel::parseDiscoveryResponse(const uint8_t* buf, unsigned len, 
    char* addr, unsigned addrLen, uint16_t& port) {

    if (len < DISCOVERY_PACKET_LEN)
        return -1;
    if (unpack_uint16_be(buf) != DISCOVERY_RESPONSE)
        return -2;

    // The public address is NUL-terminated within its field
    const char* field = reinterpret_cast<const char*>(buf) + 8;
    const void* nul = memchr(field, 0, DISCOVERY_ADDR_LEN);
    if (nul == 0)
        return -3;
    unsigned fieldLen = static_cast<const char*>(nul) - field;
    if (fieldLen + 1 > addrLen)
        return -3;
    memcpy(addr, field, fieldLen);
    addr[fieldLen] = 0;

    // Make sure it's a real address
    uint8_t scratch[sizeof(in6_addr)];
    if (inet_pton(AF_INET, addr, scratch) != 1 &&
        inet_pton(AF_INET6, addr, scratch) != 1)
        return -4;

    port = unpack_uint16_be(buf + 8 + DISCOVERY_ADDR_LEN);
    return 0;
}

VoiceDataChannel::VoiceDataChannel(Log& log) 
:   _log(log) {
    _publicAddr[0] = 0;
}

VoiceDataChannel::~VoiceDataChannel() {
    close();
}

void VoiceDataChannel::close() {
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
    _discovered = false;
    _encrypt.reset();
    _decrypt.reset();
}

int VoiceDataChannel::open(const char* addr, uint16_t port, uint32_t ssrc) {

    close();

    // TODO: IPv6 voice servers
    int sockFd = socket(AF_INET, SOCK_DGRAM, 0);
    if (sockFd < 0) {
        _log.error("Unable to open voice socket (%d)", errno);
        return -1;
    }
    // Setup a holder so we are sure to close the socket on failure
    raiiholder<int> fdHolder(&sockFd, [](int* fdp) { 
        if (*fdp >= 0) 
            ::close(*fdp); 
    });

    struct sockaddr_in localAddr;
    memset(&localAddr, 0, sizeof(localAddr));
    localAddr.sin_family = AF_INET;
    localAddr.sin_addr.s_addr = INADDR_ANY;
    localAddr.sin_port = htons(0);
    if (::bind(sockFd, reinterpret_cast<const sockaddr*>(&localAddr), 
        sizeof(localAddr)) < 0) {
        _log.error("Unable to bind voice socket (%d)", errno);
        return -2;
    }

    struct sockaddr_storage peerAddr;
    memset(&peerAddr, 0, sizeof(peerAddr));
    peerAddr.ss_family = AF_INET;
    setIPAddr(peerAddr, addr);
    setIPPort(peerAddr, port);
    const sockaddr* peer = reinterpret_cast<const sockaddr*>(&peerAddr);
    if (::connect(sockFd, peer, getIPAddrSize(*peer)) < 0) {
        _log.error("Unable to connect voice socket to %s:%d (%d)", addr, (int)port, errno);
        return -3;
    }

    // Everything from here on is serviced by the event loop
    int flags = fcntl(sockFd, F_GETFL, 0);
    if (flags < 0 || fcntl(sockFd, F_SETFL, flags | O_NONBLOCK) < 0) {
        _log.error("Unable to make voice socket non-blocking (%d)", errno);
        return -4;
    }

    _publicAddr[0] = 0;
    _publicPort = 0;
    _discovered = false;
    _ssrc = ssrc;
    _seq = randombytes_random() & 0xffff;
    // Ownership moves out of the holder
    _fd = sockFd;
    sockFd = -1;

    // Follow the IP discovery procedure in case NAT traversal is needed
    if (sendDiscoveryRequest() < 0) {
        close();
        return -5;
    }

    _log.info("Voice channel to %s:%d opened, discovering public address", 
        addr, (int)port);

    return 0;
}

int VoiceDataChannel::sendDiscoveryRequest() {
    if (_fd < 0)
        return -1;
    uint8_t buf[DISCOVERY_PACKET_LEN];
    makeDiscoveryRequest(_ssrc, buf);
    int rc = ::send(_fd, buf, DISCOVERY_PACKET_LEN, 0);
    if (rc != static_cast<int>(DISCOVERY_PACKET_LEN)) {
        _log.error("Unable to send discovery request (%d)", errno);
        return -2;
    }
    return 0;
}

int VoiceDataChannel::pollDiscovery() {

    if (_discovered)
        return 1;
    if (_fd < 0)
        return -1;

    uint8_t buf[VOICE_PACKET_MAX];
    int rc = ::recv(_fd, buf, sizeof(buf), 0);
    if (rc < 0) {
        if (errno == EWOULDBLOCK || errno == EAGAIN) 
            return 0;
        _log.error("Discovery receive failed (%d)", errno);
        return -2;
    }

    char publicAddr[DISCOVERY_ADDR_LEN];
    uint16_t publicPort = 0;
    int rc2 = parseDiscoveryResponse(buf, rc, publicAddr, sizeof(publicAddr), publicPort);
    if (rc2 < 0) {
        _log.error("Illegal discovery response (%d)", rc2);
        return -3;
    }

    strcpyLimited(_publicAddr, publicAddr, sizeof(_publicAddr));
    _publicPort = publicPort;
    _discovered = true;

    _log.info("Voice channel ready, public address is %s:%d", 
        _publicAddr, (int)_publicPort);

    return 1;
}

bool VoiceDataChannel::setKey(EncryptionMode mode, const uint8_t* key, unsigned keyLen) {
    if (keyLen != VoiceEncryption::KEY_LEN) {
        _log.error("Invalid key length %u", keyLen);
        return false;
    }
    _encrypt.reset(new VoiceEncryption(mode, key));
    _decrypt.reset(new VoiceDecryption(mode, key));
    return true;
}

int VoiceDataChannel::sendVoice(uint32_t timestamp, const uint8_t* payload, 
    unsigned payloadLen) {

    uint16_t seq = _seq++;

    if (!_encrypt)
        return -1;
    if (_fd < 0)
        return -2;

    if (RTP_HEADER_LEN + VoiceEncryption::TAG_LEN + payloadLen > VOICE_PACKET_MAX)
        return -3;

    writeRtpHeader(_sendBuf, seq, timestamp, _ssrc);
    memcpy(_sendBuf + RTP_HEADER_LEN + VoiceEncryption::TAG_LEN, payload, payloadLen);

    int size = _encrypt->encryptPacket(_sendBuf, VOICE_PACKET_MAX, payloadLen);
    if (size < 0)
        return -4;

    int rc = ::send(_fd, _sendBuf, size, 0);
    if (rc != size) {
        _log.error("Voice send failed (%d)", errno);
        return -5;
    }
    return size;
}

int VoiceDataChannel::receivePacket(VoicePacket& packet) {

    if (_fd < 0)
        return 0;

    uint8_t buf[VOICE_PACKET_MAX];
    int rc = ::recv(_fd, buf, sizeof(buf), 0);
    if (rc < 0) {
        if (errno == EWOULDBLOCK || errno == EAGAIN) 
            return 0;
        _log.error("Voice receive failed (%d)", errno);
        return -1;
    }

    if (!_decrypt) {
        _log.info("Received packet before crypto was set up");
        return -2;
    }

    return _decodePacket(buf, rc, packet);
}

int VoiceDataChannel::_decodePacket(uint8_t* buf, unsigned len, VoicePacket& packet) {

    unsigned headerLen = 0;
    PacketKind kind = demuxPacket(buf, len, headerLen);
    if (kind == PacketKind::TOO_SMALL) {
        _log.info("Illegal UDP packet from voice server");
        return -3;
    } else if (kind == PacketKind::FAILED_PARSE) {
        _log.info("Failed to parse packet from voice server");
        return -4;
    }

    unsigned bodyStart, bodyEnd;
    int rc = _decrypt->decryptPacket(buf, len, headerLen, bodyStart, bodyEnd);
    if (rc < 0) {
        _log.info("Could not decrypt packet (%d)", rc);
        return -5;
    }

    if (kind == PacketKind::RTP) {
        packet.kind = VoicePacket::Kind::RTP;
        packet.sequence = rtpSequence(buf);
        packet.timestamp = rtpTimestamp(buf);
        packet.ssrc = rtpSsrc(buf);
        packet.buffer.assign(buf, buf + len);
        packet.dataStart = bodyStart;
        packet.dataEnd = bodyEnd;
    } 
    else {
        // Strip the tag and any suffix, leaving header + body
        packet.kind = VoicePacket::Kind::RTCP;
        packet.sequence = 0;
        packet.timestamp = 0;
        packet.ssrc = 0;
        packet.buffer.assign(buf, buf + headerLen);
        packet.buffer.insert(packet.buffer.end(), buf + bodyStart, buf + bodyEnd);
        packet.dataStart = 0;
        packet.dataEnd = packet.buffer.size();
    }
    return 1;
}

    }
}
