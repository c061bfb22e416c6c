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

namespace kc1fsz {
    namespace vrelay {

// The voice service runs at 48kHz
static const unsigned SAMPLE_RATE = 48000;
// 20ms of audio at 48kHz, the usual telephony frame size
static const unsigned NUM_SAMPLES = 960;
static const unsigned FRAME_MS = 20;

static const uint8_t RTP_VERSION = 2;
static const uint8_t RTP_PAYLOAD_TYPE = 0x78;
static const unsigned RTP_HEADER_LEN = 12;
static const unsigned RTCP_HEADER_LEN = 8;

static const unsigned MAX_RTP_PACKET_SIZE = 1450;
static const unsigned MAX_OPUS_PAYLOAD_SIZE = MAX_RTP_PACKET_SIZE - RTP_HEADER_LEN - 16 - 24;
// Receive/send buffer size for voice datagrams
static const unsigned VOICE_PACKET_MAX = 1460;

static const uint16_t EXTENSION_MAGIC = 0xBEDE;

enum class PacketKind {
    RTP,
    RTCP,
    // Not enough bytes to tell
    TOO_SMALL,
    FAILED_PARSE
};

/**
 * Decides whether a datagram from the voice server is RTP or RTCP
 * based on the payload type byte. RTCP packet types are 192-223.
 *
 * @param headerLen Set to the length of the clear-text header.
 */
PacketKind demuxPacket(const uint8_t* buf, unsigned len, unsigned& headerLen);

/**
 * Writes a 12-byte RTP header with no CSRCs or extensions.
 */
void writeRtpHeader(uint8_t* buf, uint16_t seq, uint32_t ts, uint32_t ssrc);

uint16_t rtpSequence(const uint8_t* buf);
uint32_t rtpTimestamp(const uint8_t* buf);
uint32_t rtpSsrc(const uint8_t* buf);

/**
 * The voice server prefixes decrypted payloads with a one-byte header
 * extension block: 0xBEDE, a 16-bit count, then four bytes per entry.
 * This is not quite RFC 8285.
 *
 * @param newStart Set to the offset of the opus data. Unchanged input
 * when there is no extension block.
 * @returns false if the range is too short to hold the extension block
 * that it claims to have.
 */
bool skipOverExtensions(const uint8_t* buf, unsigned start, unsigned end, 
    unsigned& newStart);

    }
}
