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
#include "kc1fsz-tools/Common.h"

#include "RtpUtil.h"

namespace kc1fsz {
    namespace vrelay {

PacketKind demuxPacket(const uint8_t* buf, unsigned len, unsigned& headerLen) {
    if (len < 2)
        return PacketKind::TOO_SMALL;
    uint8_t pt = buf[1];
    if (pt >= 192 && pt <= 223) {
        if (len < RTCP_HEADER_LEN)
            return PacketKind::FAILED_PARSE;
        headerLen = RTCP_HEADER_LEN;
        return PacketKind::RTCP;
    }
    if (len < RTP_HEADER_LEN)
        return PacketKind::FAILED_PARSE;
    if ((buf[0] >> 6) != RTP_VERSION)
        return PacketKind::FAILED_PARSE;
    // Account for contributing sources
    unsigned csrcCount = buf[0] & 0x0f;
    headerLen = RTP_HEADER_LEN + 4 * csrcCount;
    if (len < headerLen)
        return PacketKind::FAILED_PARSE;
    return PacketKind::RTP;
}

void writeRtpHeader(uint8_t* buf, uint16_t seq, uint32_t ts, uint32_t ssrc) {
    buf[0] = RTP_VERSION << 6;
    buf[1] = RTP_PAYLOAD_TYPE;
    pack_uint16_be(seq, buf + 2);
    pack_uint32_be(ts, buf + 4);
    pack_uint32_be(ssrc, buf + 8);
}

uint16_t rtpSequence(const uint8_t* buf) {
    return unpack_uint16_be(buf + 2);
}

uint32_t rtpTimestamp(const uint8_t* buf) {
    return unpack_uint32_be(buf + 4);
}

uint32_t rtpSsrc(const uint8_t* buf) {
    return unpack_uint32_be(buf + 8);
}

bool skipOverExtensions(const uint8_t* buf, unsigned start, unsigned end, 
    unsigned& newStart) {
    if (end <= start)
        return false;
    if (end < start + 2 || unpack_uint16_be(buf + start) != EXTENSION_MAGIC) {
        newStart = start;
        return true;
    }
    if (end < start + 4)
        return false;
    unsigned entries = unpack_uint16_be(buf + start + 2);
    unsigned skip = 4 + 4 * entries;
    if (end - start < skip)
        return false;
    newStart = start + skip;
    return true;
}

    }
}
