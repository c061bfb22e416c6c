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
#include <map>
#include <memory>
#include <vector>

#include "vrelay/JitterBuffer.h"

#include "Error.h"
#include "OpusCodec.h"
#include "Telephony.h"
#include "VoiceDataChannel.h"

namespace kc1fsz {

class Log;
class Clock;

    namespace vrelay {

/**
 * Decodes the inbound audio of every other participant in the voice 
 * channel into a per-participant jitter buffer and mixes whatever is due
 * into a single stream of 48kHz mono frames.
 *
 * Participants are keyed by ssrc and must be mapped (via a join or 
 * speaking event) before their packets are accepted.
 *
 * Not thread-safe.
 */
class RtpReceiver {
public:

    enum class FetchResult {
        // Nothing is buffered for anyone
        NONE_QUEUED,
        // Something is buffered but not due until later
        CHECK_BACK_LATER,
        // A mixed frame was produced
        PACKET_AVAILABLE
    };

    // Used until the first frame from a participant tells us otherwise
    static const int32_t ASSUMED_VOICE_MS = 20;

    RtpReceiver(Log& log, Clock& clock);

    RtpReceiver(const RtpReceiver&) = delete;
    RtpReceiver& operator=(const RtpReceiver&) = delete;

    /**
     * Creates the participant for an ssrc. Nothing happens if the ssrc is
     * already known.
     */
    Result mapUserId(uint64_t user, uint32_t ssrc);

    /**
     * Removes the user and its participant, if any.
     */
    void unmapUserId(uint64_t user);

    bool isMapped(uint32_t ssrc) const;

    unsigned getParticipantCount() const { return _participants.size(); }

    /**
     * Accepts a decrypted datagram from the voice channel. RTCP and 
     * packets from unknown senders are ignored.
     */
    void handlePacket(const VoicePacket& packet);

    /**
     * Buffers already-decoded mono audio for a participant.
     *
     * @param rtpTs The RTP timestamp (48kHz units) of the audio.
     * @returns false if the ssrc is unknown.
     */
    bool putDecoded(uint32_t ssrc, uint32_t rtpTs, std::vector<int16_t> samples);

    /**
     * Produces the next mixed frame if one is due.
     *
     * @param checkBackMs Set to the clock time at which a frame becomes
     * due when CHECK_BACK_LATER is returned.
     */
    FetchResult fetchPacket(MediaFrame& frame, uint32_t& checkBackMs);

    /**
     * Saturating sample-wise sum. The result is as long as the shortest
     * input.
     */
    static void mix(const std::vector<std::vector<int16_t>>& frames, 
        std::vector<int16_t>& out);

private:

    typedef JitterBuffer<std::vector<int16_t>> Buffer;

    struct Participant {
        std::unique_ptr<VoiceDecoder> decoder;
        // Created on the first audio
        std::unique_ptr<Buffer> jitterBuf;
        bool haveBaseTs = false;
        uint32_t baseTs = 0;
        int32_t lastVoiceMs = ASSUMED_VOICE_MS;
    };

    bool _nextFrameTime(uint32_t& due, uint32_t& ssrc);

    Log& _log;
    Clock& _clock;
    AdaptiveJitterBuffer::Config _jbConfig;
    std::map<uint64_t, uint32_t> _userToSsrc;
    std::map<uint32_t, std::unique_ptr<Participant>> _participants;

    // Cache of the earliest due time across all participants
    bool _knownValid = false;
    uint32_t _knownDue = 0;
    uint32_t _knownSsrc = 0;
};

    }
}
