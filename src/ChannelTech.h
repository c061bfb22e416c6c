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

#include "Telephony.h"

namespace kc1fsz {

class Log;

    namespace vrelay {

class SessionThread;

/**
 * The entry points of the channel technology that the telephony runtime
 * calls on its own threads. Channels are addressed as 
 * "<server id>/<voice channel id>".
 */
class ChannelTech {
public:

    static const char* TYPE;
    static const char* DESCRIPTION;
    static const unsigned FRAMING_MS = 20;

    ChannelTech(Log& log, TelephonyRuntime& runtime, SessionThread& session);

    ChannelTech(const ChannelTech&) = delete;
    ChannelTech& operator=(const ChannelTech&) = delete;

    /**
     * The formats this technology carries (slin48 in 20ms frames).
     */
    static FormatCaps makeCapabilities();

    const FormatCaps& getCapabilities() const { return _caps; }

    /**
     * Allocates and prepares a channel for the destination.
     *
     * @returns The new channel (unlocked, with one reference for the 
     * caller) or 0 on failure.
     */
    TelephonyChannel* requester(const FormatCaps& caps, TelephonyChannel* requestor,
        const char* dest);

    /**
     * These return 0 on success and -1 on failure.
     */
    int call(TelephonyChannel& chan, const char* dest, int timeout);
    int hangup(TelephonyChannel& chan);
    int write(TelephonyChannel& chan, const MediaFrame& frame);
    int fixup(TelephonyChannel& oldChan, TelephonyChannel& newChan);

    /**
     * Inbound audio is queued onto the channel by the queue thread, so 
     * this only ever returns the null frame.
     */
    const MediaFrame* read(TelephonyChannel& chan);

private:

    Log& _log;
    TelephonyRuntime& _runtime;
    SessionThread& _session;
    FormatCaps _caps;
    const MediaFrame _nullFrame;
};

    }
}
