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
#include <memory>
#include <string>

#include "kc1fsz-tools/Log.h"

#include "CallWorker.h"
#include "SessionThread.h"
#include "ChannelTech.h"

using namespace std;

namespace kc1fsz {
    namespace vrelay {

const char* ChannelTech::TYPE = "Discord";
const char* ChannelTech::DESCRIPTION = "Discord Voice Channel Driver";

ChannelTech::ChannelTech(Log& log, TelephonyRuntime& runtime, SessionThread& session)
:   _log(log),
    _runtime(runtime),
    _session(session),
    _caps(makeCapabilities()) {
}

FormatCaps ChannelTech::makeCapabilities() {
    FormatCaps caps;
    caps.append(AudioFormat::SLIN48, FRAMING_MS);
    return caps;
}

TelephonyChannel* ChannelTech::requester(const FormatCaps& caps, 
    TelephonyChannel* requestor, const char* dest) {

    uint64_t guildId, channelId;
    if (!CallHandle::parseDestination(dest, guildId, channelId)) {
        _log.error("Invalid destination '%s', expected <server>/<channel>", 
            dest ? dest : "");
        return 0;
    }

    if (requestor) {
        _log.info("Requestor %s has formats %s", requestor->getName(), 
            requestor->getNativeFormats().names().c_str());
    }
    if (!caps.isCompatible(_caps)) {
        _log.info("Requested formats %s are not compatible with %s", 
            caps.names().c_str(), _caps.names().c_str());
    }

    string name = string(TYPE) + "/" + dest;
    TelephonyChannel* raw = _runtime.allocChannel(requestor, name.c_str());
    if (raw == 0) {
        _log.error("Unable to allocate channel %s", name.c_str());
        return 0;
    }

    // The lock is released before the reference 
    ChannelRef channel = ChannelRef::adopt(raw);
    ChannelLock lock(*raw, std::adopt_lock);

    raw->setNativeFormats(_caps);
    raw->setReadFormat(AudioFormat::SLIN48);
    raw->setWriteFormat(AudioFormat::SLIN48);

    std::unique_ptr<CallHandle> call;
    Result r = _session.prepareCall(*raw, guildId, channelId, call);
    if (!r.isOk()) {
        char msg[128];
        _log.error("Unable to prepare call to %s: %s", dest, r.describe(msg, sizeof(msg)));
        return 0;
    }

    raw->setTechData(call.release());
    return channel.release();
}

int ChannelTech::call(TelephonyChannel& chan, const char* dest, int) {
    CallHandle* handle = static_cast<CallHandle*>(chan.getTechData());
    if (handle == 0) {
        _log.error("Call on %s without a call handle", chan.getName());
        return -1;
    }
    Result r = handle->startJoining();
    if (!r.isOk()) {
        char msg[128];
        _log.error("Unable to join %s: %s", dest ? dest : "", r.describe(msg, sizeof(msg)));
        return -1;
    }
    return 0;
}

int ChannelTech::hangup(TelephonyChannel& chan) {
    std::unique_ptr<CallHandle> handle(static_cast<CallHandle*>(chan.getTechData()));
    chan.setTechData(0);
    if (!handle)
        return 0;
    Result r = handle->hangup();
    if (!r.isOk()) {
        char msg[128];
        _log.error("Hangup of %s failed: %s", chan.getName(), r.describe(msg, sizeof(msg)));
        return -1;
    }
    return 0;
}

int ChannelTech::write(TelephonyChannel& chan, const MediaFrame& frame) {
    CallHandle* handle = static_cast<CallHandle*>(chan.getTechData());
    if (handle == 0)
        return -1;
    Result r = handle->writeFrame(frame);
    if (!r.isOk()) {
        // Audio flows before the voice connection is up, so only the 
        // start of a run of failures is reported
        if (handle->noteWriteFailure() == 1) {
            char msg[128];
            _log.info("Write to %s failed: %s", chan.getName(), r.describe(msg, sizeof(msg)));
        }
        return -1;
    }
    handle->noteWriteSuccess();
    return 0;
}

const MediaFrame* ChannelTech::read(TelephonyChannel&) {
    return &_nullFrame;
}

int ChannelTech::fixup(TelephonyChannel&, TelephonyChannel& newChan) {
    // The handle has already moved with the tech data
    CallHandle* handle = static_cast<CallHandle*>(newChan.getTechData());
    if (handle == 0)
        return -1;
    Result r = handle->fixup(newChan);
    if (!r.isOk()) {
        char msg[128];
        _log.error("Fixup of %s failed: %s", newChan.getName(), r.describe(msg, sizeof(msg)));
        return -1;
    }
    return 0;
}

    }
}
