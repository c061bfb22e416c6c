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
#include <nlohmann/json.hpp>

#include "kc1fsz-tools/Log.h"

#include "Session.h"

using namespace std;
using json = nlohmann::json;

namespace kc1fsz {
    namespace vrelay {

// Limits the work done in one pass so other tasks get a turn
static const unsigned MAX_EVENTS_PER_RUN = 16;

Session::Session(Log& log, SessionTransport& transport, uint64_t botUser)
:   _log(log),
    _transport(transport),
    _botUser(botUser),
    _cancelled(false) {
}

bool Session::exclusiveServerEvents(uint64_t guildId, 
    SessionEventQueue::Receiver& receiver) {
    if (isClaimed(guildId))
        return false;
    auto q = SessionEventQueue::create(ROUTE_CAPACITY);
    _routes[guildId] = std::move(q.first);
    receiver = std::move(q.second);
    return true;
}

bool Session::isClaimed(uint64_t guildId) {
    auto it = _routes.find(guildId);
    if (it == _routes.end())
        return false;
    if (it->second.isClosed()) {
        _routes.erase(it);
        return false;
    }
    return true;
}

string Session::makeVoiceStateUpdate(uint64_t guildId, bool join,
    uint64_t channelId) {
    json d;
    d["guild_id"] = std::to_string(guildId);
    if (join)
        d["channel_id"] = std::to_string(channelId);
    else
        d["channel_id"] = nullptr;
    d["self_mute"] = false;
    d["self_deaf"] = false;
    json msg;
    msg["op"] = 4;
    msg["d"] = d;
    return msg.dump();
}

int Session::sendJoin(uint64_t guildId, uint64_t channelId) {
    if (_transport.send(makeVoiceStateUpdate(guildId, true, channelId)) != 0) {
        _log.error("Could not send voice state update for %llu", 
            (unsigned long long)guildId);
        return -1;
    }
    return 0;
}

int Session::sendLeave(uint64_t guildId) {
    if (_transport.send(makeVoiceStateUpdate(guildId, false, 0)) != 0) {
        _log.error("Could not send voice state update for %llu", 
            (unsigned long long)guildId);
        return -1;
    }
    return 0;
}

int Session::getPolls(pollfd* fds, unsigned fdsCapacity) {
    if (isCancelled())
        return 0;
    return _transport.getPolls(fds, fdsCapacity);
}

bool Session::run2() {
    if (isCancelled())
        return false;
    SessionEvent ev;
    for (unsigned i = 0; i < MAX_EVENTS_PER_RUN; i++) {
        if (!_transport.nextEvent(ev))
            return false;
        _route(ev);
    }
    return true;
}

void Session::_route(SessionEvent& ev) {

    if (ev.type == SessionEvent::Type::OTHER || !ev.hasGuildId)
        return;

    auto it = _routes.find(ev.guildId);
    if (it == _routes.end())
        return;

    SessionEventQueue::Permit permit;
    if (it->second.reserve(permit)) {
        permit.send(ev);
    }
    else if (it->second.isClosed()) {
        _routes.erase(it);
    }
    else {
        _log.error("Event queue full for server %llu, event dropped", 
            (unsigned long long)ev.guildId);
    }
}

    }
}
