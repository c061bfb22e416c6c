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
#include "kc1fsz-tools/Log.h"

#include "ChannelTech.h"
#include "QueueThread.h"
#include "RestClient.h"
#include "VoiceCrypto.h"
#include "Module.h"

using namespace std;

namespace kc1fsz {
    namespace vrelay {

Module::Module(TelephonyRuntime& runtime, GatewaySocketFactory& gatewayFactory,
    SessionTransportFactory& transportFactory)
:   _runtime(runtime),
    _gatewayFactory(gatewayFactory),
    _transportFactory(transportFactory),
    _log(runtime) {
}

Module::~Module() {
    unload();
}

int Module::load(const char* configFileName) {

    if (isLoaded())
        return 0;

    if (!initCrypto()) {
        _log.error("Unable to initialize crypto library");
        return -1;
    }

    _log.info("Capabilities: %s", ChannelTech::makeCapabilities().names().c_str());

    if (_config.load(_log, configFileName) != 0)
        return -1;

    SessionThread::CredentialCheck check = _check;
    if (!check) {
        Log& log = _log;
        std::string apiUrl = _config.apiUrl;
        check = [&log, apiUrl](const std::string& token, uint64_t& botUser) {
            RestClient client(log, apiUrl);
            std::string name;
            return client.fetchCurrentUser(token, botUser, name);
        };
    }

    _queue = std::make_unique<QueueThread>(_log);
    _queue->start();

    _session = std::make_unique<SessionThread>(_log, _clock, *_queue, _gatewayFactory,
        _transportFactory, check, _config.trace);
    Result r = _session->start(_config.token);
    if (!r.isOk()) {
        char msg[128];
        _log.error("Unable to start session: %s", r.describe(msg, sizeof(msg)));
        _session.reset();
        _queue.reset();
        return -1;
    }

    _tech = std::make_unique<ChannelTech>(_log, _runtime, *_session);
    _log.info("Registered channel type %s", ChannelTech::TYPE);
    return 0;
}

void Module::unload() {
    if (_tech) {
        _log.info("Unregistering channel type %s", ChannelTech::TYPE);
        _tech.reset();
    }
    // The session thread queues onto the channels through the queue 
    // thread, so it goes first
    _session.reset();
    _queue.reset();
}

    }
}
