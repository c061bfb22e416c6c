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

#include <memory>

#include "kc1fsz-tools/linux/StdClock.h"

#include "Config.h"
#include "RuntimeLog.h"
#include "SessionThread.h"

namespace kc1fsz {
    namespace vrelay {

class ChannelTech;
class GatewaySocketFactory;
class QueueThread;
class SessionTransportFactory;
class TelephonyRuntime;

/**
 * Everything that lives for as long as the module is loaded. The host
 * adapter keeps exactly one of these and routes the channel technology
 * callbacks to getTech().
 */
class Module {
public:

    Module(TelephonyRuntime& runtime, GatewaySocketFactory& gatewayFactory,
        SessionTransportFactory& transportFactory);
    ~Module();

    Module(const Module&) = delete;
    Module& operator=(const Module&) = delete;

    /**
     * Replaces the credential check (which normally goes to the REST API).
     */
    void setCredentialCheck(SessionThread::CredentialCheck check) { _check = check; }

    /**
     * Reads the configuration, starts the threads and logs in.
     *
     * @returns 0 on success, -1 if the module should decline to load.
     */
    int load(const char* configFileName);

    void unload();

    bool isLoaded() const { return (bool)_tech; }

    /**
     * Only valid while loaded.
     */
    ChannelTech& getTech() { return *_tech; }

    Log& getLog() { return _log; }

    const Config& getConfig() const { return _config; }

private:

    TelephonyRuntime& _runtime;
    GatewaySocketFactory& _gatewayFactory;
    SessionTransportFactory& _transportFactory;
    RuntimeLog _log;
    StdClock _clock;
    Config _config;
    SessionThread::CredentialCheck _check;
    std::unique_ptr<QueueThread> _queue;
    std::unique_ptr<SessionThread> _session;
    std::unique_ptr<ChannelTech> _tech;
};

    }
}
