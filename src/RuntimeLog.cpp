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
#include <cstdio>

#include "Telephony.h"
#include "ThreadUtil.h"
#include "RuntimeLog.h"

namespace kc1fsz {
    namespace vrelay {

RuntimeLog::RuntimeLog(TelephonyRuntime& runtime)
:   _runtime(runtime) {
}

void RuntimeLog::_out(const char* sev, const char*, const char* msg) {
    // The runtime stamps its own time
    char tid[16];
    getThreadName(tid, sizeof(tid));
    char line[512];
    snprintf(line, sizeof(line), "[%s] %s", tid, msg);
    _runtime.log(sev, line);
}

    }
}
