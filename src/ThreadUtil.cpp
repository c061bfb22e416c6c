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
#include <pthread.h>

#include "kc1fsz-tools/Common.h"

#include "ThreadUtil.h"

namespace kc1fsz {
    namespace vrelay {

void setThreadName(const char* name) {
    // The kernel limits names to 15 characters
    char limited[16];
    strcpyLimited(limited, name, sizeof(limited));
    pthread_setname_np(pthread_self(), limited);
}

void getThreadName(char* buf, unsigned bufLen) {
    if (bufLen == 0)
        return;
    char name[16];
    if (pthread_getname_np(pthread_self(), name, sizeof(name)) != 0)
        name[0] = 0;
    strcpyLimited(buf, name, bufLen);
}

    }
}
