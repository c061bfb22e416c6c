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

#include "Error.h"

namespace kc1fsz {
    namespace vrelay {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::OK:
        return "OK";
    case ErrorCode::INVALID_CREDENTIALS:
        return "Invalid credentials";
    case ErrorCode::INTERNAL_ERROR:
        return "Internal error occurred";
    case ErrorCode::ALREADY_IN_CHANNEL_ON_SERVER:
        return "Already in a channel on the requested server";
    case ErrorCode::ENCODE_ERROR:
        return "Could not encode audio";
    default:
        return "Unknown";
    }
}

const char* Result::describe(char* buf, unsigned bufLen) const {
    if (code == ErrorCode::INTERNAL_ERROR && !cause.empty())
        snprintf(buf, bufLen, "%s: %s", errorCodeName(code), cause.c_str());
    else
        snprintf(buf, bufLen, "%s", errorCodeName(code));
    return buf;
}

    }
}
