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

#include <string>

namespace kc1fsz {
    namespace vrelay {

enum class ErrorCode {
    OK,
    // The token was rejected by the voice-chat service
    INVALID_CREDENTIALS,
    INTERNAL_ERROR,
    // Another call is already routed to the same server
    ALREADY_IN_CHANNEL_ON_SERVER,
    // The audio encoder failed
    ENCODE_ERROR
};

const char* errorCodeName(ErrorCode code);

/**
 * The outcome of a call-level operation. The cause is only filled in
 * for INTERNAL_ERROR.
 */
struct Result {

    ErrorCode code = ErrorCode::OK;
    std::string cause;

    bool isOk() const { return code == ErrorCode::OK; }

    /**
     * Formats the result for logging into the buffer provided.
     */
    const char* describe(char* buf, unsigned bufLen) const;
};

inline Result makeOk() {
    return Result();
}

inline Result makeError(ErrorCode code) {
    Result r;
    r.code = code;
    return r;
}

inline Result makeInternalError(const char* cause) {
    Result r;
    r.code = ErrorCode::INTERNAL_ERROR;
    r.cause = cause;
    return r;
}

    }
}
