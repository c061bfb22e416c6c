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
#include <string>

#include "Error.h"

namespace kc1fsz {

class Log;

    namespace vrelay {

/**
 * Minimal client for the REST API of the voice-chat service. Calls block
 * for up to 15 seconds so they belong on a worker thread.
 */
class RestClient {
public:

    static const char* DEFAULT_API_URL;

    RestClient(Log& log, const std::string& apiUrl);

    /**
     * Fetches the user that the token belongs to. This is how a token is 
     * validated.
     *
     * @returns INVALID_CREDENTIALS if the service rejects the token.
     */
    Result fetchCurrentUser(const std::string& token, uint64_t& userId, 
        std::string& userName);

    /**
     * Pulls the id and name out of a /users/@me response body.
     */
    static bool parseCurrentUser(const std::string& body, uint64_t& userId, 
        std::string& userName);

private:

    static size_t _writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    Log& _log;
    std::string _apiUrl;
    std::string _response;
};

    }
}
