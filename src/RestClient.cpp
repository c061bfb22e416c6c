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
#include <algorithm>
#include <stdexcept>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "kc1fsz-tools/Log.h"

#include "RestClient.h"

using namespace std;
using json = nlohmann::json;

namespace kc1fsz {
    namespace vrelay {

const char* RestClient::DEFAULT_API_URL = "https://discord.com/api/v10";

static const char* USER_AGENT = "DiscordBot (vrelay, 1.0)";

// Bodies larger than this are not expected
static const size_t MAX_RESPONSE_SIZE = 16384;

RestClient::RestClient(Log& log, const std::string& apiUrl)
:   _log(log),
    _apiUrl(apiUrl) {
}

bool RestClient::parseCurrentUser(const std::string& body, uint64_t& userId,
    std::string& userName) {
    try {
        json j = json::parse(body);
        const json& id = j.at("id");
        if (id.is_string())
            userId = std::stoull(id.get<std::string>());
        else
            userId = id.get<uint64_t>();
        if (j.contains("username") && j["username"].is_string())
            userName = j["username"].get<std::string>();
        else
            userName.clear();
        return true;
    }
    catch (json::exception&) {
        return false;
    }
    catch (std::logic_error&) {
        // From stoull
        return false;
    }
}

Result RestClient::fetchCurrentUser(const std::string& token, uint64_t& userId,
    std::string& userName) {

    CURL* curl = curl_easy_init();
    if (curl == 0)
        return makeInternalError("Unable to initialize HTTP client");

    string url = _apiUrl + "/users/@me";
    string authHeader = "Authorization: Bot " + token;

    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, _writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
    curl_slist* headers = curl_slist_append(0, authHeader.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 15L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 15L);

    _response.clear();

    Result result;
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        _log.error("Credential check failed (%s)", curl_easy_strerror(res));
        result = makeInternalError("Unable to reach the API server");
    }
    else {
        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        if (httpCode != 200) {
            _log.error("Token was rejected (HTTP %ld)", httpCode);
            result = makeError(ErrorCode::INVALID_CREDENTIALS);
        }
        else if (!parseCurrentUser(_response, userId, userName)) {
            _log.error("Unable to parse current user");
            result = makeInternalError("Unable to parse current user");
        }
        else {
            _log.info("Logged in as %s (%llu)", userName.c_str(), 
                (unsigned long long)userId);
        }
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return result;
}

size_t RestClient::_writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    RestClient* self = static_cast<RestClient*>(userp);
    // Accumulate as much as we have room for
    size_t room = MAX_RESPONSE_SIZE - std::min(self->_response.size(), MAX_RESPONSE_SIZE);
    self->_response.append(static_cast<const char*>(contents), std::min(realsize, room));
    return realsize;
}

    }
}
