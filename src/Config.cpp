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
#include <strings.h>

#include <cstring>

#include <ini.h>

#include "kc1fsz-tools/Log.h"

#include "RestClient.h"
#include "Config.h"

using namespace std;
using json = nlohmann::json;

namespace kc1fsz {
    namespace vrelay {

const char* Config::SECTION = "general";

static bool isTrue(const char* value) {
    return strcasecmp(value, "yes") == 0 || strcasecmp(value, "true") == 0 ||
        strcmp(value, "1") == 0 || strcasecmp(value, "on") == 0;
}

void Config::setDefaults() {
    token.clear();
    apiUrl = RestClient::DEFAULT_API_URL;
    trace = false;
}

int Config::_handler(void* user, const char* section, const char* name,
    const char* value) {
    Config* self = static_cast<Config*>(user);
    // Other sections belong to someone else
    if (strcmp(section, SECTION) != 0)
        return 1;
    if (strcmp(name, "token") == 0)
        self->token = value;
    else if (strcmp(name, "api_url") == 0)
        self->apiUrl = value;
    else if (strcmp(name, "trace") == 0)
        self->trace = isTrue(value);
    else 
        self->_log->info("Unknown configuration variable %s", name);
    return 1;
}

int Config::load(Log& log, const char* fileName) {
    setDefaults();
    _log = &log;
    int rc = ini_parse(fileName, _handler, this);
    _log = 0;
    if (rc < 0) {
        log.error("Could not load configuration file %s", fileName);
        return -1;
    }
    if (rc > 0)
        log.info("Configuration syntax error on line %d", rc);
    if (token.empty()) {
        log.error("Missing token option in %s section", SECTION);
        return -2;
    }
    return 0;
}

json Config::toJson() const {
    json o;
    o["token"] = token;
    o["apiUrl"] = apiUrl;
    o["trace"] = trace;
    return o;
}

void Config::fromJson(const json& o) {
    token = o.value("token", std::string());
    apiUrl = o.value("apiUrl", std::string(RestClient::DEFAULT_API_URL));
    trace = o.value("trace", false);
}

    }
}
