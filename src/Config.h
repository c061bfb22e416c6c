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

#include <nlohmann/json.hpp>

namespace kc1fsz {

class Log;

    namespace vrelay {

/**
 * Module configuration. Read from an INI file:
 *
 * [general]
 * token = <bot token>
 * api_url = <REST base URL>      (optional)
 * trace = yes|no                 (optional)
 */
class Config {
public:

    static const char* SECTION;

    std::string token;
    std::string apiUrl;
    bool trace = false;

    void setDefaults();

    /**
     * Replaces the contents with what is in the file. Unknown keys are 
     * logged and ignored.
     *
     * @returns 0 on success, -1 if the file could not be read, -2 if the 
     * token is missing.
     */
    int load(Log& log, const char* fileName);

    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

private:

    static int _handler(void* user, const char* section, const char* name,
        const char* value);

    Log* _log = 0;
};

    }
}
