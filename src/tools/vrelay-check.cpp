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
#include <iostream>
#include <string>

#include <argparse/argparse.hpp>

#include "kc1fsz-tools/Log.h"

#include "Config.h"
#include "RestClient.h"
#include "VoiceCrypto.h"

using namespace std;
using namespace kc1fsz;
using namespace kc1fsz::vrelay;

static const char* VERSION = "20251019.0";

/*
Checks a configuration file and the token in it before the module is
loaded.

EX:
./vrelay-check --config /etc/asterisk/discord.conf
*/
int main(int argc, const char** argv) {

    Log log;

    argparse::ArgumentParser program("vrelay-check", VERSION);

    string configFileName = "/etc/asterisk/discord.conf";
    program.add_argument("--config")
        .store_into(configFileName)
        .help("Configuration file");

    program.add_argument("--dump")
        .help("Show the configuration that was read")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--offline")
        .help("Don't contact the service")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        log.error("Argument error: %s", err.what());
        return -2;
    }

    if (!initCrypto()) {
        log.error("Unable to initialize crypto library");
        return -1;
    }

    Config config;
    int rc = config.load(log, configFileName.c_str());
    if (rc == -1) {
        log.error("Unable to read %s", configFileName.c_str());
        return -1;
    } 
    else if (rc != 0) {
        log.error("No token in %s", configFileName.c_str());
        return -1;
    }

    if (program.get<bool>("--dump")) {
        nlohmann::json j = config.toJson();
        // Never print the secret
        j["token"] = "****";
        cout << j.dump(2) << endl;
    }

    if (program.get<bool>("--offline"))
        return 0;

    RestClient client(log, config.apiUrl);
    uint64_t userId = 0;
    string userName;
    Result r = client.fetchCurrentUser(config.token, userId, userName);
    if (!r.isOk()) {
        char msg[128];
        log.error("Token check failed: %s", r.describe(msg, sizeof(msg)));
        return -1;
    }

    log.info("Token belongs to %s (%llu)", userName.c_str(), (unsigned long long)userId);
    return 0;
}
