#include <iostream>
#include <cassert>
#include <fstream>
#include <string>

#include "kc1fsz-tools/Log.h"

#include "Config.h"
#include "RestClient.h"

using namespace std;
using namespace kc1fsz;
using namespace kc1fsz::vrelay;

static const char* FILE_NAME = "/tmp/vrelay-config-test.conf";

static void writeFile(const char* text) {
    ofstream f(FILE_NAME, ios::trunc);
    f << text;
}

int main(int, const char**) {

    Log log;

    {
        writeFile(
            "; Test file\n"
            "[general]\n"
            "token = abc.def.ghi\n"
            "color = blue\n"
            "trace = yes\n"
            "[other]\n"
            "token = ignored\n");
        Config config;
        assert(config.load(log, FILE_NAME) == 0);
        assert(config.token == "abc.def.ghi");
        assert(config.apiUrl == RestClient::DEFAULT_API_URL);
        assert(config.trace);

        // Through JSON and back
        Config copy;
        copy.fromJson(config.toJson());
        assert(copy.token == config.token);
        assert(copy.apiUrl == config.apiUrl);
        assert(copy.trace);
    }

    {
        writeFile(
            "[general]\n"
            "token = t1\n"
            "api_url = http://127.0.0.1:9999/api\n");
        Config config;
        assert(config.load(log, FILE_NAME) == 0);
        assert(config.apiUrl == "http://127.0.0.1:9999/api");
        assert(!config.trace);
    }

    // Token is required
    {
        writeFile("[general]\napi_url = x\n");
        Config config;
        assert(config.load(log, FILE_NAME) == -2);
    }

    // Token in the wrong section doesn't count
    {
        writeFile("[voice]\ntoken = t1\n");
        Config config;
        assert(config.load(log, FILE_NAME) == -2);
    }

    // No file
    {
        Config config;
        assert(config.load(log, "/tmp/vrelay-does-not-exist.conf") == -1);
    }

    // Defaults for anything missing from the JSON
    {
        Config config;
        config.fromJson(nlohmann::json::object());
        assert(config.token.empty());
        assert(config.apiUrl == RestClient::DEFAULT_API_URL);
    }

    // The REST response parser
    {
        uint64_t id = 0;
        string name;
        assert(RestClient::parseCurrentUser(
            "{\"id\":\"80351110224678912\",\"username\":\"relay\",\"bot\":true}", id, name));
        assert(id == 80351110224678912ULL);
        assert(name == "relay");
        assert(!RestClient::parseCurrentUser("{\"username\":\"relay\"}", id, name));
        assert(!RestClient::parseCurrentUser("{\"id\":\"abc\"}", id, name));
        assert(!RestClient::parseCurrentUser("not json", id, name));
    }

    remove(FILE_NAME);
    return 0;
}
