#include <iostream>
#include <cassert>
#include <cstring>
#include <string>

#include <sodium.h>
#include <nlohmann/json.hpp>

#include "kc1fsz-tools/Log.h"

#include "VoiceGateway.h"
#include "tests/TestUtil.h"

using namespace std;
using namespace kc1fsz;
using namespace kc1fsz::vrelay;
using json = nlohmann::json;

static void parse_1() {

    cout << "===== parse_1 =====" << endl;

    GatewayEvent ev;

    VoiceGateway::parseMessage(
        "{\"op\":2,\"d\":{\"ssrc\":1234,\"ip\":\"10.0.0.1\",\"port\":50001,"
        "\"modes\":[\"xsalsa20_poly1305\",\"xsalsa20_poly1305_lite\"]}}", ev);
    assert(ev.type == GatewayEvent::Type::READY);
    assert(ev.ssrc == 1234);
    assert(ev.ip == "10.0.0.1");
    assert(ev.port == 50001);
    assert(ev.modes.size() == 2);
    assert(ev.modes[1] == "xsalsa20_poly1305_lite");

    VoiceGateway::parseMessage(
        "{\"op\":4,\"d\":{\"mode\":\"xsalsa20_poly1305\",\"secret_key\":[1,2,3,255]}}", ev);
    assert(ev.type == GatewayEvent::Type::SESSION_DESCRIPTION);
    assert(ev.mode == "xsalsa20_poly1305");
    assert(ev.secretKey.size() == 4);
    assert(ev.secretKey[3] == 255);

    // Ids can be strings
    VoiceGateway::parseMessage(
        "{\"op\":5,\"d\":{\"user_id\":\"80351110224678912\",\"ssrc\":77,\"speaking\":1}}", ev);
    assert(ev.type == GatewayEvent::Type::SPEAKING);
    assert(ev.hasUserId);
    assert(ev.userId == 80351110224678912ULL);
    assert(ev.ssrc == 77);
    assert(ev.speaking == 1);
    assert(ev.delay == 0);

    // ... or numbers, and the user is optional
    VoiceGateway::parseMessage(
        "{\"op\":5,\"d\":{\"ssrc\":78,\"speaking\":0,\"delay\":5}}", ev);
    assert(ev.type == GatewayEvent::Type::SPEAKING);
    assert(!ev.hasUserId);
    assert(ev.delay == 5);

    VoiceGateway::parseMessage(
        "{\"op\":12,\"d\":{\"user_id\":42,\"audio_ssrc\":99,\"video_ssrc\":0}}", ev);
    assert(ev.type == GatewayEvent::Type::CLIENT_CONNECT);
    assert(ev.userId == 42);
    assert(ev.ssrc == 99);

    VoiceGateway::parseMessage("{\"op\":13,\"d\":{\"user_id\":\"43\"}}", ev);
    assert(ev.type == GatewayEvent::Type::CLIENT_DISCONNECT);
    assert(ev.userId == 43);

    VoiceGateway::parseMessage("{\"op\":8,\"d\":{\"heartbeat_interval\":13750.25}}", ev);
    assert(ev.type == GatewayEvent::Type::HELLO);
    assert(ev.heartbeatIntervalMs == 13750);

    VoiceGateway::parseMessage("{\"op\":6,\"d\":12345}", ev);
    assert(ev.type == GatewayEvent::Type::HEARTBEAT_ACK);

    // Client-to-server opcodes should never come back
    VoiceGateway::parseMessage("{\"op\":0,\"d\":{}}", ev);
    assert(ev.type == GatewayEvent::Type::UNEXPECTED);
    assert(ev.op == 0);
    VoiceGateway::parseMessage("{\"op\":3,\"d\":1}", ev);
    assert(ev.type == GatewayEvent::Type::UNEXPECTED);
    assert(ev.op == 3);

    // Garbage
    VoiceGateway::parseMessage("{\"op\":99,\"d\":{}}", ev);
    assert(ev.type == GatewayEvent::Type::UNKNOWN);
    VoiceGateway::parseMessage("not json", ev);
    assert(ev.type == GatewayEvent::Type::UNKNOWN);
    VoiceGateway::parseMessage("{\"op\":2,\"d\":{\"ssrc\":\"x\"}}", ev);
    assert(ev.type == GatewayEvent::Type::UNKNOWN);
    VoiceGateway::parseMessage("{\"op\":13,\"d\":{\"user_id\":\"abc\"}}", ev);
    assert(ev.type == GatewayEvent::Type::UNKNOWN);

    // Required fields missing
    VoiceGateway::parseMessage("{\"op\":2,\"d\":{\"ip\":\"1.2.3.4\",\"port\":1,\"modes\":[]}}", ev);
    assert(ev.type == GatewayEvent::Type::UNKNOWN);
    VoiceGateway::parseMessage("{\"op\":5,\"d\":{\"ssrc\":1}}", ev);
    assert(ev.type == GatewayEvent::Type::UNKNOWN);
    VoiceGateway::parseMessage("{\"op\":2}", ev);
    assert(ev.type == GatewayEvent::Type::UNKNOWN);
    VoiceGateway::parseMessage("{\"op\":4,\"d\":{\"secret_key\":[1,2]}}", ev);
    assert(ev.type == GatewayEvent::Type::UNKNOWN);
    VoiceGateway::parseMessage("{\"op\":12,\"d\":{\"user_id\":\"43\"}}", ev);
    assert(ev.type == GatewayEvent::Type::UNKNOWN);
    VoiceGateway::parseMessage("{\"op\":8,\"d\":{}}", ev);
    assert(ev.type == GatewayEvent::Type::UNKNOWN);
    VoiceGateway::parseMessage("{\"d\":{\"heartbeat_interval\":1000}}", ev);
    assert(ev.type == GatewayEvent::Type::UNKNOWN);
    VoiceGateway::parseMessage("[1,2,3]", ev);
    assert(ev.type == GatewayEvent::Type::UNKNOWN);

    // An ack needs no body
    VoiceGateway::parseMessage("{\"op\":6}", ev);
    assert(ev.type == GatewayEvent::Type::HEARTBEAT_ACK);
}

static void make_1() {

    cout << "===== make_1 =====" << endl;

    json o = json::parse(VoiceGateway::makeIdentify(100, 200, "sess", "tok"));
    assert(o["op"] == 0);
    assert(o["d"]["server_id"] == "100");
    assert(o["d"]["user_id"] == "200");
    assert(o["d"]["session_id"] == "sess");
    assert(o["d"]["token"] == "tok");

    o = json::parse(VoiceGateway::makeSelectProtocol("1.2.3.4", 5000, 
        EncryptionMode::LITE));
    assert(o["op"] == 1);
    assert(o["d"]["protocol"] == "udp");
    assert(o["d"]["data"]["address"] == "1.2.3.4");
    assert(o["d"]["data"]["port"] == 5000);
    assert(o["d"]["data"]["mode"] == "xsalsa20_poly1305_lite");

    o = json::parse(VoiceGateway::makeSpeaking(1, 0, 1234));
    assert(o["op"] == 5);
    assert(o["d"]["speaking"] == 1);
    assert(o["d"]["delay"] == 0);
    assert(o["d"]["ssrc"] == 1234);

    o = json::parse(VoiceGateway::makeHeartbeat(0xffffffffffffULL));
    assert(o["op"] == 3);
    assert(o["d"].get<uint64_t>() == 0xffffffffffffULL);
}

static void heartbeat_1() {

    cout << "===== heartbeat_1 =====" << endl;

    Log log;
    TestClock clock(log);
    clock.setTime(1000);
    TestGatewaySocketFactory factory;

    VoiceGateway gw(log, clock, factory);
    assert(gw.start("voice.example.com:443") == 0);
    assert(factory.lastUrl == "wss://voice.example.com:443/?v=4");
    TestGatewaySocket* sock = factory.last;

    GatewayEvent ev;
    // Nothing until hello
    clock.increment(60000);
    assert(!gw.nextEvent(ev));
    assert(sock->countSent("\"op\":3") == 0);

    // Hello and the ack are consumed
    sock->push("{\"op\":8,\"d\":{\"heartbeat_interval\":5000}}");
    sock->push("{\"op\":6,\"d\":1}");
    assert(!gw.nextEvent(ev));
    assert(sock->incoming.empty());

    clock.increment(4999);
    assert(!gw.nextEvent(ev));
    assert(sock->countSent("\"op\":3") == 0);
    clock.increment(1);
    assert(!gw.nextEvent(ev));
    assert(sock->countSent("\"op\":3") == 1);
    clock.increment(2500);
    assert(!gw.nextEvent(ev));
    assert(sock->countSent("\"op\":3") == 1);
    clock.increment(2500);
    assert(!gw.nextEvent(ev));
    assert(sock->countSent("\"op\":3") == 2);

    // Events are passed up
    sock->push("{\"op\":13,\"d\":{\"user_id\":\"5\"}}");
    assert(gw.nextEvent(ev));
    assert(ev.type == GatewayEvent::Type::CLIENT_DISCONNECT);

    assert(gw.sendSpeaking(1, 0, 7) == 0);
    assert(sock->countSent("\"op\":5") == 1);

    // The socket breaks
    sock->broken = true;
    assert(gw.nextEvent(ev));
    assert(ev.type == GatewayEvent::Type::CLOSED);
    assert(gw.isClosed());
    // Only once
    assert(!gw.nextEvent(ev));
    assert(!gw.nextEvent(ev));
    assert(gw.sendSpeaking(1, 0, 7) < 0);
}

static void close_1() {

    cout << "===== close_1 =====" << endl;

    Log log;
    TestClock clock(log);
    TestGatewaySocketFactory factory;

    VoiceGateway gw(log, clock, factory);
    assert(gw.start("x") == 0);
    gw.close();
    GatewayEvent ev;
    assert(gw.nextEvent(ev));
    assert(ev.type == GatewayEvent::Type::CLOSED);
    assert(!gw.nextEvent(ev));
}

int main(int, const char**) {
    if (sodium_init() < 0)
        return -1;
    parse_1();
    make_1();
    heartbeat_1();
    close_1();
    return 0;
}
