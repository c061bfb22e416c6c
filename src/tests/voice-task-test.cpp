#include <iostream>
#include <cassert>
#include <string>

#include <sodium.h>

#include "kc1fsz-tools/Log.h"

#include "Session.h"
#include "VoiceTask.h"
#include "tests/TestUtil.h"

using namespace std;
using namespace kc1fsz;
using namespace kc1fsz::vrelay;

static const uint64_t BOT_USER = 555;
static const uint64_t OTHER_USER = 777;
static const uint64_t GUILD_ID = 1001;
static const uint64_t CHANNEL_ID = 2002;

static string makeReady(uint16_t port) {
    return "{\"op\":2,\"d\":{\"ssrc\":1234,\"ip\":\"127.0.0.1\",\"port\":" + 
        std::to_string(port) + ",\"modes\":[\"aead_aes256_gcm_rtpsize\",\"xsalsa20_poly1305\"]}}";
}

static string makeSessionDescription() {
    string s = "{\"op\":4,\"d\":{\"mode\":\"xsalsa20_poly1305\",\"secret_key\":[";
    for (unsigned i = 0; i < 32; i++) {
        if (i > 0)
            s += ",";
        s += std::to_string(i + 1);
    }
    s += "]}}";
    return s;
}

static OutgoingVoicePacket makePacket() {
    OutgoingVoicePacket p;
    p.payload = { 0xf8, 0xff, 0xfe };
    p.timestamp = 960;
    return p;
}

/**
 * Connect, talk, and leave.
 */
static void flow_1() {

    cout << "===== flow_1 =====" << endl;

    Log log;
    TestClock clock(log);
    TestSessionTransport transport;
    Session session(log, transport, BOT_USER);
    TestGatewaySocketFactory factory;
    TestVoiceServer server;

    SessionEventQueue::Receiver sessionEvents;
    assert(session.exclusiveServerEvents(GUILD_ID, sessionEvents));

    VoiceTaskHandle handle(log, clock, session, factory, std::move(sessionEvents),
        GUILD_ID, CHANNEL_ID);
    VoiceTask& task = handle.getTask();
    assert(transport.countSent("\"channel_id\":\"2002\"") == 1);
    assert(!task.isFinished());

    // Too early to write
    unsigned callbacks = 0;
    Result writeResult;
    handle.write(makePacket(), [&callbacks, &writeResult](RequestError e, Result& r) {
        assert(e == RequestError::NONE);
        writeResult = r;
        callbacks++;
    });
    task.run2();
    assert(callbacks == 1);
    assert(writeResult.code == ErrorCode::INTERNAL_ERROR);
    assert(writeResult.cause == "Voice not set up yet.");

    // Someone else's state is ignored
    transport.push(makeVoiceStateUpdate(GUILD_ID, OTHER_USER, CHANNEL_ID, "other"));
    transport.push(makeVoiceServerUpdate(GUILD_ID, "tok1", "voice.test:443"));
    session.run2();
    task.run2();
    assert(factory.openCount == 0);

    // Now the bot's own state completes the picture
    transport.push(makeVoiceStateUpdate(GUILD_ID, BOT_USER, CHANNEL_ID, "sess1"));
    session.run2();
    task.run2();
    assert(factory.openCount == 1);
    assert(factory.lastUrl == "wss://voice.test:443/?v=4");
    TestGatewaySocket* sock = factory.last;
    assert(sock->countSent("\"op\":0") == 1);
    assert(sock->countSent("\"session_id\":\"sess1\"") == 1);
    assert(sock->countSent("\"token\":\"tok1\"") == 1);
    assert(sock->countSent("\"user_id\":\"555\"") == 1);
    assert(!task.isConnected());

    // Ready starts IP discovery. Protocol selection follows the answer.
    sock->push(makeReady(server.getPort()));
    assert(waitFor([&task]() { task.run2(); return task.isConnected(); }));
    assert(sock->countSent("\"op\":1") == 1);
    assert(sock->countSent("\"address\":\"127.0.0.1\"") == 1);
    assert(sock->countSent("\"mode\":\"xsalsa20_poly1305\"") == 1);

    // Still no key
    handle.write(makePacket(), [&callbacks, &writeResult](RequestError, Result& r) {
        writeResult = r;
        callbacks++;
    });
    task.run2();
    assert(callbacks == 2);
    assert(!writeResult.isOk());

    // Two session descriptions, one speaking announcement
    sock->push(makeSessionDescription());
    sock->push(makeSessionDescription());
    task.run2();
    assert(sock->countSent("\"op\":5") == 1);
    VoiceEvent ev;
    assert(handle.getEvents().tryReceive(ev));
    assert(ev.type == VoiceEvent::Type::FULLY_CONNECTED);
    assert(handle.getEvents().tryReceive(ev));
    assert(ev.type == VoiceEvent::Type::FULLY_CONNECTED);
    assert(!handle.getEvents().tryReceive(ev));

    handle.write(makePacket(), [&callbacks, &writeResult](RequestError, Result& r) {
        writeResult = r;
        callbacks++;
    });
    task.run2();
    assert(callbacks == 3);
    assert(writeResult.isOk());
    assert(waitFor([&server]() { return server.getPacketCount() == 1; }));

    // Membership
    sock->push("{\"op\":12,\"d\":{\"user_id\":\"777\",\"audio_ssrc\":4444}}");
    sock->push("{\"op\":5,\"d\":{\"user_id\":\"777\",\"ssrc\":4444,\"speaking\":1}}");
    sock->push("{\"op\":5,\"d\":{\"ssrc\":4445,\"speaking\":1}}");
    sock->push("{\"op\":13,\"d\":{\"user_id\":\"777\"}}");
    task.run2();
    assert(handle.getEvents().tryReceive(ev));
    assert(ev.type == VoiceEvent::Type::USER_JOINED);
    assert(ev.userId == OTHER_USER);
    assert(ev.ssrc == 4444);
    assert(handle.getEvents().tryReceive(ev));
    assert(ev.type == VoiceEvent::Type::SPEAKING);
    assert(ev.ssrc == 4444);
    // No user id, nothing to report
    assert(handle.getEvents().tryReceive(ev));
    assert(ev.type == VoiceEvent::Type::USER_LEFT);
    assert(ev.userId == OTHER_USER);
    assert(!task.isFinished());

    // Leave
    assert(transport.countSent("\"channel_id\":null") == 0);
    handle.requestClose();
    task.run2();
    assert(task.isFinished());
    assert(transport.countSent("\"channel_id\":null") == 1);
    assert(!handle.getEvents().tryReceive(ev));
    assert(handle.getEvents().isClosed());

    // Requests after the end fail
    RequestError lastErr = RequestError::NONE;
    handle.write(makePacket(), [&lastErr](RequestError e, Result&) { lastErr = e; });
    assert(lastErr == RequestError::RECEIVER_DROPPED);

    // Nothing more happens
    assert(!task.run2());
    assert(transport.countSent("\"channel_id\":null") == 1);
}

/**
 * Brings a task up to the point where the voice gateway is open.
 */
static TestGatewaySocket* startGateway(Session& session, TestSessionTransport& transport,
    TestGatewaySocketFactory& factory, VoiceTaskHandle& handle) {
    transport.push(makeVoiceStateUpdate(GUILD_ID, BOT_USER, CHANNEL_ID, "sess1"));
    transport.push(makeVoiceServerUpdate(GUILD_ID, "tok1", "voice.test"));
    session.run2();
    handle.getTask().run2();
    assert(factory.openCount == 1);
    return factory.last;
}

/**
 * The discovery answer is slow to come back. The task keeps running 
 * and repeats the request until it is answered.
 */
static void discovery_delay_1() {

    cout << "===== discovery_delay_1 =====" << endl;

    Log log;
    TestClock clock(log);
    TestSessionTransport transport;
    Session session(log, transport, BOT_USER);
    TestGatewaySocketFactory factory;
    TestVoiceServer server;
    server.setAnswering(false);

    SessionEventQueue::Receiver sessionEvents;
    assert(session.exclusiveServerEvents(GUILD_ID, sessionEvents));
    VoiceTaskHandle handle(log, clock, session, factory, std::move(sessionEvents),
        GUILD_ID, CHANNEL_ID);
    VoiceTask& task = handle.getTask();
    TestGatewaySocket* sock = startGateway(session, transport, factory, handle);

    sock->push(makeReady(server.getPort()));
    task.run2();
    assert(task.isDiscovering());
    assert(waitFor([&server]() { return server.getDiscoveryCount() == 1; }));

    // Nothing happens until the retry interval has passed
    for (unsigned i = 0; i < 5; i++)
        assert(!task.run2());
    assert(task.isDiscovering());
    assert(server.getDiscoveryCount() == 1);

    clock.increment(VoiceTask::DISCOVERY_RETRY_MS);
    task.run2();
    assert(waitFor([&server]() { return server.getDiscoveryCount() == 2; }));
    assert(task.isDiscovering());
    assert(sock->countSent("\"op\":1") == 0);

    // The next request gets an answer
    server.setAnswering(true);
    clock.increment(VoiceTask::DISCOVERY_RETRY_MS);
    assert(waitFor([&task]() { task.run2(); return task.isConnected(); }));
    assert(server.getDiscoveryCount() == 3);
    assert(sock->countSent("\"op\":1") == 1);
    assert(sock->countSent("\"address\":\"127.0.0.1\"") == 1);
    assert(!task.isFinished());
}

/**
 * The discovery answer never comes.
 */
static void discovery_timeout_1() {

    cout << "===== discovery_timeout_1 =====" << endl;

    Log log;
    TestClock clock(log);
    TestSessionTransport transport;
    Session session(log, transport, BOT_USER);
    TestGatewaySocketFactory factory;
    TestVoiceServer server;
    server.setAnswering(false);

    SessionEventQueue::Receiver sessionEvents;
    assert(session.exclusiveServerEvents(GUILD_ID, sessionEvents));
    VoiceTaskHandle handle(log, clock, session, factory, std::move(sessionEvents),
        GUILD_ID, CHANNEL_ID);
    VoiceTask& task = handle.getTask();
    TestGatewaySocket* sock = startGateway(session, transport, factory, handle);

    sock->push(makeReady(server.getPort()));
    task.run2();
    assert(task.isDiscovering());

    clock.increment(VoiceTask::DISCOVERY_TIMEOUT_MS - 1);
    task.run2();
    assert(!task.isFinished());

    clock.increment(1);
    task.run2();
    assert(task.isFinished());
    assert(sock->countSent("\"op\":1") == 0);
    assert(handle.getEvents().isClosed());
    assert(transport.countSent("\"channel_id\":null") == 1);
}

/**
 * The voice server drops the bot.
 */
static void remote_disconnect_1() {

    cout << "===== remote_disconnect_1 =====" << endl;

    Log log;
    TestClock clock(log);
    TestSessionTransport transport;
    Session session(log, transport, BOT_USER);
    TestGatewaySocketFactory factory;

    SessionEventQueue::Receiver sessionEvents;
    assert(session.exclusiveServerEvents(GUILD_ID, sessionEvents));
    VoiceTaskHandle handle(log, clock, session, factory, std::move(sessionEvents),
        GUILD_ID, CHANNEL_ID);

    transport.push(makeVoiceServerUpdate(GUILD_ID, "tok1", "voice.test"));
    transport.push(makeVoiceStateUpdate(GUILD_ID, BOT_USER, CHANNEL_ID, "sess1"));
    session.run2();
    handle.getTask().run2();
    assert(factory.openCount == 1);

    factory.last->push("{\"op\":13,\"d\":{\"user_id\":\"555\"}}");
    handle.getTask().run2();
    assert(handle.isFinished());
    VoiceEvent ev;
    assert(handle.getEvents().tryReceive(ev));
    assert(ev.type == VoiceEvent::Type::USER_LEFT);
    assert(handle.getEvents().isClosed());
    assert(transport.countSent("\"channel_id\":null") == 1);
}

/**
 * An unexpected message from the server is fatal.
 */
static void unexpected_1() {

    cout << "===== unexpected_1 =====" << endl;

    Log log;
    TestClock clock(log);
    TestSessionTransport transport;
    Session session(log, transport, BOT_USER);
    TestGatewaySocketFactory factory;

    SessionEventQueue::Receiver sessionEvents;
    assert(session.exclusiveServerEvents(GUILD_ID, sessionEvents));
    VoiceTaskHandle handle(log, clock, session, factory, std::move(sessionEvents),
        GUILD_ID, CHANNEL_ID);

    transport.push(makeVoiceStateUpdate(GUILD_ID, BOT_USER, CHANNEL_ID, "sess1"));
    transport.push(makeVoiceServerUpdate(GUILD_ID, "tok1", "voice.test"));
    session.run2();
    handle.getTask().run2();
    factory.last->push("{\"op\":1,\"d\":{}}");
    handle.getTask().run2();
    assert(handle.isFinished());
}

/**
 * The join can't be announced.
 */
static void join_failure_1() {

    cout << "===== join_failure_1 =====" << endl;

    Log log;
    TestClock clock(log);
    TestSessionTransport transport;
    transport.failSends = true;
    Session session(log, transport, BOT_USER);
    TestGatewaySocketFactory factory;

    SessionEventQueue::Receiver sessionEvents;
    assert(session.exclusiveServerEvents(GUILD_ID, sessionEvents));
    VoiceTaskHandle handle(log, clock, session, factory, std::move(sessionEvents),
        GUILD_ID, CHANNEL_ID);
    assert(handle.isFinished());
    VoiceEvent ev;
    assert(handle.getEvents().tryReceive(ev));
    assert(ev.type == VoiceEvent::Type::CLOSED);
    assert(handle.getEvents().isClosed());
}

int main(int, const char**) {
    if (sodium_init() < 0)
        return -1;
    flow_1();
    discovery_delay_1();
    discovery_timeout_1();
    remote_disconnect_1();
    unexpected_1();
    join_failure_1();
    return 0;
}
