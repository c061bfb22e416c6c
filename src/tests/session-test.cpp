#include <iostream>
#include <cassert>
#include <string>

#include <sodium.h>
#include <nlohmann/json.hpp>

#include "kc1fsz-tools/Log.h"

#include "CallWorker.h"
#include "QueueThread.h"
#include "Session.h"
#include "SessionThread.h"
#include "tests/TestUtil.h"

using namespace std;
using namespace kc1fsz;
using namespace kc1fsz::vrelay;
using json = nlohmann::json;

static const uint64_t BOT_USER = 555;

static void routing_1() {

    cout << "===== routing_1 =====" << endl;

    Log log;
    TestSessionTransport transport;
    Session session(log, transport, BOT_USER);

    SessionEventQueue::Receiver r1, r2, r3;
    assert(session.exclusiveServerEvents(100, r1));
    assert(session.isClaimed(100));
    // Taken
    assert(!session.exclusiveServerEvents(100, r2));
    assert(!r2.isValid());
    // Another server is fine
    assert(session.exclusiveServerEvents(200, r3));

    transport.push(makeVoiceStateUpdate(100, BOT_USER, 1, "a"));
    transport.push(makeVoiceServerUpdate(200, "t", "e"));
    transport.push(makeVoiceStateUpdate(300, BOT_USER, 1, "c"));
    // Events without a server go nowhere
    SessionEvent noGuild;
    noGuild.type = SessionEvent::Type::VOICE_STATE_UPDATE;
    transport.push(noGuild);
    SessionEvent other;
    other.type = SessionEvent::Type::OTHER;
    other.hasGuildId = true;
    other.guildId = 100;
    transport.push(other);
    session.run2();

    SessionEvent ev;
    assert(r1.tryReceive(ev));
    assert(ev.type == SessionEvent::Type::VOICE_STATE_UPDATE);
    assert(ev.sessionId == "a");
    assert(!r1.tryReceive(ev));
    assert(r3.tryReceive(ev));
    assert(ev.type == SessionEvent::Type::VOICE_SERVER_UPDATE);
    assert(ev.endpoint == "e");
    assert(!r3.tryReceive(ev));

    // Once the listener goes away the server can be claimed again
    r1 = SessionEventQueue::Receiver();
    assert(!session.isClaimed(100));
    assert(session.exclusiveServerEvents(100, r2));
    transport.push(makeVoiceStateUpdate(100, BOT_USER, 1, "b"));
    session.run2();
    assert(r2.tryReceive(ev));
    assert(ev.sessionId == "b");

    // A dropped listener is noticed while routing
    r3 = SessionEventQueue::Receiver();
    transport.push(makeVoiceServerUpdate(200, "t", "e"));
    session.run2();
    assert(!session.isClaimed(200));
}

static void full_1() {

    cout << "===== full_1 =====" << endl;

    Log log;
    TestSessionTransport transport;
    Session session(log, transport, BOT_USER);

    SessionEventQueue::Receiver r;
    assert(session.exclusiveServerEvents(100, r));
    for (unsigned i = 0; i < Session::ROUTE_CAPACITY + 5; i++)
        transport.push(makeVoiceStateUpdate(100, BOT_USER, 1, std::to_string(i).c_str()));
    while (session.run2());

    // The overflow was dropped, the rest arrive in order
    SessionEvent ev;
    for (unsigned i = 0; i < Session::ROUTE_CAPACITY; i++) {
        assert(r.tryReceive(ev));
        assert(ev.sessionId == std::to_string(i));
    }
    assert(!r.tryReceive(ev));
    // Still claimed
    assert(session.isClaimed(100));

    // Room again
    transport.push(makeVoiceStateUpdate(100, BOT_USER, 1, "after"));
    session.run2();
    assert(r.tryReceive(ev));
    assert(ev.sessionId == "after");
}

static void commands_1() {

    cout << "===== commands_1 =====" << endl;

    json o = json::parse(Session::makeVoiceStateUpdate(1001, true, 2002));
    assert(o["op"] == 4);
    assert(o["d"]["guild_id"] == "1001");
    assert(o["d"]["channel_id"] == "2002");
    assert(o["d"]["self_mute"] == false);
    assert(o["d"]["self_deaf"] == false);

    o = json::parse(Session::makeVoiceStateUpdate(1001, false, 2002));
    assert(o["d"]["guild_id"] == "1001");
    assert(o["d"]["channel_id"].is_null());

    Log log;
    TestSessionTransport transport;
    Session session(log, transport, BOT_USER);
    assert(session.sendJoin(1, 2) == 0);
    assert(session.sendLeave(1) == 0);
    assert(transport.getSent().size() == 2);
    transport.failSends = true;
    assert(session.sendJoin(1, 2) != 0);

    // Cancelled sessions don't route
    transport.failSends = false;
    SessionEventQueue::Receiver r;
    assert(session.exclusiveServerEvents(1, r));
    session.cancel();
    transport.push(makeVoiceStateUpdate(1, BOT_USER, 1, "x"));
    assert(!session.run2());
    SessionEvent ev;
    assert(!r.tryReceive(ev));
}

static void worker_1() {

    cout << "===== worker_1 =====" << endl;

    Log log;
    TestClock clock(log);
    TestSessionTransport transport;
    Session session(log, transport, BOT_USER);
    TestGatewaySocketFactory factory;
    QueueThread queue(log);
    queue.start();

    TestChannel chan1("vrelay/100/1-0");
    TestChannel chan2("vrelay/100/2-0");
    TestChannel chan3("vrelay/200/3-0");
    {
        auto ch = makeRequestChannel<SessionRequest, SessionResponse>();
        SessionRequestSender sender = std::move(ch.first);
        SessionWorker worker(log, clock, queue, session, factory, std::move(ch.second));

        unique_ptr<CallHandle> call1, call2, call3;
        assert(worker.prepareCall(ChannelRef(&chan1), 100, 1, call1).isOk());
        assert(call1);
        assert(worker.getCallCount() == 1);

        // Same server
        Result r = worker.prepareCall(ChannelRef(&chan2), 100, 2, call2);
        assert(r.code == ErrorCode::ALREADY_IN_CHANNEL_ON_SERVER);
        assert(!call2);
        assert(worker.getCallCount() == 1);
        assert(chan2.getRefs() == 0);

        // Different server, through the request channel
        SessionRequest req;
        req.type = SessionRequest::Type::PREPARE_CALL;
        req.channel = ChannelRef(&chan3);
        req.guildId = 200;
        req.channelId = 3;
        bool done = false;
        sender.request(std::move(req), [&done, &call3](RequestError e, SessionResponse& res) {
            assert(e == RequestError::NONE);
            assert(res.result.isOk());
            call3 = std::move(res.call);
            done = true;
        });
        worker.run2();
        assert(done);
        assert(call3);
        assert(worker.getCallCount() == 2);

        // Dropping the handle ends the call and frees the server
        call1.reset();
        worker.run2();
        worker.run2();
        assert(worker.getCallCount() == 1);
        assert(!session.isClaimed(100));
        assert(worker.prepareCall(ChannelRef(&chan2), 100, 2, call2).isOk());
        assert(worker.getCallCount() == 2);

        // Stop
        done = false;
        SessionRequest stop;
        stop.type = SessionRequest::Type::STOP;
        sender.request(std::move(stop), [&done](RequestError e, SessionResponse&) {
            assert(e == RequestError::NONE);
            done = true;
        });
        worker.run2();
        assert(done);
        assert(worker.isStopped());
    }

    queue.stop();
    assert(chan1.getRefs() == 0);
    assert(chan2.getRefs() == 0);
    assert(chan3.getRefs() == 0);
}

int main(int, const char**) {
    if (sodium_init() < 0)
        return -1;
    routing_1();
    full_1();
    commands_1();
    worker_1();
    return 0;
}
