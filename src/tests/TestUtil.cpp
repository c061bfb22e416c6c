#include <unistd.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>

#include <chrono>
#include <cstring>
#include <iostream>

#include "VoiceDataChannel.h"
#include "TestUtil.h"

using namespace std;

namespace kc1fsz {

// ----- TestChannel -----------------------------------------------------------

int TestChannel::queueHangup() {
    std::lock_guard<std::mutex> lock(_lock);
    _hangups++;
    return 0;
}

int TestChannel::queueControl(ControlType type) {
    std::lock_guard<std::mutex> lock(_lock);
    _controls.push_back(type);
    return 0;
}

int TestChannel::queueFrame(const MediaFrame& frame) {
    std::lock_guard<std::mutex> lock(_lock);
    _frames.push_back(frame);
    return 0;
}

unsigned TestChannel::getHangupCount() {
    std::lock_guard<std::mutex> lock(_lock);
    return _hangups;
}

std::vector<ControlType> TestChannel::getControls() {
    std::lock_guard<std::mutex> lock(_lock);
    return _controls;
}

std::vector<MediaFrame> TestChannel::getFrames() {
    std::lock_guard<std::mutex> lock(_lock);
    return _frames;
}

// ----- TestRuntime -----------------------------------------------------------

TelephonyChannel* TestRuntime::allocChannel(TelephonyChannel*, const char* name) {
    std::lock_guard<std::mutex> lock(_lock);
    _channels.push_back(std::make_unique<TestChannel>(name));
    TestChannel* c = _channels.back().get();
    c->ref();
    c->lock();
    return c;
}

void TestRuntime::log(const char* sev, const char* msg) {
    std::lock_guard<std::mutex> lock(_lock);
    cout << sev << ": " << msg << endl;
    _lines.push_back(msg);
}

TestChannel* TestRuntime::getChannel(unsigned i) {
    std::lock_guard<std::mutex> lock(_lock);
    return i < _channels.size() ? _channels[i].get() : 0;
}

unsigned TestRuntime::getLogCount(const char* fragment) {
    std::lock_guard<std::mutex> lock(_lock);
    unsigned n = 0;
    for (const string& l : _lines)
        if (l.find(fragment) != string::npos)
            n++;
    return n;
}

// ----- TestGatewaySocket -----------------------------------------------------

int TestGatewaySocket::sendText(const std::string& text) {
    if (closed || broken)
        return -1;
    sent.push_back(text);
    return 0;
}

int TestGatewaySocket::receiveText(std::string& text) {
    if (broken)
        return -1;
    if (incoming.empty())
        return 0;
    text = incoming.front();
    incoming.pop_front();
    return 1;
}

unsigned TestGatewaySocket::countSent(const char* fragment) const {
    unsigned n = 0;
    for (const string& s : sent)
        if (s.find(fragment) != string::npos)
            n++;
    return n;
}

std::unique_ptr<GatewaySocket> TestGatewaySocketFactory::open(const std::string& url) {
    lastUrl = url;
    openCount++;
    auto s = std::make_unique<TestGatewaySocket>();
    last = s.get();
    return s;
}

// ----- TestSessionTransport --------------------------------------------------

bool TestSessionTransport::nextEvent(SessionEvent& ev) {
    std::lock_guard<std::mutex> lock(_lock);
    if (_incoming.empty())
        return false;
    ev = _incoming.front();
    _incoming.pop_front();
    return true;
}

int TestSessionTransport::send(const std::string& text) {
    std::lock_guard<std::mutex> lock(_lock);
    if (failSends)
        return -1;
    _sent.push_back(text);
    return 0;
}

void TestSessionTransport::push(const SessionEvent& ev) {
    std::lock_guard<std::mutex> lock(_lock);
    _incoming.push_back(ev);
}

unsigned TestSessionTransport::countSent(const char* fragment) {
    std::lock_guard<std::mutex> lock(_lock);
    unsigned n = 0;
    for (const string& s : _sent)
        if (s.find(fragment) != string::npos)
            n++;
    return n;
}

std::vector<std::string> TestSessionTransport::getSent() {
    std::lock_guard<std::mutex> lock(_lock);
    return _sent;
}

std::unique_ptr<SessionTransport> TestSessionTransportFactory::open(const std::string&) {
    auto t = std::make_unique<TestSessionTransport>();
    last.store(t.get());
    return t;
}

// ----- TestVoiceServer -------------------------------------------------------

TestVoiceServer::TestVoiceServer() 
:   _runFlag(true),
    _packets(0),
    _discoveries(0),
    _answering(true) {

    _fd = socket(AF_INET, SOCK_DGRAM, 0);
    sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    bind(_fd, (const sockaddr*)&addr, sizeof(addr));
    socklen_t addrLen = sizeof(addr);
    getsockname(_fd, (sockaddr*)&addr, &addrLen);
    _port = ntohs(addr.sin_port);

    // Short timeout so that the thread notices the stop
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 100 * 1000;
    setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    _thread = std::thread(&TestVoiceServer::_run, this);
}

TestVoiceServer::~TestVoiceServer() {
    _runFlag.store(false);
    _thread.join();
    ::close(_fd);
}

void TestVoiceServer::_run() {
    while (_runFlag.load()) {
        uint8_t buf[2048];
        sockaddr_in peer;
        socklen_t peerLen = sizeof(peer);
        int rc = recvfrom(_fd, buf, sizeof(buf), 0, (sockaddr*)&peer, &peerLen);
        if (rc <= 0)
            continue;
        if (rc == (int)VoiceDataChannel::DISCOVERY_PACKET_LEN && buf[0] == 0 && buf[1] == 1) {
            _discoveries++;
            if (!_answering.load())
                continue;
            uint32_t ssrc = ((uint32_t)buf[4] << 24) | ((uint32_t)buf[5] << 16) |
                ((uint32_t)buf[6] << 8) | buf[7];
            uint8_t resp[VoiceDataChannel::DISCOVERY_PACKET_LEN];
            VoiceDataChannel::makeDiscoveryResponse(ssrc, "127.0.0.1", 
                ntohs(peer.sin_port), resp);
            sendto(_fd, resp, sizeof(resp), 0, (const sockaddr*)&peer, peerLen);
        }
        else {
            _packets++;
        }
    }
}

// ----- Helpers ---------------------------------------------------------------

SessionEvent makeVoiceStateUpdate(uint64_t guildId, uint64_t userId, uint64_t channelId,
    const char* sessionId) {
    SessionEvent ev;
    ev.type = SessionEvent::Type::VOICE_STATE_UPDATE;
    ev.hasGuildId = true;
    ev.guildId = guildId;
    ev.userId = userId;
    ev.hasChannelId = true;
    ev.channelId = channelId;
    ev.sessionId = sessionId;
    return ev;
}

SessionEvent makeVoiceServerUpdate(uint64_t guildId, const char* token, 
    const char* endpoint) {
    SessionEvent ev;
    ev.type = SessionEvent::Type::VOICE_SERVER_UPDATE;
    ev.hasGuildId = true;
    ev.guildId = guildId;
    ev.token = token;
    ev.hasEndpoint = true;
    ev.endpoint = endpoint;
    return ev;
}

bool waitFor(std::function<bool()> cond, unsigned timeoutMs) {
    for (unsigned i = 0; i < timeoutMs / 10; i++) {
        if (cond())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return cond();
}

}
