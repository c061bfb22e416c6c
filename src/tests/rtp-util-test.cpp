#include <iostream>
#include <cassert>
#include <cstring>
#include <string>
#include <vector>

#include "kc1fsz-tools/Log.h"

#include "RtpUtil.h"
#include "VoiceCrypto.h"
#include "VoiceDataChannel.h"

using namespace std;
using namespace kc1fsz;
using namespace kc1fsz::vrelay;

static void header_1() {

    cout << "===== header_1 =====" << endl;

    uint8_t buf[RTP_HEADER_LEN];
    writeRtpHeader(buf, 0x1234, 0xdeadbeef, 0x01020304);
    assert(buf[0] == 0x80);
    assert(buf[1] == 0x78);
    assert(rtpSequence(buf) == 0x1234);
    assert(rtpTimestamp(buf) == 0xdeadbeef);
    assert(rtpSsrc(buf) == 0x01020304);

    unsigned headerLen = 0;
    assert(demuxPacket(buf, sizeof(buf), headerLen) == PacketKind::RTP);
    assert(headerLen == 12);
}

static void demux_1() {

    cout << "===== demux_1 =====" << endl;

    unsigned headerLen = 0;
    uint8_t one[1] = { 0x80 };
    assert(demuxPacket(one, 1, headerLen) == PacketKind::TOO_SMALL);

    // Sender report
    uint8_t rtcp[8] = { 0x80, 200, 0, 1, 0, 0, 0, 1 };
    assert(demuxPacket(rtcp, sizeof(rtcp), headerLen) == PacketKind::RTCP);
    assert(headerLen == RTCP_HEADER_LEN);

    // Wrong version
    uint8_t bad[12] = { 0x40, 0x78 };
    assert(demuxPacket(bad, sizeof(bad), headerLen) == PacketKind::FAILED_PARSE);

    // Two contributing sources make the header longer
    uint8_t csrc[20];
    memset(csrc, 0, sizeof(csrc));
    csrc[0] = 0x82;
    csrc[1] = 0x78;
    assert(demuxPacket(csrc, sizeof(csrc), headerLen) == PacketKind::RTP);
    assert(headerLen == 20);
    assert(demuxPacket(csrc, 16, headerLen) == PacketKind::FAILED_PARSE);
}

static void extensions_1() {

    cout << "===== extensions_1 =====" << endl;

    const uint8_t data[] = { 0xBE, 0xDE, 0x00, 0x02, 0x32, 0xDF, 0x69, 0x04, 
        0x10, 0xFF, 0x90, 0x00, 0xF8, 0xFF, 0xFE };
    unsigned newStart = 0;
    assert(skipOverExtensions(data, 0, sizeof(data), newStart));
    assert(newStart == 12);

    // No magic, nothing skipped
    const uint8_t plain[] = { 0xF8, 0xFF, 0xFE };
    assert(skipOverExtensions(plain, 0, sizeof(plain), newStart));
    assert(newStart == 0);

    // Claims more entries than there is data
    const uint8_t shortData[] = { 0xBE, 0xDE, 0x00, 0x04, 0x32, 0xDF };
    assert(!skipOverExtensions(shortData, 0, sizeof(shortData), newStart));

    // Nothing at all
    assert(!skipOverExtensions(plain, 2, 2, newStart));
}

static void modes_1() {

    cout << "===== modes_1 =====" << endl;

    EncryptionMode mode;
    assert(parseEncryptionMode("xsalsa20_poly1305", mode));
    assert(mode == EncryptionMode::NORMAL);
    assert(parseEncryptionMode("xsalsa20_poly1305_suffix", mode));
    assert(mode == EncryptionMode::SUFFIX);
    assert(parseEncryptionMode("xsalsa20_poly1305_lite", mode));
    assert(mode == EncryptionMode::LITE);
    assert(!parseEncryptionMode("aead_aes256_gcm", mode));
    assert(strcmp(encryptionModeName(EncryptionMode::SUFFIX), "xsalsa20_poly1305_suffix") == 0);

    assert(encryptionModeSuffixLen(EncryptionMode::NORMAL) == 0);
    assert(encryptionModeSuffixLen(EncryptionMode::SUFFIX) == 24);
    assert(encryptionModeSuffixLen(EncryptionMode::LITE) == 4);

    // Suffix is always preferred
    vector<string> offered = { "xsalsa20_poly1305_lite", "xsalsa20_poly1305_suffix", 
        "xsalsa20_poly1305" };
    assert(selectEncryptionMode(offered, mode));
    assert(mode == EncryptionMode::SUFFIX);

    // Normal and lite rank the same, the last one offered wins
    offered = { "xsalsa20_poly1305", "xsalsa20_poly1305_lite" };
    assert(selectEncryptionMode(offered, mode));
    assert(mode == EncryptionMode::LITE);
    offered = { "xsalsa20_poly1305_lite", "xsalsa20_poly1305" };
    assert(selectEncryptionMode(offered, mode));
    assert(mode == EncryptionMode::NORMAL);

    // Unknown names are skipped
    offered = { "aead_aes256_gcm_rtpsize" };
    assert(!selectEncryptionMode(offered, mode));
}

static void discovery_1() {

    cout << "===== discovery_1 =====" << endl;

    uint8_t buf[VoiceDataChannel::DISCOVERY_PACKET_LEN];
    VoiceDataChannel::makeDiscoveryRequest(0x11223344, buf);
    assert(buf[0] == 0 && buf[1] == 1);
    assert(buf[2] == 0 && buf[3] == 70);
    assert(buf[4] == 0x11 && buf[7] == 0x44);

    VoiceDataChannel::makeDiscoveryResponse(0x11223344, "203.0.113.7", 50004, buf);
    char addr[64];
    uint16_t port = 0;
    assert(VoiceDataChannel::parseDiscoveryResponse(buf, sizeof(buf), addr, sizeof(addr), port) == 0);
    assert(strcmp(addr, "203.0.113.7") == 0);
    assert(port == 50004);

    // Too short
    assert(VoiceDataChannel::parseDiscoveryResponse(buf, 40, addr, sizeof(addr), port) < 0);

    // A request is not a response
    VoiceDataChannel::makeDiscoveryRequest(1, buf);
    assert(VoiceDataChannel::parseDiscoveryResponse(buf, sizeof(buf), addr, sizeof(addr), port) < 0);

    // Not an address
    VoiceDataChannel::makeDiscoveryResponse(1, "not-an-address", 1, buf);
    assert(VoiceDataChannel::parseDiscoveryResponse(buf, sizeof(buf), addr, sizeof(addr), port) < 0);

    // IPv6 is fine
    VoiceDataChannel::makeDiscoveryResponse(1, "2001:db8::1", 1, buf);
    assert(VoiceDataChannel::parseDiscoveryResponse(buf, sizeof(buf), addr, sizeof(addr), port) == 0);
}

int main(int, const char**) {
    header_1();
    demux_1();
    extensions_1();
    modes_1();
    discovery_1();
    return 0;
}
