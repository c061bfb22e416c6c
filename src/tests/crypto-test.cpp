#include <iostream>
#include <cassert>
#include <cstring>

#include <sodium.h>

#include "RtpUtil.h"
#include "VoiceCrypto.h"

using namespace std;
using namespace kc1fsz;
using namespace kc1fsz::vrelay;

static const char* PAYLOAD = "This is a test of the voice payload";

static void roundTrip(EncryptionMode mode) {

    cout << "===== roundTrip " << encryptionModeName(mode) << " =====" << endl;

    uint8_t key[VoiceEncryption::KEY_LEN];
    randombytes_buf(key, sizeof(key));

    VoiceEncryption enc(mode, key);
    VoiceDecryption dec(mode, key);

    const unsigned payloadLen = strlen(PAYLOAD);
    uint8_t packet[VOICE_PACKET_MAX];
    writeRtpHeader(packet, 7, 960, 0x1234);
    memcpy(packet + RTP_HEADER_LEN + VoiceEncryption::TAG_LEN, PAYLOAD, payloadLen);

    int len = enc.encryptPacket(packet, sizeof(packet), payloadLen);
    assert(len == (int)(RTP_HEADER_LEN + VoiceEncryption::TAG_LEN + payloadLen + 
        encryptionModeSuffixLen(mode)));
    // The header stays in the clear
    assert(rtpSequence(packet) == 7);
    assert(rtpSsrc(packet) == 0x1234);
    // The payload does not
    assert(memcmp(packet + RTP_HEADER_LEN + VoiceEncryption::TAG_LEN, PAYLOAD, payloadLen) != 0);

    // Keep a copy for the tamper check
    uint8_t copy[VOICE_PACKET_MAX];
    memcpy(copy, packet, len);

    unsigned bodyStart = 0, bodyEnd = 0;
    assert(dec.decryptPacket(packet, len, RTP_HEADER_LEN, bodyStart, bodyEnd) == 0);
    assert(bodyStart == RTP_HEADER_LEN + VoiceEncryption::TAG_LEN);
    assert(bodyEnd - bodyStart == payloadLen);
    assert(memcmp(packet + bodyStart, PAYLOAD, payloadLen) == 0);

    // One flipped bit fails authentication
    copy[RTP_HEADER_LEN + VoiceEncryption::TAG_LEN + 3] ^= 0x01;
    assert(dec.decryptPacket(copy, len, RTP_HEADER_LEN, bodyStart, bodyEnd) == -2);

    // Too short to hold the tag (and suffix)
    assert(dec.decryptPacket(copy, dec.minPacketLength() - 1, RTP_HEADER_LEN, 
        bodyStart, bodyEnd) == -1);
}

static void wrongKey_1() {

    cout << "===== wrongKey_1 =====" << endl;

    uint8_t key1[VoiceEncryption::KEY_LEN];
    uint8_t key2[VoiceEncryption::KEY_LEN];
    memset(key1, 1, sizeof(key1));
    memset(key2, 2, sizeof(key2));

    VoiceEncryption enc(EncryptionMode::LITE, key1);
    VoiceDecryption dec(EncryptionMode::LITE, key2);

    uint8_t packet[VOICE_PACKET_MAX];
    memset(packet, 0, sizeof(packet));
    writeRtpHeader(packet, 1, 2, 3);
    int len = enc.encryptPacket(packet, sizeof(packet), 20);
    assert(len > 0);
    unsigned bodyStart, bodyEnd;
    assert(dec.decryptPacket(packet, len, RTP_HEADER_LEN, bodyStart, bodyEnd) == -2);
}

static void capacity_1() {

    cout << "===== capacity_1 =====" << endl;

    uint8_t key[VoiceEncryption::KEY_LEN];
    memset(key, 9, sizeof(key));
    VoiceEncryption enc(EncryptionMode::SUFFIX, key);
    uint8_t packet[64];
    memset(packet, 0, sizeof(packet));
    // 12 + 16 + 20 + 24 does not fit
    assert(enc.encryptPacket(packet, sizeof(packet), 20) == -1);
}

int main(int, const char**) {
    assert(initCrypto());
    roundTrip(EncryptionMode::NORMAL);
    roundTrip(EncryptionMode::SUFFIX);
    roundTrip(EncryptionMode::LITE);
    wrongKey_1();
    capacity_1();
    return 0;
}
