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
#include <cstring>
#include <algorithm>

#include <sodium.h>

#include "kc1fsz-tools/Common.h"

#include "VoiceCrypto.h"

using namespace std;

namespace kc1fsz {
    namespace vrelay {

static_assert(VoiceEncryption::KEY_LEN == crypto_secretbox_KEYBYTES, "Key size");
static_assert(VoiceEncryption::TAG_LEN == crypto_secretbox_MACBYTES, "Tag size");
static_assert(VoiceEncryption::NONCE_LEN == crypto_secretbox_NONCEBYTES, "Nonce size");

const char* encryptionModeName(EncryptionMode mode) {
    if (mode == EncryptionMode::SUFFIX)
        return "xsalsa20_poly1305_suffix";
    else if (mode == EncryptionMode::LITE)
        return "xsalsa20_poly1305_lite";
    else
        return "xsalsa20_poly1305";
}

bool parseEncryptionMode(const char* name, EncryptionMode& mode) {
    if (strcmp(name, "xsalsa20_poly1305") == 0) {
        mode = EncryptionMode::NORMAL;
        return true;
    } else if (strcmp(name, "xsalsa20_poly1305_suffix") == 0) {
        mode = EncryptionMode::SUFFIX;
        return true;
    } else if (strcmp(name, "xsalsa20_poly1305_lite") == 0) {
        mode = EncryptionMode::LITE;
        return true;
    }
    return false;
}

unsigned encryptionModeSuffixLen(EncryptionMode mode) {
    if (mode == EncryptionMode::SUFFIX)
        return 24;
    else if (mode == EncryptionMode::LITE)
        return 4;
    else
        return 0;
}

unsigned encryptionModeEntropy(EncryptionMode mode) {
    if (mode == EncryptionMode::SUFFIX)
        return 24;
    else
        return 4;
}

bool selectEncryptionMode(const vector<string>& names, EncryptionMode& mode) {
    bool found = false;
    for (const string& name : names) {
        EncryptionMode candidate;
        if (!parseEncryptionMode(name.c_str(), candidate))
            continue;
        // NOTE: >= so that the last of several equal modes wins
        if (!found || encryptionModeEntropy(candidate) >= encryptionModeEntropy(mode)) {
            mode = candidate;
            found = true;
        }
    }
    return found;
}

bool initCrypto() {
    return sodium_init() >= 0;
}

// ------ VoiceEncryption ----------------------------------------------------

VoiceEncryption::VoiceEncryption(EncryptionMode mode, const uint8_t* key)
:   _mode(mode) {
    memcpy(_key, key, KEY_LEN);
    _liteCounter = randombytes_random();
}

VoiceEncryption::~VoiceEncryption() {
    sodium_memzero(_key, KEY_LEN);
}

int VoiceEncryption::encryptPacket(uint8_t* packet, unsigned packetCapacity, 
    unsigned payloadLen) {

    const unsigned suffixLen = encryptionModeSuffixLen(_mode);
    const unsigned totalLen = RTP_HEADER_LEN + TAG_LEN + payloadLen + suffixLen;
    if (totalLen > packetCapacity)
        return -1;

    uint8_t* tag = packet + RTP_HEADER_LEN;
    uint8_t* body = tag + TAG_LEN;
    uint8_t* suffix = body + payloadLen;

    uint8_t nonce[NONCE_LEN];
    memset(nonce, 0, NONCE_LEN);

    if (_mode == EncryptionMode::NORMAL) {
        memcpy(nonce, packet, RTP_HEADER_LEN);
    } else if (_mode == EncryptionMode::SUFFIX) {
        randombytes_buf(nonce, NONCE_LEN);
    } else {
        pack_uint32_be(_liteCounter, nonce);
        // Wraps
        _liteCounter++;
    }

    if (crypto_secretbox_detached(body, tag, body, payloadLen, nonce, _key) != 0)
        return -1;

    // The nonce travels with the packet for the suffix modes
    memcpy(suffix, nonce, suffixLen);

    return totalLen;
}

// ------ VoiceDecryption ----------------------------------------------------

VoiceDecryption::VoiceDecryption(EncryptionMode mode, const uint8_t* key)
:   _mode(mode) {
    memcpy(_key, key, VoiceEncryption::KEY_LEN);
}

VoiceDecryption::~VoiceDecryption() {
    sodium_memzero(_key, VoiceEncryption::KEY_LEN);
}

unsigned VoiceDecryption::minPacketLength() const {
    return VoiceEncryption::RTP_HEADER_LEN + VoiceEncryption::TAG_LEN + 
        encryptionModeSuffixLen(_mode);
}

int VoiceDecryption::decryptPacket(uint8_t* packet, unsigned packetLen, 
    unsigned headerLen, unsigned& bodyStart, unsigned& bodyEnd) const {

    const unsigned suffixLen = encryptionModeSuffixLen(_mode);
    if (packetLen < headerLen + VoiceEncryption::TAG_LEN + suffixLen)
        return -1;

    uint8_t nonce[VoiceEncryption::NONCE_LEN];
    memset(nonce, 0, VoiceEncryption::NONCE_LEN);
    if (_mode == EncryptionMode::NORMAL)
        memcpy(nonce, packet, std::min(headerLen, VoiceEncryption::NONCE_LEN));
    else 
        memcpy(nonce, packet + packetLen - suffixLen, suffixLen);

    uint8_t* tag = packet + headerLen;
    uint8_t* body = tag + VoiceEncryption::TAG_LEN;
    const unsigned bodyLen = packetLen - headerLen - VoiceEncryption::TAG_LEN - suffixLen;

    if (crypto_secretbox_open_detached(body, body, tag, bodyLen, nonce, _key) != 0)
        return -2;

    bodyStart = headerLen + VoiceEncryption::TAG_LEN;
    bodyEnd = bodyStart + bodyLen;
    return 0;
}

    }
}
