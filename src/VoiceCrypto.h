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

#include <cstdint>
#include <string>
#include <vector>

namespace kc1fsz {
    namespace vrelay {

/**
 * The nonce strategies that the voice server may offer for the
 * XSalsa20-Poly1305 secret box.
 */
enum class EncryptionMode {
    // The nonce is the 12-byte RTP header, zero padded
    NORMAL,
    // A random 24-byte nonce is appended to the packet
    SUFFIX,
    // A 4-byte incrementing counter is appended to the packet
    LITE
};

const char* encryptionModeName(EncryptionMode mode);

/**
 * @returns false if the name is not one of the supported modes.
 */
bool parseEncryptionMode(const char* name, EncryptionMode& mode);

/**
 * @returns The number of nonce bytes carried at the end of each packet.
 */
unsigned encryptionModeSuffixLen(EncryptionMode mode);

/**
 * @returns The effective entropy (bytes) of the nonces that the mode
 * produces. Used to rank the modes.
 */
unsigned encryptionModeEntropy(EncryptionMode mode);

/**
 * Picks the mode with the highest nonce entropy from the names that
 * the server advertised. Unknown names are ignored. When several modes
 * rank equally the one advertised last is selected.
 *
 * @returns false if none of the names are usable.
 */
bool selectEncryptionMode(const std::vector<std::string>& names, EncryptionMode& mode);

/**
 * Must be called once before any crypto is used. Safe to call more
 * than once.
 */
bool initCrypto();

class VoiceEncryption {
public:

    static const unsigned KEY_LEN = 32;
    static const unsigned TAG_LEN = 16;
    static const unsigned NONCE_LEN = 24;
    static const unsigned RTP_HEADER_LEN = 12;

    VoiceEncryption(EncryptionMode mode, const uint8_t* key);
    ~VoiceEncryption();

    /**
     * Encrypts a clear-text RTP packet in place. The packet is laid out
     * as a 12-byte header, a TAG_LEN gap, payloadLen bytes of payload and
     * then enough room for the nonce suffix of the mode.
     *
     * @returns The total length of the packet on the wire, or -1 on
     * failure.
     */
    int encryptPacket(uint8_t* packet, unsigned packetCapacity, unsigned payloadLen);

    EncryptionMode getMode() const { return _mode; }

private:

    EncryptionMode _mode;
    uint8_t _key[KEY_LEN];
    // Only used in LITE mode, starts at a random value
    uint32_t _liteCounter;
};

class VoiceDecryption {
public:

    VoiceDecryption(EncryptionMode mode, const uint8_t* key);
    ~VoiceDecryption();

    /**
     * @returns The smallest packet that could possibly be decrypted.
     */
    unsigned minPacketLength() const;

    /**
     * Decrypts a packet in place. The first headerLen bytes are the
     * clear-text header which is also the nonce in NORMAL mode. The
     * payload starts with the authentication tag.
     *
     * @param bodyStart Set to the offset of the decrypted payload.
     * @param bodyEnd Set to the offset just past the decrypted payload
     * (i.e. before any nonce suffix).
     * @returns 0 on success, -1 if the packet is malformed and -2 if
     * authentication failed.
     */
    int decryptPacket(uint8_t* packet, unsigned packetLen, unsigned headerLen,
        unsigned& bodyStart, unsigned& bodyEnd) const;

    EncryptionMode getMode() const { return _mode; }

private:

    EncryptionMode _mode;
    uint8_t _key[VoiceEncryption::KEY_LEN];
};

    }
}
