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

struct OpusEncoder;
struct OpusDecoder;

namespace kc1fsz {
    namespace vrelay {

/**
 * 48kHz mono opus encoder tuned for voice.
 */
class VoiceEncoder {
public:

    VoiceEncoder();
    ~VoiceEncoder();

    VoiceEncoder(const VoiceEncoder&) = delete;
    VoiceEncoder& operator=(const VoiceEncoder&) = delete;

    /**
     * @returns true if the underlying encoder was created.
     */
    bool isValid() const { return _encoder != 0; }

    /**
     * @param pcm Mono 48kHz samples
     * @returns The number of bytes written to out, or negative on error.
     */
    int encode(const int16_t* pcm, unsigned samples, uint8_t* out, unsigned outCapacity);

private:

    OpusEncoder* _encoder = 0;
};

/**
 * 48kHz stereo opus decoder. The voice service always sends stereo.
 */
class VoiceDecoder {
public:

    static const unsigned CHANNELS = 2;

    VoiceDecoder();
    ~VoiceDecoder();

    VoiceDecoder(const VoiceDecoder&) = delete;
    VoiceDecoder& operator=(const VoiceDecoder&) = delete;

    bool isValid() const { return _decoder != 0; }

    /**
     * @param pcm Receives interleaved stereo samples.
     * @param maxSamples The capacity of pcm in samples per channel.
     * @returns The number of samples (per channel) decoded, or negative
     * on error.
     */
    int decode(const uint8_t* data, unsigned len, int16_t* pcm, unsigned maxSamples);

private:

    OpusDecoder* _decoder = 0;
};

    }
}
