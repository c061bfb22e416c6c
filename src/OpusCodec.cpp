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
#include <opus/opus.h>

#include "RtpUtil.h"
#include "OpusCodec.h"

namespace kc1fsz {
    namespace vrelay {

VoiceEncoder::VoiceEncoder() {
    int err;
    _encoder = opus_encoder_create(SAMPLE_RATE, 1, OPUS_APPLICATION_VOIP, &err);
    if (err != OPUS_OK)
        _encoder = 0;
}

VoiceEncoder::~VoiceEncoder() {
    if (_encoder)
        opus_encoder_destroy(_encoder);
}

int VoiceEncoder::encode(const int16_t* pcm, unsigned samples, uint8_t* out, 
    unsigned outCapacity) {
    if (!_encoder)
        return -1;
    int bytes = opus_encode(_encoder, pcm, samples, out, outCapacity);
    if (bytes < 0)
        return -2;
    return bytes;
}

VoiceDecoder::VoiceDecoder() {
    int err;
    _decoder = opus_decoder_create(SAMPLE_RATE, CHANNELS, &err);
    if (err != OPUS_OK)
        _decoder = 0;
}

VoiceDecoder::~VoiceDecoder() {
    if (_decoder)
        opus_decoder_destroy(_decoder);
}

int VoiceDecoder::decode(const uint8_t* data, unsigned len, int16_t* pcm, 
    unsigned maxSamples) {
    if (!_decoder)
        return -1;
    int samples = opus_decode(_decoder, data, len, pcm, maxSamples, 0);
    if (samples < 0)
        return -2;
    return samples;
}

    }
}
