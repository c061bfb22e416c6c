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
#include <mutex>
#include <string>
#include <vector>

namespace kc1fsz {
    namespace vrelay {

/**
 * Audio formats that the telephony runtime may offer. Only signed-linear
 * 16-bit PCM at 48kHz is carried by this channel type.
 */
enum class AudioFormat { UNKNOWN, SLIN, SLIN16, SLIN48, ULAW, OPUS };

const char* audioFormatName(AudioFormat format);

/**
 * A set of formats with their framing.
 */
class FormatCaps {
public:

    struct Entry {
        AudioFormat format;
        unsigned framingMs;
    };

    void append(AudioFormat format, unsigned framingMs);

    bool contains(AudioFormat format) const;

    /**
     * @returns true if the two sets have at least one format in common.
     */
    bool isCompatible(const FormatCaps& other) const;

    /**
     * @returns The format names separated by '|'.
     */
    std::string names() const;

    bool empty() const { return _entries.empty(); }

    const std::vector<Entry>& entries() const { return _entries; }

private:

    std::vector<Entry> _entries;
};

enum class ControlType { RINGING, ANSWER };

/**
 * One block of audio moving between the runtime and this channel.
 */
struct MediaFrame {
    AudioFormat format = AudioFormat::SLIN48;
    std::vector<int16_t> samples;
    // Length of the audio in milliseconds
    unsigned ms = 0;
};

/**
 * A refcounted channel owned by the telephony runtime. Channel state may
 * only be changed while holding the channel lock (see ChannelLock).
 */
class TelephonyChannel {
public:

    virtual ~TelephonyChannel() { }

    virtual void ref() = 0;
    virtual void unref() = 0;

    virtual void lock() = 0;
    virtual void unlock() = 0;

    virtual const char* getName() const = 0;

    virtual void setReadFormat(AudioFormat format) = 0;
    virtual void setWriteFormat(AudioFormat format) = 0;
    virtual void setNativeFormats(const FormatCaps& caps) = 0;
    virtual FormatCaps getNativeFormats() const = 0;

    virtual void setTechData(void* data) = 0;
    virtual void* getTechData() const = 0;

    /**
     * The queue functions take the channel lock internally.
     * @returns 0 on success.
     */
    virtual int queueHangup() = 0;
    virtual int queueControl(ControlType type) = 0;
    virtual int queueFrame(const MediaFrame& frame) = 0;
};

/**
 * The services that the telephony runtime provides to this module.
 */
class TelephonyRuntime {
public:

    virtual ~TelephonyRuntime() { }

    /**
     * Allocates a new channel. The channel is returned LOCKED and with one
     * reference that belongs to the caller.
     *
     * @returns The channel or 0 on failure.
     */
    virtual TelephonyChannel* allocChannel(TelephonyChannel* requestor, 
        const char* name) = 0;

    virtual void log(const char* sev, const char* msg) = 0;
};

/**
 * Holds one reference on a channel. Copies take another reference.
 */
class ChannelRef {
public:

    ChannelRef() { }

    /**
     * Takes a new reference on the channel.
     */
    explicit ChannelRef(TelephonyChannel* channel) 
    :   _channel(channel) {
        if (_channel)
            _channel->ref();
    }

    /**
     * Takes over a reference that the caller already holds.
     */
    static ChannelRef adopt(TelephonyChannel* channel) {
        ChannelRef r;
        r._channel = channel;
        return r;
    }

    ChannelRef(const ChannelRef& other) 
    :   ChannelRef(other._channel) { }

    ChannelRef(ChannelRef&& other) noexcept
    :   _channel(other._channel) {
        other._channel = 0;
    }

    ChannelRef& operator=(const ChannelRef& other) {
        if (this != &other) {
            ChannelRef copy(other);
            std::swap(_channel, copy._channel);
        }
        return *this;
    }

    ChannelRef& operator=(ChannelRef&& other) noexcept {
        if (this != &other) {
            reset();
            _channel = other._channel;
            other._channel = 0;
        }
        return *this;
    }

    ~ChannelRef() { reset(); }

    void reset() {
        if (_channel) {
            _channel->unref();
            _channel = 0;
        }
    }

    /**
     * Gives up the reference without releasing it.
     */
    TelephonyChannel* release() {
        TelephonyChannel* c = _channel;
        _channel = 0;
        return c;
    }

    TelephonyChannel* get() const { return _channel; }
    TelephonyChannel* operator->() const { return _channel; }
    explicit operator bool() const { return _channel != 0; }

private:

    TelephonyChannel* _channel = 0;
};

/**
 * Holds the channel lock for the life of the object.
 */
class ChannelLock {
public:

    explicit ChannelLock(TelephonyChannel& channel) 
    :   _channel(channel) {
        _channel.lock();
    }

    /**
     * For a channel that is already locked (i.e. one that was just 
     * allocated).
     */
    ChannelLock(TelephonyChannel& channel, std::adopt_lock_t) 
    :   _channel(channel) {
    }

    ChannelLock(const ChannelLock&) = delete;
    ChannelLock& operator=(const ChannelLock&) = delete;

    ~ChannelLock() { _channel.unlock(); }

    TelephonyChannel& channel() { return _channel; }

private:

    TelephonyChannel& _channel;
};

    }
}
