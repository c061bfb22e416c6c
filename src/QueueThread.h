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

#include <atomic>
#include <thread>

#include "kc1fsz-tools/threadsafequeue2.h"

#include "Error.h"
#include "Telephony.h"

namespace kc1fsz {

class Log;

    namespace vrelay {

/**
 * Something to be put onto a channel's queue in the telephony runtime.
 */
struct ChannelWrite {
    enum class Type { HANGUP, CONTROL, FRAME };
    Type type = Type::HANGUP;
    ControlType control = ControlType::RINGING;
    MediaFrame frame;
};

/**
 * A dedicated thread that performs the channel queue operations. Queueing
 * onto a channel takes the channel's lock, which must never happen on the
 * worker event loop.
 */
class QueueThread {
public:

    QueueThread(Log& log);
    ~QueueThread();

    QueueThread(const QueueThread&) = delete;
    QueueThread& operator=(const QueueThread&) = delete;

    bool start();

    /**
     * Waits for the thread to finish whatever is already queued.
     */
    void stop();

    bool isRunning() const { return _runFlag.load(); }

    /**
     * Non-blocking. The channel reference keeps the channel alive until
     * the write has been performed.
     */
    Result request(const ChannelRef& channel, ChannelWrite write);

    Result requestHangup(const ChannelRef& channel);
    Result requestControl(const ChannelRef& channel, ControlType control);
    Result requestFrame(const ChannelRef& channel, const MediaFrame& frame);

private:

    struct Item {
        ChannelRef channel;
        ChannelWrite write;
    };

    static void _loop(QueueThread* self);
    void _perform(Item& item);

    Log& _log;
    threadsafequeue2<Item> _queue;
    std::atomic<bool> _runFlag;
    std::thread _thread;
};

    }
}
