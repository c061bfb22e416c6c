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
#include "kc1fsz-tools/Log.h"

#include "ThreadUtil.h"
#include "QueueThread.h"

using namespace std;

namespace kc1fsz {
    namespace vrelay {

QueueThread::QueueThread(Log& log)
:   _log(log),
    _runFlag(false) {
}

QueueThread::~QueueThread() {
    stop();
}

bool QueueThread::start() {
    if (_thread.joinable())
        return false;
    _runFlag.store(true);
    _thread = std::thread(_loop, this);
    return true;
}

void QueueThread::stop() {
    _runFlag.store(false);
    if (_thread.joinable())
        _thread.join();
}

Result QueueThread::request(const ChannelRef& channel, ChannelWrite write) {
    if (!_runFlag.load() || !channel)
        return makeInternalError("Could not reach queue thread");
    Item item;
    item.channel = channel;
    item.write = std::move(write);
    _queue.push(item);
    return makeOk();
}

Result QueueThread::requestHangup(const ChannelRef& channel) {
    ChannelWrite w;
    w.type = ChannelWrite::Type::HANGUP;
    return request(channel, std::move(w));
}

Result QueueThread::requestControl(const ChannelRef& channel, ControlType control) {
    ChannelWrite w;
    w.type = ChannelWrite::Type::CONTROL;
    w.control = control;
    return request(channel, std::move(w));
}

Result QueueThread::requestFrame(const ChannelRef& channel, const MediaFrame& frame) {
    ChannelWrite w;
    w.type = ChannelWrite::Type::FRAME;
    w.frame = frame;
    return request(channel, std::move(w));
}

void QueueThread::_perform(Item& item) {
    int rc;
    switch (item.write.type) {
    case ChannelWrite::Type::HANGUP:
        rc = item.channel->queueHangup();
        break;
    case ChannelWrite::Type::CONTROL:
        rc = item.channel->queueControl(item.write.control);
        break;
    default:
        rc = item.channel->queueFrame(item.write.frame);
        break;
    }
    if (rc != 0)
        _log.error("Queue operation failed on %s (%d)", item.channel->getName(), rc);
}

void QueueThread::_loop(QueueThread* self) {

    setThreadName("vrelay_queue");
    self->_log.info("Start queue thread");

    Item item;
    while (self->_runFlag.load()) {
        // Use a long timeout to avoid high CPU
        if (self->_queue.try_pop(item, 500)) {
            self->_perform(item);
            // Drop the channel reference right away
            item.channel.reset();
        }
    }

    // Anything queued before the stop is still delivered
    while (self->_queue.try_pop(item)) {
        self->_perform(item);
        item.channel.reset();
    }

    self->_log.info("End queue thread");
}

    }
}
