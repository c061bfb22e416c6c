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

#include <unistd.h>
#include <sys/eventfd.h>

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <utility>

namespace kc1fsz {
    namespace vrelay {

enum class RequestError {
    NONE,
    // The receiver took the request but destroyed the reply without answering
    REQUEST_DROPPED,
    // The receiver is gone (or went away with the request still queued)
    RECEIVER_DROPPED
};

inline const char* requestErrorName(RequestError e) {
    if (e == RequestError::REQUEST_DROPPED)
        return "Request dropped without response";
    else if (e == RequestError::RECEIVER_DROPPED)
        return "Receiver dropped";
    else
        return "None";
}

/**
 * The shared state behind a one-shot reply. Exactly one completion
 * is delivered: either a response or an error.
 */
template <class Res> class ReplyState {
public:

    typedef std::function<void(RequestError err, Res& res)> Callback;

    ReplyState() { }
    ReplyState(Callback cb) : _cb(cb) { }

    void complete(RequestError err, Res&& res) {
        Callback cb;
        {
            std::lock_guard<std::mutex> lock(_lock);
            if (_done)
                return;
            _done = true;
            _err = err;
            _res = std::move(res);
            cb = _cb;
        }
        // Callbacks are fired outside of the lock, on the thread that
        // completed the reply.
        if (cb)
            cb(_err, _res);
        else
            _cv.notify_all();
    }

    RequestError wait(Res& res) {
        std::unique_lock<std::mutex> lock(_lock);
        _cv.wait(lock, [this]() { return _done; });
        res = std::move(_res);
        return _err;
    }

private:

    std::mutex _lock;
    std::condition_variable _cv;
    bool _done = false;
    RequestError _err = RequestError::NONE;
    Res _res;
    Callback _cb;
};

/**
 * The receiver's end of a one-shot reply. Destroying this object without
 * calling send() reports REQUEST_DROPPED to the requester.
 */
template <class Res> class Reply {
public:

    Reply() { }
    Reply(std::shared_ptr<ReplyState<Res>> state) : _state(state) { }
    Reply(const Reply&) = delete;
    Reply& operator=(const Reply&) = delete;

    Reply(Reply&& other) : _state(std::move(other._state)) { }

    Reply& operator=(Reply&& other) {
        if (this != &other) {
            _drop(RequestError::REQUEST_DROPPED);
            _state = std::move(other._state);
        }
        return *this;
    }

    ~Reply() {
        _drop(RequestError::REQUEST_DROPPED);
    }

    bool isValid() const { return (bool)_state; }

    void send(Res res) {
        if (_state) {
            _state->complete(RequestError::NONE, std::move(res));
            _state.reset();
        }
    }

    /**
     * Used when a queued request is discarded because the receiver
     * is going away.
     */
    void abandon() {
        _drop(RequestError::RECEIVER_DROPPED);
    }

private:

    void _drop(RequestError err) {
        if (_state) {
            _state->complete(err, Res());
            _state.reset();
        }
    }

    std::shared_ptr<ReplyState<Res>> _state;
};

template <class Req, class Res> class RequestReceiver;
template <class Req, class Res> class RequestSender;

template <class Req, class Res>
std::pair<RequestSender<Req, Res>, RequestReceiver<Req, Res>> makeRequestChannel();

/**
 * State shared between all senders and the single receiver. The eventfd is
 * signaled on every queued request and whenever the last sender goes away
 * so that a poll() loop can wake up.
 */
template <class Req, class Res> class RequestQueue {
public:

    struct Item {
        Req req;
        Reply<Res> reply;
    };

    RequestQueue() {
        _eventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    }

    ~RequestQueue() {
        if (_eventFd >= 0)
            ::close(_eventFd);
    }

    void signal() {
        if (_eventFd >= 0) {
            uint64_t one = 1;
            // A failed write means the counter is already saturated
            ssize_t rc = ::write(_eventFd, &one, sizeof(one));
            (void)rc;
        }
    }

    void clearSignal() {
        if (_eventFd >= 0) {
            uint64_t count;
            ssize_t rc = ::read(_eventFd, &count, sizeof(count));
            (void)rc;
        }
    }

    std::mutex lock;
    std::deque<Item> items;
    unsigned senderCount = 0;
    bool receiverClosed = false;
    int _eventFd = -1;
};

/**
 * The requesting end. Copies share the same queue. The receiver considers
 * the channel closed once every sender has been destroyed.
 */
template <class Req, class Res> class RequestSender {
public:

    typedef typename ReplyState<Res>::Callback Callback;

    RequestSender() { }

    RequestSender(const RequestSender& other) : _q(other._q) {
        _attach();
    }

    RequestSender& operator=(const RequestSender& other) {
        if (this != &other) {
            _detach();
            _q = other._q;
            _attach();
        }
        return *this;
    }

    RequestSender(RequestSender&& other) : _q(std::move(other._q)) { }

    RequestSender& operator=(RequestSender&& other) {
        if (this != &other) {
            _detach();
            _q = std::move(other._q);
        }
        return *this;
    }

    ~RequestSender() {
        _detach();
    }

    /**
     * Queues the request and blocks the calling thread until the receiver
     * answers or goes away. Never call this from the thread that services
     * the receiver.
     */
    RequestError requestBlocking(Req req, Res& res) {
        auto state = std::make_shared<ReplyState<Res>>();
        if (!_enqueue(std::move(req), state))
            return RequestError::RECEIVER_DROPPED;
        return state->wait(res);
    }

    /**
     * Queues the request and returns immediately. The callback is fired
     * exactly once, on the thread that answers (or drops) the request, or
     * immediately if the receiver is already gone.
     */
    void request(Req req, Callback cb) {
        auto state = std::make_shared<ReplyState<Res>>(cb);
        if (!_enqueue(std::move(req), state))
            state->complete(RequestError::RECEIVER_DROPPED, Res());
    }

    bool isReceiverClosed() const {
        if (!_q)
            return true;
        std::lock_guard<std::mutex> lock(_q->lock);
        return _q->receiverClosed;
    }

private:

    friend std::pair<RequestSender<Req, Res>, RequestReceiver<Req, Res>>
        makeRequestChannel<Req, Res>();

    RequestSender(std::shared_ptr<RequestQueue<Req, Res>> q) : _q(q) {
        _attach();
    }

    bool _enqueue(Req&& req, std::shared_ptr<ReplyState<Res>> state) {
        if (!_q)
            return false;
        {
            std::lock_guard<std::mutex> lock(_q->lock);
            if (_q->receiverClosed)
                return false;
            _q->items.push_back({ std::move(req), Reply<Res>(state) });
        }
        _q->signal();
        return true;
    }

    void _attach() {
        if (_q) {
            std::lock_guard<std::mutex> lock(_q->lock);
            _q->senderCount++;
        }
    }

    void _detach() {
        if (_q) {
            bool last;
            {
                std::lock_guard<std::mutex> lock(_q->lock);
                last = (--_q->senderCount == 0);
            }
            if (last)
                _q->signal();
            _q.reset();
        }
    }

    std::shared_ptr<RequestQueue<Req, Res>> _q;
};

/**
 * The servicing end. Not copyable. Destroying the receiver fails every
 * request still in the queue with RECEIVER_DROPPED.
 */
template <class Req, class Res> class RequestReceiver {
public:

    RequestReceiver() { }
    RequestReceiver(const RequestReceiver&) = delete;
    RequestReceiver& operator=(const RequestReceiver&) = delete;

    RequestReceiver(RequestReceiver&& other) : _q(std::move(other._q)) { }

    RequestReceiver& operator=(RequestReceiver&& other) {
        if (this != &other) {
            _close();
            _q = std::move(other._q);
        }
        return *this;
    }

    ~RequestReceiver() {
        _close();
    }

    /**
     * @returns The file descriptor that becomes readable when a request
     * is queued or the last sender goes away, or -1.
     */
    int getFd() const { return _q ? _q->_eventFd : -1; }

    /**
     * Non-blocking.
     * @returns true if a request was taken off the queue.
     */
    bool tryReceive(Req& req, Reply<Res>& reply) {
        if (!_q)
            return false;
        std::lock_guard<std::mutex> lock(_q->lock);
        if (_q->items.empty()) {
            _q->clearSignal();
            return false;
        }
        req = std::move(_q->items.front().req);
        reply = std::move(_q->items.front().reply);
        _q->items.pop_front();
        return true;
    }

    /**
     * @returns true when every sender is gone and nothing is left
     * in the queue.
     */
    bool isClosed() const {
        if (!_q)
            return true;
        std::lock_guard<std::mutex> lock(_q->lock);
        return _q->senderCount == 0 && _q->items.empty();
    }

private:

    friend std::pair<RequestSender<Req, Res>, RequestReceiver<Req, Res>>
        makeRequestChannel<Req, Res>();

    RequestReceiver(std::shared_ptr<RequestQueue<Req, Res>> q) : _q(q) { }

    void _close() {
        if (!_q)
            return;
        std::deque<typename RequestQueue<Req, Res>::Item> abandoned;
        {
            std::lock_guard<std::mutex> lock(_q->lock);
            _q->receiverClosed = true;
            abandoned.swap(_q->items);
        }
        // Replies are completed outside of the queue lock
        for (auto& item : abandoned)
            item.reply.abandon();
        _q.reset();
    }

    std::shared_ptr<RequestQueue<Req, Res>> _q;
};

template <class Req, class Res>
std::pair<RequestSender<Req, Res>, RequestReceiver<Req, Res>> makeRequestChannel() {
    auto q = std::make_shared<RequestQueue<Req, Res>>();
    return std::pair<RequestSender<Req, Res>, RequestReceiver<Req, Res>>(
        RequestSender<Req, Res>(q), RequestReceiver<Req, Res>(q));
}

    }
}
