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

#include <deque>
#include <memory>
#include <mutex>
#include <utility>

namespace kc1fsz {
    namespace vrelay {

/**
 * A single-producer/single-consumer notification queue with a bounded
 * number of reservable slots.
 *
 * High-volume producers (i.e. inbound media) must reserve() a slot before
 * doing the work that produces an item, which bounds the backlog when the
 * consumer stalls. Low-volume control notifications use send(), which
 * does not count against the slots.
 *
 * Either end can observe that the other end has been destroyed.
 */
template <class T> class NotificationQueue {
public:

    struct State {
        std::mutex lock;
        // The flag marks items that came through a reservation
        std::deque<std::pair<T, bool>> items;
        unsigned capacity = 0;
        unsigned reserved = 0;
        unsigned slotted = 0;
        bool senderGone = false;
        bool receiverGone = false;
    };

    class Sender;

    class Permit {
    public:

        Permit() { }
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit(Permit&& other) : _s(std::move(other._s)) { }
        Permit& operator=(Permit&& other) {
            if (this != &other) {
                _release();
                _s = std::move(other._s);
            }
            return *this;
        }
        ~Permit() { _release(); }

        bool isValid() const { return (bool)_s; }

        /**
         * Consumes the reservation. Never fails, although the item is
         * discarded if the receiver has gone away in the meantime.
         */
        void send(T item) {
            if (!_s)
                return;
            {
                std::lock_guard<std::mutex> lock(_s->lock);
                _s->reserved--;
                if (!_s->receiverGone) {
                    _s->items.push_back(std::make_pair(std::move(item), true));
                    _s->slotted++;
                }
            }
            _s.reset();
        }

    private:

        friend class Sender;

        Permit(std::shared_ptr<State> s) : _s(s) { }

        void _release() {
            if (_s) {
                std::lock_guard<std::mutex> lock(_s->lock);
                _s->reserved--;
                _s.reset();
            }
        }

        std::shared_ptr<State> _s;
    };

    class Sender {
    public:

        Sender() { }
        Sender(std::shared_ptr<State> s) : _s(s) { }
        Sender(const Sender&) = delete;
        Sender& operator=(const Sender&) = delete;
        Sender(Sender&& other) : _s(std::move(other._s)) { }
        Sender& operator=(Sender&& other) {
            if (this != &other) {
                _close();
                _s = std::move(other._s);
            }
            return *this;
        }
        ~Sender() { _close(); }

        /**
         * @returns false if the receiver is gone.
         */
        bool send(T item) {
            if (!_s)
                return false;
            std::lock_guard<std::mutex> lock(_s->lock);
            if (_s->receiverGone)
                return false;
            _s->items.push_back(std::make_pair(std::move(item), false));
            return true;
        }

        /**
         * @returns true if a slot was reserved. A false return with
         * isClosed() == false means that the queue is full.
         */
        bool reserve(Permit& permit) {
            if (!_s)
                return false;
            std::lock_guard<std::mutex> lock(_s->lock);
            if (_s->receiverGone)
                return false;
            if (_s->slotted + _s->reserved >= _s->capacity)
                return false;
            _s->reserved++;
            permit = Permit(_s);
            return true;
        }

        bool hasCapacity() const {
            if (!_s)
                return false;
            std::lock_guard<std::mutex> lock(_s->lock);
            return !_s->receiverGone && _s->slotted + _s->reserved < _s->capacity;
        }

        bool isClosed() const {
            if (!_s)
                return true;
            std::lock_guard<std::mutex> lock(_s->lock);
            return _s->receiverGone;
        }

    private:

        void _close() {
            if (_s) {
                std::lock_guard<std::mutex> lock(_s->lock);
                _s->senderGone = true;
            }
            _s.reset();
        }

        std::shared_ptr<State> _s;
    };

    class Receiver {
    public:

        Receiver() { }
        Receiver(std::shared_ptr<State> s) : _s(s) { }
        Receiver(const Receiver&) = delete;
        Receiver& operator=(const Receiver&) = delete;
        Receiver(Receiver&& other) : _s(std::move(other._s)) { }
        Receiver& operator=(Receiver&& other) {
            if (this != &other) {
                _close();
                _s = std::move(other._s);
            }
            return *this;
        }
        ~Receiver() { _close(); }

        bool isValid() const { return (bool)_s; }

        bool tryReceive(T& item) {
            if (!_s)
                return false;
            std::lock_guard<std::mutex> lock(_s->lock);
            if (_s->items.empty())
                return false;
            item = std::move(_s->items.front().first);
            if (_s->items.front().second)
                _s->slotted--;
            _s->items.pop_front();
            return true;
        }

        /**
         * @returns true once the sender is gone and the queue has been
         * drained.
         */
        bool isClosed() const {
            if (!_s)
                return true;
            std::lock_guard<std::mutex> lock(_s->lock);
            return _s->senderGone && _s->items.empty();
        }

    private:

        void _close() {
            if (_s) {
                std::lock_guard<std::mutex> lock(_s->lock);
                _s->receiverGone = true;
                _s->items.clear();
                _s->slotted = 0;
            }
            _s.reset();
        }

        std::shared_ptr<State> _s;
    };

    static std::pair<Sender, Receiver> create(unsigned capacity) {
        auto s = std::make_shared<State>();
        s->capacity = capacity;
        return std::pair<Sender, Receiver>(Sender(s), Receiver(s));
    }
};

    }
}
