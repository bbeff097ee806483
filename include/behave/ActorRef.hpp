/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski,  & M2 Tech
Contact:
v@m2te.ch
mayeski@gmail.com
https://www.linkedin.com/in/vmayeski/
http://m2te.ch/

Permission is hereby granted, free of charge, to any person
obtaining a copy of this software and associated documentation
files (the "Software"), to deal in the Software without
restriction, including without limitation the rights to use,
copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the
Software is furnished to do so, subject to the following
conditions:

The above copyright notice and this permission notice shall be
included in all copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES
OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT
HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY,
WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR
OTHER DEALINGS IN THE SOFTWARE.

https://opensource.org/licenses/MIT

*/

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include "behave/Actor.hpp"

namespace behave {

/**
 * ActorRef - Copyable handle used to address an actor
 *
 * Holds no ownership; the actor must outlive every ref to it (managed
 * actors live as long as their Manager).
 *
 * Usage:
 *   ActorRef chart(chart_actor);
 *   chart.send(new Metric{4.2});
 *   send(chart, new TogglePause{}, this);
 */
class ActorRef {
    Actor* actor_;

public:
    // Default constructor - creates an empty/invalid ref
    ActorRef() : actor_(nullptr) {}

    explicit ActorRef(Actor* a) : actor_(a) {}

    ActorRef(const ActorRef&) = default;
    ActorRef(ActorRef&&) = default;
    ActorRef& operator=(const ActorRef&) = default;
    ActorRef& operator=(ActorRef&&) = default;

    /**
     * Send a message asynchronously
     * Takes ownership of m; throws std::runtime_error on an empty ref
     */
    void send(const Message* m, Actor* sender = nullptr) const {
        if (actor_ == nullptr) {
            delete m;
            throw std::runtime_error("send through an empty ActorRef");
        }
        actor_->send(m, sender);
    }

    /**
     * Dispatch a message synchronously in the caller's thread
     */
    std::unique_ptr<const Message> fast_send(const Message* m, Actor* sender = nullptr) const {
        if (actor_ == nullptr)
            throw std::runtime_error("fast_send through an empty ActorRef");
        return actor_->fast_send(m, sender);
    }

    // Check if this is a valid (non-null) reference
    bool is_valid() const { return actor_ != nullptr; }

    explicit operator bool() const { return is_valid(); }

    std::string name() const {
        if (actor_ == nullptr)
            throw std::runtime_error("name of an empty ActorRef");
        return actor_->get_name();
    }

    Actor* actor() const { return actor_; }

    bool operator==(const ActorRef& other) const { return actor_ == other.actor_; }
    bool operator!=(const ActorRef& other) const { return actor_ != other.actor_; }
};

/// send(ref, message): fire-and-forget, FIFO per sender and receiver
inline void send(const ActorRef& to, const Message* m, Actor* sender = nullptr) {
    to.send(m, sender);
}

} // namespace behave
