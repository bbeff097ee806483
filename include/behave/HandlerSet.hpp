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

#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <type_traits>
#include <utility>
#include <vector>
#include "behave/Message.hpp"

namespace behave
{
  typedef std::function<bool(const Message *)> guard_t;
  typedef std::function<void(const Message *)> action_t;

  /**
   * Registration - one (message type, guard, action) entry of a HandlerSet
   *
   * The guard is optional; an empty guard accepts every message of the
   * type. Guards must not change actor state: capture whatever they need
   * by value when the handler set is built.
   */
  struct Registration
  {
    std::type_index type;
    guard_t guard;
    action_t action;

    Registration(std::type_index t, guard_t g, action_t a)
      : type(t)
      , guard(std::move(g))
      , action(std::move(a))
    {}

    bool matches_type(const Message *m) const
    {
      return std::type_index(typeid(*m)) == type;
    }

    bool accepts(const Message *m) const
    {
      return matches_type(m) && (!guard || guard(m));
    }
  };

  /**
   * HandlerSet - a named, immutable behavior
   *
   * Built once (usually by an actor's builder function) and never changed
   * afterwards. Copies share the same body; two handler sets are equal
   * when they are copies of the same built value.
   *
   * Usage:
   *   HandlerSet charting() {
   *     return HandlerSet::build("Charting")
   *         .on<Metric>([this](const Metric *m) { record(m->value); })
   *         .on(this, &ChartActor::on_toggle)
   *         .done();
   *   }
   */
  class HandlerSet
  {
    struct Body
    {
      std::string name;
      std::vector<Registration> registrations;
    };

  public:
    class Builder;

    /// Empty, unnamed set. Every message dispatched to it is unhandled.
    HandlerSet();

    HandlerSet(std::string name, std::vector<Registration> registrations);

    static Builder build(std::string name);

    const std::string& name() const noexcept { return body_->name; }
    const std::vector<Registration>& registrations() const noexcept { return body_->registrations; }
    std::size_t size() const noexcept { return body_->registrations.size(); }
    bool empty() const noexcept { return body_->registrations.empty(); }

    /// True if at least one registration is declared for the type
    bool handles(std::type_index type) const noexcept;

    template <typename MsgT>
    bool handles() const noexcept { return handles(std::type_index(typeid(MsgT))); }

    bool operator==(const HandlerSet& other) const noexcept { return body_ == other.body_; }
    bool operator!=(const HandlerSet& other) const noexcept { return body_ != other.body_; }

  private:
    std::shared_ptr<const Body> body_;
  };

  /**
   * HandlerSet::Builder - collects registrations in declaration order
   *
   * Declaration order is the only tie-break between registrations for the
   * same message type, so it is preserved exactly.
   */
  class HandlerSet::Builder
  {
  public:
    explicit Builder(std::string name) : name_(std::move(name)) {}

    template <typename MsgT, typename F>
    Builder& on(F action)
    {
      static_assert(std::is_base_of<Message, MsgT>::value, "handlers are registered for Message types");
      registrations_.emplace_back(
          std::type_index(typeid(MsgT)), guard_t(),
          [action](const Message *m) { action(static_cast<const MsgT *>(m)); });
      return *this;
    }

    template <typename MsgT, typename G, typename F>
    Builder& on_if(G guard, F action)
    {
      static_assert(std::is_base_of<Message, MsgT>::value, "handlers are registered for Message types");
      registrations_.emplace_back(
          std::type_index(typeid(MsgT)),
          [guard](const Message *m) -> bool { return guard(static_cast<const MsgT *>(m)); },
          [action](const Message *m) { action(static_cast<const MsgT *>(m)); });
      return *this;
    }

    /// Register a member function of an actor: on(this, &MyActor::on_ping)
    template <typename ActorT, typename MsgT>
    Builder& on(ActorT *self, void (ActorT::*fn)(const MsgT *))
    {
      return on<MsgT>([self, fn](const MsgT *m) { (self->*fn)(m); });
    }

    template <typename ActorT, typename MsgT, typename G>
    Builder& on_if(ActorT *self, G guard, void (ActorT::*fn)(const MsgT *))
    {
      return on_if<MsgT>(std::move(guard), [self, fn](const MsgT *m) { (self->*fn)(m); });
    }

    Builder& add(Registration r)
    {
      registrations_.push_back(std::move(r));
      return *this;
    }

    /// Publish the set. The builder is empty afterwards.
    HandlerSet done();

  private:
    std::string name_;
    std::vector<Registration> registrations_;
  };
}
