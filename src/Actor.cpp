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

#include <string>
#include <typeinfo>
#include <exception>
#include <memory>
#include <iostream>
#include <cassert>
#include <stdexcept>
#include <thread>
#include <utility>
#include "behave/Queue.hpp"
#include "behave/BQueue.hpp"
#include "behave/Dispatcher.hpp"
#include "behave/Registry.hpp"
#include "behave/msg/ActionFault.hpp"
#include "behave/msg/Restart.hpp"
#include "behave/msg/Shutdown.hpp"
#include "behave/msg/Unhandled.hpp"
#include "behave/act/Manager.hpp"
#include "behave/Actor.hpp"

using namespace std;
using namespace behave;

const char* behave::to_string(Phase p) noexcept
{
  switch (p) {
  case Phase::Created:
    return "created";
  case Phase::Starting:
    return "starting";
  case Phase::Running:
    return "running";
  case Phase::Restarting:
    return "restarting";
  case Phase::Stopped:
    return "stopped";
  }
  return "?";
}

const char* behave::to_string(UnhandledPolicy p) noexcept
{
  switch (p) {
  case UnhandledPolicy::Drop:
    return "drop";
  case UnhandledPolicy::Log:
    return "log";
  case UnhandledPolicy::DeadLetter:
    return "dead_letter";
  }
  return "?";
}

Actor::~Actor()
{
  discard_mailbox();
  delete reply_message;
  delete msgq;
}

Actor::Actor()
{
  msgq = new BQueue<const Message *>(BEHAVE_MAILBOX_SIZE);
  strncpy(name, "actor", sizeof(name) - 1);
  name[sizeof(name) - 1] = '\0';
}

void Actor::send(const Message *m, Actor *sender) noexcept
{
  if (m == nullptr)
    return;

  if (is_stopped()) {
    delete m;
    return;
  }

  assert(m->destination == nullptr && "cannot reuse message");

  m->is_fast = false;
  m->sender = sender;
  m->destination = this;

  if (is_part_of_group) {
    group->add_message_to_queue(m);
  } else {
    add_message_to_queue(m);
  }
}

std::unique_ptr<const Message> Actor::fast_send(const Message *m, Actor *sender) noexcept
{
  if (m == nullptr)
    return nullptr;

  assert(this != sender && "fast send to itself");

  std::lock_guard<std::mutex> lock(dispatch_mutex);

  m->sender = sender;
  m->is_fast = true;
  reply_message = nullptr;

  handle(m);

  using_fast_send = false;
  std::unique_ptr<const Message> ret(reply_message);
  reply_message = nullptr;
  return ret;
}

void Actor::reply(const Message *m) noexcept
{
  if (using_fast_send) {
    m->sender = this;
    delete reply_message;
    reply_message = m;
  } else if (reply_to != nullptr) {
    reply_to->send(m, this);
  } else {
    cerr << get_name() << ": reply without a return address, dropped" << endl;
    delete m;
  }
}

void Actor::process_message_internal(const Message *m, bool dontdel) noexcept
{
  std::unique_ptr<const Message> owned(dontdel ? nullptr : m);
  std::lock_guard<std::mutex> lock(dispatch_mutex);
  handle(m);
}

void Actor::route(const Message *m) noexcept
{
  process_message_internal(m);
}

void Actor::handle(const Message *m) noexcept
{
  if (is_stopped())
    return;

  if (typeid(*m) == typeid(msg::Shutdown)) {
    do_stop();
    return;
  }
  if (typeid(*m) == typeid(msg::Restart)) {
    do_restart();
    return;
  }

  if (phase_ == Phase::Created)
    do_start();
  if (is_stopped())
    return;

  reply_to = m->sender;
  using_fast_send = m->is_fast;
  msg_cnt++;

  // the handler may replace the top of the stack, keep the active set alive
  HandlerSet active = stack.current();

  dispatching = true;
  try {
    auto outcome = Dispatcher::dispatch(active, m);
    dispatching = false;
    apply_pending();

    if (outcome == Outcome::Unhandled) {
      unhandled_cnt++;
      on_unhandled(m);
    }
  } catch (const std::exception& e) {
    dispatching = false;
    pending.clear();
    report_fault(registry::type_name(m), active.name(), e.what());
  } catch (...) {
    dispatching = false;
    pending.clear();
    report_fault(registry::type_name(m), active.name(), "unknown exception");
  }
}

void Actor::do_start() noexcept
{
  phase_ = Phase::Starting;

  if (!initial_built) {
    try {
      initial = initial_behavior();
      initial_built = true;
    } catch (const std::exception& e) {
      cerr << get_name() << ": could not build the initial behavior: " << e.what() << endl;
      do_stop();
      return;
    }
  }

  stack.reset(initial);
  if (config_.trace)
    cout << get_name() << " starts in " << initial.name() << endl;

  run_start_hook();

  if (!is_stopped())
    phase_ = Phase::Running;
}

void Actor::do_restart() noexcept
{
  if (!initial_built) {
    do_start();
    return;
  }

  phase_ = Phase::Restarting;
  pending.clear();
  stack.reset(initial);
  if (config_.trace)
    cout << get_name() << " restarted in " << initial.name() << endl;

  phase_ = Phase::Starting;
  run_start_hook();

  if (!is_stopped())
    phase_ = Phase::Running;
}

void Actor::do_stop() noexcept
{
  phase_ = Phase::Stopped;
  pending.clear();
  stack.clear();
  discard_mailbox();

  try {
    on_stop();
  } catch (const std::exception& e) {
    cerr << get_name() << ": on_stop failed: " << e.what() << endl;
  }
}

void Actor::run_start_hook() noexcept
{
  dispatching = true;
  try {
    on_start();
    dispatching = false;
    apply_pending();
  } catch (const std::exception& e) {
    dispatching = false;
    pending.clear();
    report_fault("start", stack.current().name(), e.what());
  } catch (...) {
    dispatching = false;
    pending.clear();
    report_fault("start", stack.current().name(), "unknown exception");
  }
}

void Actor::become(HandlerSet set, bool discard_previous)
{
  StackRequest r{false, discard_previous, std::move(set)};
  if (dispatching)
    pending.push_back(std::move(r));
  else
    apply(r);
}

void Actor::unbecome()
{
  StackRequest r{true, false, HandlerSet()};
  if (dispatching)
    pending.push_back(std::move(r));
  else
    apply(r);
}

void Actor::apply(StackRequest& r)
{
  if (r.pop)
    stack.unbecome();
  else
    stack.become(std::move(r.set), r.discard_previous);

  if (config_.trace) {
    cout << get_name() << (r.pop ? " unbecome -> " : " become -> ")
         << stack.current().name() << " (depth " << stack.depth() << ")" << endl;
  }
}

void Actor::apply_pending()
{
  std::vector<StackRequest> requests;
  requests.swap(pending);
  for (auto& r : requests)
    apply(r);
}

void Actor::on_unhandled(const Message *m)
{
  if (config_.unhandled == UnhandledPolicy::Drop)
    return;

  auto type = registry::type_name(m);
  auto behavior = stack.empty() ? std::string() : stack.current().name();
  cerr << get_name() << ": unhandled " << type << " in behavior " << behavior << endl;

  if (config_.unhandled != UnhandledPolicy::DeadLetter)
    return;

  // a report nobody handles is not reported again
  if (typeid(*m) == typeid(msg::Unhandled))
    return;

  Actor *sink = config_.dead_letters;
  if (sink == nullptr)
    sink = manager;
  if (sink == nullptr || sink == this) {
    cerr << get_name() << ": no dead letter actor configured" << endl;
    return;
  }

  sink->send(new msg::Unhandled(get_name(), behavior, type, registry::payload(m)), this);
}

void Actor::report_fault(const std::string& message_type, const std::string& behavior,
                         const std::string& what) noexcept
{
  fault_cnt++;
  cerr << get_name() << ": fault in behavior " << behavior << " handling "
       << message_type << ": " << what << endl;

  Actor *supervisor = manager;
  if (supervisor != nullptr && supervisor != this)
    supervisor->send(new msg::ActionFault(get_name(), behavior, message_type, what), this);
}

void Actor::operator()() noexcept
{
  start();
  cout << get_name() << " running, thread " << std::this_thread::get_id() << endl;

  while (!is_stopped()) {
    auto r = msgq->pop();
    route(std::get<0>(r));
  }
}

std::size_t Actor::drain() noexcept
{
  std::size_t n = 0;
  const Message *m = nullptr;
  while (!is_stopped() && msgq->try_pop(m)) {
    route(m);
    ++n;
  }
  return n;
}

void Actor::start() noexcept
{
  std::lock_guard<std::mutex> lock(dispatch_mutex);
  if (phase_ == Phase::Created)
    do_start();
}

void Actor::restart() noexcept
{
  send(new msg::Restart());
}

void Actor::stop() noexcept
{
  send(new msg::Shutdown());
}

void Actor::halt() noexcept
{
  std::lock_guard<std::mutex> lock(dispatch_mutex);
  if (!is_stopped())
    do_stop();
}

void Actor::discard_mailbox() noexcept
{
  const Message *m = nullptr;
  while (msgq->try_pop(m))
    delete m;
}

void Actor::add_message_to_queue(const Message *m)
{
  msgq->push(m);
}

std::size_t Actor::queue_length() const noexcept
{
  return msgq->length();
}

void Actor::configure(const ActorConfig& config)
{
  std::lock_guard<std::mutex> lock(dispatch_mutex);
  config_ = config;
}

ActorConfig Actor::config() const
{
  std::lock_guard<std::mutex> lock(dispatch_mutex);
  return config_;
}

std::size_t Actor::stack_depth() const
{
  std::lock_guard<std::mutex> lock(dispatch_mutex);
  return stack.depth();
}

HandlerSet Actor::current_behavior() const
{
  std::lock_guard<std::mutex> lock(dispatch_mutex);
  return stack.current();
}

std::vector<std::string> Actor::behavior_names() const
{
  std::lock_guard<std::mutex> lock(dispatch_mutex);
  return stack.names();
}

ActorStatus Actor::status() const
{
  std::lock_guard<std::mutex> lock(dispatch_mutex);
  ActorStatus s;
  s.name = get_name();
  s.phase = phase_.load();
  s.behaviors = stack.names();
  s.mailbox = msgq->length();
  s.processed = msg_cnt.load();
  s.unhandled = unhandled_cnt.load();
  s.faults = fault_cnt.load();
  return s;
}

void Actor::set_group(Actor *pgroup)
{
  is_part_of_group = true;
  group = pgroup;
}
