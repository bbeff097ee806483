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

#include <atomic>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "behave/BehaviorStack.hpp"
#include "behave/HandlerSet.hpp"
#include "behave/Message.hpp"

// Ring capacity of a mailbox before it spills into its overflow list
#ifndef BEHAVE_MAILBOX_SIZE
#define BEHAVE_MAILBOX_SIZE 64
#endif

namespace behave
{
  class Actor;
  class Manager;
  class Group;
}

// Pointer to an Actor
typedef behave::Actor* actor_ptr;

namespace behave
{
  template <class T> class Queue;

  /// Lifecycle of an actor's runtime shell
  enum class Phase
  {
    Created,
    Starting,
    Running,
    Restarting,
    Stopped
  };

  const char* to_string(Phase p) noexcept;

  /// What happens to a message no registration of the active behavior accepts
  enum class UnhandledPolicy
  {
    Drop,
    Log,
    DeadLetter
  };

  const char* to_string(UnhandledPolicy p) noexcept;

  struct ActorConfig
  {
    UnhandledPolicy unhandled = UnhandledPolicy::Log;
    /// Receiver of msg::Unhandled reports; falls back to the manager when null
    Actor *dead_letters = nullptr;
    /// Log every behavior change to std::cout
    bool trace = false;
  };

  /// Point-in-time view of an actor, see Actor::status()
  struct ActorStatus
  {
    std::string name;
    Phase phase = Phase::Created;
    std::vector<std::string> behaviors;
    std::size_t mailbox = 0;
    long long processed = 0;
    long long unhandled = 0;
    long long faults = 0;
  };

  /**
   * Actor - Base class for all actors in the system
   *
   * An Actor:
   * - Processes messages one at a time from its own mailbox
   * - Handles each message with its current behavior, the handler set on
   *   top of its behavior stack
   * - Switches behavior from inside its handlers with become()/unbecome();
   *   a switch takes effect once the running handler returns
   * - Communicates with other actors only via messages
   *
   * Every dispatch for an actor holds its dispatch mutex, whether it comes
   * from the actor's own thread, a Group thread, fast_send() or drain().
   *
   * Usage:
   *   class MyActor : public behave::Actor {
   *   public:
   *     MyActor() { strncpy(name, "my_actor", sizeof(name)); }
   *   protected:
   *     HandlerSet initial_behavior() override { return idle(); }
   *   private:
   *     HandlerSet idle() {
   *       return HandlerSet::build("Idle").on(this, &MyActor::on_work).done();
   *     }
   *     void on_work(const Work *m) { ... become(busy()); }
   *   };
   */
  class Actor
  {
    friend class Manager;
    friend class Group;

  public:
    Actor();
    virtual ~Actor();

    // Non-copyable
    Actor(const Actor&) = delete;
    Actor& operator=(const Actor&) = delete;

    /**
     * Send a message asynchronously (fire-and-forget)
     * Message is queued and processed later by the receiver's thread
     * @param m Message to send (must be heap-allocated, Actor takes ownership)
     * @param sender The sending actor (for reply routing)
     */
    void send(const Message *m, Actor *sender = nullptr) noexcept;

    /**
     * Dispatch a message synchronously in the caller's thread
     * Waits for any dispatch in progress for this actor first.
     * @param m Message to dispatch (not owned, can be stack-allocated)
     * @param sender The sending actor
     * @return Reply message, or nullptr if the handler did not reply
     */
    std::unique_ptr<const Message> fast_send(const Message *m, Actor *sender = nullptr) noexcept;

    /**
     * Reply to the current message
     * Works for both async (send) and sync (fast_send) messages
     */
    void reply(const Message *m) noexcept;

    /**
     * Process every message currently queued, in the caller's thread
     * Never blocks on an empty mailbox.
     * @return number of messages processed
     */
    std::size_t drain() noexcept;

    /// Push the initial behavior and run on_start(); no-op once started
    void start() noexcept;

    /// Ask the actor to reset to its initial behavior (queued like any message)
    void restart() noexcept;

    /// Ask the actor to stop (queued like any message)
    virtual void stop() noexcept;

    /**
     * Main processing loop - runs in a dedicated thread
     * Called by Manager via std::thread
     */
    void operator()() noexcept;

    /**
     * Replace the actor's configuration
     * Takes the dispatch mutex, so it is safe on a running actor but must
     * not be called from inside the actor's own handlers.
     */
    void configure(const ActorConfig& config);
    ActorConfig config() const;

    virtual const char* get_name() const { return name; }
    Phase phase() const noexcept { return phase_.load(); }
    bool is_stopped() const noexcept { return phase_.load() == Phase::Stopped; }
    std::size_t queue_length() const noexcept;

    // The accessors below take the dispatch mutex; from inside a handler
    // use behaviors() instead.
    std::size_t stack_depth() const;
    HandlerSet current_behavior() const;
    std::vector<std::string> behavior_names() const;
    ActorStatus status() const;

    long long processed_count() const noexcept { return msg_cnt.load(); }
    long long unhandled_count() const noexcept { return unhandled_cnt.load(); }
    long long fault_count() const noexcept { return fault_cnt.load(); }

  protected:
    Actor *reply_to = nullptr;
    char name[256];

    /**
     * The behavior pushed when the actor starts
     * Called once, on first start; restarts reuse the same handler set.
     */
    virtual HandlerSet initial_behavior() = 0;

    /// Called after the initial behavior is pushed, on start and on every restart
    virtual void on_start() {}

    /// Called once the actor has stopped
    virtual void on_stop() {}

    /**
     * Called for messages the current behavior does not handle
     * Default applies the configured UnhandledPolicy.
     */
    virtual void on_unhandled(const Message *m);

    /**
     * Switch behavior
     * Inside a handler or on_start() the switch is applied after it returns.
     * @param discard_previous false keeps the current behavior for unbecome()
     */
    void become(HandlerSet set, bool discard_previous = true);

    /// Return to the previous behavior; no-op on the initial one
    void unbecome();

    /// The stack itself, for use from inside handlers
    const BehaviorStack& behaviors() const noexcept { return stack; }

    virtual bool is_group() const { return false; }

    /// Hand a dequeued message to whoever has to process it
    virtual void route(const Message *m) noexcept;

    // For Group support
    void set_group(Actor *pgroup);
    void process_message_internal(const Message *m, bool dontdel = false) noexcept;

    /// Stop right now, in the caller's thread
    void halt() noexcept;

    Manager *get_manager() const { return manager; }

  private:
    struct StackRequest
    {
      bool pop;
      bool discard_previous;
      HandlerSet set;
    };

    Queue<const Message *> *msgq;
    mutable std::mutex dispatch_mutex;
    BehaviorStack stack;
    HandlerSet initial;
    bool initial_built = false;
    bool dispatching = false;
    std::vector<StackRequest> pending;
    std::atomic<Phase> phase_{Phase::Created};
    ActorConfig config_;
    bool using_fast_send = false;
    const Message *reply_message = nullptr;
    Actor *group = nullptr;
    bool is_managed = false;
    bool is_part_of_group = false;
    Manager *manager = nullptr;
    std::atomic<long long> msg_cnt{0};
    std::atomic<long long> unhandled_cnt{0};
    std::atomic<long long> fault_cnt{0};

    void add_message_to_queue(const Message *m);

    // all of the following run with dispatch_mutex held
    void handle(const Message *m) noexcept;
    void do_start() noexcept;
    void do_restart() noexcept;
    void do_stop() noexcept;
    void run_start_hook() noexcept;
    void apply(StackRequest& r);
    void apply_pending();
    void report_fault(const std::string& message_type, const std::string& behavior,
                      const std::string& what) noexcept;
    void discard_mailbox() noexcept;

    void set_manager(Manager *mgr) { manager = mgr; }
  };

}
