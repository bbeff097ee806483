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
#include <list>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

#include "behave/Actor.hpp"
#include "behave/msg/ActionFault.hpp"
#include "behave/msg/Unhandled.hpp"

namespace behave
{
  /**
   * Manager - Manages the lifecycle of actors
   *
   * The Manager:
   * - Owns the actors it manages and runs each in its own thread
   * - Coordinates startup and shutdown
   * - Is the default supervisor: action faults are reported to it
   * - Is the default dead letter actor for UnhandledPolicy::DeadLetter
   *
   * It is an actor itself, running in a thread of its own.
   *
   * Usage:
   *   class MyManager : public behave::Manager {
   *   public:
   *     MyManager() {
   *       manage(new MyActor());
   *       manage(new OtherActor(), {UnhandledPolicy::DeadLetter});
   *     }
   *   };
   *
   *   MyManager mgr;
   *   mgr.init();      // Start all actors
   *   // ... run ...
   *   mgr.shutdown();  // Ask every actor to stop
   *   mgr.end();       // Wait for actors to finish
   */
  class Manager : public Actor
  {
    std::list<std::unique_ptr<Actor>> actor_list;
    std::list<std::thread> thread_list;
    std::map<std::string, actor_ptr> managed_name_map;
    std::map<std::string, actor_ptr> expanded_name_map;
    std::atomic<long long> dead_letter_cnt{0};
    std::atomic<long long> reported_fault_cnt{0};
    bool initialized = false;

  public:
    Manager();
    ~Manager();

    /**
     * Start all managed actors
     * Launches one thread per managed actor (a Group counts as one) and one
     * for the manager. Call this after registering all actors with manage().
     */
    void init();

    /// Ask every managed actor, and the manager, to stop
    void shutdown() noexcept;

    /**
     * Wait for all actors to finish
     * Blocks until all actor threads have terminated.
     */
    void end();

    /**
     * Register an actor to be managed
     * @param actor The actor to manage (takes ownership)
     * @param config Unhandled message policy and tracing for the actor
     * Throws std::invalid_argument for a null, already managed or
     * duplicate-named actor and std::logic_error after init().
     */
    void manage(actor_ptr actor, ActorConfig config = {});

    /**
     * Find an actor by name
     * @param name Actor name to search for
     * @return Pointer to actor, or nullptr if not found
     */
    actor_ptr get_actor_by_name(const std::string& name) const noexcept;

    /**
     * Get list of all managed actor names
     * Includes actors inside groups.
     */
    std::list<std::string> get_managed_names() const noexcept;

    /**
     * Get total pending messages across all actors
     */
    std::size_t total_queue_length();

    /**
     * Get pending message count per actor
     * @return Map of actor name to queue length
     */
    std::map<std::string, std::size_t> get_queue_lengths() const noexcept;

    long long dead_letter_count() const noexcept { return dead_letter_cnt.load(); }
    long long reported_fault_count() const noexcept { return reported_fault_cnt.load(); }

    /**
     * Status of every managed actor, groups expanded
     * Each entry waits for the actor to finish the message in progress.
     */
    nlohmann::json snapshot() const;

  protected:
    HandlerSet initial_behavior() override;

    /**
     * Decide what happens to an actor whose action threw
     * The default resumes it: the actor keeps its current behavior and
     * carries on with the next message. Override to restart or stop it.
     */
    virtual void supervise(Actor *faulty, const msg::ActionFault *m);

    /// Called for every msg::Unhandled received; the default logs it
    virtual void on_dead_letter(const msg::Unhandled *m);

  private:
    void on_fault(const msg::ActionFault *m);
    void on_unhandled_report(const msg::Unhandled *m);
  };
}
