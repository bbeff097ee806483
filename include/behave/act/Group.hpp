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

#include <list>
#include <map>
#include <memory>
#include <string>
#include <cstring>
#include "behave/Actor.hpp"

namespace behave
{
  /**
   * Group - Run multiple actors in a single thread
   *
   * Use when you have lightweight actors that don't need separate threads.
   * Messages sent to a member are queued in the group's mailbox; the group
   * thread hands each one to its member, which dispatches it with its own
   * behavior stack. A member still processes one message at a time.
   *
   * Usage:
   *   auto *grp = new behave::Group("my_group");
   *   grp->add(new LightActor1());
   *   grp->add(new LightActor2());
   *   mgr.manage(grp);  // All run in single thread
   */
  class Group : public Actor
  {
    friend class Manager;

    char name[256];
    std::list<std::unique_ptr<Actor>> members;
    std::map<std::string, actor_ptr> name_to_actor;

  public:
    explicit Group(const std::string& group_name)
      : Actor()
    {
      strncpy(name, group_name.c_str(), sizeof(name) - 1);
      name[sizeof(name) - 1] = '\0';
    }

    virtual ~Group() = default;

    bool is_group() const override { return true; }

    /**
     * Add a member (takes ownership)
     * Throws std::invalid_argument for a null, managed, grouped or
     * duplicate-named actor.
     */
    void add(actor_ptr actor);

    const char* get_name() const override { return name; }

    std::size_t size() const noexcept { return members.size(); }

  protected:
    HandlerSet initial_behavior() override;
    void on_start() override;
    void on_stop() override;
    void route(const Message* m) noexcept override;
  };
}
