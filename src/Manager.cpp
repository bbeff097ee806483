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

#include <list>
#include <map>
#include <string>
#include <iostream>
#include <stdexcept>
#include <thread>
#include "behave/Actor.hpp"
#include "behave/Diagnostics.hpp"
#include "behave/act/Group.hpp"
#include "behave/act/Manager.hpp"

using namespace behave;
using namespace std;

Manager::Manager()
{
  strncpy(name, "manager", sizeof(name) - 1);
}

Manager::~Manager()
{
  if (initialized) {
    shutdown();
    end();
  }
}

HandlerSet Manager::initial_behavior()
{
  return HandlerSet::build("Supervising")
      .on(this, &Manager::on_fault)
      .on(this, &Manager::on_unhandled_report)
      .done();
}

void Manager::init()
{
  if (initialized)
    return;
  initialized = true;

  for (auto& actor : actor_list)
  {
    Actor *a = actor.get();
    cout << "Manager::init starting " << a->get_name() << endl;
    thread_list.emplace_back([a]() { (*a)(); });
  }

  thread_list.emplace_back([this]() { (*this)(); });
}

void Manager::shutdown() noexcept
{
  for (auto& actor : actor_list)
    actor->stop();
  this->stop();
}

void Manager::end()
{
  for (auto& t : thread_list)
  {
    if (t.joinable())
      t.join();
  }
}

void Manager::on_fault(const msg::ActionFault *m)
{
  reported_fault_cnt++;
  cerr << get_name() << ": " << m->actor << " faulted in " << m->behavior
       << " on " << m->message_type << ": " << m->what << endl;
  supervise(m->sender, m);
}

void Manager::supervise(Actor *faulty, const msg::ActionFault *)
{
  if (faulty != nullptr)
    cout << get_name() << ": resuming " << faulty->get_name() << endl;
}

void Manager::on_unhandled_report(const msg::Unhandled *m)
{
  dead_letter_cnt++;
  on_dead_letter(m);
}

void Manager::on_dead_letter(const msg::Unhandled *m)
{
  cerr << get_name() << ": dead letter " << m->message_type << " for " << m->actor
       << " in " << m->behavior;
  if (!m->payload.empty())
    cerr << " " << m->payload;
  cerr << endl;
}

void Manager::manage(actor_ptr actor, ActorConfig config)
{
  if (actor == nullptr)
    throw invalid_argument("cannot manage null actor");

  // someone else owns these two
  if (actor->is_managed)
    throw invalid_argument(std::string(actor->get_name()) + " is already managed");

  if (actor->is_part_of_group)
    throw invalid_argument(std::string(actor->get_name()) + " is part of a group, manage the group");

  // the manager owns whatever else it was handed from here on
  std::unique_ptr<Actor> owned(actor);

  if (initialized)
    throw logic_error(std::string("cannot manage ") + actor->get_name() + " after init()");

  if (managed_name_map.find(actor->get_name()) != managed_name_map.end() ||
      expanded_name_map.find(actor->get_name()) != expanded_name_map.end())
  {
    cerr << "actors already managed:\n";
    for (const auto &p : expanded_name_map)
      cerr << p.first << endl;
    throw invalid_argument(std::string("actor with name ") + actor->get_name() + " already managed");
  }

  if (actor->is_group())
  {
    auto g = static_cast<Group *>(actor);
    if (g->name_to_actor.empty())
      throw invalid_argument("add actors to group before managing group");

    for (const auto& p : g->name_to_actor)
    {
      if (expanded_name_map.find(p.first) != expanded_name_map.end())
        throw invalid_argument("actor " + p.first + " (part of a group) already managed somewhere else");
    }
    for (const auto& p : g->name_to_actor)
    {
      expanded_name_map[p.first] = p.second;
      p.second->set_manager(this);
    }
  }

  managed_name_map[actor->get_name()] = actor;
  expanded_name_map[actor->get_name()] = actor;

  actor->set_manager(this);
  actor->configure(config);
  actor->is_managed = true;
  actor_list.push_back(std::move(owned));
}

map<string, size_t> Manager::get_queue_lengths() const noexcept
{
  map<string, size_t> ret;
  for (auto &[name, actor] : managed_name_map)
  {
    ret[name] = actor->queue_length();
  }
  return ret;
}

list<string> Manager::get_managed_names() const noexcept
{
  list<string> ret;
  for (auto &[name, _] : expanded_name_map)
    ret.push_back(name);
  return ret;
}

actor_ptr Manager::get_actor_by_name(const string &name) const noexcept
{
  auto it = expanded_name_map.find(name);
  if (it != expanded_name_map.end())
    return it->second;
  return nullptr;
}

size_t Manager::total_queue_length()
{
  size_t total = 0;
  for (auto& actor : actor_list)
  {
    total += actor->queue_length();
  }
  return total;
}

nlohmann::json Manager::snapshot() const
{
  auto ret = nlohmann::json::array();
  for (auto &[name, actor] : expanded_name_map)
    ret.push_back(diagnostics::snapshot(*actor));
  return ret;
}
