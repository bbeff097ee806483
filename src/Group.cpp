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
#include <string>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "behave/act/Group.hpp"

using namespace behave;

void Group::add(actor_ptr a)
{
  if (a == nullptr)
    throw std::invalid_argument("adding null actor to group");
  if (a->is_managed || a->is_part_of_group)
    throw std::invalid_argument(std::string(a->get_name()) + " already has an owner");

  std::unique_ptr<Actor> owned(a);
  if (a->is_group())
    throw std::invalid_argument("groups cannot be nested");
  if (name_to_actor.find(a->get_name()) != name_to_actor.end())
    throw std::invalid_argument(std::string("group ") + get_name() + " already has a member named " + a->get_name());

  a->set_group(this);
  name_to_actor[a->get_name()] = a;
  members.push_back(std::move(owned));
}

HandlerSet Group::initial_behavior()
{
  return HandlerSet::build("Group").done();
}

void Group::on_start()
{
  for (auto& a : members)
  {
    std::cout << get_name() << " Group starting " << a->get_name() << std::endl;
    a->start();
  }
}

void Group::on_stop()
{
  for (auto& a : members)
    a->halt();
}

void Group::route(const Message *m) noexcept
{
  Actor *target = m->destination;
  if (target == nullptr || target == this)
  {
    Actor::route(m);
    return;
  }
  target->process_message_internal(m);
}
