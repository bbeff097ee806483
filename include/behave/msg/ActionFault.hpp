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

#include <string>
#include <utility>
#include "behave/Message.hpp"

namespace behave::msg
{
  /**
   * ActionFault - an action (or guard) threw while handling a message
   *
   * Sent to the faulting actor's supervisor. The runtime does not retry the
   * message; whether to resume, restart or stop is the supervisor's call.
   * The actor itself is referenced by the sender field.
   */
  class ActionFault : public Message_N<4>
  {
  public:
    std::string actor;
    std::string behavior;
    std::string message_type;
    std::string what;

    ActionFault() = default;

    ActionFault(std::string actor, std::string behavior, std::string message_type, std::string what)
      : actor(std::move(actor))
      , behavior(std::move(behavior))
      , message_type(std::move(message_type))
      , what(std::move(what)) {}
  };
}
