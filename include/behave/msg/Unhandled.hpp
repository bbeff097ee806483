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
   * Unhandled - dead letter report
   *
   * Sent to the dead letter actor when no registration of the active
   * behavior accepted a message and the policy is DeadLetter.
   */
  class Unhandled : public Message_N<3>
  {
  public:
    std::string actor;          // Name of the actor that received the message
    std::string behavior;       // Name of its active handler set
    std::string message_type;   // Registered or demangled type name
    std::string payload;        // JSON text, empty if the type is not registered

    Unhandled() = default;

    Unhandled(std::string actor, std::string behavior, std::string message_type, std::string payload)
      : actor(std::move(actor))
      , behavior(std::move(behavior))
      , message_type(std::move(message_type))
      , payload(std::move(payload)) {}
  };
}
