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

namespace behave
{
  class Actor;

  /**
   * Base class for all messages in the actor system
   *
   * Messages are the only way actors communicate. A message is immutable
   * once sent: handlers only ever see it through a const pointer.
   * Each message type has a small integer ID; IDs below 100 are reserved
   * for the runtime's own messages (see behave/msg/).
   */
  struct Message
  {
    virtual int get_message_id() const = 0;
    mutable Actor *sender = nullptr;
    mutable Actor *destination = nullptr;
    mutable bool is_fast = false;

    Message() = default;

    Message(const Message& other)
      : sender(other.sender)
      , destination(nullptr)
      , is_fast(other.is_fast)
    {}

    Message& operator=(const Message& other) {
      if (this != &other) {
        sender = other.sender;
        destination = nullptr;
        is_fast = other.is_fast;
      }
      return *this;
    }

    virtual ~Message() = default;
  };

  /**
   * Template for creating message types with a specific ID
   *
   * Usage:
   *   struct MyMessage : public behave::Message_N<100> {
   *     int data;
   *     MyMessage(int d) : data(d) {}
   *   };
   */
  template <int N>
  struct Message_N : public Message
  {
    static constexpr int message_id = N;
    int get_message_id() const override { return N; }
  };
}

typedef behave::Message* msg_ptr;
typedef const behave::Message* const_msg_ptr;
