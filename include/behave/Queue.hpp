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

#include <cstddef>
#include <tuple>

namespace behave
{
  /**
   * Queue - mailbox interface
   *
   * Multi-producer, single-consumer. pop() blocks until an element is
   * available and also reports whether the queue was left empty.
   */
  template <class T>
  class Queue
  {
  public:
    virtual ~Queue() = default;

    virtual std::tuple<T, bool> pop() noexcept = 0;

    /// Non-blocking pop; returns false when nothing is queued
    virtual bool try_pop(T& out) noexcept = 0;

    virtual T peek() const noexcept = 0;
    virtual void push(const T& x) noexcept = 0;
    virtual bool is_empty() const noexcept = 0;
    virtual std::size_t length() const noexcept = 0;
  };
}
