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
#include <vector>
#include "behave/HandlerSet.hpp"

namespace behave
{
  /**
   * BehaviorStack - the handler sets of one actor, top = active
   *
   * Only ever touched from the owning actor's dispatch context, so it has
   * no locking of its own.
   */
  class BehaviorStack
  {
  public:
    BehaviorStack() = default;

    BehaviorStack(const BehaviorStack&) = delete;
    BehaviorStack& operator=(const BehaviorStack&) = delete;

    /**
     * Make set the active behavior
     * @param discard_previous true replaces the top, false pushes on top of it
     */
    void become(HandlerSet set, bool discard_previous = true);

    /// Pop the top unless it is the last one left; never fails
    void unbecome() noexcept;

    /// Active handler set. Throws std::logic_error if nothing was ever pushed.
    const HandlerSet& current() const;

    /// Drop everything and leave exactly initial on the stack
    void reset(HandlerSet initial);

    void clear() noexcept { elements_.clear(); }

    std::size_t depth() const noexcept { return elements_.size(); }
    bool empty() const noexcept { return elements_.empty(); }

    /// Behavior names, bottom to top
    std::vector<std::string> names() const;

  private:
    std::vector<HandlerSet> elements_;
  };
}
