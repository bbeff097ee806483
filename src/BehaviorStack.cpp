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

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "behave/BehaviorStack.hpp"

using namespace std;
using namespace behave;

void BehaviorStack::become(HandlerSet set, bool discard_previous)
{
  if (discard_previous && !elements_.empty())
    elements_.back() = std::move(set);
  else
    elements_.push_back(std::move(set));
}

void BehaviorStack::unbecome() noexcept
{
  // the initial behavior is never popped
  if (elements_.size() > 1)
    elements_.pop_back();
}

const HandlerSet& BehaviorStack::current() const
{
  if (elements_.empty())
    throw logic_error("behavior stack used before the initial behavior was pushed");
  return elements_.back();
}

void BehaviorStack::reset(HandlerSet initial)
{
  elements_.clear();
  elements_.push_back(std::move(initial));
}

vector<string> BehaviorStack::names() const
{
  vector<string> ret;
  ret.reserve(elements_.size());
  for (const auto& e : elements_)
    ret.push_back(e.name());
  return ret;
}
