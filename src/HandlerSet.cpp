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

#include <algorithm>
#include <string>
#include <utility>
#include <vector>
#include "behave/HandlerSet.hpp"

using namespace std;
using namespace behave;

HandlerSet::HandlerSet()
  : body_(make_shared<const Body>())
{
}

HandlerSet::HandlerSet(string name, vector<Registration> registrations)
  : body_(make_shared<const Body>(Body{std::move(name), std::move(registrations)}))
{
}

HandlerSet::Builder HandlerSet::build(string name)
{
  return Builder(std::move(name));
}

bool HandlerSet::handles(type_index type) const noexcept
{
  const auto& regs = body_->registrations;
  return any_of(regs.begin(), regs.end(),
                [&type](const Registration& r) { return r.type == type; });
}

HandlerSet HandlerSet::Builder::done()
{
  HandlerSet ret(std::move(name_), std::move(registrations_));
  name_.clear();
  registrations_.clear();
  return ret;
}
