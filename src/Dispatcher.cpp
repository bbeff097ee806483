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

#include "behave/Dispatcher.hpp"

using namespace behave;

const char* behave::to_string(Outcome o) noexcept
{
  switch (o) {
  case Outcome::Handled:
    return "handled";
  case Outcome::Unhandled:
    return "unhandled";
  }
  return "?";
}

const Registration* Dispatcher::select(const HandlerSet& set, const Message *m)
{
  for (const auto& r : set.registrations()) {
    if (r.accepts(m))
      return &r;
  }
  return nullptr;
}

Outcome Dispatcher::dispatch(const HandlerSet& set, const Message *m)
{
  auto r = select(set, m);
  if (r == nullptr)
    return Outcome::Unhandled;
  r->action(m);
  return Outcome::Handled;
}
