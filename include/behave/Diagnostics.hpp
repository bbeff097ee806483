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
#include <nlohmann/json.hpp>
#include "behave/Actor.hpp"
#include "behave/HandlerSet.hpp"

namespace behave
{
  /**
   * {"name": ..., "phase": ..., "depth": ..., "current": ...,
   *  "behaviors": [bottom .. top], "mailbox": ..., "processed": ...,
   *  "unhandled": ..., "faults": ...}
   */
  void to_json(nlohmann::json& j, const ActorStatus& s);

  /// {"name": ..., "registrations": ...}
  void to_json(nlohmann::json& j, const HandlerSet& set);
}

namespace behave::diagnostics
{
  /// JSON status of an actor; waits for the message in progress to finish
  nlohmann::json snapshot(const Actor& actor);

  /// Same as snapshot(), as a single line of text
  std::string describe(const Actor& actor);
}
