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

#include <utility>
#include "behave/Actor.hpp"

namespace behave
{
  /**
   * StatefulActor - an actor whose private fields live in one State struct
   *
   * Every behavior of the actor reads and writes the same state; become()
   * and unbecome() only change which handler set runs, never the state.
   * A restart does not reset it either.
   *
   * Usage:
   *   struct CounterState { int count = 0; };
   *
   *   class Counter : public behave::StatefulActor<CounterState> {
   *   protected:
   *     HandlerSet initial_behavior() override {
   *       return HandlerSet::build("Counting")
   *           .on<Tick>([this](const Tick*) { state.count++; })
   *           .done();
   *     }
   *   };
   */
  template <class State>
  class StatefulActor : public Actor
  {
  public:
    State state;

  protected:
    StatefulActor() = default;

    explicit StatefulActor(State initial)
      : state(std::move(initial))
    {}
  };
}
