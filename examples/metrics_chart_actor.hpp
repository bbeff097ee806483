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

/**
 * Pausable metrics chart
 *
 * The chart appends every Metric it receives to its series while Charting.
 * TogglePause pushes Paused on top of Charting; while paused each Metric
 * is recorded as a zero so the series keeps its time axis. The next
 * TogglePause pops back to Charting.
 */

#include <cstring>
#include <vector>
#include "behave/Actor.hpp"
#include "behave/HandlerSet.hpp"
#include "behave/StatefulActor.hpp"

namespace chart
{
  struct Metric : public behave::Message_N<110> {
    double value;
    explicit Metric(double v = 0) : value(v) {}
  };

  struct TogglePause : public behave::Message_N<111> {
  };

  struct ChartState {
    std::vector<double> points;
    std::size_t pauses = 0;
  };

  class MetricsChartActor : public behave::StatefulActor<ChartState> {
  public:
    MetricsChartActor() {
      strncpy(name, "chart", sizeof(name) - 1);
    }

    behave::HandlerSet charting(ChartState& st) {
      return behave::HandlerSet::build("Charting")
          .on<Metric>([&st](const Metric* m) {
            st.points.push_back(m->value);
          })
          .on<TogglePause>([this, &st](const TogglePause*) {
            st.pauses++;
            become(paused(st), false);
          })
          .done();
    }

    behave::HandlerSet paused(ChartState& st) {
      return behave::HandlerSet::build("Paused")
          .on<Metric>([&st](const Metric*) {
            st.points.push_back(0.0);
          })
          .on<TogglePause>([this](const TogglePause*) {
            unbecome();
          })
          .done();
    }

  protected:
    behave::HandlerSet initial_behavior() override {
      return charting(state);
    }
  };
}
