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

/**
 * Metrics Chart Example - pausing and resuming with become/unbecome
 *
 * Demonstrates:
 * - Keeping the previous behavior with become(set, false)
 * - Returning to it with unbecome()
 * - Reading an actor's status as JSON
 */

#include <iostream>
#include "behave/ActorRef.hpp"
#include "behave/Diagnostics.hpp"
#include "behave/Registry.hpp"
#include "behave/act/Manager.hpp"
#include "metrics_chart_actor.hpp"

using namespace behave;
using namespace chart;
using namespace std;

REGISTER_MESSAGE_1(Metric, value)
REGISTER_MESSAGE_0(TogglePause)

class ChartManager : public Manager {
public:
  MetricsChartActor* chart;

  ChartManager() : chart(new MetricsChartActor()) {
    ActorConfig config;
    config.trace = true;
    manage(chart, config);
  }
};

int main() {
  cout << "=== Metrics Chart Example ===" << endl;

  ChartManager mgr;
  mgr.init();

  ActorRef chart(mgr.chart);
  for (int i = 1; i <= 3; ++i)
    send(chart, new Metric(i * 1.5));
  send(chart, new TogglePause());
  for (int i = 0; i < 2; ++i)
    send(chart, new Metric(99.0));
  send(chart, new TogglePause());
  send(chart, new Metric(6.0));

  // messages from one sender arrive in order, so the shutdown comes last
  mgr.shutdown();
  mgr.end();

  cout << "series:";
  for (auto p : mgr.chart->state.points)
    cout << " " << p;
  cout << endl;
  cout << diagnostics::describe(*mgr.chart) << endl;

  return 0;
}
