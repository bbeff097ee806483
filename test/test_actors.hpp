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

#include <behave/Actor.hpp>
#include <behave/HandlerSet.hpp>
#include <behave/StatefulActor.hpp>
#include <behave/msg/Unhandled.hpp>

#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace test {

////////////////////////////////////////////////////////////////////////////////

struct Ping : behave::Message_N<200> {
    int seq;
    explicit Ping(int s = 0) : seq(s) {}
};

struct Pong : behave::Message_N<201> {
    int seq;
    explicit Pong(int s = 0) : seq(s) {}
};

// keep the current behavior and push Busy on top of it
struct Push : behave::Message_N<202> {};

// replace the current behavior with Busy
struct Swap : behave::Message_N<203> {};

struct Pop : behave::Message_N<204> {};

struct Fail : behave::Message_N<205> {
    bool switch_first = false;
    explicit Fail(bool s = false) : switch_first(s) {}
};

struct Stray : behave::Message_N<206> {
    int value;
    explicit Stray(int v = 0) : value(v) {}
};

////////////////////////////////////////////////////////////////////////////////

struct ProbeState {
    std::vector<std::string> log;
    std::vector<int> seen;
    int starts = 0;
    int initial_builds = 0;

    // what a handler saw of the stack while it was still running
    std::size_t depth_in_action = 0;
    std::string top_in_action;
};

/**
 * Actor with two behaviors, Idle and Busy, driven by the messages above.
 */
class Probe : public behave::StatefulActor<ProbeState> {
public:
    explicit Probe(const char* n = "probe")
    {
        strncpy(name, n, sizeof(name) - 1);
    }

    behave::HandlerSet idle(ProbeState& st)
    {
        return behave::HandlerSet::build("Idle")
            .on<Ping>([this, &st](const Ping* m) {
                st.log.push_back("idle:ping");
                st.seen.push_back(m->seq);
                if (m->seq < 0)
                    reply(new Pong(-m->seq));
            })
            .on<Push>([this, &st](const Push*) {
                become(busy(st), false);
                note_stack(st);
            })
            .on<Swap>([this, &st](const Swap*) {
                become(busy(st));
                note_stack(st);
            })
            .on<Pop>([this, &st](const Pop*) {
                unbecome();
                note_stack(st);
            })
            .on<Fail>([this](const Fail* m) {
                if (m->switch_first)
                    become(busy(state), false);
                throw std::runtime_error("probe failure");
            })
            .done();
    }

    behave::HandlerSet busy(ProbeState& st)
    {
        return behave::HandlerSet::build("Busy")
            .on<Ping>([&st](const Ping* m) {
                st.log.push_back("busy:ping");
                st.seen.push_back(m->seq);
            })
            .on<Push>([this, &st](const Push*) {
                become(busy(st), false);
                note_stack(st);
            })
            .on<Swap>([this, &st](const Swap*) {
                become(idle(st));
                note_stack(st);
            })
            .on<Pop>([this, &st](const Pop*) {
                unbecome();
                note_stack(st);
            })
            .done();
    }

protected:
    behave::HandlerSet initial_behavior() override
    {
        state.initial_builds++;
        return idle(state);
    }

    void on_start() override
    {
        state.starts++;
    }

private:
    void note_stack(ProbeState& st)
    {
        st.depth_in_action = behaviors().depth();
        st.top_in_action = behaviors().current().name();
    }
};

/**
 * Actor whose handlers throw values that are not std::exception.
 */
class Thrower : public behave::Actor {
public:
    int pings = 0;

    Thrower()
    {
        strncpy(name, "thrower", sizeof(name) - 1);
    }

protected:
    behave::HandlerSet initial_behavior() override
    {
        return behave::HandlerSet::build("Throwing")
            .on<Stray>([](const Stray*) { throw 42; })
            .on_if<Pong>([](const Pong*) -> bool { throw std::string("guard"); },
                         [](const Pong*) {})
            .on<Ping>([this](const Ping*) { pings++; })
            .done();
    }
};

struct SinkState {
    std::vector<behave::msg::Unhandled> dead_letters;
    std::vector<int> pongs;
};

/**
 * Collects dead letter reports and pongs.
 */
class Sink : public behave::StatefulActor<SinkState> {
public:
    explicit Sink(const char* n = "sink")
    {
        strncpy(name, n, sizeof(name) - 1);
    }

protected:
    behave::HandlerSet initial_behavior() override
    {
        return behave::HandlerSet::build("Collecting")
            .on<behave::msg::Unhandled>([this](const behave::msg::Unhandled* m) {
                state.dead_letters.push_back(*m);
            })
            .on<Pong>([this](const Pong* m) {
                state.pongs.push_back(m->seq);
            })
            .done();
    }
};

} // namespace test
