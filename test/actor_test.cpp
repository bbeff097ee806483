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

#include <behave/Actor.hpp>
#include <behave/msg/Shutdown.hpp>

#include "test_actors.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace behave;
using namespace test;

namespace {

class StartsBusy : public Probe {
public:
    StartsBusy() : Probe("starts_busy") {}

protected:
    void on_start() override
    {
        Probe::on_start();
        become(busy(state), false);
        state.depth_in_action = behaviors().depth();
    }
};

class FailsToStart : public Probe {
public:
    FailsToStart() : Probe("fails_to_start") {}

protected:
    void on_start() override
    {
        Probe::on_start();
        become(busy(state), false);
        throw std::runtime_error("no luck");
    }
};

class ThrowsAtStart : public Probe {
public:
    ThrowsAtStart() : Probe("throws_at_start") {}

protected:
    void on_start() override
    {
        Probe::on_start();
        become(busy(state), false);
        throw 7;
    }
};

} // namespace

////////////////////////////////////////////////////////////////////////////////
// lifecycle

TEST(actor, start_pushes_initial_behavior)
{
    Probe p;

    EXPECT_EQ(p.phase(), Phase::Created);
    EXPECT_EQ(p.stack_depth(), 0u);
    EXPECT_THROW(p.current_behavior(), std::logic_error);

    p.start();

    EXPECT_EQ(p.phase(), Phase::Running);
    EXPECT_EQ(p.stack_depth(), 1u);
    EXPECT_EQ(p.current_behavior().name(), "Idle");
    EXPECT_EQ(p.state.starts, 1);
    EXPECT_EQ(p.state.initial_builds, 1);

    p.start();
    EXPECT_EQ(p.state.starts, 1);
}

TEST(actor, first_message_starts_the_actor)
{
    Probe p;

    p.send(new Ping(1));
    EXPECT_EQ(p.drain(), 1u);

    EXPECT_EQ(p.phase(), Phase::Running);
    EXPECT_EQ(p.state.starts, 1);
    EXPECT_EQ(p.state.log, std::vector<std::string>{"idle:ping"});
}

TEST(actor, become_in_start_hook)
{
    StartsBusy p;
    p.start();

    // applied once on_start returned
    EXPECT_EQ(p.state.depth_in_action, 1u);
    EXPECT_EQ(p.stack_depth(), 2u);
    EXPECT_EQ(p.current_behavior().name(), "Busy");
}

TEST(actor, fault_in_start_hook)
{
    FailsToStart p;
    p.start();

    EXPECT_EQ(p.phase(), Phase::Running);
    EXPECT_EQ(p.fault_count(), 1);
    EXPECT_EQ(p.stack_depth(), 1u);
    EXPECT_EQ(p.current_behavior().name(), "Idle");
}

TEST(actor, phase_names)
{
    EXPECT_STREQ(to_string(Phase::Created), "created");
    EXPECT_STREQ(to_string(Phase::Running), "running");
    EXPECT_STREQ(to_string(Phase::Stopped), "stopped");
    EXPECT_STREQ(to_string(UnhandledPolicy::DeadLetter), "dead_letter");
}

////////////////////////////////////////////////////////////////////////////////
// behavior switching

TEST(actor, switch_applies_after_the_action)
{
    Probe p;
    p.start();

    p.send(new Push());
    p.send(new Ping(1));
    p.drain();

    EXPECT_EQ(p.state.depth_in_action, 1u);
    EXPECT_EQ(p.state.top_in_action, "Idle");

    EXPECT_EQ(p.stack_depth(), 2u);
    EXPECT_EQ(p.current_behavior().name(), "Busy");
    EXPECT_EQ(p.state.log, std::vector<std::string>{"busy:ping"});
}

TEST(actor, push_and_pop)
{
    Probe p;
    p.start();

    p.send(new Push());
    p.send(new Push());
    p.send(new Push());
    p.drain();
    EXPECT_EQ(p.stack_depth(), 4u);
    EXPECT_EQ(p.behavior_names(), (std::vector<std::string>{"Idle", "Busy", "Busy", "Busy"}));

    p.send(new Pop());
    p.send(new Pop());
    p.send(new Pop());
    p.drain();
    EXPECT_EQ(p.stack_depth(), 1u);
    EXPECT_EQ(p.current_behavior().name(), "Idle");

    // nothing below the initial behavior
    p.send(new Pop());
    p.send(new Ping(2));
    p.drain();
    EXPECT_EQ(p.stack_depth(), 1u);
    EXPECT_EQ(p.state.log, std::vector<std::string>{"idle:ping"});
}

TEST(actor, swap_discards_previous)
{
    Probe p;
    p.start();
    auto initial = p.current_behavior();

    p.send(new Swap());
    p.send(new Pop());
    p.send(new Ping(1));
    p.drain();

    EXPECT_EQ(p.stack_depth(), 1u);
    EXPECT_EQ(p.current_behavior().name(), "Busy");
    EXPECT_FALSE(p.current_behavior() == initial);
    EXPECT_EQ(p.state.log, std::vector<std::string>{"busy:ping"});
}

TEST(actor, restart_resets_to_initial_behavior)
{
    Probe p;
    p.start();
    auto initial = p.current_behavior();

    p.send(new Ping(1));
    p.send(new Push());
    p.send(new Push());
    p.drain();
    ASSERT_EQ(p.stack_depth(), 3u);

    p.restart();
    p.send(new Ping(2));
    p.drain();

    EXPECT_EQ(p.stack_depth(), 1u);
    EXPECT_TRUE(p.current_behavior() == initial);
    EXPECT_EQ(p.state.starts, 2);
    EXPECT_EQ(p.state.initial_builds, 1);

    // state survives the restart
    EXPECT_EQ(p.state.seen, (std::vector<int>{1, 2}));
    EXPECT_EQ(p.state.log, (std::vector<std::string>{"idle:ping", "idle:ping"}));
}

////////////////////////////////////////////////////////////////////////////////
// unhandled messages

TEST(actor, unhandled_drop)
{
    Probe p;
    ActorConfig config;
    config.unhandled = UnhandledPolicy::Drop;
    p.configure(config);

    p.send(new Stray(1));
    p.send(new Ping(1));
    p.drain();

    EXPECT_EQ(p.unhandled_count(), 1);
    EXPECT_EQ(p.processed_count(), 2);
    EXPECT_EQ(p.stack_depth(), 1u);
    EXPECT_EQ(p.state.seen, std::vector<int>{1});
}

TEST(actor, unhandled_log_is_default)
{
    Probe p;
    EXPECT_EQ(p.config().unhandled, UnhandledPolicy::Log);

    p.send(new Stray(1));
    p.drain();

    EXPECT_EQ(p.unhandled_count(), 1);
    EXPECT_EQ(p.current_behavior().name(), "Idle");
}

TEST(actor, unhandled_dead_letter)
{
    Sink sink;
    Probe p;
    ActorConfig config;
    config.unhandled = UnhandledPolicy::DeadLetter;
    config.dead_letters = &sink;
    p.configure(config);

    p.send(new Push());
    p.send(new Stray(7));
    p.drain();
    sink.drain();

    ASSERT_EQ(sink.state.dead_letters.size(), 1u);
    const auto& report = sink.state.dead_letters.front();
    EXPECT_EQ(report.actor, "probe");
    EXPECT_EQ(report.behavior, "Busy");
    EXPECT_NE(report.message_type.find("Stray"), std::string::npos);
    EXPECT_EQ(report.payload, "");
}

TEST(actor, unhandled_report_is_not_reported_again)
{
    Probe first("first");
    Probe second("second");

    ActorConfig config;
    config.unhandled = UnhandledPolicy::DeadLetter;
    config.dead_letters = &second;
    first.configure(config);
    config.dead_letters = &first;
    second.configure(config);

    first.send(new Stray(1));
    first.drain();
    ASSERT_EQ(second.queue_length(), 1u);

    // second has no handler for the report either
    second.drain();
    EXPECT_EQ(second.unhandled_count(), 1);
    EXPECT_EQ(first.queue_length(), 0u);
}

TEST(actor, dead_letter_without_a_receiver)
{
    Probe p;
    ActorConfig config;
    config.unhandled = UnhandledPolicy::DeadLetter;
    p.configure(config);

    p.send(new Stray(1));
    p.send(new Ping(1));
    p.drain();

    EXPECT_EQ(p.unhandled_count(), 1);
    EXPECT_EQ(p.state.seen, std::vector<int>{1});
}

////////////////////////////////////////////////////////////////////////////////
// faults

TEST(actor, fault_drops_requested_switch)
{
    Probe p;
    p.start();

    p.send(new Fail(true));
    p.send(new Ping(1));
    p.drain();

    EXPECT_EQ(p.fault_count(), 1);
    EXPECT_EQ(p.unhandled_count(), 0);
    EXPECT_EQ(p.phase(), Phase::Running);
    EXPECT_EQ(p.stack_depth(), 1u);
    EXPECT_EQ(p.state.log, std::vector<std::string>{"idle:ping"});
}

TEST(actor, non_standard_exception_is_a_fault)
{
    Thrower t;

    t.send(new Stray(1));
    t.send(new Pong(1));
    t.send(new Ping(1));
    t.drain();

    // one from the action, one from the guard
    EXPECT_EQ(t.fault_count(), 2);
    EXPECT_EQ(t.unhandled_count(), 0);
    EXPECT_EQ(t.phase(), Phase::Running);
    EXPECT_EQ(t.pings, 1);
}

TEST(actor, non_standard_exception_in_start_hook)
{
    ThrowsAtStart p;
    p.start();
    p.send(new Ping(1));
    p.drain();

    EXPECT_EQ(p.fault_count(), 1);
    EXPECT_EQ(p.phase(), Phase::Running);
    EXPECT_EQ(p.stack_depth(), 1u);
    EXPECT_EQ(p.state.seen, std::vector<int>{1});
}

////////////////////////////////////////////////////////////////////////////////
// stopping

TEST(actor, stop_discards_mailbox)
{
    Probe p;
    p.start();

    p.send(new Ping(1));
    p.stop();
    p.send(new Ping(2));
    p.drain();

    EXPECT_TRUE(p.is_stopped());
    EXPECT_EQ(p.state.seen, std::vector<int>{1});
    EXPECT_EQ(p.queue_length(), 0u);
    EXPECT_EQ(p.stack_depth(), 0u);
    EXPECT_THROW(p.current_behavior(), std::logic_error);

    // anything sent later is dropped
    p.send(new Ping(3));
    EXPECT_EQ(p.queue_length(), 0u);
    EXPECT_EQ(p.drain(), 0u);
}

TEST(actor, shutdown_by_fast_send)
{
    Probe p;
    p.start();
    p.send(new Ping(1));
    p.send(new Ping(2));

    msg::Shutdown shutdown;
    EXPECT_EQ(p.fast_send(&shutdown).get(), nullptr);

    EXPECT_EQ(p.phase(), Phase::Stopped);
    EXPECT_EQ(p.queue_length(), 0u);
    EXPECT_TRUE(p.state.seen.empty());
}

////////////////////////////////////////////////////////////////////////////////
// messaging

TEST(actor, mailbox_is_fifo_past_the_ring)
{
    Probe p;
    std::vector<int> expected;
    for (int i = 0; i < 3 * BEHAVE_MAILBOX_SIZE; ++i) {
        p.send(new Ping(i));
        expected.push_back(i);
    }
    EXPECT_EQ(p.queue_length(), expected.size());

    p.drain();
    EXPECT_EQ(p.state.seen, expected);
}

TEST(actor, fast_send_reply)
{
    Probe p;

    Ping ask(-5);
    auto r = p.fast_send(&ask);
    ASSERT_NE(r.get(), nullptr);
    auto pong = dynamic_cast<const Pong*>(r.get());
    ASSERT_NE(pong, nullptr);
    EXPECT_EQ(pong->seq, 5);

    Ping tell(5);
    EXPECT_EQ(p.fast_send(&tell).get(), nullptr);
}

TEST(actor, reply_to_sender)
{
    Probe p;
    Sink sink;

    p.send(new Ping(-4), &sink);
    p.drain();
    sink.drain();

    EXPECT_EQ(sink.state.pongs, std::vector<int>{4});
}

TEST(actor, runs_in_own_thread)
{
    Probe p;
    std::thread t([&p]() { p(); });

    for (int i = 0; i < 100; ++i)
        p.send(new Ping(i));
    p.stop();
    t.join();

    EXPECT_TRUE(p.is_stopped());
    EXPECT_EQ(p.state.seen.size(), 100u);
    EXPECT_EQ(p.processed_count(), 100);
}

TEST(actor, configure_while_running)
{
    Sink sink;
    Probe p;
    std::thread t([&p]() { p(); });

    ActorConfig config;
    config.unhandled = UnhandledPolicy::DeadLetter;
    config.dead_letters = &sink;
    p.configure(config);
    EXPECT_EQ(p.config().unhandled, UnhandledPolicy::DeadLetter);

    p.send(new Stray(1));
    p.stop();
    t.join();
    sink.drain();

    ASSERT_EQ(sink.state.dead_letters.size(), 1u);
    EXPECT_EQ(sink.state.dead_letters[0].actor, "probe");
}

TEST(actor, status)
{
    Probe p;
    p.send(new Push());
    p.send(new Stray(1));
    p.drain();
    p.send(new Ping(1));

    auto s = p.status();
    EXPECT_EQ(s.name, "probe");
    EXPECT_EQ(s.phase, Phase::Running);
    EXPECT_EQ(s.behaviors, (std::vector<std::string>{"Idle", "Busy"}));
    EXPECT_EQ(s.mailbox, 1u);
    EXPECT_EQ(s.processed, 2);
    EXPECT_EQ(s.unhandled, 1);
    EXPECT_EQ(s.faults, 0);
}
